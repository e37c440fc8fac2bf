// SPDX-License-Identifier: Apache-2.0
// Part of the RestCL project.
// apps/restcl_cli.cpp

#include "restcl/json_codec.hpp"
#include "restcl/log.hpp"
#include "restcl/rest_client.hpp"
#include "restcl/socket_transport.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <chrono>
#include <algorithm>
#include <stdexcept>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --server https://host:6443/api/v1beta1 --api-version v1beta1\n"
      "      [--method GET|POST|PUT|DELETE] [--resource pods] [--name NAME]\n"
      "      [--namespace NS] [--selector labels=SEL] [--data JSON] [--operation NAME]\n"
      "      [--legacy 0|1] [--sync 0|1] [--poll_period SEC] [--timeout SEC]\n"
      "      [--tls_ca ca.crt] [--insecure 0|1]\n"
      "\n"
      "Logging:\n"
      "  --log <file>              log file, empty for none (default restcl.log)\n"
      "  --log_stdout 0|1          also log to stdout (default 1)\n"
      "  --log_level <level>       debug|info|warn|error (default info)\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect timeout in seconds (default 5)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 30)\n"
      "  --timeout <sec>           request timeout, overrides --io_timeout (default none)\n"
      "\n"
      "Polling:\n"
      "  --poll_period <sec>       wait between operation polls, 0 disables (default 2)\n";
}

int main(int argc, char** argv){
    restcl::TransportConfig tcfg;

    std::string server, api_version, method = "GET";
    std::string resource, name, ns, selector, data, op_name;
    std::string log_file = "restcl.log";
    bool legacy = false, sync = false, log_stdout = true;
    restcl::LogLevel log_level = restcl::LogLevel::Info;
    int poll_period_sec = 2, timeout_sec = 0;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--server" && i+1<argc) server = argv[++i];
            else if(a=="--api-version" && i+1<argc) api_version = argv[++i];
            else if(a=="--method" && i+1<argc) method = argv[++i];
            else if(a=="--resource" && i+1<argc) resource = argv[++i];
            else if(a=="--name" && i+1<argc) name = argv[++i];
            else if(a=="--namespace" && i+1<argc) ns = argv[++i];
            else if(a=="--selector" && i+1<argc) selector = argv[++i];
            else if(a=="--data" && i+1<argc) data = argv[++i];
            else if(a=="--operation" && i+1<argc) op_name = argv[++i];
            else if(a=="--legacy" && i+1<argc) legacy = (std::stoi(argv[++i])!=0);
            else if(a=="--sync" && i+1<argc) sync = (std::stoi(argv[++i])!=0);
            else if(a=="--poll_period" && i+1<argc) poll_period_sec = std::max(0, std::stoi(argv[++i]));
            else if(a=="--timeout" && i+1<argc) timeout_sec = std::max(0, std::stoi(argv[++i]));
            else if(a=="--tls_ca" && i+1<argc) tcfg.tls_ca_file = argv[++i];
            else if(a=="--insecure" && i+1<argc) { tcfg.tls_verify_peer = (std::stoi(argv[++i])==0); }
            else if(a=="--connect_timeout" && i+1<argc) tcfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc)      tcfg.io_timeout_sec      = std::max(1, std::stoi(argv[++i]));
            else if(a=="--log" && i+1<argc) log_file = argv[++i];
            else if(a=="--log_stdout" && i+1<argc) log_stdout = (std::stoi(argv[++i])!=0);
            else if(a=="--log_level" && i+1<argc) {
                if(!restcl::parse_log_level(argv[++i], log_level)) { usage(argv[0]); return 2; }
            }
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::logic_error&) {
        // std::stoi rejected a numeric flag
        usage(argv[0]);
        return 2;
    }

    if(server.empty() || api_version.empty()){
        usage(argv[0]);
        return 2;
    }
    if(resource.empty() && op_name.empty()){
        std::cerr<<"Need --resource or --operation\n";
        return 2;
    }

    restcl::set_log_level(log_level);
    restcl::set_log_stdout(log_stdout);
    restcl::set_log_file(log_file);

    std::unique_ptr<restcl::RestClient> cli;
    try {
        cli = std::make_unique<restcl::RestClient>(
            server, api_version, std::make_shared<restcl::JsonCodec>(api_version), legacy);
    } catch (const std::invalid_argument& e) {
        std::cerr<<e.what()<<"\n";
        return 2;
    }
    cli->transport = std::make_shared<restcl::SocketTransport>(tcfg);
    cli->sync = sync;
    cli->poll_period = std::chrono::seconds(poll_period_sec);
    cli->timeout = std::chrono::seconds(timeout_sec);

    restcl::Request req = op_name.empty() ? cli->verb(method) : cli->operation(op_name);
    if (op_name.empty()) {
        req.resource(resource);
        if (!name.empty()) req.name(name);
        if (!ns.empty()) req.namespace_(ns);
        if (!selector.empty()) {
            const std::size_t eq = selector.find('=');
            if (eq == std::string::npos) {
                std::cerr<<"Bad --selector: expected key=selector\n";
                return 2;
            }
            req.selector_param(selector.substr(0, eq), selector.substr(eq + 1));
        }
        if (!data.empty()) {
            const nlohmann::json obj = nlohmann::json::parse(data, nullptr, false);
            if (obj.is_discarded()) {
                std::cerr<<"Bad --data: not valid JSON\n";
                return 2;
            }
            req.body_object(obj);
        }
    }

    restcl::Result res;
    const bool ok = req.execute(res);
    if (!ok) {
        std::cerr<<"request failed: "<<res.error<<"\n";
        return 1;
    }

    std::cout<<"HTTP "<<res.http_status<<(res.created ? " (created)" : "")<<"\n";
    if (res.in_progress()) {
        std::cout<<"operation "<<res.status.details.id<<" still running\n";
    }
    if (!res.object.is_null()) {
        std::cout<<res.object.dump(2)<<"\n";
    } else {
        std::cout<<res.body<<"\n";
    }
    return 0;
}
