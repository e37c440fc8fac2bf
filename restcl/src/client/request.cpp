/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/request.hpp"
#include "restcl/log.hpp"

#include "restcl/internal/utils.hpp"
#include "restcl/internal/http_parser.hpp"

#include <sstream>
#include <utility>

namespace restcl {

namespace {

// Append the '/'-separated pieces of item to segs, dropping empty and "."
// pieces and resolving "..", the way a cleaned path join does.
void join_into(std::vector<std::string>& segs, const std::string& item) {
    std::size_t pos = 0;
    while (pos <= item.size()) {
        std::size_t next = item.find('/', pos);
        if (next == std::string::npos) next = item.size();
        const std::string piece = item.substr(pos, next - pos);
        pos = next + 1;
        if (piece.empty() || piece == ".") continue;
        if (piece == "..") {
            if (!segs.empty()) segs.pop_back();
            continue;
        }
        segs.push_back(piece);
    }
}

} // namespace

Request::Request(std::shared_ptr<HttpTransport> transport,
                 std::string method,
                 const Url& base,
                 std::shared_ptr<const Codec> codec,
                 bool namespace_in_query,
                 bool preserve_resource_case)
    : _transport(std::move(transport)),
      _codec(std::move(codec)),
      _method(internal::upper_copy(std::move(method))),
      _base(base),
      _namespace_in_query(namespace_in_query),
      _preserve_resource_case(preserve_resource_case) {}

void Request::set_error(const std::string& e) {
    if (_err.empty()) _err = e;
}

Request& Request::path(const std::string& item) {
    join_into(_path, item);
    return *this;
}

Request& Request::namespace_(const std::string& ns) {
    _namespace = ns;
    _namespace_set = true;
    return *this;
}

Request& Request::resource(const std::string& r) {
    _resource = r;
    return *this;
}

Request& Request::name(const std::string& n) {
    if (n.empty()) {
        set_error("resource name may not be empty");
        return *this;
    }
    _name = n;
    return *this;
}

Request& Request::suffix(const std::string& item) {
    _suffix = item;
    return *this;
}

Request& Request::param(const std::string& key, const std::string& value) {
    _params[key] = value;
    return *this;
}

Request& Request::selector_param(const std::string& key, const std::string& selector) {
    return param(key, selector);
}

Request& Request::header(const std::string& key, const std::string& value) {
    _headers[key] = value;
    return *this;
}

Request& Request::body(std::string data) {
    _body = std::move(data);
    return *this;
}

Request& Request::body_object(const nlohmann::json& obj) {
    if (!_codec) {
        set_error("no codec configured to encode the request body");
        return *this;
    }
    std::string data;
    if (!_codec->encode(obj, data)) {
        set_error("encoding request body failed");
        return *this;
    }
    _body = std::move(data);
    return *this;
}

Request& Request::poller(PollFunc fn) {
    _poller = std::move(fn);
    return *this;
}

Request& Request::no_poll() {
    _poller = nullptr;
    return *this;
}

Request& Request::sync(bool on) {
    _sync = on;
    return *this;
}

Request& Request::timeout(std::chrono::milliseconds d) {
    _timeout = d;
    return *this;
}

Url Request::final_address() const {
    Url u = _base;

    std::vector<std::string> segs;
    join_into(segs, _base.path);
    for (const auto& p : _path) segs.push_back(p);

    bool added = false;
    if (_namespace_set && !_namespace_in_query && !_namespace.empty()) {
        join_into(segs, "ns");
        join_into(segs, _namespace);
        added = true;
    }
    if (!_resource.empty()) {
        join_into(segs, _preserve_resource_case ? _resource : internal::lower_copy(_resource));
        added = true;
    }
    if (!_name.empty() || !_suffix.empty()) {
        join_into(segs, _name);
        join_into(segs, _suffix);
        added = true;
    }

    std::string p;
    for (const auto& s : segs) p += "/" + internal::escape_component(s);
    // keep the base's trailing slash when nothing was appended
    if (!added && _path.empty()) p += "/";
    if (p.empty()) p = "/";
    u.path = p;

    std::unordered_map<std::string, std::string> query = _params;
    if (_namespace_set && _namespace_in_query && !_namespace.empty()) {
        query["namespace"] = _namespace;
    }
    // sync and timeout are only meaningful together
    if (_sync) {
        query["sync"] = "true";
        if (_timeout.count() > 0) {
            query["timeout"] = internal::format_duration(_timeout);
        }
    }
    u.query = internal::canonical_query_sorted(query);
    u.fragment.clear();
    return u;
}

bool Request::transform_response(const HttpResponse& resp, Result& out) const {
    out.http_status = resp.status_code;

    nlohmann::json doc;
    const bool decoded = _codec && !resp.body.empty() && _codec->decode(resp.body, doc);

    Status st;
    const bool is_status = decoded && status_from_object(doc, st);

    const int code = resp.status_code;
    if (code != 101 && (code < 200 || code > 206)) {
        if (!is_status) {
            std::ostringstream oss;
            oss << "request [" << _method << " " << final_url() << "] failed ("
                << code << ") " << resp.status_text << ": " << resp.body;
            out.error = oss.str();
            return false;
        }
        out.has_status = true;
        out.status = st;
        out.error = st.message.empty() ? ("server reported " + st.status + " (" + std::to_string(code) + ")")
                                       : st.message;
        return false;
    }

    if (is_status && !st.is_success()) {
        out.has_status = true;
        out.status = st;
        if (st.is_working()) {
            // running operations are not failures; the caller decides on polling
            return true;
        }
        out.error = st.message.empty() ? ("server reported " + st.status) : st.message;
        return false;
    }

    out.created = (code == 201);
    out.body = resp.body;
    if (decoded) out.object = std::move(doc);
    if (is_status) {
        out.has_status = true;
        out.status = st;
    }
    return true;
}

bool Request::should_poll(const Status& st, std::unique_ptr<Request>& next) const {
    if (_sync || !_poller) return false;
    if (!st.is_working() || st.details.id.empty()) return false;
    next.reset();
    if (!_poller(st.details.id, next)) return false;
    if (!next) {
        restcl::log_line("POLL", "poller for operation " + st.details.id + " returned no request, stopping",
                         LogLevel::Warn);
        return false;
    }
    return true;
}

bool Request::round_trip_once(Result& out) {
    out = Result{};
    if (_consumed) {
        out.error = "request already executed";
        return false;
    }
    _consumed = true;

    if (!_err.empty()) {
        out.error = _err;
        return false;
    }
    if (!_transport) {
        out.error = "no transport configured";
        return false;
    }

    HttpRequest hreq;
    hreq.method  = _method;
    hreq.url     = final_address();
    hreq.headers = _headers;
    hreq.body    = _body;
    if (!hreq.body.empty() && internal::hdr_ci(hreq.headers, "Content-Type").empty()) {
        hreq.headers["Content-Type"] = "application/json";
    }

    HttpResponse resp;
    std::string terr;
    if (!_transport->round_trip(hreq, _timeout, resp, terr)) {
        out.error = "request [" + _method + " " + hreq.url.to_string() + "] failed: " + terr;
        restcl::log_line("REQUEST", out.error, LogLevel::Warn);
        return false;
    }
    restcl::log_line("REQUEST", _method + " " + hreq.url.to_string() + " -> " + std::to_string(resp.status_code),
                     LogLevel::Debug);
    return transform_response(resp, out);
}

bool Request::execute(Result& out) {
    Request* cur = this;
    std::unique_ptr<Request> owned;   // current poll request, if any

    for (;;) {
        if (!cur->round_trip_once(out)) return false;
        if (!out.in_progress()) return true;

        std::unique_ptr<Request> next;
        if (!cur->should_poll(out.status, next)) {
            // stopped or sync: the running status is the answer
            return true;
        }
        owned = std::move(next);
        cur = owned.get();
    }
}

} // namespace restcl
