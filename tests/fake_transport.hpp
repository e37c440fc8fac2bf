/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <deque>
#include <string>
#include <vector>
#include "restcl/transport.hpp"

namespace restcl::testing {

// Scripted transport: answers from a queue and records what was sent.
class FakeTransport : public HttpTransport {
public:
    struct Reply {
        bool ok = true;
        int  code = 200;
        std::string body;
    };

    void push(int code, const std::string& body) {
        Reply r;
        r.code = code;
        r.body = body;
        replies.push_back(r);
    }

    void push_failure() {
        Reply r;
        r.ok = false;
        replies.push_back(r);
    }

    bool round_trip(const HttpRequest& req,
                    std::chrono::milliseconds timeout,
                    HttpResponse& out,
                    std::string& err) override {
        sent.push_back(req);
        timeouts.push_back(timeout);
        if (replies.empty()) {
            err = "no scripted reply";
            return false;
        }
        const Reply r = replies.front();
        replies.pop_front();
        if (!r.ok) {
            err = "connection refused";
            return false;
        }
        out.status_code = r.code;
        out.status_text = "scripted";
        out.headers["Content-Length"] = std::to_string(r.body.size());
        out.body = r.body;
        return true;
    }

    std::deque<Reply> replies;
    std::vector<HttpRequest> sent;
    std::vector<std::chrono::milliseconds> timeouts;
};

inline std::string working_status(const std::string& op) {
    return R"({"kind":"Status","status":"Working","details":{"id":")" + op + R"(","kind":"pods"}})";
}

} // namespace restcl::testing
