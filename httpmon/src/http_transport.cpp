#include "http_transport.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <cstdint>

HttpResponse CprTransport::send(const HttpRequest& request) {
    HttpResponse result;

    try {
        cpr::Session session;
        session.SetUrl(cpr::Url{request.url});
        session.SetTimeout(cpr::Timeout{request.timeout});

        cpr::Header header;
        for (const auto& [key, value] : request.headers) {
            header[key] = value;
        }
        session.SetHeader(header);

        if (!request.body.empty()) {
            session.SetBody(cpr::Body{request.body});
        }

        if (!request.read_body) {
            // Abort the transfer at the first body chunk; only the status line is needed
            session.SetWriteCallback(cpr::WriteCallback{[](auto&&, intptr_t) { return false; }});
        }

        auto method = util::to_upper(request.method);
        cpr::Response response;
        if (method == "POST") {
            response = session.Post();
        } else if (method == "PUT") {
            response = session.Put();
        } else if (method == "DELETE") {
            response = session.Delete();
        } else if (method == "HEAD") {
            response = session.Head();
        } else if (method == "OPTIONS") {
            response = session.Options();
        } else if (method == "PATCH") {
            response = session.Patch();
        } else {
            response = session.Get();
        }

        result.status_code = static_cast<int>(response.status_code);

        if (response.error) {
            std::string message = response.error.message.empty() ? "request failed" : response.error.message;
            if (response.status_code == 0) {
                result.transport_error = message;
            } else if (request.read_body) {
                result.body_error = message;
            }
            // Otherwise the error is the deliberate abort after the headers
            return result;
        }

        if (result.status_code == 0) {
            result.transport_error = "no response received";
            return result;
        }

        if (request.read_body) {
            result.body = std::move(response.text);
        }
    } catch (const std::exception& e) {
        spdlog::debug("HTTP {} {} raised: {}", request.method, request.url, e.what());
        result.transport_error = e.what();
    }

    return result;
}
