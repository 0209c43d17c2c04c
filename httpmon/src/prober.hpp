
#pragma once

#include "cert_inspector.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "types.hpp"
#include <memory>

class Prober {
public:
    Prober(std::shared_ptr<HttpTransport> transport, std::shared_ptr<CertInspector> cert_inspector);

    // Issues exactly one request for the target. Network failures are
    // returned as unsuccessful checks, never thrown.
    HealthCheck probe(const Target& target);

    static bool status_accepted(const Target& target, int status_code);
    static HttpRequest build_request(const Target& target);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<CertInspector> cert_inspector_;
};
