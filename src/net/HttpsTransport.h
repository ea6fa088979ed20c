#pragma once

#include <chrono>
#include "HttpTransport.h"

namespace net {

// Blocking HTTPS client on Boost.Beast + OpenSSL. A fresh TLS connection is
// made per request and closed afterwards.
class HttpsTransport : public HttpTransport {
public:
    HttpsTransport();
    explicit HttpsTransport(std::chrono::seconds op_timeout);
    HttpResponse send(const HttpRequest& req) override;
private:
    std::chrono::seconds op_timeout_;
};

}
