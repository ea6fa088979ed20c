#pragma once

#include <string>
#include <utility>
#include <vector>

namespace net {

struct HttpRequest {
    std::string method = "GET";
    std::string host;
    std::string port = "443";
    std::string target;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::string body;
};

// One request, one response. Implementations throw errors::TransportError
// when no HTTP response could be obtained.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& req) = 0;
};

}
