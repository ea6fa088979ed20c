#include "HttpsTransport.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include "errors/Errors.h"
#include "observability/Logging.h"

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;

namespace net {

namespace {

constexpr std::chrono::seconds DEFAULT_TIMEOUT{10};

[[noreturn]] void fail(const std::string& stage, const HttpRequest& req, const beast::error_code& ec) {
    if (ec == beast::error::timeout || ec == asio::error::timed_out) {
        throw errors::TransportError(stage + " timeout " + req.host + ":" + req.port + " target=" + req.target);
    }
    throw errors::TransportError(stage + " failed " + req.host + ":" + req.port + " -> " + ec.message());
}

http::verb to_verb(const std::string& method) {
    http::verb v = http::string_to_verb(method);
    if (v == http::verb::unknown) throw errors::TransportError("unsupported http method " + method);
    return v;
}

}

HttpsTransport::HttpsTransport() : op_timeout_(DEFAULT_TIMEOUT) {}

HttpsTransport::HttpsTransport(std::chrono::seconds op_timeout) : op_timeout_(op_timeout) {}

HttpResponse HttpsTransport::send(const HttpRequest& req) {
    asio::io_context ioc;
    ssl::context ctx(ssl::context::tls_client);
    beast::error_code ec;
    ctx.set_default_verify_paths(ec);
    if (ec) throw errors::TransportError("tls trust store unavailable -> " + ec.message());
    ctx.set_verify_mode(ssl::verify_peer);

    asio::ip::tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI
    if (!SSL_set_tlsext_host_name(stream.native_handle(), req.host.c_str())) {
        beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        fail("sni", req, sni_ec);
    }
    stream.set_verify_callback(ssl::host_name_verification(req.host));

    auto const results = resolver.resolve(req.host, req.port, ec);
    if (ec) fail("resolve", req, ec);

    beast::get_lowest_layer(stream).expires_after(op_timeout_);
    beast::get_lowest_layer(stream).connect(results, ec);
    if (ec) fail("connect", req, ec);

    beast::get_lowest_layer(stream).expires_after(op_timeout_);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) fail("tls handshake", req, ec);

    http::request<http::string_body> hreq{to_verb(req.method), req.target, 11};
    hreq.set(http::field::host, req.host);
    hreq.set(http::field::connection, "close");
    for (const auto& h : req.headers) hreq.set(h.first, h.second);
    hreq.body() = req.body;
    hreq.prepare_payload();

    observability::log_debug("http_request", {{"method", req.method}, {"host", req.host}, {"target", req.target}});

    beast::get_lowest_layer(stream).expires_after(op_timeout_);
    http::write(stream, hreq, ec);
    if (ec) fail("write", req, ec);

    beast::flat_buffer b;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(op_timeout_);
    http::read(stream, b, res, ec);
    if (ec) fail("read", req, ec);

    HttpResponse out;
    out.status = res.result_int();
    auto reason = res.reason();
    out.reason.assign(reason.data(), reason.size());
    out.body = std::move(res.body());

    observability::log_debug("http_response", {{"status", int64_t(out.status)}, {"bytes", int64_t(out.body.size())}});

    beast::get_lowest_layer(stream).expires_after(op_timeout_);
    beast::error_code shut_ec;
    stream.shutdown(shut_ec);
    // servers commonly drop the connection without close_notify
    if (shut_ec && shut_ec != asio::error::eof && shut_ec != ssl::error::stream_truncated) {
        observability::log_debug("tls_shutdown", {{"error", shut_ec.message()}});
    }
    return out;
}

}
