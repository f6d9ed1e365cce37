#include "src/pipeline/authorizer.hpp"

#include "common/errors.hpp"
#include "src/pipeline/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

namespace optick {

namespace net   = boost::asio;
namespace ssl   = net::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr size_t MAX_ECHO = 512;

std::string clip(const std::string& s) {
    return s.size() <= MAX_ECHO ? s : s.substr(0, MAX_ECHO) + "...";
}

} // namespace

std::string parse_authorize_response(unsigned status, const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw AuthError("authorize returned HTTP " + std::to_string(status) +
                        " with a non-JSON body: " + clip(body));
    }

    auto data = doc.find("data");
    if (data != doc.end() && data->is_object()) {
        for (const char* key : {"authorized_redirect_uri", "authorizedRedirectUri"}) {
            auto uri = data->find(key);
            if (uri != data->end() && uri->is_string() && !uri->get<std::string>().empty()) {
                return uri->get<std::string>();
            }
        }
    }

    auto errors = doc.find("errors");
    if (errors != doc.end()) {
        throw AuthError("authorize rejected (HTTP " + std::to_string(status) + "): " +
                        clip(errors->dump()));
    }
    throw AuthError("authorize response has no redirect uri (HTTP " + std::to_string(status) +
                    "): " + clip(body));
}

HttpsAuthorizer::HttpsAuthorizer(std::string authorize_url, bool verify_peer)
    : authorize_url_(std::move(authorize_url)), verify_peer_(verify_peer) {}

std::string HttpsAuthorizer::authorize(const std::string& credential) const {
    if (credential.empty()) {
        throw AuthError("no bearer credential supplied");
    }
    const auto url = parse_url(authorize_url_);
    if (!url || !url->secure() || url->scheme != "https") {
        throw AuthError("authorize url must be https: " + authorize_url_);
    }

    http::response<http::string_body> res;
    try {
        net::io_context ioc;
        ssl::context tls{ssl::context::tls_client};
        if (verify_peer_) {
            tls.set_default_verify_paths();
        }

        tcp::resolver resolver(ioc);
        beast::ssl_stream<beast::tcp_stream> stream(ioc, tls);

        if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
            throw beast::system_error{
                beast::error_code{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()},
                "SSL_set_tlsext_host_name"};
        }
        if (verify_peer_) {
            stream.set_verify_mode(ssl::verify_peer);
            stream.set_verify_callback(ssl::host_name_verification(url->host));
        } else {
            stream.set_verify_mode(ssl::verify_none);
        }

        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(10));
        beast::get_lowest_layer(stream).connect(resolver.resolve(url->host, url->port));
        stream.handshake(ssl::stream_base::client);

        http::request<http::empty_body> req{http::verb::get, url->target, 11};
        req.set(http::field::host, url->host);
        req.set(http::field::user_agent, "optick/1.0");
        req.set(http::field::accept, "application/json");
        req.set(http::field::authorization, "Bearer " + credential);

        http::write(stream, req);

        beast::flat_buffer buffer;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.shutdown(ec);
        // peers commonly drop the connection instead of a TLS close_notify
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            spdlog::debug("authorize: TLS shutdown: {}", ec.message());
        }
    } catch (const beast::system_error& e) {
        throw ConnectionError("authorize request to " + url->host + " failed: " + e.code().message());
    }

    spdlog::debug("Authorize response status: {}", res.result_int());
    return parse_authorize_response(res.result_int(), res.body());
}

} // namespace optick
