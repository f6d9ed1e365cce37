#include "src/pipeline/message_stream.hpp"

#include "common/errors.hpp"
#include "src/pipeline/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace optick {

namespace net       = boost::asio;
namespace ssl       = net::ssl;
namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

websocket::stream_base::timeout stream_timeouts() {
    websocket::stream_base::timeout opt;
    opt.handshake_timeout = std::chrono::seconds(30);
    opt.idle_timeout = std::chrono::seconds(30);
    opt.keep_alive_pings = true;
    return opt;
}

// Runs one async_read to completion on the caller's thread. Posted close
// requests execute here too, so shutdown() never touches the socket from
// another thread.
template<class Ws>
bool read_one(net::io_context& ioc, Ws& ws, beast::flat_buffer& buffer, bool& closing,
              std::string& out) {
    beast::error_code result;
    bool done = false;
    ws.async_read(buffer, [&](beast::error_code ec, std::size_t) {
        result = ec;
        done = true;
    });

    ioc.restart();
    while (!done && ioc.run_one() > 0) {
    }

    if (result == websocket::error::closed) {
        return false;
    }
    if (closing && (result == net::error::operation_aborted || result == net::error::eof)) {
        return false;
    }
    if (result) {
        throw ConnectionError("websocket read failed: " + result.message());
    }

    out = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    return true;
}

template<class Ws>
void send_one(Ws& ws, const std::string& payload) {
    beast::error_code ec;
    ws.binary(true);
    ws.write(net::buffer(payload), ec);
    if (ec) {
        throw ConnectionError("websocket write failed: " + ec.message());
    }
}

template<class Ws>
void post_close(net::io_context& ioc, Ws& ws, bool& closing) {
    net::post(ioc, [&ws, &closing]() {
        if (closing || !ws.is_open()) return;
        closing = true;
        ws.async_close(websocket::close_code::normal, [](beast::error_code ec) {
            if (ec) {
                spdlog::debug("websocket close: {}", ec.message());
            }
        });
    });
}

void decorate(websocket::request_type& req, const std::string& user_agent) {
    req.set(http::field::user_agent, user_agent);
}

class PlainWebSocket final : public MessageStream {
public:
    PlainWebSocket(const Url& url, const StreamOptions& opts) : ws_(ioc_) {
        tcp::resolver resolver(ioc_);
        auto const results = resolver.resolve(url.host, url.port);
        net::connect(ws_.next_layer(), results.begin(), results.end());

        ws_.set_option(stream_timeouts());
        const std::string ua = opts.user_agent;
        ws_.set_option(websocket::stream_base::decorator(
            [ua](websocket::request_type& req) { decorate(req, ua); }));
        ws_.handshake(url.host + ":" + url.port, url.target);
    }

    void send_binary(const std::string& payload) override { send_one(ws_, payload); }
    bool read(std::string& out) override { return read_one(ioc_, ws_, buffer_, closing_, out); }
    void shutdown() override { post_close(ioc_, ws_, closing_); }

private:
    net::io_context ioc_;
    websocket::stream<tcp::socket> ws_;
    beast::flat_buffer buffer_;
    bool closing_ = false;
};

class TlsWebSocket final : public MessageStream {
public:
    TlsWebSocket(const Url& url, const StreamOptions& opts)
        : tls_(ssl::context::tls_client), ws_(ioc_, init_tls(tls_, opts)) {
        tcp::resolver resolver(ioc_);
        auto const results = resolver.resolve(url.host, url.port);
        net::connect(beast::get_lowest_layer(ws_), results.begin(), results.end());

        // SNI must be set before the TLS handshake
        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url.host.c_str())) {
            throw beast::system_error{
                beast::error_code{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()},
                "SSL_set_tlsext_host_name"};
        }
        if (opts.verify_peer) {
            ws_.next_layer().set_verify_mode(ssl::verify_peer);
            ws_.next_layer().set_verify_callback(ssl::host_name_verification(url.host));
        } else {
            ws_.next_layer().set_verify_mode(ssl::verify_none);
        }
        ws_.next_layer().handshake(ssl::stream_base::client);

        ws_.set_option(stream_timeouts());
        const std::string ua = opts.user_agent;
        ws_.set_option(websocket::stream_base::decorator(
            [ua](websocket::request_type& req) { decorate(req, ua); }));
        ws_.handshake(url.host, url.target);
    }

    void send_binary(const std::string& payload) override { send_one(ws_, payload); }
    bool read(std::string& out) override { return read_one(ioc_, ws_, buffer_, closing_, out); }
    void shutdown() override { post_close(ioc_, ws_, closing_); }

private:
    static ssl::context& init_tls(ssl::context& tls, const StreamOptions& opts) {
        if (opts.verify_peer) {
            tls.set_default_verify_paths();
        }
        return tls;
    }

    net::io_context ioc_;
    ssl::context tls_;
    websocket::stream<ssl::stream<tcp::socket>> ws_;
    beast::flat_buffer buffer_;
    bool closing_ = false;
};

} // namespace

std::unique_ptr<MessageStream> open_websocket(const std::string& url, const StreamOptions& opts) {
    const auto parsed = parse_url(url);
    if (!parsed || (parsed->scheme != "ws" && parsed->scheme != "wss")) {
        throw ConnectionError("not a websocket url: " + url);
    }

    try {
        if (parsed->secure()) {
            return std::make_unique<TlsWebSocket>(*parsed, opts);
        }
        return std::make_unique<PlainWebSocket>(*parsed, opts);
    } catch (const beast::system_error& e) {
        throw ConnectionError("cannot connect to " + parsed->host + ":" + parsed->port + ": " +
                              e.code().message());
    }
}

} // namespace optick
