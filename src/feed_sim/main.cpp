#include "common/config.hpp"
#include "common/timing.hpp"
#include "market_feed.pb.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace optick;

namespace net       = boost::asio;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

std::atomic<bool> running{true};

void signal_handler(int) {
    running.store(false);
}

namespace {

struct SimArgs {
    unsigned short port = 8765;
    int frames_per_sec = 10;
    std::optional<unsigned> seed;
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--port N] [--rate FRAMES_PER_SEC] [--seed N]\n";
}

SimArgs parse_args(const std::vector<std::string>& args) {
    SimArgs a;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) {
            throw UsageError("missing value for " + flag);
        }
        const std::string& v = args[++i];
        if (flag == "--port") {
            const int port = detail::to_int(flag, v, 1);
            if (port > 65535) throw UsageError("port out of range: " + v);
            a.port = static_cast<unsigned short>(port);
        }
        else if (flag == "--rate") a.frames_per_sec = detail::to_int(flag, v, 1);
        else if (flag == "--seed") a.seed = static_cast<unsigned>(detail::to_int(flag, v, 0));
        else throw UsageError("unknown option " + flag);
    }
    return a;
}

// Random-walking option quote for one instrument
struct SimQuote {
    double ltp;
    double cp;
    double oi;
    double iv;
    double delta;
};

std::vector<std::string> subscribed_keys(const std::string& text) {
    std::vector<std::string> keys;
    const auto msg = nlohmann::json::parse(text, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) return keys;

    const auto data = msg.find("data");
    if (data == msg.end() || !data->is_object()) return keys;
    const auto ids = data->find("instrumentKeys");
    if (ids == data->end() || !ids->is_array()) return keys;

    for (const auto& id : *ids) {
        if (id.is_string()) keys.push_back(id.get<std::string>());
    }
    return keys;
}

std::string market_open_frame() {
    feed::FeedResponse msg;
    msg.set_type(feed::MARKET_INFO);
    msg.set_current_ts(wall_clock_ns() / 1'000'000);
    auto& status = *msg.mutable_market_info()->mutable_segment_status();
    status["NSE_FO"] = feed::NORMAL_OPEN;
    status["NSE_INDEX"] = feed::NORMAL_OPEN;
    return msg.SerializeAsString();
}

void fill_feed(const SimQuote& q, bool with_greeks, feed::Feed& out) {
    feed::MarketFullFeed* m = out.mutable_full_feed()->mutable_market_ff();
    m->mutable_ltpc()->set_ltp(q.ltp);
    m->mutable_ltpc()->set_cp(q.cp);
    m->mutable_ltpc()->set_ltt(wall_clock_ns() / 1'000'000);
    m->set_oi(q.oi);
    m->set_iv(q.iv);
    if (with_greeks) {
        feed::OptionGreeks* g = m->mutable_option_greeks();
        g->set_delta(q.delta);
        g->set_gamma(0.001 + q.iv / 1000.0);
        g->set_vega(q.ltp * 0.05);
        g->set_theta(-q.ltp * 0.02);
    }
    out.set_request_mode(feed::MODE_FULL_D5);
}

// Streams frames to one subscriber until it disconnects or we are interrupted.
uint64_t serve(websocket::stream<tcp::socket>& ws, std::mt19937& gen, int frames_per_sec) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    const std::vector<std::string> keys = subscribed_keys(beast::buffers_to_string(buffer.data()));
    std::cout << "Subscriber asked for " << keys.size() << " instruments\n";
    if (keys.empty()) {
        return 0;
    }

    std::uniform_real_distribution<> price_dist(50.0, 500.0);
    std::uniform_real_distribution<> oi_dist(1'000.0, 500'000.0);
    std::normal_distribution<> step(0.0, 0.004);
    std::uniform_int_distribution<> greeks_dist(0, 9);

    std::map<std::string, SimQuote> book;
    for (const auto& key : keys) {
        const double px = price_dist(gen);
        book[key] = SimQuote{px, px, oi_dist(gen), 0.12 + step(gen) * 10.0, 0.5};
    }

    ws.binary(true);
    ws.write(net::buffer(market_open_frame()));

    uint64_t total_sent = 0;
    const auto sleep_interval = std::chrono::microseconds(1'000'000 / frames_per_sec);
    auto last_report = std::chrono::steady_clock::now();
    bool initial = true;

    while (running.load()) {
        feed::FeedResponse msg;
        msg.set_type(initial ? feed::INITIAL_FEED : feed::LIVE_FEED);
        msg.set_current_ts(wall_clock_ns() / 1'000'000);

        for (auto& kv : book) {
            SimQuote& q = kv.second;
            q.ltp = std::max(0.05, q.ltp * (1.0 + step(gen)));
            q.oi = std::max(0.0, q.oi + std::round(q.oi * step(gen)));
            q.iv = std::max(0.01, q.iv + step(gen) / 10.0);
            q.delta = std::min(1.0, std::max(-1.0, q.delta + step(gen)));
            // roughly one entry in ten arrives without greeks
            fill_feed(q, greeks_dist(gen) != 0, (*msg.mutable_feeds())[kv.first]);
        }
        initial = false;

        beast::error_code ec;
        ws.write(net::buffer(msg.SerializeAsString()), ec);
        if (ec) {
            std::cout << "Subscriber gone: " << ec.message() << "\n";
            return total_sent;
        }
        ++total_sent;

        // Rate limiting
        std::this_thread::sleep_for(sleep_interval);

        // Report stats every second
        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::seconds>(now - last_report).count() >= 1) {
            std::cout << "Sent: " << total_sent << " frames\n";
            last_report = now;
        }
    }

    beast::error_code ec;
    ws.close(websocket::close_code::going_away, ec);
    return total_sent;
}

} // namespace

int main(int argc, char** argv) {
    SimArgs args;
    try {
        args = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::random_device rd;
    std::mt19937 gen(args.seed ? *args.seed : rd());

    net::io_context ioc;
    tcp::acceptor acceptor(ioc);
    try {
        const tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), args.port);
        acceptor.open(endpoint.protocol());
        acceptor.set_option(net::socket_base::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
        // polled so SIGINT is noticed between clients
        acceptor.non_blocking(true);
    } catch (const boost::system::system_error& e) {
        std::cerr << "Cannot listen on port " << args.port << ": " << e.what() << "\n";
        return 1;
    }

    std::cout << "Feed simulator on ws://127.0.0.1:" << args.port << "/ at "
              << args.frames_per_sec << " frames/s\n";

    uint64_t total_sent = 0;
    while (running.load()) {
        tcp::socket socket(ioc);
        beast::error_code ec;
        acceptor.accept(socket, ec);
        if (ec == net::error::would_block || ec == net::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            std::cerr << "Accept failed: " << ec.message() << "\n";
            continue;
        }

        try {
            socket.non_blocking(false);
            websocket::stream<tcp::socket> ws(std::move(socket));
            ws.accept();
            std::cout << "Subscriber connected\n";
            total_sent += serve(ws, gen, args.frames_per_sec);
        } catch (const beast::system_error& e) {
            std::cout << "Session ended: " << e.code().message() << "\n";
        }
    }

    std::cout << "\nShutting down. Total sent: " << total_sent << " frames\n";
    return 0;
}
