#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "src/pipeline/authorizer.hpp"
#include "src/pipeline/message_stream.hpp"
#include "src/pipeline/pipeline.hpp"
#include "src/registry/instrument_registry.hpp"
#include "src/store/tick_store.hpp"
#include "src/writer/persistence_writer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

using namespace optick;

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_AUTH = 3;
constexpr int EXIT_CONNECTION = 4;

void print_usage(const char* argv0) {
    std::cerr
        << "usage: " << argv0 << " (--instruments FILE | --chain FILE)... [options]\n"
        << "  --db PATH               tick store file (default resources/live_data.db)\n"
        << "  --mode MODE             full | ltpc | option_greeks | full_d30 (default full)\n"
        << "  --authorize-url URL     stream authorization endpoint\n"
        << "  --stream-url URL        connect here directly, skipping authorization\n"
        << "  --token-env NAME        env var holding the bearer token (default A_TOKEN)\n"
        << "  --insecure              do not verify TLS peers\n"
        << "  --ring-wait-ms N        max stall when the write ring is full (default 20)\n"
        << "  --batch N               rows per store transaction (default 64)\n"
        << "  --flush-ms N            flush a partial batch after N ms (default 100)\n"
        << "  --busy-timeout-ms N     store lock wait before dropping a batch (default 250)\n"
        << "  --log-level LEVEL       trace|debug|info|warn|err|critical|off\n";
}

} // namespace

int main(int argc, char** argv) {
    BridgeConfig cfg;
    try {
        cfg = parse_bridge_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    init_logging("optick", cfg.log_level);

    InstrumentRegistry registry;
    try {
        for (const auto& path : cfg.chain_files) registry.load_chain_file(path);
        for (const auto& path : cfg.instrument_files) registry.load_list_file(path);
    } catch (const RegistryError& e) {
        spdlog::error("Cannot load instruments: {}", e.what());
        spdlog::shutdown();
        return EXIT_USAGE;
    }
    if (registry.empty()) {
        spdlog::error("No instruments to subscribe to");
        spdlog::shutdown();
        return EXIT_USAGE;
    }

    std::string credential;
    if (cfg.stream_url.empty()) {
        const char* token = std::getenv(cfg.token_env.c_str());
        if (!token || !*token) {
            spdlog::error("Bearer token missing: set {}", cfg.token_env);
            spdlog::shutdown();
            return EXIT_AUTH;
        }
        credential = token;
    }

    spdlog::info("Starting optick bridge");
    spdlog::info("Store: {}", cfg.db_path);
    spdlog::info("Instruments: {}", registry.instruments().size());
    spdlog::info("Ring size: {}, Batch size: {}", PersistenceWriter::RING_SIZE, cfg.batch);

    int rc = EXIT_SUCCESS;
    try {
        TickStore store(cfg.db_path, TickStore::Mode::ReadWrite, cfg.busy_timeout_ms);

        WriterOptions wopts;
        wopts.batch_size = static_cast<size_t>(cfg.batch);
        wopts.flush_interval = std::chrono::milliseconds(cfg.flush_ms);
        wopts.enqueue_wait = std::chrono::milliseconds(cfg.ring_wait_ms);
        PersistenceWriter writer(store, wopts);
        writer.start();

        HttpsAuthorizer authorizer(cfg.authorize_url, !cfg.insecure);
        StreamOptions sopts;
        sopts.verify_peer = !cfg.insecure;

        Pipeline::Options popts;
        popts.mode = cfg.mode;
        popts.stream_url = cfg.stream_url;

        Pipeline pipeline(
            registry.instruments(), writer,
            [&authorizer](const std::string& cred) { return authorizer.authorize(cred); },
            [sopts](const std::string& url) { return open_websocket(url, sopts); },
            popts);

        // SIGINT/SIGTERM close the stream from a side thread
        boost::asio::io_context sig_ioc;
        boost::asio::signal_set signals(sig_ioc, SIGINT, SIGTERM);
        signals.async_wait([&pipeline](const boost::system::error_code& ec, int sig) {
            if (!ec) {
                spdlog::info("Signal {} received, closing stream", sig);
                pipeline.stop();
            }
        });
        std::thread sig_thread([&sig_ioc]() { sig_ioc.run(); });

        try {
            pipeline.run(credential);
        } catch (const AuthError& e) {
            spdlog::error("Authorization failed, refresh the token: {}", e.what());
            rc = EXIT_AUTH;
        } catch (const ConnectionError& e) {
            spdlog::error("Stream failed: {}", e.what());
            rc = EXIT_CONNECTION;
        } catch (const std::exception& e) {
            spdlog::error("Pipeline aborted: {}", e.what());
            rc = EXIT_FAILURE;
        }

        sig_ioc.stop();
        sig_thread.join();
        writer.stop();
    } catch (const StorageError& e) {
        spdlog::error("Tick store unavailable: {}", e.what());
        rc = EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        rc = EXIT_FAILURE;
    }

    spdlog::info("Shutdown complete");
    spdlog::shutdown();
    return rc;
}
