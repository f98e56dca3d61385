#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <relay/core/config/loader.hpp>
#include <relay/core/dispatch/dispatch_engine.hpp>
#include <relay/core/sim/simulated_sender.hpp>

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Global flag for graceful shutdown
static std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running.store(false, std::memory_order_release);
}

namespace {

void setupLogging(const AppConfig::LoggingConfig& logging) {
    if (!logging.file.empty()) {
        try {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file);
            auto logger = std::make_shared<spdlog::logger>(
                "relay", spdlog::sinks_init_list{console, file});
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", logging.file, e.what());
        }
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

// Wait up to timeout_ms for a line on stdin; false on timeout
bool stdinReadable(int timeout_ms) {
    if (std::cin.rdbuf()->in_avail() > 0) {
        return true;
    }
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    return ::poll(&pfd, 1, timeout_ms) > 0;
}

Relay::SubmitHints hintsFor(std::string& line) {
    Relay::SubmitHints hints;
    if (!line.empty() && line[0] == '>') {
        hints.is_reply = true;
        line.erase(0, 1);
    }
    static const std::string media_tag = "[media]";
    if (line.compare(0, media_tag.size(), media_tag) == 0) {
        hints.has_media = true;
        line.erase(0, media_tag.size());
    }
    hints.text_length = line.size();
    return hints;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("RelayCore version 1.0.0 starting up...");

    const std::string config_path = argc > 1 ? argv[1] : "config/config.yaml";
    spdlog::info("Config file: {}", config_path);

    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(config_path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    setupLogging(config.logging);
    spdlog::info("Configuration loaded: {} v{}", config.app_name, config.version);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Relay::SimulatedSender sender(config.simulator);
    Relay::DispatchEngine engine(config.dispatch, sender.asSendFunction(), config.simulator.seed);
    engine.start();

    spdlog::info("Reading messages from stdin ('>' = reply, '[media]' = media). Ctrl+C to stop.");

    uint64_t next_id = 1;
    bool eof = false;
    std::string line;
    while (g_running.load(std::memory_order_acquire)) {
        if (!stdinReadable(500)) {
            continue;
        }
        if (!std::getline(std::cin, line)) {
            eof = true;
            break;
        }
        if (line.empty()) {
            continue;
        }

        Relay::SubmitHints hints = hintsFor(line);
        Relay::Payload payload;
        payload.id = next_id++;
        payload.body.assign(line.begin(), line.end());
        if (!engine.submit(std::move(payload), hints)) {
            spdlog::warn("Message {} rejected (queue full or draining)", next_id - 1);
        }
    }

    if (eof) {
        spdlog::info("End of input, draining {} pending messages...", engine.stats().totals.pending);
        engine.drain();
        while (g_running.load(std::memory_order_acquire)
               && !engine.waitUntilIdle(std::chrono::milliseconds(500))) {
        }
    }

    engine.stop();
    Relay::logReport(engine.stats(), "FINAL DISPATCH STATS");
    spdlog::info("Simulator: {} calls, {} failures, {} retry-after signals",
                 sender.calls(), sender.failures(), sender.retryAfters());
    spdlog::info("RelayCore shutdown complete");
    return 0;
}
