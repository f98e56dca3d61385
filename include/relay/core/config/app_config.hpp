#pragma once

#include <relay/core/dispatch/dispatch_config.hpp>
#include <cstdint>
#include <string>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";     // trace | debug | info | warn | error
    std::string file;               // empty = console only
};

/**
 * @brief Behaviour of the simulated sender used by relaycore_app.
 *
 * The real protocol client is an external collaborator; the simulator stands
 * in for it so the engine can be run end to end.
 */
struct SimulatorConfig {
    double failure_rate = 0.0;          // probability of a NETWORK failure
    double retry_after_rate = 0.0;      // probability of a retry-after signal
    uint32_t retry_after_ms = 1000;
    uint32_t latency_ms = 50;
    uint64_t seed = 0;                  // 0 = random
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    Relay::DispatchConfig dispatch;
    SimulatorConfig simulator;
};

} // namespace AppConfig
