#include <relay/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

// ============================================================================
// Field helpers
// ============================================================================
// Every helper leaves the default in place when the key is absent and throws
// std::runtime_error naming the offending key on a type or range error.
// ============================================================================

namespace {

[[noreturn]] void fail(const std::string& key, const std::string& what) {
    throw std::runtime_error("Config field '" + key + "': " + what);
}

template <typename T>
T convert(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        fail(key, "invalid type");
    }
}

void readString(const YAML::Node& parent, const char* key, std::string& out) {
    const YAML::Node node = parent[key];
    if (!node) return;
    if (!node.IsScalar()) fail(key, "expected a string");
    out = node.as<std::string>();
}

void readBool(const YAML::Node& parent, const char* key, bool& out) {
    const YAML::Node node = parent[key];
    if (!node) return;
    out = convert<bool>(node, key);
}

template <typename T>
void readUnsigned(const YAML::Node& parent, const char* key, T& out,
                  uint64_t min_value = 0,
                  uint64_t max_value = std::numeric_limits<T>::max()) {
    const YAML::Node node = parent[key];
    if (!node) return;
    int64_t value = convert<int64_t>(node, key);
    if (value < 0 || static_cast<uint64_t>(value) < min_value
        || static_cast<uint64_t>(value) > max_value) {
        fail(key, "value " + std::to_string(value) + " out of range ["
             + std::to_string(min_value) + ", " + std::to_string(max_value) + "]");
    }
    out = static_cast<T>(value);
}

void readDouble(const YAML::Node& parent, const char* key, double& out,
                double min_value, double max_value) {
    const YAML::Node node = parent[key];
    if (!node) return;
    double value = convert<double>(node, key);
    if (value < min_value || value > max_value) {
        fail(key, "value " + std::to_string(value) + " out of range");
    }
    out = value;
}

Relay::TargetConfig parseTarget(const YAML::Node& node, size_t index) {
    if (!node.IsMap()) {
        throw std::runtime_error("Config field 'targets[" + std::to_string(index)
                                 + "]': expected a mapping");
    }
    Relay::TargetConfig t;
    if (!node["name"]) {
        throw std::runtime_error("Config field 'targets[" + std::to_string(index)
                                 + "].name' is required");
    }
    readString(node, "name", t.name);
    readDouble(node, "messages_per_second", t.messages_per_second, 0.1, 1000.0);
    readUnsigned(node, "burst_limit", t.burst_limit, 1, 10000);
    readDouble(node, "recovery_time_s", t.recovery_time_s, 0.0, 3600.0);
    readBool(node, "adaptive", t.adaptive);
    return t;
}

} // namespace

// ============================================================================
// ConfigLoader
// ============================================================================

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found or unreadable: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }

    auto config = parse(root);
    spdlog::info("[ConfigLoader] Loaded {} v{} from {} ({} targets)",
                 config.app_name, config.version, filepath, config.dispatch.targets.size());
    return config;
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(std::string("Config is not valid YAML: ") + e.what());
    }
    return parse(root);
}

AppConfig::AppConfiguration ConfigLoader::parse(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping");
    }

    AppConfig::AppConfiguration config;

    if (!root["app_name"]) {
        throw std::runtime_error("Config field 'app_name' is required");
    }
    readString(root, "app_name", config.app_name);
    readString(root, "version", config.version);

    if (const YAML::Node logging = root["logging"]) {
        readString(logging, "level", config.logging.level);
        readString(logging, "file", config.logging.file);
    }

    auto& d = config.dispatch;

    const YAML::Node targets = root["targets"];
    if (!targets) {
        throw std::runtime_error("Config field 'targets' is required");
    }
    if (!targets.IsSequence()) {
        fail("targets", "expected a sequence");
    }
    for (size_t i = 0; i < targets.size(); ++i) {
        d.targets.push_back(parseTarget(targets[i], i));
    }

    if (const YAML::Node n = root["dispatch"]) {
        readUnsigned(n, "max_queue_size", d.queue.max_queue_size, 1);
        readUnsigned(n, "item_max_retries", d.queue.item_max_retries, 1, 100);
        readUnsigned(n, "max_item_age_s", d.queue.max_item_age_s, 1);
        readDouble(n, "requeue_backoff_factor", d.queue.requeue_backoff_factor, 1.0, 10.0);
        readUnsigned(n, "requeue_max_delay", d.queue.requeue_max_delay, 0, 3600);
        readUnsigned(n, "requeue_delay_unit_ms", d.queue.requeue_delay_unit_ms, 0, 60000);
        readUnsigned(n, "preferred_max_failures", d.queue.preferred_max_failures);
        readUnsigned(n, "rate_window_ms", d.rate.window_ms, 1);
        readUnsigned(n, "rate_tracker_capacity", d.rate.tracker_capacity, 1, 100000);
        readBool(n, "adaptive_enabled", d.adaptive_enabled);

        std::string strategy;
        readString(n, "selection_strategy", strategy);
        if (!strategy.empty()) {
            auto parsed = Relay::parseSelectionStrategy(strategy);
            if (!parsed) {
                fail("selection_strategy", "unknown strategy '" + strategy
                     + "' (expected round_robin, least_loaded or smart)");
            }
            d.strategy = *parsed;
        }
    }

    if (const YAML::Node n = root["resilience"]) {
        readUnsigned(n, "max_attempts", d.resilience.max_attempts, 1, 100);
        readUnsigned(n, "base_delay_ms", d.resilience.base_delay_ms);
        readUnsigned(n, "jitter_max_ms", d.resilience.jitter_max_ms);
        readUnsigned(n, "circuit_threshold", d.resilience.circuit_threshold, 1);
        readUnsigned(n, "circuit_timeout_s", d.resilience.circuit_timeout_s);
        readUnsigned(n, "send_timeout_ms", d.resilience.send_timeout_ms, 1);
        readUnsigned(n, "send_threads", d.resilience.send_threads, 0, 1024);
    }

    if (const YAML::Node n = root["workers"]) {
        readUnsigned(n, "idle_poll_ms", d.workers.idle_poll_ms, 1);
        readUnsigned(n, "idle_activity_ms", d.workers.idle_activity_ms, 1);
        readUnsigned(n, "rate_limited_pause_ms", d.workers.rate_limited_pause_ms, 1);
        readUnsigned(n, "message_timeout_ms", d.workers.message_timeout_ms, 1);
        readUnsigned(n, "health_check_interval_s", d.workers.health_check_interval_s);
        readUnsigned(n, "stuck_threshold_s", d.workers.stuck_threshold_s, 1);
        readUnsigned(n, "error_threshold", d.workers.error_threshold, 1);
        readUnsigned(n, "restart_pause_ms", d.workers.restart_pause_ms);
    }

    if (const YAML::Node n = root["maintenance"]) {
        readUnsigned(n, "monitor_interval_ms", d.maintenance.monitor_interval_ms, 1);
        readUnsigned(n, "rebalance_interval_ms", d.maintenance.rebalance_interval_ms, 1);
        readUnsigned(n, "reaper_interval_ms", d.maintenance.reaper_interval_ms, 1);
        readUnsigned(n, "retention_s", d.maintenance.retention_s, 1);
        readUnsigned(n, "rebalance_min_gap", d.maintenance.rebalance_min_gap, 1);
        readUnsigned(n, "rebalance_max_move", d.maintenance.rebalance_max_move, 1);
        readUnsigned(n, "dead_letter_capacity", d.maintenance.dead_letter_capacity, 1);
    }

    if (const YAML::Node n = root["simulator"]) {
        readDouble(n, "failure_rate", config.simulator.failure_rate, 0.0, 1.0);
        readDouble(n, "retry_after_rate", config.simulator.retry_after_rate, 0.0, 1.0);
        readUnsigned(n, "retry_after_ms", config.simulator.retry_after_ms);
        readUnsigned(n, "latency_ms", config.simulator.latency_ms);
        readUnsigned(n, "seed", config.simulator.seed);
    }

    validate(config);
    return config;
}

void ConfigLoader::validate(const AppConfig::AppConfiguration& config) {
    if (config.app_name.empty()) {
        fail("app_name", "must not be empty");
    }

    const auto& d = config.dispatch;
    if (d.targets.empty()) {
        fail("targets", "at least one target is required");
    }
    for (size_t i = 0; i < d.targets.size(); ++i) {
        if (d.targets[i].name.empty()) {
            fail("targets[" + std::to_string(i) + "].name", "must not be empty");
        }
        if (d.targets[i].burst_limit > d.rate.tracker_capacity) {
            fail("targets[" + std::to_string(i) + "].burst_limit",
                 "exceeds rate_tracker_capacity (" + std::to_string(d.rate.tracker_capacity) + ")");
        }
    }

    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known_level = false;
    for (const char* l : levels) {
        if (config.logging.level == l) known_level = true;
    }
    if (!known_level) {
        fail("logging.level", "unknown level '" + config.logging.level + "'");
    }

    if (config.simulator.failure_rate + config.simulator.retry_after_rate > 1.0) {
        fail("simulator", "failure_rate + retry_after_rate must not exceed 1.0");
    }
}
