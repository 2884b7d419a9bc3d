#include "engine_config.hpp"

#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace seating {

namespace {

// One year; keeps minute arithmetic on timestamps far from overflow.
constexpr int kMaxHoldMinutesCeiling = 525600;

void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }

LoadResult parse(const YAML::Node& root, EngineConfig& out) {
    if (root.IsNull()) {
        return LoadResult{true, ""};
    }
    if (!root.IsMap()) {
        return LoadResult{false, "Config root must be a mapping"};
    }

    EngineConfig c = out;
    try_get(root, "hold_duration_minutes",  c.hold_duration_minutes);
    try_get(root, "max_hold_minutes",       c.max_hold_minutes);
    try_get(root, "sweep_interval_seconds", c.sweep_interval_seconds);
    try_get(root, "retry_attempts",         c.retry_attempts);
    try_get(root, "retry_base_delay_ms",    c.retry_base_delay_ms);
    try_get(root, "log_level",              c.log_level);
    try_get(root, "chart_file",             c.chart_file);

    LoadResult valid = c.validate();
    if (!valid.success) return valid;

    out = c;
    return LoadResult{true, ""};
}

} // namespace

LoadResult EngineConfig::load_from_file(const std::string& path, EngineConfig& out) {
    try {
        return parse(YAML::LoadFile(path), out);
    } catch (const YAML::Exception& e) {
        return LoadResult{false, "Failed to read config " + path + ": " + e.what()};
    }
}

LoadResult EngineConfig::load_from_string(const std::string& yaml, EngineConfig& out) {
    try {
        return parse(YAML::Load(yaml), out);
    } catch (const YAML::Exception& e) {
        return LoadResult{false, std::string("Failed to parse config: ") + e.what()};
    }
}

LoadResult EngineConfig::validate() const {
    if (hold_duration_minutes <= 0) {
        return LoadResult{false, "hold_duration_minutes must be positive"};
    }
    if (max_hold_minutes < 1 || max_hold_minutes > kMaxHoldMinutesCeiling) {
        return LoadResult{false, "max_hold_minutes must be in [1, " + std::to_string(kMaxHoldMinutesCeiling) + "]"};
    }
    if (hold_duration_minutes > max_hold_minutes) {
        return LoadResult{false, "hold_duration_minutes must not exceed max_hold_minutes"};
    }
    if (sweep_interval_seconds <= 0) {
        return LoadResult{false, "sweep_interval_seconds must be positive"};
    }
    if (retry_attempts < 1 || retry_attempts > 10) {
        return LoadResult{false, "retry_attempts must be in [1, 10]"};
    }
    if (retry_base_delay_ms < 0) {
        return LoadResult{false, "retry_base_delay_ms must not be negative"};
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        return LoadResult{false, "Unknown log_level: " + log_level};
    }
    return LoadResult{true, ""};
}

void EngineConfig::apply_log_level() const {
    spdlog::set_level(spdlog::level::from_str(log_level));
}

} // namespace seating
