#pragma once

#include <chrono>
#include <string>

/**
 * @file engine_config.hpp
 * @brief Tunables of the seating engine, loadable from a YAML file.
 *
 * Example:
 * @code
 * hold_duration_minutes: 15
 * max_hold_minutes: 1440
 * sweep_interval_seconds: 60
 * retry_attempts: 3
 * retry_base_delay_ms: 5
 * log_level: info
 * chart_file: charts/main_hall.yaml
 * @endcode
 *
 * Keys that are absent keep their defaults.
 */

namespace seating {

/**
 * @brief Result of loading a configuration or chart file.
 */
struct LoadResult {
    bool success;         /**< True if the file was parsed and validated. */
    std::string message;  /**< Reason for failure (empty on success). */
};

struct EngineConfig {
    int hold_duration_minutes = 15;    /**< Default hold duration. */
    int max_hold_minutes = 1440;       /**< Upper bound for a hold duration and for one extension. */
    int sweep_interval_seconds = 60;   /**< ExpirySweeper period. */
    int retry_attempts = 3;            /**< Attempts per seat on transient store contention. */
    int retry_base_delay_ms = 5;       /**< First backoff delay; doubled after every attempt. */
    std::string log_level = "info";    /**< spdlog level name. */
    std::string chart_file;            /**< Optional chart definition loaded by the CLI. */

    std::chrono::seconds sweep_interval() const { return std::chrono::seconds(sweep_interval_seconds); }
    std::chrono::milliseconds retry_base_delay() const { return std::chrono::milliseconds(retry_base_delay_ms); }

    /**
     * @brief Reads @p path into @p out.
     *
     * @p out is left untouched on failure.
     */
    static LoadResult load_from_file(const std::string& path, EngineConfig& out);

    /** @brief Same as load_from_file() for an in-memory YAML document. */
    static LoadResult load_from_string(const std::string& yaml, EngineConfig& out);

    /** @brief Checks value ranges; returns the first violation. */
    LoadResult validate() const;

    /** @brief Applies log_level to the default spdlog logger. */
    void apply_log_level() const;
};

} // namespace seating
