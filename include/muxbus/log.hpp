#ifndef MUXBUS_LOG_HPP
#define MUXBUS_LOG_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace muxbus {

/**
 * @brief Library diagnostics logger ("muxbus").
 *
 * Created on first use as a colored stdout logger unless the application
 * has already registered a logger with that name in spdlog, or installed
 * one with SetLogger().
 *
 * @par Thread Safety
 * Safe to call from any thread.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> Logger();

/**
 * @brief Per-batch transmission telemetry logger ("muxbus.stats").
 *
 * Only written to by clients configured with `stats = true`.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> StatsLogger();

// Replace the diagnostics logger (nullptr restores the default)
void SetLogger(std::shared_ptr<spdlog::logger> logger);

// Replace the telemetry logger (nullptr restores the default)
void SetStatsLogger(std::shared_ptr<spdlog::logger> logger);

} // namespace muxbus

#endif // MUXBUS_LOG_HPP
