#include "muxbus/log.hpp"
#include <mutex>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace muxbus {

namespace {

struct LoggerSlot {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
};

LoggerSlot& DiagnosticsSlot() {
    static LoggerSlot* slot = new LoggerSlot();
    return *slot;
}

LoggerSlot& TelemetrySlot() {
    static LoggerSlot* slot = new LoggerSlot();
    return *slot;
}

// Reuse a logger the application registered under `name`, else create one
std::shared_ptr<spdlog::logger> Acquire(LoggerSlot& slot, const std::string& name) {
    std::lock_guard lock(slot.mutex);
    if (slot.logger) {
        return slot.logger;
    }
    slot.logger = spdlog::get(name);
    if (!slot.logger) {
        try {
            slot.logger = spdlog::stdout_color_mt(name);
        } catch (const spdlog::spdlog_ex&) {
            // Registered concurrently by someone else
            slot.logger = spdlog::get(name);
        }
    }
    return slot.logger;
}

void Install(LoggerSlot& slot, std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lock(slot.mutex);
    slot.logger = std::move(logger);
}

} // namespace

std::shared_ptr<spdlog::logger> Logger() {
    return Acquire(DiagnosticsSlot(), "muxbus");
}

std::shared_ptr<spdlog::logger> StatsLogger() {
    return Acquire(TelemetrySlot(), "muxbus.stats");
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    Install(DiagnosticsSlot(), std::move(logger));
}

void SetStatsLogger(std::shared_ptr<spdlog::logger> logger) {
    Install(TelemetrySlot(), std::move(logger));
}

} // namespace muxbus
