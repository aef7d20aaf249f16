#include "log_pump.h"

#include <cstdio>
#include <syslog.h>

namespace nvmestas {
namespace engine {
namespace logging {

namespace {

int syslog_priority(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return LOG_DEBUG;
        case LogLevel::INFO:    return LOG_INFO;
        case LogLevel::WARNING: return LOG_WARNING;
        case LogLevel::ERR:     return LOG_ERR;
    }
    return LOG_INFO;
}

} // namespace

LogPump::LogPump(std::string identity, bool use_syslog)
    : identity_(std::move(identity)), use_syslog_(use_syslog) {}

LogPump::~LogPump() {
    stop();
}

void LogPump::start() {
    if (running_) {
        return;
    }
    if (use_syslog_) {
        openlog(identity_.c_str(), LOG_PID, LOG_DAEMON);
    }
    running_ = true;
    thread_ = std::thread(&LogPump::run, this);
}

void LogPump::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    shutdown_stas_logger();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (use_syslog_) {
        closelog();
    }
}

void LogPump::run() {
    while (running_) {
        for (const auto& entry : retrieve_log_entries(200)) {
            write_entry(entry);
        }
    }
    // Drain what was queued before shutdown.
    for (;;) {
        auto batch = retrieve_log_entries(0);
        if (batch.empty()) {
            break;
        }
        for (const auto& entry : batch) {
            write_entry(entry);
        }
    }
}

void LogPump::write_entry(const LogEntry& entry) {
    if (use_syslog_) {
        syslog(syslog_priority(entry.level), "%s", entry.message.c_str());
        return;
    }
    std::fprintf(stderr, "%-7s %s:%d %s\n",
                 log_level_name(entry.level),
                 entry.filename.c_str(),
                 entry.line_number,
                 entry.message.c_str());
}

} // namespace logging
} // namespace engine
} // namespace nvmestas
