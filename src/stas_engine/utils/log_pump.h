/**
 * @file log_pump.h
 * @brief Drains the engine log queue into stderr or syslog.
 */
#ifndef STAS_LOG_PUMP_H
#define STAS_LOG_PUMP_H

#include <atomic>
#include <string>
#include <thread>

#include "stas_logger.h"

namespace nvmestas {
namespace engine {
namespace logging {

/**
 * @class LogPump
 * @brief Owns the single consumer thread of the log queue.
 * @details The daemon starts one pump right after parsing its command line. Entries are
 *          written to stderr as "LEVEL file:line message" or, when syslog output is
 *          selected, forwarded to `syslog(3)` with the matching priority.
 */
class LogPump {
public:
    LogPump(std::string identity, bool use_syslog);
    ~LogPump();

    LogPump(const LogPump&) = delete;
    LogPump& operator=(const LogPump&) = delete;

    void start();

    /** @brief Flushes whatever is queued, then joins the pump thread. */
    void stop();

    bool is_running() const { return running_; }

private:
    void run();
    void write_entry(const LogEntry& entry);

    std::string identity_;
    bool use_syslog_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace logging
} // namespace engine
} // namespace nvmestas

#endif // STAS_LOG_PUMP_H
