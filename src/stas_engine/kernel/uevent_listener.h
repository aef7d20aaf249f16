/**
 * @file uevent_listener.h
 * @brief Receives nvme uevents from the kernel over NETLINK_KOBJECT_UEVENT.
 */
#ifndef STAS_UEVENT_LISTENER_H
#define STAS_UEVENT_LISTENER_H

#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "device_event.h"

namespace nvmestas {
namespace engine {

/**
 * @brief Listener thread for kernel device events.
 * @details The callback runs on the listener thread. Callers are expected to hand the
 *          event over to the Dispatcher rather than act on it there.
 */
class UeventListener {
public:
    using EventCallback = std::function<void(const DeviceEvent&)>;

    explicit UeventListener(std::string logger_prefix = "[UeventListener]");
    ~UeventListener();

    UeventListener(const UeventListener&) = delete;
    UeventListener& operator=(const UeventListener&) = delete;

    void set_event_callback(EventCallback callback);

    /** @brief Opens the netlink socket and starts the thread. Returns false on failure. */
    bool start();
    void stop();

    bool is_running() const { return running_; }

private:
    void run();
    bool setup_socket();
    void close_socket();

    std::string logger_prefix_;
    EventCallback event_callback_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    int socket_fd_ = -1;
    int epoll_fd_ = -1;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_UEVENT_LISTENER_H
