#include "uevent_listener.h"

#include <linux/netlink.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

constexpr int kMaxEvents = 8;
constexpr int kEpollTimeoutMs = 1000;
constexpr size_t kReceiveBufferSize = 8192;
constexpr uint32_t kKernelEventGroup = 1;

} // namespace

UeventListener::UeventListener(std::string logger_prefix) : logger_prefix_(std::move(logger_prefix)) {}

UeventListener::~UeventListener() {
    stop();
}

void UeventListener::set_event_callback(EventCallback callback) {
    event_callback_ = std::move(callback);
}

bool UeventListener::start() {
    if (running_) {
        return true;
    }
    LOG_STAS_INFO("%s Starting kernel event listener.", logger_prefix_.c_str());
    if (!setup_socket()) {
        close_socket();
        return false;
    }
    running_ = true;
    thread_ = std::thread(&UeventListener::run, this);
    return true;
}

void UeventListener::stop() {
    if (!running_) {
        return;
    }
    LOG_STAS_INFO("%s Stopping kernel event listener.", logger_prefix_.c_str());
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    close_socket();
}

bool UeventListener::setup_socket() {
    socket_fd_ = socket(AF_NETLINK, SOCK_DGRAM | SOCK_CLOEXEC | SOCK_NONBLOCK, NETLINK_KOBJECT_UEVENT);
    if (socket_fd_ < 0) {
        LOG_STAS_ERROR("%s Failed to create netlink socket: %s", logger_prefix_.c_str(), strerror(errno));
        return false;
    }

    struct sockaddr_nl addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.nl_family = AF_NETLINK;
    addr.nl_pid = 0;
    addr.nl_groups = kKernelEventGroup;
    if (bind(socket_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_STAS_ERROR("%s Failed to bind netlink socket: %s", logger_prefix_.c_str(), strerror(errno));
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ == -1) {
        LOG_STAS_ERROR("%s Failed to create epoll instance", logger_prefix_.c_str());
        return false;
    }

    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = EPOLLIN;
    event.data.fd = socket_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, socket_fd_, &event) == -1) {
        LOG_STAS_ERROR("%s Failed to add netlink socket to epoll: %s", logger_prefix_.c_str(), strerror(errno));
        return false;
    }
    return true;
}

void UeventListener::close_socket() {
    if (epoll_fd_ != -1) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (socket_fd_ != -1) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

void UeventListener::run() {
    LOG_STAS_DEBUG("%s Listener thread started.", logger_prefix_.c_str());
    char buffer[kReceiveBufferSize];
    struct epoll_event events[kMaxEvents];

    while (running_) {
        int n_events = epoll_wait(epoll_fd_, events, kMaxEvents, kEpollTimeoutMs);
        if (!running_) {
            break;
        }
        if (n_events < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_STAS_ERROR("%s epoll_wait() error: %s", logger_prefix_.c_str(), strerror(errno));
            continue;
        }

        for (int i = 0; i < n_events; ++i) {
            if (!(events[i].events & EPOLLIN)) {
                continue;
            }
            for (;;) {
                ssize_t n_received = recv(socket_fd_, buffer, sizeof(buffer), 0);
                if (n_received <= 0) {
                    if (n_received < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                        LOG_STAS_WARNING("%s recv() error: %s", logger_prefix_.c_str(), strerror(errno));
                    }
                    break;
                }
                auto event = parse_uevent(buffer, static_cast<size_t>(n_received));
                if (event && event_callback_) {
                    event_callback_(*event);
                }
            }
        }
    }
    LOG_STAS_DEBUG("%s Listener thread finished.", logger_prefix_.c_str());
}

} // namespace engine
} // namespace nvmestas
