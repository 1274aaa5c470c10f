// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "connection.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <common/showmsg.hpp>

#ifndef MSG_NOSIGNAL
	#define MSG_NOSIGNAL 0
#endif

namespace tpsdk {

// ============================================================================
// LineFramer
// ============================================================================

void LineFramer::append(const char* data, size_t len) {
    // Drop consumed bytes before growing the buffer
    if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    buffer_.append(data, len);
}

bool LineFramer::next_line(std::string& line) {
    size_t end = buffer_.find('\n', offset_);
    if (end == std::string::npos) {
        return false;
    }

    size_t len = end - offset_;
    if (len > 0 && buffer_[end - 1] == '\r') {
        --len;
    }

    line.assign(buffer_, offset_, len);
    offset_ = end + 1;

    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    return true;
}

void LineFramer::clear() {
    buffer_.clear();
    offset_ = 0;
}

const char* exit_reason_name(ExitReason reason) {
    switch (reason) {
        case ExitReason::REQUESTED: return "requested";
        case ExitReason::PEER_CLOSED: return "peer closed the connection";
        case ExitReason::SOCKET_ERROR: return "socket error";
    }
    return "unknown";
}

// ============================================================================
// ConnectionManager
// ============================================================================

ConnectionManager::ConnectionManager(Settings settings)
    : settings_(std::move(settings)) {
    if (settings_.receive_buffer_size == 0) {
        settings_.receive_buffer_size = 4096;
    }
}

ConnectionManager::~ConnectionManager() {
    close_socket();
}

bool ConnectionManager::open() {
    if (state_ != ConnectionState::DISCONNECTED) {
        ShowWarning("ConnectionManager::open: already connected to %s:%u\n", settings_.host.c_str(), static_cast<unsigned>(settings_.port));
        return false;
    }

    stop_requested_ = false;
    state_ = ConnectionState::CONNECTING;
    framer_.clear();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    const std::string port = std::to_string(static_cast<unsigned>(settings_.port));
    int rc = ::getaddrinfo(settings_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        set_error(std::string("cannot resolve ") + settings_.host + ": " + gai_strerror(rc));
        ShowError("ConnectionManager::open: %s\n", last_error().c_str());
        state_ = ConnectionState::DISCONNECTED;
        return false;
    }

    int fd = -1;
    std::string error = "no address";
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            error = std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        error = std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(result);

    if (fd < 0) {
        set_error("connect to " + settings_.host + ":" + port + " failed (" + error + ")");
        ShowError("ConnectionManager::open: %s\n", last_error().c_str());
        state_ = ConnectionState::DISCONNECTED;
        return false;
    }

    int yes = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&yes, sizeof(yes)) != 0) {
        ShowWarning("ConnectionManager::open: Unable to set TCP_NODELAY on socket #%d (%s)\n", fd, std::strerror(errno));
    }

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        std::lock_guard<std::mutex> fd_lock(fd_mutex_);
        fd_ = fd;
    }
    state_ = ConnectionState::CONNECTED;
    ShowStatus("[Connection] Connected to %s:%u\n", settings_.host.c_str(), static_cast<unsigned>(settings_.port));
    return true;
}

ExitReason ConnectionManager::run(const LineHandler& on_line) {
    std::vector<char> buffer(settings_.receive_buffer_size);
    ExitReason reason = ExitReason::REQUESTED;
    std::string line;

    while (!stop_requested_ && fd_ >= 0) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, static_cast<int>(settings_.socket_wait_ms));
        if (stop_requested_) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            set_error(std::string("poll failed (") + std::strerror(errno) + ")");
            reason = ExitReason::SOCKET_ERROR;
            break;
        }

        bool received = false;
        if (rc > 0) {
            if (pfd.revents & POLLNVAL) {
                set_error("socket is not open");
                reason = ExitReason::SOCKET_ERROR;
                break;
            }

            ssize_t len = ::recv(fd_, buffer.data(), buffer.size(), MSG_DONTWAIT);
            if (len > 0) {
                framer_.append(buffer.data(), static_cast<size_t>(len));
                received = true;
            } else if (len == 0) {
                reason = stop_requested_ ? ExitReason::REQUESTED : ExitReason::PEER_CLOSED;
                if (reason == ExitReason::PEER_CLOSED) {
                    set_error("peer closed the connection");
                }
                break;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                if (!stop_requested_) {
                    set_error(std::string("recv failed (") + std::strerror(errno) + ")");
                    reason = ExitReason::SOCKET_ERROR;
                }
                break;
            }
        }

        while (framer_.next_line(line)) {
            if (!line.empty()) {
                on_line(line);
            }
        }

        if (!received && settings_.poll_interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(settings_.poll_interval_ms));
        }
    }

    if (framer_.buffered() > 0) {
        ShowWarning("[Connection] Discarding %zu byte(s) of incomplete message\n", framer_.buffered());
    }

    close_socket();

    if (reason == ExitReason::REQUESTED) {
        ShowStatus("[Connection] Disconnected from %s:%u\n", settings_.host.c_str(), static_cast<unsigned>(settings_.port));
    } else {
        ShowError("[Connection] Connection to %s:%u lost: %s\n", settings_.host.c_str(), static_cast<unsigned>(settings_.port), last_error().c_str());
    }
    return reason;
}

bool ConnectionManager::send(const nlohmann::json& message) {
    std::string line;
    try {
        line = message.dump();
    } catch (const nlohmann::json::type_error& e) {
        ShowError("ConnectionManager::send: cannot serialize message (%s)\n", e.what());
        return false;
    }
    return send_line(line);
}

bool ConnectionManager::send_line(const std::string& line) {
    std::string data = line;
    data += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (fd_ < 0 || state_ != ConnectionState::CONNECTED || stop_requested_) {
        return false;
    }

    const char* ptr = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t len = ::send(fd_, ptr, left, MSG_NOSIGNAL);
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (stop_requested_) {
                // Socket was shut down under a pending write
                return false;
            }
            set_error(std::string("send failed (") + std::strerror(errno) + ")");
            ShowError("ConnectionManager::send: %s on socket #%d\n", last_error().c_str(), fd_);
            return false;
        }
        ptr += len;
        left -= static_cast<size_t>(len);
    }
    return true;
}

void ConnectionManager::disconnect() {
    if (state_ == ConnectionState::DISCONNECTED) {
        return;
    }
    if (stop_requested_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        if (fd_ >= 0) {
            // Wakes the loop thread and fails any blocked write; the loop
            // closes the descriptor
            ::shutdown(fd_, SHUT_RDWR);
        }
    }
    ShowInfo("[Connection] Disconnect requested\n");
}

std::string ConnectionManager::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void ConnectionManager::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
}

void ConnectionManager::close_socket() {
    {
        // Fail writes still blocked on the socket so write_mutex_ frees up
        std::lock_guard<std::mutex> lock(fd_mutex_);
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::lock_guard<std::mutex> fd_lock(fd_mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    framer_.clear();
    state_ = ConnectionState::DISCONNECTED;
}

} // namespace tpsdk
