// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file connection.hpp
 * @brief Controller socket: connect, read loop, line framing and writes
 */

#ifndef TPSDK_CONNECTION_HPP
#define TPSDK_CONNECTION_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace tpsdk {

constexpr const char* DEFAULT_HOST = "127.0.0.1";
constexpr uint16_t DEFAULT_PORT = 12136;

/**
 * @brief Splits a byte stream into lines
 *
 * Lines end with '\n', a trailing '\r' is dropped. Bytes after the last
 * terminator stay buffered until the rest of the line arrives.
 */
class LineFramer {
public:
    void append(const char* data, size_t len);

    /**
     * @brief Extract the next complete line
     * @return false when no complete line is buffered
     */
    bool next_line(std::string& line);

    size_t buffered() const { return buffer_.size() - offset_; }
    void clear();

private:
    std::string buffer_;
    size_t offset_{0};
};

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

/**
 * @brief Why the read loop ended
 */
enum class ExitReason {
    REQUESTED,      ///< disconnect() was called
    PEER_CLOSED,    ///< Zero-length read
    SOCKET_ERROR
};

const char* exit_reason_name(ExitReason reason);

/**
 * @brief Owns the stream socket to the controller
 *
 * open() and run() are meant for one thread (the loop thread). send() and
 * disconnect() may be called from any thread; writes are serialized so each
 * message goes out as one uninterrupted line. disconnect() never waits for a
 * blocked write: it shuts the socket down, which fails the write.
 */
class ConnectionManager {
public:
    struct Settings {
        std::string host{DEFAULT_HOST};
        uint16_t port{DEFAULT_PORT};
        uint32_t poll_interval_ms{10};      ///< Sleep between idle loop iterations
        uint32_t socket_wait_ms{1000};      ///< Bounded wait for readability
        size_t receive_buffer_size{4096};   ///< Bytes per read
    };

    using LineHandler = std::function<void(const std::string&)>;

    explicit ConnectionManager(Settings settings);
    ~ConnectionManager();

    /**
     * @brief Open the socket
     * @return true once connected, false on failure (see last_error())
     */
    bool open();

    /**
     * @brief Run the read loop until disconnect, peer close or socket error
     *
     * Every complete non-empty line is passed to on_line, in arrival order.
     * The socket is closed before returning.
     */
    ExitReason run(const LineHandler& on_line);

    /**
     * @brief Serialize a message and write it as one line
     * @return false when not connected or the write failed
     */
    bool send(const nlohmann::json& message);
    bool send_line(const std::string& line);

    /**
     * @brief Ask the loop to stop and shut the socket down
     *
     * Does nothing when already disconnected or already requested.
     */
    void disconnect();

    bool is_connected() const { return state_ == ConnectionState::CONNECTED; }
    ConnectionState state() const { return state_; }
    std::string last_error() const;
    const Settings& settings() const { return settings_; }

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

private:
    void set_error(const std::string& error);
    void close_socket();

    Settings settings_;
    LineFramer framer_;

    int fd_{-1};
    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
    std::atomic<bool> stop_requested_{false};

    // fd_ changes only with both locks held. write_mutex_ is held across
    // ::send, fd_mutex_ only for short fd operations.
    std::mutex write_mutex_;
    std::mutex fd_mutex_;
    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace tpsdk

#endif // TPSDK_CONNECTION_HPP
