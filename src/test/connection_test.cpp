#include <gtest/gtest.h>
#include "tpsdk/client.hpp"
#include "tpsdk/connection.hpp"
#include "tpsdk/errors.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace tpsdk;

namespace {

template<typename Predicate>
bool wait_until(Predicate predicate, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// Plays the controller side on an ephemeral loopback port
class FakeController {
public:
    FakeController() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 && ::listen(listen_fd_, 1) == 0) {
            socklen_t len = sizeof(addr);
            ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
            port_ = ntohs(addr.sin_port);
        }
    }

    ~FakeController() {
        close_client();
        if (listen_fd_ >= 0) {
            ::close(listen_fd_);
        }
    }

    uint16_t port() const { return port_; }

    bool accept_client(int timeout_ms = 5000) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, timeout_ms) <= 0) {
            return false;
        }
        client_fd_ = ::accept(listen_fd_, nullptr, nullptr);
        return client_fd_ >= 0;
    }

    bool send_line(const std::string& line) {
        std::string data = line + "\n";
        return ::send(client_fd_, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    bool send_raw(const std::string& data) {
        return ::send(client_fd_, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    // Null when nothing arrives in time
    nlohmann::json read_message(int timeout_ms = 5000) {
        std::string line;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

        while (!framer_.next_line(line)) {
            int left = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count());
            if (left <= 0) {
                return nullptr;
            }
            pollfd pfd{client_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, left) <= 0) {
                return nullptr;
            }
            char buffer[1024];
            ssize_t len = ::recv(client_fd_, buffer, sizeof(buffer), 0);
            if (len <= 0) {
                return nullptr;
            }
            framer_.append(buffer, static_cast<size_t>(len));
        }
        return nlohmann::json::parse(line);
    }

    void close_client() {
        if (client_fd_ >= 0) {
            ::shutdown(client_fd_, SHUT_RDWR);
            ::close(client_fd_);
            client_fd_ = -1;
        }
    }

private:
    int listen_fd_{-1};
    int client_fd_{-1};
    uint16_t port_{0};
    LineFramer framer_;
};

// Port with nothing listening on it
uint16_t unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    uint16_t port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
    }
    ::close(fd);
    return port;
}

// Polls a counter until it stops moving
bool wait_until_stalled(const std::atomic<size_t>& counter, int timeout_ms = 10000) {
    return wait_until([&counter]() {
        size_t before = counter.load();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return before > 0 && counter.load() == before;
    }, timeout_ms);
}

} // namespace

// ============================================================================
// LineFramer
// ============================================================================

TEST(LineFramerTest, PartialLines) {
    LineFramer framer;
    std::string line;

    framer.append("{\"type\":", 8);
    EXPECT_FALSE(framer.next_line(line));
    EXPECT_EQ(framer.buffered(), 8u);

    framer.append("\"info\"}\n{\"ty", 12);
    ASSERT_TRUE(framer.next_line(line));
    EXPECT_EQ(line, "{\"type\":\"info\"}");
    EXPECT_FALSE(framer.next_line(line));
    EXPECT_EQ(framer.buffered(), 4u);

    framer.clear();
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(LineFramerTest, SeveralLinesInOneRead) {
    LineFramer framer;
    std::string line;
    const std::string data = "first\r\n\nsecond\nthird";

    framer.append(data.data(), data.size());
    ASSERT_TRUE(framer.next_line(line));
    EXPECT_EQ(line, "first");
    ASSERT_TRUE(framer.next_line(line));
    EXPECT_EQ(line, "");
    ASSERT_TRUE(framer.next_line(line));
    EXPECT_EQ(line, "second");
    EXPECT_FALSE(framer.next_line(line));

    framer.append("\n", 1);
    ASSERT_TRUE(framer.next_line(line));
    EXPECT_EQ(line, "third");
    EXPECT_EQ(framer.buffered(), 0u);
}

// ============================================================================
// ConnectionManager
// ============================================================================

class ConnectionTest : public ::testing::Test {
protected:
    FakeController controller;

    ConnectionManager::Settings settings() {
        ConnectionManager::Settings settings;
        settings.port = controller.port();
        settings.socket_wait_ms = 50;
        settings.poll_interval_ms = 1;
        settings.receive_buffer_size = 16;
        return settings;
    }
};

TEST_F(ConnectionTest, ReadsLinesAndStopsOnRequest) {
    ASSERT_NE(controller.port(), 0);
    ConnectionManager connection(settings());

    ASSERT_TRUE(connection.open());
    EXPECT_TRUE(connection.is_connected());
    ASSERT_TRUE(controller.accept_client());

    std::mutex mutex;
    std::vector<std::string> lines;
    std::promise<ExitReason> exit;
    std::thread loop([&]() {
        exit.set_value(connection.run([&](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.push_back(line);
        }));
    });

    EXPECT_TRUE(connection.send({{"type", "pair"}, {"id", "com.example"}}));
    nlohmann::json pair = controller.read_message();
    EXPECT_EQ(pair["type"], "pair");

    // Longer than the read size, split across reads
    controller.send_raw("{\"type\":\"info\",\"tpVersionString\":\"4.0\"}\r\n\n{\"type\":\"broad");
    controller.send_raw("cast\"}\n");
    EXPECT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return lines.size() == 2;
    }));

    connection.disconnect();
    connection.disconnect();

    auto future = exit.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(future.get(), ExitReason::REQUESTED);
    loop.join();

    EXPECT_EQ(lines[0], "{\"type\":\"info\",\"tpVersionString\":\"4.0\"}");
    EXPECT_EQ(lines[1], "{\"type\":\"broadcast\"}");
    EXPECT_FALSE(connection.is_connected());
    EXPECT_FALSE(connection.send_line("{}"));

    // Disconnecting a closed connection does nothing
    connection.disconnect();
    EXPECT_EQ(connection.state(), ConnectionState::DISCONNECTED);
}

TEST_F(ConnectionTest, DisconnectUnblocksPendingWrite) {
    ConnectionManager connection(settings());
    ASSERT_TRUE(connection.open());
    ASSERT_TRUE(controller.accept_client());

    // The controller never reads, so the socket buffers fill up
    const std::string payload(64 * 1024, 'x');
    const std::string line = nlohmann::json({{"type", "stateUpdate"}, {"id", "com.example.big"}, {"value", payload}}).dump();
    std::atomic<size_t> sent{0};
    std::thread writer([&]() {
        while (connection.send_line(line)) {
            ++sent;
        }
    });
    EXPECT_TRUE(wait_until_stalled(sent));

    std::promise<void> done;
    std::thread stopper([&]() {
        connection.disconnect();
        done.set_value();
    });
    auto future = done.get_future();
    EXPECT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    stopper.join();
    writer.join();
    EXPECT_FALSE(connection.send_line("{}"));
}

TEST_F(ConnectionTest, PeerClose) {
    ConnectionManager connection(settings());
    ASSERT_TRUE(connection.open());
    ASSERT_TRUE(controller.accept_client());

    controller.close_client();
    EXPECT_EQ(connection.run([](const std::string&) {}), ExitReason::PEER_CLOSED);
    EXPECT_FALSE(connection.last_error().empty());
    EXPECT_FALSE(connection.is_connected());
}

TEST_F(ConnectionTest, RefusedConnection) {
    ConnectionManager::Settings refused = settings();
    refused.port = unused_port();
    ConnectionManager connection(refused);

    EXPECT_FALSE(connection.open());
    EXPECT_FALSE(connection.last_error().empty());
    EXPECT_EQ(connection.state(), ConnectionState::DISCONNECTED);
    EXPECT_FALSE(connection.send({{"type", "pair"}}));
}

// ============================================================================
// Client
// ============================================================================

class ClientTest : public ::testing::Test {
protected:
    FakeController controller;
    std::mutex mutex;
    std::vector<ErrorEvent> errors;

    ClientConfig config() {
        ClientConfig config;
        config.plugin_id = "com.example";
        config.port = controller.port();
        config.socket_wait_ms = 50;
        config.poll_interval_ms = 1;
        config.max_workers = 2;
        return config;
    }

    void watch_errors(Client& client) {
        client.on_error([this](const ErrorEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(event);
        });
    }

    // Accepts the client and consumes its pairing request
    void pair(Client& client) {
        ASSERT_TRUE(client.start());
        ASSERT_TRUE(controller.accept_client());
        nlohmann::json pair = controller.read_message();
        ASSERT_EQ(pair["type"], "pair");
        ASSERT_EQ(pair["id"], "com.example");
        ASSERT_TRUE(wait_until([&client]() { return client.is_connected(); }));
    }
};

TEST_F(ClientTest, ActionHandlerReceivesValue) {
    Client client(config());
    watch_errors(client);

    std::promise<std::string> value;
    client.on(MessageKind::ACTION, [&value](const Message& message) {
        auto data = message.data_value("com.example.main.set.value");
        value.set_value(data ? data->get<std::string>() : "");
    });

    pair(client);
    controller.send_line(R"({"type":"action","pluginId":"com.example","actionId":"com.example.main.set",)"
                         R"("data":[{"id":"com.example.main.set.value","value":"42"}]})");

    auto future = value.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(future.get(), "42");

    client.disconnect();
    EXPECT_TRUE(client.wait());
    EXPECT_TRUE(errors.empty());
}

TEST_F(ClientTest, SettingsFromInfoAreRecorded) {
    Client client(config());
    pair(client);

    controller.send_line(R"({"type":"info","tpVersionString":"4.0","settings":[{"Refresh":"60"},{"Mode":"fast"}]})");
    EXPECT_TRUE(wait_until([&client]() { return client.states().setting("Mode").has_value(); }));
    EXPECT_EQ(*client.states().setting("Refresh"), "60");

    // Already known to the controller
    EXPECT_FALSE(client.setting_update("Refresh", "60"));
    EXPECT_TRUE(client.setting_update("Refresh", "30"));
    nlohmann::json update = controller.read_message();
    EXPECT_EQ(update["type"], "settingUpdate");
    EXPECT_EQ(update["name"], "Refresh");
    EXPECT_EQ(update["value"], "30");
}

TEST_F(ClientTest, HoldLifecycle) {
    Client client(config());
    pair(client);

    controller.send_line(R"({"type":"down","pluginId":"com.example","actionId":"com.example.main.set","instanceId":"i1"})");
    EXPECT_TRUE(wait_until([&client]() { return client.is_action_held("com.example.main.set"); }));
    EXPECT_TRUE(client.is_action_held("com.example.main.set", "i1"));

    controller.send_line(R"({"type":"up","pluginId":"com.example","actionId":"com.example.main.set","instanceId":"i1"})");
    EXPECT_TRUE(wait_until([&client]() { return !client.is_action_held("com.example.main.set"); }));

    controller.send_line(R"({"type":"down","pluginId":"com.example","actionId":"com.example.main.set","instanceId":"i2"})");
    EXPECT_TRUE(wait_until([&client]() { return client.is_action_held("com.example.main.set"); }));

    client.disconnect();
    EXPECT_TRUE(client.wait());
    EXPECT_FALSE(client.is_action_held("com.example.main.set"));
}

TEST_F(ClientTest, StatesResentOnBroadcast) {
    Client client(config());
    pair(client);

    EXPECT_TRUE(client.state_update("com.example.level", "3"));
    EXPECT_FALSE(client.state_update("com.example.level", "3"));
    nlohmann::json update = controller.read_message();
    EXPECT_EQ(update["type"], "stateUpdate");
    EXPECT_EQ(update["value"], "3");

    controller.send_line(R"({"type":"broadcast","event":"pageChange","pageName":"Main"})");
    nlohmann::json resent = controller.read_message();
    EXPECT_EQ(resent["type"], "stateUpdate");
    EXPECT_EQ(resent["id"], "com.example.level");
    EXPECT_EQ(resent["value"], "3");
}

TEST_F(ClientTest, DisconnectDuringBroadcastResendToStalledPeer) {
    Client client(config());
    pair(client);

    // Fill the socket with state updates the controller never reads
    const std::string payload(64 * 1024, 'x');
    std::atomic<size_t> written{0};
    std::thread writer([&]() {
        while (client.state_update("com.example.big" + std::to_string(written.load()), payload)) {
            ++written;
        }
    });
    EXPECT_TRUE(wait_until_stalled(written));

    // The loop thread resends every state and blocks as well
    controller.send_line(R"({"type":"broadcast","event":"pageChange","pageName":"Main"})");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::promise<bool> finished;
    std::thread stopper([&]() {
        client.disconnect();
        finished.set_value(client.wait());
    });
    auto future = finished.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready) << "disconnect blocked behind a pending write";
    EXPECT_TRUE(future.get());

    stopper.join();
    writer.join();
    EXPECT_FALSE(client.is_connected());
}

TEST_F(ClientTest, DynamicStates) {
    Client client(config());
    pair(client);

    EXPECT_TRUE(client.create_state("com.example.dyn", "Dynamic", "a"));
    nlohmann::json created = controller.read_message();
    EXPECT_EQ(created["type"], "createState");
    EXPECT_EQ(created["desc"], "Dynamic");

    EXPECT_FALSE(client.remove_state("com.example.unknown"));
    EXPECT_TRUE(client.remove_state("com.example.dyn"));
    nlohmann::json removed = controller.read_message();
    EXPECT_EQ(removed["type"], "removeState");
    EXPECT_EQ(removed["id"], "com.example.dyn");
}

TEST_F(ClientTest, ConnectorUpdateUsesWireId) {
    Client client(config());
    pair(client);

    EXPECT_TRUE(client.connector_update("slider", 40));
    nlohmann::json update = controller.read_message();
    EXPECT_EQ(update["type"], "connectorUpdate");
    EXPECT_EQ(update["connectorId"], "pc_com.example_slider");
    EXPECT_EQ(update["value"], "40");
}

TEST_F(ClientTest, ClosePluginEndsLoop) {
    ClientConfig cfg = config();
    cfg.auto_close = true;
    Client client(cfg);
    watch_errors(client);

    std::atomic<bool> closed{false};
    client.on(MessageKind::CLOSE_PLUGIN, [&closed](const Message&) { closed = true; });

    pair(client);
    controller.send_line(R"({"type":"closePlugin","pluginId":"com.example"})");

    EXPECT_TRUE(client.wait());
    EXPECT_TRUE(wait_until([&closed]() { return closed.load(); }));
    EXPECT_FALSE(client.is_connected());
    EXPECT_TRUE(errors.empty());
}

TEST_F(ClientTest, PeerCloseIsTransportError) {
    Client client(config());
    watch_errors(client);
    pair(client);

    controller.close_client();
    EXPECT_FALSE(client.wait());

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].category, ErrorCategory::TRANSPORT);
}

TEST_F(ClientTest, RefusedConnectIsTransportError) {
    ClientConfig cfg = config();
    cfg.port = unused_port();
    Client client(cfg);
    watch_errors(client);

    EXPECT_FALSE(client.connect());

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].category, ErrorCategory::TRANSPORT);
}

TEST_F(ClientTest, DisconnectTwice) {
    Client client(config());
    watch_errors(client);
    pair(client);

    EXPECT_FALSE(client.start());

    client.disconnect();
    client.disconnect();
    EXPECT_TRUE(client.wait());
    EXPECT_FALSE(client.is_connected());
    EXPECT_TRUE(errors.empty());

    // Nothing to stop any more
    client.disconnect();
    EXPECT_TRUE(client.wait());
}

TEST_F(ClientTest, UsageErrors) {
    Client client(config());

    EXPECT_THROW(client.connector_update("slider", 101), UsageError);
    EXPECT_THROW(client.connector_update("", 50), UsageError);
    EXPECT_THROW(client.choice_update("", {"a"}), UsageError);
    EXPECT_THROW(client.choice_update_specific("com.example.list", {"a"}, ""), UsageError);
    EXPECT_THROW(client.show_notification("", "Title", "Body", {}), UsageError);
    EXPECT_THROW(client.show_notification("note", "Title", "Body", {{"opt", ""}}), UsageError);
    EXPECT_THROW(client.update_action_data("i1", "com.example.main.set.value", "0", 10), UsageError);
    EXPECT_THROW(client.send(nlohmann::json::array()), UsageError);

    // Not connected
    EXPECT_FALSE(client.send({{"type", "custom"}}));
}

TEST_F(ClientTest, DescriptorStates) {
    Client client(config());
    Document descriptor = Document::parse(R"({
        "categories": [
            {"id": "com.example.main", "states": [
                {"id": "com.example.main.level", "desc": "Level", "default": "0"},
                {"id": "com.example.main.mode", "desc": "Mode", "default": "a"}
            ]},
            {"id": "com.example.extra"}
        ]
    })");

    EXPECT_EQ(client.load_descriptor_states(descriptor), 2u);
    auto record = client.states().find_state("com.example.main.mode");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->origin, StateStore::Origin::STATIC);
    EXPECT_EQ(record->value, "a");
}

TEST(ClientConfigCheck, InvalidConfigRejected) {
    ClientConfig config;
    EXPECT_THROW(Client client(config), ConfigError);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
