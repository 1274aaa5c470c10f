// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file client.hpp
 * @brief Plugin client runtime
 *
 * One Client owns everything a plugin needs to talk to the controller:
 * the connection, the state store, the dispatcher and its worker pool.
 * Several clients may coexist in one process.
 *
 * Typical use:
 * @code
 *   tpsdk::Client client(config);
 *   client.on(tpsdk::MessageKind::ACTION, [&](const tpsdk::Message& msg) { ... });
 *   client.connect(); // returns when the connection ends
 * @endcode
 */

#ifndef TPSDK_CLIENT_HPP
#define TPSDK_CLIENT_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <common/sync.hpp>

#include "client_config.hpp"
#include "connection.hpp"
#include "dispatcher.hpp"
#include "entity_model.hpp"
#include "message.hpp"
#include "state_store.hpp"

namespace tpsdk {

struct StateDefinition {
    std::string id;
    std::string description;
    std::string value;
};

struct NotificationOption {
    std::string id;
    std::string title;
};

class Client {
public:
    /**
     * @throw ConfigError when the configuration is invalid
     */
    explicit Client(ClientConfig config);
    ~Client();

    void on(MessageKind kind, MessageHandler handler);
    void on_any(MessageHandler handler);
    void on_error(ErrorHandler handler);

    /**
     * @brief Connect, pair and run until the connection ends
     *
     * Blocks the calling thread.
     *
     * @return true after a requested disconnect, false on transport failure
     */
    bool connect();

    /**
     * @brief Connect and run the loop on its own thread
     * @return false when the loop is already running
     */
    bool start();

    /**
     * @brief Wait for the loop started by start() to end
     * @return Same as connect()
     */
    bool wait();

    /**
     * @brief Stop the loop; safe from handlers and other threads, idempotent
     */
    void disconnect();

    bool is_connected() const;

    // States

    bool create_state(const std::string& id, const std::string& description, const std::string& value);
    void create_states(const std::vector<StateDefinition>& states);

    /**
     * @brief Remove a runtime state
     * @return false when the state is unknown, which is not an error
     */
    bool remove_state(const std::string& id);
    void remove_states(const std::vector<std::string>& ids);

    /**
     * @brief Update a state value; repeated identical values are not resent
     */
    bool state_update(const std::string& id, const std::string& value);
    void state_updates(const std::vector<std::pair<std::string, std::string>>& updates);

    /**
     * @brief Seed the store with the states a descriptor declares
     * @return Number of states declared
     */
    size_t load_descriptor_states(const Document& descriptor);

    // Other outbound messages

    bool choice_update(const std::string& id, const std::vector<std::string>& values);
    bool choice_update_specific(const std::string& id, const std::vector<std::string>& values, const std::string& instance_id);
    bool setting_update(const std::string& name, const nlohmann::json& value);

    /**
     * @brief Move a connector
     * @param connector_id Connector id without the pc_<plugin id>_ prefix
     * @param value 0 to 100
     * @throw UsageError when the value is out of range
     */
    bool connector_update(const std::string& connector_id, int32_t value);

    bool show_notification(const std::string& notification_id, const std::string& title,
                           const std::string& msg, const std::vector<NotificationOption>& options);
    bool update_action_data(const std::string& instance_id, const std::string& data_id,
                            const nlohmann::json& min_value, const nlohmann::json& max_value);

    /**
     * @brief Send any message object as is
     */
    bool send(const nlohmann::json& fields);

    bool is_action_held(const std::string& action_id) const;
    bool is_action_held(const std::string& action_id, const std::string& instance_id) const;

    static std::optional<nlohmann::json> action_data_value(const nlohmann::json& data, const std::string& id = "");

    const ClientConfig& config() const { return config_; }
    const StateStore& states() const { return store_; }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

private:
    void run_loop();
    void handle_inbound(const Message& message);
    void record_settings(const nlohmann::json& settings);

    const ClientConfig config_;
    thread_pool pool_;
    ConnectionManager connection_;
    StateStore store_;
    MessageDispatcher dispatcher_;

    std::mutex loop_mutex_;
    std::thread loop_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> clean_exit_{true};
    std::atomic<bool> stop_pending_{false};
};

} // namespace tpsdk

#endif // TPSDK_CLIENT_HPP
