// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "client.hpp"

#include <common/showmsg.hpp>

#include "errors.hpp"

namespace tpsdk {

namespace {

ClientConfig validated(ClientConfig config) {
    config.validate();
    return config;
}

} // namespace

Client::Client(ClientConfig config)
    : config_(validated(std::move(config))),
      pool_(config_.max_workers),
      connection_(config_.connection_settings()),
      store_([this](const nlohmann::json& message) { return connection_.send(message); }, config_.strict_states),
      dispatcher_(pool_, config_.plugin_id, config_.check_plugin_id) {
    dispatcher_.set_inbound_hook([this](const Message& message) { handle_inbound(message); });
}

Client::~Client() {
    disconnect();
    wait();
    pool_.shutdown();
}

// ============================================================================
// Handlers
// ============================================================================

void Client::on(MessageKind kind, MessageHandler handler) {
    dispatcher_.on(kind, std::move(handler));
}

void Client::on_any(MessageHandler handler) {
    dispatcher_.on_any(std::move(handler));
}

void Client::on_error(ErrorHandler handler) {
    dispatcher_.on_error(std::move(handler));
}

// ============================================================================
// Lifecycle
// ============================================================================

bool Client::connect() {
    if (!start()) {
        return false;
    }
    return wait();
}

bool Client::start() {
    std::lock_guard<std::mutex> lock(loop_mutex_);

    if (running_) {
        ShowWarning("[Client] Plugin '%s' is already running\n", config_.plugin_id.c_str());
        return false;
    }
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    running_ = true;
    clean_exit_ = true;
    stop_pending_ = false;
    loop_thread_ = std::thread(&Client::run_loop, this);
    return true;
}

bool Client::wait() {
    std::thread loop;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        loop = std::move(loop_thread_);
    }

    if (loop.joinable()) {
        if (loop.get_id() == std::this_thread::get_id()) {
            loop.detach();
        } else {
            loop.join();
        }
    }
    return clean_exit_;
}

void Client::disconnect() {
    // The loop may still be opening the socket
    if (running_ && !connection_.is_connected()) {
        stop_pending_ = true;
    }
    connection_.disconnect();
}

bool Client::is_connected() const {
    return connection_.is_connected();
}

void Client::run_loop() {
    ShowInfo("[Client] Connecting plugin '%s' to %s:%u\n", config_.plugin_id.c_str(),
             config_.host.c_str(), static_cast<unsigned>(config_.port));

    if (!connection_.open()) {
        clean_exit_ = false;
        dispatcher_.raise_error({ErrorCategory::TRANSPORT, "Cannot connect: " + connection_.last_error(), "", nullptr});
        running_ = false;
        return;
    }

    if (stop_pending_.exchange(false)) {
        connection_.disconnect();
    }

    if (!connection_.send(outbound::pair(config_.plugin_id))) {
        ShowWarning("[Client] Pairing request for '%s' could not be sent\n", config_.plugin_id.c_str());
    }

    ExitReason reason = connection_.run([this](const std::string& line) {
        dispatcher_.dispatch_line(line);
    });

    store_.clear_held();

    if (reason != ExitReason::REQUESTED) {
        clean_exit_ = false;
        dispatcher_.raise_error({ErrorCategory::TRANSPORT,
                                 std::string("Connection ended: ") + exit_reason_name(reason) + " (" + connection_.last_error() + ")",
                                 "", nullptr});
    }
    running_ = false;
}

// ============================================================================
// Inbound bookkeeping
// ============================================================================

void Client::handle_inbound(const Message& message) {
    switch (message.kind) {
        case MessageKind::INFO:
            ShowInfo("[Client] Paired with controller %s\n",
                     message.data.value("tpVersionString", std::string("(unknown version)")).c_str());
            if (message.data.contains("settings")) {
                record_settings(message.data["settings"]);
            }
            break;
        case MessageKind::SETTINGS:
            if (message.data.contains("values")) {
                record_settings(message.data["values"]);
            }
            break;
        case MessageKind::HOLD_DOWN:
            store_.set_held(message.action_id(), message.instance_id(), true);
            break;
        case MessageKind::HOLD_UP:
            store_.set_held(message.action_id(), message.instance_id(), false);
            break;
        case MessageKind::BROADCAST:
            if (config_.update_states_on_broadcast) {
                size_t sent = store_.resend_all();
                ShowDebug("[Client] Broadcast: resent %zu state(s)\n", sent);
            }
            break;
        case MessageKind::CLOSE_PLUGIN:
            if (config_.auto_close) {
                ShowInfo("[Client] Controller asked plugin '%s' to close\n", config_.plugin_id.c_str());
                connection_.disconnect();
            }
            break;
        default:
            break;
    }
}

// Settings arrive as a list of single-pair objects
void Client::record_settings(const nlohmann::json& settings) {
    if (!settings.is_array()) {
        return;
    }
    for (const auto& entry : settings) {
        if (!entry.is_object()) {
            continue;
        }
        for (auto it = entry.begin(); it != entry.end(); ++it) {
            store_.record_setting(it.key(), it.value());
        }
    }
}

// ============================================================================
// States
// ============================================================================

bool Client::create_state(const std::string& id, const std::string& description, const std::string& value) {
    return store_.create_or_update_state(id, description, value);
}

void Client::create_states(const std::vector<StateDefinition>& states) {
    for (const auto& state : states) {
        create_state(state.id, state.description, state.value);
    }
}

bool Client::remove_state(const std::string& id) {
    return store_.remove_state(id);
}

void Client::remove_states(const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        remove_state(id);
    }
}

bool Client::state_update(const std::string& id, const std::string& value) {
    return store_.update_value(id, value);
}

void Client::state_updates(const std::vector<std::pair<std::string, std::string>>& updates) {
    for (const auto& update : updates) {
        state_update(update.first, update.second);
    }
}

size_t Client::load_descriptor_states(const Document& descriptor) {
    size_t declared = 0;
    if (!descriptor.is_object() || !descriptor.contains("categories") || !descriptor["categories"].is_array()) {
        return declared;
    }

    for (const auto& category : descriptor["categories"]) {
        if (!category.is_object() || !category.contains("states") || !category["states"].is_array()) {
            continue;
        }
        for (const auto& state : category["states"]) {
            if (!state.is_object() || !state.contains("id") || !state["id"].is_string()) {
                continue;
            }
            store_.declare_static(state["id"].get<std::string>(),
                                  state.value("desc", std::string()),
                                  state.value("default", std::string()));
            ++declared;
        }
    }

    ShowInfo("[Client] Declared %zu state(s) from descriptor\n", declared);
    return declared;
}

// ============================================================================
// Outbound
// ============================================================================

bool Client::choice_update(const std::string& id, const std::vector<std::string>& values) {
    if (id.empty()) {
        throw UsageError("choice_update: id must not be empty");
    }
    return connection_.send(outbound::choice_update(id, values));
}

bool Client::choice_update_specific(const std::string& id, const std::vector<std::string>& values, const std::string& instance_id) {
    if (id.empty() || instance_id.empty()) {
        throw UsageError("choice_update_specific: id and instance id must not be empty");
    }
    return connection_.send(outbound::choice_update(id, values, instance_id));
}

bool Client::setting_update(const std::string& name, const nlohmann::json& value) {
    return store_.update_setting(name, value);
}

bool Client::connector_update(const std::string& connector_id, int32_t value) {
    if (connector_id.empty()) {
        throw UsageError("connector_update: connector id must not be empty");
    }
    if (value < 0 || value > 100) {
        throw UsageError("connector_update: value must be between 0 and 100, got " + std::to_string(value));
    }
    return connection_.send(outbound::connector_update("pc_" + config_.plugin_id + "_" + connector_id, value));
}

bool Client::show_notification(const std::string& notification_id, const std::string& title,
                               const std::string& msg, const std::vector<NotificationOption>& options) {
    if (notification_id.empty() || title.empty()) {
        throw UsageError("show_notification: notification id and title must not be empty");
    }

    nlohmann::json list = nlohmann::json::array();
    for (const auto& option : options) {
        if (option.id.empty() || option.title.empty()) {
            throw UsageError("show_notification: every option requires an id and a title");
        }
        list.push_back({{"id", option.id}, {"title", option.title}});
    }

    return connection_.send(outbound::show_notification(notification_id, title, msg, list));
}

bool Client::update_action_data(const std::string& instance_id, const std::string& data_id,
                                const nlohmann::json& min_value, const nlohmann::json& max_value) {
    if (instance_id.empty() || data_id.empty()) {
        throw UsageError("update_action_data: instance id and data id must not be empty");
    }
    if (!min_value.is_number() || !max_value.is_number()) {
        throw UsageError("update_action_data: minimum and maximum must be numbers");
    }
    return connection_.send(outbound::update_action_data(instance_id, data_id, min_value, max_value));
}

bool Client::send(const nlohmann::json& fields) {
    if (!fields.is_object()) {
        throw UsageError("send: message must be an object");
    }
    return connection_.send(fields);
}

bool Client::is_action_held(const std::string& action_id) const {
    return store_.is_held(action_id);
}

bool Client::is_action_held(const std::string& action_id, const std::string& instance_id) const {
    return store_.is_held(action_id, instance_id);
}

std::optional<nlohmann::json> Client::action_data_value(const nlohmann::json& data, const std::string& id) {
    return tpsdk::action_data_value(data, id);
}

} // namespace tpsdk
