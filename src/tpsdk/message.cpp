// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "message.hpp"

#include <unordered_map>

namespace tpsdk {

namespace {

std::string string_field(const nlohmann::json& data, const char* key) {
    if (!data.is_object()) {
        return "";
    }
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

MessageKind message_kind_from_type(const std::string& type) {
    static const std::unordered_map<std::string, MessageKind> kinds = {
        {"info", MessageKind::INFO},
        {"pair", MessageKind::INFO},
        {"action", MessageKind::ACTION},
        {"down", MessageKind::HOLD_DOWN},
        {"on", MessageKind::HOLD_DOWN},
        {"up", MessageKind::HOLD_UP},
        {"off", MessageKind::HOLD_UP},
        {"listChange", MessageKind::LIST_CHANGE},
        {"connectorChange", MessageKind::CONNECTOR_CHANGE},
        {"settings", MessageKind::SETTINGS},
        {"broadcast", MessageKind::BROADCAST},
        {"notificationOptionClicked", MessageKind::NOTIFICATION_OPTION_CLICKED},
        {"closePlugin", MessageKind::CLOSE_PLUGIN},
    };

    auto it = kinds.find(type);
    return it != kinds.end() ? it->second : MessageKind::UNKNOWN;
}

const char* message_kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::INFO: return "info";
        case MessageKind::ACTION: return "action";
        case MessageKind::HOLD_DOWN: return "down";
        case MessageKind::HOLD_UP: return "up";
        case MessageKind::LIST_CHANGE: return "listChange";
        case MessageKind::CONNECTOR_CHANGE: return "connectorChange";
        case MessageKind::SETTINGS: return "settings";
        case MessageKind::BROADCAST: return "broadcast";
        case MessageKind::NOTIFICATION_OPTION_CLICKED: return "notificationOptionClicked";
        case MessageKind::CLOSE_PLUGIN: return "closePlugin";
        case MessageKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TRANSPORT: return "transport";
        case ErrorCategory::PROTOCOL: return "protocol";
        case ErrorCategory::PLUGIN_ID: return "plugin_id";
        case ErrorCategory::HANDLER: return "handler";
    }
    return "unknown";
}

std::optional<nlohmann::json> action_data_value(const nlohmann::json& data, const std::string& id) {
    if (!data.is_array() || data.empty()) {
        return std::nullopt;
    }

    if (id.empty()) {
        // First entry carrying a non-null value
        for (const auto& item : data) {
            if (item.is_object() && item.contains("value") && !item["value"].is_null()) {
                return item["value"];
            }
        }
        return std::nullopt;
    }

    for (const auto& item : data) {
        if (string_field(item, "id") == id && item.contains("value")) {
            return item["value"];
        }
    }
    return std::nullopt;
}

// ============================================================================
// Message
// ============================================================================

std::string Message::action_id() const {
    return string_field(data, "actionId");
}

std::string Message::instance_id() const {
    return string_field(data, "instanceId");
}

std::string Message::plugin_id() const {
    return string_field(data, "pluginId");
}

std::optional<nlohmann::json> Message::data_value(const std::string& id) const {
    if (!data.is_object() || !data.contains("data")) {
        return std::nullopt;
    }
    return action_data_value(data["data"], id);
}

// ============================================================================
// Outbound
// ============================================================================

namespace outbound {

nlohmann::json pair(const std::string& plugin_id) {
    return {{"type", "pair"}, {"id", plugin_id}};
}

nlohmann::json create_state(const std::string& id, const std::string& description, const std::string& default_value) {
    return {{"type", "createState"}, {"id", id}, {"desc", description}, {"defaultValue", default_value}};
}

nlohmann::json remove_state(const std::string& id) {
    return {{"type", "removeState"}, {"id", id}};
}

nlohmann::json state_update(const std::string& id, const std::string& value) {
    return {{"type", "stateUpdate"}, {"id", id}, {"value", value}};
}

nlohmann::json choice_update(const std::string& id, const std::vector<std::string>& values, const std::string& instance_id) {
    nlohmann::json msg = {{"type", "choiceUpdate"}, {"id", id}, {"value", values}};
    if (!instance_id.empty()) {
        msg["instanceId"] = instance_id;
    }
    return msg;
}

nlohmann::json setting_update(const std::string& name, const nlohmann::json& value) {
    return {{"type", "settingUpdate"}, {"name", name}, {"value", value}};
}

nlohmann::json connector_update(const std::string& connector_id, int32_t value) {
    return {{"type", "connectorUpdate"}, {"connectorId", connector_id}, {"value", std::to_string(value)}};
}

nlohmann::json show_notification(const std::string& notification_id, const std::string& title,
                                 const std::string& msg, const nlohmann::json& options) {
    return {{"type", "showNotification"}, {"notificationId", notification_id},
            {"title", title}, {"msg", msg}, {"options", options}};
}

nlohmann::json update_action_data(const std::string& instance_id, const std::string& data_id,
                                  const nlohmann::json& min_value, const nlohmann::json& max_value) {
    return {
        {"type", "updateActionData"},
        {"instanceId", instance_id},
        {"data", {{"minValue", min_value}, {"maxValue", max_value}, {"id", data_id}, {"type", "number"}}},
    };
}

} // namespace outbound

} // namespace tpsdk
