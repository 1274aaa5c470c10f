// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file message.hpp
 * @brief Wire message kinds, inbound message view and outbound builders
 *
 * Every message is one JSON object on its own line with a string `type`
 * discriminator.
 */

#ifndef TPSDK_MESSAGE_HPP
#define TPSDK_MESSAGE_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tpsdk {

/**
 * @brief Inbound message kinds
 */
enum class MessageKind {
    INFO,                        ///< "info" / "pair": pairing acknowledgement
    ACTION,                      ///< "action"
    HOLD_DOWN,                   ///< "down" / "on"
    HOLD_UP,                     ///< "up" / "off"
    LIST_CHANGE,                 ///< "listChange"
    CONNECTOR_CHANGE,            ///< "connectorChange"
    SETTINGS,                    ///< "settings"
    BROADCAST,                   ///< "broadcast"
    NOTIFICATION_OPTION_CLICKED, ///< "notificationOptionClicked"
    CLOSE_PLUGIN,                ///< "closePlugin"
    UNKNOWN                      ///< any other discriminator
};

MessageKind message_kind_from_type(const std::string& type);
const char* message_kind_name(MessageKind kind);

/**
 * @brief Look up the value of an action data item
 * @param data The `data` list of an action, hold or connector message
 * @param id Data item id, empty for the first item
 * @return Value, or empty when there is no such item
 */
std::optional<nlohmann::json> action_data_value(const nlohmann::json& data, const std::string& id = "");

/**
 * @brief Decoded inbound message
 */
struct Message {
    MessageKind kind{MessageKind::UNKNOWN};
    std::string type;   ///< Discriminator as received
    nlohmann::json data;

    std::string action_id() const;
    std::string instance_id() const;
    std::string plugin_id() const;

    /// Value of the data item `id` carried by this message
    std::optional<nlohmann::json> data_value(const std::string& id = "") const;
};

/**
 * @brief Category of an asynchronous failure
 */
enum class ErrorCategory {
    TRANSPORT,  ///< Socket refused, reset or closed by the peer
    PROTOCOL,   ///< Undecodable line or missing discriminator
    PLUGIN_ID,  ///< Message addressed to another plugin
    HANDLER     ///< Exception thrown by a user handler
};

const char* error_category_name(ErrorCategory category);

/**
 * @brief Asynchronous failure delivered to error handlers
 */
struct ErrorEvent {
    ErrorCategory category;
    std::string message;
    std::string raw;            ///< Offending line, when there is one
    std::exception_ptr cause;   ///< Original exception, when there is one
};

using MessageHandler = std::function<void(const Message&)>;
using ErrorHandler = std::function<void(const ErrorEvent&)>;

/**
 * @brief Outbound message builders
 */
namespace outbound {

nlohmann::json pair(const std::string& plugin_id);
nlohmann::json create_state(const std::string& id, const std::string& description, const std::string& default_value);
nlohmann::json remove_state(const std::string& id);
nlohmann::json state_update(const std::string& id, const std::string& value);
nlohmann::json choice_update(const std::string& id, const std::vector<std::string>& values, const std::string& instance_id = "");
nlohmann::json setting_update(const std::string& name, const nlohmann::json& value);
nlohmann::json connector_update(const std::string& connector_id, int32_t value);
nlohmann::json show_notification(const std::string& notification_id, const std::string& title,
                                 const std::string& msg, const nlohmann::json& options);
nlohmann::json update_action_data(const std::string& instance_id, const std::string& data_id,
                                  const nlohmann::json& min_value, const nlohmann::json& max_value);

} // namespace outbound

} // namespace tpsdk

#endif // TPSDK_MESSAGE_HPP
