// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file client_config.hpp
 * @brief Client configuration
 *
 * Loaded from conf/tpsdk_client.yml:
 * - plugin:     plugin id
 * - connection: endpoint, poll timings, read size, auto close
 * - dispatch:   worker count, plugin id verification
 * - states:     broadcast resend, strict mode
 * - log:        console message settings
 */

#ifndef TPSDK_CLIENT_CONFIG_HPP
#define TPSDK_CLIENT_CONFIG_HPP

#include <cstdint>
#include <string>

#include "connection.hpp"

namespace tpsdk {

struct ClientConfig {
    std::string plugin_id;                  ///< Required
    std::string host{DEFAULT_HOST};
    uint16_t port{DEFAULT_PORT};
    uint32_t poll_interval_ms{10};
    uint32_t socket_wait_ms{1000};
    size_t receive_buffer_size{4096};
    bool auto_close{false};                 ///< Disconnect when the controller sends closePlugin
    bool update_states_on_broadcast{true};  ///< Resend every state on a page change
    bool check_plugin_id{true};
    size_t max_workers{default_workers()};
    bool strict_states{false};              ///< Updating an undeclared state is a usage error

    struct LogSettings {
        int silent{0};                      ///< msg_silent mask
        std::string timestamp_format;
        std::string file;                   ///< Empty keeps the current console_log_filepath
        int file_mask{0};                   ///< console_msg_log mask
        bool colors{false};
    } log;

    /**
     * @brief Load a YAML configuration file
     *
     * Missing keys keep their defaults. The log section is applied to the
     * console immediately.
     *
     * @throw ConfigError when the file cannot be parsed or is invalid
     */
    static ClientConfig load(const std::string& path);

    /**
     * @brief Same as load(), from YAML text
     */
    static ClientConfig load_string(const std::string& text);

    /**
     * @brief Check the values
     * @throw ConfigError on an empty plugin id, zero port, workers or read size
     */
    void validate() const;

    /**
     * @brief Copy the log settings to the showmsg globals
     *
     * Safe while pool workers are logging; the globals change under the
     * showmsg lock.
     */
    void apply_log_settings() const;

    ConnectionManager::Settings connection_settings() const;

    static size_t default_workers();
};

} // namespace tpsdk

#endif // TPSDK_CLIENT_CONFIG_HPP
