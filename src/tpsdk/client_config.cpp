// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "client_config.hpp"

#include <thread>

#include <yaml-cpp/yaml.h>

#include <common/showmsg.hpp>

#include "errors.hpp"

namespace tpsdk {

namespace {

void parse_config(const YAML::Node& yaml, ClientConfig& config) {
    if (!yaml.IsMap()) {
        throw ConfigError("configuration root must be a map");
    }

    if (yaml["plugin"]) {
        auto plugin = yaml["plugin"];
        config.plugin_id = plugin["id"].as<std::string>(config.plugin_id);
    }

    if (yaml["connection"]) {
        auto connection = yaml["connection"];
        config.host = connection["host"].as<std::string>(config.host);
        config.port = connection["port"].as<uint16_t>(config.port);
        config.poll_interval_ms = connection["poll_interval_ms"].as<uint32_t>(config.poll_interval_ms);
        config.socket_wait_ms = connection["socket_wait_ms"].as<uint32_t>(config.socket_wait_ms);
        config.receive_buffer_size = connection["receive_buffer_size"].as<size_t>(config.receive_buffer_size);
        config.auto_close = connection["auto_close"].as<bool>(config.auto_close);
    }

    if (yaml["dispatch"]) {
        auto dispatch = yaml["dispatch"];
        config.max_workers = dispatch["max_workers"].as<size_t>(config.max_workers);
        config.check_plugin_id = dispatch["check_plugin_id"].as<bool>(config.check_plugin_id);
    }

    if (yaml["states"]) {
        auto states = yaml["states"];
        config.update_states_on_broadcast = states["update_on_broadcast"].as<bool>(config.update_states_on_broadcast);
        config.strict_states = states["strict"].as<bool>(config.strict_states);
    }

    if (yaml["log"]) {
        auto log = yaml["log"];
        config.log.silent = log["silent"].as<int>(config.log.silent);
        config.log.timestamp_format = log["timestamp_format"].as<std::string>(config.log.timestamp_format);
        config.log.file = log["file"].as<std::string>(config.log.file);
        config.log.file_mask = log["file_mask"].as<int>(config.log.file_mask);
        config.log.colors = log["colors"].as<bool>(config.log.colors);
    }
}

} // namespace

ClientConfig ClientConfig::load(const std::string& path) {
    ClientConfig config;

    try {
        parse_config(YAML::LoadFile(path), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load " + path + ": " + e.what());
    }

    config.validate();
    config.apply_log_settings();
    ShowStatus("Done reading '" CL_WHITE "%s" CL_RESET "'.\n", path.c_str());
    return config;
}

ClientConfig ClientConfig::load_string(const std::string& text) {
    ClientConfig config;

    try {
        parse_config(YAML::Load(text), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }

    config.validate();
    config.apply_log_settings();
    return config;
}

void ClientConfig::validate() const {
    if (plugin_id.empty()) {
        throw ConfigError("plugin id must not be empty");
    }
    if (port == 0) {
        throw ConfigError("connection port must not be 0");
    }
    if (max_workers == 0) {
        throw ConfigError("max_workers must be at least 1");
    }
    if (receive_buffer_size == 0) {
        throw ConfigError("receive_buffer_size must be at least 1");
    }
    if (log.timestamp_format.size() >= sizeof(timestamp_format)) {
        throw ConfigError("log timestamp_format is longer than " + std::to_string(sizeof(timestamp_format) - 1) + " characters");
    }
    if (log.file.size() >= sizeof(console_log_filepath)) {
        throw ConfigError("log file path is too long");
    }
}

void ClientConfig::apply_log_settings() const {
    showmsg_configure(log.silent, log.file_mask, log.colors, log.timestamp_format.c_str(), log.file.c_str());
}

ConnectionManager::Settings ClientConfig::connection_settings() const {
    ConnectionManager::Settings settings;
    settings.host = host;
    settings.port = port;
    settings.poll_interval_ms = poll_interval_ms;
    settings.socket_wait_ms = socket_wait_ms;
    settings.receive_buffer_size = receive_buffer_size;
    return settings;
}

size_t ClientConfig::default_workers() {
    unsigned int n = std::thread::hardware_concurrency();
    return n > 0 ? n : 1;
}

} // namespace tpsdk
