// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "state_store.hpp"

#include <common/showmsg.hpp>

#include "errors.hpp"
#include "message.hpp"

namespace tpsdk {

StateStore::StateStore(Writer writer, bool strict)
    : writer_(std::move(writer)), strict_(strict) {
}

// ============================================================================
// States
// ============================================================================

void StateStore::declare_static(const std::string& id, const std::string& description, const std::string& default_value) {
    if (id.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (states_.count(id) != 0) {
        return;
    }

    StateRecord record;
    record.id = id;
    record.description = description;
    record.value = default_value;
    record.origin = Origin::STATIC;
    states_.emplace(id, std::move(record));
}

bool StateStore::create_or_update_state(const std::string& id, const std::string& description, const std::string& value) {
    if (id.empty()) {
        throw UsageError("create_or_update_state: state id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(id);
    if (it != states_.end()) {
        StateRecord& record = it->second;
        record.value = value;
        if (record.last_sent && *record.last_sent == value) {
            return false;
        }
        return write_state(record);
    }

    StateRecord record;
    record.id = id;
    record.description = description;
    record.value = value;
    record.origin = Origin::DYNAMIC;

    bool written = writer_(outbound::create_state(id, description, value));
    if (written) {
        record.last_sent = value;
    }
    states_.emplace(id, std::move(record));
    return written;
}

bool StateStore::remove_state(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(id);
    if (it == states_.end()) {
        ShowDebug("[StateStore] remove_state: unknown state '%s' ignored\n", id.c_str());
        return false;
    }

    states_.erase(it);
    return writer_(outbound::remove_state(id));
}

bool StateStore::update_value(const std::string& id, const std::string& value) {
    if (id.empty()) {
        throw UsageError("update_value: state id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(id);
    if (it == states_.end()) {
        if (strict_) {
            throw UsageError("update_value: state '" + id + "' was never declared");
        }

        // Undeclared states are assumed to live in the descriptor
        StateRecord record;
        record.id = id;
        record.origin = Origin::STATIC;
        it = states_.emplace(id, std::move(record)).first;
    }

    StateRecord& record = it->second;
    record.value = value;
    if (record.last_sent && *record.last_sent == value) {
        return false;
    }
    return write_state(record);
}

size_t StateStore::resend_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t written = 0;
    for (auto& entry : states_) {
        if (write_state(entry.second)) {
            ++written;
        }
    }
    return written;
}

// Caller holds mutex_
bool StateStore::write_state(StateRecord& record) {
    if (!writer_(outbound::state_update(record.id, record.value))) {
        return false;
    }
    record.last_sent = record.value;
    return true;
}

// ============================================================================
// Settings
// ============================================================================

bool StateStore::update_setting(const std::string& name, const nlohmann::json& value) {
    if (name.empty()) {
        throw UsageError("update_setting: setting name must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = settings_.find(name);
    if (it != settings_.end() && it->second == value) {
        return false;
    }

    if (!writer_(outbound::setting_update(name, value))) {
        return false;
    }
    settings_[name] = value;
    return true;
}

void StateStore::record_setting(const std::string& name, const nlohmann::json& value) {
    if (name.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    settings_[name] = value;
}

// ============================================================================
// Held actions
// ============================================================================

void StateStore::set_held(const std::string& action_id, const std::string& instance_id, bool held) {
    if (action_id.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (held) {
        held_.emplace(action_id, instance_id);
        return;
    }

    if (!instance_id.empty()) {
        held_.erase(std::make_pair(action_id, instance_id));
        return;
    }

    auto it = held_.lower_bound(std::make_pair(action_id, std::string()));
    while (it != held_.end() && it->first == action_id) {
        it = held_.erase(it);
    }
}

bool StateStore::is_held(const std::string& action_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = held_.lower_bound(std::make_pair(action_id, std::string()));
    return it != held_.end() && it->first == action_id;
}

bool StateStore::is_held(const std::string& action_id, const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(std::make_pair(action_id, instance_id)) != 0;
}

void StateStore::clear_held() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.clear();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<StateStore::StateRecord> StateStore::find_state(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<nlohmann::json> StateStore::setting(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = settings_.find(name);
    if (it == settings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t StateStore::state_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

std::vector<std::string> StateStore::state_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(states_.size());
    for (const auto& entry : states_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace tpsdk
