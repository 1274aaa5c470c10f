// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file state_store.hpp
 * @brief Registry of plugin states, settings and held actions
 *
 * The store decides which state and setting writes reach the wire: a value
 * equal to the last one sent for the same id is never written twice in a
 * row. Writes go through the Writer while the store lock is held, so two
 * concurrent updates of the same id cannot both pass the comparison.
 */

#ifndef TPSDK_STATE_STORE_HPP
#define TPSDK_STATE_STORE_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace tpsdk {

/**
 * @brief Thread-safe state, setting and hold registry
 */
class StateStore {
public:
    /// Sends one outbound message, false when it could not be written
    using Writer = std::function<bool(const nlohmann::json&)>;

    enum class Origin {
        STATIC,    ///< Declared in the descriptor
        DYNAMIC    ///< Created at runtime
    };

    struct StateRecord {
        std::string id;
        std::string description;
        std::string value;                     ///< Current value
        std::optional<std::string> last_sent;  ///< Last value written to the wire
        Origin origin{Origin::DYNAMIC};
    };

    /**
     * @param writer Outbound writer
     * @param strict Updating an undeclared state is a usage error
     */
    explicit StateStore(Writer writer, bool strict = false);

    /**
     * @brief Register a state declared in the descriptor
     *
     * Nothing is written. An id that is already known is left untouched.
     */
    void declare_static(const std::string& id, const std::string& description, const std::string& default_value);

    /**
     * @brief Create a state, or update its value when the id is known
     *
     * An existing state keeps its original description.
     *
     * @return true when a message was written
     * @throw UsageError on an empty id
     */
    bool create_or_update_state(const std::string& id, const std::string& description, const std::string& value);

    /**
     * @brief Remove a state
     * @return false when the id is unknown, nothing is written then
     */
    bool remove_state(const std::string& id);

    /**
     * @brief Update a state value
     * @return true when a message was written, false when suppressed or the write failed
     * @throw UsageError on an empty id, or an unknown id in strict mode
     */
    bool update_value(const std::string& id, const std::string& value);

    /**
     * @brief Write every known state value again, ignoring the last sent values
     * @return Number of states written
     */
    size_t resend_all();

    /**
     * @brief Update a plugin setting
     * @return true when a message was written
     * @throw UsageError on an empty name
     */
    bool update_setting(const std::string& name, const nlohmann::json& value);

    /**
     * @brief Remember a setting value received from the controller
     */
    void record_setting(const std::string& name, const nlohmann::json& value);

    /**
     * @brief Record hold status of an action instance
     *
     * Releasing with an empty instance id releases every instance of the action.
     */
    void set_held(const std::string& action_id, const std::string& instance_id, bool held);
    bool is_held(const std::string& action_id) const;
    bool is_held(const std::string& action_id, const std::string& instance_id) const;
    void clear_held();

    std::optional<StateRecord> find_state(const std::string& id) const;
    std::optional<nlohmann::json> setting(const std::string& name) const;
    size_t state_count() const;
    std::vector<std::string> state_ids() const;
    bool is_strict() const { return strict_; }

private:
    bool write_state(StateRecord& record);

    Writer writer_;
    const bool strict_;

    mutable std::mutex mutex_;
    std::map<std::string, StateRecord> states_;
    std::map<std::string, nlohmann::json> settings_;
    std::set<std::pair<std::string, std::string>> held_;
};

} // namespace tpsdk

#endif // TPSDK_STATE_STORE_HPP
