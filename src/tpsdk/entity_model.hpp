// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file entity_model.hpp
 * @brief Descriptor entity model and versioned attribute rules
 *
 * Describes every entity kind a plugin descriptor may contain (root,
 * settings, categories, actions, action data, states, events, connectors)
 * together with the attributes each kind accepts per schema version:
 * - minimum schema version of the attribute
 * - required flag
 * - accepted JSON value type(s)
 * - default value used by the generator
 * - permitted values, if restricted
 * - nested entity kind for list attributes
 *
 * The tables are built once and never modified afterwards.
 */

#ifndef TPSDK_ENTITY_MODEL_HPP
#define TPSDK_ENTITY_MODEL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tpsdk {

/// Descriptor documents keep the attribute order they were written with
using Document = nlohmann::ordered_json;

constexpr int32_t SDK_MIN_VERSION = 1;
constexpr int32_t SDK_MAX_VERSION = 6;
constexpr int32_t SDK_DEFAULT_VERSION = 6;

/**
 * @brief Entity kinds found in a descriptor
 */
enum class EntityKind {
    ROOT,
    SETTING,
    CATEGORY,
    ACTION,
    ACTION_DATA,
    STATE,
    EVENT,
    CONNECTOR
};

/**
 * @brief JSON value types, combined as a bitmask in AttributeRule::types
 */
enum ValueType : uint8_t {
    VT_STRING  = 0x01,
    VT_INTEGER = 0x02,
    VT_FLOAT   = 0x04,
    VT_BOOLEAN = 0x08,
    VT_LIST    = 0x10,
    VT_OBJECT  = 0x20,
    VT_SCALAR  = VT_STRING | VT_INTEGER | VT_FLOAT | VT_BOOLEAN
};

/**
 * @brief One (entity kind, attribute) rule
 */
struct AttributeRule {
    std::string name;
    int32_t min_sdk{SDK_MIN_VERSION};      ///< Attribute is forbidden below this version
    bool required{false};
    uint8_t types{VT_STRING};
    Document default_value;                ///< null when the attribute has no default
    std::vector<Document> choices;         ///< empty when any value of the right type is allowed
    std::optional<EntityKind> child;       ///< kind of the entities listed in this attribute
};

/**
 * @brief Outcome of an attribute lookup
 */
enum class RuleStatus {
    ALLOWED,
    UNKNOWN,      ///< No such attribute for this kind
    TOO_NEW       ///< Attribute exists but needs a newer schema version
};

/**
 * @brief Problem found by a type-domain check
 */
struct DomainIssue {
    std::string attribute;
    std::string message;
};

/**
 * @brief Category of a descriptor violation
 */
enum class ViolationKind {
    MISSING_REQUIRED,
    UNKNOWN_ATTRIBUTE,
    VERSION_TOO_LOW,
    WRONG_TYPE,
    INVALID_CHOICE,
    DOMAIN,
    DUPLICATE_ID,
    UNRESOLVED_REFERENCE,
    MALFORMED
};

/**
 * @brief One descriptor violation
 */
struct Violation {
    std::string path;       ///< Entity path, e.g. "categories[0].actions[1]"
    std::string attribute;  ///< Offending attribute, empty when the entity itself is at fault
    ViolationKind kind;
    std::string message;

    /// "categories[0].actions[1].id"
    std::string attribute_path() const;
    std::string to_string() const;
};

const char* violation_kind_name(ViolationKind kind);

/**
 * @brief Versioned attribute rule table plus value-domain rules
 *
 * Pure lookup structure, no side effects. Unknown attributes are always
 * rejected.
 */
class EntityModel {
public:
    /**
     * @brief Shared immutable model
     */
    static const EntityModel& instance();

    /**
     * @brief All rules of a kind, in descriptor order
     */
    const std::vector<AttributeRule>& rules(EntityKind kind) const;

    /**
     * @brief Find the rule for an attribute
     * @return Rule or nullptr when the attribute is unknown for this kind
     */
    const AttributeRule* find_rule(EntityKind kind, const std::string& attribute) const;

    /**
     * @brief Check whether an attribute may appear for a schema version
     * @param kind Entity kind
     * @param attribute Attribute name
     * @param sdk Declared schema version
     * @param rule Receives the rule when one exists (may be nullptr)
     * @return RuleStatus
     */
    RuleStatus check_attribute(EntityKind kind, const std::string& attribute, int32_t sdk, const AttributeRule** rule = nullptr) const;

    /**
     * @brief Check a value against the rule's accepted JSON type(s)
     */
    bool check_value_type(const AttributeRule& rule, const Document& value) const;

    /**
     * @brief Check a value against the rule's permitted values
     * @return true when the rule has no restriction or the value is listed
     */
    bool check_choice(const AttributeRule& rule, const Document& value) const;

    /**
     * @brief Type-specific domain checks for an entity
     *
     * Looks at the entity's declared `type`:
     * - number: numeric default, minValue <= maxValue, default within range
     * - choice: non-empty list of candidates, default is one of them
     * - color:  default is #RRGGBB or #RRGGBBAA
     * - switch: boolean default
     *
     * @param kind Entity kind
     * @param entity Entity object
     * @return Issues found, empty when the entity is in domain
     */
    std::vector<DomainIssue> check_type_domain(EntityKind kind, const Document& entity) const;

    /**
     * @brief Name of the attribute holding the identifier of a kind
     * @return "id", "name" for settings, empty for the root
     */
    static const char* id_attribute(EntityKind kind);

    static const char* kind_name(EntityKind kind);
    static std::string type_names(uint8_t types);
    static bool is_valid_color(const std::string& value);

private:
    EntityModel();

    std::vector<AttributeRule> root_;
    std::vector<AttributeRule> setting_;
    std::vector<AttributeRule> category_;
    std::vector<AttributeRule> action_;
    std::vector<AttributeRule> action_data_;
    std::vector<AttributeRule> state_;
    std::vector<AttributeRule> event_;
    std::vector<AttributeRule> connector_;
};

} // namespace tpsdk

#endif // TPSDK_ENTITY_MODEL_HPP
