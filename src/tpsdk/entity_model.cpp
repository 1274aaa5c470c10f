// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "entity_model.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace tpsdk {

namespace {

AttributeRule make_rule(const std::string& name, int32_t min_sdk, bool required, uint8_t types,
                        Document default_value = nullptr, std::vector<Document> choices = {},
                        std::optional<EntityKind> child = std::nullopt) {
    AttributeRule rule;
    rule.name = name;
    rule.min_sdk = min_sdk;
    rule.required = required;
    rule.types = types;
    rule.default_value = std::move(default_value);
    rule.choices = std::move(choices);
    rule.child = child;
    return rule;
}

// Parses a JSON number or a numeric string
std::optional<double> as_number(const Document& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string& str = value.get_ref<const std::string&>();
        if (str.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        double parsed = std::strtod(str.c_str(), &end);
        if (end != nullptr && *end == '\0') {
            return parsed;
        }
    }
    return std::nullopt;
}

std::string scalar_text(const Document& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

// ============================================================================
// Violation
// ============================================================================

std::string Violation::attribute_path() const {
    if (path.empty()) {
        return attribute;
    }
    if (attribute.empty()) {
        return path;
    }
    return path + "." + attribute;
}

std::string Violation::to_string() const {
    return std::string(violation_kind_name(kind)) + ": " + message;
}

const char* violation_kind_name(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::MISSING_REQUIRED: return "missing_required";
        case ViolationKind::UNKNOWN_ATTRIBUTE: return "unknown_attribute";
        case ViolationKind::VERSION_TOO_LOW: return "version_too_low";
        case ViolationKind::WRONG_TYPE: return "wrong_type";
        case ViolationKind::INVALID_CHOICE: return "invalid_choice";
        case ViolationKind::DOMAIN: return "domain";
        case ViolationKind::DUPLICATE_ID: return "duplicate_id";
        case ViolationKind::UNRESOLVED_REFERENCE: return "unresolved_reference";
        case ViolationKind::MALFORMED: return "malformed";
    }
    return "unknown";
}

// ============================================================================
// EntityModel
// ============================================================================

const EntityModel& EntityModel::instance() {
    static const EntityModel model;
    return model;
}

EntityModel::EntityModel() {
    //                 key name                 sdk  required  type(s)                default          choices
    setting_ = {
        make_rule("name",                       3,   true,     VT_STRING),
        make_rule("type",                       3,   true,     VT_STRING,             "text",          {"text", "number"}),
        make_rule("default",                    3,   false,    VT_STRING),
        make_rule("maxLength",                  3,   false,    VT_INTEGER),
        make_rule("isPassword",                 3,   false,    VT_BOOLEAN),
        make_rule("minValue",                   3,   false,    VT_INTEGER),
        make_rule("maxValue",                   3,   false,    VT_INTEGER),
        make_rule("readOnly",                   3,   false,    VT_BOOLEAN,            false),
    };

    state_ = {
        make_rule("id",                         1,   true,     VT_STRING),
        make_rule("type",                       1,   true,     VT_STRING,             "text",          {"text", "choice"}),
        make_rule("desc",                       1,   true,     VT_STRING),
        make_rule("default",                    1,   true,     VT_STRING,             ""),
        make_rule("parentGroup",                6,   false,    VT_STRING),
        make_rule("valueChoices",               1,   false,    VT_LIST),
    };

    event_ = {
        make_rule("id",                         1,   true,     VT_STRING),
        make_rule("name",                       1,   true,     VT_STRING),
        make_rule("format",                     1,   true,     VT_STRING),
        make_rule("type",                       1,   true,     VT_STRING,             "communicate",   {"communicate"}),
        make_rule("valueChoices",               1,   true,     VT_LIST,               Document::array()),
        make_rule("valueType",                  1,   true,     VT_STRING,             "choice",        {"choice"}),
        make_rule("valueStateId",               1,   true,     VT_STRING),
    };

    action_data_ = {
        make_rule("id",                         1,   true,     VT_STRING),
        make_rule("type",                       1,   true,     VT_STRING,             "text",
                  {"text", "number", "switch", "choice", "file", "folder", "color"}),
        make_rule("label",                      1,   true,     VT_STRING),
        make_rule("default",                    1,   true,     VT_SCALAR,             ""),
        make_rule("valueChoices",               1,   false,    VT_LIST),
        make_rule("extensions",                 2,   false,    VT_LIST),
        make_rule("allowDecimals",              2,   false,    VT_BOOLEAN),
        make_rule("minValue",                   3,   false,    VT_INTEGER),
        make_rule("maxValue",                   3,   false,    VT_INTEGER),
    };

    action_ = {
        make_rule("id",                         1,   true,     VT_STRING),
        make_rule("name",                       1,   true,     VT_STRING),
        make_rule("prefix",                     1,   true,     VT_STRING),
        make_rule("type",                       1,   true,     VT_STRING,             "communicate",   {"communicate", "execute"}),
        make_rule("description",                1,   false,    VT_STRING),
        make_rule("format",                     1,   false,    VT_STRING),
        make_rule("executionType",              1,   false,    VT_STRING),
        make_rule("execution_cmd",              1,   false,    VT_STRING),
        make_rule("tryInline",                  1,   false,    VT_BOOLEAN),
        make_rule("hasHoldFunctionality",       3,   false,    VT_BOOLEAN),
        make_rule("data",                       1,   false,    VT_LIST,               nullptr,         {}, EntityKind::ACTION_DATA),
    };

    connector_ = {
        make_rule("id",                         4,   true,     VT_STRING),
        make_rule("name",                       4,   true,     VT_STRING),
        make_rule("format",                     4,   false,    VT_STRING),
        make_rule("data",                       4,   false,    VT_LIST,               nullptr,         {}, EntityKind::ACTION_DATA),
    };

    category_ = {
        make_rule("id",                         1,   true,     VT_STRING),
        make_rule("name",                       1,   true,     VT_STRING),
        make_rule("imagepath",                  1,   false,    VT_STRING),
        make_rule("actions",                    1,   false,    VT_LIST,               nullptr,         {}, EntityKind::ACTION),
        make_rule("connectors",                 4,   false,    VT_LIST,               nullptr,         {}, EntityKind::CONNECTOR),
        make_rule("states",                     1,   false,    VT_LIST,               nullptr,         {}, EntityKind::STATE),
        make_rule("events",                     1,   false,    VT_LIST,               nullptr,         {}, EntityKind::EVENT),
    };

    root_ = {
        make_rule("sdk",                        1,   true,     VT_INTEGER,            SDK_DEFAULT_VERSION, {1, 2, 3, 4, 5, 6}),
        make_rule("version",                    1,   true,     VT_INTEGER,            1),
        make_rule("name",                       1,   true,     VT_STRING),
        make_rule("id",                         1,   true,     VT_STRING),
        make_rule("configuration",              1,   false,    VT_OBJECT),
        make_rule("plugin_start_cmd",           1,   false,    VT_STRING),
        make_rule("plugin_start_cmd_windows",   4,   false,    VT_STRING),
        make_rule("plugin_start_cmd_linux",     4,   false,    VT_STRING),
        make_rule("plugin_start_cmd_mac",       4,   false,    VT_STRING),
        make_rule("categories",                 1,   true,     VT_LIST,               Document::array(), {}, EntityKind::CATEGORY),
        make_rule("settings",                   3,   false,    VT_LIST,               Document::array(), {}, EntityKind::SETTING),
    };
}

const std::vector<AttributeRule>& EntityModel::rules(EntityKind kind) const {
    switch (kind) {
        case EntityKind::ROOT: return root_;
        case EntityKind::SETTING: return setting_;
        case EntityKind::CATEGORY: return category_;
        case EntityKind::ACTION: return action_;
        case EntityKind::ACTION_DATA: return action_data_;
        case EntityKind::STATE: return state_;
        case EntityKind::EVENT: return event_;
        case EntityKind::CONNECTOR: return connector_;
    }
    return root_;
}

const AttributeRule* EntityModel::find_rule(EntityKind kind, const std::string& attribute) const {
    const auto& table = rules(kind);
    auto it = std::find_if(table.begin(), table.end(), [&attribute](const AttributeRule& rule) {
        return rule.name == attribute;
    });
    return it != table.end() ? &(*it) : nullptr;
}

RuleStatus EntityModel::check_attribute(EntityKind kind, const std::string& attribute, int32_t sdk, const AttributeRule** rule) const {
    const AttributeRule* found = find_rule(kind, attribute);
    if (rule != nullptr) {
        *rule = found;
    }
    if (found == nullptr) {
        return RuleStatus::UNKNOWN;
    }
    if (sdk < found->min_sdk) {
        return RuleStatus::TOO_NEW;
    }
    return RuleStatus::ALLOWED;
}

bool EntityModel::check_value_type(const AttributeRule& rule, const Document& value) const {
    if ((rule.types & VT_STRING) && value.is_string()) return true;
    if ((rule.types & VT_INTEGER) && value.is_number_integer()) return true;
    if ((rule.types & VT_FLOAT) && value.is_number_float()) return true;
    if ((rule.types & VT_BOOLEAN) && value.is_boolean()) return true;
    if ((rule.types & VT_LIST) && value.is_array()) return true;
    if ((rule.types & VT_OBJECT) && value.is_object()) return true;
    return false;
}

bool EntityModel::check_choice(const AttributeRule& rule, const Document& value) const {
    if (rule.choices.empty()) {
        return true;
    }
    return std::find(rule.choices.begin(), rule.choices.end(), value) != rule.choices.end();
}

std::vector<DomainIssue> EntityModel::check_type_domain(EntityKind kind, const Document& entity) const {
    std::vector<DomainIssue> issues;

    if (!entity.is_object()) {
        return issues;
    }
    if (kind != EntityKind::ACTION_DATA && kind != EntityKind::STATE && kind != EntityKind::SETTING) {
        return issues;
    }

    // Settings default to text, everything else must say what it is
    std::string type = kind == EntityKind::SETTING ? "text" : "";
    auto type_it = entity.find("type");
    if (type_it != entity.end()) {
        if (!type_it->is_string()) {
            return issues;
        }
        type = type_it->get<std::string>();
    }

    auto def_it = entity.find("default");
    const Document* def = def_it != entity.end() ? &(*def_it) : nullptr;

    if (type == "number") {
        std::optional<double> numeric_default;
        if (def != nullptr) {
            numeric_default = as_number(*def);
            if (!numeric_default) {
                issues.push_back({"default", "Default value '" + scalar_text(*def) + "' of a number is not numeric"});
            }
        }

        std::optional<double> min_value;
        std::optional<double> max_value;
        auto min_it = entity.find("minValue");
        auto max_it = entity.find("maxValue");
        if (min_it != entity.end() && min_it->is_number()) min_value = min_it->get<double>();
        if (max_it != entity.end() && max_it->is_number()) max_value = max_it->get<double>();

        if (min_value && max_value && *min_value > *max_value) {
            issues.push_back({"minValue", "minValue " + min_it->dump() + " is greater than maxValue " + max_it->dump()});
        } else if (numeric_default) {
            if (min_value && *numeric_default < *min_value) {
                issues.push_back({"default", "Default value " + scalar_text(*def) + " is below minValue " + min_it->dump()});
            }
            if (max_value && *numeric_default > *max_value) {
                issues.push_back({"default", "Default value " + scalar_text(*def) + " is above maxValue " + max_it->dump()});
            }
        }
    } else if (type == "choice") {
        auto choices = entity.find("valueChoices");
        if (choices == entity.end() || !choices->is_array() || choices->empty()) {
            issues.push_back({"valueChoices", "A choice requires a non-empty list of candidates"});
        } else if (def != nullptr && std::find(choices->begin(), choices->end(), *def) == choices->end()) {
            issues.push_back({"default", "Default value '" + scalar_text(*def) + "' is not one of the candidates " + choices->dump()});
        }
    } else if (type == "color") {
        if (def != nullptr && (!def->is_string() || !is_valid_color(def->get<std::string>()))) {
            issues.push_back({"default", "Default value '" + scalar_text(*def) + "' is not a #RRGGBB or #RRGGBBAA color"});
        }
    } else if (type == "switch") {
        if (def != nullptr && !def->is_boolean()) {
            issues.push_back({"default", "Default value '" + scalar_text(*def) + "' of a switch is not a boolean"});
        }
    }

    return issues;
}

const char* EntityModel::id_attribute(EntityKind kind) {
    switch (kind) {
        case EntityKind::ROOT: return "";
        case EntityKind::SETTING: return "name";
        default: return "id";
    }
}

const char* EntityModel::kind_name(EntityKind kind) {
    switch (kind) {
        case EntityKind::ROOT: return "plugin";
        case EntityKind::SETTING: return "setting";
        case EntityKind::CATEGORY: return "category";
        case EntityKind::ACTION: return "action";
        case EntityKind::ACTION_DATA: return "action data";
        case EntityKind::STATE: return "state";
        case EntityKind::EVENT: return "event";
        case EntityKind::CONNECTOR: return "connector";
    }
    return "entity";
}

std::string EntityModel::type_names(uint8_t types) {
    std::string names;
    auto append = [&names](const char* name) {
        if (!names.empty()) names += "|";
        names += name;
    };

    if (types & VT_STRING) append("string");
    if (types & VT_INTEGER) append("integer");
    if (types & VT_FLOAT) append("float");
    if (types & VT_BOOLEAN) append("boolean");
    if (types & VT_LIST) append("list");
    if (types & VT_OBJECT) append("object");
    return names;
}

bool EntityModel::is_valid_color(const std::string& value) {
    if (value.size() != 7 && value.size() != 9) {
        return false;
    }
    if (value[0] != '#') {
        return false;
    }
    return std::all_of(value.begin() + 1, value.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

} // namespace tpsdk
