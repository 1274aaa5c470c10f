// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "descriptor_validator.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace tpsdk {

namespace {

std::string join_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string display_path(const std::string& path) {
    return path.empty() ? "plugin" : path;
}

} // namespace

void DescriptorValidator::Pass::report(const std::string& path, const std::string& attribute, ViolationKind kind, const std::string& message) {
    violations.push_back(Violation{path, attribute, kind, display_path(path) + ": " + message});
}

DescriptorValidator::DescriptorValidator(const EntityModel& model)
    : model_(model) {
}

// ============================================================================
// Entry points
// ============================================================================

std::vector<Violation> DescriptorValidator::validate(const Document& descriptor) const {
    Pass pass;

    if (!descriptor.is_object()) {
        pass.report("", "", ViolationKind::MALFORMED, "descriptor must be a JSON object");
        return pass.violations;
    }

    pass.sdk = declared_version(descriptor);
    validate_entity(pass, EntityKind::ROOT, descriptor, "");
    return pass.violations;
}

std::vector<Violation> DescriptorValidator::validate_string(const std::string& text) const {
    Document descriptor;
    try {
        descriptor = Document::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        Violation violation{"", "", ViolationKind::MALFORMED, std::string("invalid JSON: ") + e.what()};
        return {violation};
    }
    return validate(descriptor);
}

std::vector<Violation> DescriptorValidator::validate_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        Violation violation{"", "", ViolationKind::MALFORMED, "cannot open descriptor file '" + path + "'"};
        return {violation};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return validate_string(buffer.str());
}

int32_t DescriptorValidator::declared_version(const Document& descriptor) {
    if (!descriptor.is_object()) {
        return SDK_DEFAULT_VERSION;
    }

    auto it = descriptor.find("sdk");
    if (it == descriptor.end() || !it->is_number_integer()) {
        return SDK_DEFAULT_VERSION;
    }

    int64_t sdk = it->get<int64_t>();
    if (sdk < SDK_MIN_VERSION || sdk > SDK_MAX_VERSION) {
        return SDK_DEFAULT_VERSION;
    }
    return static_cast<int32_t>(sdk);
}

// ============================================================================
// Tree walk
// ============================================================================

void DescriptorValidator::validate_entity(Pass& pass, EntityKind kind, const Document& entity, const std::string& path) const {
    const char* kind_name = EntityModel::kind_name(kind);

    if (!entity.is_object()) {
        pass.report(path, "", ViolationKind::MALFORMED, std::string(kind_name) + " must be an object, got " + entity.type_name());
        return;
    }

    for (const auto& rule : model_.rules(kind)) {
        if (rule.required && rule.min_sdk <= pass.sdk && !entity.contains(rule.name)) {
            pass.report(path, rule.name, ViolationKind::MISSING_REQUIRED,
                        "missing required attribute '" + rule.name + "' of " + kind_name);
        }
    }

    for (auto it = entity.begin(); it != entity.end(); ++it) {
        const std::string& key = it.key();
        const Document& value = it.value();
        const AttributeRule* rule = nullptr;

        switch (model_.check_attribute(kind, key, pass.sdk, &rule)) {
            case RuleStatus::UNKNOWN:
                pass.report(path, key, ViolationKind::UNKNOWN_ATTRIBUTE,
                            "unknown attribute '" + key + "' for " + kind_name);
                continue;
            case RuleStatus::TOO_NEW:
                pass.report(path, key, ViolationKind::VERSION_TOO_LOW,
                            "attribute '" + key + "' needs sdk " + std::to_string(rule->min_sdk) +
                            " but the descriptor declares sdk " + std::to_string(pass.sdk));
                continue;
            case RuleStatus::ALLOWED:
                break;
        }

        if (!model_.check_value_type(*rule, value)) {
            pass.report(path, key, ViolationKind::WRONG_TYPE,
                        "attribute '" + key + "' must be " + EntityModel::type_names(rule->types) +
                        ", got " + value.type_name());
            continue;
        }

        if (!model_.check_choice(*rule, value)) {
            Document permitted(rule->choices);
            pass.report(path, key, ViolationKind::INVALID_CHOICE,
                        "attribute '" + key + "' has value " + value.dump() + ", expected one of " + permitted.dump());
            continue;
        }

        if (rule->child) {
            validate_list(pass, *rule->child, value, join_path(path, key));
        }
    }

    for (const auto& issue : model_.check_type_domain(kind, entity)) {
        pass.report(path, issue.attribute, ViolationKind::DOMAIN, issue.message);
    }

    check_unique(pass, kind, entity, path);

    if (kind == EntityKind::ACTION || kind == EntityKind::CONNECTOR) {
        check_references(pass, entity, path);
    }
}

void DescriptorValidator::validate_list(Pass& pass, EntityKind kind, const Document& list, const std::string& path) const {
    size_t index = 0;
    for (const auto& item : list) {
        validate_entity(pass, kind, item, path + "[" + std::to_string(index) + "]");
        ++index;
    }
}

void DescriptorValidator::check_unique(Pass& pass, EntityKind kind, const Document& entity, const std::string& path) const {
    const std::string id_key = EntityModel::id_attribute(kind);
    if (id_key.empty()) {
        return;
    }

    auto it = entity.find(id_key);
    if (it == entity.end() || !it->is_string()) {
        return;
    }

    auto& seen = pass.ids;
    const std::string id = it->get<std::string>();
    auto found = seen.find(id);
    if (found != seen.end()) {
        pass.report(path, id_key, ViolationKind::DUPLICATE_ID,
                    "duplicate " + id_key + " '" + id + "', first declared at " + display_path(found->second));
        return;
    }
    seen.emplace(id, path);
}

void DescriptorValidator::check_references(Pass& pass, const Document& entity, const std::string& path) const {
    auto format = entity.find("format");
    if (format == entity.end() || !format->is_string()) {
        return;
    }

    std::set<std::string> data_ids;
    auto data = entity.find("data");
    if (data != entity.end() && data->is_array()) {
        for (const auto& item : *data) {
            if (item.is_object() && item.contains("id") && item["id"].is_string()) {
                data_ids.insert(item["id"].get<std::string>());
            }
        }
    }

    const std::string& text = format->get_ref<const std::string&>();
    size_t pos = 0;
    while ((pos = text.find("{$", pos)) != std::string::npos) {
        size_t end = text.find("$}", pos + 2);
        if (end == std::string::npos) {
            break;
        }

        std::string ref = text.substr(pos + 2, end - pos - 2);
        if (data_ids.count(ref) == 0) {
            pass.report(path, "format", ViolationKind::UNRESOLVED_REFERENCE,
                        "format references '" + ref + "' which is not a data item of this entity");
        }
        pos = end + 2;
    }
}

} // namespace tpsdk
