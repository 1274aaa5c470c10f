// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "descriptor_generator.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include <common/showmsg.hpp>

#include "errors.hpp"

namespace tpsdk {

namespace {

bool is_placed_kind(EntityKind kind) {
    return kind == EntityKind::ACTION || kind == EntityKind::STATE || kind == EntityKind::EVENT || kind == EntityKind::CONNECTOR;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_word(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    return std::all_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_';
    });
}

bool is_digits(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

/**
 * Default value of a state or action data item that omits one, picked so
 * that the item stays within its type's domain.
 */
Document type_default(const Document& definition, const AttributeRule& rule, const std::string& type) {
    if (type == "number") {
        auto min_it = definition.find("minValue");
        if (min_it != definition.end() && min_it->is_number()) {
            return *min_it;
        }
        return 0;
    }
    if (type == "switch") {
        return false;
    }
    if (type == "choice") {
        auto choices = definition.find("valueChoices");
        if (choices != definition.end() && choices->is_array() && !choices->empty()) {
            return choices->front();
        }
    }
    if (type == "color") {
        return "#000000FF";
    }
    return rule.default_value;
}

// ============================================================================
// YAML conversion
// ============================================================================

bool parse_integer(const std::string& str, int64_t& out) {
    if (str.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(str.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

bool parse_float(const std::string& str, double& out) {
    // Only plain decimal notation, strtod also takes "inf", "nan" and hex
    bool has_digit = false;
    for (unsigned char c : str) {
        if (std::isdigit(c)) {
            has_digit = true;
        } else if (c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
            return false;
        }
    }
    if (!has_digit) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(str.c_str(), &end);
    return end != nullptr && *end == '\0';
}

Document scalar_to_document(const YAML::Node& node) {
    const std::string& str = node.Scalar();

    // Quoted scalars are always strings
    if (node.Tag() == "!") {
        return str;
    }

    int64_t integer;
    if (parse_integer(str, integer)) {
        return integer;
    }
    double number;
    if (parse_float(str, number)) {
        return number;
    }
    if (str == "true" || str == "True" || str == "TRUE") {
        return true;
    }
    if (str == "false" || str == "False" || str == "FALSE") {
        return false;
    }
    if (str == "null" || str == "Null" || str == "NULL" || str == "~") {
        return nullptr;
    }
    return str;
}

Document yaml_to_document(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_document(node);
        case YAML::NodeType::Sequence: {
            Document list = Document::array();
            for (const auto& item : node) {
                list.push_back(yaml_to_document(item));
            }
            return list;
        }
        case YAML::NodeType::Map: {
            Document object = Document::object();
            for (const auto& entry : node) {
                object[entry.first.Scalar()] = yaml_to_document(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

} // namespace

// ============================================================================
// PluginDeclaration
// ============================================================================

PluginDeclaration PluginDeclaration::from_document(const Document& document) {
    if (!document.is_object()) {
        Violation violation{"", "", ViolationKind::MALFORMED, "declaration must be an object"};
        throw DescriptorError("Invalid plugin declaration", {violation});
    }

    PluginDeclaration declaration;
    std::vector<Violation> violations;

    for (auto it = document.begin(); it != document.end(); ++it) {
        const std::string& key = it.key();
        Document* slot = nullptr;

        if (key == "info") slot = &declaration.info;
        else if (key == "categories") slot = &declaration.categories;
        else if (key == "settings") slot = &declaration.settings;
        else if (key == "actions") slot = &declaration.actions;
        else if (key == "states") slot = &declaration.states;
        else if (key == "events") slot = &declaration.events;
        else if (key == "connectors") slot = &declaration.connectors;

        if (slot == nullptr) {
            violations.push_back(Violation{"", key, ViolationKind::UNKNOWN_ATTRIBUTE, "declaration: unknown section '" + key + "'"});
            continue;
        }
        if (it.value().is_null()) {
            continue;
        }
        if (!it.value().is_object()) {
            violations.push_back(Violation{"", key, ViolationKind::WRONG_TYPE,
                                           "declaration: section '" + key + "' must be an object, got " + it.value().type_name()});
            continue;
        }
        *slot = it.value();
    }

    if (declaration.info.empty()) {
        violations.push_back(Violation{"", "info", ViolationKind::MISSING_REQUIRED, "declaration: missing section 'info'"});
    }
    if (declaration.categories.empty()) {
        violations.push_back(Violation{"", "categories", ViolationKind::MISSING_REQUIRED, "declaration: missing section 'categories'"});
    }

    if (!violations.empty()) {
        throw DescriptorError("Invalid plugin declaration", std::move(violations));
    }
    return declaration;
}

PluginDeclaration PluginDeclaration::load_file(const std::string& path) {
    Document document;

    if (ends_with(path, ".json") || ends_with(path, ".tp")) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Violation violation{"", "", ViolationKind::MALFORMED, "cannot open declaration file '" + path + "'"};
            throw DescriptorError("Cannot load " + path, {violation});
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        try {
            document = Document::parse(buffer.str());
        } catch (const nlohmann::json::parse_error& e) {
            Violation violation{"", "", ViolationKind::MALFORMED, std::string("invalid JSON: ") + e.what()};
            throw DescriptorError("Cannot load " + path, {violation});
        }
    } else {
        try {
            document = yaml_to_document(YAML::LoadFile(path));
        } catch (const YAML::Exception& e) {
            Violation violation{"", "", ViolationKind::MALFORMED, std::string("invalid YAML: ") + e.what()};
            throw DescriptorError("Cannot load " + path, {violation});
        }
    }

    return from_document(document);
}

// ============================================================================
// DescriptorGenerator
// ============================================================================

DescriptorGenerator::DescriptorGenerator(const EntityModel& model)
    : model_(model), validator_(model) {
}

Document DescriptorGenerator::generate(const PluginDeclaration& declaration) const {
    Context ctx;
    const Document& info = declaration.info;

    if (!info.is_object()) {
        Violation violation{"info", "", ViolationKind::MALFORMED, "info: must be an object"};
        throw DescriptorError("Invalid plugin declaration", {violation});
    }
    auto id_it = info.find("id");
    if (id_it == info.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        Violation violation{"info", "id", ViolationKind::MISSING_REQUIRED, "info: missing plugin id"};
        throw DescriptorError("Invalid plugin declaration", {violation});
    }

    ctx.plugin_id = id_it->get<std::string>();
    ctx.sdk = DescriptorValidator::declared_version(info);

    Document entry = build_entity(ctx, EntityKind::ROOT, info, "", Document::object(), "info");

    std::vector<std::string> category_keys;
    if (declaration.categories.is_object()) {
        for (auto it = declaration.categories.begin(); it != declaration.categories.end(); ++it) {
            const std::string& key = it.key();
            category_keys.push_back(key);
            entry["categories"].push_back(build_entity(ctx, EntityKind::CATEGORY, it.value(),
                                                       ctx.plugin_id + "." + key, Document::object(),
                                                       "categories[" + key + "]"));
        }
    }

    Document& categories = entry["categories"];
    place_entities(ctx, EntityKind::ACTION, declaration.actions, "actions", categories, category_keys);
    place_entities(ctx, EntityKind::STATE, declaration.states, "states", categories, category_keys);
    place_entities(ctx, EntityKind::EVENT, declaration.events, "events", categories, category_keys);

    if (ctx.sdk >= 4) {
        place_entities(ctx, EntityKind::CONNECTOR, declaration.connectors, "connectors", categories, category_keys);
    } else if (!declaration.connectors.empty()) {
        ShowWarning("[DescriptorGenerator] Connectors need sdk 4 or newer, ignoring %zu connector(s) for sdk %d\n",
                    declaration.connectors.size(), ctx.sdk);
    }

    if (ctx.sdk >= 3) {
        if (declaration.settings.is_object()) {
            for (auto it = declaration.settings.begin(); it != declaration.settings.end(); ++it) {
                entry["settings"].push_back(build_entity(ctx, EntityKind::SETTING, it.value(), it.key(),
                                                         Document::object(), "settings[" + it.key() + "]"));
            }
        }
    } else if (!declaration.settings.empty()) {
        ShowWarning("[DescriptorGenerator] Settings need sdk 3 or newer, ignoring %zu setting(s) for sdk %d\n",
                    declaration.settings.size(), ctx.sdk);
    }

    std::vector<Violation> violations = std::move(ctx.violations);
    for (auto& violation : validator_.validate(entry)) {
        violations.push_back(std::move(violation));
    }

    if (!violations.empty()) {
        throw DescriptorError("Generated descriptor for '" + ctx.plugin_id + "' has " +
                              std::to_string(violations.size()) + " violation(s)", std::move(violations));
    }

    return entry;
}

Document DescriptorGenerator::build_entity(Context& ctx, EntityKind kind, const Document& definition, const std::string& derived_id,
                                           const Document& inherited, const std::string& path) const {
    Document entity = Document::object();

    if (!definition.is_object()) {
        ctx.violations.push_back(Violation{path, "", ViolationKind::MALFORMED,
                                           path + ": " + EntityModel::kind_name(kind) + " definition must be an object"});
        return entity;
    }

    const std::string id_key = EntityModel::id_attribute(kind);
    std::string type;

    // Attributes come out in table order
    for (const auto& rule : model_.rules(kind)) {
        auto it = definition.find(rule.name);

        if (rule.child) {
            if (*rule.child == EntityKind::ACTION_DATA) {
                if (it != definition.end()) {
                    std::string owner_id = entity.contains(id_key) && entity[id_key].is_string() ? entity[id_key].get<std::string>() : derived_id;
                    entity[rule.name] = build_data(ctx, *it, owner_id, path + "." + rule.name);
                }
                continue;
            }
            if (it != definition.end()) {
                ctx.violations.push_back(Violation{path, rule.name, ViolationKind::MALFORMED,
                                                   path + ": '" + rule.name + "' is declared in its own section"});
            }
            if (rule.min_sdk <= ctx.sdk) {
                entity[rule.name] = Document::array();
            }
            continue;
        }

        if (it != definition.end()) {
            entity[rule.name] = *it;
        } else if (rule.name == id_key && !derived_id.empty()) {
            entity[rule.name] = derived_id;
        } else if (inherited.contains(rule.name)) {
            entity[rule.name] = inherited[rule.name];
        } else if (rule.min_sdk <= ctx.sdk) {
            if (rule.name == "default" && (kind == EntityKind::STATE || kind == EntityKind::ACTION_DATA)) {
                entity[rule.name] = type_default(definition, rule, type);
            } else if (!rule.default_value.is_null()) {
                entity[rule.name] = rule.default_value;
            }
        }

        if (rule.name == "type" && entity.contains("type") && entity["type"].is_string()) {
            type = entity["type"].get<std::string>();
        }
    }

    for (auto it = definition.begin(); it != definition.end(); ++it) {
        if (is_placed_kind(kind) && it.key() == "category") {
            continue;
        }
        if (model_.find_rule(kind, it.key()) == nullptr) {
            ctx.violations.push_back(Violation{path, it.key(), ViolationKind::UNKNOWN_ATTRIBUTE,
                                               path + ": unknown attribute '" + it.key() + "' for " + EntityModel::kind_name(kind)});
        }
    }

    return entity;
}

Document DescriptorGenerator::build_data(Context& ctx, const Document& data, const std::string& owner_id, const std::string& path) const {
    Document list = Document::array();

    if (data.is_object()) {
        for (auto it = data.begin(); it != data.end(); ++it) {
            list.push_back(build_entity(ctx, EntityKind::ACTION_DATA, it.value(), owner_id + "." + it.key(),
                                        Document::object(), path + "[" + it.key() + "]"));
        }
    } else if (data.is_array()) {
        size_t position = 1;
        for (const auto& item : data) {
            std::string local = std::to_string(position++);
            list.push_back(build_entity(ctx, EntityKind::ACTION_DATA, item, owner_id + "." + local,
                                        Document::object(), path + "[" + local + "]"));
        }
    } else {
        ctx.violations.push_back(Violation{path, "", ViolationKind::WRONG_TYPE,
                                           path + ": data must be an object or a list, got " + data.type_name()});
    }

    return list;
}

void DescriptorGenerator::replace_format_tokens(Context& ctx, Document& entity, const std::string& path) const {
    auto format = entity.find("format");
    if (format == entity.end() || !format->is_string()) {
        return;
    }

    std::vector<std::string> data_ids;
    auto data = entity.find("data");
    if (data != entity.end() && data->is_array()) {
        for (const auto& item : *data) {
            if (item.is_object() && item.contains("id") && item["id"].is_string()) {
                data_ids.push_back(item["id"].get<std::string>());
            }
        }
    }

    const std::string text = format->get<std::string>();
    std::string out;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t start = text.find("$[", pos);
        size_t end = start == std::string::npos ? std::string::npos : text.find(']', start + 2);
        if (end == std::string::npos) {
            out += text.substr(pos);
            break;
        }

        std::string token = text.substr(start + 2, end - start - 2);
        if (!is_word(token)) {
            out += text.substr(pos, start + 2 - pos);
            pos = start + 2;
            continue;
        }

        out += text.substr(pos, start - pos);

        std::string replacement;
        for (const auto& id : data_ids) {
            size_t dot = id.rfind('.');
            std::string local = dot == std::string::npos ? id : id.substr(dot + 1);
            if (local == token) {
                replacement = id;
                break;
            }
        }
        if (replacement.empty() && is_digits(token) && token.size() < 10) {
            size_t index = std::stoul(token);
            if (index >= 1 && index <= data_ids.size()) {
                replacement = data_ids[index - 1];
            }
        }

        if (replacement.empty()) {
            ctx.violations.push_back(Violation{path, "format", ViolationKind::UNRESOLVED_REFERENCE,
                                               path + ": no data item matches format token '" + token + "'"});
            out += text.substr(start, end + 1 - start);
        } else {
            out += "{$" + replacement + "$}";
        }
        pos = end + 1;
    }

    *format = out;
}

void DescriptorGenerator::place_entities(Context& ctx, EntityKind kind, const Document& definitions, const char* collection,
                                         Document& categories, const std::vector<std::string>& category_keys) const {
    if (!definitions.is_object()) {
        return;
    }

    for (auto it = definitions.begin(); it != definitions.end(); ++it) {
        const std::string& key = it.key();
        const Document& definition = it.value();
        const std::string path = std::string(collection) + "[" + key + "]";

        if (category_keys.empty()) {
            ctx.violations.push_back(Violation{path, "category", ViolationKind::UNRESOLVED_REFERENCE,
                                               path + ": no category declared to hold this " + EntityModel::kind_name(kind)});
            continue;
        }

        size_t index = 0;
        if (definition.is_object() && definition.contains("category")) {
            const Document& category = definition["category"];
            auto found = category.is_string()
                ? std::find(category_keys.begin(), category_keys.end(), category.get<std::string>())
                : category_keys.end();
            if (found == category_keys.end()) {
                ctx.violations.push_back(Violation{path, "category", ViolationKind::UNRESOLVED_REFERENCE,
                                                   path + ": unknown category " + category.dump()});
                continue;
            }
            index = static_cast<size_t>(found - category_keys.begin());
        }

        Document& owner = categories[index];
        Document inherited = Document::object();
        if (kind == EntityKind::ACTION && owner.contains("name")) {
            inherited["prefix"] = owner["name"];
        }

        Document entity = build_entity(ctx, kind, definition, ctx.plugin_id + "." + category_keys[index] + "." + key, inherited, path);
        if (kind == EntityKind::ACTION || kind == EntityKind::CONNECTOR) {
            replace_format_tokens(ctx, entity, path);
        }
        owner[collection].push_back(std::move(entity));
    }
}

} // namespace tpsdk
