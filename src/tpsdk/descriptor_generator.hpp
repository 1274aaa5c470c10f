// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file descriptor_generator.hpp
 * @brief Builds a plugin descriptor from declarative entity definitions
 */

#ifndef TPSDK_DESCRIPTOR_GENERATOR_HPP
#define TPSDK_DESCRIPTOR_GENERATOR_HPP

#include <string>
#include <vector>

#include "descriptor_validator.hpp"
#include "entity_model.hpp"

namespace tpsdk {

/**
 * @brief Declarative plugin definition
 *
 * Every collection is an object mapping a local key to a definition. The
 * local key stands in for the identifier when the definition has none:
 * - category:  <plugin id>.<category key>
 * - entity:    <plugin id>.<category key>.<entity key>
 * - data item: <owner id>.<data key>
 * - setting:   the key is the setting name
 *
 * Entities name their category with a `category` attribute; without one
 * they go to the first declared category. An action's `data` may be an
 * object (keys are local names) or a list.
 */
struct PluginDeclaration {
    Document info = Document::object();
    Document categories = Document::object();
    Document settings = Document::object();
    Document actions = Document::object();
    Document states = Document::object();
    Document events = Document::object();
    Document connectors = Document::object();

    /**
     * @brief Build a declaration from a document
     *
     * Accepted top-level keys: info, categories, settings, actions,
     * states, events, connectors.
     *
     * @throw DescriptorError when the document does not have that shape
     */
    static PluginDeclaration from_document(const Document& document);

    /**
     * @brief Load a declaration from a YAML or JSON file
     * @throw DescriptorError when the file cannot be read or parsed
     */
    static PluginDeclaration load_file(const std::string& path);
};

/**
 * @brief Descriptor generator
 *
 * Fills identifiers and table defaults, rewrites `$[name]` format tokens
 * and validates the result. Output that does not validate is never
 * returned.
 */
class DescriptorGenerator {
public:
    explicit DescriptorGenerator(const EntityModel& model = EntityModel::instance());

    /**
     * @brief Generate the descriptor document
     * @param declaration Plugin definition
     * @return Expanded descriptor, valid for its declared schema version
     * @throw DescriptorError with every violation when generation or validation fails
     */
    Document generate(const PluginDeclaration& declaration) const;

private:
    struct Context {
        int32_t sdk{SDK_DEFAULT_VERSION};
        std::string plugin_id;
        std::vector<Violation> violations;
    };

    Document build_entity(Context& ctx, EntityKind kind, const Document& definition, const std::string& derived_id,
                          const Document& inherited, const std::string& path) const;
    Document build_data(Context& ctx, const Document& data, const std::string& owner_id, const std::string& path) const;
    void replace_format_tokens(Context& ctx, Document& entity, const std::string& path) const;
    void place_entities(Context& ctx, EntityKind kind, const Document& definitions, const char* collection,
                        Document& categories, const std::vector<std::string>& category_keys) const;

    const EntityModel& model_;
    DescriptorValidator validator_;
};

} // namespace tpsdk

#endif // TPSDK_DESCRIPTOR_GENERATOR_HPP
