// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder
/**
 * @file descriptor_validator.hpp
 * @brief Lints a plugin descriptor against the versioned entity model
 *
 * Validation is total: the whole tree is walked depth-first and every
 * violation is collected, so a single run yields the complete report.
 */

#ifndef TPSDK_DESCRIPTOR_VALIDATOR_HPP
#define TPSDK_DESCRIPTOR_VALIDATOR_HPP

#include <map>
#include <string>
#include <vector>

#include "entity_model.hpp"

namespace tpsdk {

/**
 * @brief Descriptor linter
 *
 * Checks, per entity:
 * - required attributes are present
 * - no unknown attribute, none newer than the declared schema version
 * - value types, permitted values and type-specific domains
 * - identifiers unique across the whole document
 * - format references resolve to data items of the same entity
 */
class DescriptorValidator {
public:
    explicit DescriptorValidator(const EntityModel& model = EntityModel::instance());

    /**
     * @brief Validate a parsed descriptor
     * @param descriptor Descriptor document
     * @return All violations, empty when the descriptor is valid
     */
    std::vector<Violation> validate(const Document& descriptor) const;

    /**
     * @brief Validate descriptor text
     *
     * A parse failure is reported as a single MALFORMED violation.
     */
    std::vector<Violation> validate_string(const std::string& text) const;

    /**
     * @brief Validate a descriptor file
     *
     * An unreadable or unparsable file is reported as a single MALFORMED
     * violation.
     */
    std::vector<Violation> validate_file(const std::string& path) const;

    /**
     * @brief Schema version a descriptor targets
     * @return Declared `sdk`, or SDK_DEFAULT_VERSION when absent or invalid
     */
    static int32_t declared_version(const Document& descriptor);

private:
    // State of one validation run
    struct Pass {
        int32_t sdk{SDK_DEFAULT_VERSION};
        std::map<std::string, std::string> ids;  ///< id or setting name -> path of first declaration
        std::vector<Violation> violations;

        void report(const std::string& path, const std::string& attribute, ViolationKind kind, const std::string& message);
    };

    void validate_entity(Pass& pass, EntityKind kind, const Document& entity, const std::string& path) const;
    void validate_list(Pass& pass, EntityKind kind, const Document& list, const std::string& path) const;
    void check_unique(Pass& pass, EntityKind kind, const Document& entity, const std::string& path) const;
    void check_references(Pass& pass, const Document& entity, const std::string& path) const;

    const EntityModel& model_;
};

} // namespace tpsdk

#endif // TPSDK_DESCRIPTOR_VALIDATOR_HPP
