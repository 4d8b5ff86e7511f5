// =================================================================
// include/Rewind/IndexValidator.hpp
// =================================================================
// Structural checks applied to the patch index before it is trusted
// or persisted.

#pragma once

#include "Rewind/PatchTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Rewind {

/**
 * @brief Outcome of a validation
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;   ///< One message per violated rule

    void addError(const std::string& error) {
        valid = false;
        errors.push_back(error);
    }
};

/**
 * @brief Validator for index records, whole indexes and undo results
 */
class IndexValidator {
public:
    /**
     * @brief Check one metadata record
     *
     * patch_number must be positive, operation_type, file_path and
     * patch_file non-empty, and patch_file a bare file name. The timestamp
     * is only required to be present; unparseable timestamps are tolerated
     * and skipped by range queries.
     */
    ValidationResult validateMetadata(const PatchMetadata& metadata) const;

    /**
     * @brief Check an in-memory index
     *
     * Every record must be valid, patch numbers unique, and
     * next_patch_number greater than every live patch number.
     */
    ValidationResult validateIndex(const PatchIndexData& index) const;

    /**
     * @brief Check the JSON form of an index as read from disk
     *
     * Verifies field presence and types before conversion, then applies
     * validateIndex() to the converted value.
     */
    ValidationResult validateIndexJson(const nlohmann::json& j) const;

    /**
     * @brief Check the UndoResult invariant
     *
     * success must be true exactly when reverted_files is non-empty and
     * failed_operations is empty.
     */
    ValidationResult validateUndoResult(const UndoResult& result) const;

private:
    void validateMetadataJson(const nlohmann::json& j, size_t position, ValidationResult& result) const;
};

} // namespace Rewind
