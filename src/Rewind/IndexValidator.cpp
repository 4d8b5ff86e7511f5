// =================================================================
// src/Rewind/IndexValidator.cpp
// =================================================================
// Implementation for patch index validation.

#include "Rewind/IndexValidator.hpp"
#include <set>

namespace Rewind {

ValidationResult IndexValidator::validateMetadata(const PatchMetadata& metadata) const {
    ValidationResult result;
    std::string label = "patch " + std::to_string(metadata.patch_number);
    
    if (metadata.patch_number <= 0) {
        result.addError(label + ": patch_number must be positive");
    }
    if (metadata.timestamp.empty()) {
        result.addError(label + ": timestamp is empty");
    }
    if (metadata.operation_type.empty()) {
        result.addError(label + ": operation_type is empty");
    }
    if (metadata.file_path.empty()) {
        result.addError(label + ": file_path is empty");
    }
    if (metadata.patch_file.empty()) {
        result.addError(label + ": patch_file is empty");
    } else if (metadata.patch_file.find('/') != std::string::npos ||
               metadata.patch_file.find('\\') != std::string::npos ||
               metadata.patch_file == "." || metadata.patch_file == "..") {
        result.addError(label + ": patch_file must be a file name, got " + metadata.patch_file);
    }
    
    return result;
}

ValidationResult IndexValidator::validateIndex(const PatchIndexData& index) const {
    ValidationResult result;
    
    if (index.next_patch_number <= 0) {
        result.addError("next_patch_number must be positive");
    }
    
    std::set<int> seen;
    for (const auto& metadata : index.patches) {
        ValidationResult record = validateMetadata(metadata);
        for (const auto& error : record.errors) {
            result.addError(error);
        }
        if (!seen.insert(metadata.patch_number).second) {
            result.addError("duplicate patch_number " + std::to_string(metadata.patch_number));
        }
        if (metadata.patch_number >= index.next_patch_number) {
            result.addError("patch_number " + std::to_string(metadata.patch_number) +
                            " is not below next_patch_number " + std::to_string(index.next_patch_number));
        }
    }
    
    return result;
}

void IndexValidator::validateMetadataJson(const nlohmann::json& j, size_t position, ValidationResult& result) const {
    std::string label = "patches[" + std::to_string(position) + "]";
    if (!j.is_object()) {
        result.addError(label + " is not an object");
        return;
    }
    if (!j.contains("patch_number") || !j["patch_number"].is_number_integer()) {
        result.addError(label + ".patch_number must be an integer");
    }
    for (const char* field : {"timestamp", "operation_type", "file_path", "patch_file"}) {
        if (!j.contains(field) || !j[field].is_string()) {
            result.addError(label + "." + field + " must be a string");
        }
    }
}

ValidationResult IndexValidator::validateIndexJson(const nlohmann::json& j) const {
    ValidationResult result;
    
    if (!j.is_object()) {
        result.addError("index is not an object");
        return result;
    }
    if (!j.contains("next_patch_number") || !j["next_patch_number"].is_number_integer()) {
        result.addError("next_patch_number must be an integer");
    }
    if (!j.contains("patches") || !j["patches"].is_array()) {
        result.addError("patches must be an array");
        return result;
    }
    
    const auto& patches = j["patches"];
    for (size_t i = 0; i < patches.size(); ++i) {
        validateMetadataJson(patches[i], i, result);
    }
    if (!result.valid) {
        return result;
    }
    
    return validateIndex(j.get<PatchIndexData>());
}

ValidationResult IndexValidator::validateUndoResult(const UndoResult& undo_result) const {
    ValidationResult result;
    bool expected = !undo_result.reverted_files.empty() && undo_result.failed_operations.empty();
    if (undo_result.success != expected) {
        result.addError(undo_result.success
            ? "success is set but the result has no reverted files or has failures"
            : "success is not set although every operation succeeded");
    }
    for (const auto& file : undo_result.reverted_files) {
        if (file.empty()) {
            result.addError("reverted_files contains an empty path");
        }
    }
    return result;
}

} // namespace Rewind
