// =================================================================
// include/Rewind/PatchTypes.hpp
// =================================================================
// Data types shared by the patch storage and undo components.

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Rewind {

/**
 * @brief One row of the patch index, describing one captured operation
 */
struct PatchMetadata {
    int patch_number = 0;          ///< Unique, strictly increasing in assignment order
    std::string timestamp;         ///< ISO-8601 capture time
    std::string operation_type;    ///< write, edit, line_edit, delete, ...
    std::string file_path;         ///< Absolute, canonical path of the affected file
    std::string patch_file;        ///< Basename of the stored patch document
};

/**
 * @brief In-memory form of patch_index.json
 */
struct PatchIndexData {
    int next_patch_number = 1;
    std::vector<PatchMetadata> patches;   ///< Insertion order, oldest first
};

/**
 * @brief Outcome of an undo request
 *
 * success is true only when reverted_files is non-empty and
 * failed_operations is empty.
 */
struct UndoResult {
    bool success = false;
    std::vector<std::string> reverted_files;
    std::vector<std::string> failed_operations;
};

/**
 * @brief Predicted effect of undoing one patch
 */
struct UndoPreview {
    std::string operation_type;
    std::string file_path;
    int patch_number = 0;
    std::string timestamp;
    std::string current_content;
    std::string predicted_content;
};

/**
 * @brief Line statistics of a unified diff
 */
struct DiffStats {
    size_t additions = 0;
    size_t deletions = 0;
    size_t changes = 0;   ///< additions + deletions
};

/**
 * @brief Entry of the recent-changes list shown before a selective undo
 */
struct UndoFileEntry {
    int patch_number = 0;
    std::string file_path;
    std::string operation_type;
    std::string timestamp;
    DiffStats stats;
};

struct PatchStats {
    std::string session_id;
    std::string patches_directory;
    size_t total_patches = 0;
    std::map<std::string, size_t> operation_counts;
    uintmax_t total_size_bytes = 0;
    int next_patch_number = 1;
};

struct ClearResult {
    bool success = false;
    std::string message;
    size_t removed_count = 0;
};

/**
 * @brief Findings of an integrity pass over a session's patch storage
 */
struct IntegrityReport {
    size_t corrupted_count = 0;                   ///< Index entries without a patch file
    size_t orphaned_count = 0;                    ///< Patch files without an index entry
    std::vector<std::string> quarantined_files;   ///< Orphans moved to quarantine
    std::vector<std::string> failed_files;        ///< Orphans that could not be moved
    size_t stale_temp_files_removed = 0;
    std::string quarantine_manifest;              ///< Manifest of corrupted entries, if written
    std::string orphan_directory;                 ///< Quarantine directory of orphans, if created
};

void to_json(nlohmann::json& j, const PatchMetadata& metadata);
void from_json(const nlohmann::json& j, PatchMetadata& metadata);
void to_json(nlohmann::json& j, const PatchIndexData& index);
void from_json(const nlohmann::json& j, PatchIndexData& index);

} // namespace Rewind
