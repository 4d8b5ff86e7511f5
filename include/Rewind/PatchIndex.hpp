// =================================================================
// include/Rewind/PatchIndex.hpp
// =================================================================
// Ordered, numbered catalog of the patches captured in a session.

#pragma once

#include "Rewind/IndexValidator.hpp"
#include "Rewind/PatchTypes.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Rewind {

/**
 * @brief Fields that may be changed on an existing record
 *
 * patch_number is the identity of a record and cannot be updated.
 */
struct PatchMetadataUpdate {
    std::optional<std::string> timestamp;
    std::optional<std::string> operation_type;
    std::optional<std::string> file_path;
    std::optional<std::string> patch_file;
};

/**
 * @brief In-memory patch index backed by patch_index.json
 *
 * Records are kept in insertion order (oldest first). next_patch_number
 * only grows, so numbers are never reused while the index lives.
 * Not thread safe; PatchManager serializes access per session.
 */
class PatchIndex {
public:
    /**
     * @brief Construct an index
     * @param index_file Path of patch_index.json, or std::nullopt without a session
     */
    explicit PatchIndex(std::optional<std::string> index_file = std::nullopt);

    void setIndexFile(std::optional<std::string> index_file);
    const std::optional<std::string>& indexFile() const { return m_index_file; }

    /**
     * @brief Load the index from disk
     *
     * A missing file, unreadable file or invalid content yields a fresh
     * empty index. Never throws.
     */
    void load();

    /**
     * @brief Validate and persist the index (temp file then rename)
     * @return False if the index is invalid or cannot be written; true
     *         without a session
     */
    bool save() const;

    /**
     * @brief Append a record
     *
     * The counter is not touched; callers follow up with incrementNumber().
     *
     * @return False if the record is invalid or its number is already used
     */
    bool add(const PatchMetadata& metadata);

    bool remove(int patch_number);
    size_t removeMany(const std::set<int>& patch_numbers);
    std::vector<PatchMetadata> removeLast(size_t count);
    std::vector<PatchMetadata> removeFirst(size_t count);

    /**
     * @brief Update fields of an existing record
     * @return False if the record is missing or the update would make it invalid
     */
    bool update(int patch_number, const PatchMetadataUpdate& fields);

    std::optional<PatchMetadata> get(int patch_number) const;

    /// Last count records, chronological
    std::vector<PatchMetadata> last(size_t count) const;

    /**
     * @brief Records with timestamp >= since_ms, chronological
     *
     * Records whose timestamp cannot be parsed are skipped with a warning.
     */
    std::vector<PatchMetadata> since(int64_t since_ms) const;

    std::vector<PatchMetadata> all() const { return m_index.patches; }

    /**
     * @brief Records most recent first
     * @param limit Maximum number of records, 0 for all
     */
    std::vector<PatchMetadata> history(size_t limit = 0) const;

    int nextNumber() const { return m_index.next_patch_number; }
    int incrementNumber();
    size_t count() const { return m_index.patches.size(); }
    std::map<std::string, size_t> operationCounts() const;

    /// Reset to next_patch_number = 1 and no records
    void clear();

    const PatchIndexData& data() const { return m_index; }

    /// Replace the in-memory state, e.g. to roll back after a failed save
    void restore(PatchIndexData data) { m_index = std::move(data); }

private:
    std::optional<std::string> m_index_file;
    PatchIndexData m_index;
    IndexValidator m_validator;

    void reset();
};

} // namespace Rewind
