// =================================================================
// include/Rewind/RetentionPolicy.hpp
// =================================================================
// Caps the number, total size and age of stored patches by evicting
// the oldest patches first.

#pragma once

#include <cstdint>
#include <cstddef>

namespace Rewind {

class PatchIndex;
class PatchFileStore;

/**
 * @brief Limits enforced after every capture
 */
struct RetentionLimits {
    size_t max_patches = 100;                          ///< Maximum patches per session
    uintmax_t max_total_size_bytes = 10 * 1024 * 1024; ///< Maximum size of all patch files
    unsigned int max_age_days = 0;                     ///< 0 disables the age limit
};

/**
 * @brief Oldest-first eviction of patches
 *
 * Eviction order is ascending patch number. A patch whose file cannot be
 * deleted stays in the index; one whose file is already gone is dropped.
 */
class RetentionPolicy {
public:
    explicit RetentionPolicy(const RetentionLimits& limits = RetentionLimits());

    /**
     * @brief Apply the age, count and size limits in that order
     * @return Total number of evicted patches
     */
    size_t enforce(PatchIndex& index, const PatchFileStore& store) const;

    size_t enforceCount(PatchIndex& index, const PatchFileStore& store) const;
    size_t enforceSize(PatchIndex& index, const PatchFileStore& store) const;

    /**
     * @brief Evict patches captured before now - max_age_days
     * @param now_ms Reference time in milliseconds since the epoch
     */
    size_t enforceAge(PatchIndex& index, const PatchFileStore& store, int64_t now_ms) const;

    /**
     * @brief Delete every patch file and reset the index
     * @return Number of patch files deleted
     */
    size_t clearAll(PatchIndex& index, const PatchFileStore& store) const;

    void updateLimits(const RetentionLimits& limits) { m_limits = limits; }
    const RetentionLimits& limits() const { return m_limits; }

private:
    RetentionLimits m_limits;
};

} // namespace Rewind
