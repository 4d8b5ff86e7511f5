// =================================================================
// src/Rewind/RetentionPolicy.cpp
// =================================================================
// Implementation for patch retention enforcement.

#include "Rewind/RetentionPolicy.hpp"
#include "Rewind/Logger.hpp"
#include "Rewind/PatchFileStore.hpp"
#include "Rewind/PatchIndex.hpp"
#include "Rewind/Timestamp.hpp"
#include <algorithm>
#include <chrono>
#include <vector>

namespace Rewind {

namespace {

std::vector<PatchMetadata> oldestFirst(const PatchIndex& index) {
    std::vector<PatchMetadata> patches = index.all();
    std::sort(patches.begin(), patches.end(),
              [](const PatchMetadata& a, const PatchMetadata& b) { return a.patch_number < b.patch_number; });
    return patches;
}

// Delete the file and drop the record; keeps the record if the file survives
bool evict(PatchIndex& index, const PatchFileStore& store, const PatchMetadata& patch) {
    if (!store.remove(patch.patch_file) && store.exists(patch.patch_file)) {
        LOG_WARNING("RetentionPolicy", "Could not delete " + patch.patch_file + ", keeping patch " +
                    std::to_string(patch.patch_number));
        return false;
    }
    return index.remove(patch.patch_number);
}

void persist(const PatchIndex& index, const std::string& reason, size_t removed) {
    if (removed == 0) {
        return;
    }
    if (!index.save()) {
        LOG_ERROR("RetentionPolicy", "Failed to save index after " + reason + " cleanup");
    }
    Logger::getInstance().logRetention(reason, removed);
}

} // anonymous namespace

RetentionPolicy::RetentionPolicy(const RetentionLimits& limits)
    : m_limits(limits) {
}

size_t RetentionPolicy::enforce(PatchIndex& index, const PatchFileStore& store) const {
    if (!store.directory()) {
        return 0;
    }
    
    auto now_ms = toEpochMillis(std::chrono::system_clock::now());
    size_t removed = enforceAge(index, store, now_ms);
    removed += enforceCount(index, store);
    removed += enforceSize(index, store);
    
    if (removed > 0) {
        LOG_INFO("RetentionPolicy", "Automatic cleanup removed " + std::to_string(removed) + " patches total");
    }
    return removed;
}

size_t RetentionPolicy::enforceCount(PatchIndex& index, const PatchFileStore& store) const {
    if (index.count() <= m_limits.max_patches) {
        return 0;
    }
    
    size_t removed = 0;
    for (const auto& patch : oldestFirst(index)) {
        if (index.count() <= m_limits.max_patches) {
            break;
        }
        if (evict(index, store, patch)) {
            removed++;
        }
    }
    
    persist(index, "count", removed);
    return removed;
}

size_t RetentionPolicy::enforceSize(PatchIndex& index, const PatchFileStore& store) const {
    uintmax_t total_size = store.totalSize();
    if (total_size <= m_limits.max_total_size_bytes) {
        return 0;
    }
    
    LOG_INFO("RetentionPolicy", "Patches directory size (" + std::to_string(total_size) +
             " bytes) exceeds limit (" + std::to_string(m_limits.max_total_size_bytes) + " bytes)");
    
    size_t removed = 0;
    for (const auto& patch : oldestFirst(index)) {
        if (total_size <= m_limits.max_total_size_bytes) {
            break;
        }
        uintmax_t file_size = store.sizeOf(patch.patch_file);
        if (evict(index, store, patch)) {
            total_size -= std::min(total_size, file_size);
            removed++;
        }
    }
    
    persist(index, "size", removed);
    return removed;
}

size_t RetentionPolicy::enforceAge(PatchIndex& index, const PatchFileStore& store, int64_t now_ms) const {
    if (m_limits.max_age_days == 0) {
        return 0;
    }
    
    int64_t cutoff = now_ms - static_cast<int64_t>(m_limits.max_age_days) * 24 * 60 * 60 * 1000;
    size_t removed = 0;
    for (const auto& patch : oldestFirst(index)) {
        auto patch_time = parseTimestamp(patch.timestamp);
        if (!patch_time) {
            LOG_WARNING("RetentionPolicy", "Failed to parse timestamp for patch " +
                        std::to_string(patch.patch_number) + ": " + patch.timestamp);
            continue;
        }
        if (*patch_time < cutoff && evict(index, store, patch)) {
            removed++;
        }
    }
    
    persist(index, "age", removed);
    return removed;
}

size_t RetentionPolicy::clearAll(PatchIndex& index, const PatchFileStore& store) const {
    size_t removed = 0;
    for (const auto& patch : index.all()) {
        if (store.remove(patch.patch_file)) {
            removed++;
        }
    }
    
    index.clear();
    if (!index.save()) {
        LOG_ERROR("RetentionPolicy", "Failed to save cleared index");
    }
    
    LOG_INFO("RetentionPolicy", "Cleared patch history: removed " + std::to_string(removed) + " patch files");
    return removed;
}

} // namespace Rewind
