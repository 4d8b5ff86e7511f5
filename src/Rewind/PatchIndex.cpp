// =================================================================
// src/Rewind/PatchIndex.cpp
// =================================================================
// Implementation for the patch index.

#include "Rewind/PatchIndex.hpp"
#include "Rewind/FileIO.hpp"
#include "Rewind/Logger.hpp"
#include "Rewind/Timestamp.hpp"
#include <algorithm>
#include <filesystem>
#include <utility>

namespace Rewind {

PatchIndex::PatchIndex(std::optional<std::string> index_file)
    : m_index_file(std::move(index_file)) {
}

void PatchIndex::setIndexFile(std::optional<std::string> index_file) {
    m_index_file = std::move(index_file);
}

void PatchIndex::reset() {
    m_index = PatchIndexData{};
}

void PatchIndex::load() {
    reset();
    if (!m_index_file) {
        return;
    }
    if (!FileIO::fileExists(*m_index_file)) {
        // Nothing captured yet in this session
        return;
    }
    
    auto content = FileIO::readFile(*m_index_file);
    if (!content) {
        LOG_ERROR("PatchIndex", "Failed to read patch index: " + *m_index_file);
        return;
    }
    
    try {
        nlohmann::json j = nlohmann::json::parse(*content);
        ValidationResult validation = m_validator.validateIndexJson(j);
        if (!validation.valid) {
            LOG_WARNING("PatchIndex", "Invalid patch index structure, resetting: " + validation.errors.front());
            return;
        }
        m_index = j.get<PatchIndexData>();
        LOG_DEBUG("PatchIndex", "Loaded " + std::to_string(m_index.patches.size()) + " patches from index");
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING("PatchIndex", "Failed to parse patch index, resetting: " + std::string(e.what()));
        reset();
    }
}

bool PatchIndex::save() const {
    if (!m_index_file) {
        return true;
    }
    
    ValidationResult validation = m_validator.validateIndex(m_index);
    if (!validation.valid) {
        LOG_ERROR("PatchIndex", "Refusing to save invalid patch index: " + validation.errors.front());
        return false;
    }
    
    std::string directory = std::filesystem::path(*m_index_file).parent_path().string();
    if (!directory.empty() && !FileIO::createDirectories(directory)) {
        return false;
    }
    
    nlohmann::json j = m_index;
    if (!FileIO::writeFileAtomic(*m_index_file, j.dump(2))) {
        LOG_ERROR("PatchIndex", "Failed to save patch index: " + *m_index_file);
        return false;
    }
    
    LOG_DEBUG("PatchIndex", "Patch index saved");
    return true;
}

bool PatchIndex::add(const PatchMetadata& metadata) {
    ValidationResult validation = m_validator.validateMetadata(metadata);
    if (!validation.valid) {
        LOG_ERROR("PatchIndex", "Rejected patch metadata: " + validation.errors.front());
        return false;
    }
    if (get(metadata.patch_number)) {
        LOG_ERROR("PatchIndex", "Patch number already in index: " + std::to_string(metadata.patch_number));
        return false;
    }
    
    m_index.patches.push_back(metadata);
    return true;
}

bool PatchIndex::remove(int patch_number) {
    auto& patches = m_index.patches;
    size_t initial = patches.size();
    patches.erase(std::remove_if(patches.begin(), patches.end(),
                                 [patch_number](const PatchMetadata& p) { return p.patch_number == patch_number; }),
                  patches.end());
    return patches.size() < initial;
}

size_t PatchIndex::removeMany(const std::set<int>& patch_numbers) {
    auto& patches = m_index.patches;
    size_t initial = patches.size();
    patches.erase(std::remove_if(patches.begin(), patches.end(),
                                 [&patch_numbers](const PatchMetadata& p) {
                                     return patch_numbers.count(p.patch_number) > 0;
                                 }),
                  patches.end());
    return initial - patches.size();
}

std::vector<PatchMetadata> PatchIndex::removeLast(size_t count) {
    auto& patches = m_index.patches;
    count = std::min(count, patches.size());
    std::vector<PatchMetadata> removed(patches.end() - count, patches.end());
    patches.erase(patches.end() - count, patches.end());
    return removed;
}

std::vector<PatchMetadata> PatchIndex::removeFirst(size_t count) {
    auto& patches = m_index.patches;
    count = std::min(count, patches.size());
    std::vector<PatchMetadata> removed(patches.begin(), patches.begin() + count);
    patches.erase(patches.begin(), patches.begin() + count);
    return removed;
}

bool PatchIndex::update(int patch_number, const PatchMetadataUpdate& fields) {
    auto it = std::find_if(m_index.patches.begin(), m_index.patches.end(),
                           [patch_number](const PatchMetadata& p) { return p.patch_number == patch_number; });
    if (it == m_index.patches.end()) {
        return false;
    }
    
    PatchMetadata updated = *it;
    if (fields.timestamp) updated.timestamp = *fields.timestamp;
    if (fields.operation_type) updated.operation_type = *fields.operation_type;
    if (fields.file_path) updated.file_path = *fields.file_path;
    if (fields.patch_file) updated.patch_file = *fields.patch_file;
    
    ValidationResult validation = m_validator.validateMetadata(updated);
    if (!validation.valid) {
        LOG_WARNING("PatchIndex", "Rejected update of patch " + std::to_string(patch_number) +
                    ": " + validation.errors.front());
        return false;
    }
    
    *it = std::move(updated);
    return true;
}

std::optional<PatchMetadata> PatchIndex::get(int patch_number) const {
    for (const auto& patch : m_index.patches) {
        if (patch.patch_number == patch_number) {
            return patch;
        }
    }
    return std::nullopt;
}

std::vector<PatchMetadata> PatchIndex::last(size_t count) const {
    const auto& patches = m_index.patches;
    count = std::min(count, patches.size());
    return std::vector<PatchMetadata>(patches.end() - count, patches.end());
}

std::vector<PatchMetadata> PatchIndex::since(int64_t since_ms) const {
    std::vector<PatchMetadata> result;
    for (const auto& patch : m_index.patches) {
        auto patch_time = parseTimestamp(patch.timestamp);
        if (!patch_time) {
            LOG_WARNING("PatchIndex", "Failed to parse timestamp for patch " +
                        std::to_string(patch.patch_number) + ": " + patch.timestamp);
            continue;
        }
        if (*patch_time >= since_ms) {
            result.push_back(patch);
        }
    }
    return result;
}

std::vector<PatchMetadata> PatchIndex::history(size_t limit) const {
    std::vector<PatchMetadata> result(m_index.patches.rbegin(), m_index.patches.rend());
    if (limit > 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

int PatchIndex::incrementNumber() {
    m_index.next_patch_number += 1;
    return m_index.next_patch_number;
}

std::map<std::string, size_t> PatchIndex::operationCounts() const {
    std::map<std::string, size_t> counts;
    for (const auto& patch : m_index.patches) {
        counts[patch.operation_type]++;
    }
    return counts;
}

void PatchIndex::clear() {
    reset();
}

} // namespace Rewind
