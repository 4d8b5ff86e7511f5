// =================================================================
// src/Rewind/PatchFileStore.cpp
// =================================================================
// Implementation for patch document storage.

#include "Rewind/PatchFileStore.hpp"
#include "Rewind/FileIO.hpp"
#include "Rewind/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace Rewind {

namespace fs = std::filesystem;

static const std::string PATCH_PREFIX = "patch_";
static const std::string PATCH_SUFFIX = ".diff";

PatchFileStore::PatchFileStore(std::optional<std::string> directory, int padding)
    : m_directory(std::move(directory)), m_padding(padding > 0 ? padding : 3) {
}

void PatchFileStore::setDirectory(std::optional<std::string> directory) {
    m_directory = std::move(directory);
}

bool PatchFileStore::ensureDirectory() const {
    if (!m_directory) {
        return false;
    }
    if (!FileIO::createDirectories(*m_directory)) {
        return false;
    }
    LOG_DEBUG("PatchFileStore", "Patches directory ensured at: " + *m_directory);
    return true;
}

std::string PatchFileStore::filenameFor(int patch_number) const {
    std::ostringstream oss;
    oss << PATCH_PREFIX << std::setw(m_padding) << std::setfill('0') << patch_number << PATCH_SUFFIX;
    return oss.str();
}

std::optional<std::string> PatchFileStore::pathFor(const std::string& name) const {
    if (!m_directory) {
        return std::nullopt;
    }
    return (fs::path(*m_directory) / name).string();
}

std::optional<std::string> PatchFileStore::write(int patch_number, const std::string& content) const {
    if (!m_directory) {
        return std::nullopt;
    }
    if (!ensureDirectory()) {
        return std::nullopt;
    }
    
    std::string name = filenameFor(patch_number);
    std::string path = *pathFor(name);
    if (!FileIO::writeFileAtomic(path, content)) {
        LOG_ERROR("PatchFileStore", "Failed to write patch file " + path);
        return std::nullopt;
    }
    
    LOG_DEBUG("PatchFileStore", "Wrote patch file: " + path);
    return name;
}

std::optional<std::string> PatchFileStore::read(const std::string& name) const {
    auto path = pathFor(name);
    if (!path) {
        return std::nullopt;
    }
    if (!FileIO::fileExists(*path)) {
        LOG_ERROR("PatchFileStore", "Patch file not found: " + *path);
        return std::nullopt;
    }
    
    auto content = FileIO::readFile(*path);
    if (!content) {
        LOG_ERROR("PatchFileStore", "Failed to read patch file " + *path);
    }
    return content;
}

bool PatchFileStore::remove(const std::string& name) const {
    auto path = pathFor(name);
    if (!path) {
        return false;
    }
    
    std::error_code ec;
    bool removed = fs::remove(*path, ec);
    if (ec || !removed) {
        LOG_DEBUG("PatchFileStore", "Failed to delete patch file " + *path +
                  (ec ? ": " + ec.message() : ": not found"));
        return false;
    }
    
    LOG_DEBUG("PatchFileStore", "Deleted patch file: " + *path);
    return true;
}

bool PatchFileStore::exists(const std::string& name) const {
    auto path = pathFor(name);
    return path && FileIO::fileExists(*path);
}

uintmax_t PatchFileStore::totalSize() const {
    uintmax_t total = 0;
    for (const auto& name : listPatchFiles()) {
        total += sizeOf(name);
    }
    return total;
}

uintmax_t PatchFileStore::sizeOf(const std::string& name) const {
    auto path = pathFor(name);
    if (!path) {
        return 0;
    }
    std::error_code ec;
    uintmax_t size = fs::file_size(*path, ec);
    return ec ? 0 : size;
}

std::vector<std::string> PatchFileStore::listPatchFiles() const {
    std::vector<std::string> names;
    if (!m_directory) {
        return names;
    }
    
    std::error_code ec;
    if (!fs::is_directory(*m_directory, ec)) {
        return names;
    }
    
    try {
        for (const auto& entry : fs::directory_iterator(*m_directory)) {
            std::string name = entry.path().filename().string();
            if (isPatchFileName(name) && entry.is_regular_file(ec)) {
                names.push_back(name);
            }
        }
    } catch (const fs::filesystem_error& e) {
        LOG_WARNING("PatchFileStore", "Failed to list patches directory " + *m_directory + ": " + e.what());
    }
    
    std::sort(names.begin(), names.end());
    return names;
}

bool PatchFileStore::isPatchFileName(const std::string& name) {
    return name.size() > PATCH_PREFIX.size() + PATCH_SUFFIX.size() &&
           name.compare(0, PATCH_PREFIX.size(), PATCH_PREFIX) == 0 &&
           name.compare(name.size() - PATCH_SUFFIX.size(), PATCH_SUFFIX.size(), PATCH_SUFFIX) == 0;
}

} // namespace Rewind
