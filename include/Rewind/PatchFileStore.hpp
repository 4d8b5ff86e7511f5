// =================================================================
// include/Rewind/PatchFileStore.hpp
// =================================================================
// Durable storage of numbered patch documents in a session directory.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Rewind {

/**
 * @brief File I/O for patch documents
 *
 * Without a directory (no active session) every read-side call returns an
 * empty result and writes are no-ops returning std::nullopt.
 */
class PatchFileStore {
public:
    /**
     * @brief Construct a store
     * @param directory Patches directory, or std::nullopt without a session
     * @param padding Width of the zero-padded patch number in file names
     */
    explicit PatchFileStore(std::optional<std::string> directory = std::nullopt, int padding = 3);

    void setDirectory(std::optional<std::string> directory);
    const std::optional<std::string>& directory() const { return m_directory; }

    /**
     * @brief Create the directory recursively; idempotent
     * @return False if there is no directory or it cannot be created
     */
    bool ensureDirectory() const;

    /**
     * @brief File name for a patch number, e.g. "patch_007.diff"
     */
    std::string filenameFor(int patch_number) const;

    /**
     * @brief Full path of a patch file, or std::nullopt without a session
     */
    std::optional<std::string> pathFor(const std::string& name) const;

    /**
     * @brief Write a patch document (temp file then rename)
     * @return File name written, or std::nullopt on failure or without a session
     */
    std::optional<std::string> write(int patch_number, const std::string& content) const;

    std::optional<std::string> read(const std::string& name) const;
    bool remove(const std::string& name) const;
    bool exists(const std::string& name) const;

    /**
     * @brief Sum of the sizes of all patch_*.diff files
     */
    uintmax_t totalSize() const;

    /**
     * @brief Size of one patch file, 0 if missing
     */
    uintmax_t sizeOf(const std::string& name) const;

    /**
     * @brief Names of all files following the patch naming convention, sorted
     */
    std::vector<std::string> listPatchFiles() const;

    static bool isPatchFileName(const std::string& name);

private:
    std::optional<std::string> m_directory;
    int m_padding;
};

} // namespace Rewind
