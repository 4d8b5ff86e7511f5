// =================================================================
// include/Rewind/FileIO.hpp
// =================================================================
// Defines the file-level primitives shared by the patch storage and
// the file-mutating tools: whole-file reads and atomic writes.

#pragma once

#include <optional>
#include <string>

namespace Rewind {

class FileIO {
public:
    /**
     * @brief Reads the entire content of a file in binary mode.
     * @param file_path The path to the file.
     * @return The content, or std::nullopt if the file cannot be read.
     */
    static std::optional<std::string> readFile(const std::string& file_path);

    /**
     * @brief Writes content through a sibling temporary file that is then
     *        renamed over the target.
     *
     * The target either keeps its old content or receives the new content
     * in full. The temporary file is removed on failure.
     *
     * @return True on success, false on failure.
     */
    static bool writeFileAtomic(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a regular file exists.
     */
    static bool fileExists(const std::string& file_path);

    /**
     * @brief Creates a directory and its parents; succeeds if it already exists.
     */
    static bool createDirectories(const std::string& dir_path);

    /**
     * @brief Removes a file; a missing file counts as removed.
     */
    static bool removeFile(const std::string& file_path);

    /**
     * @brief Tells whether a file name was produced by writeFileAtomic()
     *        for an interrupted write ("<name>.tmp.<suffix>").
     */
    static bool isTemporaryName(const std::string& file_name);
};

} // namespace Rewind
