// =================================================================
// include/Rewind/DiffCodec.hpp
// =================================================================
// Builds, parses and wraps unified diffs for storable patch documents.

#pragma once

#include "Rewind/PatchTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Rewind {

enum class HunkLineType {
    CONTEXT,
    ADDED,
    REMOVED
};

/**
 * @brief One body line of a hunk
 *
 * text keeps its trailing newline; a line followed by the
 * "\ No newline at end of file" marker has none.
 */
struct HunkLine {
    HunkLineType type;
    std::string text;
};

struct DiffHunk {
    size_t old_start = 0;
    size_t old_count = 0;
    size_t new_start = 0;
    size_t new_count = 0;
    std::vector<HunkLine> lines;

    std::string header() const;
};

struct ParsedDiff {
    std::string old_file;
    std::string new_file;
    std::vector<DiffHunk> hunks;
};

/**
 * @brief Metadata header of a stored patch document
 */
struct PatchHeader {
    std::string operation_type;
    std::string file_path;
    std::string timestamp;
};

/**
 * @brief Unified diff encoding and decoding
 *
 * A patch document is a small "# Key: value" header, the DIFF_MARKER line,
 * then a standard unified diff body that `patch -R` can read.
 */
class DiffCodec {
public:
    /// Separator between the metadata header and the diff body
    static const std::string DIFF_MARKER;

    /**
     * @brief Construct a codec
     * @param context_lines Unchanged lines kept around each change (default: 3)
     */
    explicit DiffCodec(size_t context_lines = 3);

    /**
     * @brief Build a unified diff between two contents
     * @param original Content before the operation
     * @param updated Content after the operation (empty for a delete)
     * @param display_path Path shown in the ---/+++ headers (basename is used)
     * @return Diff text; only the two file headers when the contents are equal
     */
    std::string buildDiff(const std::string& original,
                          const std::string& updated,
                          const std::string& display_path) const;

    /**
     * @brief Prepend the metadata header to a diff
     */
    static std::string wrap(const std::string& operation_type,
                            const std::string& absolute_path,
                            const std::string& timestamp,
                            const std::string& diff_text);

    /**
     * @brief Recover the diff embedded in a patch document
     * @return The diff text, or std::nullopt when no diff marker is found
     */
    static std::optional<std::string> unwrap(const std::string& document_text);

    /**
     * @brief Read the metadata header of a patch document
     * @return Header fields, or std::nullopt if the document has no header
     */
    static std::optional<PatchHeader> readHeader(const std::string& document_text);

    /**
     * @brief Count added and removed lines; never fails
     */
    static DiffStats stats(const std::string& diff_text);

    /**
     * @brief Parse a single-file unified diff
     * @param diff_text Diff to parse
     * @param error Receives a description of the problem on failure
     * @return Parsed diff, or std::nullopt if the text is malformed
     */
    static std::optional<ParsedDiff> parse(const std::string& diff_text, std::string* error = nullptr);

    /**
     * @brief Split text into lines, each keeping its trailing newline
     */
    static std::vector<std::string> splitLines(const std::string& text);

private:
    size_t m_context_lines;
};

} // namespace Rewind
