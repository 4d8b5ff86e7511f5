// =================================================================
// include/Rewind/PatchApplier.hpp
// =================================================================
// Applies unified diffs to in-memory content, forward or in reverse.

#pragma once

#include <optional>
#include <string>

namespace Rewind {

/**
 * @brief Result of applying a diff
 */
struct PatchResult {
    bool success = false;
    std::string content;   ///< Patched content when success is true
    std::string error;     ///< Description of the failure otherwise
};

/**
 * @brief Hunk-by-hunk unified diff application
 *
 * Each hunk is located near its recorded position; the search tolerates
 * line offsets introduced by earlier hunks but never fuzzes context.
 * Zero-context diffs (diff -U0) are accepted. A diff made of a single
 * "@@ -0,0 ..." hunk is read as the creation of the whole file and only
 * applies to empty content.
 */
class PatchApplier {
public:
    /**
     * @brief Apply a diff to content
     * @param diff_text Unified diff
     * @param content Content to patch
     * @param reverse Swap added and removed lines (undo the diff)
     * @return Patched content, or an error if a hunk does not match
     */
    PatchResult apply(const std::string& diff_text, const std::string& content, bool reverse = false) const;

    /**
     * @brief Same as apply() but reports failure as std::nullopt
     *
     * Used by preview paths. Never throws.
     */
    std::optional<std::string> simulate(const std::string& diff_text,
                                        const std::string& content,
                                        bool reverse = false) const noexcept;
};

} // namespace Rewind
