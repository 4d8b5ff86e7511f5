// =================================================================
// include/Rewind/FileEditor.hpp
// =================================================================
// File-mutating tool whose operations are recorded for undo.

#pragma once

#include "Rewind/OperationRecorder.hpp"
#include <optional>
#include <string>

namespace Rewind {

/**
 * @brief Outcome of a file edit
 */
struct EditResult {
    bool success = false;
    std::string message;
    std::optional<int> patch_number;   ///< Set when the edit was captured
};

/**
 * @brief Writes, edits and deletes files, then reports each change
 *
 * The change is applied first and recorded afterwards; a failed capture is
 * logged and never rolls the change back.
 */
class FileEditor {
public:
    /**
     * @param recorder Receiver of the operations; nullptr disables capture
     */
    explicit FileEditor(OperationRecorder* recorder = nullptr);

    /**
     * @brief Create or overwrite a file ("write")
     */
    EditResult writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Replace text inside a file ("edit")
     * @param replace_all Replace every occurrence; otherwise old_text must be unique
     */
    EditResult replaceText(const std::string& file_path,
                           const std::string& old_text,
                           const std::string& new_text,
                           bool replace_all = false);

    /**
     * @brief Replace lines [start_line, end_line] (1-based, inclusive) ("line-edit")
     * @param replacement New text for the range; an empty string removes the lines
     */
    EditResult editLines(const std::string& file_path,
                         size_t start_line,
                         size_t end_line,
                         const std::string& replacement);

    /**
     * @brief Delete a file ("delete")
     */
    EditResult deleteFile(const std::string& file_path);

private:
    OperationRecorder* m_recorder;

    std::optional<int> record(const std::string& operation_type,
                              const std::string& file_path,
                              const std::string& original_content,
                              const std::optional<std::string>& new_content);
};

} // namespace Rewind
