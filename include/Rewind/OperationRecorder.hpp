// =================================================================
// include/Rewind/OperationRecorder.hpp
// =================================================================
// Interface through which file-mutating tools report their operations.

#pragma once

#include <optional>
#include <string>

namespace Rewind {

/**
 * @brief Receiver of file operations that should become undoable
 *
 * Tools receive a recorder at construction and call it after they have
 * changed a file. A failed capture must never undo the change.
 */
class OperationRecorder {
public:
    virtual ~OperationRecorder() = default;

    /**
     * @brief Record an operation that was just applied to a file
     * @param operation_type write, edit, line_edit, delete, ...
     * @param file_path Affected file
     * @param original_content Content before the operation (empty for a new file)
     * @param new_content Content after the operation; std::nullopt for a delete
     * @return Patch number, or std::nullopt if nothing was captured
     */
    virtual std::optional<int> captureOperation(const std::string& operation_type,
                                                const std::string& file_path,
                                                const std::string& original_content,
                                                const std::optional<std::string>& new_content) = 0;
};

} // namespace Rewind
