// =================================================================
// src/Rewind/FileEditor.cpp
// =================================================================
// Implementation for the recorded file-mutating tool.

#include "Rewind/FileEditor.hpp"
#include "Rewind/DiffCodec.hpp"
#include "Rewind/FileIO.hpp"
#include "Rewind/Logger.hpp"
#include <filesystem>
#include <system_error>
#include <vector>

namespace Rewind {

FileEditor::FileEditor(OperationRecorder* recorder)
    : m_recorder(recorder) {
}

EditResult FileEditor::writeFile(const std::string& file_path, const std::string& content) {
    EditResult result;
    
    std::string original;
    if (FileIO::fileExists(file_path)) {
        auto existing = FileIO::readFile(file_path);
        if (!existing) {
            result.message = "Cannot read " + file_path;
            return result;
        }
        original = *existing;
    }
    
    std::string parent = std::filesystem::path(file_path).parent_path().string();
    if (!parent.empty() && !FileIO::createDirectories(parent)) {
        result.message = "Cannot create directory " + parent;
        return result;
    }
    if (!FileIO::writeFileAtomic(file_path, content)) {
        result.message = "Cannot write " + file_path;
        return result;
    }
    
    result.success = true;
    result.message = "Wrote " + std::to_string(content.size()) + " bytes to " + file_path;
    result.patch_number = record("write", file_path, original, content);
    return result;
}

EditResult FileEditor::replaceText(const std::string& file_path,
                                   const std::string& old_text,
                                   const std::string& new_text,
                                   bool replace_all) {
    EditResult result;
    
    if (old_text.empty()) {
        result.message = "Text to replace cannot be empty";
        return result;
    }
    
    auto original = FileIO::readFile(file_path);
    if (!original) {
        result.message = "Cannot read " + file_path;
        return result;
    }
    
    size_t occurrences = 0;
    for (size_t pos = original->find(old_text); pos != std::string::npos;
         pos = original->find(old_text, pos + old_text.size())) {
        occurrences++;
    }
    if (occurrences == 0) {
        result.message = "Text not found in " + file_path;
        return result;
    }
    if (occurrences > 1 && !replace_all) {
        result.message = "Text occurs " + std::to_string(occurrences) + " times in " + file_path +
                         "; use replace-all or a longer snippet";
        return result;
    }
    
    std::string updated;
    size_t cursor = 0;
    for (size_t pos = original->find(old_text); pos != std::string::npos;
         pos = original->find(old_text, cursor)) {
        updated.append(*original, cursor, pos - cursor);
        updated += new_text;
        cursor = pos + old_text.size();
    }
    updated.append(*original, cursor, std::string::npos);
    
    if (!FileIO::writeFileAtomic(file_path, updated)) {
        result.message = "Cannot write " + file_path;
        return result;
    }
    
    result.success = true;
    result.message = "Replaced " + std::to_string(occurrences) + " occurrence(s) in " + file_path;
    result.patch_number = record("edit", file_path, *original, updated);
    return result;
}

EditResult FileEditor::editLines(const std::string& file_path,
                                 size_t start_line,
                                 size_t end_line,
                                 const std::string& replacement) {
    EditResult result;
    
    auto original = FileIO::readFile(file_path);
    if (!original) {
        result.message = "Cannot read " + file_path;
        return result;
    }
    
    std::vector<std::string> lines = DiffCodec::splitLines(*original);
    if (start_line == 0 || end_line < start_line || end_line > lines.size()) {
        result.message = "Invalid line range " + std::to_string(start_line) + "-" +
                         std::to_string(end_line) + " for a file with " +
                         std::to_string(lines.size()) + " lines";
        return result;
    }
    
    std::string updated;
    for (size_t i = 0; i < start_line - 1; ++i) {
        updated += lines[i];
    }
    updated += replacement;
    // Keep the line structure of the replaced range
    if (!replacement.empty() && replacement.back() != '\n' && lines[end_line - 1].back() == '\n') {
        updated += '\n';
    }
    for (size_t i = end_line; i < lines.size(); ++i) {
        updated += lines[i];
    }
    
    if (!FileIO::writeFileAtomic(file_path, updated)) {
        result.message = "Cannot write " + file_path;
        return result;
    }
    
    result.success = true;
    result.message = "Replaced lines " + std::to_string(start_line) + "-" + std::to_string(end_line) +
                     " in " + file_path;
    result.patch_number = record("line-edit", file_path, *original, updated);
    return result;
}

EditResult FileEditor::deleteFile(const std::string& file_path) {
    EditResult result;
    
    auto original = FileIO::readFile(file_path);
    if (!original || !FileIO::fileExists(file_path)) {
        result.message = "Cannot read " + file_path;
        return result;
    }
    
    std::error_code ec;
    std::filesystem::remove(file_path, ec);
    if (ec) {
        result.message = "Cannot delete " + file_path + ": " + ec.message();
        return result;
    }
    
    result.success = true;
    result.message = "Deleted " + file_path;
    result.patch_number = record("delete", file_path, *original, std::nullopt);
    return result;
}

std::optional<int> FileEditor::record(const std::string& operation_type,
                                      const std::string& file_path,
                                      const std::string& original_content,
                                      const std::optional<std::string>& new_content) {
    if (!m_recorder) {
        return std::nullopt;
    }
    
    auto patch_number = m_recorder->captureOperation(operation_type, file_path, original_content, new_content);
    if (!patch_number) {
        LOG_WARNING("FileEditor", "Operation on " + file_path + " was applied but not captured for undo");
    }
    return patch_number;
}

} // namespace Rewind
