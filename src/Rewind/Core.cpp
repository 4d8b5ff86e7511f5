// =================================================================
// src/Rewind/Core.cpp
// =================================================================
// Implementation for the command-line application logic.

#include "Rewind/Core.hpp"
#include "Rewind/FileEditor.hpp"
#include "Rewind/FileIO.hpp"
#include "Rewind/Logger.hpp"
#include "Rewind/PatchManager.hpp"
#include <iostream>
#include <optional>

namespace Rewind {

static void printPreviews(const std::optional<std::vector<UndoPreview>>& previews) {
    if (!previews) {
        std::cout << "Nothing to preview." << std::endl;
        return;
    }
    
    DiffCodec codec;
    for (const auto& preview : *previews) {
        std::cout << "Patch #" << preview.patch_number << " (" << preview.operation_type << ", "
                  << preview.timestamp << ") " << preview.file_path << std::endl;
        std::cout << codec.buildDiff(preview.current_content, preview.predicted_content, preview.file_path);
        std::cout << std::endl;
    }
}

static int printUndoResult(const UndoResult& result) {
    if (result.reverted_files.empty() && result.failed_operations.empty()) {
        std::cout << "Nothing to undo." << std::endl;
        return 0;
    }
    
    for (const auto& file : result.reverted_files) {
        std::cout << "Reverted: " << file << std::endl;
    }
    for (const auto& failure : result.failed_operations) {
        std::cerr << "Failed: " << failure << std::endl;
    }
    return result.success ? 0 : 1;
}

static int printEditResult(const EditResult& result) {
    if (!result.success) {
        std::cerr << "[ERROR] " << result.message << std::endl;
        return 1;
    }
    
    std::cout << result.message;
    if (result.patch_number) {
        std::cout << " (patch #" << *result.patch_number << ")";
    }
    std::cout << std::endl;
    return 0;
}

Core::Core(const Commands& commands) 
    : m_commands(commands)
{
    m_config.loadFromFile(m_commands.config_path);
    m_config.applyCommandOverrides(m_commands);
    
    Logger& logger = Logger::getInstance();
    logger.initialize(m_config.log_dir);
    logger.setConsoleLogLevel(Logger::parseLevel(m_config.console_level, LogLevel::WARNING));
    logger.setConsoleLogging(m_config.console_enabled);
    
    m_config_valid = m_config.validate();
    if (!m_config_valid) {
        return;
    }
    
    std::string session_id = m_commands.session_id;
    m_patches = std::make_unique<PatchManager>(m_config, [session_id]() -> std::optional<std::string> {
        if (session_id.empty()) {
            return std::nullopt;
        }
        return session_id;
    });
    m_patches->initialize();
    m_editor = std::make_unique<FileEditor>(m_patches.get());
}

Core::~Core() {
    if (m_patches) {
        m_patches->waitForBackgroundTasks();
    }
    Logger::getInstance().flush();
}

int Core::run() {
    if (!m_config_valid) {
        std::cerr << "Invalid configuration in " << m_commands.config_path << std::endl;
        return 1;
    }
    
    if (m_commands.active_command == "write") {
        return handleWrite();
    } else if (m_commands.active_command == "replace") {
        return handleReplace();
    } else if (m_commands.active_command == "line-edit") {
        return handleLineEdit();
    } else if (m_commands.active_command == "delete") {
        return handleDelete();
    } else if (m_commands.active_command == "undo") {
        return handleUndo();
    } else if (m_commands.active_command == "history") {
        return handleHistory();
    } else if (m_commands.active_command == "files") {
        return handleFiles();
    } else if (m_commands.active_command == "stats") {
        return handleStats();
    } else if (m_commands.active_command == "clear") {
        return handleClear();
    } else if (m_commands.active_command == "validate") {
        return handleValidate();
    } else if (m_commands.active_command == "cleanup-session") {
        return handleCleanupSession();
    }
    
    std::cerr << "Unknown command: " << m_commands.active_command << std::endl;
    return 1;
}

bool Core::requireSession() const {
    if (m_patches->currentSession()) {
        return true;
    }
    std::cerr << "No active session. Pass --session or set REWIND_SESSION." << std::endl;
    return false;
}

int Core::handleWrite() {
    std::string content = m_commands.content;
    if (!m_commands.content_file.empty()) {
        auto loaded = FileIO::readFile(m_commands.content_file);
        if (!loaded) {
            std::cerr << "[ERROR] Cannot read " << m_commands.content_file << std::endl;
            return 1;
        }
        content = *loaded;
    }
    return printEditResult(m_editor->writeFile(m_commands.file_path, content));
}

int Core::handleReplace() {
    return printEditResult(m_editor->replaceText(m_commands.file_path, m_commands.old_text,
                                                 m_commands.new_text, m_commands.replace_all));
}

int Core::handleLineEdit() {
    return printEditResult(m_editor->editLines(m_commands.file_path, m_commands.start_line,
                                               m_commands.end_line, m_commands.content));
}

int Core::handleDelete() {
    return printEditResult(m_editor->deleteFile(m_commands.file_path));
}

int Core::handleUndo() {
    if (!requireSession()) {
        return 1;
    }
    
    if (m_commands.preview) {
        if (m_commands.patch_number > 0) {
            printPreviews(m_patches->previewSingle(m_commands.patch_number));
        } else if (!m_commands.since.empty()) {
            printPreviews(m_patches->previewSince(m_commands.since));
        } else {
            printPreviews(m_patches->previewLast(m_commands.undo_count));
        }
        return 0;
    }
    
    if (m_commands.patch_number > 0) {
        return printUndoResult(m_patches->undoSingle(m_commands.patch_number));
    } else if (!m_commands.since.empty()) {
        return printUndoResult(m_patches->undoSince(m_commands.since));
    }
    return printUndoResult(m_patches->undoLast(m_commands.undo_count));
}

int Core::handleHistory() {
    if (!requireSession()) {
        return 1;
    }
    
    auto patches = m_patches->history(m_commands.limit);
    if (patches.empty()) {
        std::cout << "No recorded operations." << std::endl;
        return 0;
    }
    for (const auto& patch : patches) {
        std::cout << "#" << patch.patch_number << "  " << patch.timestamp << "  "
                  << patch.operation_type << "  " << patch.file_path << std::endl;
    }
    return 0;
}

int Core::handleFiles() {
    if (!requireSession()) {
        return 1;
    }
    
    auto entries = m_patches->recentFiles(m_commands.limit > 0 ? m_commands.limit : 10);
    if (entries.empty()) {
        std::cout << "No recorded operations." << std::endl;
        return 0;
    }
    for (const auto& entry : entries) {
        std::cout << "#" << entry.patch_number << "  " << entry.operation_type << "  "
                  << entry.file_path << "  +" << entry.stats.additions
                  << " -" << entry.stats.deletions << std::endl;
    }
    return 0;
}

int Core::handleStats() {
    if (!requireSession()) {
        return 1;
    }
    
    PatchStats stats = m_patches->stats();
    std::cout << "Session:            " << stats.session_id << std::endl;
    std::cout << "Patches directory:  " << stats.patches_directory << std::endl;
    std::cout << "Total patches:      " << stats.total_patches << std::endl;
    std::cout << "Total size (bytes): " << stats.total_size_bytes << std::endl;
    std::cout << "Next patch number:  " << stats.next_patch_number << std::endl;
    for (const auto& [operation, count] : stats.operation_counts) {
        std::cout << "  " << operation << ": " << count << std::endl;
    }
    return 0;
}

int Core::handleClear() {
    if (!requireSession()) {
        return 1;
    }
    
    ClearResult result = m_patches->clearAll();
    std::cout << result.message << std::endl;
    return result.success ? 0 : 1;
}

int Core::handleValidate() {
    if (!requireSession()) {
        return 1;
    }
    
    IntegrityReport report = m_patches->validateIntegrity();
    std::cout << "Corrupted index entries: " << report.corrupted_count << std::endl;
    std::cout << "Orphaned patch files:    " << report.orphaned_count << std::endl;
    std::cout << "Stale temporary files:   " << report.stale_temp_files_removed << std::endl;
    if (!report.quarantine_manifest.empty()) {
        std::cout << "Quarantine manifest:     " << report.quarantine_manifest << std::endl;
    }
    if (!report.orphan_directory.empty()) {
        std::cout << "Orphan directory:        " << report.orphan_directory << std::endl;
    }
    return report.failed_files.empty() ? 0 : 1;
}

int Core::handleCleanupSession() {
    if (m_patches->cleanupSession(m_commands.target_session)) {
        std::cout << "Removed undo history of session " << m_commands.target_session << std::endl;
        return 0;
    }
    std::cerr << "Failed to remove undo history of session " << m_commands.target_session << std::endl;
    return 1;
}

} // namespace Rewind
