// =================================================================
// include/Rewind/Core.hpp
// =================================================================
// Defines the command-line application orchestrator.

#pragma once

#include "Rewind/CliParser.hpp"
#include "Rewind/UndoConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Rewind {
    class PatchManager;
    class FileEditor;
}

namespace Rewind {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleWrite();
    int handleReplace();
    int handleLineEdit();
    int handleDelete();
    int handleUndo();
    int handleHistory();
    int handleFiles();
    int handleStats();
    int handleClear();
    int handleValidate();
    int handleCleanupSession();

    bool requireSession() const;

    const Commands& m_commands;
    UndoConfig m_config;
    bool m_config_valid = true;
    std::unique_ptr<PatchManager> m_patches;
    std::unique_ptr<FileEditor> m_editor;
};

} // namespace Rewind
