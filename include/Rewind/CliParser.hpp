// =================================================================
// include/Rewind/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Rewind {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string session_id;     // Empty means no active session
    std::string config_path;
    std::string sessions_root;  // Overrides the configured sessions_root
    bool verbose = false;

    // Options for 'write', 'replace', 'line-edit' and 'delete'
    std::string file_path;
    std::string content;
    std::string content_file;
    std::string old_text;
    std::string new_text;
    bool replace_all = false;
    size_t start_line = 0;
    size_t end_line = 0;

    // Options for 'undo'
    int undo_count = 1;
    int patch_number = 0;
    std::string since;
    bool preview = false;

    // Options for 'history' and 'files'
    size_t limit = 0;

    // Options for 'cleanup-session'
    std::string target_session;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupGlobalOptions(CLI::App& app);
    void setupWriteCommand(CLI::App& app);
    void setupReplaceCommand(CLI::App& app);
    void setupLineEditCommand(CLI::App& app);
    void setupDeleteCommand(CLI::App& app);
    void setupUndoCommand(CLI::App& app);
    void setupHistoryCommand(CLI::App& app);
    void setupFilesCommand(CLI::App& app);
    void setupMaintenanceCommands(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Rewind
