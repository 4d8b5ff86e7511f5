// =================================================================
// src/Rewind/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Rewind/CliParser.hpp"
#include "Rewind/UndoConfig.hpp"

namespace Rewind {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Rewind: reversible file operations with per-session undo history.");
    m_app->require_subcommand(1);
    
    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupGlobalOptions(*m_app);
    setupWriteCommand(*m_app);
    setupReplaceCommand(*m_app);
    setupLineEditCommand(*m_app);
    setupDeleteCommand(*m_app);
    setupUndoCommand(*m_app);
    setupHistoryCommand(*m_app);
    setupFilesCommand(*m_app);
    setupMaintenanceCommands(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupGlobalOptions(CLI::App& app) {
    m_commands.config_path = UndoConfig::defaultConfigPath();
    app.add_option("-s,--session", m_commands.session_id, "Session whose undo history is used.")
        ->envname("REWIND_SESSION");
    app.add_option("-c,--config", m_commands.config_path, "Path of the YAML configuration file.");
    app.add_option("--sessions-root", m_commands.sessions_root, "Directory holding the session patch stores.");
    app.add_flag("-v,--verbose", m_commands.verbose, "Print debug logging to the console.");
}

void CliParser::setupWriteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("write", "Creates or overwrites a file and records the change.");
    sub->add_option("file", m_commands.file_path, "The file to write.")->required();
    auto* content = sub->add_option("--content", m_commands.content, "The new content of the file.");
    sub->add_option("--from", m_commands.content_file, "Read the new content from this file.")
        ->check(CLI::ExistingFile)
        ->excludes(content);
}

void CliParser::setupReplaceCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("replace", "Replaces text in a file and records the change.");
    sub->add_option("file", m_commands.file_path, "The file to edit.")->required()->check(CLI::ExistingFile);
    sub->add_option("--old", m_commands.old_text, "The text to replace.")->required();
    sub->add_option("--new", m_commands.new_text, "The replacement text.")->required();
    sub->add_flag("--all", m_commands.replace_all, "Replace every occurrence.");
}

void CliParser::setupLineEditCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("line-edit", "Replaces a range of lines in a file and records the change.");
    sub->add_option("file", m_commands.file_path, "The file to edit.")->required()->check(CLI::ExistingFile);
    sub->add_option("--start", m_commands.start_line, "First line of the range (1-based).")->required();
    sub->add_option("--end", m_commands.end_line, "Last line of the range (inclusive).")->required();
    sub->add_option("--content", m_commands.content, "Replacement text; omit to delete the lines.");
}

void CliParser::setupDeleteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("delete", "Deletes a file and records the change.");
    sub->add_option("file", m_commands.file_path, "The file to delete.")->required()->check(CLI::ExistingFile);
}

void CliParser::setupUndoCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("undo", "Reverts recorded operations, most recent first.");
    auto* count = sub->add_option("count", m_commands.undo_count, "Number of operations to revert (default: 1).")
        ->check(CLI::PositiveNumber);
    auto* patch = sub->add_option("-p,--patch", m_commands.patch_number, "Revert only this patch number.")
        ->check(CLI::PositiveNumber)
        ->excludes(count);
    sub->add_option("--since", m_commands.since, "Revert every operation at or after this ISO-8601 timestamp.")
        ->excludes(count)
        ->excludes(patch);
    sub->add_flag("--preview", m_commands.preview, "Show the predicted result without changing anything.");
}

void CliParser::setupHistoryCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("history", "Lists recorded operations, most recent first.");
    sub->add_option("-n,--limit", m_commands.limit, "Maximum number of entries (default: all).");
}

void CliParser::setupFilesCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("files", "Lists recently changed files with line statistics.");
    sub->add_option("-n,--limit", m_commands.limit, "Maximum number of entries (default: 10).");
}

void CliParser::setupMaintenanceCommands(CLI::App& app) {
    app.add_subcommand("stats", "Shows statistics of the session's undo history.");
    app.add_subcommand("clear", "Deletes the session's undo history.");
    app.add_subcommand("validate", "Checks the undo history and quarantines inconsistent state.");
    
    auto* cleanup = app.add_subcommand("cleanup-session", "Deletes the undo history of another session.");
    cleanup->add_option("session", m_commands.target_session, "The session to clean up.")->required();
}

} // namespace Rewind
