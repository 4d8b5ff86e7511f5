// =================================================================
// include/Rewind/UndoConfig.hpp
// =================================================================
// Configuration of patch storage, retention and logging.

#pragma once

#include "Rewind/RetentionPolicy.hpp"
#include <string>

namespace Rewind {

struct Commands;

/**
 * @brief Settings read from .rewind/config.yml
 *
 * Every key is optional. Example:
 *
 *   sessions_root: .rewind/sessions
 *   patch_number_padding: 3
 *   retention:
 *     max_patches_per_session: 100
 *     max_total_size_bytes: 10485760
 *     max_patch_age_days: 0
 *   logging:
 *     log_dir: .rewind/logs
 *     console_level: warning
 *     console_enabled: true
 */
struct UndoConfig {
    // Storage settings
    std::string sessions_root = ".rewind/sessions";
    int patch_number_padding = 3;
    
    // Retention settings
    size_t max_patches_per_session = 100;
    uintmax_t max_total_size_bytes = 10 * 1024 * 1024; // 10MB
    unsigned int max_patch_age_days = 0;
    
    // Logging settings
    std::string log_dir = ".rewind/logs";
    std::string console_level = "warning";
    bool console_enabled = true;
    
    /**
     * @brief Load settings from a YAML file
     *
     * Keys that are missing keep their current value; keys with an invalid
     * value keep it too and produce a warning.
     *
     * @param config_path Path of the YAML file
     * @return False if the file is missing or is not valid YAML
     */
    bool loadFromFile(const std::string& config_path);
    
    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);
    
    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid
     */
    bool validate() const;
    
    RetentionLimits retentionLimits() const;
    
    static std::string defaultConfigPath();
};

} // namespace Rewind
