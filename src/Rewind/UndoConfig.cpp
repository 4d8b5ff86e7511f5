// =================================================================
// src/Rewind/UndoConfig.cpp
// =================================================================
// Implementation for configuration loading.

#include "Rewind/UndoConfig.hpp"
#include "Rewind/CliParser.hpp"
#include "Rewind/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace Rewind {

namespace {

template<typename T>
void readValue(const YAML::Node& node, const std::string& key, T& target) {
    if (!node || !node[key]) {
        return;
    }
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        LOG_WARNING("UndoConfig", "Invalid " + key + " value, using default: " + std::string(e.what()));
    }
}

} // anonymous namespace

bool UndoConfig::loadFromFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        LOG_DEBUG("UndoConfig", "No configuration file at " + config_path + ", using defaults");
        return false;
    }
    
    try {
        YAML::Node root = YAML::LoadFile(config_path);
        
        readValue(root, "sessions_root", sessions_root);
        readValue(root, "patch_number_padding", patch_number_padding);
        
        if (root["retention"]) {
            YAML::Node retention = root["retention"];
            readValue(retention, "max_patches_per_session", max_patches_per_session);
            readValue(retention, "max_total_size_bytes", max_total_size_bytes);
            readValue(retention, "max_patch_age_days", max_patch_age_days);
        }
        
        if (root["logging"]) {
            YAML::Node logging = root["logging"];
            readValue(logging, "log_dir", log_dir);
            readValue(logging, "console_level", console_level);
            readValue(logging, "console_enabled", console_enabled);
        }
        
    } catch (const YAML::Exception& e) {
        LOG_ERROR("UndoConfig", "Failed to parse configuration file " + config_path + ": " + std::string(e.what()));
        return false;
    }
    
    LOG_DEBUG("UndoConfig", "Loaded configuration from " + config_path);
    return true;
}

void UndoConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.sessions_root.empty()) {
        sessions_root = commands.sessions_root;
    }
    if (commands.verbose) {
        console_level = "debug";
    }
}

bool UndoConfig::validate() const {
    bool valid = true;
    
    if (sessions_root.empty()) {
        LOG_ERROR("UndoConfig", "sessions_root cannot be empty");
        valid = false;
    }
    
    if (patch_number_padding <= 0) {
        LOG_ERROR("UndoConfig", "patch_number_padding must be greater than 0");
        valid = false;
    }
    
    if (max_patches_per_session == 0) {
        LOG_ERROR("UndoConfig", "retention.max_patches_per_session must be greater than 0");
        valid = false;
    }
    
    if (max_total_size_bytes == 0) {
        LOG_ERROR("UndoConfig", "retention.max_total_size_bytes must be greater than 0");
        valid = false;
    }
    
    return valid;
}

RetentionLimits UndoConfig::retentionLimits() const {
    RetentionLimits limits;
    limits.max_patches = max_patches_per_session;
    limits.max_total_size_bytes = max_total_size_bytes;
    limits.max_age_days = max_patch_age_days;
    return limits;
}

std::string UndoConfig::defaultConfigPath() {
    return ".rewind/config.yml";
}

} // namespace Rewind
