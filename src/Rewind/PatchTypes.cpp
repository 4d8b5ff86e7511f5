// =================================================================
// src/Rewind/PatchTypes.cpp
// =================================================================
// JSON conversions for the patch index.

#include "Rewind/PatchTypes.hpp"

namespace Rewind {

void to_json(nlohmann::json& j, const PatchMetadata& metadata) {
    j = nlohmann::json{
        {"patch_number", metadata.patch_number},
        {"timestamp", metadata.timestamp},
        {"operation_type", metadata.operation_type},
        {"file_path", metadata.file_path},
        {"patch_file", metadata.patch_file}
    };
}

void from_json(const nlohmann::json& j, PatchMetadata& metadata) {
    j.at("patch_number").get_to(metadata.patch_number);
    j.at("timestamp").get_to(metadata.timestamp);
    j.at("operation_type").get_to(metadata.operation_type);
    j.at("file_path").get_to(metadata.file_path);
    j.at("patch_file").get_to(metadata.patch_file);
}

void to_json(nlohmann::json& j, const PatchIndexData& index) {
    j = nlohmann::json{
        {"next_patch_number", index.next_patch_number},
        {"patches", index.patches}
    };
}

void from_json(const nlohmann::json& j, PatchIndexData& index) {
    j.at("next_patch_number").get_to(index.next_patch_number);
    index.patches = j.at("patches").get<std::vector<PatchMetadata>>();
}

} // namespace Rewind
