// =================================================================
// src/Rewind/PatchManager.cpp
// =================================================================
// Implementation for patch capture, undo and integrity management.

#include "Rewind/PatchManager.hpp"
#include "Rewind/FileIO.hpp"
#include "Rewind/Logger.hpp"
#include "Rewind/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <set>
#include <system_error>
#include <utility>

namespace Rewind {

namespace fs = std::filesystem;

namespace {

const std::string PATCHES_DIR = "patches";
const std::string INDEX_FILE = "patch_index.json";
const std::string QUARANTINE_DIR = ".quarantine";

int64_t nowMillis() {
    return toEpochMillis(std::chrono::system_clock::now());
}

} // anonymous namespace

PatchManager::PatchManager(const UndoConfig& config, SessionProvider session_provider)
    : m_config(config),
      m_session_provider(std::move(session_provider)),
      m_store(std::nullopt, config.patch_number_padding),
      m_retention(config.retentionLimits()) {
}

PatchManager::~PatchManager() {
    m_queue.shutdown();
}

template<typename T, typename F>
T PatchManager::runForSession(const std::string& operation, T fallback, F&& body) {
    auto session = currentSession();
    if (!session) {
        LOG_DEBUG("PatchManager", "No active session, skipping " + operation);
        return fallback;
    }
    
    const std::string key = *session;
    try {
        return m_queue.runSync(key, [&]() -> T {
            std::lock_guard<std::recursive_mutex> lock(m_state_mutex);
            if (m_loaded_session != key) {
                LOG_WARNING("PatchManager", "Session " + key + " is no longer active, skipping " + operation);
                return fallback;
            }
            return body(key);
        });
    } catch (const std::exception& e) {
        LOG_ERROR("PatchManager", "Failed to " + operation + ": " + std::string(e.what()));
        return fallback;
    }
}

void PatchManager::initialize() {
    onSessionChange();
}

void PatchManager::onSessionChange() {
    std::optional<std::string> session;
    try {
        session = m_session_provider ? m_session_provider() : std::nullopt;
    } catch (const std::exception& e) {
        LOG_ERROR("PatchManager", "Session provider failed: " + std::string(e.what()));
        session.reset();
    }
    
    if (session && (session->empty() || !isValidSessionId(*session))) {
        LOG_ERROR("PatchManager", "Ignoring invalid session id: " + *session);
        session.reset();
    }
    
    if (!session) {
        {
            std::lock_guard<std::mutex> lock(m_session_mutex);
            m_session_id.reset();
        }
        std::lock_guard<std::recursive_mutex> lock(m_state_mutex);
        m_loaded_session.reset();
        m_store.setDirectory(std::nullopt);
        m_index.setIndexFile(std::nullopt);
        m_index.load();
        LOG_DEBUG("PatchManager", "No active session; undo history disabled");
        return;
    }
    
    const std::string key = *session;
    auto publish = [this, &session]() {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        m_session_id = session;
    };
    auto load = [this, key]() {
        std::lock_guard<std::recursive_mutex> lock(m_state_mutex);
        std::string directory = patchesDirectoryFor(key);
        m_store.setDirectory(directory);
        m_index.setIndexFile((fs::path(directory) / INDEX_FILE).string());
        m_index.load();
        m_loaded_session = key;
        LOG_INFO("PatchManager", "Session " + key + " active with " +
                 std::to_string(m_index.count()) + " patches");
        validateIntegrityLocked(key);
    };
    
    try {
        if (m_queue.isWorkerFor(key)) {
            publish();
            load();
            return;
        }
        // The load is queued before the id is published, so every operation
        // that observes the new id runs after it
        auto loaded = m_queue.enqueue(key, load);
        publish();
        loaded.get();
    } catch (const std::exception& e) {
        LOG_ERROR("PatchManager", "Failed to switch to session " + key + ": " + std::string(e.what()));
    }
}

std::optional<std::string> PatchManager::currentSession() const {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    return m_session_id;
}

std::optional<std::string> PatchManager::patchesDirectory() const {
    auto session = currentSession();
    if (!session) {
        return std::nullopt;
    }
    return patchesDirectoryFor(*session);
}

std::string PatchManager::quarantineDirectory() const {
    return (fs::path(m_config.sessions_root) / QUARANTINE_DIR).string();
}

std::string PatchManager::patchesDirectoryFor(const std::string& session_id) const {
    return (fs::path(m_config.sessions_root) / session_id / PATCHES_DIR).string();
}

std::optional<int> PatchManager::captureOperation(const std::string& operation_type,
                                                  const std::string& file_path,
                                                  const std::string& original_content,
                                                  const std::optional<std::string>& new_content) {
    return runForSession("capture " + operation_type + " of " + file_path, std::optional<int>(),
        [&](const std::string& key) -> std::optional<int> {
            std::string absolute_path = canonicalPath(file_path);
            std::string target = (operation_type == "delete" || !new_content) ? std::string() : *new_content;
            
            std::string diff = m_codec.buildDiff(original_content, target, absolute_path);
            std::string timestamp = currentTimestamp();
            std::string document = DiffCodec::wrap(operation_type, absolute_path, timestamp, diff);
            
            int patch_number = m_index.nextNumber();
            auto patch_file = m_store.write(patch_number, document);
            if (!patch_file) {
                LOG_ERROR("PatchManager", "Failed to write patch " + std::to_string(patch_number) +
                          " for " + absolute_path);
                return std::nullopt;
            }
            
            PatchMetadata metadata;
            metadata.patch_number = patch_number;
            metadata.timestamp = timestamp;
            metadata.operation_type = operation_type;
            metadata.file_path = absolute_path;
            metadata.patch_file = *patch_file;
            
            if (!m_index.add(metadata)) {
                if (!m_store.remove(*patch_file)) {
                    LOG_WARNING("PatchManager", "Could not delete rejected patch file " + *patch_file);
                }
                return std::nullopt;
            }
            m_index.incrementNumber();
            
            if (!m_index.save()) {
                // Keep memory consistent with disk; the number stays consumed
                m_index.remove(patch_number);
                if (!m_store.remove(*patch_file)) {
                    LOG_WARNING("PatchManager", "Could not delete unindexed patch file " + *patch_file);
                }
                LOG_ERROR("PatchManager", "Failed to persist index for patch " + std::to_string(patch_number));
                return std::nullopt;
            }
            
            Logger::getInstance().logCapture(operation_type, absolute_path, patch_number);
            scheduleRetention(key);
            return patch_number;
        });
}

void PatchManager::scheduleRetention(const std::string& session_id) {
    try {
        // Runs after the current task; completion is observed through waitForBackgroundTasks()
        m_queue.enqueue(session_id, [this, session_id]() {
            try {
                std::lock_guard<std::recursive_mutex> lock(m_state_mutex);
                if (m_loaded_session == session_id) {
                    m_retention.enforce(m_index, m_store);
                }
            } catch (const std::exception& e) {
                LOG_WARNING("PatchManager", "Retention enforcement failed: " + std::string(e.what()));
            }
        });
    } catch (const std::exception& e) {
        LOG_WARNING("PatchManager", "Could not schedule retention enforcement: " + std::string(e.what()));
    }
}

size_t PatchManager::enforceRetention() {
    return runForSession("enforce retention", size_t(0), [&](const std::string&) {
        return m_retention.enforce(m_index, m_store);
    });
}

void PatchManager::waitForBackgroundTasks() {
    m_queue.waitForAll();
}

// ----------------------------------------------------------------
// Undo
// ----------------------------------------------------------------

UndoResult PatchManager::undoLast(int count) {
    std::string request = "last " + std::to_string(count);
    if (count <= 0) {
        UndoResult result;
        result.failed_operations.push_back("Invalid undo count: " + std::to_string(count));
        return finalizeResult(result, request);
    }
    
    return runForSession("undo " + request, UndoResult(), [&](const std::string&) {
        auto patches = m_index.last(static_cast<size_t>(count));
        if (patches.empty()) {
            LOG_INFO("PatchManager", "No patches to undo");
            return finalizeResult(UndoResult(), request);
        }
        if (patches.size() < static_cast<size_t>(count)) {
            LOG_INFO("PatchManager", "Requested " + std::to_string(count) + " undos but only " +
                     std::to_string(patches.size()) + " patches are available");
        }
        return undoPatches(patches, request);
    });
}

UndoResult PatchManager::undoSingle(int patch_number) {
    std::string request = "patch " + std::to_string(patch_number);
    if (patch_number <= 0) {
        UndoResult result;
        result.failed_operations.push_back("Invalid patch number: " + std::to_string(patch_number));
        return finalizeResult(result, request);
    }
    
    return runForSession("undo " + request, UndoResult(), [&](const std::string&) {
        auto patch = m_index.get(patch_number);
        if (!patch) {
            UndoResult result;
            result.failed_operations.push_back("Patch " + std::to_string(patch_number) + " not found");
            return finalizeResult(result, request);
        }
        return undoPatches({*patch}, request);
    });
}

UndoResult PatchManager::undoSince(const std::string& timestamp) {
    std::string request = "since " + timestamp;
    auto since_ms = parseTimestamp(timestamp);
    if (!since_ms) {
        UndoResult result;
        result.failed_operations.push_back("Invalid timestamp: " + timestamp);
        return finalizeResult(result, request);
    }
    
    return runForSession("undo " + request, UndoResult(), [&](const std::string&) {
        auto patches = m_index.since(*since_ms);
        if (patches.empty()) {
            LOG_INFO("PatchManager", "No patches since " + timestamp);
            return finalizeResult(UndoResult(), request);
        }
        return undoPatches(patches, request);
    });
}

UndoResult PatchManager::undoPatches(const std::vector<PatchMetadata>& patches, const std::string& request) {
    UndoResult result;
    std::set<int> reverted;
    
    // Most recent first, the inverse of capture order
    for (auto it = patches.rbegin(); it != patches.rend(); ++it) {
        std::string error;
        if (!reverseApplyLocked(*it, error)) {
            result.failed_operations.push_back("Patch " + std::to_string(it->patch_number) +
                                               " (" + it->file_path + "): " + error);
            break;
        }
        result.reverted_files.push_back(it->file_path);
        reverted.insert(it->patch_number);
    }
    
    if (!result.failed_operations.empty()) {
        if (!result.reverted_files.empty()) {
            LOG_WARNING("PatchManager", std::to_string(result.reverted_files.size()) +
                        " files were reverted before the failure; their patches stay in the index");
        }
        return finalizeResult(result, request);
    }
    
    // Index first: a crash before the file deletions leaves orphans, which
    // the next integrity pass quarantines
    PatchIndexData before = m_index.data();
    m_index.removeMany(reverted);
    if (!m_index.save()) {
        // Patch documents stay on disk so memory and disk keep agreeing
        m_index.restore(before);
        LOG_CRITICAL("PatchManager", "Files were reverted but the index could not be saved");
        result.failed_operations.push_back("Index could not be saved; " +
                                           std::to_string(reverted.size()) +
                                           " reverted patches remain recorded");
        return finalizeResult(result, request);
    }
    for (const auto& patch : patches) {
        if (!m_store.remove(patch.patch_file)) {
            LOG_WARNING("PatchManager", "Could not delete patch file " + patch.patch_file);
        }
    }
    
    result.success = true;
    return finalizeResult(result, request);
}

UndoResult PatchManager::finalizeResult(UndoResult result, const std::string& request) const {
    ValidationResult validation = m_validator.validateUndoResult(result);
    if (!validation.valid) {
        LOG_ERROR("PatchManager", "Inconsistent undo result for " + request + ": " + validation.errors.front());
        result.success = !result.reverted_files.empty() && result.failed_operations.empty();
    }
    Logger::getInstance().logUndoResult(request, result);
    return result;
}

bool PatchManager::reverseApply(const PatchMetadata& metadata, std::string* error) {
    std::string reason = "No active session";
    bool applied = runForSession("reverse-apply patch " + std::to_string(metadata.patch_number), false,
        [&](const std::string&) {
            return reverseApplyLocked(metadata, reason);
        });
    if (!applied && error) {
        *error = reason;
    }
    return applied;
}

bool PatchManager::reverseApplyLocked(const PatchMetadata& metadata, std::string& error) {
    auto document = m_store.read(metadata.patch_file);
    if (!document) {
        error = "Patch file not found: " + metadata.patch_file;
        return false;
    }
    
    auto diff = DiffCodec::unwrap(*document);
    if (!diff) {
        error = "Patch file has no diff content: " + metadata.patch_file;
        return false;
    }
    
    bool existed = FileIO::fileExists(metadata.file_path);
    std::string current;
    if (existed) {
        auto content = FileIO::readFile(metadata.file_path);
        if (!content) {
            error = "Cannot read " + metadata.file_path;
            return false;
        }
        current = *content;
    }
    
    PatchResult patched = m_applier.apply(*diff, current, true);
    if (!patched.success) {
        error = patched.error;
        return false;
    }
    
    // An empty deleted file is restored as an empty file
    bool recreate = !existed && metadata.operation_type == "delete";
    if (!patched.content.empty() || recreate) {
        std::string parent = fs::path(metadata.file_path).parent_path().string();
        if (!parent.empty() && !FileIO::createDirectories(parent)) {
            error = "Cannot create directory " + parent;
            return false;
        }
        if (!FileIO::writeFileAtomic(metadata.file_path, patched.content)) {
            error = "Cannot write " + metadata.file_path;
            return false;
        }
    } else if (existed) {
        // Reverting a creation
        std::error_code ec;
        fs::remove(metadata.file_path, ec);
        if (ec) {
            error = "Cannot delete " + metadata.file_path + ": " + ec.message();
            return false;
        }
    }
    
    LOG_DEBUG("PatchManager", "Reverted patch " + std::to_string(metadata.patch_number) +
              " on " + metadata.file_path);
    return true;
}

// ----------------------------------------------------------------
// Preview
// ----------------------------------------------------------------

std::optional<std::vector<UndoPreview>> PatchManager::previewLast(int count) {
    if (count <= 0) {
        LOG_WARNING("PatchManager", "Invalid preview count: " + std::to_string(count));
        return std::nullopt;
    }
    return runForSession("preview last " + std::to_string(count), std::optional<std::vector<UndoPreview>>(),
        [&](const std::string&) {
            return previewPatches(m_index.last(static_cast<size_t>(count)));
        });
}

std::optional<std::vector<UndoPreview>> PatchManager::previewSingle(int patch_number) {
    return runForSession("preview patch " + std::to_string(patch_number), std::optional<std::vector<UndoPreview>>(),
        [&](const std::string&) -> std::optional<std::vector<UndoPreview>> {
            auto patch = m_index.get(patch_number);
            if (!patch) {
                return std::nullopt;
            }
            return previewPatches({*patch});
        });
}

std::optional<std::vector<UndoPreview>> PatchManager::previewSince(const std::string& timestamp) {
    auto since_ms = parseTimestamp(timestamp);
    if (!since_ms) {
        LOG_WARNING("PatchManager", "Invalid timestamp for preview: " + timestamp);
        return std::nullopt;
    }
    return runForSession("preview since " + timestamp, std::optional<std::vector<UndoPreview>>(),
        [&](const std::string&) {
            return previewPatches(m_index.since(*since_ms));
        });
}

std::optional<std::vector<UndoPreview>> PatchManager::previewPatches(const std::vector<PatchMetadata>& patches) {
    if (patches.empty()) {
        return std::nullopt;
    }
    
    std::vector<UndoPreview> previews;
    // Simulated content per file, so older patches see the effect of newer ones
    std::map<std::string, std::string> simulated;
    
    for (auto it = patches.rbegin(); it != patches.rend(); ++it) {
        auto document = m_store.read(it->patch_file);
        if (!document) {
            continue;
        }
        auto diff = DiffCodec::unwrap(*document);
        if (!diff) {
            continue;
        }
        
        std::string current;
        auto known = simulated.find(it->file_path);
        if (known != simulated.end()) {
            current = known->second;
        } else if (FileIO::fileExists(it->file_path)) {
            auto content = FileIO::readFile(it->file_path);
            if (!content) {
                continue;
            }
            current = *content;
        }
        
        auto predicted = m_applier.simulate(*diff, current, true);
        if (!predicted) {
            LOG_DEBUG("PatchManager", "Patch " + std::to_string(it->patch_number) +
                      " does not apply to the current content of " + it->file_path);
            continue;
        }
        
        UndoPreview preview;
        preview.operation_type = it->operation_type;
        preview.file_path = it->file_path;
        preview.patch_number = it->patch_number;
        preview.timestamp = it->timestamp;
        preview.current_content = current;
        preview.predicted_content = *predicted;
        previews.push_back(std::move(preview));
        
        simulated[it->file_path] = *predicted;
    }
    
    if (previews.empty()) {
        return std::nullopt;
    }
    return previews;
}

// ----------------------------------------------------------------
// Reporting
// ----------------------------------------------------------------

PatchStats PatchManager::stats() {
    PatchStats empty;
    return runForSession("collect stats", empty, [&](const std::string& key) {
        PatchStats stats;
        stats.session_id = key;
        stats.patches_directory = m_store.directory().value_or("");
        stats.total_patches = m_index.count();
        stats.operation_counts = m_index.operationCounts();
        stats.total_size_bytes = m_store.totalSize();
        stats.next_patch_number = m_index.nextNumber();
        return stats;
    });
}

std::vector<PatchMetadata> PatchManager::history(size_t limit) {
    return runForSession("read history", std::vector<PatchMetadata>(), [&](const std::string&) {
        return m_index.history(limit);
    });
}

std::vector<UndoFileEntry> PatchManager::recentFiles(size_t limit) {
    return runForSession("list recent files", std::vector<UndoFileEntry>(), [&](const std::string&) {
        std::vector<UndoFileEntry> entries;
        for (const auto& patch : m_index.history(limit)) {
            auto document = m_store.read(patch.patch_file);
            if (!document) {
                continue;
            }
            auto diff = DiffCodec::unwrap(*document);
            
            UndoFileEntry entry;
            entry.patch_number = patch.patch_number;
            entry.file_path = patch.file_path;
            entry.operation_type = patch.operation_type;
            entry.timestamp = patch.timestamp;
            entry.stats = DiffCodec::stats(diff.value_or(""));
            entries.push_back(std::move(entry));
        }
        return entries;
    });
}

ClearResult PatchManager::clearAll() {
    ClearResult no_session;
    no_session.message = "No active session";
    return runForSession("clear patch history", no_session, [&](const std::string& key) {
        ClearResult result;
        result.removed_count = m_retention.clearAll(m_index, m_store);
        result.success = true;
        result.message = "Cleared " + std::to_string(result.removed_count) + " patches from session " + key;
        return result;
    });
}

bool PatchManager::cleanupSession(const std::string& session_id) {
    if (session_id.empty() || !isValidSessionId(session_id)) {
        LOG_WARNING("PatchManager", "Refusing to clean up invalid session id: " + session_id);
        return false;
    }
    
    try {
        bool removed = m_queue.runSync(session_id, [this, session_id]() {
            std::lock_guard<std::recursive_mutex> lock(m_state_mutex);
            std::string directory = patchesDirectoryFor(session_id);
            
            std::error_code ec;
            fs::remove_all(directory, ec);
            if (ec) {
                LOG_WARNING("PatchManager", "Failed to clean up patches for session " + session_id +
                            ": " + ec.message());
                return false;
            }
            if (m_loaded_session == session_id) {
                m_index.clear();
            }
            
            LOG_INFO("PatchManager", "Cleaned up patches for session " + session_id);
            return true;
        });
        if (currentSession() != session_id) {
            m_queue.retire(session_id);
        }
        return removed;
    } catch (const std::exception& e) {
        LOG_WARNING("PatchManager", "Failed to clean up session " + session_id + ": " + std::string(e.what()));
        return false;
    }
}

// ----------------------------------------------------------------
// Integrity
// ----------------------------------------------------------------

IntegrityReport PatchManager::validateIntegrity() {
    return runForSession("validate integrity", IntegrityReport(), [&](const std::string& key) {
        return validateIntegrityLocked(key);
    });
}

IntegrityReport PatchManager::validateIntegrityLocked(const std::string& session_id) {
    IntegrityReport report;
    const auto& directory = m_store.directory();
    if (!directory) {
        return report;
    }
    
    try {
        std::error_code ec;
        if (fs::is_directory(*directory, ec)) {
            for (const auto& entry : fs::directory_iterator(*directory)) {
                std::string name = entry.path().filename().string();
                if (FileIO::isTemporaryName(name) && FileIO::removeFile(entry.path().string())) {
                    report.stale_temp_files_removed++;
                }
            }
        }
        
        // Index entries whose patch file is gone
        std::vector<PatchMetadata> corrupted;
        for (const auto& patch : m_index.all()) {
            if (!m_store.exists(patch.patch_file)) {
                corrupted.push_back(patch);
            }
        }
        
        if (!corrupted.empty()) {
            report.corrupted_count = corrupted.size();
            std::set<int> numbers;
            for (const auto& patch : corrupted) {
                numbers.insert(patch.patch_number);
            }
            m_index.removeMany(numbers);
            if (!m_index.save()) {
                LOG_ERROR("PatchManager", "Failed to save index after removing corrupted entries");
            }
            
            nlohmann::json manifest = {
                {"reason", "missing_patch_file"},
                {"session_id", session_id},
                {"timestamp", currentTimestamp()},
                {"patches", corrupted}
            };
            std::string manifest_path = (fs::path(quarantineDirectory()) /
                ("patches_" + session_id + "_" + std::to_string(nowMillis()) + ".json")).string();
            if (FileIO::createDirectories(quarantineDirectory()) &&
                FileIO::writeFileAtomic(manifest_path, manifest.dump(2))) {
                report.quarantine_manifest = manifest_path;
            } else {
                LOG_ERROR("PatchManager", "Failed to write quarantine manifest " + manifest_path);
            }
        }
        
        // Patch files that no index entry refers to
        std::set<std::string> indexed;
        for (const auto& patch : m_index.all()) {
            indexed.insert(patch.patch_file);
        }
        std::vector<std::string> orphans;
        for (const auto& name : m_store.listPatchFiles()) {
            if (indexed.count(name) == 0) {
                orphans.push_back(name);
            }
        }
        
        if (!orphans.empty()) {
            report.orphaned_count = orphans.size();
            fs::path orphan_dir = fs::path(quarantineDirectory()) /
                ("orphaned_" + session_id + "_" + std::to_string(nowMillis()));
            
            if (!FileIO::createDirectories(orphan_dir.string())) {
                report.failed_files = orphans;
            } else {
                report.orphan_directory = orphan_dir.string();
                for (const auto& name : orphans) {
                    fs::path source = fs::path(*directory) / name;
                    fs::path destination = orphan_dir / name;
                    
                    std::error_code move_ec;
                    fs::rename(source, destination, move_ec);
                    if (move_ec) {
                        // e.g. a quarantine directory on another device
                        std::error_code copy_ec;
                        fs::copy_file(source, destination, fs::copy_options::overwrite_existing, copy_ec);
                        if (!copy_ec) {
                            fs::remove(source, copy_ec);
                        }
                        if (copy_ec) {
                            LOG_ERROR("PatchManager", "Failed to quarantine orphaned patch " + name +
                                      ": " + copy_ec.message());
                            report.failed_files.push_back(name);
                            continue;
                        }
                    }
                    report.quarantined_files.push_back(name);
                }
                
                nlohmann::json manifest = {
                    {"reason", "orphaned_files_not_in_index"},
                    {"session_id", session_id},
                    {"timestamp", currentTimestamp()},
                    {"files", report.quarantined_files},
                    {"failed", report.failed_files}
                };
                if (!FileIO::writeFileAtomic((orphan_dir / "MANIFEST.json").string(), manifest.dump(2))) {
                    LOG_ERROR("PatchManager", "Failed to write orphan manifest in " + orphan_dir.string());
                }
            }
        }
        
    } catch (const std::exception& e) {
        LOG_ERROR("PatchManager", "Integrity validation failed for session " + session_id +
                  ": " + std::string(e.what()));
    }
    
    Logger::getInstance().logIntegrityReport(session_id, report);
    return report;
}

// ----------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------

bool PatchManager::isValidSessionId(const std::string& session_id) {
    if (session_id == "." || session_id == ".." || session_id == QUARANTINE_DIR) {
        return false;
    }
    return session_id.find('/') == std::string::npos && session_id.find('\\') == std::string::npos;
}

std::string PatchManager::canonicalPath(const std::string& file_path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(file_path, ec);
    if (ec) {
        return fs::path(file_path).lexically_normal().string();
    }
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal().string();
    }
    return canonical.string();
}

} // namespace Rewind
