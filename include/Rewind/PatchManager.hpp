// =================================================================
// include/Rewind/PatchManager.hpp
// =================================================================
// Orchestrates patch capture, undo, preview and integrity checks for
// the active session.

#pragma once

#include "Rewind/DiffCodec.hpp"
#include "Rewind/IndexValidator.hpp"
#include "Rewind/OperationRecorder.hpp"
#include "Rewind/PatchApplier.hpp"
#include "Rewind/PatchFileStore.hpp"
#include "Rewind/PatchIndex.hpp"
#include "Rewind/PatchTypes.hpp"
#include "Rewind/RetentionPolicy.hpp"
#include "Rewind/SessionTaskQueue.hpp"
#include "Rewind/UndoConfig.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Rewind {

/**
 * @brief Undo history of the active session
 *
 * Without an active session every operation is a no-op returning an
 * empty result. Operations on a session are serialized through a
 * SessionTaskQueue keyed by the session id, so concurrent callers never
 * interleave the load/modify/save cycle of the index. No exception
 * escapes the public methods.
 *
 * Storage layout under sessions_root:
 *   <session>/patches/patch_index.json
 *   <session>/patches/patch_NNN.diff
 *   .quarantine/patches_<session>_<ms>.json
 *   .quarantine/orphaned_<session>_<ms>/MANIFEST.json
 */
class PatchManager : public OperationRecorder {
public:
    using SessionProvider = std::function<std::optional<std::string>()>;

    /**
     * @brief Construct a manager
     * @param config Storage and retention settings
     * @param session_provider Returns the active session id, or std::nullopt
     *
     * The manager starts in the no-session state; call initialize().
     */
    PatchManager(const UndoConfig& config, SessionProvider session_provider);
    ~PatchManager() override;

    PatchManager(const PatchManager&) = delete;
    PatchManager& operator=(const PatchManager&) = delete;

    /// Equivalent to onSessionChange()
    void initialize();

    /**
     * @brief Re-read the active session from the provider
     *
     * Points storage at the new session's directory, reloads its index and
     * runs validateIntegrity(). The directory itself is created lazily by
     * the first capture.
     */
    void onSessionChange();

    std::optional<std::string> currentSession() const;
    std::optional<std::string> patchesDirectory() const;
    std::string quarantineDirectory() const;

    /**
     * @brief Store a reversible patch for an operation already applied
     *
     * Retention is enforced afterwards as a background task; see
     * waitForBackgroundTasks().
     *
     * @return Patch number, or std::nullopt without a session or on I/O failure
     */
    std::optional<int> captureOperation(const std::string& operation_type,
                                        const std::string& file_path,
                                        const std::string& original_content,
                                        const std::optional<std::string>& new_content) override;

    /**
     * @brief Revert the last count patches, most recent first
     *
     * All-or-nothing on the index: entries are removed only when every
     * revert succeeds. Reverting stops at the first failure; files already
     * reverted by then stay reverted.
     */
    UndoResult undoLast(int count = 1);

    UndoResult undoSingle(int patch_number);

    /**
     * @brief Revert every patch captured at or after an ISO-8601 timestamp
     */
    UndoResult undoSince(const std::string& timestamp);

    /**
     * @name Side-effect-free previews
     * Return std::nullopt when there is nothing to preview or every
     * simulation fails. Patches touching the same file are simulated in
     * sequence, most recent first.
     * @{
     */
    std::optional<std::vector<UndoPreview>> previewLast(int count = 1);
    std::optional<std::vector<UndoPreview>> previewSingle(int patch_number);
    std::optional<std::vector<UndoPreview>> previewSince(const std::string& timestamp);
    /** @} */

    /**
     * @brief Revert one patch on disk without touching the index
     *
     * The file is rewritten atomically, or deleted when the reverted
     * content is empty and the file exists.
     *
     * @param metadata Patch to revert
     * @param error Receives the reason on failure
     * @return True if the file now holds the pre-operation content
     */
    bool reverseApply(const PatchMetadata& metadata, std::string* error = nullptr);

    PatchStats stats();

    /**
     * @brief Patch records, most recent first
     * @param limit Maximum number of records, 0 for all
     */
    std::vector<PatchMetadata> history(size_t limit = 0);

    /**
     * @brief Recent patches with their line statistics, most recent first
     *
     * Patches whose document cannot be read are skipped.
     */
    std::vector<UndoFileEntry> recentFiles(size_t limit = 10);

    /**
     * @brief Delete every patch of the session and reset numbering
     */
    ClearResult clearAll();

    /**
     * @brief Reconcile the index with the patch files on disk
     *
     * Index entries without a file are removed and recorded in a quarantine
     * manifest; patch files without an entry are moved to a quarantine
     * directory; stale temporary files are deleted.
     */
    IntegrityReport validateIntegrity();

    /**
     * @brief Apply the retention limits now
     * @return Number of evicted patches
     */
    size_t enforceRetention();

    /**
     * @brief Delete the patch directory of a session, best effort
     * @return True if the directory no longer exists
     */
    bool cleanupSession(const std::string& session_id);

    /**
     * @brief Block until every queued task, including retention
     *        scheduled by captures, has run
     */
    void waitForBackgroundTasks();

    const UndoConfig& config() const { return m_config; }

    /// Sessions that currently own a queue worker thread
    size_t sessionWorkerCount() const { return m_queue.workerCount(); }

private:
    UndoConfig m_config;
    SessionProvider m_session_provider;

    mutable std::mutex m_session_mutex;
    std::optional<std::string> m_session_id;

    // Guards everything below; recursive because runSync() runs inline
    // when called from the session's own worker
    std::recursive_mutex m_state_mutex;
    std::optional<std::string> m_loaded_session;
    PatchFileStore m_store;
    PatchIndex m_index;
    RetentionPolicy m_retention;
    DiffCodec m_codec;
    PatchApplier m_applier;
    IndexValidator m_validator;

    // Declared last so that workers are joined before the state above goes away
    SessionTaskQueue m_queue;

    template<typename T, typename F>
    T runForSession(const std::string& operation, T fallback, F&& body);

    std::string patchesDirectoryFor(const std::string& session_id) const;
    void scheduleRetention(const std::string& session_id);

    bool reverseApplyLocked(const PatchMetadata& metadata, std::string& error);
    UndoResult undoPatches(const std::vector<PatchMetadata>& patches, const std::string& request);
    UndoResult finalizeResult(UndoResult result, const std::string& request) const;
    std::optional<std::vector<UndoPreview>> previewPatches(const std::vector<PatchMetadata>& patches);
    IntegrityReport validateIntegrityLocked(const std::string& session_id);

    static bool isValidSessionId(const std::string& session_id);
    static std::string canonicalPath(const std::string& file_path);
};

} // namespace Rewind
