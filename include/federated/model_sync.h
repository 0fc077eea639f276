/*
 * Model synchronization for federated learning nodes
 * Version tracking, conflict detection, bounded history and rollback
 */

#ifndef FEDCORE_MODEL_SYNC_H
#define FEDCORE_MODEL_SYNC_H

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "federated/model_protocol.h"

namespace fedcore {

enum class SyncStatus {
    PENDING,
    DISTRIBUTING,
    ACTIVE,
    DEPRECATED
};

std::string syncStatusToString(SyncStatus status);

enum class ConflictType {
    VERSION_MISMATCH,
    HASH_MISMATCH,
    ROUND_MISMATCH
};

enum class ConflictSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string conflictTypeToString(ConflictType type);
std::string conflictSeverityToString(ConflictSeverity severity);

struct ModelConflict {
    ConflictType type;
    ConflictSeverity severity;
    int64_t local_version = 0;
    int64_t global_version = 0;
    std::string description;
    double detected_at = 0.0;
};

enum class ResolutionStrategy {
    PREFER_GLOBAL,
    PREFER_LOCAL,
    MERGE
};

// "prefer_global", "prefer_local" or "merge"; throws std::invalid_argument otherwise
ResolutionStrategy parseResolutionStrategy(const std::string& name);

class UnsupportedResolutionError : public std::logic_error {
public:
    explicit UnsupportedResolutionError(const std::string& message)
        : std::logic_error(message) {}
};

struct ResolutionOutcome {
    bool resolved = false;
    ResolutionStrategy strategy = ResolutionStrategy::PREFER_GLOBAL;
    std::string kept;  // "global" or "local"
    size_t conflicts_resolved = 0;
};

struct ChainVerification {
    bool valid = true;
    std::vector<std::string> problems;
};

class ModelSynchronizer {
public:
    explicit ModelSynchronizer(std::string node_id, size_t max_history = 10);

    // Rejects invalid or stale (version <= current) models without touching state
    bool receiveGlobalModel(const GlobalModel& model, const std::string& source = "");
    bool setLocalModel(const GlobalModel& model);

    // Detected conflicts are also appended to the conflict log
    std::vector<ModelConflict> checkForConflicts(const GlobalModel& local, const GlobalModel& global);

    // Throws UnsupportedResolutionError for MERGE
    ResolutionOutcome resolveConflicts(const std::vector<ModelConflict>& conflicts,
                                       ResolutionStrategy strategy);

    // Restores an exact version from history; the current model moves into history
    bool rollback(int64_t version);

    void markDistributing();
    void markDeprecated();

    void updateNodeVersion(const std::string& node_id, int64_t version);
    std::map<std::string, int64_t> getNodeVersions() const;

    std::vector<ModelConflict> getConflictLog() const;
    std::vector<int64_t> getHistoryVersions() const;

    std::optional<GlobalModel> getCurrentModel() const;
    // 0 while no model has been adopted
    int64_t getModelVersion() const;
    SyncStatus getSyncStatus() const;
    double getLastSyncTime() const;

    const std::string& nodeId() const { return node_id_; }
    size_t maxHistory() const { return max_history_; }

    // Checks every hash and that each model links to its predecessor
    static ChainVerification verifyModelChain(const std::vector<GlobalModel>& models);

private:
    std::string node_id_;
    size_t max_history_;

    mutable std::mutex mutex_;
    std::optional<GlobalModel> current_model_;
    std::deque<GlobalModel> history_;
    std::map<std::string, int64_t> node_versions_;
    std::vector<ModelConflict> conflict_log_;
    SyncStatus status_ = SyncStatus::PENDING;
    double last_sync_time_ = 0.0;

    static bool validateModel(const GlobalModel& model, std::string& reason);
    bool adoptLocked(const GlobalModel& model, const std::string& origin);
    void pushHistoryLocked(GlobalModel model);
};

} // namespace fedcore

#endif // FEDCORE_MODEL_SYNC_H
