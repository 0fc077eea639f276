/*
 * Model synchronization implementation
 */

#include "federated/model_sync.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace fedcore {

std::string syncStatusToString(SyncStatus status) {
    switch (status) {
        case SyncStatus::PENDING: return "pending";
        case SyncStatus::DISTRIBUTING: return "distributing";
        case SyncStatus::ACTIVE: return "active";
        case SyncStatus::DEPRECATED: return "deprecated";
    }
    return "unknown";
}

std::string conflictTypeToString(ConflictType type) {
    switch (type) {
        case ConflictType::VERSION_MISMATCH: return "version_mismatch";
        case ConflictType::HASH_MISMATCH: return "hash_mismatch";
        case ConflictType::ROUND_MISMATCH: return "round_mismatch";
    }
    return "unknown";
}

std::string conflictSeverityToString(ConflictSeverity severity) {
    switch (severity) {
        case ConflictSeverity::LOW: return "low";
        case ConflictSeverity::MEDIUM: return "medium";
        case ConflictSeverity::HIGH: return "high";
        case ConflictSeverity::CRITICAL: return "critical";
    }
    return "unknown";
}

ResolutionStrategy parseResolutionStrategy(const std::string& name) {
    if (name == "prefer_global") return ResolutionStrategy::PREFER_GLOBAL;
    if (name == "prefer_local") return ResolutionStrategy::PREFER_LOCAL;
    if (name == "merge") return ResolutionStrategy::MERGE;
    throw std::invalid_argument("Unknown resolution strategy: " + name +
                                " (available: prefer_global, prefer_local, merge)");
}

ModelSynchronizer::ModelSynchronizer(std::string node_id, size_t max_history)
    : node_id_(std::move(node_id)),
      max_history_(max_history > 0 ? max_history : 1) {}

bool ModelSynchronizer::validateModel(const GlobalModel& model, std::string& reason) {
    if (model.weights.empty()) {
        reason = "model carries no weights";
        return false;
    }
    if (model.version < 0) {
        reason = "negative version " + std::to_string(model.version);
        return false;
    }
    for (double value : model.weights.toFlatVector()) {
        if (!std::isfinite(value)) {
            reason = "non-finite weight value";
            return false;
        }
    }
    if (!model.weights_hash.empty() && !model.verifyHash()) {
        reason = "weights hash does not match contents";
        return false;
    }
    return true;
}

void ModelSynchronizer::pushHistoryLocked(GlobalModel model) {
    history_.push_back(std::move(model));
    while (history_.size() > max_history_) {
        history_.pop_front();
    }
}

bool ModelSynchronizer::adoptLocked(const GlobalModel& model, const std::string& origin) {
    std::string reason;
    if (!validateModel(model, reason)) {
        std::cerr << "[ModelSync] " << node_id_ << ": rejected model v" << model.version
                  << " from " << origin << ": " << reason << std::endl;
        return false;
    }

    if (current_model_ && model.version <= current_model_->version) {
        std::cerr << "[ModelSync] " << node_id_ << ": ignoring stale model v" << model.version
                  << " from " << origin << " (current v" << current_model_->version << ")" << std::endl;
        return false;
    }

    if (current_model_) {
        pushHistoryLocked(*current_model_);
    }
    current_model_ = model;
    status_ = SyncStatus::ACTIVE;
    last_sync_time_ = nowSeconds();

    std::cout << "[ModelSync] " << node_id_ << ": adopted model v" << model.version
              << " (" << model.weights_hash.substr(0, 8) << ") from " << origin << std::endl;
    return true;
}

bool ModelSynchronizer::receiveGlobalModel(const GlobalModel& model, const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string origin = source.empty() ? "coordinator" : source;
    if (!adoptLocked(model, origin)) {
        return false;
    }
    if (!source.empty()) {
        node_versions_[source] = model.version;
    }
    return true;
}

bool ModelSynchronizer::setLocalModel(const GlobalModel& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!adoptLocked(model, "local")) {
        return false;
    }
    node_versions_[node_id_] = model.version;
    return true;
}

std::vector<ModelConflict> ModelSynchronizer::checkForConflicts(const GlobalModel& local,
                                                                const GlobalModel& global) {
    std::vector<ModelConflict> conflicts;
    const double now = nowSeconds();

    auto add = [&](ConflictType type, ConflictSeverity severity, const std::string& description) {
        ModelConflict conflict;
        conflict.type = type;
        conflict.severity = severity;
        conflict.local_version = local.version;
        conflict.global_version = global.version;
        conflict.description = description;
        conflict.detected_at = now;
        conflicts.push_back(conflict);
    };

    if (local.version != global.version) {
        ConflictSeverity severity = local.version > global.version ? ConflictSeverity::HIGH
                                                                   : ConflictSeverity::MEDIUM;
        add(ConflictType::VERSION_MISMATCH, severity,
            "local v" + std::to_string(local.version) + " vs global v" + std::to_string(global.version));
    } else if (local.weights_hash != global.weights_hash) {
        add(ConflictType::HASH_MISMATCH, ConflictSeverity::CRITICAL,
            "same version v" + std::to_string(local.version) + " with different weights");
    }

    if (local.round_number != global.round_number) {
        add(ConflictType::ROUND_MISMATCH, ConflictSeverity::MEDIUM,
            "local round " + std::to_string(local.round_number) + " vs global round " +
            std::to_string(global.round_number));
    }

    if (!conflicts.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        conflict_log_.insert(conflict_log_.end(), conflicts.begin(), conflicts.end());
        std::cerr << "[ModelSync] " << node_id_ << ": " << conflicts.size()
                  << " conflict(s) detected" << std::endl;
    }
    return conflicts;
}

ResolutionOutcome ModelSynchronizer::resolveConflicts(const std::vector<ModelConflict>& conflicts,
                                                      ResolutionStrategy strategy) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (strategy == ResolutionStrategy::MERGE) {
        throw UnsupportedResolutionError("Merge resolution is not supported");
    }

    ResolutionOutcome outcome;
    outcome.resolved = true;
    outcome.strategy = strategy;
    outcome.kept = strategy == ResolutionStrategy::PREFER_GLOBAL ? "global" : "local";
    outcome.conflicts_resolved = conflicts.size();

    if (!conflicts.empty()) {
        std::cout << "[ModelSync] " << node_id_ << ": resolved " << conflicts.size()
                  << " conflict(s), keeping " << outcome.kept << " model" << std::endl;
    }
    return outcome;
}

bool ModelSynchronizer::rollback(int64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(history_.begin(), history_.end(),
                           [version](const GlobalModel& model) { return model.version == version; });
    if (it == history_.end()) {
        std::cerr << "[ModelSync] " << node_id_ << ": version " << version
                  << " not in history, rollback refused" << std::endl;
        return false;
    }

    GlobalModel target = *it;
    history_.erase(it);
    if (current_model_) {
        pushHistoryLocked(*current_model_);
    }
    current_model_ = std::move(target);
    status_ = SyncStatus::ACTIVE;
    last_sync_time_ = nowSeconds();

    std::cout << "[ModelSync] " << node_id_ << ": rolled back to v" << version << std::endl;
    return true;
}

void ModelSynchronizer::markDistributing() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = SyncStatus::DISTRIBUTING;
}

void ModelSynchronizer::markDeprecated() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = SyncStatus::DEPRECATED;
}

void ModelSynchronizer::updateNodeVersion(const std::string& node_id, int64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    node_versions_[node_id] = version;
}

std::map<std::string, int64_t> ModelSynchronizer::getNodeVersions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return node_versions_;
}

std::vector<ModelConflict> ModelSynchronizer::getConflictLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conflict_log_;
}

std::vector<int64_t> ModelSynchronizer::getHistoryVersions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int64_t> versions;
    for (const auto& model : history_) {
        versions.push_back(model.version);
    }
    return versions;
}

std::optional<GlobalModel> ModelSynchronizer::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_model_;
}

int64_t ModelSynchronizer::getModelVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_model_ ? current_model_->version : 0;
}

SyncStatus ModelSynchronizer::getSyncStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

double ModelSynchronizer::getLastSyncTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sync_time_;
}

ChainVerification ModelSynchronizer::verifyModelChain(const std::vector<GlobalModel>& models) {
    ChainVerification verification;

    for (size_t i = 0; i < models.size(); ++i) {
        const GlobalModel& model = models[i];
        const std::string label = "model v" + std::to_string(model.version);

        if (!model.verifyHash()) {
            verification.problems.push_back(label + ": weights hash mismatch");
        }
        if (i == 0) {
            continue;
        }

        const GlobalModel& prior = models[i - 1];
        if (model.previous_hash != prior.weights_hash) {
            verification.problems.push_back(label + ": previous_hash does not link to v" +
                                            std::to_string(prior.version));
        }
        if (model.version <= prior.version) {
            verification.problems.push_back(label + ": version does not increase");
        }
    }

    verification.valid = verification.problems.empty();
    return verification;
}

} // namespace fedcore
