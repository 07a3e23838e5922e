#include "mss/versions.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace mss {

std::shared_ptr<const WeightSet> VersionRegistry::publish_weights(WeightSet weights) {
    std::lock_guard lock(mutex_);
    if (weights.version <= 0 || weights_.contains(weights.version)) {
        weights.version = next_weight_version_;
    }
    next_weight_version_ = std::max(next_weight_version_, weights.version + 1);

    auto stored = std::make_shared<const WeightSet>(std::move(weights));
    weights_.emplace(stored->version, stored);
    spdlog::info("Published weight set v{} (w1 {:.3f}, w2 {:.3f})",
                 stored->version, stored->w1, stored->w2);
    return stored;
}

std::shared_ptr<const WeightSet> VersionRegistry::weights(int version) const {
    std::lock_guard lock(mutex_);
    auto it = weights_.find(version);
    return it != weights_.end() ? it->second : nullptr;
}

std::shared_ptr<const WeightSet> VersionRegistry::latest_weights() const {
    std::lock_guard lock(mutex_);
    return weights_.empty() ? nullptr : weights_.rbegin()->second;
}

std::vector<int> VersionRegistry::weight_versions() const {
    std::lock_guard lock(mutex_);
    std::vector<int> versions;
    for (auto& [v, _] : weights_) versions.push_back(v);
    return versions;
}

int VersionRegistry::reserve_model_version() {
    std::lock_guard lock(mutex_);
    return next_model_version_++;
}

bool VersionRegistry::publish_model(std::shared_ptr<const TrajectoryModel> model) {
    if (!model) return false;
    std::lock_guard lock(mutex_);
    int version = model->version();
    if (models_.contains(version)) {
        spdlog::warn("Model v{} already published; keeping the existing one", version);
        return false;
    }
    next_model_version_ = std::max(next_model_version_, version + 1);
    models_.emplace(version, std::move(model));
    return true;
}

std::shared_ptr<const TrajectoryModel> VersionRegistry::model(int version) const {
    std::lock_guard lock(mutex_);
    auto it = models_.find(version);
    return it != models_.end() ? it->second : nullptr;
}

std::shared_ptr<const TrajectoryModel> VersionRegistry::latest_model() const {
    std::lock_guard lock(mutex_);
    return models_.empty() ? nullptr : models_.rbegin()->second;
}

std::vector<int> VersionRegistry::model_versions() const {
    std::lock_guard lock(mutex_);
    std::vector<int> versions;
    for (auto& [v, _] : models_) versions.push_back(v);
    return versions;
}

} // namespace mss
