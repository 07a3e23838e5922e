#pragma once

#include "mss/predictor.hpp"
#include "mss/types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace mss {

// Holds every published weight set and trajectory model. Entries are shared
// as pointers to const and never replaced, so a prediction holding a model
// keeps using it while a refit publishes the next version.
class VersionRegistry {
public:
    VersionRegistry() = default;

    std::shared_ptr<const WeightSet> publish_weights(WeightSet weights);
    std::shared_ptr<const WeightSet> weights(int version) const;
    std::shared_ptr<const WeightSet> latest_weights() const;
    std::vector<int> weight_versions() const;

    // Reserves the next model version number for a model about to be fit.
    int reserve_model_version();
    bool publish_model(std::shared_ptr<const TrajectoryModel> model);
    std::shared_ptr<const TrajectoryModel> model(int version) const;
    std::shared_ptr<const TrajectoryModel> latest_model() const;
    std::vector<int> model_versions() const;

private:
    mutable std::mutex mutex_;
    std::map<int, std::shared_ptr<const WeightSet>> weights_;
    std::map<int, std::shared_ptr<const TrajectoryModel>> models_;
    int next_weight_version_ = 1;
    int next_model_version_ = 1;
};

} // namespace mss
