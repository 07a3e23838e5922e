#pragma once

#include "mss/context.hpp"
#include "mss/types.hpp"
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mss {

// Player histories kept as one JSON document per player under base_dir, with
// an in-memory layer for histories loaded from a batch file. Lookups only
// return appearances strictly before the requested time.
class HistoryStore : public PlayerHistoryLookup {
public:
    explicit HistoryStore(std::filesystem::path base_dir = "data/history");

    // Loads a JSON array of player histories. Returns the number loaded.
    std::expected<int, std::string> load_file(const std::filesystem::path& path);

    void add(PlayerHistory history);
    bool store(const PlayerHistory& history) const;

    // Writes every history held in memory to base_dir so later runs can look
    // players up without the batch file. Returns the number written.
    std::expected<int, std::string> persist() const;

    std::expected<PlayerHistory, LookupError> history(
        const std::string& player_id, TimePoint before) const override;

private:
    std::filesystem::path base_dir_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, PlayerHistory> histories_;

    std::expected<PlayerHistory, LookupError> read_history(const std::string& player_id) const;
};

} // namespace mss
