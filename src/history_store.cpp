#include "mss/history_store.hpp"
#include "mss/json_io.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace mss {

HistoryStore::HistoryStore(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {}

std::expected<int, std::string> HistoryStore::load_file(const std::filesystem::path& path) {
    auto items = read_json_array(path);
    if (!items) return std::unexpected(items.error());

    int loaded = 0;
    for (auto& item : *items) {
        auto h = parse_history(item);
        if (h.player_id.empty()) {
            spdlog::warn("{}: skipping history entry without player_id", path.string());
            continue;
        }
        add(std::move(h));
        loaded++;
    }
    spdlog::debug("Loaded {} player histories from {}", loaded, path.string());
    return loaded;
}

void HistoryStore::add(PlayerHistory history) {
    std::lock_guard lock(mutex_);
    auto id = history.player_id;
    histories_.insert_or_assign(std::move(id), std::move(history));
}

bool HistoryStore::store(const PlayerHistory& history) const {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
    if (ec) {
        spdlog::warn("Cannot create {}: {}", base_dir_.string(), ec.message());
        return false;
    }

    nlohmann::json appearances = nlohmann::json::array();
    for (auto& a : history.appearances) {
        appearances.push_back({
            {"game_id", a.game_id},
            {"date", std::chrono::system_clock::to_time_t(a.date)},
            {"performance", a.performance},
        });
    }
    nlohmann::json data = {
        {"player_id", history.player_id},
        {"career_plate_appearances", history.career_plate_appearances},
        {"career_innings_pitched", history.career_innings_pitched},
        {"career_performance", history.career_performance},
        {"appearances", appearances},
    };

    std::ofstream file(base_dir_ / (history.player_id + ".json"));
    if (!file.is_open()) return false;
    file << data.dump(2);
    return static_cast<bool>(file);
}

std::expected<int, std::string> HistoryStore::persist() const {
    std::vector<PlayerHistory> snapshot;
    {
        std::lock_guard lock(mutex_);
        snapshot.reserve(histories_.size());
        for (auto& [id, h] : histories_) snapshot.push_back(h);
    }

    int written = 0;
    for (auto& h : snapshot) {
        if (!store(h)) {
            return std::unexpected("cannot write history for " + h.player_id + " under " +
                                   base_dir_.string());
        }
        written++;
    }
    spdlog::debug("Persisted {} player histories to {}", written, base_dir_.string());
    return written;
}

std::expected<PlayerHistory, LookupError> HistoryStore::read_history(
    const std::string& player_id) const {
    {
        std::lock_guard lock(mutex_);
        auto it = histories_.find(player_id);
        if (it != histories_.end()) return it->second;
    }

    auto path = base_dir_ / (player_id + ".json");
    if (!std::filesystem::exists(path)) {
        return std::unexpected(LookupError{player_id, "no history for player"});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(LookupError{player_id, "cannot open " + path.string()});
    }

    PlayerHistory h;
    try {
        h = parse_history(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(LookupError{player_id, path.string() + ": " + e.what()});
    }
    if (h.player_id.empty()) h.player_id = player_id;

    std::lock_guard lock(mutex_);
    histories_.emplace(player_id, h);
    return h;
}

std::expected<PlayerHistory, LookupError> HistoryStore::history(
    const std::string& player_id, TimePoint before) const {
    auto h = read_history(player_id);
    if (!h) return h;

    std::erase_if(h->appearances, [&](const Appearance& a) { return a.date >= before; });
    return h;
}

} // namespace mss
