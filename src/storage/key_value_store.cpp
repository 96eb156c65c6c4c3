#include "storage/key_value_store.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace httpkv {

std::optional<nlohmann::ordered_json> KeyValueStore::get(std::string_view key) const {
    std::shared_lock lock(mutex_);
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<nlohmann::ordered_json> KeyValueStore::set(std::string key, nlohmann::ordered_json value) {
    std::unique_lock lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        map_.emplace(std::move(key), std::move(value));
        return std::nullopt;
    }
    // Hand the old value back to the caller; nothing of it stays in the map.
    std::optional<nlohmann::ordered_json> previous{std::move(it->second)};
    it->second = std::move(value);
    return previous;
}

std::optional<nlohmann::ordered_json> KeyValueStore::del(std::string_view key) {
    std::unique_lock lock(mutex_);
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return std::nullopt;
    }
    std::optional<nlohmann::ordered_json> removed{std::move(it->second)};
    map_.erase(it);
    return removed;
}

std::vector<std::string> KeyValueStore::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(map_.size());
    for (const auto& [k, _] : map_) {
        result.push_back(k);
    }
    return result;
}

std::size_t KeyValueStore::size() const {
    std::shared_lock lock(mutex_);
    return map_.size();
}

void KeyValueStore::clear() {
    std::unique_lock lock(mutex_);
    map_.clear();
}

} // namespace httpkv
