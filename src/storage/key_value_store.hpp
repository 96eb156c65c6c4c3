#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace httpkv {

// Thread-safe mapping from string key to an arbitrary JSON value.
//
// Concurrency model:
//   - get() / keys() / size() acquire a shared (read) lock.
//   - set() / del() / clear() acquire an exclusive (write) lock.
//   Multiple concurrent readers are allowed; writers are exclusive, so two
//   writers to the same key are totally ordered (last writer wins).
//
// A missing key is reported through std::nullopt, never by throwing.
class KeyValueStore {
public:
    KeyValueStore() = default;

    // Not copyable – copies of a live store would silently race.
    KeyValueStore(const KeyValueStore&)            = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<nlohmann::ordered_json> get(std::string_view key) const;

    // Inserts or overwrites `key` with `value`.
    // Returns the value that was replaced, or std::nullopt for a new key.
    std::optional<nlohmann::ordered_json> set(std::string key, nlohmann::ordered_json value);

    // Removes `key`.  Returns the removed value, or std::nullopt if the key
    // did not exist (not an error: deletion is idempotent).
    std::optional<nlohmann::ordered_json> del(std::string_view key);

    // Returns a snapshot of all keys (order is unspecified).
    [[nodiscard]] std::vector<std::string> keys() const;

    // Returns the number of stored entries.
    [[nodiscard]] std::size_t size() const;

    // Removes all entries.
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, nlohmann::ordered_json> map_;
};

} // namespace httpkv
