#pragma once
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mwtab {

/**
 * Insertion-ordered string multimap.
 *
 * Keys may repeat; every entry keeps its occurrence index (0 for the first
 * time a key is seen, 1 for the second, ...). Lookup by key returns the
 * first value, iteration yields every entry in insertion order.
 */
class Multimap
{
public:
    struct Entry
    {
        std::string key;
        std::string value;
        size_t occurrence = 0;

        bool operator==(const Entry&) const = default;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

    Multimap() = default;
    Multimap(std::initializer_list<std::pair<std::string, std::string>> pairs);

    // Appends, keeping any earlier entry with the same key.
    void add(std::string key, std::string value);
    // Replaces the first value for key, or appends when the key is new.
    void set(const std::string& key, std::string value);

    const std::string* find(std::string_view key) const;
    std::string* find(std::string_view key);
    std::string get(std::string_view key, const std::string& fallback = "") const;
    std::vector<std::string> all(std::string_view key) const;

    bool contains(std::string_view key) const { return index.count(std::string(key)) > 0; }
    size_t count(std::string_view key) const;
    size_t erase(std::string_view key);

    // Distinct keys in order of first appearance.
    std::vector<std::string> keys() const;
    std::vector<std::string> duplicate_keys() const;
    bool has_duplicates() const { return index.size() != entries.size(); }

    // Moves the listed keys (all their occurrences) to the front in the given
    // order; unlisted keys follow in their current order.
    void reorder(const std::vector<std::string>& order);
    void rename(std::string_view from, const std::string& to);

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }
    const Entry& at(size_t position) const { return entries.at(position); }
    Entry& at(size_t position) { return entries.at(position); }

    bool operator==(const Multimap& other) const { return entries == other.entries; }

private:
    void reindex();

    std::vector<Entry> entries;
    std::unordered_map<std::string, std::vector<size_t>> index;
};

} // namespace mwtab
