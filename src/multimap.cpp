#include "multimap.hpp"
#include <algorithm>

namespace mwtab {

Multimap::Multimap(std::initializer_list<std::pair<std::string, std::string>> pairs) {
    for (const auto& [key, value] : pairs) {
        add(key, value);
    }
}

void Multimap::add(std::string key, std::string value) {
    auto& positions = index[key];
    positions.push_back(entries.size());
    entries.push_back({std::move(key), std::move(value), positions.size() - 1});
}

void Multimap::set(const std::string& key, std::string value) {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    add(key, std::move(value));
}

const std::string* Multimap::find(std::string_view key) const {
    auto it = index.find(std::string(key));
    if (it == index.end()) return nullptr;
    return &entries[it->second.front()].value;
}

std::string* Multimap::find(std::string_view key) {
    auto it = index.find(std::string(key));
    if (it == index.end()) return nullptr;
    return &entries[it->second.front()].value;
}

std::string Multimap::get(std::string_view key, const std::string& fallback) const {
    const auto* value = find(key);
    return value ? *value : fallback;
}

std::vector<std::string> Multimap::all(std::string_view key) const {
    std::vector<std::string> values;
    auto it = index.find(std::string(key));
    if (it == index.end()) return values;
    for (size_t position : it->second) {
        values.push_back(entries[position].value);
    }
    return values;
}

size_t Multimap::count(std::string_view key) const {
    auto it = index.find(std::string(key));
    return it == index.end() ? 0 : it->second.size();
}

size_t Multimap::erase(std::string_view key) {
    size_t before = entries.size();
    std::erase_if(entries, [&](const Entry& entry) { return entry.key == key; });
    reindex();
    return before - entries.size();
}

std::vector<std::string> Multimap::keys() const {
    std::vector<std::string> result;
    for (const auto& entry : entries) {
        if (entry.occurrence == 0) result.push_back(entry.key);
    }
    return result;
}

std::vector<std::string> Multimap::duplicate_keys() const {
    std::vector<std::string> result;
    for (const auto& entry : entries) {
        if (entry.occurrence == 1) result.push_back(entry.key);
    }
    return result;
}

void Multimap::reorder(const std::vector<std::string>& order) {
    std::vector<Entry> sorted;
    sorted.reserve(entries.size());
    for (const auto& key : order) {
        for (const auto& entry : entries) {
            if (entry.key == key) sorted.push_back(entry);
        }
    }
    for (const auto& entry : entries) {
        if (std::find(order.begin(), order.end(), entry.key) == order.end()) {
            sorted.push_back(entry);
        }
    }
    entries = std::move(sorted);
    reindex();
}

void Multimap::rename(std::string_view from, const std::string& to) {
    for (auto& entry : entries) {
        if (entry.key == from) entry.key = to;
    }
    reindex();
}

void Multimap::reindex() {
    index.clear();
    for (size_t i = 0; i < entries.size(); ++i) {
        auto& positions = index[entries[i].key];
        entries[i].occurrence = positions.size();
        positions.push_back(i);
    }
}

} // namespace mwtab
