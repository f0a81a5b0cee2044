#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rqsynth::http {

inline bool ci_char_equal(char a, char b) noexcept {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

inline bool ci_equal(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), ci_char_equal);
}

// Ordered multi-valued header container; names compare case-insensitively and
// keep the spelling of their first insertion.
class headers_map {
private:
    struct entry {
        std::string name;
        std::vector<std::string> values;
    };

public:
    headers_map() = default;

    // Replaces every value stored under name.
    void set(std::string_view name, std::string_view value) {
        if (auto* e = find(name)) {
            e->values.assign(1, std::string(value));
            return;
        }
        entries_.push_back(entry{std::string(name), {std::string(value)}});
    }

    // Appends a value, keeping any existing ones.
    void add(std::string_view name, std::string_view value) {
        if (auto* e = find(name)) {
            e->values.emplace_back(value);
            return;
        }
        entries_.push_back(entry{std::string(name), {std::string(value)}});
    }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
        const auto* e = find(name);
        if (!e || e->values.empty()) {
            return std::nullopt;
        }
        return std::string_view(e->values.front());
    }

    [[nodiscard]] std::vector<std::string_view> get_all(std::string_view name) const {
        std::vector<std::string_view> out;
        if (const auto* e = find(name)) {
            out.reserve(e->values.size());
            for (const auto& v : e->values) {
                out.emplace_back(v);
            }
        }
        return out;
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return find(name) != nullptr;
    }

    void remove(std::string_view name) noexcept {
        auto it = std::find_if(entries_.begin(), entries_.end(), [name](const entry& e) {
            return ci_equal(e.name, name);
        });
        if (it != entries_.end()) {
            entries_.erase(it);
        }
    }

    void clear() noexcept { entries_.clear(); }

    // Walks every (name, value) pair; a name with N values yields N pairs.
    struct iterator {
        const headers_map* map;
        size_t entry_index;
        size_t value_index;

        void skip_empty() noexcept {
            while (entry_index < map->entries_.size() &&
                   value_index >= map->entries_[entry_index].values.size()) {
                ++entry_index;
                value_index = 0;
            }
        }

        iterator& operator++() {
            ++value_index;
            skip_empty();
            return *this;
        }

        bool operator!=(const iterator& other) const {
            return entry_index != other.entry_index || value_index != other.value_index;
        }

        bool operator==(const iterator& other) const { return !(*this != other); }

        std::pair<std::string_view, std::string_view> operator*() const {
            const auto& e = map->entries_[entry_index];
            return {std::string_view(e.name), std::string_view(e.values[value_index])};
        }
    };

    iterator begin() const noexcept {
        iterator it{this, 0, 0};
        it.skip_empty();
        return it;
    }

    iterator end() const noexcept { return {this, entries_.size(), 0}; }

    // Number of distinct header names.
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    entry* find(std::string_view name) noexcept {
        for (auto& e : entries_) {
            if (ci_equal(e.name, name)) {
                return &e;
            }
        }
        return nullptr;
    }

    const entry* find(std::string_view name) const noexcept {
        return const_cast<headers_map*>(this)->find(name);
    }

    std::vector<entry> entries_;
};

} // namespace rqsynth::http
