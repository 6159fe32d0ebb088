/*
 * header_map.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Case-insensitive multi-valued HTTP header map

**************************************************/

#ifndef RAMPART_UTILS_HEADER_MAP_HPP
#define RAMPART_UTILS_HEADER_MAP_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rampart::utils {

/**
 * @brief Ordered HTTP header list with case-insensitive lookup
 *
 * Insertion order is preserved so responses are emitted deterministically.
 */
class HeaderMap {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<value_type> init) : entries_(init) {}

    [[nodiscard]] static bool equalsIgnoreCase(std::string_view a,
                                               std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (lower(a[i]) != lower(b[i])) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        return find(name) != nullptr;
    }

    [[nodiscard]] auto get(std::string_view name) const
        -> std::optional<std::string_view> {
        if (const auto* entry = find(name)) {
            return std::string_view(entry->second);
        }
        return std::nullopt;
    }

    /// Replace the first header named @p name, or append it.
    void set(std::string_view name, std::string value) {
        if (auto* entry = find(name)) {
            entry->second = std::move(value);
            return;
        }
        entries_.emplace_back(std::string(name), std::move(value));
    }

    /// Append unless a header with the same name exists.
    bool setIfAbsent(std::string_view name, std::string value) {
        if (contains(name)) {
            return false;
        }
        entries_.emplace_back(std::string(name), std::move(value));
        return true;
    }

    void add(std::string name, std::string value) {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] auto begin() const -> const_iterator {
        return entries_.begin();
    }
    [[nodiscard]] auto end() const -> const_iterator { return entries_.end(); }

private:
    static char lower(char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    [[nodiscard]] auto find(std::string_view name) const -> const value_type* {
        for (const auto& entry : entries_) {
            if (equalsIgnoreCase(entry.first, name)) {
                return &entry;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto find(std::string_view name) -> value_type* {
        for (auto& entry : entries_) {
            if (equalsIgnoreCase(entry.first, name)) {
                return &entry;
            }
        }
        return nullptr;
    }

    std::vector<value_type> entries_;
};

}  // namespace rampart::utils

#endif  // RAMPART_UTILS_HEADER_MAP_HPP
