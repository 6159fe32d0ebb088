/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Base for JSON-backed configuration sections and their
validation report

**************************************************/

#ifndef RAMPART_CONFIG_CORE_CONFIG_SECTION_HPP
#define RAMPART_CONFIG_CORE_CONFIG_SECTION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "exception.hpp"

namespace rampart::config {

using json = nlohmann::json;

struct ConfigValidationError {
    std::string path;     ///< JSON pointer of the offending value
    std::string message;
    std::string keyword;  ///< "required", "minItems", ... when it applies
};

/**
 * @brief Every problem validate() found, in document order
 */
struct ConfigValidationResult {
    bool valid{true};
    std::vector<ConfigValidationError> errors;

    [[nodiscard]] bool isValid() const noexcept { return valid; }
    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message,
                  std::string keyword = {}) {
        valid = false;
        errors.emplace_back(ConfigValidationError{
            std::move(path), std::move(message), std::move(keyword)});
    }

    /// "path: message" entries separated by "; ".
    [[nodiscard]] auto summary() const -> std::string {
        std::string text;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) {
                text += "; ";
            }
            text += errors[i].path;
            text += ": ";
            text += errors[i].message;
        }
        return text;
    }
};

/**
 * @brief CRTP base of a section stored under a fixed JSON pointer
 *
 * @tparam Section provides `PATH`, `serialize()`, a static
 *         `deserialize(const json&)` and a static `generateSchema()`.
 *         Its default constructor yields the built-in defaults.
 */
template <typename Section>
class ConfigSection {
public:
    [[nodiscard]] static constexpr auto path() noexcept -> std::string_view {
        return Section::PATH;
    }

    [[nodiscard]] auto toJson() const -> json {
        return self().serialize();
    }

    /// @throws json::exception or InvalidConfigException on a bad shape
    [[nodiscard]] static auto fromJson(const json& j) -> Section {
        return Section::deserialize(j);
    }

    /// fromJson() that reports a bad shape as nullopt.
    [[nodiscard]] static auto tryFromJson(const json& j)
        -> std::optional<Section> {
        try {
            return Section::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        } catch (const BadConfigException&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] static auto schema() -> json {
        return Section::generateSchema();
    }

    [[nodiscard]] static auto defaults() -> Section { return Section{}; }

protected:
    /// @p key as a string array, or @p fallback when absent.
    static auto stringList(const json& j, const char* key,
                           std::vector<std::string> fallback)
        -> std::vector<std::string> {
        auto it = j.find(key);
        if (it == j.end()) {
            return fallback;
        }
        if (!it->is_array()) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(path()) + "/" + key +
                                           " must be an array");
        }
        return it->template get<std::vector<std::string>>();
    }

private:
    [[nodiscard]] auto self() const -> const Section& {
        return static_cast<const Section&>(*this);
    }
};

}  // namespace rampart::config

#endif  // RAMPART_CONFIG_CORE_CONFIG_SECTION_HPP
