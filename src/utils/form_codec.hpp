/*
 * form_codec.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: application/x-www-form-urlencoded encoding and decoding

**************************************************/

#ifndef RAMPART_UTILS_FORM_CODEC_HPP
#define RAMPART_UTILS_FORM_CODEC_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rampart::utils {

/**
 * @brief One `name=value` pair of an application/x-www-form-urlencoded body
 *
 * Both members hold decoded text. `hasValue` is false for a bare `name`
 * segment without `=`, which is written back the same way.
 */
struct FormField {
    std::string name;
    std::string value;
    bool hasValue{true};
};

/**
 * @brief Percent-decode @p text
 *
 * Malformed escapes are kept literally. With @p plusAsSpace a `+` becomes a
 * space, as form encoding requires.
 */
[[nodiscard]] auto urlDecode(std::string_view text, bool plusAsSpace = true)
    -> std::string;

/// Percent-encode everything but unreserved characters; space becomes `+`.
[[nodiscard]] auto urlEncode(std::string_view text) -> std::string;

[[nodiscard]] auto parseForm(std::string_view body) -> std::vector<FormField>;
[[nodiscard]] auto serializeForm(const std::vector<FormField>& fields)
    -> std::string;

/// First value of @p name in a form body.
[[nodiscard]] auto findFormValue(std::string_view body, std::string_view name)
    -> std::optional<std::string>;

}  // namespace rampart::utils

#endif  // RAMPART_UTILS_FORM_CODEC_HPP
