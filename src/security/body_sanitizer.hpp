/*
 * body_sanitizer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: HTML escaping of decoded request bodies at ingress

**************************************************/

#ifndef RAMPART_SECURITY_BODY_SANITIZER_HPP
#define RAMPART_SECURITY_BODY_SANITIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace rampart::security {

/// How a request body is interpreted, chosen from its Content-Type.
enum class BodyKind { Form, Json, Unsupported };

/**
 * @brief What the sanitizer does and to which fields
 */
struct SanitizationPolicy {
    bool enabled{true};
    /// Reject unsupported content types instead of passing them through.
    bool failClosed{false};
    /// Case-insensitive substrings marking fields that are never rewritten.
    std::vector<std::string> sensitiveFields{"password", "token", "secret",
                                             "key"};

    [[nodiscard]] bool isSensitive(std::string_view field) const;
};

enum class SanitizeStatus {
    Sanitized,    ///< body rewritten (possibly to identical text)
    Empty,        ///< nothing to do
    Unsupported,  ///< content type not handled, body untouched
    Malformed     ///< declared JSON that does not parse or nests too
                  ///< deeply, body untouched
};

[[nodiscard]] auto sanitizeStatusName(SanitizeStatus status)
    -> std::string_view;

/**
 * @brief Escapes HTML-significant characters in request bodies
 *
 * Escaping is not idempotent (`&` doubles up on a second pass), so a body
 * must go through sanitizeBody exactly once.
 */
class BodySanitizer {
public:
    /// Containers nested deeper than this make a JSON body Malformed.
    static constexpr int MAX_JSON_DEPTH = 128;

    BodySanitizer() = default;
    explicit BodySanitizer(SanitizationPolicy policy);

    /// `< > & " ' /` to `&lt; &gt; &amp; &quot; &#x27; &#x2F;`
    [[nodiscard]] static auto escapeHtml(std::string_view input) -> std::string;

    [[nodiscard]] static auto classify(std::string_view contentType)
        -> BodyKind;

    /**
     * @brief Parse a JSON body without building deeply nested documents
     * @return nullopt (logged) when the body does not parse or nests deeper
     *         than MAX_JSON_DEPTH
     */
    [[nodiscard]] static auto parseJson(std::string_view body)
        -> std::optional<nlohmann::json>;

    /// Escape every non-sensitive value of a urlencoded body.
    [[nodiscard]] auto sanitizeForm(std::string_view body) const
        -> std::string;

    /**
     * @brief Escape string leaves of a JSON document in place
     *
     * Numbers, booleans and null are left alone and object keys are kept.
     * Strings under a sensitive key are skipped.
     */
    void sanitizeJson(nlohmann::json& value, std::string_view key = {}) const;

    /**
     * @brief Sanitize @p body according to @p contentType
     *
     * The body is only modified when the result is Sanitized.
     */
    auto sanitizeBody(std::string_view contentType, std::string& body) const
        -> SanitizeStatus;

    [[nodiscard]] auto policy() const -> const SanitizationPolicy& {
        return policy_;
    }

private:
    SanitizationPolicy policy_;
};

/// Shorthand for BodySanitizer::escapeHtml.
[[nodiscard]] inline auto sanitize(std::string_view input) -> std::string {
    return BodySanitizer::escapeHtml(input);
}

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_BODY_SANITIZER_HPP
