/*
 * body_sanitizer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "body_sanitizer.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "utils/form_codec.hpp"

namespace rampart::security {

namespace {

auto toLower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

/// Media type without parameters, lower-cased ("text/html; charset=x" -> "text/html").
auto mediaType(std::string_view contentType) -> std::string {
    auto type = contentType.substr(0, contentType.find(';'));
    const auto first = type.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = type.find_last_not_of(" \t");
    return toLower(type.substr(first, last - first + 1));
}

}  // namespace

bool SanitizationPolicy::isSensitive(std::string_view field) const {
    if (field.empty()) {
        return false;
    }
    const auto lowered = toLower(field);
    return std::any_of(sensitiveFields.begin(), sensitiveFields.end(),
                       [&lowered](const std::string& marker) {
                           return !marker.empty() &&
                                  lowered.find(toLower(marker)) !=
                                      std::string::npos;
                       });
}

auto sanitizeStatusName(SanitizeStatus status) -> std::string_view {
    switch (status) {
        case SanitizeStatus::Sanitized:
            return "sanitized";
        case SanitizeStatus::Empty:
            return "empty";
        case SanitizeStatus::Unsupported:
            return "unsupported";
        case SanitizeStatus::Malformed:
            return "malformed";
    }
    return "unknown";
}

BodySanitizer::BodySanitizer(SanitizationPolicy policy)
    : policy_(std::move(policy)) {}

auto BodySanitizer::escapeHtml(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size() + input.size() / 4);
    for (char c : input) {
        switch (c) {
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '&':
                out += "&amp;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#x27;";
                break;
            case '/':
                out += "&#x2F;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

auto BodySanitizer::classify(std::string_view contentType) -> BodyKind {
    const auto type = mediaType(contentType);
    if (type == "application/x-www-form-urlencoded") {
        return BodyKind::Form;
    }
    if (type == "application/json" || type.ends_with("+json")) {
        return BodyKind::Json;
    }
    return BodyKind::Unsupported;
}

auto BodySanitizer::parseJson(std::string_view body)
    -> std::optional<nlohmann::json> {
    bool tooDeep = false;
    const nlohmann::json::parser_callback_t limitDepth =
        [&tooDeep](int depth, nlohmann::json::parse_event_t event,
                   nlohmann::json& /*parsed*/) {
            const bool opens =
                event == nlohmann::json::parse_event_t::object_start ||
                event == nlohmann::json::parse_event_t::array_start;
            if (opens && depth >= MAX_JSON_DEPTH) {
                tooDeep = true;
                return false;
            }
            return true;
        };

    auto document = nlohmann::json::parse(body, limitDepth, false);
    if (tooDeep) {
        spdlog::warn("JSON body nested deeper than {} levels", MAX_JSON_DEPTH);
        return std::nullopt;
    }
    if (document.is_discarded()) {
        spdlog::warn("Request declared JSON but the body does not parse");
        return std::nullopt;
    }
    return document;
}

auto BodySanitizer::sanitizeForm(std::string_view body) const -> std::string {
    auto fields = utils::parseForm(body);
    for (auto& field : fields) {
        if (field.hasValue && !policy_.isSensitive(field.name)) {
            field.value = escapeHtml(field.value);
        }
    }
    return utils::serializeForm(fields);
}

void BodySanitizer::sanitizeJson(nlohmann::json& value,
                                 std::string_view key) const {
    if (value.is_string()) {
        if (!policy_.isSensitive(key)) {
            value = escapeHtml(value.get_ref<const std::string&>());
        }
    } else if (value.is_object()) {
        for (auto& [name, child] : value.items()) {
            sanitizeJson(child, name);
        }
    } else if (value.is_array()) {
        // array elements inherit the sensitivity of the enclosing key
        for (auto& child : value) {
            sanitizeJson(child, key);
        }
    }
}

auto BodySanitizer::sanitizeBody(std::string_view contentType,
                                 std::string& body) const -> SanitizeStatus {
    if (body.empty()) {
        return SanitizeStatus::Empty;
    }

    switch (classify(contentType)) {
        case BodyKind::Form:
            body = sanitizeForm(body);
            return SanitizeStatus::Sanitized;

        case BodyKind::Json: {
            auto document = parseJson(body);
            if (!document) {
                return SanitizeStatus::Malformed;
            }
            sanitizeJson(*document);
            body = document->dump();
            return SanitizeStatus::Sanitized;
        }

        case BodyKind::Unsupported:
            break;
    }
    return SanitizeStatus::Unsupported;
}

}  // namespace rampart::security
