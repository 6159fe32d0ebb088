/*
 * form_codec.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "form_codec.hpp"

#include <cctype>

namespace rampart::utils {

namespace {

auto hexDigit(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

}  // namespace

auto urlDecode(std::string_view text, bool plusAsSpace) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            const int hi = hexDigit(text[i + 1]);
            const int lo = hexDigit(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(plusAsSpace && c == '+' ? ' ' : c);
    }
    return out;
}

auto urlEncode(std::string_view text) -> std::string {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

auto parseForm(std::string_view body) -> std::vector<FormField> {
    std::vector<FormField> fields;
    std::size_t start = 0;
    while (start <= body.size()) {
        auto end = body.find('&', start);
        if (end == std::string_view::npos) {
            end = body.size();
        }
        const auto pair = body.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                fields.push_back({urlDecode(pair), {}, false});
            } else {
                fields.push_back({urlDecode(pair.substr(0, eq)),
                                  urlDecode(pair.substr(eq + 1)), true});
            }
        }
        start = end + 1;
    }
    return fields;
}

auto serializeForm(const std::vector<FormField>& fields) -> std::string {
    std::string out;
    for (const auto& field : fields) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += urlEncode(field.name);
        if (field.hasValue) {
            out.push_back('=');
            out += urlEncode(field.value);
        }
    }
    return out;
}

auto findFormValue(std::string_view body, std::string_view name)
    -> std::optional<std::string> {
    for (auto& field : parseForm(body)) {
        if (field.name == name && field.hasValue) {
            return std::move(field.value);
        }
    }
    return std::nullopt;
}

}  // namespace rampart::utils
