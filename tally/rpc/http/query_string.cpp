// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "query_string.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>

namespace tally::rpc::http {

Target split_target(std::string_view target) {
    target = target.substr(0, target.find('#'));
    const auto question_mark = target.find('?');
    if (question_mark == std::string_view::npos) {
        return {target, {}};
    }
    return {target.substr(0, question_mark), target.substr(question_mark + 1)};
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    return absl::ascii_tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

std::string percent_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (size_t i{0}; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c == '+') {
            decoded.push_back(' ');
        } else if (c == '%' && i + 2 < encoded.size() &&
                   absl::ascii_isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
                   absl::ascii_isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            decoded.push_back(static_cast<char>(hex_value(encoded[i + 1]) * 16 + hex_value(encoded[i + 2])));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }
    return decoded;
}

std::optional<std::string> find_query_param(std::string_view query, std::string_view name) {
    std::optional<std::string> value;
    for (const std::string_view pair : absl::StrSplit(query, '&', absl::SkipEmpty())) {
        const std::pair<std::string_view, std::string_view> key_value = absl::StrSplit(pair, absl::MaxSplits('=', 1));
        if (percent_decode(key_value.first) == name) {
            value = percent_decode(key_value.second);
        }
    }
    return value;
}

}  // namespace tally::rpc::http
