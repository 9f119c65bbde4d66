// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tally::rpc::http {

struct Target {
    std::string_view path;
    std::string_view query;
};

//! Split request-target into path and query, dropping any fragment
Target split_target(std::string_view target);

//! Decode %XX escapes and '+' as space; malformed escapes are kept verbatim
std::string percent_decode(std::string_view encoded);

//! Decoded value of the named query parameter, the last occurrence wins
std::optional<std::string> find_query_param(std::string_view query, std::string_view name);

}  // namespace tally::rpc::http
