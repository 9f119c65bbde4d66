// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <tally/rpc/types/block.hpp>
#include <tally/rpc/types/block_summary.hpp>

namespace tally::rpc {

inline constexpr const char* kJsonVersion{"2.0"};

//! Hex quantity with "0x" prefix and no leading zeros ("0x0" for zero)
std::string to_quantity(uint64_t number);

//! Parse a hex quantity, with or without "0x" prefix; nullopt if empty, malformed or out of range
std::optional<uint64_t> from_quantity(std::string_view hex_quantity);

nlohmann::json make_json_request(uint32_t id, std::string_view method, nlohmann::json params);

//! Detail-only body used for every HTTP error reply
nlohmann::json make_json_detail(std::string_view message);

void from_json(const nlohmann::json& json, Transaction& transaction);
void from_json(const nlohmann::json& json, Block& block);

void to_json(nlohmann::json& json, const BlockSummary& summary);

}  // namespace tally::rpc
