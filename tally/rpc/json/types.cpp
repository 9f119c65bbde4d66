// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <charconv>
#include <utility>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace tally::rpc {

std::string to_quantity(uint64_t number) {
    return absl::StrCat("0x", absl::Hex(number));
}

std::optional<uint64_t> from_quantity(std::string_view hex_quantity) {
    if (absl::StartsWithIgnoreCase(hex_quantity, "0x")) {
        hex_quantity.remove_prefix(2);
    }
    if (hex_quantity.empty()) {
        return std::nullopt;
    }
    uint64_t number{0};
    const auto* end = hex_quantity.data() + hex_quantity.size();
    const auto [ptr, ec] = std::from_chars(hex_quantity.data(), end, number, 16);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return number;
}

nlohmann::json make_json_request(uint32_t id, std::string_view method, nlohmann::json params) {
    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

nlohmann::json make_json_detail(std::string_view message) {
    return {{"detail", message}};
}

//! String member value, absent when missing, null or not a string
static std::optional<std::string> optional_string(const nlohmann::json& json, const char* key) {
    const auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void from_json(const nlohmann::json& json, Transaction& transaction) {
    if (!json.is_object()) {
        transaction = Transaction{};
        return;
    }
    transaction.from = optional_string(json, "from");
    transaction.to = optional_string(json, "to");
}

void from_json(const nlohmann::json& json, Block& block) {
    block.number = optional_string(json, "number");
    block.hash = optional_string(json, "hash");
    block.transactions.clear();
    const auto it = json.find("transactions");
    if (it == json.end() || !it->is_array()) {
        return;
    }
    block.transactions.reserve(it->size());
    for (const auto& tx : *it) {
        block.transactions.push_back(tx.get<Transaction>());
    }
}

static nlohmann::json make_json_tally(const AddressTally& tally) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [address, count] : tally) {
        json[address] = count;
    }
    return json;
}

void to_json(nlohmann::json& json, const BlockSummary& summary) {
    json["block_number"] = summary.block_number ? nlohmann::json(*summary.block_number) : nlohmann::json(nullptr);
    json["block_hash"] = summary.block_hash ? nlohmann::json(*summary.block_hash) : nlohmann::json(nullptr);
    json["total_transactions"] = summary.total_transactions;
    json["by_sender"] = make_json_tally(summary.by_sender);
    json["by_receiver"] = make_json_tally(summary.by_receiver);
}

}  // namespace tally::rpc
