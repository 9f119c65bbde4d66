// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <optional>
#include <string>
#include <utility>

#include <absl/strings/str_cat.h>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <tally/infra/common/log.hpp>
#include <tally/rpc/json/types.hpp>

namespace tally::rpc::json_rpc {

static constexpr std::string_view kTransportErrorPrefix{"Network or HTTP error while calling RPC: "};

Task<Result<nlohmann::json>> Client::call(std::string_view method, nlohmann::json params) {
    const auto request = make_json_request(kRequestId, method, std::move(params));
    TALLY_DEBUG << "json_rpc::Client::call request: " << request.dump();

    http::PostReply reply;
    std::optional<Error> transport_error;
    try {
        reply = co_await transport_.post(request.dump());
    } catch (const boost::system::system_error& se) {
        // Cancellation of the caller is not a transport failure: let it unwind the coroutine chain
        if (se.code() == boost::asio::error::operation_aborted) {
            throw;
        }
        transport_error = Error{ErrorKind::kTransportError, absl::StrCat(kTransportErrorPrefix, se.what())};
    }
    if (transport_error) {
        TALLY_WARN << "json_rpc::Client::call method: " << method << " " << *transport_error;
        co_return tl::unexpected{*transport_error};
    }

    TALLY_TRACE << "json_rpc::Client::call status: " << reply.status << " response: " << reply.body;

    const auto response = nlohmann::json::parse(reply.body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (response.is_object()) {
        if (const auto error = response.find("error"); error != response.end()) {
            TALLY_WARN << "json_rpc::Client::call method: " << method << " error: " << error->dump();
            co_return make_error(ErrorKind::kRpcProtocolError, absl::StrCat("RPC error: ", error->dump()));
        }
    }
    if (reply.status < 200 || reply.status >= 300) {
        TALLY_WARN << "json_rpc::Client::call method: " << method << " HTTP status: " << reply.status;
        co_return make_error(ErrorKind::kTransportError, absl::StrCat(kTransportErrorPrefix, "HTTP status ", reply.status));
    }
    if (response.is_discarded()) {
        co_return make_error(ErrorKind::kRpcProtocolError, "Invalid JSON-RPC response: malformed JSON");
    }
    if (!response.is_object()) {
        co_return make_error(ErrorKind::kRpcProtocolError, "Invalid JSON-RPC response: not a JSON object");
    }

    const auto result = response.find("result");
    co_return result != response.end() ? *result : nlohmann::json(nullptr);
}

}  // namespace tally::rpc::json_rpc
