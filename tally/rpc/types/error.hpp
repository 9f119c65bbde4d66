// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace tally::rpc {

//! Failure classes surfaced by the block summary pipeline
enum class ErrorKind {
    kInvalidArgument,   // bad caller input, e.g. negative block number
    kTransportError,    // network, timeout or non-2xx HTTP status reaching the node
    kRpcProtocolError,  // node reachable but returned a JSON-RPC error or garbage
    kNotFound,          // requested block does not exist (yet)
    kInternal,          // anything else
};

struct Error {
    ErrorKind kind{ErrorKind::kInternal};
    std::string message;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& out, const Error& error);

//! Result-or-error returned at each layer boundary
template <typename T>
using Result = tl::expected<T, Error>;

inline tl::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return tl::unexpected<Error>{Error{kind, std::move(message)}};
}

//! HTTP status code reported to callers for the given failure class
unsigned to_http_status(ErrorKind kind);

}  // namespace tally::rpc
