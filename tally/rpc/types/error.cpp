// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <sstream>

#include <magic_enum.hpp>

namespace tally::rpc {

std::ostream& operator<<(std::ostream& out, const Error& error) {
    out << error.to_string();
    return out;
}

std::string Error::to_string() const {
    std::stringstream out;
    out << magic_enum::enum_name(kind) << ": " << message;
    return out.str();
}

unsigned to_http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidArgument:
            return 400;
        case ErrorKind::kTransportError:
        case ErrorKind::kRpcProtocolError:
        case ErrorKind::kNotFound:
            return 502;
        case ErrorKind::kInternal:
            return 500;
    }
    return 500;
}

}  // namespace tally::rpc
