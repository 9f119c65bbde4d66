// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace tally::rpc::http {

//! Location of the JSON-RPC node
struct EndpointUrl {
    bool use_tls{true};
    std::string host;
    uint16_t port{443};
    std::string target{"/"};

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& out, const EndpointUrl& url);

//! Parse http[s]://host[:port][/path][?query] URLs, IPv6 hosts in brackets
tl::expected<EndpointUrl, std::string> parse_endpoint_url(std::string_view url);

}  // namespace tally::rpc::http
