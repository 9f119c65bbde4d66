// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint_url.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

namespace tally::rpc::http {

std::string EndpointUrl::to_string() const {
    return absl::StrCat(use_tls ? "https" : "http", "://", host, ":", port, target);
}

std::ostream& operator<<(std::ostream& out, const EndpointUrl& url) {
    out << url.to_string();
    return out;
}

tl::expected<EndpointUrl, std::string> parse_endpoint_url(std::string_view url) {
    EndpointUrl endpoint;
    const std::string_view original{url};
    url = absl::StripAsciiWhitespace(url);
    if (absl::StartsWithIgnoreCase(url, "https://")) {
        url.remove_prefix(8);
        endpoint.use_tls = true;
        endpoint.port = 443;
    } else if (absl::StartsWithIgnoreCase(url, "http://")) {
        url.remove_prefix(7);
        endpoint.use_tls = false;
        endpoint.port = 80;
    } else {
        return tl::unexpected{absl::StrCat("unsupported scheme in URL: ", original)};
    }

    const auto target_start = url.find_first_of("/?");
    std::string_view authority = url.substr(0, target_start);
    if (target_start != std::string_view::npos) {
        const auto target = url.substr(target_start);
        endpoint.target = target.front() == '?' ? absl::StrCat("/", target) : std::string{target};
    }
    if (authority.find('@') != std::string_view::npos) {
        return tl::unexpected{absl::StrCat("user info not supported in URL: ", original)};
    }

    std::string_view port;
    if (absl::StartsWith(authority, "[")) {
        const auto closing = authority.find(']');
        if (closing == std::string_view::npos) {
            return tl::unexpected{absl::StrCat("invalid IPv6 host in URL: ", original)};
        }
        endpoint.host = std::string{authority.substr(1, closing - 1)};
        const auto rest = authority.substr(closing + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return tl::unexpected{absl::StrCat("invalid authority in URL: ", original)};
            }
            port = rest.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        endpoint.host = std::string{authority.substr(0, colon)};
        if (colon != std::string_view::npos) {
            port = authority.substr(colon + 1);
        }
    }
    if (endpoint.host.empty()) {
        return tl::unexpected{absl::StrCat("missing host in URL: ", original)};
    }
    if (!port.empty()) {
        uint32_t port_number{0};
        if (!absl::SimpleAtoi(port, &port_number) || port_number == 0 || port_number > 65535) {
            return tl::unexpected{absl::StrCat("invalid port in URL: ", original)};
        }
        endpoint.port = static_cast<uint16_t>(port_number);
    }
    return endpoint;
}

}  // namespace tally::rpc::http
