// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ip_endpoint_option.hpp"

#include <regex>

#include <absl/strings/numbers.h>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace tally::cmd::common {

IPEndpointValidator::IPEndpointValidator(bool allow_empty) {
    name_ = "IP_ENDPOINT";
    func_ = [allow_empty](const std::string& value) -> std::string {
        if (value.empty() && allow_empty) {
            return {};
        }

        const std::regex pattern(R"(([\da-fA-F\.\:]*)\:([\d]*))");
        std::smatch matches;
        if (!std::regex_match(value, matches, pattern)) {
            return "Value " + value + " is not a valid endpoint";
        }

        boost::system::error_code err;
        boost::asio::ip::make_address(matches[1].str(), err);
        if (err) {
            return "Value " + matches[1].str() + " is not a valid ip address";
        }

        uint32_t port{0};
        if (!absl::SimpleAtoi(matches[2].str(), &port) || port < 1 || port > 65535) {
            return "Value " + matches[2].str() + " is not a valid listening port";
        }

        return {};
    };
}

void add_option_ip_endpoint(CLI::App& cli, const std::string& name, std::string& address, const std::string& description) {
    cli.add_option(name, address, description)
        ->capture_default_str()
        ->check(IPEndpointValidator(/*allow_empty=*/false));
}

}  // namespace tally::cmd::common
