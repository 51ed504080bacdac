#pragma once

#include "domain/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ip6gen::domain {

std::optional<IPv6Address> parse_address(const std::string& text);

// Parses "<ipv6-address>/<prefix>". A missing prefix means /128.
// Throws InvalidNetworkException with the parser diagnostic.
IPv6Network parse_network(const std::string& cidr);

bool is_valid_ipv6(const std::string& text);

// RFC 5952 compressed text, e.g. "fd52:f6b0:3162::1".
std::string format_address(const IPv6Address& address);
// Eight zero-padded groups of four digits.
std::string format_expanded(const IPv6Address& address);
// All 32 nibbles, no separators.
std::string to_hex_digits(const IPv6Address& address);
std::string format_network(const IPv6Network& network);

std::string to_hex(const std::vector<uint8_t>& bytes);

// Nibble 0 is the high half of byte 0.
uint8_t nibble_at(const uint8_t* bytes, size_t index);
void set_nibble(uint8_t* bytes, size_t index, uint8_t value);

}
