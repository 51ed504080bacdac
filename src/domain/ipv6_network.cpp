#include "domain/ipv6_network.h"
#include "domain/errors.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <iomanip>
#include <netinet/in.h>
#include <sstream>

namespace ip6gen::domain {

namespace {

// Unsigned decimal with an optional leading '+' and any number of leading zeros.
std::optional<uint8_t> parse_prefix(const std::string& text) {
    std::string digits = !text.empty() && text[0] == '+' ? text.substr(1) : text;
    if (digits.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
    if (digits.size() > 3) {
        return std::nullopt;
    }
    int value = std::stoi(digits);
    if (value > MAX_PREFIX_LENGTH) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(value);
}

}

std::optional<IPv6Address> parse_address(const std::string& text) {
    struct in6_addr raw{};
    if (inet_pton(AF_INET6, text.c_str(), &raw) != 1) {
        return std::nullopt;
    }

    IPv6Address address{};
    std::copy(std::begin(raw.s6_addr), std::end(raw.s6_addr), address.begin());
    return address;
}

IPv6Network parse_network(const std::string& cidr) {
    auto slash = cidr.find('/');
    if (slash != std::string::npos && cidr.find('/', slash + 1) != std::string::npos) {
        THROW_INVALID_NETWORK(cidr, "invalid cidr format");
    }

    std::string address_text = cidr.substr(0, slash);
    auto address = parse_address(address_text);
    if (!address) {
        THROW_INVALID_NETWORK(cidr, "invalid address '" + address_text + "'");
    }

    IPv6Network network;
    network.address = *address;

    if (slash != std::string::npos) {
        std::string prefix_text = cidr.substr(slash + 1);
        auto prefix = parse_prefix(prefix_text);
        if (!prefix) {
            THROW_INVALID_NETWORK(cidr, "invalid prefix '" + prefix_text + "'");
        }
        network.prefix_length = *prefix;
    }

    return network;
}

bool is_valid_ipv6(const std::string& text) {
    return parse_address(text).has_value();
}

std::string format_address(const IPv6Address& address) {
    struct in6_addr raw{};
    std::copy(address.begin(), address.end(), std::begin(raw.s6_addr));

    char buffer[INET6_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET6, &raw, buffer, sizeof(buffer)) == nullptr) {
        return format_expanded(address);
    }
    return buffer;
}

std::string format_expanded(const IPv6Address& address) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < address.size(); i += 2) {
        if (i > 0) oss << ":";
        uint16_t word = (static_cast<uint16_t>(address[i]) << 8) | address[i + 1];
        oss << std::setw(4) << word;
    }

    return oss.str();
}

std::string to_hex_digits(const IPv6Address& address) {
    return to_hex(std::vector<uint8_t>(address.begin(), address.end()));
}

std::string format_network(const IPv6Network& network) {
    return format_address(network.address) + "/" + std::to_string(network.prefix_length);
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

uint8_t nibble_at(const uint8_t* bytes, size_t index) {
    uint8_t byte = bytes[index / 2];
    return (index % 2 == 0) ? static_cast<uint8_t>(byte >> 4) : static_cast<uint8_t>(byte & 0x0f);
}

void set_nibble(uint8_t* bytes, size_t index, uint8_t value) {
    uint8_t& byte = bytes[index / 2];
    if (index % 2 == 0) {
        byte = static_cast<uint8_t>((byte & 0x0f) | ((value & 0x0f) << 4));
    } else {
        byte = static_cast<uint8_t>((byte & 0xf0) | (value & 0x0f));
    }
}

}
