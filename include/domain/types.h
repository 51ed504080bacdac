#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>

namespace ip6gen::domain {

using IPv6Address = std::array<uint8_t, 16>;

constexpr size_t ADDRESS_BITS = 128;
constexpr size_t ADDRESS_NIBBLES = 32;
constexpr size_t ADDRESS_GROUPS = 8;
constexpr uint8_t MAX_PREFIX_LENGTH = 128;
constexpr size_t SUBNET_HASH_BYTES = 2;

struct IPv6Network {
    IPv6Address address{};
    uint8_t prefix_length{MAX_PREFIX_LENGTH};

    // Leading nibbles that belong to the network; a partial boundary nibble is kept whole.
    size_t network_nibbles() const { return prefix_length / 4; }
    size_t host_nibbles() const { return ADDRESS_NIBBLES - network_nibbles(); }
    bool is_single_host() const { return prefix_length == MAX_PREFIX_LENGTH; }

    bool operator==(const IPv6Network& other) const {
        return address == other.address && prefix_length == other.prefix_length;
    }
};

inline std::ostream& operator<<(std::ostream& os, const IPv6Address& addr) {
    auto flags = os.flags();
    auto fill = os.fill('0');
    os << std::hex;
    for (size_t i = 0; i < addr.size(); i += 2) {
        if (i > 0) os << ":";
        os << std::setw(2) << static_cast<int>(addr[i])
           << std::setw(2) << static_cast<int>(addr[i + 1]);
    }
    os.fill(fill);
    os.flags(flags);
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const IPv6Network& net) {
    return os << net.address << "/" << static_cast<int>(net.prefix_length);
}

}

namespace std {
    template<>
    struct hash<ip6gen::domain::IPv6Address> {
        size_t operator()(const ip6gen::domain::IPv6Address& addr) const noexcept {
            size_t result = 0;
            for (size_t i = 0; i < addr.size(); ++i) {
                result ^= hash<uint8_t>{}(addr[i]) + 0x9e3779b9 + (result << 6) + (result >> 2);
            }
            return result;
        }
    };
}
