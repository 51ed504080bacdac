#include "infrastructure/address_generator.h"
#include "infrastructure/digest.h"
#include "domain/errors.h"
#include "domain/ipv6_network.h"

namespace ip6gen::infrastructure {

using domain::ADDRESS_NIBBLES;

domain::IPv6Address AddressGenerator::generate(const std::string& name, const std::string& cidr) const {
    return generate(name, domain::parse_network(cidr));
}

domain::IPv6Address AddressGenerator::generate(const std::string& name,
                                               const domain::IPv6Network& network) const {
    if (network.is_single_host()) {
        THROW_FULL_ADDRESS(domain::format_address(network.address), network.prefix_length);
    }

    size_t network_len = network.network_nibbles();
    size_t host_len = network.host_nibbles();
    auto digest = Blake2bDigest::hash(name, digest_length_for(host_len));

    // With an odd host length the digest renders one digit too many; the
    // trailing digit is the one dropped.
    if (network_len + host_len != ADDRESS_NIBBLES || digest.size() * 2 < host_len) {
        THROW_ASSEMBLY_ERROR(domain::to_hex_digits(network.address).substr(0, network_len) +
                                 domain::to_hex(digest),
                             "a network/host split of " + std::to_string(network_len) + "+" +
                                 std::to_string(host_len) + " nibbles");
    }

    domain::IPv6Address address{};
    for (size_t i = 0; i < network_len; ++i) {
        domain::set_nibble(address.data(), i, domain::nibble_at(network.address.data(), i));
    }
    for (size_t i = 0; i < host_len; ++i) {
        domain::set_nibble(address.data(), network_len + i, domain::nibble_at(digest.data(), i));
    }

    std::string expanded = domain::format_expanded(address);
    if (!domain::is_valid_ipv6(expanded)) {
        THROW_ASSEMBLY_ERROR(expanded, "an invalid IPv6 syntax");
    }

    return address;
}

std::string AddressGenerator::subnet_hash(const std::string& name) const {
    return Blake2bDigest::hex_digest(name, domain::SUBNET_HASH_BYTES);
}

size_t AddressGenerator::digest_length_for(size_t host_nibbles) {
    return (host_nibbles + 1) / 2;
}

}
