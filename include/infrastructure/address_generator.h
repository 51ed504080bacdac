#pragma once

#include "domain/types.h"
#include <string>

namespace ip6gen::infrastructure {

// Derives a stable address inside a network from an arbitrary name.
//
// The network keeps its first prefix/4 nibbles; the remaining host nibbles
// are the leading hex digits of an unkeyed BLAKE2b digest of the name, sized
// to ceil(host_nibbles / 2) bytes. Stateless: safe to share between threads.
class AddressGenerator {
public:
    // Throws InvalidNetworkException, AlreadyFullAddressException or AssemblyException.
    domain::IPv6Address generate(const std::string& name, const std::string& cidr) const;
    domain::IPv6Address generate(const std::string& name, const domain::IPv6Network& network) const;

    // Four lowercase hex digits from a 2-byte digest of the name.
    std::string subnet_hash(const std::string& name) const;

    static size_t digest_length_for(size_t host_nibbles);
};

}
