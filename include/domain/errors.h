#pragma once

#include <cstdint>
#include <exception>
#include <string>

namespace ip6gen::domain {

enum class ErrorCategory {
    NETWORK,
    ASSEMBLY,
    SECURITY,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string error_category_to_string(ErrorCategory category);
std::string error_severity_to_string(ErrorSeverity severity);

class IP6GenException : public std::exception {
public:
    IP6GenException(const std::string& message, ErrorCategory category = ErrorCategory::UNKNOWN,
                    ErrorSeverity severity = ErrorSeverity::MEDIUM)
        : message_(message), category_(category), severity_(severity) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCategory get_category() const { return category_; }
    ErrorSeverity get_severity() const { return severity_; }

private:
    std::string message_;
    ErrorCategory category_;
    ErrorSeverity severity_;
};

// The CIDR text is not a valid IPv6 network.
class InvalidNetworkException : public IP6GenException {
public:
    InvalidNetworkException(const std::string& cidr, const std::string& diagnostic)
        : IP6GenException("invalid IPv6 network '" + cidr + "': " + diagnostic,
                          ErrorCategory::NETWORK, ErrorSeverity::MEDIUM)
        , cidr_(cidr), diagnostic_(diagnostic) {}

    const std::string& get_cidr() const { return cidr_; }
    const std::string& get_diagnostic() const { return diagnostic_; }

private:
    std::string cidr_;
    std::string diagnostic_;
};

// A /128 leaves no host nibbles to generate.
class AlreadyFullAddressException : public IP6GenException {
public:
    AlreadyFullAddressException(const std::string& address, uint8_t prefix_length)
        : IP6GenException(address + "/" + std::to_string(prefix_length) +
                          " is already a full IPv6 address",
                          ErrorCategory::NETWORK, ErrorSeverity::MEDIUM)
        , address_(address), prefix_length_(prefix_length) {}

    const std::string& get_address() const { return address_; }
    uint8_t get_prefix_length() const { return prefix_length_; }

private:
    std::string address_;
    uint8_t prefix_length_;
};

// Region arithmetic produced something that is not an address. Always a defect.
class AssemblyException : public IP6GenException {
public:
    AssemblyException(const std::string& generated, const std::string& reason)
        : IP6GenException("generated IPv6 address (" + generated + ") has " + reason,
                          ErrorCategory::ASSEMBLY, ErrorSeverity::CRITICAL)
        , generated_(generated) {}

    const std::string& get_generated() const { return generated_; }

private:
    std::string generated_;
};

// The crypto provider could not produce the requested digest.
class DigestException : public IP6GenException {
public:
    DigestException(const std::string& message)
        : IP6GenException(message, ErrorCategory::SECURITY, ErrorSeverity::CRITICAL) {}
};

class ConfigurationException : public IP6GenException {
public:
    ConfigurationException(const std::string& message)
        : IP6GenException(message, ErrorCategory::CONFIGURATION, ErrorSeverity::HIGH) {}
};

#define THROW_INVALID_NETWORK(cidr, diagnostic) \
    throw ::ip6gen::domain::InvalidNetworkException(cidr, diagnostic)
#define THROW_FULL_ADDRESS(address, prefix) \
    throw ::ip6gen::domain::AlreadyFullAddressException(address, prefix)
#define THROW_ASSEMBLY_ERROR(generated, reason) \
    throw ::ip6gen::domain::AssemblyException(generated, reason)
#define THROW_DIGEST_ERROR(msg) throw ::ip6gen::domain::DigestException(msg)
#define THROW_CONFIG_ERROR(msg) throw ::ip6gen::domain::ConfigurationException(msg)

}
