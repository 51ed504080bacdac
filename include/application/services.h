#pragma once

#include "domain/types.h"
#include "infrastructure/address_generator.h"
#include "infrastructure/config_manager.h"
#include <optional>
#include <string>
#include <vector>

namespace ip6gen::application {

struct GenerationResult {
    std::string name;
    std::string network;
    std::optional<domain::IPv6Address> address;
    std::string error_message;

    bool is_success() const { return address.has_value(); }
};

struct SubnetResult {
    std::string name;
    std::string subnet;
};

// Front door for callers that work on batches of names and want per-name
// failures reported instead of thrown.
class AddressService {
public:
    AddressService(infrastructure::AddressGenerator generator, infrastructure::GeneratorConfig config);

    // Falls back to the configured network when none is given. User errors
    // land in the result; AssemblyException still propagates.
    GenerationResult generate(const std::string& name,
                              const std::optional<std::string>& network = std::nullopt) const;
    std::vector<GenerationResult> generate_batch(const std::vector<std::string>& names,
                                                 const std::optional<std::string>& network = std::nullopt) const;

    SubnetResult subnet(const std::string& name) const;
    std::vector<SubnetResult> subnet_batch(const std::vector<std::string>& names) const;

    const infrastructure::GeneratorConfig& get_config() const { return config_; }

    static std::string format_text(const std::vector<GenerationResult>& results, bool expanded);
    static std::string format_text(const std::vector<SubnetResult>& results);
    static std::string to_json(const std::vector<GenerationResult>& results, bool expanded);
    static std::string to_json(const std::vector<SubnetResult>& results);

private:
    std::string resolve_network(const std::optional<std::string>& network) const;

    infrastructure::AddressGenerator generator_;
    infrastructure::GeneratorConfig config_;
};

}
