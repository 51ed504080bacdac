#include "application/services.h"
#include "domain/errors.h"
#include "domain/ipv6_network.h"
#include "infrastructure/logger.h"
#include <nlohmann/json.hpp>
#include <sstream>

namespace ip6gen::application {

namespace {

std::string render_address(const domain::IPv6Address& address, bool expanded) {
    return expanded ? domain::format_expanded(address) : domain::format_address(address);
}

}

AddressService::AddressService(infrastructure::AddressGenerator generator,
                               infrastructure::GeneratorConfig config)
    : generator_(generator), config_(std::move(config)) {}

GenerationResult AddressService::generate(const std::string& name,
                                          const std::optional<std::string>& network) const {
    auto results = generate_batch({name}, network);
    return results.front();
}

std::vector<GenerationResult> AddressService::generate_batch(const std::vector<std::string>& names,
                                                             const std::optional<std::string>& network) const {
    std::string cidr = resolve_network(network);
    std::vector<GenerationResult> results;
    results.reserve(names.size());

    std::optional<domain::IPv6Network> parsed;
    std::string network_error;
    try {
        parsed = domain::parse_network(cidr);
    } catch (const domain::InvalidNetworkException& e) {
        network_error = e.what();
        LOG_WARNING("service", "rejected network", {{"network", cidr}, {"error", e.get_diagnostic()}});
    }

    for (const auto& name : names) {
        GenerationResult result;
        result.name = name;
        result.network = cidr;

        if (!parsed) {
            result.error_message = network_error;
            results.push_back(std::move(result));
            continue;
        }

        try {
            result.address = generator_.generate(name, *parsed);
            if (infrastructure::Logger::instance().is_enabled(infrastructure::Logger::LogLevel::DEBUG_LEVEL)) {
                LOG_DEBUG("service", "generated address",
                          {{"name", name}, {"network", cidr},
                           {"address", domain::format_address(*result.address)}});
            }
        } catch (const domain::AlreadyFullAddressException& e) {
            result.error_message = e.what();
            LOG_WARNING("service", "generation failed", {{"name", name}, {"error", e.what()}});
        }

        results.push_back(std::move(result));
    }

    return results;
}

SubnetResult AddressService::subnet(const std::string& name) const {
    SubnetResult result{name, generator_.subnet_hash(name)};
    LOG_DEBUG("service", "generated subnet hash", {{"name", name}, {"subnet", result.subnet}});
    return result;
}

std::vector<SubnetResult> AddressService::subnet_batch(const std::vector<std::string>& names) const {
    std::vector<SubnetResult> results;
    results.reserve(names.size());
    for (const auto& name : names) {
        results.push_back(subnet(name));
    }
    return results;
}

std::string AddressService::format_text(const std::vector<GenerationResult>& results, bool expanded) {
    std::ostringstream oss;
    bool with_names = results.size() > 1;
    for (const auto& result : results) {
        if (!result.is_success()) continue;
        if (with_names) oss << result.name << "\t";
        oss << render_address(*result.address, expanded) << "\n";
    }
    return oss.str();
}

std::string AddressService::format_text(const std::vector<SubnetResult>& results) {
    std::ostringstream oss;
    bool with_names = results.size() > 1;
    for (const auto& result : results) {
        if (with_names) oss << result.name << "\t";
        oss << result.subnet << "\n";
    }
    return oss.str();
}

std::string AddressService::to_json(const std::vector<GenerationResult>& results, bool expanded) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& result : results) {
        nlohmann::json entry;
        entry["name"] = result.name;
        entry["network"] = result.network;
        if (result.is_success()) {
            entry["address"] = render_address(*result.address, expanded);
            entry["error"] = nullptr;
        } else {
            entry["address"] = nullptr;
            entry["error"] = result.error_message;
        }
        array.push_back(entry);
    }
    return array.dump(2);
}

std::string AddressService::to_json(const std::vector<SubnetResult>& results) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& result : results) {
        array.push_back({{"name", result.name}, {"subnet", result.subnet}, {"error", nullptr}});
    }
    return array.dump(2);
}

std::string AddressService::resolve_network(const std::optional<std::string>& network) const {
    if (network && !network->empty()) {
        return *network;
    }
    if (config_.network.empty()) {
        THROW_CONFIG_ERROR("no network given: pass --network or set 'network' in the config");
    }
    return config_.network;
}

}
