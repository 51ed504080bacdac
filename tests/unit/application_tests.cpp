#include "testing/test_framework.h"
#include "application/services.h"
#include "domain/errors.h"
#include "domain/ipv6_network.h"
#include <nlohmann/json.hpp>

namespace ip6gen::testing {

using ip6gen::application::AddressService;
using ip6gen::infrastructure::AddressGenerator;
using ip6gen::infrastructure::GeneratorConfig;

namespace {

AddressService make_service(const std::string& default_network = "") {
    GeneratorConfig config;
    config.network = default_network;
    return AddressService(AddressGenerator{}, config);
}

}

TEST_SUITE(AddressServiceTests) {
    TEST_CASE(GeneratesWithExplicitNetwork, "an explicit network wins over the configured one") {
        auto service = make_service("fd00::/8");
        auto result = service.generate("c0a010fb-2632-40cb-a105-90297cba567a", std::string("fd52:f6b0:3162::/48"));

        ASSERT_TRUE(result.is_success());
        ASSERT_EQ(std::string("fd52:f6b0:3162::/48"), result.network);
        ASSERT_EQ(std::string("fd52:f6b0:3162:440c:925b:0b5c:b23c:600e"),
                  ip6gen::domain::format_expanded(*result.address));
    } END_TEST_CASE

    TEST_CASE(FallsBackToConfiguredNetwork, "no network argument uses the config value") {
        auto service = make_service("fd00::/8");
        auto result = service.generate("");

        ASSERT_TRUE(result.is_success());
        ASSERT_EQ(std::string("fd00::/8"), result.network);
        ASSERT_EQ(std::string("fdb7:db87:196c:4834:05e4:0f84:01fa:1fc9"),
                  ip6gen::domain::format_expanded(*result.address));
    } END_TEST_CASE

    TEST_CASE(MissingNetworkIsConfigurationError, "with nothing configured a network is required") {
        auto service = make_service();
        ASSERT_THROWS(ip6gen::domain::ConfigurationException, service.generate("web-01"));
        ASSERT_THROWS(ip6gen::domain::ConfigurationException, service.generate("web-01", std::string("")));
    } END_TEST_CASE

    TEST_CASE(InvalidNetworkFailsEveryName, "a bad network is reported per result") {
        auto service = make_service();
        auto results = service.generate_batch({"a", "b"}, std::string("not-a-cidr"));

        ASSERT_EQ(2u, results.size());
        for (const auto& result : results) {
            ASSERT_FALSE(result.is_success());
            ASSERT_CONTAINS(result.error_message, "not-a-cidr");
        }
    } END_TEST_CASE

    TEST_CASE(FullAddressIsReported, "a /128 produces an error result instead of throwing") {
        auto service = make_service();
        auto result = service.generate("web-01", std::string("fd52:f6b0:3162::/128"));

        ASSERT_FALSE(result.is_success());
        ASSERT_CONTAINS(result.error_message, "already a full IPv6 address");
    } END_TEST_CASE

    TEST_CASE(BatchKeepsOrder, "results follow the order of the names") {
        auto service = make_service("fd52:f6b0:3162::/64");
        auto results = service.generate_batch({"c", "a", "b"});

        ASSERT_EQ(3u, results.size());
        ASSERT_EQ(std::string("c"), results[0].name);
        ASSERT_EQ(std::string("a"), results[1].name);
        ASSERT_EQ(std::string("b"), results[2].name);
        ASSERT_TRUE(*results[0].address == AddressGenerator{}.generate("c", "fd52:f6b0:3162::/64"));
    } END_TEST_CASE

    TEST_CASE(SubnetBatch, "subnet tags come back in name order") {
        auto service = make_service();
        auto results = service.subnet_batch({"alpha", "beta"});

        ASSERT_EQ(2u, results.size());
        ASSERT_EQ(std::string("0cf8"), results[0].subnet);
        ASSERT_EQ(std::string("d5f0"), results[1].subnet);
        ASSERT_EQ(std::string("alpha"), service.subnet("alpha").name);
    } END_TEST_CASE
}
END_TEST_SUITE()

TEST_SUITE(AddressServiceOutputTests) {
    TEST_CASE(SingleResultTextIsBare, "one name prints only the address") {
        auto service = make_service("fd52:f6b0:3162::/48");
        auto results = service.generate_batch({"c0a010fb-2632-40cb-a105-90297cba567a"});

        ASSERT_EQ(std::string("fd52:f6b0:3162:440c:925b:b5c:b23c:600e\n"),
                  AddressService::format_text(results, false));
        ASSERT_EQ(std::string("fd52:f6b0:3162:440c:925b:0b5c:b23c:600e\n"),
                  AddressService::format_text(results, true));
    } END_TEST_CASE

    TEST_CASE(MultipleResultsAreTabSeparated, "several names print name and value per line") {
        auto service = make_service();
        auto text = AddressService::format_text(service.subnet_batch({"alpha", "beta"}));

        ASSERT_EQ(std::string("alpha\t0cf8\nbeta\td5f0\n"), text);
    } END_TEST_CASE

    TEST_CASE(FailuresAreLeftOutOfText, "only successful results reach the text output") {
        auto service = make_service();
        std::vector<ip6gen::application::GenerationResult> results;
        results.push_back(service.generate("web-01", std::string("fd52:f6b0:3162::/50")));
        results.push_back(service.generate("web-01", std::string("fd52::/128")));

        ASSERT_EQ(std::string("web-01\tfd52:f6b0:3162:23e4:975d:6a84:34b9:208f\n"),
                  AddressService::format_text(results, false));
    } END_TEST_CASE

    TEST_CASE(JsonCarriesErrors, "json output has one object per name with address or error") {
        auto service = make_service();
        std::vector<ip6gen::application::GenerationResult> results;
        results.push_back(service.generate("web-01", std::string("::/0")));
        results.push_back(service.generate("web-01", std::string("fd52::/128")));

        auto json = nlohmann::json::parse(AddressService::to_json(results, true));

        ASSERT_TRUE(json.is_array());
        ASSERT_EQ(2u, json.size());
        ASSERT_EQ(std::string("web-01"), json[0]["name"].get<std::string>());
        ASSERT_EQ(std::string("::/0"), json[0]["network"].get<std::string>());
        ASSERT_EQ(std::string("387a:b2ce:e11b:a9be:d30b:514d:2b5a:124b"), json[0]["address"].get<std::string>());
        ASSERT_TRUE(json[0]["error"].is_null());
        ASSERT_TRUE(json[1]["address"].is_null());
        ASSERT_CONTAINS(json[1]["error"].get<std::string>(), "fd52::/128");
    } END_TEST_CASE

    TEST_CASE(SubnetJson, "subnet json pairs names with tags") {
        auto service = make_service();
        auto json = nlohmann::json::parse(AddressService::to_json(service.subnet_batch({"beta"})));

        ASSERT_EQ(1u, json.size());
        ASSERT_EQ(std::string("beta"), json[0]["name"].get<std::string>());
        ASSERT_EQ(std::string("d5f0"), json[0]["subnet"].get<std::string>());
    } END_TEST_CASE
}
END_TEST_SUITE()

}
