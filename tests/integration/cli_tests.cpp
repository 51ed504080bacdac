#include "testing/test_framework.h"
#include "presentation/cli.h"
#include "domain/errors.h"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace ip6gen::testing {

using ip6gen::presentation::CLIManager;

namespace {

struct CLIRun {
    int exit_code;
    std::string out;
    std::string err;
};

CLIRun run_cli(const std::vector<std::string>& args) {
    std::ostringstream out;
    std::ostringstream err;
    CLIManager cli(out, err);
    int code = cli.run(args);
    return {code, out.str(), err.str()};
}

std::string write_temp_file(const std::string& filename, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / filename;
    std::ofstream file(path);
    file << content;
    return path.string();
}

}

TEST_SUITE(CLIAddressTests) {
    TEST_CASE(SingleNameWithNetwork, "prints the compressed address and exits 0") {
        auto run = run_cli({"address", "--network", "fd52:f6b0:3162::/48",
                            "c0a010fb-2632-40cb-a105-90297cba567a"});

        ASSERT_EQ(ip6gen::presentation::EXIT_OK, run.exit_code);
        ASSERT_EQ(std::string("fd52:f6b0:3162:440c:925b:b5c:b23c:600e\n"), run.out);
        ASSERT_EQ(std::string(""), run.err);
    } END_TEST_CASE

    TEST_CASE(ExpandedFlag, "--expanded pads every group") {
        auto run = run_cli({"address", "--network=fd52:f6b0:3162::/64", "--expanded",
                            "c0a010fb-2632-40cb-a105-90297cba567a"});

        ASSERT_EQ(0, run.exit_code);
        ASSERT_EQ(std::string("fd52:f6b0:3162:0000:dfae:9d64:312d:7096\n"), run.out);
    } END_TEST_CASE

    TEST_CASE(JsonFormat, "--format json prints an array of results") {
        auto run = run_cli({"--format", "json", "address", "--network", "::/0", "web-01"});

        ASSERT_EQ(0, run.exit_code);
        auto json = nlohmann::json::parse(run.out);
        ASSERT_EQ(1u, json.size());
        ASSERT_EQ(std::string("387a:b2ce:e11b:a9be:d30b:514d:2b5a:124b"), json[0]["address"].get<std::string>());
    } END_TEST_CASE

    TEST_CASE(FullAddressExitsWithUserError, "a /128 network is a user error") {
        auto run = run_cli({"address", "--network", "fd52:f6b0:3162::/128", "web-01"});

        ASSERT_EQ(ip6gen::presentation::EXIT_USER_ERROR, run.exit_code);
        ASSERT_EQ(std::string(""), run.out);
        ASSERT_CONTAINS(run.err, "already a full IPv6 address");
    } END_TEST_CASE

    TEST_CASE(InvalidNetworkExitsWithUserError, "an unparsable network is a user error") {
        auto run = run_cli({"address", "--network", "bogus", "web-01"});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.err, "invalid IPv6 network 'bogus'");
    } END_TEST_CASE

    TEST_CASE(MissingNetworkIsConfigError, "no --network and no configured default exits 2") {
        auto run = run_cli({"address", "web-01"});

        ASSERT_EQ(ip6gen::presentation::EXIT_CONFIG_ERROR, run.exit_code);
        ASSERT_CONTAINS(run.err, "no network given");
    } END_TEST_CASE

    TEST_CASE(NoNamesIsUsageError, "the address command needs at least one name") {
        auto run = run_cli({"address", "--network", "fd00::/8"});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.err, "no names given");
    } END_TEST_CASE

    TEST_CASE(NamesFile, "names are read one per line, blank lines skipped") {
        auto path = write_temp_file("ip6gen_cli_names.txt", "alpha\r\n\nbeta\n");
        auto run = run_cli({"subnet", "--names-file", path});
        std::filesystem::remove(path);

        ASSERT_EQ(0, run.exit_code);
        ASSERT_EQ(std::string("alpha\t0cf8\nbeta\td5f0\n"), run.out);
    } END_TEST_CASE

    TEST_CASE(MissingNamesFile, "an unreadable names file is a user error") {
        auto run = run_cli({"subnet", "--names-file", "/nonexistent/ip6gen/names.txt"});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.err, "failed to open names file");
    } END_TEST_CASE

    TEST_CASE(ReadNamesFileDirectly, "readNamesFile strips carriage returns") {
        auto path = write_temp_file("ip6gen_cli_names_direct.txt", "one\r\ntwo\n\n");
        auto names = ip6gen::presentation::readNamesFile(path);
        std::filesystem::remove(path);

        ASSERT_EQ(2u, names.size());
        ASSERT_EQ(std::string("one"), names[0]);
        ASSERT_EQ(std::string("two"), names[1]);
        ASSERT_THROWS(ip6gen::domain::IP6GenException,
                      ip6gen::presentation::readNamesFile("/nonexistent/ip6gen/names.txt"));
    } END_TEST_CASE
}
END_TEST_SUITE()

TEST_SUITE(CLIConfigTests) {
    TEST_CASE(ConfiguredDefaultNetwork, "the config file supplies the network") {
        auto path = write_temp_file("ip6gen_cli_config.yaml",
                                    "network: fd00::/8\noutput:\n  expanded: true\n");
        auto run = run_cli({"--config", path, "address", ""});
        std::filesystem::remove(path);

        ASSERT_EQ(0, run.exit_code);
        ASSERT_EQ(std::string("fdb7:db87:196c:4834:05e4:0f84:01fa:1fc9\n"), run.out);
    } END_TEST_CASE

    TEST_CASE(MissingConfigFile, "a config file that does not exist exits 2") {
        auto run = run_cli({"--config", "/nonexistent/ip6gen.yaml", "subnet", "alpha"});

        ASSERT_EQ(ip6gen::presentation::EXIT_CONFIG_ERROR, run.exit_code);
        ASSERT_CONTAINS(run.err, "failed to open config file");
    } END_TEST_CASE

    TEST_CASE(InvalidConfigBlocksGeneration, "a full-address default network fails validation") {
        auto path = write_temp_file("ip6gen_cli_bad_config.yaml", "network: fd00::1/128\n");
        auto run = run_cli({"--config", path, "subnet", "alpha"});
        std::filesystem::remove(path);

        ASSERT_EQ(2, run.exit_code);
        ASSERT_CONTAINS(run.err, "network");
    } END_TEST_CASE

    TEST_CASE(UnknownLogLevel, "--log-level with an unknown level fails validation") {
        auto run = run_cli({"--log-level", "loud", "subnet", "alpha"});

        ASSERT_EQ(2, run.exit_code);
        ASSERT_CONTAINS(run.err, "logging.level");
    } END_TEST_CASE

    TEST_CASE(ValidateCommand, "config validate reports a valid default configuration") {
        auto run = run_cli({"config", "validate"});

        ASSERT_EQ(0, run.exit_code);
        ASSERT_EQ(std::string("configuration is valid\n"), run.out);
    } END_TEST_CASE

    TEST_CASE(ValidateCommandReportsErrors, "config validate lists every problem and exits 2") {
        auto run = run_cli({"--format", "xml", "config", "validate"});

        ASSERT_EQ(2, run.exit_code);
        ASSERT_CONTAINS(run.err, "output.format");
    } END_TEST_CASE

    TEST_CASE(ShowCommandAsJson, "config show exports the effective configuration") {
        auto run = run_cli({"--format", "json", "config", "show"});

        ASSERT_EQ(0, run.exit_code);
        auto json = nlohmann::json::parse(run.out);
        ASSERT_EQ(std::string("json"), json["output"]["format"].get<std::string>());
    } END_TEST_CASE
}
END_TEST_SUITE()

TEST_SUITE(CLIDispatchTests) {
    TEST_CASE(HelpListsCommands, "help shows every registered command") {
        auto run = run_cli({"help"});

        ASSERT_EQ(0, run.exit_code);
        ASSERT_CONTAINS(run.out, "address");
        ASSERT_CONTAINS(run.out, "subnet");
        ASSERT_CONTAINS(run.out, "config");
    } END_TEST_CASE

    TEST_CASE(VersionPrintsName, "version prints the program name") {
        auto run = run_cli({"--version"});

        ASSERT_EQ(0, run.exit_code);
        ASSERT_CONTAINS(run.out, "ip6gen ");
    } END_TEST_CASE

    TEST_CASE(NoCommandShowsHelp, "running without a command is a usage error") {
        auto run = run_cli({});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.out, "usage:");
    } END_TEST_CASE

    TEST_CASE(UnknownCommand, "unknown commands are rejected") {
        auto run = run_cli({"frobnicate"});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.err, "unknown command: frobnicate");
    } END_TEST_CASE

    TEST_CASE(UnknownOption, "unknown command options are rejected") {
        auto run = run_cli({"subnet", "--bogus", "alpha"});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.err, "unknown option --bogus");
    } END_TEST_CASE

    TEST_CASE(GlobalOptionsAcceptEqualsForm, "--config=FILE and --format=json work like the split form") {
        auto path = write_temp_file("ip6gen_cli_equals_config.yaml", "network: \"::/0\"\n");
        auto run = run_cli({"--config=" + path, "--format=json", "address", "web-01"});
        std::filesystem::remove(path);

        ASSERT_EQ(0, run.exit_code);
        auto json = nlohmann::json::parse(run.out);
        ASSERT_EQ(std::string("387a:b2ce:e11b:a9be:d30b:514d:2b5a:124b"), json[0]["address"].get<std::string>());
    } END_TEST_CASE

    TEST_CASE(TrailingGlobalOptionNeedsValue, "a global option at the end reports its missing value") {
        for (const std::string option : {"--config", "--log-level", "--format"}) {
            auto run = run_cli({option});

            ASSERT_EQ(1, run.exit_code);
            ASSERT_CONTAINS(run.err, "option " + option + " requires a value");
            Assertion::assert_true(run.err.find("unknown option") == std::string::npos,
                                   option + " is not reported as unknown");
        }
    } END_TEST_CASE

    TEST_CASE(TrailingCommandOptionNeedsValue, "a command option at the end reports its missing value") {
        auto run = run_cli({"address", "web-01", "--network"});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.err, "option --network requires a value");
    } END_TEST_CASE

    TEST_CASE(UnknownGlobalOption, "unrecognised global options are still rejected") {
        auto run = run_cli({"--colour", "subnet", "alpha"});

        ASSERT_EQ(1, run.exit_code);
        ASSERT_CONTAINS(run.err, "unknown option --colour");
    } END_TEST_CASE

    TEST_CASE(DoubleDashEndsOptions, "names that look like options follow --") {
        auto run = run_cli({"subnet", "--", "--alpha"});

        ASSERT_EQ(0, run.exit_code);
        ASSERT_EQ(4u + 1u, run.out.size());
    } END_TEST_CASE
}
END_TEST_SUITE()

}
