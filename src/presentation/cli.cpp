#include "presentation/cli.h"
#include "application/services.h"
#include "domain/errors.h"
#include "infrastructure/logger.h"
#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

#ifndef IP6GEN_VERSION
#define IP6GEN_VERSION "0.1.0"
#endif

namespace ip6gen::presentation {

namespace {

struct ParsedArgs {
	std::map<std::string, std::string> options;
	std::vector<std::string> flags;
	std::vector<std::string> positional;
	std::string unknown;
	std::string missing_value;
};

bool hasFlag(const ParsedArgs& parsed, const std::string& flag) {
	return std::find(parsed.flags.begin(), parsed.flags.end(), flag) != parsed.flags.end();
}

// Options listed in `with_value` take "--opt VALUE" or "--opt=VALUE"; "--" ends
// option parsing. With `stop_at_positional` everything from the first positional
// argument on is left unparsed in `positional`.
ParsedArgs parseArgs(const std::vector<std::string>& args,
                     const std::vector<std::string>& with_value,
                     const std::vector<std::string>& without_value,
                     bool stop_at_positional = false) {
	ParsedArgs parsed;
	bool options_done = false;

	for (size_t i = 0; i < args.size(); ++i) {
		const std::string& arg = args[i];
		if (options_done || !arg.starts_with("--")) {
			if (stop_at_positional) {
				parsed.positional.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
				return parsed;
			}
			parsed.positional.push_back(arg);
			continue;
		}
		if (arg == "--") {
			options_done = true;
			continue;
		}

		std::string key = arg;
		std::optional<std::string> inline_value;
		auto eq_pos = arg.find('=');
		if (eq_pos != std::string::npos) {
			key = arg.substr(0, eq_pos);
			inline_value = arg.substr(eq_pos + 1);
		}

		if (std::find(with_value.begin(), with_value.end(), key) != with_value.end()) {
			if (inline_value) {
				parsed.options[key] = *inline_value;
			} else if (i + 1 < args.size()) {
				parsed.options[key] = args[++i];
			} else {
				parsed.missing_value = key;
				return parsed;
			}
		} else if (!inline_value &&
		           std::find(without_value.begin(), without_value.end(), key) != without_value.end()) {
			parsed.flags.push_back(key);
		} else {
			parsed.unknown = arg;
			return parsed;
		}
	}

	return parsed;
}

// Prints the parse problem, if any, and reports whether one was found.
bool reportParseError(const ParsedArgs& parsed, std::ostream& err) {
	if (!parsed.missing_value.empty()) {
		err << "error: option " << parsed.missing_value << " requires a value\n";
		return true;
	}
	if (!parsed.unknown.empty()) {
		err << "error: unknown option " << parsed.unknown << "\n";
		return true;
	}
	return false;
}

std::vector<std::string> collectNames(const ParsedArgs& parsed) {
	std::vector<std::string> names;
	auto file_it = parsed.options.find("--names-file");
	if (file_it != parsed.options.end()) {
		names = readNamesFile(file_it->second);
	}
	names.insert(names.end(), parsed.positional.begin(), parsed.positional.end());
	return names;
}

}

std::vector<std::string> readNamesFile(const std::string& path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw domain::IP6GenException("failed to open names file: " + path,
		                              domain::ErrorCategory::SYSTEM, domain::ErrorSeverity::MEDIUM);
	}

	std::vector<std::string> names;
	std::string line;
	while (std::getline(file, line)) {
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (!line.empty()) {
			names.push_back(line);
		}
	}
	return names;
}

int AddressCommand::execute(const std::vector<std::string>& args, CLIContext& context) {
	auto parsed = parseArgs(args, {"--network", "--names-file"}, {"--expanded"});
	if (reportParseError(parsed, context.err)) {
		context.err << "usage: " << getUsage() << "\n";
		return EXIT_USER_ERROR;
	}

	auto names = collectNames(parsed);
	if (names.empty()) {
		context.err << "error: no names given\n";
		context.err << "usage: " << getUsage() << "\n";
		return EXIT_USER_ERROR;
	}

	auto config = context.config.get_config();
	std::optional<std::string> network;
	if (auto it = parsed.options.find("--network"); it != parsed.options.end()) {
		network = it->second;
	}
	bool expanded = hasFlag(parsed, "--expanded") || config.output.expanded;

	application::AddressService service(infrastructure::AddressGenerator{}, config);
	auto results = service.generate_batch(names, network);

	bool all_succeeded = true;
	for (const auto& result : results) {
		if (!result.is_success()) {
			all_succeeded = false;
			if (config.output.format != "json") {
				context.err << "error: " << result.error_message << "\n";
			}
		}
	}

	if (config.output.format == "json") {
		context.out << application::AddressService::to_json(results, expanded) << "\n";
	} else {
		context.out << application::AddressService::format_text(results, expanded);
	}

	return all_succeeded ? EXIT_OK : EXIT_USER_ERROR;
}

std::string AddressCommand::getDescription() const {
	return "derive a stable ipv6 address for each name";
}

std::string AddressCommand::getUsage() const {
	return "address [--network CIDR] [--expanded] [--names-file FILE] <name>...";
}

int SubnetCommand::execute(const std::vector<std::string>& args, CLIContext& context) {
	auto parsed = parseArgs(args, {"--names-file"}, {});
	if (reportParseError(parsed, context.err)) {
		context.err << "usage: " << getUsage() << "\n";
		return EXIT_USER_ERROR;
	}

	auto names = collectNames(parsed);
	if (names.empty()) {
		context.err << "error: no names given\n";
		context.err << "usage: " << getUsage() << "\n";
		return EXIT_USER_ERROR;
	}

	auto config = context.config.get_config();
	application::AddressService service(infrastructure::AddressGenerator{}, config);
	auto results = service.subnet_batch(names);

	if (config.output.format == "json") {
		context.out << application::AddressService::to_json(results) << "\n";
	} else {
		context.out << application::AddressService::format_text(results);
	}
	return EXIT_OK;
}

std::string SubnetCommand::getDescription() const {
	return "derive a 4-digit subnet tag for each name";
}

std::string SubnetCommand::getUsage() const {
	return "subnet [--names-file FILE] <name>...";
}

int ConfigCommand::execute(const std::vector<std::string>& args, CLIContext& context) {
	if (args.empty() || args[0] == "show") {
		if (context.config.get_config().output.format == "json") {
			context.out << context.config.export_config_json() << "\n";
		} else {
			context.out << context.config.export_config_yaml() << "\n";
		}
		return EXIT_OK;
	}

	if (args[0] == "validate") {
		auto errors = context.config.validate_config();
		if (errors.empty()) {
			context.out << "configuration is valid\n";
			return EXIT_OK;
		}
		for (const auto& error : errors) {
			context.err << "error: " << error.field << ": " << error.message
			            << " (" << error.suggestion << ")\n";
		}
		return EXIT_CONFIG_ERROR;
	}

	context.err << "usage: " << getUsage() << "\n";
	return EXIT_USER_ERROR;
}

std::string ConfigCommand::getDescription() const {
	return "show or validate the effective configuration";
}

std::string ConfigCommand::getUsage() const {
	return "config [show|validate]";
}

CLIManager::CLIManager(std::ostream& out, std::ostream& err) : out(out), err(err) {
	registerCommand("address", std::make_unique<AddressCommand>());
	registerCommand("subnet", std::make_unique<SubnetCommand>());
	registerCommand("config", std::make_unique<ConfigCommand>());
}

int CLIManager::run(int argc, char* argv[]) {
	std::vector<std::string> args;
	for (int i = 1; i < argc; ++i) {
		args.emplace_back(argv[i]);
	}
	return run(args);
}

int CLIManager::run(const std::vector<std::string>& args) {
	auto parsed = parseArgs(args, {"--config", "--log-level", "--format"}, {"--help", "--version"}, true);
	if (reportParseError(parsed, err)) {
		err << "type 'ip6gen help' for available commands\n";
		return EXIT_USER_ERROR;
	}
	if (hasFlag(parsed, "--help")) {
		showHelp();
		return EXIT_OK;
	}
	if (hasFlag(parsed, "--version")) {
		showVersion();
		return EXIT_OK;
	}

	if (parsed.positional.empty()) {
		showHelp();
		return EXIT_USER_ERROR;
	}

	std::string command = parsed.positional.front();
	std::vector<std::string> command_args(parsed.positional.begin() + 1, parsed.positional.end());

	if (command == "-h") {
		showHelp();
		return EXIT_OK;
	}
	if (command.starts_with("-")) {
		err << "error: unknown option " << command << "\n";
		err << "type 'ip6gen help' for available commands\n";
		return EXIT_USER_ERROR;
	}

	if (command == "help") {
		showHelp();
		return EXIT_OK;
	}
	if (command == "version") {
		showVersion();
		return EXIT_OK;
	}

	auto it = commands.find(command);
	if (it == commands.end()) {
		err << "unknown command: " << command << "\n";
		err << "type 'ip6gen help' for available commands\n";
		return EXIT_USER_ERROR;
	}

	infrastructure::ConfigManager config;
	try {
		if (auto option = parsed.options.find("--config"); option != parsed.options.end()) {
			config.load_config(option->second);
		}
		config.load_environment_variables();
		if (auto option = parsed.options.find("--log-level"); option != parsed.options.end()) {
			config.set_value("logging.level", option->second);
		}
		if (auto option = parsed.options.find("--format"); option != parsed.options.end()) {
			config.set_value("output.format", option->second);
		}
	} catch (const domain::ConfigurationException& e) {
		err << "error: " << e.what() << "\n";
		return EXIT_CONFIG_ERROR;
	}

	configureLogging(config.get_config());

	if (it->second->requiresValidConfig()) {
		auto errors = config.validate_config();
		if (!errors.empty()) {
			for (const auto& error : errors) {
				err << "error: " << error.field << ": " << error.message
				    << " (" << error.suggestion << ")\n";
			}
			return EXIT_CONFIG_ERROR;
		}
	}

	CLIContext context{config, out, err};
	try {
		return it->second->execute(command_args, context);
	} catch (const domain::ConfigurationException& e) {
		err << "error: " << e.what() << "\n";
		return EXIT_CONFIG_ERROR;
	} catch (const domain::AssemblyException& e) {
		LOG_CRITICAL("cli", "address assembly failed", {{"generated", e.get_generated()}});
		err << "error: " << e.what() << "\n";
		return EXIT_USER_ERROR;
	} catch (const domain::DigestException& e) {
		LOG_CRITICAL("cli", "digest unavailable", {{"error", e.what()}});
		err << "error: " << e.what() << "\n";
		return EXIT_USER_ERROR;
	} catch (const domain::IP6GenException& e) {
		err << "error: " << e.what() << "\n";
		return EXIT_USER_ERROR;
	}
}

void CLIManager::showHelp() {
	out << "ip6gen - derive stable IPv6 addresses from names\n\n";
	out << "usage: ip6gen [--config FILE] [--log-level LEVEL] [--format text|json] <command> [args]\n\n";
	out << "Available commands:\n";

	for (const auto& [name, command] : commands) {
		out << "  " << name << " - " << command->getDescription() << "\n";
		out << "    usage: " << command->getUsage() << "\n\n";
	}

	out << "  help - show this help message\n";
	out << "  version - show version information\n";
}

void CLIManager::showVersion() {
	out << "ip6gen " << IP6GEN_VERSION << "\n";
}

void CLIManager::registerCommand(const std::string& name, std::unique_ptr<CLICommand> command) {
	commands[name] = std::move(command);
}

void CLIManager::configureLogging(const infrastructure::GeneratorConfig& config) {
	auto& logger = infrastructure::Logger::instance();
	auto level = infrastructure::Logger::string_to_log_level(config.logging.level);
	logger.set_log_level(level.value_or(infrastructure::Logger::LogLevel::WARNING));
	logger.set_log_file(config.logging.file);
	logger.enable_json_format(config.logging.json);
}

}
