#pragma once

#include "infrastructure/config_manager.h"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ip6gen::presentation {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USER_ERROR = 1;
constexpr int EXIT_CONFIG_ERROR = 2;

struct CLIContext {
	infrastructure::ConfigManager& config;
	std::ostream& out;
	std::ostream& err;
};

class CLICommand {
public:
	virtual ~CLICommand() = default;
	virtual int execute(const std::vector<std::string>& args, CLIContext& context) = 0;
	virtual std::string getDescription() const = 0;
	virtual std::string getUsage() const = 0;
	// Commands that only inspect the configuration may run on an invalid one.
	virtual bool requiresValidConfig() const { return true; }
};

class AddressCommand : public CLICommand {
public:
	int execute(const std::vector<std::string>& args, CLIContext& context) override;
	std::string getDescription() const override;
	std::string getUsage() const override;
};

class SubnetCommand : public CLICommand {
public:
	int execute(const std::vector<std::string>& args, CLIContext& context) override;
	std::string getDescription() const override;
	std::string getUsage() const override;
};

class ConfigCommand : public CLICommand {
public:
	int execute(const std::vector<std::string>& args, CLIContext& context) override;
	std::string getDescription() const override;
	std::string getUsage() const override;
	bool requiresValidConfig() const override { return false; }
};

class CLIManager {
	std::map<std::string, std::unique_ptr<CLICommand>> commands;
	std::ostream& out;
	std::ostream& err;

public:
	CLIManager(std::ostream& out = std::cout, std::ostream& err = std::cerr);
	~CLIManager() = default;

	int run(int argc, char* argv[]);
	int run(const std::vector<std::string>& args);
	void showHelp();
	void showVersion();

private:
	void registerCommand(const std::string& name, std::unique_ptr<CLICommand> command);
	void configureLogging(const infrastructure::GeneratorConfig& config);
};

std::vector<std::string> readNamesFile(const std::string& path);

}
