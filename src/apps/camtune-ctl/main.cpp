/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * camtune-ctl - One-shot camera parameter control
 */

#include <errno.h>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdlib.h>
#include <string.h>
#include <vector>

#include <camtune/logging.h>

#include "camtune/internal/configuration.h"
#include "camtune/internal/protocol_transport.h"

#include "../common/options.h"

#include "main.h"

using namespace camtune;

namespace {

const char *const synopsis =
	"camtune-ctl -c <config.yaml> -C <camera> <command> [args...]\n"
	"\n"
	"Commands:\n"
	"  get <Name>...           Read parameters\n"
	"  set <Name>=<Value>...   Write parameters\n"
	"  preset <name>           Apply a configured preset\n"
	"  randomize [<Name>...]   Set parameters to random values within their range";

void printResults(const std::vector<CommandResult> &results)
{
	for (const CommandResult &result : results) {
		std::cout << result.parameter;

		if (result.ok() && result.achieved)
			std::cout << " = " << *result.achieved;
		else if (result.ok() && result.requested)
			std::cout << " = " << *result.requested;
		else
			std::cout << ": " << result.outcome;

		std::cout << std::endl;
	}
}

bool allOk(const std::vector<CommandResult> &results)
{
	for (const CommandResult &result : results) {
		if (!result.ok())
			return false;
	}

	return true;
}

} /* namespace */

class CtlApp
{
public:
	int init(int argc, char **argv);
	int exec();

private:
	int parseOptions(int argc, char *argv[]);

	int get(const std::vector<std::string> &args);
	int set(const std::vector<std::string> &args);
	int preset(const std::vector<std::string> &args);
	int randomize(const std::vector<std::string> &args);

	Options options_;
	std::optional<Configuration> config_;
	std::unique_ptr<ProtocolTransport> transport_;
};

int CtlApp::parseOptions(int argc, char *argv[])
{
	OptionsParser parser(synopsis);
	parser.addOption(OptConfig, OptionType::String, "config",
			 "Load the deployment configuration from a YAML file",
			 "file");
	parser.addOption(OptCamera, OptionType::Integer, "camera",
			 "Operate on the camera with the given id", "id");
	parser.addOption(OptHelp, OptionType::Flag, "help",
			 "Display this help message");
	parser.addOption(OptLogLevel, OptionType::String, "log-level",
			 "Set the log level of all categories", "level");

	std::optional<Options> options = parser.parse(argc, argv);
	if (!options)
		return -EINVAL;

	options_ = std::move(*options);

	if (options_.isSet(OptHelp)) {
		parser.usage();
		return -EINTR;
	}

	if (!options_.isSet(OptConfig) || !options_.isSet(OptCamera) ||
	    options_.arguments().empty()) {
		parser.usage();
		return -EINVAL;
	}

	if (options_.isSet(OptLogLevel)) {
		if (logSetLevel("*", options_.string(OptLogLevel).c_str()) < 0) {
			std::cerr << "Invalid log level "
				  << options_.string(OptLogLevel) << std::endl;
			return -EINVAL;
		}
	} else if (!secure_getenv("CAMTUNE_LOG_LEVELS")) {
		logSetLevel("*", "WARN");
	}

	return 0;
}

int CtlApp::init(int argc, char **argv)
{
	int ret = parseOptions(argc, argv);
	if (ret < 0)
		return ret;

	config_ = Configuration::load(options_.string(OptConfig));
	if (!config_)
		return -EINVAL;

	unsigned int id = options_.integer(OptCamera);
	const CameraConfig *camera = config_->camera(id);
	if (!camera) {
		std::cerr << "Unknown camera " << id << std::endl;
		return -ENODEV;
	}

	const TransportFactoryBase *factory =
		TransportFactoryBase::getFactoryByName(config_->protocol);
	if (!factory)
		return -EINVAL;

	transport_ = factory->create(config_->transportOptions(*camera));

	ret = transport_->connect();
	if (ret < 0) {
		std::cerr << "Failed to connect to camera " << id << " ("
			  << camera->address << "): " << strerror(-ret) << std::endl;
		return ret;
	}

	return 0;
}

int CtlApp::exec()
{
	std::vector<std::string> args = options_.arguments();
	std::string command = args.front();
	args.erase(args.begin());

	int ret;

	if (command == "get")
		ret = get(args);
	else if (command == "set")
		ret = set(args);
	else if (command == "preset")
		ret = preset(args);
	else if (command == "randomize")
		ret = randomize(args);
	else {
		std::cerr << "Unknown command " << command << std::endl;
		ret = -EINVAL;
	}

	transport_->disconnect();

	return ret;
}

int CtlApp::get(const std::vector<std::string> &args)
{
	std::vector<std::string> names = args;
	if (names.empty()) {
		for (const auto &[name, range] : config_->parameters)
			names.push_back(name);
	}

	std::vector<CommandResult> results = transport_->getParameters(names);
	printResults(results);

	return allOk(results) ? 0 : -EIO;
}

int CtlApp::set(const std::vector<std::string> &args)
{
	ParameterValues values;

	for (const std::string &arg : args) {
		std::string::size_type pos = arg.find('=');
		if (pos == std::string::npos || pos == 0) {
			std::cerr << "Expected <Name>=<Value>, got " << arg << std::endl;
			return -EINVAL;
		}

		std::string value = arg.substr(pos + 1);
		char *end;
		long number = strtol(value.c_str(), &end, 10);
		if (value.empty() || *end != '\0') {
			std::cerr << "Invalid value " << value << std::endl;
			return -EINVAL;
		}

		values[arg.substr(0, pos)] = number;
	}

	if (values.empty()) {
		std::cerr << "Nothing to set" << std::endl;
		return -EINVAL;
	}

	std::vector<CommandResult> results = transport_->setParameters(values);
	printResults(results);

	return allOk(results) ? 0 : -EIO;
}

int CtlApp::preset(const std::vector<std::string> &args)
{
	if (args.size() != 1) {
		std::cerr << "Expected one preset name" << std::endl;
		return -EINVAL;
	}

	auto it = config_->presets.find(args[0]);
	if (it == config_->presets.end()) {
		std::cerr << "Unknown preset " << args[0] << std::endl;
		return -EINVAL;
	}

	int ret = transport_->applyPreset(it->second);
	if (ret < 0) {
		std::cerr << "Failed to apply preset " << args[0] << ": "
			  << strerror(-ret) << std::endl;
		return ret;
	}

	std::cout << "Applied preset " << args[0] << std::endl;
	return 0;
}

int CtlApp::randomize(const std::vector<std::string> &args)
{
	std::vector<std::string> names = args;
	if (names.empty()) {
		for (const auto &[name, range] : config_->parameters)
			names.push_back(name);
	}

	std::random_device device;
	std::mt19937 generator(device());
	ParameterValues values;

	for (const std::string &name : names) {
		auto it = config_->parameters.find(name);
		if (it == config_->parameters.end()) {
			std::cerr << "No range for parameter " << name << std::endl;
			return -EINVAL;
		}

		const ParameterRange &range = it->second;
		std::uniform_int_distribution<int32_t> steps(0, (range.max - range.min) / range.step);
		values[name] = range.min + steps(generator) * range.step;
	}

	std::vector<CommandResult> results = transport_->setParameters(values);
	printResults(results);

	return allOk(results) ? 0 : -EIO;
}

int main(int argc, char **argv)
{
	CtlApp app;

	int ret = app.init(argc, argv);
	if (ret)
		return ret == -EINTR ? 0 : EXIT_FAILURE;

	if (app.exec())
		return EXIT_FAILURE;

	return 0;
}
