/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Command line options for the camtune applications
 */

#include "options.h"

#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <limits.h>
#include <sstream>
#include <stdlib.h>

namespace {

std::optional<int> parseInteger(const std::string &value)
{
	if (value.empty())
		return std::nullopt;

	char *end;
	long number = strtol(value.c_str(), &end, 0);
	if (*end != '\0' || number < INT_MIN || number > INT_MAX)
		return std::nullopt;

	return static_cast<int>(number);
}

} /* namespace */

const std::string &Options::string(int key) const
{
	static const std::string empty;

	auto it = values_.find(key);
	if (it == values_.end() || it->second.empty())
		return empty;

	return it->second.back();
}

/* Integer values are checked when parsing, unset options read as 0. */
int Options::integer(int key) const
{
	return parseInteger(string(key)).value_or(0);
}

std::vector<int> Options::integers(int key) const
{
	std::vector<int> numbers;

	auto it = values_.find(key);
	if (it == values_.end())
		return numbers;

	for (const std::string &value : it->second)
		numbers.push_back(parseInteger(value).value_or(0));

	return numbers;
}

OptionsParser::OptionsParser(const char *synopsis)
	: synopsis_(synopsis)
{
}

void OptionsParser::addOption(int key, OptionType type, const char *name,
			      const char *help, const char *argument,
			      bool repeated)
{
	specs_.push_back({ key, type, name, help, argument, repeated });
}

const OptionsParser::Spec *OptionsParser::find(int key) const
{
	for (const Spec &spec : specs_) {
		if (spec.key == key)
			return &spec;
	}

	return nullptr;
}

std::optional<Options> OptionsParser::parse(int argc, char *argv[]) const
{
	std::string shortOptions = ":";
	std::vector<struct option> longOptions;

	for (const Spec &spec : specs_) {
		bool hasArgument = spec.type != OptionType::Flag;

		shortOptions += static_cast<char>(spec.key);
		if (hasArgument)
			shortOptions += ':';

		if (spec.name)
			longOptions.push_back({ spec.name,
						hasArgument ? required_argument
							    : no_argument,
						nullptr, spec.key });
	}
	longOptions.push_back({ nullptr, 0, nullptr, 0 });

	Options options;

	/* Restart the scan, parse() may be called more than once. */
	optind = 0;
	opterr = 0;

	int key;
	while ((key = getopt_long(argc, argv, shortOptions.c_str(),
				  longOptions.data(), nullptr)) != -1) {
		if (key == ':') {
			std::cerr << "Missing argument for option "
				  << argv[optind - 1] << std::endl;
			return std::nullopt;
		}

		const Spec *spec = find(key);
		if (!spec) {
			std::cerr << "Unknown option " << argv[optind - 1]
				  << std::endl;
			return std::nullopt;
		}

		std::string value = optarg ? optarg : "";

		if (spec->type == OptionType::Integer && !parseInteger(value)) {
			std::cerr << "Option " << argv[optind - 1]
				  << " expects an integer, got '" << value
				  << "'" << std::endl;
			return std::nullopt;
		}

		std::vector<std::string> &values = options.values_[key];
		if (!spec->repeated)
			values.clear();
		values.push_back(value);
	}

	for (int i = optind; i < argc; ++i)
		options.arguments_.push_back(argv[i]);

	return options;
}

void OptionsParser::usage() const
{
	std::cerr << "Usage: " << synopsis_ << std::endl
		  << std::endl
		  << "Options:" << std::endl;

	for (const Spec &spec : specs_) {
		std::ostringstream flags;
		flags << "-" << static_cast<char>(spec.key);
		if (spec.name)
			flags << ", --" << spec.name;
		if (spec.argument)
			flags << " <" << spec.argument << ">";

		std::istringstream help(spec.help);
		std::string line;
		bool first = true;

		while (std::getline(help, line)) {
			std::cerr << "  " << std::left << std::setw(28)
				  << (first ? flags.str() : "") << line
				  << std::endl;
			first = false;
		}

		if (spec.repeated)
			std::cerr << "  " << std::setw(28) << ""
				  << "May be given multiple times." << std::endl;
	}

	std::cerr << std::right;
}
