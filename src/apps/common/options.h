/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Command line options for the camtune applications
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class OptionType {
	Flag,
	String,
	Integer,
};

class Options
{
public:
	bool isSet(int key) const { return values_.count(key) != 0; }

	const std::string &string(int key) const;
	int integer(int key) const;
	std::vector<int> integers(int key) const;

	const std::vector<std::string> &arguments() const { return arguments_; }

private:
	friend class OptionsParser;

	std::map<int, std::vector<std::string>> values_;
	std::vector<std::string> arguments_;
};

class OptionsParser
{
public:
	explicit OptionsParser(const char *synopsis);

	/*
	 * The key doubles as the short option character. Repeated options
	 * keep all their values, other options keep the last one.
	 */
	void addOption(int key, OptionType type, const char *name,
		       const char *help, const char *argument = nullptr,
		       bool repeated = false);

	std::optional<Options> parse(int argc, char *argv[]) const;
	void usage() const;

private:
	struct Spec {
		int key;
		OptionType type;
		const char *name;
		const char *help;
		const char *argument;
		bool repeated;
	};

	const Spec *find(int key) const;

	const char *synopsis_;
	std::vector<Spec> specs_;
};
