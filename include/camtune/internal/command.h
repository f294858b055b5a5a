/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Camera parameter command results
 */

#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

namespace camtune {

enum class Outcome {
	Ok,
	Timeout,
	Rejected,
	Error,
	Cancelled,
};

const char *outcomeName(Outcome outcome);
std::ostream &operator<<(std::ostream &out, Outcome outcome);

struct CommandResult {
	std::string parameter;
	std::optional<int32_t> requested;
	std::optional<int32_t> achieved;
	Outcome outcome;

	bool ok() const { return outcome == Outcome::Ok; }
	bool failed() const
	{
		return outcome != Outcome::Ok && outcome != Outcome::Cancelled;
	}
};

using ParameterValues = std::map<std::string, int32_t>;

} /* namespace camtune */
