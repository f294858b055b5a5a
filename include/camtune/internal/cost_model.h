/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Cost based selection of the parameter to adjust
 */

#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

namespace camtune {

enum class Direction {
	Increase,
	Decrease,
	Either,
};

const char *directionName(Direction direction);
std::optional<Direction> directionFromName(const std::string &name);
std::ostream &operator<<(std::ostream &out, Direction direction);

struct CostSpec {
	double baseCost;
	double maxCost;
	double minCost;
	Direction preferred;
	double weight = 1.0;
	bool inverted = false;
};

struct ParameterRange {
	int32_t min;
	int32_t max;
	int32_t step;
};

struct CameraParameter {
	std::string name;
	ParameterRange range;
	int32_t currentValue = 0;
	bool stale = true;
	bool rejected = false;

	bool usable() const { return !stale && !rejected; }
};

struct CostModelConfig {
	enum class TieBreak {
		Order,
		Headroom,
	};

	TieBreak tieBreak = TieBreak::Order;
	unsigned int boundMarginSteps = 2;
	double againstPenalty = 1.5;
	double boundPenalty = 0.5;
	std::map<std::string, CostSpec> specs = defaultSpecs();

	static const std::map<std::string, CostSpec> &defaultSpecs();
	static const std::map<std::string, ParameterRange> &defaultRanges();
};

struct Candidate {
	std::string parameter;
	Direction direction;
	int32_t from;
	int32_t to;
	int32_t headroom;
	double cost;
};

class ParameterCostModel
{
public:
	ParameterCostModel(const CostModelConfig &config);

	const CostModelConfig &config() const { return config_; }
	const CostSpec *spec(const std::string &parameter) const;

	Direction neededMove(const CostSpec &spec, double deviation) const;
	std::optional<double> cost(const CameraParameter &parameter,
				   double deviation) const;
	std::optional<Candidate> candidate(const CameraParameter &parameter,
					   double deviation) const;
	std::optional<Candidate> select(const std::vector<const CameraParameter *> &parameters,
					double deviation) const;

private:
	int32_t headroom(const CameraParameter &parameter, Direction move) const;

	CostModelConfig config_;
};

} /* namespace camtune */
