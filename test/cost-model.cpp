/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * cost-model.cpp - Parameter selection tests
 */

#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "camtune/internal/cost_model.h"

#include "test.h"

using namespace std;
using namespace camtune;

static bool near(double a, double b)
{
	return std::abs(a - b) < 1e-9;
}

class CostModelTest : public Test
{
protected:
	CameraParameter makeParameter(const string &name, int32_t value)
	{
		CameraParameter parameter;
		parameter.name = name;
		parameter.range = CostModelConfig::defaultRanges().at(name);
		parameter.currentValue = value;
		parameter.stale = false;
		return parameter;
	}

	int testCosts()
	{
		ParameterCostModel model{ CostModelConfig{} };

		/* Brightness 0.15 against the 0.375 midpoint. */
		const double deviation = 0.15 - 0.375;

		static const map<string, pair<int32_t, double>> expected = {
			{ "ExposureIris", { 5, 0.5 - 0.225 } },
			{ "ExposureExposureTime", { 10, 1.5 * 1.5 + 0.225 } },
			{ "ExposureGain", { 5, 3.0 * 1.5 + 0.225 } },
			{ "DigitalBrightLevel", { 7, 2.0 } },
			{ "ColorSaturation", { 7, 0.8 } },
		};

		for (const auto &[name, entry] : expected) {
			CameraParameter parameter = makeParameter(name, entry.first);
			optional<double> cost = model.cost(parameter, deviation);
			if (!cost || !near(*cost, entry.second)) {
				cerr << name << ": expected cost " << entry.second
				     << ", got " << cost.value_or(-1.0) << endl;
				return TestFail;
			}
		}

		/* Gain is capped at its maximum cost when moving against preference. */
		CostModelConfig config;
		config.specs["ExposureGain"].weight = 100.0;
		ParameterCostModel heavy{ config };
		if (!near(*heavy.cost(makeParameter("ExposureGain", 5), deviation), 10.0)) {
			cerr << "Cost not capped at maximum" << endl;
			return TestFail;
		}

		/* Moving in the preferred direction is floored at the minimum cost. */
		config.specs["ExposureIris"].weight = 100.0;
		ParameterCostModel floored{ config };
		if (!near(*floored.cost(makeParameter("ExposureIris", 5), deviation), 0.2)) {
			cerr << "Cost not floored at minimum" << endl;
			return TestFail;
		}

		CameraParameter unknown;
		unknown.name = "DetailLevel";
		unknown.range = { 0, 10, 1 };
		unknown.stale = false;
		if (model.cost(unknown, deviation) || model.candidate(unknown, deviation)) {
			cerr << "Parameter without cost specification has a cost" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testDirection()
	{
		ParameterCostModel model{ CostModelConfig{} };

		CostSpec spec{ 1.0, 2.0, 0.5, Direction::Increase };
		if (model.neededMove(spec, -0.1) != Direction::Increase ||
		    model.neededMove(spec, 0.1) != Direction::Decrease) {
			cerr << "Unexpected needed move" << endl;
			return TestFail;
		}

		spec.inverted = true;
		if (model.neededMove(spec, -0.1) != Direction::Decrease) {
			cerr << "Inverted parameter not reversed" << endl;
			return TestFail;
		}

		/* Too bright: closing the iris goes against its preference. */
		CameraParameter iris = makeParameter("ExposureIris", 5);
		optional<Candidate> candidate = model.candidate(iris, 0.2);
		if (!candidate || candidate->direction != Direction::Decrease ||
		    candidate->to != 4 || !near(candidate->cost, 0.5 * 1.5 + 0.2)) {
			cerr << "Unexpected candidate for a positive deviation" << endl;
			return TestFail;
		}

		if (directionFromName("decrease") != Direction::Decrease ||
		    directionFromName("sideways") ||
		    string(directionName(Direction::Either)) != "either") {
			cerr << "Direction name mapping failed" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testSelection()
	{
		ParameterCostModel model{ CostModelConfig{} };

		CameraParameter iris = makeParameter("ExposureIris", 5);
		CameraParameter time = makeParameter("ExposureExposureTime", 10);
		CameraParameter gain = makeParameter("ExposureGain", 5);
		CameraParameter dbl = makeParameter("DigitalBrightLevel", 7);
		vector<const CameraParameter *> parameters = { &iris, &time, &gain, &dbl };

		optional<Candidate> best = model.select(parameters, -0.225);
		if (!best || best->parameter != "ExposureIris" || best->from != 5 ||
		    best->to != 6 || best->headroom != 12) {
			cerr << "Iris not selected first" << endl;
			return TestFail;
		}

		/* Stale and rejected parameters are never candidates. */
		iris.stale = true;
		best = model.select(parameters, -0.225);
		if (!best || best->parameter != "DigitalBrightLevel") {
			cerr << "Stale parameter selected" << endl;
			return TestFail;
		}

		iris.stale = false;
		iris.rejected = true;
		best = model.select(parameters, -0.225);
		if (!best || best->parameter != "DigitalBrightLevel") {
			cerr << "Rejected parameter selected" << endl;
			return TestFail;
		}

		/* A parameter at its bound can't move further. */
		iris.rejected = false;
		iris.currentValue = 17;
		best = model.select(parameters, -0.225);
		if (!best || best->parameter != "DigitalBrightLevel" || best->to != 8) {
			cerr << "Parameter at bound selected" << endl;
			return TestFail;
		}

		if (model.select(parameters, 0.0)) {
			cerr << "Adjustment proposed without deviation" << endl;
			return TestFail;
		}

		iris.currentValue = iris.range.max;
		time.currentValue = time.range.max;
		gain.currentValue = gain.range.max;
		dbl.currentValue = dbl.range.max;
		if (model.select(parameters, -0.225)) {
			cerr << "Adjustment proposed with all parameters at bound" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testBoundPenalty()
	{
		ParameterCostModel model{ CostModelConfig{} };
		const double base = 0.5 - 0.225;

		CameraParameter iris = makeParameter("ExposureIris", 14);
		if (!near(*model.cost(iris, -0.225), base)) {
			cerr << "Bound penalty applied with enough headroom" << endl;
			return TestFail;
		}

		iris.currentValue = 15;
		if (!near(*model.cost(iris, -0.225), base + (2.0 - base) * 0.5)) {
			cerr << "Bound penalty not applied within margin" << endl;
			return TestFail;
		}

		/* The penalty only applies in the direction of the move. */
		iris.currentValue = 1;
		if (!near(*model.cost(iris, -0.225), base)) {
			cerr << "Bound penalty applied to the opposite bound" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testTieBreak()
	{
		CostModelConfig config;
		config.specs = {
			{ "A", { 1.0, 2.0, 0.5, Direction::Either } },
			{ "B", { 1.0, 2.0, 0.5, Direction::Either } },
		};

		CameraParameter a{ "A", { 0, 100, 1 }, 50, false, false };
		CameraParameter b{ "B", { 0, 100, 1 }, 20, false, false };
		vector<const CameraParameter *> parameters = { &a, &b };

		ParameterCostModel ordered{ config };
		optional<Candidate> best = ordered.select(parameters, -0.1);
		if (!best || best->parameter != "A") {
			cerr << "Order tie break didn't pick the first parameter" << endl;
			return TestFail;
		}

		config.tieBreak = CostModelConfig::TieBreak::Headroom;
		ParameterCostModel roomy{ config };
		best = roomy.select(parameters, -0.1);
		if (!best || best->parameter != "B" || best->headroom != 80) {
			cerr << "Headroom tie break didn't pick the largest headroom" << endl;
			return TestFail;
		}

		/* Headroom is measured in the direction of the move. */
		best = roomy.select(parameters, 0.1);
		if (!best || best->parameter != "A" || best->to != 49) {
			cerr << "Headroom tie break ignored the move direction" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		if (testCosts() != TestPass)
			return TestFail;

		if (testDirection() != TestPass)
			return TestFail;

		if (testSelection() != TestPass)
			return TestFail;

		if (testBoundPenalty() != TestPass)
			return TestFail;

		if (testTieBreak() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(CostModelTest)
