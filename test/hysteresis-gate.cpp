/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * hysteresis-gate.cpp - Dead band and hysteresis tests
 */

#include <cmath>
#include <iostream>
#include <sstream>

#include "camtune/internal/hysteresis_gate.h"

#include "test.h"

using namespace std;
using namespace camtune;

using State = HysteresisGate::State;

static bool near(double a, double b)
{
	return std::abs(a - b) < 1e-9;
}

class HysteresisGateTest : public Test
{
protected:
	int expect(HysteresisGate &gate, double measured, State state, bool adjust,
		   std::optional<double> center = std::nullopt)
	{
		HysteresisGate::Decision decision = gate.evaluate(measured, center);

		if (decision.state != state || decision.adjust != adjust) {
			cerr << "Measurement " << measured << ": expected " << state
			     << (adjust ? " with" : " without") << " adjustment, got "
			     << decision.state
			     << (decision.adjust ? " with" : " without")
			     << " adjustment" << endl;
			return TestFail;
		}

		if (!near(decision.deviation, measured - decision.target)) {
			cerr << "Deviation not relative to target" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testThresholds()
	{
		HysteresisGate gate("brightness", { 0.25, 0.5, {} });

		if (!near(gate.deadBand(), 0.0125) ||
		    !near(gate.innerThreshold(), 0.0075) ||
		    !near(gate.outerThreshold(), 0.0325)) {
			cerr << "Unexpected thresholds " << gate.deadBand() << ", "
			     << gate.innerThreshold() << ", "
			     << gate.outerThreshold() << endl;
			return TestFail;
		}

		/* The inner threshold never goes below zero. */
		HysteresisGate narrow("saturation", { 0.3, 0.6, { 0.01, 0.02, 0.08 } });
		if (narrow.innerThreshold() != 0.0) {
			cerr << "Negative inner threshold" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testTransitions()
	{
		HysteresisGate gate("brightness", { 0.25, 0.5, {} });

		if (gate.state() != State::InsideDeadBand) {
			cerr << "Gate doesn't start inside the dead band" << endl;
			return TestFail;
		}

		/* Beyond the dead band but within the outer threshold. */
		if (expect(gate, 0.40, State::InsideDeadBand, false) != TestPass)
			return TestFail;

		if (expect(gate, 0.41, State::OutsideNeedsAdjust, true) != TestPass)
			return TestFail;

		/* Within the dead band, above the inner threshold: hold. */
		if (expect(gate, 0.385, State::OutsideNeedsAdjust, false) != TestPass)
			return TestFail;

		if (expect(gate, 0.39, State::OutsideNeedsAdjust, true) != TestPass)
			return TestFail;

		if (expect(gate, 0.38, State::InsideDeadBand, false) != TestPass)
			return TestFail;

		/* Leaving again requires crossing the outer threshold. */
		if (expect(gate, 0.40, State::InsideDeadBand, false) != TestPass)
			return TestFail;

		if (expect(gate, 0.30, State::OutsideNeedsAdjust, true) != TestPass)
			return TestFail;

		gate.reset();
		if (gate.state() != State::InsideDeadBand) {
			cerr << "Reset didn't return inside" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testCenter()
	{
		HysteresisGate gate("brightness", { 0.25, 0.5, {} });

		/* Inside around the midpoint, outside around a synchronized target. */
		HysteresisGate::Decision decision = gate.evaluate(0.36, 0.30);
		if (decision.state != State::OutsideNeedsAdjust || !decision.adjust ||
		    !near(decision.target, 0.30) || !near(decision.deviation, 0.06)) {
			cerr << "Center override not applied" << endl;
			return TestFail;
		}

		if (expect(gate, 0.355, State::InsideDeadBand, false, 0.35) != TestPass)
			return TestFail;

		decision = gate.evaluate(0.375);
		if (!near(decision.target, 0.375) || decision.state != State::InsideDeadBand) {
			cerr << "Midpoint not used without override" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testNames()
	{
		ostringstream ss;
		ss << State::InsideDeadBand << " " << State::OutsideNeedsAdjust;

		if (ss.str() != "INSIDE_DEAD_BAND OUTSIDE_NEEDS_ADJUST") {
			cerr << "Unexpected state names " << ss.str() << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		if (testThresholds() != TestPass)
			return TestFail;

		if (testTransitions() != TestPass)
			return TestFail;

		if (testCenter() != TestPass)
			return TestFail;

		if (testNames() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(HysteresisGateTest)
