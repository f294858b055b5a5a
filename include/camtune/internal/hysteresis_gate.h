/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Hysteresis gate controlling when a feature is corrected
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace camtune {

struct HysteresisConfig {
	double deadBandPct = 0.05;
	double innerPct = 0.02;
	double outerPct = 0.08;
};

struct FeatureBand {
	double acceptableLow;
	double acceptableHigh;
	HysteresisConfig hysteresis;

	double range() const { return acceptableHigh - acceptableLow; }
	double midpoint() const { return (acceptableLow + acceptableHigh) / 2; }
};

class HysteresisGate
{
public:
	enum class State {
		InsideDeadBand,
		OutsideNeedsAdjust,
	};

	struct Decision {
		State state;
		double target;
		double deviation;
		bool adjust;
	};

	HysteresisGate(const std::string &feature, const FeatureBand &band);

	const std::string &feature() const { return feature_; }
	const FeatureBand &band() const { return band_; }
	State state() const { return state_; }

	double deadBand() const;
	double innerThreshold() const;
	double outerThreshold() const;

	Decision evaluate(double measured,
			  std::optional<double> center = std::nullopt);
	void reset();

private:
	std::string feature_;
	FeatureBand band_;
	State state_;
};

std::ostream &operator<<(std::ostream &out, HysteresisGate::State state);

} /* namespace camtune */
