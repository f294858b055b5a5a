/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Hysteresis gate controlling when a feature is corrected
 */

#include "camtune/internal/hysteresis_gate.h"

#include <algorithm>
#include <cmath>

#include <camtune/base/log.h>

/**
 * \file internal/hysteresis_gate.h
 * \brief Two threshold gate around a feature target
 */

namespace camtune {

LOG_DEFINE_CATEGORY(Hysteresis)

/**
 * \struct HysteresisConfig
 * \brief Hysteresis thresholds as fractions of the acceptable range
 */

/**
 * \struct FeatureBand
 * \brief Acceptable range of a feature and its hysteresis configuration
 */

/**
 * \class HysteresisGate
 * \brief Decide whether a feature needs correcting
 *
 * The gate has two states. It starts inside the dead band and moves outside
 * when the deviation of the measured value from the target exceeds the outer
 * threshold. It only moves back inside once the deviation has fallen to the
 * inner threshold, which is always lower. While outside, an adjustment is
 * requested for every evaluation whose deviation also exceeds the dead band.
 *
 * With R the acceptable range,
 *
 * - dead band = R x dead_band_pct
 * - outer threshold = dead band + R x outer_pct
 * - inner threshold = max(0, dead band - R x inner_pct)
 *
 * The thresholds don't depend on the target, a slave camera recentering on
 * the master target keeps the width of its band.
 */

/**
 * \enum HysteresisGate::State
 * \brief Gate state
 * \var HysteresisGate::State::InsideDeadBand
 * \brief The feature is close enough to its target
 * \var HysteresisGate::State::OutsideNeedsAdjust
 * \brief The feature is being corrected
 */

/**
 * \struct HysteresisGate::Decision
 * \brief Result of a gate evaluation
 */

HysteresisGate::HysteresisGate(const std::string &feature, const FeatureBand &band)
	: feature_(feature), band_(band), state_(State::InsideDeadBand)
{
}

/**
 * \brief Retrieve the half width of the dead band
 * \return The dead band
 */
double HysteresisGate::deadBand() const
{
	return band_.range() * band_.hysteresis.deadBandPct;
}

/**
 * \brief Retrieve the deviation at or below which the gate returns inside
 * \return The inner threshold
 */
double HysteresisGate::innerThreshold() const
{
	return std::max(0.0, deadBand() - band_.range() * band_.hysteresis.innerPct);
}

/**
 * \brief Retrieve the deviation above which the gate moves outside
 * \return The outer threshold
 */
double HysteresisGate::outerThreshold() const
{
	return deadBand() + band_.range() * band_.hysteresis.outerPct;
}

/**
 * \brief Update the gate with a measurement
 * \param[in] measured The measured feature value
 * \param[in] center The target overriding the band midpoint, if any
 * \return The gate decision
 */
HysteresisGate::Decision HysteresisGate::evaluate(double measured,
						  std::optional<double> center)
{
	double target = center.value_or(band_.midpoint());
	double deviation = measured - target;
	double magnitude = std::abs(deviation);

	State previous = state_;

	if (state_ == State::InsideDeadBand && magnitude > outerThreshold())
		state_ = State::OutsideNeedsAdjust;
	else if (state_ == State::OutsideNeedsAdjust && magnitude <= innerThreshold())
		state_ = State::InsideDeadBand;

	if (state_ != previous)
		LOG(Hysteresis, Debug)
			<< feature_ << ": " << previous << " -> " << state_
			<< " (deviation " << deviation << ", target " << target << ")";

	bool adjust = state_ == State::OutsideNeedsAdjust && magnitude > deadBand();

	return { state_, target, deviation, adjust };
}

/**
 * \brief Return the gate to the inside state
 */
void HysteresisGate::reset()
{
	state_ = State::InsideDeadBand;
}

std::ostream &operator<<(std::ostream &out, HysteresisGate::State state)
{
	switch (state) {
	case HysteresisGate::State::InsideDeadBand:
		out << "INSIDE_DEAD_BAND";
		break;
	case HysteresisGate::State::OutsideNeedsAdjust:
		out << "OUTSIDE_NEEDS_ADJUST";
		break;
	}

	return out;
}

} /* namespace camtune */
