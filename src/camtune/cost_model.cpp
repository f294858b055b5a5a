/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Cost based selection of the parameter to adjust
 */

#include "camtune/internal/cost_model.h"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <camtune/base/log.h>

/**
 * \file internal/cost_model.h
 * \brief Cost model for the candidate parameter adjustments
 */

namespace camtune {

LOG_DEFINE_CATEGORY(CostModel)

namespace {

const char *const directionNames[] = {
	"increase",
	"decrease",
	"either",
};

} /* namespace */

/**
 * \enum Direction
 * \brief Direction of a parameter change
 * \var Direction::Increase
 * \brief The parameter value grows
 * \var Direction::Decrease
 * \brief The parameter value shrinks
 * \var Direction::Either
 * \brief No preference, only valid as a preferred direction
 */

/**
 * \brief Retrieve the configuration name of a direction
 * \param[in] direction The direction
 * \return The direction name
 */
const char *directionName(Direction direction)
{
	return directionNames[static_cast<unsigned int>(direction)];
}

/**
 * \brief Parse a direction from its configuration name
 * \param[in] name The direction name
 * \return The direction, or std::nullopt if \a name is unknown
 */
std::optional<Direction> directionFromName(const std::string &name)
{
	for (unsigned int i = 0; i < std::size(directionNames); ++i) {
		if (name == directionNames[i])
			return static_cast<Direction>(i);
	}

	return std::nullopt;
}

std::ostream &operator<<(std::ostream &out, Direction direction)
{
	out << directionName(direction);
	return out;
}

/**
 * \struct CostSpec
 * \brief Cost configuration of one parameter
 *
 * \var CostSpec::baseCost
 * \brief Cost of a move in the preferred direction for a vanishing deviation
 * \var CostSpec::maxCost
 * \brief Upper bound of the cost
 * \var CostSpec::minCost
 * \brief Lower bound of the cost of a move in the preferred direction
 * \var CostSpec::preferred
 * \brief Preferred direction of change
 * \var CostSpec::weight
 * \brief Slope of the cost against the absolute deviation
 * \var CostSpec::inverted
 * \brief Increasing the parameter lowers the feature
 */

/**
 * \struct CameraParameter
 * \brief Last known state of a camera parameter
 *
 * The current value is only trusted when the parameter isn't stale. A
 * rejected parameter is excluded from selection until its next successful
 * read.
 */

/**
 * \struct CostModelConfig
 * \brief Cost model configuration
 */

/**
 * \brief Retrieve the built-in cost specifications
 * \return The cost specifications keyed by parameter name
 */
const std::map<std::string, CostSpec> &CostModelConfig::defaultSpecs()
{
	static const std::map<std::string, CostSpec> specs = {
		{ "ExposureIris", { 0.5, 2.0, 0.2, Direction::Increase } },
		{ "ExposureExposureTime", { 1.5, 5.0, 0.5, Direction::Decrease } },
		{ "ExposureGain", { 3.0, 10.0, 1.0, Direction::Decrease } },
		{ "DigitalBrightLevel", { 2.0, 6.0, 0.5, Direction::Either } },
		{ "ColorSaturation", { 0.8, 3.0, 0.3, Direction::Either } },
	};

	return specs;
}

/**
 * \brief Retrieve the built-in parameter ranges
 * \return The parameter ranges keyed by parameter name
 */
const std::map<std::string, ParameterRange> &CostModelConfig::defaultRanges()
{
	static const std::map<std::string, ParameterRange> ranges = {
		{ "ExposureIris", { 0, 17, 1 } },
		{ "ExposureExposureTime", { 0, 21, 1 } },
		{ "ExposureGain", { 0, 15, 1 } },
		{ "DigitalBrightLevel", { 0, 15, 1 } },
		{ "ColorSaturation", { 0, 14, 1 } },
	};

	return ranges;
}

/**
 * \struct Candidate
 * \brief A feasible single step adjustment of one parameter
 */

/**
 * \class ParameterCostModel
 * \brief Pick the cheapest parameter adjustment for a feature deviation
 *
 * For a deviation \f$\Delta = measured - target\f$, a negative deviation
 * requires raising the feature, which moves the parameter up unless it is
 * inverted. The cost of moving a parameter in that direction is
 *
 * - \f$clamp(base - w|\Delta|, min, base)\f$ when the move matches the
 *   preferred direction,
 * - \f$base\f$ when the parameter has no preference,
 * - \f$min(max, base \cdot penalty + w|\Delta|)\f$ otherwise.
 *
 * A parameter whose headroom in the needed direction is within the bound
 * margin gets its cost pushed half way towards its maximum.
 *
 * Only parameters that can move by at least one step are candidates.
 */

/**
 * \brief Construct a cost model
 * \param[in] config The cost model configuration
 */
ParameterCostModel::ParameterCostModel(const CostModelConfig &config)
	: config_(config)
{
}

/**
 * \brief Retrieve the cost specification of a parameter
 * \param[in] parameter The parameter name
 * \return The specification, or nullptr if the parameter has none
 */
const CostSpec *ParameterCostModel::spec(const std::string &parameter) const
{
	auto it = config_.specs.find(parameter);
	if (it == config_.specs.end())
		return nullptr;

	return &it->second;
}

/**
 * \brief Compute the direction in which a parameter must move
 * \param[in] spec The parameter cost specification
 * \param[in] deviation The feature deviation from its target
 * \return The needed direction of change of the parameter value
 */
Direction ParameterCostModel::neededMove(const CostSpec &spec, double deviation) const
{
	bool raise = deviation < 0;
	if (spec.inverted)
		raise = !raise;

	return raise ? Direction::Increase : Direction::Decrease;
}

int32_t ParameterCostModel::headroom(const CameraParameter &parameter,
				     Direction move) const
{
	const ParameterRange &range = parameter.range;
	int32_t value = std::clamp(parameter.currentValue, range.min, range.max);

	return move == Direction::Increase ? range.max - value : value - range.min;
}

/**
 * \brief Compute the cost of moving a parameter to correct a deviation
 * \param[in] parameter The parameter
 * \param[in] deviation The feature deviation from its target
 * \return The cost, or std::nullopt if the parameter has no cost specification
 */
std::optional<double> ParameterCostModel::cost(const CameraParameter &parameter,
					       double deviation) const
{
	const CostSpec *costSpec = spec(parameter.name);
	if (!costSpec)
		return std::nullopt;

	double magnitude = costSpec->weight * std::abs(deviation);
	Direction move = neededMove(*costSpec, deviation);
	double cost;

	if (costSpec->preferred == Direction::Either)
		cost = costSpec->baseCost;
	else if (costSpec->preferred == move)
		cost = std::clamp(costSpec->baseCost - magnitude,
				  costSpec->minCost, costSpec->baseCost);
	else
		cost = std::min(costSpec->maxCost,
				costSpec->baseCost * config_.againstPenalty + magnitude);

	int64_t margin = static_cast<int64_t>(config_.boundMarginSteps) *
			 parameter.range.step;
	if (headroom(parameter, move) <= margin)
		cost += (costSpec->maxCost - cost) * config_.boundPenalty;

	return cost;
}

/**
 * \brief Compute the single step adjustment of a parameter
 * \param[in] parameter The parameter
 * \param[in] deviation The feature deviation from its target
 *
 * \return The candidate adjustment, or std::nullopt if the parameter can't be
 * used or has no room to move in the needed direction
 */
std::optional<Candidate> ParameterCostModel::candidate(const CameraParameter &parameter,
						       double deviation) const
{
	if (!parameter.usable() || deviation == 0.0)
		return std::nullopt;

	const CostSpec *costSpec = spec(parameter.name);
	if (!costSpec)
		return std::nullopt;

	Direction move = neededMove(*costSpec, deviation);
	const ParameterRange &range = parameter.range;

	int64_t target = parameter.currentValue;
	target += move == Direction::Increase ? range.step : -range.step;
	int32_t to = static_cast<int32_t>(std::clamp<int64_t>(target, range.min, range.max));

	if (to == parameter.currentValue)
		return std::nullopt;

	Candidate result;
	result.parameter = parameter.name;
	result.direction = move;
	result.from = parameter.currentValue;
	result.to = to;
	result.headroom = headroom(parameter, move);
	result.cost = *cost(parameter, deviation);

	return result;
}

/**
 * \brief Select the cheapest adjustment among parameters
 * \param[in] parameters The parameters mapped to the feature, in configuration
 * order
 * \param[in] deviation The feature deviation from its target
 *
 * Ties are resolved by configuration order, or by the largest headroom first
 * when configured to.
 *
 * \return The selected adjustment, or std::nullopt if no parameter can move
 */
std::optional<Candidate>
ParameterCostModel::select(const std::vector<const CameraParameter *> &parameters,
			   double deviation) const
{
	std::optional<Candidate> best;

	for (const CameraParameter *parameter : parameters) {
		std::optional<Candidate> option = candidate(*parameter, deviation);
		if (!option)
			continue;

		LOG(CostModel, Debug)
			<< parameter->name << ": " << option->from << " -> "
			<< option->to << " cost " << option->cost;

		if (!best || option->cost < best->cost) {
			best = option;
			continue;
		}

		if (config_.tieBreak == CostModelConfig::TieBreak::Headroom &&
		    option->cost == best->cost && option->headroom > best->headroom)
			best = option;
	}

	return best;
}

} /* namespace camtune */
