/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Per camera control cycle
 */

#include "camtune/internal/adjustment_engine.h"

#include <algorithm>

#include "camtune/internal/concurrency_controller.h"

/**
 * \file internal/adjustment_engine.h
 * \brief Control cycle combining the hysteresis gates and the cost model
 */

namespace camtune {

LOG_DEFINE_CATEGORY(Engine)

/**
 * \struct FeatureConfig
 * \brief A monitored feature and the parameters that influence it
 *
 * The parameter list order is the tie breaking order of the cost model.
 */

/**
 * \brief Retrieve the built-in feature configuration
 * \return The brightness and saturation features
 */
std::vector<FeatureConfig> FeatureConfig::defaults()
{
	return {
		{ "brightness", { 0.25, 0.5, {} },
		  { "ExposureIris", "ExposureExposureTime", "ExposureGain",
		    "DigitalBrightLevel" } },
		{ "saturation", { 0.3, 0.6, {} }, { "ColorSaturation" } },
	};
}

/**
 * \struct Adjustment
 * \brief Record of one submitted adjustment
 */

/**
 * \struct CycleSummary
 * \brief Outcome of a control cycle
 *
 * \var CycleSummary::requested
 * \brief Number of adjustments submitted to the camera
 * \var CycleSummary::applied
 * \brief Number of adjustments acknowledged by the camera
 * \var CycleSummary::stalls
 * \brief Number of features that needed an adjustment and didn't get one
 * applied
 */

/**
 * \class AdjustmentEngine
 * \brief Drive the parameters of one camera towards the feature targets
 *
 * Each cycle reads the parameters whose value isn't trusted, evaluates the
 * hysteresis gate of every measured feature and, for each feature that needs
 * correcting, asks the cost model for the cheapest single step adjustment. The
 * adjustments of a cycle, at most one per feature, are submitted together as
 * one SET batch.
 *
 * A parameter value is trusted after a successful read or an acknowledged
 * write. Any other outcome marks it stale, so that it is read again before
 * the next decision. A rejected write also excludes the parameter from
 * selection until it has been read again. A parameter whose read is rejected
 * is excluded as well and only read again every kRejectedReadBackoff cycles.
 *
 * Failures are reported in the cycle summary and in the log, they never stop
 * the engine.
 */

/**
 * \brief Construct an adjustment engine
 * \param[in] controller The controller used to reach the camera
 * \param[in] costModel The cost model
 * \param[in] features The monitored features
 * \param[in] ranges The ranges of the camera parameters
 * \param[in] cameraId The camera identifier, used in log messages
 *
 * Parameters referenced by \a features but missing from \a ranges fall back to
 * the built-in ranges, or are ignored if they have none.
 */
AdjustmentEngine::AdjustmentEngine(ConcurrencyController *controller,
				   const ParameterCostModel *costModel,
				   const std::vector<FeatureConfig> &features,
				   const std::map<std::string, ParameterRange> &ranges,
				   unsigned int cameraId)
	: controller_(controller), costModel_(costModel), cameraId_(cameraId)
{
	const auto &defaultRanges = CostModelConfig::defaultRanges();

	for (const FeatureConfig &config : features) {
		Feature feature;
		feature.config = config;
		feature.gate = std::make_unique<HysteresisGate>(config.name, config.band);

		for (const std::string &name : config.parameters) {
			if (parameters_.count(name))
				continue;

			auto it = ranges.find(name);
			if (it == ranges.end()) {
				it = defaultRanges.find(name);
				if (it == defaultRanges.end()) {
					LOG(Engine, Warning)
						<< "No range for parameter " << name
						<< ", ignoring";
					continue;
				}
			}

			CameraParameter parameter;
			parameter.name = name;
			parameter.range = it->second;
			parameters_[name] = parameter;
		}

		features_.push_back(std::move(feature));
	}
}

AdjustmentEngine::~AdjustmentEngine()
{
}

std::string AdjustmentEngine::logPrefix() const
{
	return "camera " + std::to_string(cameraId_);
}

/**
 * \brief Run one control cycle
 * \param[in] measured The measured feature values
 * \param[in] targets The feature targets overriding the band midpoints
 *
 * Features missing from \a measured are not evaluated this cycle.
 *
 * \return The cycle summary
 */
CycleSummary AdjustmentEngine::cycle(const FeatureValues &measured,
				     const FeatureValues &targets)
{
	CycleSummary summary;

	refresh();

	std::vector<Plan> plans;

	for (Feature &feature : features_) {
		auto value = measured.find(feature.config.name);
		if (value == measured.end())
			continue;

		std::optional<double> target;
		auto it = targets.find(feature.config.name);
		if (it != targets.end())
			target = it->second;

		HysteresisGate::Decision decision =
			feature.gate->evaluate(value->second, target);
		if (!decision.adjust)
			continue;

		std::optional<Plan> plan = decide(feature, value->second,
						  decision.target, plans);
		if (!plan) {
			summary.stalls++;
			continue;
		}

		plans.push_back(std::move(*plan));
	}

	if (plans.empty())
		return summary;

	apply(plans, summary);

	return summary;
}

/*
 * Read all parameters whose value isn't trusted. Parameters that can't be
 * read stay stale and are excluded from this cycle.
 */
void AdjustmentEngine::refresh()
{
	std::vector<std::string> names;
	for (const auto &[name, parameter] : parameters_) {
		if (!parameter.stale)
			continue;

		auto backoff = readBackoff_.find(name);
		if (backoff != readBackoff_.end() && backoff->second > 0) {
			backoff->second--;
			continue;
		}

		names.push_back(name);
	}

	if (names.empty())
		return;

	std::vector<CommandResult> results = controller_->get(names);

	for (const CommandResult &result : results) {
		auto it = parameters_.find(result.parameter);
		if (it == parameters_.end())
			continue;

		CameraParameter &parameter = it->second;

		if (result.outcome == Outcome::Rejected) {
			if (!parameter.rejected)
				LOG(Engine, Warning)
					<< "Camera rejected reading " << parameter.name
					<< ", excluding it";
			parameter.rejected = true;
			readBackoff_[parameter.name] = kRejectedReadBackoff;
			continue;
		}

		if (!result.ok() || !result.achieved) {
			if (result.failed())
				LOG(Engine, Warning)
					<< "Failed to read " << parameter.name
					<< ": " << result.outcome;
			continue;
		}

		parameter.currentValue = *result.achieved;
		parameter.stale = false;
		parameter.rejected = false;
		readBackoff_.erase(parameter.name);

		LOG(Engine, Debug)
			<< parameter.name << " = " << parameter.currentValue;
	}
}

std::optional<AdjustmentEngine::Plan>
AdjustmentEngine::decide(Feature &feature, double measured,
			 std::optional<double> target,
			 const std::vector<Plan> &plans)
{
	double deviation = measured - target.value_or(feature.config.band.midpoint());

	std::vector<const CameraParameter *> candidates;
	for (const std::string &name : feature.config.parameters) {
		auto it = parameters_.find(name);
		if (it == parameters_.end())
			continue;

		/* One change per parameter and cycle. */
		bool planned = std::any_of(plans.begin(), plans.end(),
					   [&](const Plan &plan) {
						   return plan.candidate.parameter == name;
					   });
		if (planned)
			continue;

		candidates.push_back(&it->second);
	}

	std::optional<Candidate> candidate = costModel_->select(candidates, deviation);
	if (!candidate) {
		LOG(Engine, Warning)
			<< feature.config.name << ": no suitable parameter (deviation "
			<< deviation << ")";
		return std::nullopt;
	}

	LOG(Engine, Debug)
		<< feature.config.name << ": " << candidate->parameter << " "
		<< candidate->from << " -> " << candidate->to
		<< " (deviation " << deviation << ", cost " << candidate->cost << ")";

	return Plan{ feature.config.name, std::move(*candidate) };
}

void AdjustmentEngine::apply(const std::vector<Plan> &plans, CycleSummary &summary)
{
	ParameterValues values;
	for (const Plan &plan : plans)
		values[plan.candidate.parameter] = plan.candidate.to;

	summary.requested = plans.size();

	std::vector<CommandResult> results = controller_->set(values);

	for (const Plan &plan : plans) {
		auto result = std::find_if(results.begin(), results.end(),
					   [&](const CommandResult &r) {
						   return r.parameter == plan.candidate.parameter;
					   });
		Outcome outcome = result != results.end() ? result->outcome
							  : Outcome::Error;

		CameraParameter &parameter = parameters_[plan.candidate.parameter];

		record(plan, outcome);

		switch (outcome) {
		case Outcome::Ok:
			parameter.currentValue = result->achieved.value_or(plan.candidate.to);
			summary.applied++;
			break;

		case Outcome::Rejected:
			LOG(Engine, Warning)
				<< plan.feature << ": camera rejected "
				<< parameter.name << "=" << plan.candidate.to;
			parameter.stale = true;
			parameter.rejected = true;
			summary.stalls++;
			break;

		case Outcome::Cancelled:
			parameter.stale = true;
			break;

		default:
			LOG(Engine, Warning)
				<< plan.feature << ": failed to set "
				<< parameter.name << "=" << plan.candidate.to
				<< ": " << outcome;
			parameter.stale = true;
			summary.stalls++;
			break;
		}
	}
}

void AdjustmentEngine::record(const Plan &plan, Outcome outcome)
{
	history_.push_back({ utils::clock::now(), plan.feature,
			     plan.candidate.parameter, plan.candidate.from,
			     plan.candidate.to, plan.candidate.cost, outcome });

	while (history_.size() > kHistorySize)
		history_.pop_front();
}

/**
 * \brief Mark all parameter values as untrusted
 *
 * The next cycle reads every parameter again. This is used after the camera
 * has been reconnected or modified behind the engine's back.
 */
void AdjustmentEngine::invalidate()
{
	for (auto &[name, parameter] : parameters_)
		parameter.stale = true;

	readBackoff_.clear();
}

/**
 * \brief Retrieve the state of a parameter
 * \param[in] name The parameter name
 * \return The parameter, or nullptr if it isn't monitored
 */
const CameraParameter *AdjustmentEngine::parameter(const std::string &name) const
{
	auto it = parameters_.find(name);
	if (it == parameters_.end())
		return nullptr;

	return &it->second;
}

/**
 * \brief Retrieve the hysteresis gate of a feature
 * \param[in] feature The feature name
 * \return The gate, or nullptr if the feature isn't monitored
 */
const HysteresisGate *AdjustmentEngine::gate(const std::string &feature) const
{
	for (const Feature &f : features_) {
		if (f.config.name == feature)
			return f.gate.get();
	}

	return nullptr;
}

} /* namespace camtune */
