/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Per camera control cycle
 */

#pragma once

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

#include <camtune/base/class.h>
#include <camtune/base/log.h>
#include <camtune/base/utils.h>

#include "camtune/internal/command.h"
#include "camtune/internal/cost_model.h"
#include "camtune/internal/hysteresis_gate.h"

namespace camtune {

class ConcurrencyController;

using FeatureValues = std::map<std::string, double>;

struct FeatureConfig {
	std::string name;
	FeatureBand band;
	std::vector<std::string> parameters;

	static std::vector<FeatureConfig> defaults();
};

struct Adjustment {
	utils::time_point time;
	std::string feature;
	std::string parameter;
	int32_t from;
	int32_t to;
	double cost;
	Outcome outcome;
};

struct CycleSummary {
	unsigned int requested = 0;
	unsigned int applied = 0;
	unsigned int stalls = 0;
};

class AdjustmentEngine : public Loggable
{
public:
	static constexpr unsigned int kHistorySize = 100;
	static constexpr unsigned int kRejectedReadBackoff = 10;

	AdjustmentEngine(ConcurrencyController *controller,
			 const ParameterCostModel *costModel,
			 const std::vector<FeatureConfig> &features,
			 const std::map<std::string, ParameterRange> &ranges,
			 unsigned int cameraId = 0);
	~AdjustmentEngine();

	CycleSummary cycle(const FeatureValues &measured,
			   const FeatureValues &targets = {});

	void invalidate();

	const CameraParameter *parameter(const std::string &name) const;
	const HysteresisGate *gate(const std::string &feature) const;
	const std::deque<Adjustment> &history() const { return history_; }

protected:
	std::string logPrefix() const override;

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(AdjustmentEngine)

	struct Feature {
		FeatureConfig config;
		std::unique_ptr<HysteresisGate> gate;
	};

	struct Plan {
		std::string feature;
		Candidate candidate;
	};

	void refresh();
	std::optional<Plan> decide(Feature &feature, double measured,
				   std::optional<double> target,
				   const std::vector<Plan> &plans);
	void apply(const std::vector<Plan> &plans, CycleSummary &summary);
	void record(const Plan &plan, Outcome outcome);

	ConcurrencyController *controller_;
	const ParameterCostModel *costModel_;
	const unsigned int cameraId_;

	std::vector<Feature> features_;
	std::map<std::string, CameraParameter> parameters_;
	std::map<std::string, unsigned int> readBackoff_;
	std::deque<Adjustment> history_;
};

} /* namespace camtune */
