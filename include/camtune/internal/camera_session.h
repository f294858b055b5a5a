/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Control loop of one camera
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <stdint.h>
#include <string>
#include <thread>

#include <camtune/base/class.h>
#include <camtune/base/log.h>
#include <camtune/base/mutex.h>

#include "camtune/internal/adjustment_engine.h"
#include "camtune/internal/configuration.h"
#include "camtune/internal/cost_model.h"

namespace camtune {

class ConcurrencyController;
class ProtocolTransport;
class SyncPublisher;
class TargetCache;

class CameraSession : public Loggable
{
public:
	CameraSession(const Configuration &config, const CameraConfig &camera,
		      TargetCache *targets = nullptr,
		      SyncPublisher *publisher = nullptr);
	~CameraSession();

	int start();
	void stop();

	void post(const FeatureValues &features) CAMTUNE_TSA_EXCLUDES(mutex_);

	unsigned int id() const { return camera_.id; }
	bool isMaster() const;
	bool healthy() const { return healthy_; }
	uint64_t cycles() const { return cycles_; }

	ConcurrencyStats stats() const;
	CycleSummary lastSummary() const CAMTUNE_TSA_EXCLUDES(mutex_);

protected:
	std::string logPrefix() const override;

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(CameraSession)

	void run();
	void runCycle(const FeatureValues &features);
	void publishTargets(const FeatureValues &features);
	void updateHealth();

	const Configuration &config_;
	const CameraConfig camera_;
	TargetCache *targets_;
	SyncPublisher *publisher_;

	std::unique_ptr<ProtocolTransport> transport_;
	std::unique_ptr<ConcurrencyController> controller_;
	ParameterCostModel costModel_;
	std::unique_ptr<AdjustmentEngine> engine_;

	std::thread thread_;
	std::atomic<bool> healthy_;
	std::atomic<uint64_t> cycles_;

	mutable Mutex mutex_;
	ConditionVariable cv_;
	std::optional<FeatureValues> pending_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	CycleSummary summary_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	bool running_ CAMTUNE_TSA_GUARDED_BY(mutex_);
};

} /* namespace camtune */
