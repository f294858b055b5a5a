/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Bounded, rate limited and adaptive execution of parameter operations
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

#include <camtune/base/class.h>
#include <camtune/base/log.h>
#include <camtune/base/mutex.h>
#include <camtune/base/utils.h>

#include "camtune/internal/command.h"
#include "camtune/internal/token_bucket.h"

namespace camtune {

class ProtocolTransport;

struct PacingConfig {
	utils::Duration concurrent = std::chrono::milliseconds(10);
	utils::Duration sequential = std::chrono::milliseconds(20);
	utils::Duration retryDelay = std::chrono::milliseconds(50);
};

struct RecoveryConfig {
	unsigned int window = 10;
	unsigned int step = 1;
	utils::Duration cooldown = std::chrono::milliseconds(0);
};

struct RateLimitConfig {
	bool setOperations = true;
	bool getOperations = false;
	double maxRequestsPerSecond = 10.0;
	unsigned int burst = 1;
};

struct ConcurrencyConfig {
	bool enabled = true;
	unsigned int maxConcurrentOperations = 5;
	bool fallbackToSequential = true;
	RecoveryConfig recovery;
	PacingConfig pacing;
	RateLimitConfig rateLimiting;
};

struct ConcurrencyStats {
	bool enabled;
	unsigned int currentLimit;
	unsigned int maxLimit;
	uint64_t successCount;
	uint64_t failureCount;
	double successRate;
	bool rateLimitingActive;

	unsigned int peakInFlight;
	unsigned int reconnectFailures;
};

class ConcurrencyController : public Loggable
{
public:
	ConcurrencyController(ProtocolTransport *transport,
			      const ConcurrencyConfig &config,
			      unsigned int cameraId = 0);
	~ConcurrencyController();

	std::vector<CommandResult> get(const std::vector<std::string> &names);
	std::vector<CommandResult> set(const ParameterValues &values);

	int reconnect();
	void cancel();
	bool cancelled() const { return cancelled_; }

	ConcurrencyStats stats() const CAMTUNE_TSA_EXCLUDES(mutex_);
	unsigned int currentLimit() const CAMTUNE_TSA_EXCLUDES(mutex_);
	unsigned int reconnectFailures() const { return reconnectFailures_; }

protected:
	std::string logPrefix() const override;

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(ConcurrencyController)

	enum class Type {
		Get,
		Set,
	};

	struct Operation {
		std::string parameter;
		std::optional<int32_t> value;
	};

	std::vector<CommandResult> dispatch(Type type, std::vector<Operation> &operations);
	CommandResult execute(Type type, const Operation &operation);
	CommandResult attempt(Type type, const Operation &operation);

	bool admit(const std::string &parameter) CAMTUNE_TSA_EXCLUDES(mutex_);
	void finish(const std::string &parameter) CAMTUNE_TSA_EXCLUDES(mutex_);
	bool pace() CAMTUNE_TSA_EXCLUDES(dispatchMutex_);
	bool sleep(utils::Duration duration) CAMTUNE_TSA_EXCLUDES(mutex_);
	bool reconnectAfterError(uint64_t generation);
	void account(const CommandResult &result) CAMTUNE_TSA_EXCLUDES(mutex_);
	void recover(utils::time_point now) CAMTUNE_TSA_REQUIRES(mutex_);

	bool rateLimited(Type type) const;

	ProtocolTransport *transport_;
	const ConcurrencyConfig config_;
	const unsigned int cameraId_;

	std::unique_ptr<TokenBucket> bucket_;
	std::atomic<bool> cancelled_;

	mutable Mutex mutex_;
	ConditionVariable cv_;
	unsigned int currentLimit_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int inFlight_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int peakInFlight_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::set<std::string> busy_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	uint64_t successCount_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	uint64_t failureCount_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int cleanStreak_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	utils::time_point lastChange_ CAMTUNE_TSA_GUARDED_BY(mutex_);

	Mutex dispatchMutex_;
	ConditionVariable dispatchCv_;
	std::optional<utils::time_point> lastDispatch_ CAMTUNE_TSA_GUARDED_BY(dispatchMutex_);

	Mutex reconnectMutex_;
	std::atomic<uint64_t> generation_;
	std::atomic<unsigned int> reconnectFailures_;
	bool lastReconnectOk_ CAMTUNE_TSA_GUARDED_BY(reconnectMutex_);
};

} /* namespace camtune */
