/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * fake_transport.h - In-process camera transport for tests
 */

#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <camtune/base/mutex.h>
#include <camtune/base/utils.h>

#include "camtune/internal/protocol_transport.h"

class FakeTransport : public camtune::ProtocolTransport
{
public:
	enum class Operation {
		Get,
		Set,
	};

	FakeTransport();

	int connect() override;
	void disconnect() override;
	bool isConnected() const override { return connected_; }

	std::vector<camtune::CommandResult>
	getParameters(const std::vector<std::string> &names) override;
	std::vector<camtune::CommandResult>
	setParameters(const camtune::ParameterValues &values) override;

	int applyPreset(const std::string &arguments) override;

	void abort() override;

	/* Camera behaviour */
	void setValue(const std::string &name, int32_t value);
	std::optional<int32_t> value(const std::string &name) const;
	void fail(Operation operation, const std::string &name,
		  camtune::Outcome outcome, unsigned int count = 1);
	void setLatency(camtune::utils::Duration latency);
	void setConnectResult(int result);
	void setConnectLatency(camtune::utils::Duration latency);

	/* Observations */
	unsigned int gets(const std::string &name) const;
	unsigned int sets(const std::string &name) const;
	unsigned int connects() const;
	unsigned int disconnects() const;
	bool aborted() const;
	unsigned int peakInFlight() const;
	unsigned int peakInFlight(const std::string &name) const;
	std::vector<camtune::utils::time_point> dispatches() const;
	std::vector<std::string> presets() const;

private:
	struct Call {
		Call(FakeTransport *transport, const std::vector<std::string> &names);
		~Call();

		FakeTransport *transport_;
		std::vector<std::string> names_;
	};

	bool sleep() CAMTUNE_TSA_EXCLUDES(mutex_);
	std::optional<camtune::Outcome> scripted(Operation operation,
						 const std::string &name)
		CAMTUNE_TSA_REQUIRES(mutex_);

	std::atomic<bool> connected_;

	mutable camtune::Mutex mutex_;
	camtune::ConditionVariable cv_;

	bool aborted_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	int connectResult_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	camtune::utils::Duration connectLatency_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	camtune::utils::Duration latency_ CAMTUNE_TSA_GUARDED_BY(mutex_);

	std::map<std::string, int32_t> values_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::map<std::pair<Operation, std::string>, std::deque<camtune::Outcome>>
		failures_ CAMTUNE_TSA_GUARDED_BY(mutex_);

	std::map<std::string, unsigned int> gets_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::map<std::string, unsigned int> sets_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int connects_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int disconnects_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int inFlight_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int peakInFlight_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::map<std::string, unsigned int> nameInFlight_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::map<std::string, unsigned int> namePeak_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::vector<camtune::utils::time_point> dispatches_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::vector<std::string> presets_ CAMTUNE_TSA_GUARDED_BY(mutex_);
};
