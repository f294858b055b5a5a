/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * fake_transport.cpp - In-process camera transport for tests
 */

#include <algorithm>
#include <errno.h>
#include <stdlib.h>
#include <thread>

#include "fake_transport.h"

using namespace camtune;

/*
 * Track the calls in flight, overall and per parameter, for the lifetime of
 * a transport call.
 */
FakeTransport::Call::Call(FakeTransport *transport,
			  const std::vector<std::string> &names)
	: transport_(transport), names_(names)
{
	MutexLocker locker(transport_->mutex_);

	transport_->dispatches_.push_back(utils::clock::now());
	transport_->inFlight_++;
	transport_->peakInFlight_ = std::max(transport_->peakInFlight_,
					     transport_->inFlight_);

	for (const std::string &name : names_) {
		unsigned int &count = transport_->nameInFlight_[name];
		count++;
		unsigned int &peak = transport_->namePeak_[name];
		peak = std::max(peak, count);
	}
}

FakeTransport::Call::~Call()
{
	MutexLocker locker(transport_->mutex_);

	transport_->inFlight_--;
	for (const std::string &name : names_)
		transport_->nameInFlight_[name]--;
}

FakeTransport::FakeTransport()
	: connected_(false), aborted_(false), connectResult_(0),
	  connectLatency_(), latency_(), connects_(0), disconnects_(0),
	  inFlight_(0), peakInFlight_(0)
{
}

/* The handshake delay isn't interrupted by abort(). */
int FakeTransport::connect()
{
	utils::Duration delay;
	{
		MutexLocker locker(mutex_);
		delay = connectLatency_;
	}

	if (delay)
		std::this_thread::sleep_for(delay.toClock());

	MutexLocker locker(mutex_);

	connects_++;
	aborted_ = false;
	connected_ = connectResult_ == 0;

	return connectResult_;
}

void FakeTransport::disconnect()
{
	MutexLocker locker(mutex_);

	disconnects_++;
	connected_ = false;
}

void FakeTransport::abort()
{
	{
		MutexLocker locker(mutex_);
		aborted_ = true;
	}

	cv_.notify_all();
}

/* Simulate the camera response time. Return false if aborted meanwhile. */
bool FakeTransport::sleep()
{
	MutexLocker locker(mutex_);

	if (latency_)
		cv_.wait_for(locker, latency_.toClock(),
			     [this]() CAMTUNE_TSA_REQUIRES(mutex_) { return aborted_; });

	return !aborted_;
}

std::optional<Outcome> FakeTransport::scripted(Operation operation,
					       const std::string &name)
{
	auto it = failures_.find({ operation, name });
	if (it == failures_.end() || it->second.empty())
		return std::nullopt;

	Outcome outcome = it->second.front();
	it->second.pop_front();

	return outcome;
}

std::vector<CommandResult>
FakeTransport::getParameters(const std::vector<std::string> &names)
{
	Call call(this, names);
	bool completed = sleep();

	std::vector<CommandResult> results;
	MutexLocker locker(mutex_);

	for (const std::string &name : names) {
		CommandResult result{ name, std::nullopt, std::nullopt, Outcome::Ok };
		gets_[name]++;

		std::optional<Outcome> failure = scripted(Operation::Get, name);
		auto it = values_.find(name);

		if (!completed)
			result.outcome = Outcome::Cancelled;
		else if (failure)
			result.outcome = *failure;
		else if (it == values_.end())
			result.outcome = Outcome::Rejected;
		else
			result.achieved = it->second;

		results.push_back(std::move(result));
	}

	return results;
}

std::vector<CommandResult>
FakeTransport::setParameters(const ParameterValues &values)
{
	std::vector<std::string> names;
	for (const auto &entry : values)
		names.push_back(entry.first);

	Call call(this, names);
	bool completed = sleep();

	std::vector<CommandResult> results;
	MutexLocker locker(mutex_);

	for (const auto &[name, value] : values) {
		CommandResult result{ name, value, std::nullopt, Outcome::Ok };
		sets_[name]++;

		std::optional<Outcome> failure = scripted(Operation::Set, name);

		if (!completed) {
			result.outcome = Outcome::Cancelled;
		} else if (failure) {
			result.outcome = *failure;
		} else if (!values_.count(name)) {
			result.outcome = Outcome::Rejected;
		} else {
			values_[name] = value;
			result.achieved = value;
		}

		results.push_back(std::move(result));
	}

	return results;
}

int FakeTransport::applyPreset(const std::string &arguments)
{
	int ret = 0;

	MutexLocker locker(mutex_);
	presets_.push_back(arguments);

	for (const auto &[name, value] : parseArguments(arguments)) {
		auto it = values_.find(name);
		if (it == values_.end())
			continue;

		char *end = nullptr;
		long number = strtol(value.c_str(), &end, 10);
		if (value.empty() || *end != '\0') {
			ret = -EINVAL;
			continue;
		}

		it->second = static_cast<int32_t>(number);
	}

	return ret;
}

void FakeTransport::setValue(const std::string &name, int32_t value)
{
	MutexLocker locker(mutex_);
	values_[name] = value;
}

std::optional<int32_t> FakeTransport::value(const std::string &name) const
{
	MutexLocker locker(mutex_);

	auto it = values_.find(name);
	if (it == values_.end())
		return std::nullopt;

	return it->second;
}

/*
 * Make the next \a count operations of type \a operation on \a name
 * complete with \a outcome.
 */
void FakeTransport::fail(Operation operation, const std::string &name,
			 Outcome outcome, unsigned int count)
{
	MutexLocker locker(mutex_);

	std::deque<Outcome> &queue = failures_[{ operation, name }];
	queue.insert(queue.end(), count, outcome);
}

void FakeTransport::setLatency(utils::Duration latency)
{
	MutexLocker locker(mutex_);
	latency_ = latency;
}

void FakeTransport::setConnectResult(int result)
{
	MutexLocker locker(mutex_);
	connectResult_ = result;
}

void FakeTransport::setConnectLatency(utils::Duration latency)
{
	MutexLocker locker(mutex_);
	connectLatency_ = latency;
}

unsigned int FakeTransport::gets(const std::string &name) const
{
	MutexLocker locker(mutex_);

	auto it = gets_.find(name);
	return it != gets_.end() ? it->second : 0;
}

unsigned int FakeTransport::sets(const std::string &name) const
{
	MutexLocker locker(mutex_);

	auto it = sets_.find(name);
	return it != sets_.end() ? it->second : 0;
}

bool FakeTransport::aborted() const
{
	MutexLocker locker(mutex_);
	return aborted_;
}

unsigned int FakeTransport::connects() const
{
	MutexLocker locker(mutex_);
	return connects_;
}

unsigned int FakeTransport::disconnects() const
{
	MutexLocker locker(mutex_);
	return disconnects_;
}

unsigned int FakeTransport::peakInFlight() const
{
	MutexLocker locker(mutex_);
	return peakInFlight_;
}

unsigned int FakeTransport::peakInFlight(const std::string &name) const
{
	MutexLocker locker(mutex_);

	auto it = namePeak_.find(name);
	return it != namePeak_.end() ? it->second : 0;
}

std::vector<utils::time_point> FakeTransport::dispatches() const
{
	MutexLocker locker(mutex_);
	return dispatches_;
}

std::vector<std::string> FakeTransport::presets() const
{
	MutexLocker locker(mutex_);
	return presets_;
}
