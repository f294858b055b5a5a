/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Master/slave synchronization of feature targets
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include <camtune/base/class.h>
#include <camtune/base/mutex.h>
#include <camtune/base/unique_fd.h>
#include <camtune/base/utils.h>

namespace camtune {

struct TargetFeature {
	std::string feature;
	double value;
	int64_t timestamp;
	unsigned int cameraId;

	std::string serialize() const;
	static std::optional<TargetFeature> parse(const std::string &feature,
						  const std::string &payload);
};

std::string targetTopic(const std::string &feature);

class MessageBus
{
public:
	using Handler = std::function<void(const std::string &topic,
					   const std::string &payload)>;

	virtual ~MessageBus();

	virtual int publish(const std::string &topic, const std::string &payload) = 0;
	void subscribe(const std::string &prefix, Handler handler);

protected:
	void deliver(const std::string &topic, const std::string &payload);

private:
	std::vector<std::pair<std::string, Handler>> subscriptions_;
};

class LocalBus : public MessageBus
{
public:
	int publish(const std::string &topic, const std::string &payload) override;
};

class UdpBus : public MessageBus
{
public:
	UdpBus(const std::string &group, uint16_t port);

	int open();
	int fd() const { return fd_.get(); }

	int publish(const std::string &topic, const std::string &payload) override;
	void process();

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(UdpBus)

	std::string group_;
	uint16_t port_;
	UniqueFD fd_;
};

class TargetCache
{
public:
	TargetCache(unsigned int masterId, unsigned int selfId,
		    utils::Duration staleness);

	bool update(const TargetFeature &target,
		    utils::time_point now = utils::clock::now())
		CAMTUNE_TSA_EXCLUDES(mutex_);
	std::optional<double> target(const std::string &feature,
				     utils::time_point now = utils::clock::now()) const
		CAMTUNE_TSA_EXCLUDES(mutex_);
	std::map<std::string, double> targets(utils::time_point now = utils::clock::now()) const
		CAMTUNE_TSA_EXCLUDES(mutex_);

	unsigned int masterId() const { return masterId_; }

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(TargetCache)

	struct Entry {
		TargetFeature target;
		utils::time_point received;
	};

	bool fresh(const Entry &entry, utils::time_point now) const;

	const unsigned int masterId_;
	const unsigned int selfId_;
	const utils::Duration staleness_;

	mutable Mutex mutex_;
	std::map<std::string, Entry> entries_ CAMTUNE_TSA_GUARDED_BY(mutex_);
};

class SyncPublisher
{
public:
	SyncPublisher(MessageBus *bus, unsigned int cameraId);

	int publish(const std::string &feature, double value);

private:
	MessageBus *bus_;
	unsigned int cameraId_;
};

class SyncSubscriber
{
public:
	SyncSubscriber(MessageBus *bus, TargetCache *cache);

private:
	void received(const std::string &topic, const std::string &payload);

	TargetCache *cache_;
};

} /* namespace camtune */
