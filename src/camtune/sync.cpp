/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Master/slave synchronization of feature targets
 */

#include "camtune/internal/sync.h"

#include <arpa/inet.h>
#include <chrono>
#include <errno.h>
#include <iomanip>
#include <locale>
#include <netinet/in.h>
#include <sstream>
#include <string.h>
#include <sys/socket.h>

#include <camtune/base/log.h>

#include "camtune/internal/yaml_parser.h"

/**
 * \file internal/sync.h
 * \brief Publication and caching of master feature targets
 */

namespace camtune {

LOG_DEFINE_CATEGORY(Sync)

namespace {

const std::string kTargetTopicPrefix = "features.target.";

} /* namespace */

/**
 * \struct TargetFeature
 * \brief Feature target published by the master camera
 *
 * \var TargetFeature::timestamp
 * \brief Publication time in nanoseconds since the epoch, as seen by the
 * publisher
 */

/**
 * \brief Serialize the target to a message payload
 *
 * The payload is a YAML flow mapping such as
 * `{value: 0.35, timestamp: 1718000000000000000, camera_id: 1}`. The feature
 * name is carried by the topic.
 *
 * \return The payload
 */
std::string TargetFeature::serialize() const
{
	std::ostringstream ss;
	ss.imbue(std::locale::classic());

	ss << "{value: " << std::setprecision(9) << value
	   << ", timestamp: " << timestamp
	   << ", camera_id: " << cameraId << "}";

	return ss.str();
}

/**
 * \brief Parse a target from a message payload
 * \param[in] feature The feature name, taken from the topic
 * \param[in] payload The message payload
 * \return The target, or std::nullopt if the payload is malformed
 */
std::optional<TargetFeature> TargetFeature::parse(const std::string &feature,
						  const std::string &payload)
{
	std::optional<YamlNode> root = YamlParser::parseString(payload);
	if (!root || !root->isDictionary()) {
		LOG(Sync, Warning) << "Malformed target payload for " << feature;
		return std::nullopt;
	}

	std::optional<double> value = (*root)["value"].get<double>();
	std::optional<int64_t> timestamp = (*root)["timestamp"].get<int64_t>();
	std::optional<uint32_t> cameraId = (*root)["camera_id"].get<uint32_t>();

	if (!value || !timestamp || !cameraId) {
		LOG(Sync, Warning) << "Incomplete target payload for " << feature;
		return std::nullopt;
	}

	return TargetFeature{ feature, *value, *timestamp, *cameraId };
}

/**
 * \brief Retrieve the topic on which the target of a feature is published
 * \param[in] feature The feature name
 * \return The topic name
 */
std::string targetTopic(const std::string &feature)
{
	return kTargetTopicPrefix + feature;
}

/**
 * \class MessageBus
 * \brief Minimal publish/subscribe interface
 *
 * Handlers are called for every message whose topic starts with the
 * subscription prefix. Delivery is best effort and unordered across
 * publishers.
 */

MessageBus::~MessageBus()
{
}

/**
 * \fn MessageBus::publish()
 * \brief Publish a message
 * \param[in] topic The message topic
 * \param[in] payload The message payload
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \brief Subscribe to a topic prefix
 * \param[in] prefix The topic prefix
 * \param[in] handler The function called for each matching message
 */
void MessageBus::subscribe(const std::string &prefix, Handler handler)
{
	subscriptions_.emplace_back(prefix, std::move(handler));
}

/**
 * \brief Dispatch a received message to the matching subscriptions
 * \param[in] topic The message topic
 * \param[in] payload The message payload
 */
void MessageBus::deliver(const std::string &topic, const std::string &payload)
{
	for (const auto &[prefix, handler] : subscriptions_) {
		if (topic.compare(0, prefix.size(), prefix) == 0)
			handler(topic, payload);
	}
}

/**
 * \class LocalBus
 * \brief In-process bus delivering messages synchronously
 */

int LocalBus::publish(const std::string &topic, const std::string &payload)
{
	deliver(topic, payload);
	return 0;
}

/**
 * \class UdpBus
 * \brief Bus carried by UDP datagrams
 *
 * Each message is one datagram made of the topic, a newline and the payload.
 * When the group address is a multicast address the bus joins the group and
 * receives the messages of all publishers on the network segment, including
 * its own.
 *
 * The bus doesn't run any thread. The owner polls fd() and calls process()
 * when it is readable.
 */

/**
 * \brief Construct a UDP bus
 * \param[in] group The destination address, usually a multicast group
 * \param[in] port The UDP port
 */
UdpBus::UdpBus(const std::string &group, uint16_t port)
	: group_(group), port_(port)
{
}

/**
 * \brief Create the socket and join the group
 * \return 0 on success or a negative error code otherwise
 */
int UdpBus::open()
{
	struct in_addr group;
	if (inet_pton(AF_INET, group_.c_str(), &group) != 1) {
		LOG(Sync, Error) << "Invalid sync group " << group_;
		return -EINVAL;
	}

	UniqueFD fd(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
	if (!fd.isValid()) {
		int ret = -errno;
		LOG(Sync, Error) << "Failed to create socket: " << strerror(-ret);
		return ret;
	}

	int one = 1;
	if (setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
		int ret = -errno;
		LOG(Sync, Error) << "Failed to set SO_REUSEADDR: " << strerror(-ret);
		return ret;
	}

	struct sockaddr_in addr = {};
	addr.sin_family = AF_INET;
	addr.sin_port = htons(port_);
	addr.sin_addr.s_addr = htonl(INADDR_ANY);

	if (bind(fd.get(), reinterpret_cast<struct sockaddr *>(&addr),
		 sizeof(addr)) < 0) {
		int ret = -errno;
		LOG(Sync, Error)
			<< "Failed to bind to port " << port_ << ": " << strerror(-ret);
		return ret;
	}

	if (IN_MULTICAST(ntohl(group.s_addr))) {
		struct ip_mreq mreq = {};
		mreq.imr_multiaddr = group;
		mreq.imr_interface.s_addr = htonl(INADDR_ANY);

		if (setsockopt(fd.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP,
			       &mreq, sizeof(mreq)) < 0) {
			int ret = -errno;
			LOG(Sync, Error)
				<< "Failed to join " << group_ << ": " << strerror(-ret);
			return ret;
		}

		unsigned char loop = 1;
		if (setsockopt(fd.get(), IPPROTO_IP, IP_MULTICAST_LOOP,
			       &loop, sizeof(loop)) < 0)
			LOG(Sync, Warning)
				<< "Failed to enable multicast loopback: "
				<< strerror(errno);
	}

	fd_ = std::move(fd);

	LOG(Sync, Info) << "Sync bus on " << group_ << ":" << port_;

	return 0;
}

int UdpBus::publish(const std::string &topic, const std::string &payload)
{
	if (!fd_.isValid())
		return -ENOTCONN;

	struct sockaddr_in addr = {};
	addr.sin_family = AF_INET;
	addr.sin_port = htons(port_);
	inet_pton(AF_INET, group_.c_str(), &addr.sin_addr);

	std::string message = topic + "\n" + payload;

	ssize_t ret = sendto(fd_.get(), message.data(), message.size(), 0,
			     reinterpret_cast<struct sockaddr *>(&addr),
			     sizeof(addr));
	if (ret < 0) {
		int err = -errno;
		LOG(Sync, Warning)
			<< "Failed to publish " << topic << ": " << strerror(-err);
		return err;
	}

	return 0;
}

/**
 * \brief Read and dispatch all pending datagrams
 */
void UdpBus::process()
{
	char buffer[2048];

	while (fd_.isValid()) {
		ssize_t size = recv(fd_.get(), buffer, sizeof(buffer), 0);
		if (size < 0) {
			if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
				LOG(Sync, Warning) << "recv() failed: " << strerror(errno);
			return;
		}

		std::string message(buffer, size);
		std::string::size_type pos = message.find('\n');
		if (pos == std::string::npos) {
			LOG(Sync, Debug) << "Dropping datagram without topic";
			continue;
		}

		deliver(message.substr(0, pos), message.substr(pos + 1));
	}
}

/**
 * \class TargetCache
 * \brief Latest feature targets received from the master camera
 *
 * The cache only accepts targets published by the configured master, and
 * ignores the targets published by the local camera itself. For each feature
 * the target with the most recent publisher timestamp wins. A target is fresh
 * while the time elapsed since its reception, measured on the local
 * monotonic clock, is below the staleness threshold.
 *
 * The cache is written by the subscriber and read by the camera sessions.
 */

/**
 * \brief Construct a target cache
 * \param[in] masterId The identifier of the master camera
 * \param[in] selfId The identifier of the local camera
 * \param[in] staleness The age after which a target is ignored
 */
TargetCache::TargetCache(unsigned int masterId, unsigned int selfId,
			 utils::Duration staleness)
	: masterId_(masterId), selfId_(selfId), staleness_(staleness)
{
}

/**
 * \brief Store a received target
 * \param[in] target The target
 * \param[in] now The reception time
 * \return True if the target has been stored, false if it has been ignored
 */
bool TargetCache::update(const TargetFeature &target, utils::time_point now)
{
	if (target.cameraId != masterId_ || target.cameraId == selfId_)
		return false;

	MutexLocker locker(mutex_);

	auto it = entries_.find(target.feature);
	if (it != entries_.end() && it->second.target.timestamp > target.timestamp) {
		LOG(Sync, Debug) << "Ignoring out of order target for "
				 << target.feature;
		return false;
	}

	entries_[target.feature] = { target, now };

	LOG(Sync, Debug)
		<< "Target " << target.feature << " = " << target.value
		<< " from camera " << target.cameraId;

	return true;
}

bool TargetCache::fresh(const Entry &entry, utils::time_point now) const
{
	return now - entry.received < staleness_.toClock();
}

/**
 * \brief Retrieve the fresh target of a feature
 * \param[in] feature The feature name
 * \param[in] now The current time
 * \return The target value, or std::nullopt if there is no fresh target
 */
std::optional<double> TargetCache::target(const std::string &feature,
					  utils::time_point now) const
{
	MutexLocker locker(mutex_);

	auto it = entries_.find(feature);
	if (it == entries_.end() || !fresh(it->second, now))
		return std::nullopt;

	return it->second.target.value;
}

/**
 * \brief Retrieve all fresh targets
 * \param[in] now The current time
 * \return The target values keyed by feature name
 */
std::map<std::string, double> TargetCache::targets(utils::time_point now) const
{
	MutexLocker locker(mutex_);

	std::map<std::string, double> result;
	for (const auto &[feature, entry] : entries_) {
		if (fresh(entry, now))
			result[feature] = entry.target.value;
	}

	return result;
}

/**
 * \class SyncPublisher
 * \brief Publish the targets of the master camera
 */

SyncPublisher::SyncPublisher(MessageBus *bus, unsigned int cameraId)
	: bus_(bus), cameraId_(cameraId)
{
}

/**
 * \brief Publish the target of a feature
 * \param[in] feature The feature name
 * \param[in] value The target value
 * \return 0 on success or a negative error code otherwise
 */
int SyncPublisher::publish(const std::string &feature, double value)
{
	auto now = std::chrono::system_clock::now().time_since_epoch();

	TargetFeature target;
	target.feature = feature;
	target.value = value;
	target.timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
	target.cameraId = cameraId_;

	return bus_->publish(targetTopic(feature), target.serialize());
}

/**
 * \class SyncSubscriber
 * \brief Feed the target cache from the bus
 */

SyncSubscriber::SyncSubscriber(MessageBus *bus, TargetCache *cache)
	: cache_(cache)
{
	bus->subscribe(kTargetTopicPrefix,
		       [this](const std::string &topic, const std::string &payload) {
			       received(topic, payload);
		       });
}

void SyncSubscriber::received(const std::string &topic, const std::string &payload)
{
	std::string feature = topic.substr(kTargetTopicPrefix.size());
	if (feature.empty())
		return;

	std::optional<TargetFeature> target = TargetFeature::parse(feature, payload);
	if (!target)
		return;

	cache_->update(*target);
}

} /* namespace camtune */
