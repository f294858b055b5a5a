/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * VISCA-over-IP UDP transport
 */

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <errno.h>
#include <map>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <thread>
#include <vector>

#include <camtune/base/log.h>
#include <camtune/base/mutex.h>
#include <camtune/base/unique_fd.h>
#include <camtune/base/utils.h>

#include "camtune/internal/protocol_transport.h"

#include "visca_packet.h"

namespace camtune {

LOG_DEFINE_CATEGORY(VISCA)

class ViscaTransport : public ProtocolTransport, public Loggable
{
public:
	ViscaTransport(const TransportOptions &options);
	~ViscaTransport();

	int connect() override;
	void disconnect() override;
	bool isConnected() const override { return connected_; }

	std::vector<CommandResult>
	getParameters(const std::vector<std::string> &names) override;
	std::vector<CommandResult>
	setParameters(const ParameterValues &values) override;

	int applyPreset(const std::string &arguments) override;

	void abort() override;

protected:
	std::string logPrefix() const override;

private:
	/*
	 * Commands go Sent -> AwaitingAck -> AwaitingCompletion and end in
	 * Done, Timeout, Rejected or Failed. Inquiries aren't acknowledged
	 * and go straight to AwaitingCompletion.
	 */
	enum class State {
		Sent,
		AwaitingAck,
		AwaitingCompletion,
		Done,
		Timeout,
		Rejected,
		Failed,
	};

	struct Command {
		std::string parameter;
		std::optional<int32_t> requested;
		visca::PayloadType type;
		std::vector<uint8_t> payload;

		State state;
		uint32_t sequence;
		utils::time_point deadline;
		unsigned int attempts;
		std::optional<int32_t> value;
	};

	static bool isAwaiting(State state)
	{
		return state == State::AwaitingAck ||
		       state == State::AwaitingCompletion;
	}

	static const char *stateName(State state);

	std::vector<CommandResult> execute(std::vector<Command> &commands);
	void executeBatch(Command *commands, size_t count);
	void transmit(Command &command) CAMTUNE_TSA_REQUIRES(mutex_);
	void waitReplies(MutexLocker &locker, Command *commands, size_t count)
		CAMTUNE_TSA_REQUIRES(mutex_);
	bool waitRetryDelay();

	void receiveLoop(int fd);
	void handleReply(const visca::Packet &packet);

	TransportOptions options_;

	std::thread receiver_;
	std::atomic<bool> running_;
	std::atomic<bool> connected_;
	std::atomic<bool> aborted_;

	Mutex mutex_;
	ConditionVariable cv_;
	UniqueFD socket_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	uint32_t sequence_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int events_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::map<uint32_t, Command *> pending_ CAMTUNE_TSA_GUARDED_BY(mutex_);
};

ViscaTransport::ViscaTransport(const TransportOptions &options)
	: options_(options), running_(false), connected_(false),
	  aborted_(false), sequence_(0), events_(0)
{
	if (!options_.visca.batchSize)
		options_.visca.batchSize = 1;
}

ViscaTransport::~ViscaTransport()
{
	disconnect();
}

std::string ViscaTransport::logPrefix() const
{
	return "camera " + std::to_string(options_.cameraId);
}

const char *ViscaTransport::stateName(State state)
{
	switch (state) {
	case State::Sent:
		return "Sent";
	case State::AwaitingAck:
		return "AwaitingAck";
	case State::AwaitingCompletion:
		return "AwaitingCompletion";
	case State::Done:
		return "Done";
	case State::Timeout:
		return "Timeout";
	case State::Rejected:
		return "Rejected";
	case State::Failed:
		return "Failed";
	}

	return "Unknown";
}

int ViscaTransport::connect()
{
	if (connected_)
		disconnect();

	aborted_ = false;

	struct sockaddr_in addr = {};
	addr.sin_family = AF_INET;
	addr.sin_port = htons(options_.visca.port);
	if (inet_pton(AF_INET, options_.address.c_str(), &addr.sin_addr) != 1) {
		LOG(VISCA, Error) << "Invalid camera address " << options_.address;
		return -EINVAL;
	}

	UniqueFD fd(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
	if (!fd.isValid()) {
		int ret = -errno;
		LOG(VISCA, Error) << "Failed to create socket: " << strerror(-ret);
		return ret;
	}

	/* Only accept datagrams from the camera. */
	if (::connect(fd.get(), reinterpret_cast<struct sockaddr *>(&addr),
		      sizeof(addr)) < 0) {
		int ret = -errno;
		LOG(VISCA, Error)
			<< "Failed to connect to " << options_.address << ":"
			<< options_.visca.port << ": " << strerror(-ret);
		return ret;
	}

	int rawFd = fd.get();

	{
		MutexLocker locker(mutex_);
		socket_ = std::move(fd);
	}

	running_ = true;
	receiver_ = std::thread(&ViscaTransport::receiveLoop, this, rawFd);
	connected_ = true;

	LOG(VISCA, Debug)
		<< "Connected to " << options_.address << ":" << options_.visca.port;

	return 0;
}

void ViscaTransport::disconnect()
{
	running_ = false;
	if (receiver_.joinable())
		receiver_.join();

	MutexLocker locker(mutex_);
	pending_.clear();
	socket_.reset();
	connected_ = false;
}

void ViscaTransport::abort()
{
	{
		MutexLocker locker(mutex_);
		aborted_ = true;
	}

	cv_.notify_all();
}

void ViscaTransport::receiveLoop(int fd)
{
	uint8_t buffer[1024];
	struct pollfd pfd = { fd, POLLIN, 0 };

	while (running_) {
		int ret = poll(&pfd, 1, 20);
		if (ret < 0 && errno != EINTR) {
			LOG(VISCA, Error) << "poll() failed: " << strerror(errno);
			break;
		}
		if (ret <= 0)
			continue;

		ssize_t size = recv(fd, buffer, sizeof(buffer), 0);
		if (size < 0) {
			/* ICMP port unreachable is reported on the next recv(). */
			LOG(VISCA, Debug) << "recv() failed: " << strerror(errno);
			continue;
		}

		std::optional<visca::Packet> packet =
			visca::decodePacket(buffer, static_cast<size_t>(size));
		if (!packet) {
			LOG(VISCA, Warning) << "Dropping malformed datagram of "
					    << size << " bytes";
			continue;
		}

		handleReply(*packet);
	}
}

void ViscaTransport::handleReply(const visca::Packet &packet)
{
	{
		MutexLocker locker(mutex_);

		auto it = pending_.find(packet.sequence);
		if (it == pending_.end()) {
			LOG(VISCA, Debug)
				<< "Ignoring reply " << visca::toString(packet.payload)
				<< " for sequence " << packet.sequence;
			return;
		}

		Command &command = *it->second;
		visca::Reply reply = visca::parseReply(packet.payload);

		switch (reply.type) {
		case visca::ReplyType::Ack:
			if (command.state == State::AwaitingAck) {
				command.state = State::AwaitingCompletion;
				command.deadline = utils::clock::now() +
						   options_.visca.timeout.toClock();
			}
			break;

		case visca::ReplyType::Completion:
			/* A completion without an ACK acknowledges implicitly. */
			command.state = State::Done;
			command.value = reply.value;
			pending_.erase(it);
			break;

		case visca::ReplyType::Error:
			LOG(VISCA, Warning)
				<< command.parameter << ": "
				<< visca::errorName(reply.error) << " ("
				<< utils::hex(reply.error) << ")";
			command.state = reply.isRejection() ? State::Rejected
							    : State::Timeout;
			pending_.erase(it);
			break;

		case visca::ReplyType::Invalid:
			LOG(VISCA, Warning)
				<< "Invalid reply " << visca::toString(packet.payload);
			return;
		}

		events_++;
	}

	cv_.notify_all();
}

void ViscaTransport::transmit(Command &command)
{
	command.state = State::Sent;
	command.attempts++;
	command.sequence = ++sequence_;

	if (!socket_.isValid()) {
		command.state = State::Failed;
		return;
	}

	std::vector<uint8_t> data =
		visca::encodePacket({ command.type, command.sequence, command.payload });

	ssize_t ret = send(socket_.get(), data.data(), data.size(), MSG_NOSIGNAL);
	if (ret < 0) {
		LOG(VISCA, Error)
			<< "Failed to send " << command.parameter << ": "
			<< strerror(errno);
		command.state = State::Failed;
		return;
	}

	LOG(VISCA, Debug)
		<< "Sent " << command.parameter << " ["
		<< visca::toString(command.payload) << "] sequence "
		<< command.sequence << " attempt " << command.attempts;

	command.state = command.type == visca::PayloadType::Inquiry
		      ? State::AwaitingCompletion : State::AwaitingAck;
	command.deadline = utils::clock::now() + options_.visca.timeout.toClock();
	pending_[command.sequence] = &command;
}

/*
 * Wait until every command of the batch has left the awaiting states, either
 * through a reply or because its phase deadline expired.
 */
void ViscaTransport::waitReplies(MutexLocker &locker, Command *commands, size_t count)
{
	while (true) {
		utils::time_point now = utils::clock::now();
		utils::time_point next = utils::time_point::max();
		bool active = false;

		for (size_t i = 0; i < count; ++i) {
			Command &command = commands[i];
			if (!isAwaiting(command.state))
				continue;

			if (aborted_) {
				pending_.erase(command.sequence);
				continue;
			}

			if (now >= command.deadline) {
				LOG(VISCA, Debug)
					<< command.parameter << ": timeout in state "
					<< stateName(command.state) << ", sequence "
					<< command.sequence;
				command.state = State::Timeout;
				pending_.erase(command.sequence);
				continue;
			}

			active = true;
			next = std::min(next, command.deadline);
		}

		if (!active)
			return;

		unsigned int seen = events_;
		cv_.wait_until(locker, next, [&]() CAMTUNE_TSA_REQUIRES(mutex_) {
			return aborted_ || events_ != seen;
		});
	}
}

bool ViscaTransport::waitRetryDelay()
{
	MutexLocker locker(mutex_);
	cv_.wait_for(locker, options_.visca.retryDelay.toClock(),
		     [this]() { return aborted_.load(); });
	return !aborted_;
}

/*
 * Commands of a batch are sent back-to-back and their replies collected by
 * sequence number. Commands that timed out are resent together.
 */
void ViscaTransport::executeBatch(Command *commands, size_t count)
{
	std::vector<Command *> toSend;
	for (size_t i = 0; i < count; ++i)
		toSend.push_back(&commands[i]);

	while (!toSend.empty()) {
		{
			MutexLocker locker(mutex_);
			if (aborted_)
				return;

			for (Command *command : toSend)
				transmit(*command);

			waitReplies(locker, commands, count);
		}

		toSend.clear();
		for (size_t i = 0; i < count; ++i) {
			Command &command = commands[i];
			if (command.state == State::Timeout &&
			    command.attempts <= options_.visca.maxRetries)
				toSend.push_back(&command);
		}

		if (toSend.empty() || !waitRetryDelay())
			return;

		LOG(VISCA, Debug) << "Retrying " << toSend.size() << " command(s)";
	}
}

std::vector<CommandResult> ViscaTransport::execute(std::vector<Command> &commands)
{
	for (size_t first = 0; first < commands.size();
	     first += options_.visca.batchSize) {
		size_t count = std::min<size_t>(options_.visca.batchSize,
						commands.size() - first);
		executeBatch(&commands[first], count);
	}

	std::vector<CommandResult> results;
	results.reserve(commands.size());

	for (const Command &command : commands) {
		CommandResult result{ command.parameter, command.requested,
				      std::nullopt, Outcome::Cancelled };

		switch (command.state) {
		case State::Done:
			if (command.type == visca::PayloadType::Inquiry) {
				result.achieved = command.value;
				result.outcome = command.value ? Outcome::Ok
							       : Outcome::Rejected;
			} else {
				result.achieved = command.requested;
				result.outcome = Outcome::Ok;
			}
			break;
		case State::Timeout:
			result.outcome = Outcome::Timeout;
			break;
		case State::Rejected:
			result.outcome = Outcome::Rejected;
			break;
		case State::Failed:
			result.outcome = Outcome::Error;
			break;
		default:
			break;
		}

		if (result.outcome == Outcome::Timeout)
			LOG(VISCA, Warning)
				<< command.parameter << ": no response after "
				<< command.attempts << " attempt(s)";

		results.push_back(std::move(result));
	}

	return results;
}

std::vector<CommandResult>
ViscaTransport::getParameters(const std::vector<std::string> &names)
{
	std::vector<Command> commands;
	std::vector<CommandResult> unsupported;

	for (const std::string &name : names) {
		std::optional<std::vector<uint8_t>> payload = visca::inquiryPayload(name);
		if (!payload) {
			LOG(VISCA, Warning) << name << " is not supported";
			unsupported.push_back({ name, std::nullopt, std::nullopt,
						Outcome::Rejected });
			continue;
		}

		commands.push_back({ name, std::nullopt, visca::PayloadType::Inquiry,
				     std::move(*payload), State::Sent, 0, {}, 0,
				     std::nullopt });
	}

	std::vector<CommandResult> results = execute(commands);

	/* Restore the order of the request. */
	std::vector<CommandResult> ordered;
	for (const std::string &name : names) {
		auto pick = [&](std::vector<CommandResult> &list) {
			auto it = std::find_if(list.begin(), list.end(),
					       [&](const CommandResult &r) {
						       return r.parameter == name;
					       });
			if (it == list.end())
				return false;
			ordered.push_back(std::move(*it));
			list.erase(it);
			return true;
		};

		if (!pick(results))
			pick(unsupported);
	}

	return ordered;
}

std::vector<CommandResult>
ViscaTransport::setParameters(const ParameterValues &values)
{
	std::vector<Command> commands;
	std::vector<CommandResult> results;

	for (const auto &[name, value] : values) {
		std::optional<std::vector<uint8_t>> payload = visca::setPayload(name, value);
		if (!payload) {
			LOG(VISCA, Warning) << name << " is not supported";
			continue;
		}

		commands.push_back({ name, value, visca::PayloadType::Command,
				     std::move(*payload), State::Sent, 0, {}, 0,
				     std::nullopt });
	}

	std::vector<CommandResult> executed = execute(commands);

	/* Values are sorted by name, merge the unsupported ones back in. */
	auto it = executed.begin();
	for (const auto &[name, value] : values) {
		if (it != executed.end() && it->parameter == name) {
			results.push_back(std::move(*it));
			++it;
		} else {
			results.push_back({ name, value, std::nullopt,
					    Outcome::Rejected });
		}
	}

	return results;
}

int ViscaTransport::applyPreset(const std::string &arguments)
{
	ParameterValues values;

	for (const auto &[name, value] : parseArguments(arguments)) {
		char *end = nullptr;
		long number = strtol(value.c_str(), &end, 10);
		if (!visca::isSupported(name) || value.empty() || *end != '\0') {
			LOG(VISCA, Warning)
				<< "Skipping " << name << "=" << value
				<< ", not supported over VISCA";
			continue;
		}

		values[name] = static_cast<int32_t>(number);
	}

	if (values.empty())
		return -ENOTSUP;

	int ret = 0;
	for (const CommandResult &result : setParameters(values)) {
		if (result.outcome == Outcome::Rejected)
			ret = -EINVAL;
		else if (result.failed() && !ret)
			ret = -EIO;
	}

	return ret;
}

REGISTER_TRANSPORT(ViscaTransport, "visca")

} /* namespace camtune */
