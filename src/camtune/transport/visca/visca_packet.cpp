/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * VISCA-over-IP packet encoding and decoding
 */

#include "visca_packet.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace camtune {

namespace visca {

/*
 * Each parameter is addressed by its CAM_* category byte. Direct set
 * commands carry the value as two nibbles ("00 00 0p 0q") except the
 * exposure compensation level which carries a single nibble.
 */
struct ParameterCommand {
	const char *name;
	uint8_t code;
	bool singleNibble;
};

static const ParameterCommand parameterCommands[] = {
	{ "ExposureGain", 0x4c, false },
	{ "ExposureExposureTime", 0x4a, false },
	{ "ExposureIris", 0x4b, false },
	{ "ColorSaturation", 0x49, false },
	{ "DigitalBrightLevel", 0x3e, true },
};

static const ParameterCommand *findCommand(const std::string &name)
{
	auto it = std::find_if(std::begin(parameterCommands),
			       std::end(parameterCommands),
			       [&name](const ParameterCommand &cmd) {
				       return name == cmd.name;
			       });
	if (it == std::end(parameterCommands))
		return nullptr;

	return &*it;
}

/**
 * \brief Serialize a packet with its VISCA-over-IP header
 * \param[in] packet The packet
 *
 * The header holds the payload type, the payload length and the sequence
 * number, all in big-endian order.
 *
 * \return The datagram bytes
 */
std::vector<uint8_t> encodePacket(const Packet &packet)
{
	uint16_t type = static_cast<uint16_t>(packet.type);
	uint16_t length = static_cast<uint16_t>(packet.payload.size());

	std::vector<uint8_t> data = {
		static_cast<uint8_t>(type >> 8),
		static_cast<uint8_t>(type & 0xff),
		static_cast<uint8_t>(length >> 8),
		static_cast<uint8_t>(length & 0xff),
		static_cast<uint8_t>(packet.sequence >> 24),
		static_cast<uint8_t>((packet.sequence >> 16) & 0xff),
		static_cast<uint8_t>((packet.sequence >> 8) & 0xff),
		static_cast<uint8_t>(packet.sequence & 0xff),
	};

	data.insert(data.end(), packet.payload.begin(), packet.payload.end());
	return data;
}

/**
 * \brief Parse a VISCA-over-IP datagram
 * \param[in] data The datagram bytes
 * \param[in] size The datagram size
 *
 * \return The packet, or std::nullopt if the datagram is truncated or its
 * length field doesn't match its size
 */
std::optional<Packet> decodePacket(const uint8_t *data, size_t size)
{
	if (size < kHeaderSize)
		return std::nullopt;

	uint16_t type = (data[0] << 8) | data[1];
	uint16_t length = (data[2] << 8) | data[3];
	uint32_t sequence = (static_cast<uint32_t>(data[4]) << 24) |
			    (static_cast<uint32_t>(data[5]) << 16) |
			    (static_cast<uint32_t>(data[6]) << 8) |
			    static_cast<uint32_t>(data[7]);

	if (length != size - kHeaderSize)
		return std::nullopt;

	return Packet{ static_cast<PayloadType>(type), sequence,
		       std::vector<uint8_t>(data + kHeaderSize, data + size) };
}

bool isSupported(const std::string &name)
{
	return findCommand(name) != nullptr;
}

/**
 * \brief Build the inquiry payload for a parameter
 * \param[in] name The parameter name
 * \return The payload, or std::nullopt if the parameter isn't supported
 */
std::optional<std::vector<uint8_t>> inquiryPayload(const std::string &name)
{
	const ParameterCommand *cmd = findCommand(name);
	if (!cmd)
		return std::nullopt;

	return std::vector<uint8_t>{ 0x81, 0x09, 0x04, cmd->code, 0xff };
}

/**
 * \brief Build the direct set payload for a parameter
 * \param[in] name The parameter name
 * \param[in] value The value, clamped to the range the command can carry
 * \return The payload, or std::nullopt if the parameter isn't supported
 */
std::optional<std::vector<uint8_t>> setPayload(const std::string &name, int32_t value)
{
	const ParameterCommand *cmd = findCommand(name);
	if (!cmd)
		return std::nullopt;

	if (cmd->singleNibble) {
		uint8_t v = static_cast<uint8_t>(std::clamp<int32_t>(value, 0, 0x0f));
		return std::vector<uint8_t>{ 0x81, 0x01, 0x04, cmd->code, v, 0xff };
	}

	uint8_t v = static_cast<uint8_t>(std::clamp<int32_t>(value, 0, 0xff));
	return std::vector<uint8_t>{ 0x81, 0x01, 0x04, cmd->code, 0x00, 0x00,
				     static_cast<uint8_t>(v >> 4),
				     static_cast<uint8_t>(v & 0x0f), 0xff };
}

/**
 * \brief Classify a reply payload
 * \param[in] payload The VISCA reply payload
 *
 * Replies start with 0x90 (camera address 1) and end with 0xff. The high
 * nibble of the second byte identifies the reply: 0x4y acknowledge, 0x5y
 * completion and 0x6y error, y being the command socket. Inquiry completions
 * carry the value as four nibbles, or a single nibble for one byte values.
 *
 * \return The reply
 */
Reply parseReply(const std::vector<uint8_t> &payload)
{
	Reply reply{ ReplyType::Invalid, 0, 0, std::nullopt };

	if (payload.size() < 3 || (payload[0] & 0xf0) != 0x90 ||
	    payload.back() != 0xff)
		return reply;

	reply.socket = payload[1] & 0x0f;

	switch (payload[1] & 0xf0) {
	case 0x40:
		reply.type = ReplyType::Ack;
		break;

	case 0x50:
		reply.type = ReplyType::Completion;
		if (payload.size() == 7) {
			reply.value = ((payload[2] & 0x0f) << 12) |
				      ((payload[3] & 0x0f) << 8) |
				      ((payload[4] & 0x0f) << 4) |
				      (payload[5] & 0x0f);
		} else if (payload.size() == 4) {
			reply.value = payload[2] & 0x0f;
		}
		break;

	case 0x60:
		if (payload.size() < 4)
			return reply;
		reply.type = ReplyType::Error;
		reply.error = payload[2];
		break;

	default:
		break;
	}

	return reply;
}

const char *errorName(uint8_t error)
{
	switch (error) {
	case ErrorMessageLength:
		return "message length error";
	case ErrorSyntax:
		return "syntax error";
	case ErrorBufferFull:
		return "command buffer full";
	case ErrorCancelled:
		return "command cancelled";
	case ErrorNoSocket:
		return "no socket";
	case ErrorNotExecutable:
		return "command not executable";
	default:
		return "unknown error";
	}
}

std::string toString(const std::vector<uint8_t> &bytes)
{
	std::ostringstream ss;
	ss << std::hex << std::setfill('0');

	for (size_t i = 0; i < bytes.size(); ++i) {
		if (i)
			ss << ' ';
		ss << std::setw(2) << static_cast<unsigned int>(bytes[i]);
	}

	return ss.str();
}

} /* namespace visca */

} /* namespace camtune */
