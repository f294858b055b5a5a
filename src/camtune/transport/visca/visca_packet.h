/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * VISCA-over-IP packet encoding and decoding
 */

#pragma once

#include <optional>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace camtune {

namespace visca {

enum class PayloadType : uint16_t {
	Command = 0x0100,
	Inquiry = 0x0110,
	Reply = 0x0111,
	ControlCommand = 0x0200,
	ControlReply = 0x0201,
};

constexpr size_t kHeaderSize = 8;
constexpr uint16_t kDefaultPort = 52381;

struct Packet {
	PayloadType type;
	uint32_t sequence;
	std::vector<uint8_t> payload;
};

std::vector<uint8_t> encodePacket(const Packet &packet);
std::optional<Packet> decodePacket(const uint8_t *data, size_t size);

bool isSupported(const std::string &name);
std::optional<std::vector<uint8_t>> inquiryPayload(const std::string &name);
std::optional<std::vector<uint8_t>> setPayload(const std::string &name, int32_t value);

enum class ReplyType {
	Ack,
	Completion,
	Error,
	Invalid,
};

enum ErrorCode : uint8_t {
	ErrorMessageLength = 0x01,
	ErrorSyntax = 0x02,
	ErrorBufferFull = 0x03,
	ErrorCancelled = 0x04,
	ErrorNoSocket = 0x05,
	ErrorNotExecutable = 0x41,
};

struct Reply {
	ReplyType type;
	uint8_t socket;
	uint8_t error;
	std::optional<int32_t> value;

	bool isRejection() const
	{
		return type == ReplyType::Error &&
		       (error == ErrorSyntax || error == ErrorNotExecutable ||
			error == ErrorMessageLength);
	}
};

Reply parseReply(const std::vector<uint8_t> &payload);

const char *errorName(uint8_t error);

std::string toString(const std::vector<uint8_t> &bytes);

} /* namespace visca */

} /* namespace camtune */
