/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * visca-packet.cpp - VISCA-over-IP codec tests
 */

#include <iostream>
#include <vector>

#include "visca_packet.h"

#include "test.h"

using namespace std;
using namespace camtune;
using namespace camtune::visca;

using Bytes = vector<uint8_t>;

class ViscaPacketTest : public Test
{
protected:
	int testHeader()
	{
		Packet packet{ PayloadType::Command, 0x01020304,
			       { 0x81, 0x01, 0x04, 0x4b, 0x00, 0x00, 0x00, 0x0b, 0xff } };

		Bytes data = encodePacket(packet);
		Bytes expected = { 0x01, 0x00, 0x00, 0x09, 0x01, 0x02, 0x03, 0x04,
				   0x81, 0x01, 0x04, 0x4b, 0x00, 0x00, 0x00, 0x0b, 0xff };
		if (data != expected) {
			cerr << "Unexpected datagram " << toString(data) << endl;
			return TestFail;
		}

		optional<Packet> decoded = decodePacket(data.data(), data.size());
		if (!decoded || decoded->type != PayloadType::Command ||
		    decoded->sequence != 0x01020304 || decoded->payload != packet.payload) {
			cerr << "Failed to decode datagram" << endl;
			return TestFail;
		}

		/* Truncated header and inconsistent length. */
		if (decodePacket(data.data(), 7)) {
			cerr << "Truncated datagram decoded" << endl;
			return TestFail;
		}

		if (decodePacket(data.data(), data.size() - 1)) {
			cerr << "Datagram with wrong length decoded" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testPayloads()
	{
		optional<Bytes> payload = setPayload("ExposureGain", 0x12);
		if (!payload || *payload != Bytes{ 0x81, 0x01, 0x04, 0x4c, 0x00, 0x00, 0x01, 0x02, 0xff }) {
			cerr << "Unexpected gain command" << endl;
			return TestFail;
		}

		payload = setPayload("ExposureIris", 11);
		if (!payload || *payload != Bytes{ 0x81, 0x01, 0x04, 0x4b, 0x00, 0x00, 0x00, 0x0b, 0xff }) {
			cerr << "Unexpected iris command" << endl;
			return TestFail;
		}

		/* Single nibble values are clamped. */
		payload = setPayload("DigitalBrightLevel", 42);
		if (!payload || *payload != Bytes{ 0x81, 0x01, 0x04, 0x3e, 0x0f, 0xff }) {
			cerr << "Unexpected bright level command" << endl;
			return TestFail;
		}

		payload = setPayload("ColorSaturation", -3);
		if (!payload || (*payload)[6] != 0x00 || (*payload)[7] != 0x00) {
			cerr << "Negative value not clamped" << endl;
			return TestFail;
		}

		payload = inquiryPayload("ExposureExposureTime");
		if (!payload || *payload != Bytes{ 0x81, 0x09, 0x04, 0x4a, 0xff }) {
			cerr << "Unexpected exposure time inquiry" << endl;
			return TestFail;
		}

		if (setPayload("WhiteBalanceMode", 1) || inquiryPayload("DetailLevel") ||
		    isSupported("ColorMatrixEnable") || !isSupported("ExposureIris")) {
			cerr << "Unsupported parameter accepted" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testReplies()
	{
		Reply reply = parseReply({ 0x90, 0x41, 0xff });
		if (reply.type != ReplyType::Ack || reply.socket != 1 || reply.value) {
			cerr << "Failed to parse ACK" << endl;
			return TestFail;
		}

		reply = parseReply({ 0x90, 0x51, 0xff });
		if (reply.type != ReplyType::Completion || reply.value) {
			cerr << "Failed to parse command completion" << endl;
			return TestFail;
		}

		reply = parseReply({ 0x90, 0x50, 0x00, 0x00, 0x01, 0x02, 0xff });
		if (reply.type != ReplyType::Completion || reply.value != 0x12) {
			cerr << "Failed to parse inquiry completion" << endl;
			return TestFail;
		}

		reply = parseReply({ 0x90, 0x50, 0x07, 0xff });
		if (reply.type != ReplyType::Completion || reply.value != 7) {
			cerr << "Failed to parse single nibble completion" << endl;
			return TestFail;
		}

		reply = parseReply({ 0x90, 0x60, 0x02, 0xff });
		if (reply.type != ReplyType::Error || reply.error != ErrorSyntax ||
		    !reply.isRejection()) {
			cerr << "Failed to parse syntax error" << endl;
			return TestFail;
		}

		reply = parseReply({ 0x90, 0x61, 0x41, 0xff });
		if (!reply.isRejection()) {
			cerr << "Not executable error isn't a rejection" << endl;
			return TestFail;
		}

		reply = parseReply({ 0x90, 0x60, 0x03, 0xff });
		if (reply.type != ReplyType::Error || reply.isRejection()) {
			cerr << "Buffer full reported as a rejection" << endl;
			return TestFail;
		}

		static const vector<Bytes> invalid = {
			{},
			{ 0x90, 0x41 },
			{ 0x80, 0x41, 0xff },
			{ 0x90, 0x41, 0x00 },
			{ 0x90, 0x60, 0xff },
			{ 0x90, 0x71, 0xff },
		};

		for (const Bytes &bytes : invalid) {
			if (parseReply(bytes).type != ReplyType::Invalid) {
				cerr << "Invalid reply [" << toString(bytes)
				     << "] accepted" << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int testNames()
	{
		if (toString({ 0x90, 0x41, 0xff }) != "90 41 ff") {
			cerr << "Unexpected byte formatting" << endl;
			return TestFail;
		}

		if (string(errorName(ErrorBufferFull)) != "command buffer full" ||
		    string(errorName(0x7f)) != "unknown error") {
			cerr << "Unexpected error names" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		if (testHeader() != TestPass)
			return TestFail;

		if (testPayloads() != TestPass)
			return TestFail;

		if (testReplies() != TestPass)
			return TestFail;

		if (testNames() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(ViscaPacketTest)
