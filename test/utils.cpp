/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * String, time and scope helper tests
 */

#include <clocale>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <camtune/base/utils.h>

#include "test.h"

using namespace std;
using namespace camtune;
using namespace std::literals::chrono_literals;

class UtilsTest : public Test
{
protected:
	int testHex()
	{
		static const vector<pair<string, string>> cases = {
			{ utils::hex(static_cast<int32_t>(0x42)), "0x00000042" },
			{ utils::hex(static_cast<uint8_t>(0x05)), "0x05" },
			{ utils::hex(static_cast<int64_t>(0x42)), "0x0000000000000042" },
			{ utils::hex(static_cast<int8_t>(-1)), "0xff" },
			{ utils::hex(static_cast<uint32_t>(0x42), 4), "0x0042" },
			{ utils::hex(static_cast<uint32_t>(0x1234), 2), "0x1234" },
		};

		for (const auto &[result, expected] : cases) {
			if (result != expected) {
				cerr << "utils::hex() returned " << result
				     << ", expected " << expected << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int testSplitJoin()
	{
		/* The query string of a CGI parameter update. */
		const vector<string> fields = utils::split("ExposureIris=11&&ExposureGain=3&", "&");
		const vector<string> expected = { "ExposureIris=11", "", "ExposureGain=3", "" };

		if (fields != expected) {
			cerr << "utils::split() kept " << fields.size() << " fields" << endl;
			return TestFail;
		}

		if (utils::join(fields, "&") != "ExposureIris=11&&ExposureGain=3&") {
			cerr << "utils::join() doesn't reverse utils::split()" << endl;
			return TestFail;
		}

		if (utils::split("", ",") != vector<string>{ "" } ||
		    utils::split("no separator", ",") != vector<string>{ "no separator" }) {
			cerr << "utils::split() mishandles a single field" << endl;
			return TestFail;
		}

		if (utils::split("a::b", "::") != vector<string>{ "a", "b" }) {
			cerr << "utils::split() mishandles multi-character separators" << endl;
			return TestFail;
		}

		const map<string, int32_t> values = {
			{ "ExposureGain", 3 },
			{ "ExposureIris", 11 },
		};
		string query = utils::join(values, "&", [](const auto &value) {
			return value.first + "=" + to_string(value.second);
		});

		if (query != "ExposureGain=3&ExposureIris=11") {
			cerr << "utils::join() with a formatter returned " << query << endl;
			return TestFail;
		}

		if (!utils::join(vector<string>{}, "&").empty()) {
			cerr << "utils::join() of nothing isn't empty" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testTrim()
	{
		static const vector<pair<string, string>> strings = {
			{ "  ExposureIris ", "ExposureIris" },
			{ "\t\"11\"\r\n", "\"11\"" },
			{ "var a", "var a" },
			{ " \t ", "" },
			{ "", "" },
		};

		for (const auto &[str, expected] : strings) {
			if (utils::trim(str) != expected) {
				cerr << "utils::trim('" << str << "') returned '"
				     << utils::trim(str) << "'" << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int testToDouble()
	{
		/* Feature values use '.' whatever the process locale. */
		setlocale(LC_NUMERIC, "de_DE.UTF-8");
		optional<double> value = utils::toDouble("0.35");
		setlocale(LC_NUMERIC, "C");

		if (!value || *value != 0.35) {
			cerr << "utils::toDouble(\"0.35\") failed" << endl;
			return TestFail;
		}

		if (utils::toDouble("-2e3").value_or(0) != -2000.0) {
			cerr << "utils::toDouble() exponent conversion failed" << endl;
			return TestFail;
		}

		for (const char *invalid : { "", "1.5x", "0,35", "bright", "1e999" }) {
			if (utils::toDouble(invalid)) {
				cerr << "utils::toDouble(\"" << invalid
				     << "\") should fail" << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int testDuration()
	{
		utils::Duration timeout = 25ms + 25ms;
		if (timeout.get<std::micro>() != 50000.0) {
			cerr << "utils::Duration microsecond count mismatch" << endl;
			return TestFail;
		}

		timeout = 1500us;
		if (!timeout || timeout.get<std::milli>() != 1.5) {
			cerr << "utils::Duration fractional milliseconds mismatch" << endl;
			return TestFail;
		}

		if (utils::Duration(0ms) || utils::Duration()) {
			cerr << "Zero utils::Duration converts to true" << endl;
			return TestFail;
		}

		timeout = 100ms;
		if (timeout / 25ms != 4.0) {
			cerr << "utils::Duration ratio mismatch" << endl;
			return TestFail;
		}

		utils::time_point start = utils::clock::now();
		if ((start + timeout.toClock()) - start != 100ms) {
			cerr << "utils::Duration clock conversion failed" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testScopeGuard()
	{
		unsigned int calls = 0;

		{
			utils::ScopeGuard guard([&]() { calls++; });
		}

		if (calls != 1) {
			cerr << "Scope guard didn't run on scope exit" << endl;
			return TestFail;
		}

		{
			utils::ScopeGuard guard([&]() { calls++; });
			guard.dismiss();
		}

		if (calls != 1) {
			cerr << "Dismissed scope guard ran" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		if (testHex() != TestPass)
			return TestFail;

		if (testSplitJoin() != TestPass)
			return TestFail;

		if (testTrim() != TestPass)
			return TestFail;

		if (testToDouble() != TestPass)
			return TestFail;

		if (testDuration() != TestPass)
			return TestFail;

		if (testScopeGuard() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(UtilsTest)
