/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * YAML document tree tests
 */

#include <iostream>
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

#include "camtune/internal/yaml_parser.h"

#include "test.h"

using namespace camtune;
using namespace std;

static const string testYaml =
	"protocol: visca\n"
	"ratio: 0.35\n"
	"port: 52381\n"
	"offset: -100\n"
	"timestamp: 1700000000123456789\n"
	"enabled: true\n"
	"acceptable: [0.25, 0.5]\n"
	"parameters:\n"
	"  - ExposureIris\n"
	"  - ExposureGain\n"
	"weights:\n"
	"  ExposureIris: 1\n"
	"  ExposureGain: 3\n"
	"  DigitalBrightLevel: 2\n"
	"level1:\n"
	"  level2:\n"
	"    - [1, 2]\n"
	"    - {one: 1, two: 2}\n";

static const string invalidYaml =
	"Invalid : - YAML : - Content";

class YamlParserTest : public Test
{
protected:
	bool createFile(const string &content, string &filename)
	{
		filename = "/tmp/camtune.test.XXXXXX";
		int fd = mkstemp(&filename.front());
		if (fd == -1)
			return false;

		int ret = write(fd, content.c_str(), content.size());
		close(fd);

		if (ret != static_cast<int>(content.size()))
			return false;

		return true;
	}

	int init()
	{
		if (!createFile(testYaml, testYamlFile_))
			return TestFail;

		if (!createFile(invalidYaml, invalidYamlFile_))
			return TestFail;

		return TestPass;
	}

	int testScalars(const YamlNode &root)
	{
		if (root["protocol"].get<string>("") != "visca") {
			cerr << "String value mismatch" << endl;
			return TestFail;
		}

		if (root["protocol"].get<int32_t>() || root["protocol"].get<double>()) {
			cerr << "String value parsed as a number" << endl;
			return TestFail;
		}

		if (root["ratio"].get<double>(0.0) != 0.35) {
			cerr << "Double value mismatch" << endl;
			return TestFail;
		}

		if (root["ratio"].get<int32_t>()) {
			cerr << "Double value parsed as an integer" << endl;
			return TestFail;
		}

		if (root["port"].get<uint32_t>(0) != 52381 ||
		    root["port"].get<int32_t>(0) != 52381) {
			cerr << "Integer value mismatch" << endl;
			return TestFail;
		}

		if (root["offset"].get<int32_t>(0) != -100) {
			cerr << "Negative integer value mismatch" << endl;
			return TestFail;
		}

		if (root["offset"].get<uint32_t>()) {
			cerr << "Negative value parsed as unsigned" << endl;
			return TestFail;
		}

		if (root["timestamp"].get<int64_t>(0) != 1700000000123456789LL) {
			cerr << "64-bit integer value mismatch" << endl;
			return TestFail;
		}

		if (root["timestamp"].get<int32_t>()) {
			cerr << "Out of range value parsed as int32_t" << endl;
			return TestFail;
		}

		if (!root["enabled"].get<bool>(false)) {
			cerr << "Boolean value mismatch" << endl;
			return TestFail;
		}

		if (root["protocol"].get<bool>()) {
			cerr << "String value parsed as a boolean" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testLists(const YamlNode &root)
	{
		const YamlNode &acceptable = root["acceptable"];
		if (!acceptable.isList() || acceptable.size() != 2) {
			cerr << "Acceptable range is not a list of two items" << endl;
			return TestFail;
		}

		optional<vector<double>> range = acceptable.getList<double>();
		if (!range || (*range)[0] != 0.25 || (*range)[1] != 0.5) {
			cerr << "Failed to parse list of doubles" << endl;
			return TestFail;
		}

		optional<vector<string>> names = root["parameters"].getList<string>();
		if (!names || *names != vector<string>{ "ExposureIris", "ExposureGain" }) {
			cerr << "Failed to parse list of strings" << endl;
			return TestFail;
		}

		if (root["parameters"].getList<int32_t>()) {
			cerr << "List of strings parsed as integers" << endl;
			return TestFail;
		}

		if (root["protocol"].getList<string>()) {
			cerr << "Scalar parsed as a list" << endl;
			return TestFail;
		}

		unsigned int count = 0;
		for (const YamlNode &item : root["parameters"].asList()) {
			if (!item.isValue()) {
				cerr << "List item is not a value" << endl;
				return TestFail;
			}
			count++;
		}

		if (count != 2) {
			cerr << "List iteration count mismatch" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testDictionaries(const YamlNode &root)
	{
		const YamlNode &weights = root["weights"];
		if (!weights.isDictionary() || weights.size() != 3) {
			cerr << "Weights is not a dictionary of three items" << endl;
			return TestFail;
		}

		if (!weights.contains("ExposureGain") || weights.contains("ExposureTime")) {
			cerr << "Dictionary key lookup mismatch" << endl;
			return TestFail;
		}

		/* Iteration follows the document order. */
		static const vector<pair<string, int32_t>> expected = {
			{ "ExposureIris", 1 },
			{ "ExposureGain", 3 },
			{ "DigitalBrightLevel", 2 },
		};

		unsigned int i = 0;
		for (const auto &[key, value] : weights.asDict()) {
			if (i >= expected.size() || key != expected[i].first ||
			    value.get<int32_t>(0) != expected[i].second) {
				cerr << "Dictionary iteration mismatch at " << key << endl;
				return TestFail;
			}
			i++;
		}

		if (i != expected.size()) {
			cerr << "Dictionary iteration count mismatch" << endl;
			return TestFail;
		}

		const YamlNode &level2 = root["level1"]["level2"];
		if (!level2.isList() || level2.size() != 2 ||
		    !level2[0].isList() || level2[0][1].get<int32_t>(0) != 2 ||
		    !level2[1].isDictionary() || level2[1]["two"].get<int32_t>(0) != 2) {
			cerr << "Nested objects mismatch" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testMissing(const YamlNode &root)
	{
		const YamlNode &missing = root["missing"];
		if (!missing.isEmpty() || missing.get<string>()) {
			cerr << "Missing key didn't return an empty object" << endl;
			return TestFail;
		}

		if (!missing["nested"].isEmpty() || !root["parameters"][10].isEmpty()) {
			cerr << "Lookup through empty object failed" << endl;
			return TestFail;
		}

		if (missing.get<uint32_t>(7) != 7) {
			cerr << "Default value not returned for missing key" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testDocument(const YamlNode &root)
	{
		if (!root.isDictionary()) {
			cerr << "Root is not a dictionary" << endl;
			return TestFail;
		}

		if (testScalars(root) != TestPass)
			return TestFail;

		if (testLists(root) != TestPass)
			return TestFail;

		if (testDictionaries(root) != TestPass)
			return TestFail;

		if (testMissing(root) != TestPass)
			return TestFail;

		return TestPass;
	}

	int run()
	{
		/* Test parsing invalid YAML file. */
		if (YamlParser::parse(invalidYamlFile_)) {
			cerr << "Invalid YAML file parsed successfully" << endl;
			return TestFail;
		}

		if (YamlParser::parseString(invalidYaml)) {
			cerr << "Invalid YAML string parsed successfully" << endl;
			return TestFail;
		}

		if (YamlParser::parse("/nonexistent/camtune.yaml")) {
			cerr << "Nonexistent file parsed successfully" << endl;
			return TestFail;
		}

		/* Test parsing a valid YAML file and the same document in memory. */
		std::optional<YamlNode> fromFile = YamlParser::parse(testYamlFile_);
		if (!fromFile) {
			cerr << "Failed to parse YAML file" << endl;
			return TestFail;
		}

		if (testDocument(*fromFile) != TestPass)
			return TestFail;

		std::optional<YamlNode> fromString = YamlParser::parseString(testYaml);
		if (!fromString) {
			cerr << "Failed to parse YAML string" << endl;
			return TestFail;
		}

		if (testDocument(*fromString) != TestPass)
			return TestFail;

		if (YamlParser::parseString("a: 1\nb: 2\na: 3\n")) {
			cerr << "Duplicate key accepted" << endl;
			return TestFail;
		}

		if (YamlParser::parseString("base: &b 1\ncopy: *b\n")) {
			cerr << "Alias accepted" << endl;
			return TestFail;
		}

		if (YamlParser::parseString("")) {
			cerr << "Empty document accepted" << endl;
			return TestFail;
		}

		/* Flow mappings as carried by the sync bus. */
		std::optional<YamlNode> flow =
			YamlParser::parseString("{value: 0.35, timestamp: 42, camera_id: 1}");
		if (!flow || (*flow)["value"].get<double>(0.0) != 0.35 ||
		    (*flow)["camera_id"].get<uint32_t>(0) != 1) {
			cerr << "Failed to parse flow mapping" << endl;
			return TestFail;
		}

		return TestPass;
	}

	void cleanup()
	{
		unlink(testYamlFile_.c_str());
		unlink(invalidYamlFile_.c_str());
	}

private:
	std::string testYamlFile_;
	std::string invalidYamlFile_;
};

TEST_REGISTER(YamlParserTest)
