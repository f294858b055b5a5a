/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Logging rules, sinks and prefixes
 */

#include <errno.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdlib.h>
#include <string>
#include <unistd.h>
#include <vector>

#include <camtune/base/log.h>

#include <camtune/logging.h>

#include "test.h"

using namespace std;
using namespace camtune;

LOG_DEFINE_CATEGORY(LogAPITest)
LOG_DEFINE_CATEGORY(EnvExact)
LOG_DEFINE_CATEGORY(EnvWildA)
LOG_DEFINE_CATEGORY(EnvDigit)
LOG_DEFINE_CATEGORY(EnvBad)
LOG_DEFINE_CATEGORY(Zoom0)
LOG_DEFINE_CATEGORY(Zoom1)
LOG_DEFINE_CATEGORY(Late)

namespace {

class Camera : public Loggable
{
public:
	explicit Camera(unsigned int id)
		: id_(id)
	{
	}

	void report() const
	{
		LOG(LogAPITest, Warning) << "iris stuck";
	}

protected:
	std::string logPrefix() const override
	{
		return "camera " + to_string(id_);
	}

private:
	unsigned int id_;
};

vector<string> lines(const string &text)
{
	vector<string> result;
	istringstream in(text);
	string line;

	while (getline(in, line))
		result.push_back(line);

	return result;
}

bool endsWith(const string &line, const string &suffix)
{
	return line.size() >= suffix.size() &&
	       line.compare(line.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} /* namespace */

class LogAPITest : public Test
{
protected:
	int init() override
	{
		/*
		 * Rules are read from the environment when the logger is first
		 * used, which happens in run().
		 */
		setenv("CAMTUNE_LOG_LEVELS",
		       "EnvExact:DEBUG,EnvWild*:WARN,EnvDigit:3,EnvBad:bogus,*:ERROR",
		       1);

		return TestPass;
	}

	/* Lines ending in "kept" are expected in the output, "dropped" aren't. */
	void emit()
	{
		logSetLevel("LogAPITest", "DEBUG");
		LOG(LogAPITest, Debug) << "kept";

		logSetLevel("LogAPITest", "WARN");
		LOG(LogAPITest, Info) << "dropped";
		LOG(LogAPITest, Warning) << "kept";

		logSetLevel("LogAPITest", "4");
		LOG(LogAPITest, Error) << "dropped";
	}

	int verify(const string &output)
	{
		vector<string> got = lines(output);
		if (got.size() != 2) {
			cerr << "Expected 2 log lines, got " << got.size() << endl;
			return TestFail;
		}

		for (const string &line : got) {
			if (!endsWith(line, "kept")) {
				cerr << "Unexpected log line '" << line << "'" << endl;
				return TestFail;
			}
		}

		if (got[0].find("DEBUG") == string::npos ||
		    got[0].find("LogAPITest") == string::npos ||
		    got[0].find("log_api.cpp:") == string::npos) {
			cerr << "Missing severity, category or location in '"
			     << got[0] << "'" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testEnvironment()
	{
		static const vector<pair<LogCategory *, LogSeverity>> expected = {
			{ &_logCategoryEnvExact(), LogSeverity::Debug },
			{ &_logCategoryEnvWildA(), LogSeverity::Warning },
			{ &_logCategoryEnvDigit(), LogSeverity::Error },
			{ &_logCategoryEnvBad(), LogSeverity::Error },
		};

		for (const auto &[category, severity] : expected) {
			if (category->threshold() != severity) {
				cerr << category->name() << " logs at "
				     << logSeverityName(category->threshold())
				     << ", expected " << logSeverityName(severity)
				     << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int testRules()
	{
		if (logSetLevel("Zoom*", "ERROR") < 0 ||
		    logSetLevel("Zoom1", "DEBUG") < 0) {
			cerr << "Failed to set log levels" << endl;
			return TestFail;
		}

		/* The newest rule wins over the older wildcard. */
		if (_logCategoryZoom0().threshold() != LogSeverity::Error ||
		    _logCategoryZoom1().threshold() != LogSeverity::Debug) {
			cerr << "Wildcard rule precedence mismatch" << endl;
			return TestFail;
		}

		/* Rules apply to categories first used after them. */
		logSetLevel("Late", "FATAL");
		if (_logCategoryLate().threshold() != LogSeverity::Fatal) {
			cerr << "Rule not applied to a new category" << endl;
			return TestFail;
		}

		if (logSetLevel("Zoom0", "LOUD") != -EINVAL ||
		    logSetLevel("Zoom0", "5") != -EINVAL ||
		    logSetLevel("", "INFO") != -EINVAL) {
			cerr << "Invalid log level accepted" << endl;
			return TestFail;
		}

		if (_logCategoryZoom0().threshold() != LogSeverity::Error) {
			cerr << "Invalid log level changed a threshold" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testStream()
	{
		ostringstream log;
		logSetStream(&log);

		emit();

		logSetStream(nullptr);
		return verify(log.str());
	}

	int testFile()
	{
		char path[] = "/tmp/camtune-log.XXXXXX";
		int fd = mkstemp(path);
		if (fd < 0) {
			cerr << "Failed to create a log file" << endl;
			return TestFail;
		}
		close(fd);

		int ret = logSetFile(path);
		if (ret < 0) {
			cerr << "Failed to log to " << path << endl;
			unlink(path);
			return TestFail;
		}

		emit();

		/* Close the file before reading it back. */
		logSetStream(nullptr);

		ifstream file(path);
		stringstream content;
		content << file.rdbuf();
		unlink(path);

		if (logSetFile("/nonexistent/camtune.log") >= 0) {
			cerr << "Logging to a missing directory succeeded" << endl;
			return TestFail;
		}

		return verify(content.str());
	}

	int testPrefix()
	{
		ostringstream log;
		logSetStream(&log);
		logSetLevel("LogAPITest", "DEBUG");

		Camera camera(3);
		camera.report();
		LOG(LogAPITest, Info) << "no prefix";

		logSetStream(nullptr);

		vector<string> got = lines(log.str());
		if (got.size() != 2 || !endsWith(got[0], " camera 3: iris stuck") ||
		    !endsWith(got[1], " no prefix") ||
		    got[1].find("camera") != string::npos) {
			cerr << "Prefix mismatch in '" << log.str() << "'" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testLazyFormatting()
	{
		unsigned int evaluations = 0;
		auto count = [&]() { return ++evaluations; };

		logSetStream(nullptr);
		logSetLevel("LogAPITest", "ERROR");

		LOG(LogAPITest, Info) << count();
		if (evaluations != 0) {
			cerr << "Disabled message was formatted" << endl;
			return TestFail;
		}

		LOG(LogAPITest, Error) << count();
		if (evaluations != 1) {
			cerr << "Enabled message wasn't formatted" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run() override
	{
		if (testEnvironment() != TestPass)
			return TestFail;

		if (testRules() != TestPass)
			return TestFail;

		if (testStream() != TestPass)
			return TestFail;

		if (testFile() != TestPass)
			return TestFail;

		if (testPrefix() != TestPass)
			return TestFail;

		if (testLazyFormatting() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(LogAPITest)
