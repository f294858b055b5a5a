/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Category based logging
 */

#include <camtune/base/log.h>

#include <array>
#include <chrono>
#include <errno.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdlib.h>
#include <string.h>
#include <syslog.h>
#include <time.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include <camtune/base/mutex.h>
#include <camtune/base/utils.h>

#include <camtune/logging.h>

/**
 * \file log.h
 * \brief Category based logging
 *
 * Every source file declares the categories it logs to with
 * LOG_DEFINE_CATEGORY() and writes messages with LOG(). Each category has a
 * threshold below which messages are dropped before being formatted.
 *
 * Thresholds are resolved from an ordered list of rules. A rule pairs a
 * category pattern, either an exact name or a prefix followed by '*', with
 * a severity. The first rule matching a category wins and categories no rule
 * matches log at Info and above.
 *
 * The CAMTUNE_LOG_LEVELS environment variable provides the initial rules as
 * a comma separated list of pattern:level entries, or a bare level applying
 * to every category. Levels are given by name (DEBUG, INFO, WARN, ERROR,
 * FATAL) or by number from 0 to 4. logSetLevel() inserts rules in front of
 * the environment ones.
 *
 * Messages go to stderr unless CAMTUNE_LOG_FILE names a file, or is set to
 * "syslog". Color on stderr is disabled by CAMTUNE_LOG_NO_COLOR.
 */

namespace camtune {

namespace {

constexpr std::array<const char *, 5> severityNames = {
	"DEBUG", "INFO", "WARN", "ERROR", "FATAL",
};

std::optional<LogSeverity> parseSeverity(const std::string &level)
{
	if (level.size() == 1 && level[0] >= '0' && level[0] <= '4')
		return static_cast<LogSeverity>(level[0] - '0');

	for (std::size_t i = 0; i < severityNames.size(); ++i) {
		if (level == severityNames[i])
			return static_cast<LogSeverity>(i);
	}

	return std::nullopt;
}

bool patternMatches(const std::string &pattern, const std::string &name)
{
	if (!pattern.empty() && pattern.back() == '*')
		return name.compare(0, pattern.size() - 1, pattern, 0,
				    pattern.size() - 1) == 0;

	return pattern == name;
}

struct LogEntry {
	LogSeverity severity;
	const std::string &category;
	const char *file;
	unsigned int line;
	std::string text;
};

class LogSink
{
public:
	virtual ~LogSink() = default;

	virtual void write(const LogEntry &entry) = 0;
};

class StreamSink : public LogSink
{
public:
	StreamSink(std::ostream *stream, bool color)
		: stream_(stream), color_(color)
	{
	}

	void write(const LogEntry &entry) override;

protected:
	std::ostream *stream_;

private:
	bool color_;
};

void StreamSink::write(const LogEntry &entry)
{
	static constexpr std::array<const char *, 5> colors = {
		"\033[0;37m", "\033[0;32m", "\033[1;33m", "\033[1;31m", "\033[1;35m",
	};

	struct timespec ts;
	clock_gettime(CLOCK_MONOTONIC, &ts);

	const char *base = strrchr(entry.file, '/');
	unsigned int index = static_cast<unsigned int>(entry.severity);

	std::ostream &out = *stream_;
	out << "[" << ts.tv_sec << "."
	    << std::setw(6) << std::setfill('0') << ts.tv_nsec / 1000
	    << std::setfill(' ') << "] [" << gettid() << "] ";

	if (color_)
		out << colors[index];
	out << std::left << std::setw(5) << severityNames[index] << std::right;
	if (color_)
		out << "\033[0m";

	out << " " << entry.category << " "
	    << (base ? base + 1 : entry.file) << ":" << entry.line << " "
	    << entry.text << std::endl;
}

class FileSink : public StreamSink
{
public:
	explicit FileSink(std::unique_ptr<std::ofstream> file)
		: StreamSink(file.get(), false), file_(std::move(file))
	{
	}

private:
	std::unique_ptr<std::ofstream> file_;
};

class SyslogSink : public LogSink
{
public:
	SyslogSink()
	{
		openlog("camtune", LOG_PID, LOG_DAEMON);
	}

	~SyslogSink()
	{
		closelog();
	}

	void write(const LogEntry &entry) override
	{
		static constexpr std::array<int, 5> priorities = {
			LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERR, LOG_CRIT,
		};

		syslog(priorities[static_cast<unsigned int>(entry.severity)],
		       "%s %s", entry.category.c_str(), entry.text.c_str());
	}
};

class Logger
{
public:
	static Logger &instance();

	void attach(LogCategory *category);
	void addRule(const std::string &pattern, LogSeverity severity);
	void setSink(std::unique_ptr<LogSink> sink);
	void write(const LogEntry &entry);

private:
	Logger();

	LogSeverity resolve(const std::string &name) const
		CAMTUNE_TSA_REQUIRES(mutex_);
	void parseLevels(const char *levels);
	void openDefaultSink();

	Mutex mutex_;
	std::vector<LogCategory *> categories_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::vector<std::pair<std::string, LogSeverity>> rules_
		CAMTUNE_TSA_GUARDED_BY(mutex_);
	std::unique_ptr<LogSink> sink_ CAMTUNE_TSA_GUARDED_BY(mutex_);
};

Logger &Logger::instance()
{
	static Logger logger;
	return logger;
}

Logger::Logger()
{
	const char *levels = secure_getenv("CAMTUNE_LOG_LEVELS");
	if (levels)
		parseLevels(levels);

	openDefaultSink();
}

void Logger::parseLevels(const char *levels)
{
	for (const std::string &entry : utils::split(levels, ",")) {
		if (entry.empty())
			continue;

		std::string pattern = "*";
		std::string level = entry;

		std::string::size_type colon = entry.rfind(':');
		if (colon != std::string::npos) {
			pattern = entry.substr(0, colon);
			level = entry.substr(colon + 1);
		}

		std::optional<LogSeverity> severity = parseSeverity(level);
		if (!severity || pattern.empty())
			continue;

		MutexLocker locker(mutex_);
		rules_.emplace_back(pattern, *severity);
	}
}

void Logger::openDefaultSink()
{
	const char *file = secure_getenv("CAMTUNE_LOG_FILE");
	std::unique_ptr<LogSink> sink;

	if (file && !strcmp(file, "syslog")) {
		sink = std::make_unique<SyslogSink>();
	} else if (file) {
		auto stream = std::make_unique<std::ofstream>(file, std::ios::app);
		if (stream->good())
			sink = std::make_unique<FileSink>(std::move(stream));
	}

	if (!sink) {
		bool color = isatty(STDERR_FILENO) &&
			     !secure_getenv("CAMTUNE_LOG_NO_COLOR");
		sink = std::make_unique<StreamSink>(&std::cerr, color);
	}

	MutexLocker locker(mutex_);
	sink_ = std::move(sink);
}

LogSeverity Logger::resolve(const std::string &name) const
{
	for (const auto &[pattern, severity] : rules_) {
		if (patternMatches(pattern, name))
			return severity;
	}

	return LogSeverity::Info;
}

void Logger::attach(LogCategory *category)
{
	MutexLocker locker(mutex_);
	category->setThreshold(resolve(category->name()));
	categories_.push_back(category);
}

void Logger::addRule(const std::string &pattern, LogSeverity severity)
{
	MutexLocker locker(mutex_);
	rules_.emplace(rules_.begin(), pattern, severity);

	for (LogCategory *category : categories_)
		category->setThreshold(resolve(category->name()));
}

void Logger::setSink(std::unique_ptr<LogSink> sink)
{
	MutexLocker locker(mutex_);
	sink_ = std::move(sink);
}

void Logger::write(const LogEntry &entry)
{
	MutexLocker locker(mutex_);
	if (sink_)
		sink_->write(entry);
}

} /* namespace */

const char *logSeverityName(LogSeverity severity)
{
	return severityNames[static_cast<unsigned int>(severity)];
}

LogCategory::LogCategory(const char *name)
	: name_(name), threshold_(LogSeverity::Info)
{
	Logger::instance().attach(this);
}

LogRecord::LogRecord(const LogCategory &category, LogSeverity severity,
		     const char *file, unsigned int line,
		     const std::string &prefix)
	: category_(category), severity_(severity), file_(file), line_(line)
{
	if (!prefix.empty())
		stream_ << prefix << ": ";
}

LogRecord::~LogRecord()
{
	Logger::instance().write({ severity_, category_.name(), file_, line_,
				   stream_.str() });

	if (severity_ == LogSeverity::Fatal)
		abort();
}

Loggable::~Loggable() = default;

/**
 * \brief Send log messages to the file at \a path
 * \return 0 on success or a negative error code otherwise
 */
int logSetFile(const char *path)
{
	errno = 0;
	auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
	if (!stream->good())
		return errno ? -errno : -EIO;

	Logger::instance().setSink(std::make_unique<FileSink>(std::move(stream)));
	return 0;
}

/**
 * \brief Send log messages to \a stream, or drop them if \a stream is null
 *
 * The stream must outlive its use by the logger.
 */
void logSetStream(std::ostream *stream)
{
	Logger::instance().setSink(stream ? std::make_unique<StreamSink>(stream, false)
					  : nullptr);
}

void logSetSyslog()
{
	Logger::instance().setSink(std::make_unique<SyslogSink>());
}

void logSetStderr()
{
	bool color = isatty(STDERR_FILENO) &&
		     !secure_getenv("CAMTUNE_LOG_NO_COLOR");
	Logger::instance().setSink(std::make_unique<StreamSink>(&std::cerr, color));
}

/**
 * \brief Set the threshold of the categories matching \a category
 * \param[in] category A category name, or a prefix followed by '*'
 * \param[in] level The severity name or number
 *
 * The new rule takes precedence over all the rules set before it.
 *
 * \return 0 on success or -EINVAL if the pattern or the level is invalid
 */
int logSetLevel(const char *category, const char *level)
{
	std::optional<LogSeverity> severity = parseSeverity(level);
	if (!severity || !*category)
		return -EINVAL;

	Logger::instance().addRule(category, *severity);
	return 0;
}

} /* namespace camtune */
