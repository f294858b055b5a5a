/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Category based logging
 */

#pragma once

#include <atomic>
#include <sstream>
#include <string>

#include <camtune/base/class.h>

namespace camtune {

enum class LogSeverity {
	Debug,
	Info,
	Warning,
	Error,
	Fatal,
};

const char *logSeverityName(LogSeverity severity);

class LogCategory
{
public:
	explicit LogCategory(const char *name);

	const std::string &name() const { return name_; }

	LogSeverity threshold() const
	{
		return threshold_.load(std::memory_order_relaxed);
	}
	void setThreshold(LogSeverity threshold)
	{
		threshold_.store(threshold, std::memory_order_relaxed);
	}

	bool enabled(LogSeverity severity) const
	{
		return severity >= threshold();
	}

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(LogCategory)

	const std::string name_;
	std::atomic<LogSeverity> threshold_;
};

/*
 * A single log line under construction. The text is handed to the active
 * sink when the record goes out of scope.
 */
class LogRecord
{
public:
	LogRecord(const LogCategory &category, LogSeverity severity,
		  const char *file, unsigned int line,
		  const std::string &prefix);
	~LogRecord();

	std::ostream &stream() { return stream_; }

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(LogRecord)

	const LogCategory &category_;
	LogSeverity severity_;
	const char *file_;
	unsigned int line_;
	std::ostringstream stream_;
};

/* Turns the stream expression of LOG() into void for the ternary. */
struct LogVoidify {
	void operator&(std::ostream &) {}
};

class Loggable
{
public:
	virtual ~Loggable();

protected:
	virtual std::string logPrefix() const = 0;

	std::string _logPrefix() const { return logPrefix(); }
};

/* Found by LOG() outside of Loggable members. */
inline std::string _logPrefix()
{
	return {};
}

#define LOG_DEFINE_CATEGORY(name)                                        \
	[[maybe_unused]] static ::camtune::LogCategory &_logCategory##name() \
	{                                                                \
		static ::camtune::LogCategory category(#name);           \
		return category;                                         \
	}

/* Messages below the category threshold are never formatted. */
#define LOG(category, severity)                                          \
	!_logCategory##category().enabled(::camtune::LogSeverity::severity) \
		? static_cast<void>(0)                                   \
		: ::camtune::LogVoidify() &                              \
			  ::camtune::LogRecord(_logCategory##category(), \
					       ::camtune::LogSeverity::severity, \
					       __FILE__, __LINE__,       \
					       _logPrefix())             \
				  .stream()

} /* namespace camtune */
