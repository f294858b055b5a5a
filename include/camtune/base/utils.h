/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * String, time and scope helpers
 */

#pragma once

#include <chrono>
#include <optional>
#include <stdint.h>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace camtune {

namespace utils {

using clock = std::chrono::steady_clock;
using duration = clock::duration;
using time_point = clock::time_point;

/*
 * A time interval stored as floating point nanoseconds. Configuration values
 * are kept in this form and converted to the clock resolution when waiting.
 */
class Duration : public std::chrono::duration<double, std::nano>
{
public:
	using Base = std::chrono::duration<double, std::nano>;

	constexpr Duration()
		: Base(0)
	{
	}

	template<typename Rep, typename Period>
	constexpr Duration(const std::chrono::duration<Rep, Period> &d)
		: Base(d)
	{
	}

	template<typename Period>
	double get() const
	{
		return std::chrono::duration<double, Period>(*this).count();
	}

	constexpr explicit operator bool() const
	{
		return count() != 0;
	}

	utils::duration toClock() const
	{
		return std::chrono::duration_cast<utils::duration>(*this);
	}
};

std::string formatHex(uint64_t value, unsigned int digits);

/* Zero padded to the width of T unless \a digits is given. */
template<typename T, std::enable_if_t<std::is_integral_v<T>> * = nullptr>
std::string hex(T value, unsigned int digits = 0)
{
	using Unsigned = std::make_unsigned_t<T>;
	return formatHex(static_cast<Unsigned>(value),
			 digits ? digits : sizeof(T) * 2);
}

template<typename Container, typename Format>
std::string join(const Container &items, const std::string &separator,
		 Format format)
{
	std::string result;
	bool first = true;

	for (const auto &item : items) {
		if (!first)
			result += separator;
		result += format(item);
		first = false;
	}

	return result;
}

template<typename Container>
std::string join(const Container &items, const std::string &separator)
{
	return join(items, separator,
		    [](const auto &item) { return std::string(item); });
}

std::vector<std::string> split(const std::string &str,
			       const std::string &separator);

std::string trim(const std::string &str);

std::optional<double> toDouble(const std::string &str);

/* Runs a callable when going out of scope, unless dismissed. */
template<typename Function>
class ScopeGuard
{
public:
	explicit ScopeGuard(Function function)
		: function_(std::move(function)), active_(true)
	{
	}

	ScopeGuard(const ScopeGuard &) = delete;
	ScopeGuard &operator=(const ScopeGuard &) = delete;

	~ScopeGuard()
	{
		if (active_)
			function_();
	}

	void dismiss() { active_ = false; }

private:
	Function function_;
	bool active_;
};

} /* namespace utils */

} /* namespace camtune */
