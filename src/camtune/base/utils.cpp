/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * String, time and scope helpers
 */

#include <camtune/base/utils.h>

#include <iomanip>
#include <locale>
#include <sstream>

namespace camtune {

namespace utils {

std::string formatHex(uint64_t value, unsigned int digits)
{
	std::ostringstream out;
	out << "0x" << std::hex << std::setw(digits) << std::setfill('0')
	    << value;
	return out.str();
}

/**
 * \brief Split \a str at every occurrence of \a separator
 *
 * Empty fields are kept, splitting "a&&b" on "&" gives { "a", "", "b" }. An
 * empty string gives a single empty field.
 */
std::vector<std::string> split(const std::string &str,
			       const std::string &separator)
{
	std::vector<std::string> fields;
	std::string::size_type start = 0;

	if (separator.empty())
		return { str };

	while (true) {
		std::string::size_type end = str.find(separator, start);
		fields.push_back(str.substr(start, end - start));
		if (end == std::string::npos)
			break;
		start = end + separator.size();
	}

	return fields;
}

std::string trim(const std::string &str)
{
	static const char *const blanks = " \t\r\n";

	std::string::size_type first = str.find_first_not_of(blanks);
	if (first == std::string::npos)
		return {};

	std::string::size_type last = str.find_last_not_of(blanks);
	return str.substr(first, last - first + 1);
}

/**
 * \brief Convert the whole of \a str to a double
 *
 * The conversion always uses the "C" locale decimal separator. Trailing
 * characters and out of range values make it fail.
 *
 * \return The value, or std::nullopt if \a str isn't a number
 */
std::optional<double> toDouble(const std::string &str)
{
	if (str.empty())
		return std::nullopt;

	std::istringstream in(str);
	in.imbue(std::locale::classic());

	double value;
	in >> value;
	if (in.fail() || !in.eof())
		return std::nullopt;

	return value;
}

} /* namespace utils */

} /* namespace camtune */
