/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * YAML document tree
 */

#pragma once

#include <optional>
#include <stdint.h>
#include <string>
#include <type_traits>
#include <vector>

namespace camtune {

class YamlReader;

/*
 * A node of a parsed YAML document. Lookups that fail return a missing node,
 * on which every further lookup also yields a missing node and every get()
 * fails, so that nested keys can be chained without intermediate checks.
 */
class YamlNode
{
public:
	struct Entry;

	YamlNode();

	bool isValue() const { return kind_ == Kind::Scalar; }
	bool isList() const { return kind_ == Kind::Sequence; }
	bool isDictionary() const { return kind_ == Kind::Mapping; }
	bool isEmpty() const { return kind_ == Kind::Missing; }

	std::size_t size() const;

	template<typename T>
	static constexpr bool isScalarType =
		std::is_same_v<T, bool> || std::is_same_v<T, double> ||
		std::is_same_v<T, int32_t> || std::is_same_v<T, uint32_t> ||
		std::is_same_v<T, int64_t> || std::is_same_v<T, std::string>;

	template<typename T, std::enable_if_t<isScalarType<T>> * = nullptr>
	std::optional<T> get() const;

	template<typename T>
	T get(const T &fallback) const
	{
		return get<T>().value_or(fallback);
	}

	/* Fails unless the node is a list whose every item converts to T. */
	template<typename T, std::enable_if_t<isScalarType<T>> * = nullptr>
	std::optional<std::vector<T>> getList() const
	{
		if (!isList())
			return std::nullopt;

		std::vector<T> values;
		for (const YamlNode &item : items_) {
			std::optional<T> value = item.get<T>();
			if (!value)
				return std::nullopt;
			values.push_back(*value);
		}

		return values;
	}

	const std::vector<YamlNode> &asList() const { return items_; }
	const std::vector<Entry> &asDict() const { return entries_; }

	const YamlNode &operator[](std::size_t index) const;
	const YamlNode &operator[](const std::string &key) const;
	bool contains(const std::string &key) const;

private:
	friend class YamlReader;

	enum class Kind {
		Missing,
		Scalar,
		Sequence,
		Mapping,
	};

	Kind kind_;
	std::string scalar_;
	std::vector<YamlNode> items_;
	std::vector<Entry> entries_;
};

/* Mapping entries keep the document order. */
struct YamlNode::Entry {
	std::string key;
	YamlNode value;
};

class YamlParser final
{
public:
	static std::optional<YamlNode> parse(const std::string &path);
	static std::optional<YamlNode> parseString(const std::string &text);
};

} /* namespace camtune */
