/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * YAML document tree
 */

#include "camtune/internal/yaml_parser.h"

#include <ctype.h>
#include <errno.h>
#include <limits>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <camtune/base/log.h>
#include <camtune/base/utils.h>

#include <yaml.h>

namespace camtune {

LOG_DEFINE_CATEGORY(YamlParser)

namespace {

const YamlNode &missingNode()
{
	static const YamlNode node;
	return node;
}

/* Whole string integer conversion within the range of T. */
template<typename T>
std::optional<T> toInteger(const std::string &text)
{
	if (text.empty() || isspace(static_cast<unsigned char>(text[0])))
		return std::nullopt;

	if (std::is_unsigned_v<T> && text[0] == '-')
		return std::nullopt;

	char *end;
	errno = 0;
	long long value = strtoll(text.c_str(), &end, 10);
	if (*end != '\0' || errno == ERANGE)
		return std::nullopt;

	if (value < static_cast<long long>(std::numeric_limits<T>::min()) ||
	    static_cast<unsigned long long>(value) >
		    static_cast<unsigned long long>(std::numeric_limits<T>::max()))
		return std::nullopt;

	return static_cast<T>(value);
}

} /* namespace */

YamlNode::YamlNode()
	: kind_(Kind::Missing)
{
}

/* The number of list items or mapping entries, 0 for other nodes. */
std::size_t YamlNode::size() const
{
	if (kind_ == Kind::Sequence)
		return items_.size();
	if (kind_ == Kind::Mapping)
		return entries_.size();

	return 0;
}

template<>
std::optional<std::string> YamlNode::get() const
{
	if (kind_ != Kind::Scalar)
		return std::nullopt;

	return scalar_;
}

template<>
std::optional<bool> YamlNode::get() const
{
	if (kind_ != Kind::Scalar)
		return std::nullopt;

	if (scalar_ == "true")
		return true;
	if (scalar_ == "false")
		return false;

	return std::nullopt;
}

template<>
std::optional<double> YamlNode::get() const
{
	if (kind_ != Kind::Scalar)
		return std::nullopt;

	return utils::toDouble(scalar_);
}

template<>
std::optional<int32_t> YamlNode::get() const
{
	if (kind_ != Kind::Scalar)
		return std::nullopt;

	return toInteger<int32_t>(scalar_);
}

template<>
std::optional<uint32_t> YamlNode::get() const
{
	if (kind_ != Kind::Scalar)
		return std::nullopt;

	return toInteger<uint32_t>(scalar_);
}

template<>
std::optional<int64_t> YamlNode::get() const
{
	if (kind_ != Kind::Scalar)
		return std::nullopt;

	return toInteger<int64_t>(scalar_);
}

const YamlNode &YamlNode::operator[](std::size_t index) const
{
	if (kind_ != Kind::Sequence || index >= items_.size())
		return missingNode();

	return items_[index];
}

const YamlNode &YamlNode::operator[](const std::string &key) const
{
	for (const Entry &entry : entries_) {
		if (entry.key == key)
			return entry.value;
	}

	return missingNode();
}

bool YamlNode::contains(const std::string &key) const
{
	return !(*this)[key].isEmpty();
}

/*
 * Builds a YamlNode tree from the libyaml event stream. Only the first
 * document of the stream is read. Anchors and aliases are rejected.
 */
class YamlReader
{
public:
	YamlReader();
	~YamlReader();

	void setInput(FILE *file);
	void setInput(const std::string &text);

	std::optional<YamlNode> read();

private:
	/* Releases the libyaml event buffers on scope exit. */
	struct Event {
		yaml_event_t event;
		bool filled = false;

		~Event()
		{
			if (filled)
				yaml_event_delete(&event);
		}

		yaml_event_type_t type() const { return event.type; }
	};

	bool next(Event &event);
	bool expect(yaml_event_type_t type);
	bool readNode(Event &event, YamlNode &node);

	yaml_parser_t parser_;
	bool valid_;
};

YamlReader::YamlReader()
{
	valid_ = yaml_parser_initialize(&parser_);
	if (!valid_)
		LOG(YamlParser, Error) << "Failed to initialize the YAML parser";
}

YamlReader::~YamlReader()
{
	if (valid_)
		yaml_parser_delete(&parser_);
}

void YamlReader::setInput(FILE *file)
{
	if (valid_)
		yaml_parser_set_input_file(&parser_, file);
}

void YamlReader::setInput(const std::string &text)
{
	if (valid_)
		yaml_parser_set_input_string(&parser_,
					     reinterpret_cast<const unsigned char *>(text.data()),
					     text.size());
}

bool YamlReader::next(Event &event)
{
	if (!yaml_parser_parse(&parser_, &event.event)) {
		LOG(YamlParser, Error)
			<< "Line " << parser_.problem_mark.line + 1 << ": "
			<< (parser_.problem ? parser_.problem : "invalid YAML");
		return false;
	}

	event.filled = true;
	return true;
}

bool YamlReader::expect(yaml_event_type_t type)
{
	Event event;
	if (!next(event))
		return false;

	if (event.type() != type) {
		LOG(YamlParser, Error)
			<< "Unexpected YAML event " << event.type()
			<< ", expected " << type;
		return false;
	}

	return true;
}

bool YamlReader::readNode(Event &event, YamlNode &node)
{
	switch (event.type()) {
	case YAML_SCALAR_EVENT:
		node.kind_ = YamlNode::Kind::Scalar;
		node.scalar_.assign(reinterpret_cast<const char *>(event.event.data.scalar.value),
				    event.event.data.scalar.length);
		return true;

	case YAML_SEQUENCE_START_EVENT:
		node.kind_ = YamlNode::Kind::Sequence;

		while (true) {
			Event item;
			if (!next(item))
				return false;
			if (item.type() == YAML_SEQUENCE_END_EVENT)
				return true;

			node.items_.emplace_back();
			if (!readNode(item, node.items_.back()))
				return false;
		}

	case YAML_MAPPING_START_EVENT:
		node.kind_ = YamlNode::Kind::Mapping;

		while (true) {
			Event key;
			if (!next(key))
				return false;
			if (key.type() == YAML_MAPPING_END_EVENT)
				return true;

			if (key.type() != YAML_SCALAR_EVENT) {
				LOG(YamlParser, Error) << "Mapping keys must be scalars";
				return false;
			}

			std::string name(reinterpret_cast<const char *>(key.event.data.scalar.value),
					 key.event.data.scalar.length);
			if (node.contains(name)) {
				LOG(YamlParser, Error) << "Duplicate key '" << name << "'";
				return false;
			}

			Event value;
			if (!next(value))
				return false;

			node.entries_.push_back({ name, YamlNode() });
			if (!readNode(value, node.entries_.back().value))
				return false;
		}

	case YAML_ALIAS_EVENT:
		LOG(YamlParser, Error) << "YAML aliases are not supported";
		return false;

	default:
		LOG(YamlParser, Error) << "Unexpected YAML event " << event.type();
		return false;
	}
}

std::optional<YamlNode> YamlReader::read()
{
	if (!valid_)
		return std::nullopt;

	if (!expect(YAML_STREAM_START_EVENT))
		return std::nullopt;

	Event start;
	if (!next(start))
		return std::nullopt;

	if (start.type() != YAML_DOCUMENT_START_EVENT) {
		LOG(YamlParser, Error) << "Empty YAML document";
		return std::nullopt;
	}

	Event content;
	if (!next(content))
		return std::nullopt;

	YamlNode root;
	if (!readNode(content, root))
		return std::nullopt;

	if (!expect(YAML_DOCUMENT_END_EVENT))
		return std::nullopt;

	return root;
}

/**
 * \brief Parse the YAML file at \a path
 * \return The document root, or std::nullopt if the file can't be read or
 * isn't valid YAML
 */
std::optional<YamlNode> YamlParser::parse(const std::string &path)
{
	FILE *file = fopen(path.c_str(), "re");
	if (!file) {
		LOG(YamlParser, Error)
			<< "Failed to open " << path << ": " << strerror(errno);
		return std::nullopt;
	}

	utils::ScopeGuard closeFile([file]() { fclose(file); });

	YamlReader reader;
	reader.setInput(file);

	std::optional<YamlNode> root = reader.read();
	if (!root)
		LOG(YamlParser, Error) << "Failed to parse " << path;

	return root;
}

std::optional<YamlNode> YamlParser::parseString(const std::string &text)
{
	YamlReader reader;
	reader.setInput(text);

	return reader.read();
}

} /* namespace camtune */
