/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Deployment configuration
 */

#include "camtune/internal/configuration.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

#include <camtune/base/log.h>

#include "camtune/internal/yaml_parser.h"

/**
 * \file internal/configuration.h
 * \brief Deployment configuration loaded from YAML
 */

namespace camtune {

LOG_DEFINE_CATEGORY(Config)

namespace {

/*
 * Read configuration values into defaults, logging every invalid field with
 * its path. The parse fails if any error has been reported.
 */
class ConfigParser
{
public:
	ConfigParser()
		: valid_(true)
	{
	}

	bool valid() const { return valid_; }

	void error(const std::string &path, const std::string &message)
	{
		LOG(Config, Error) << path << ": " << message;
		valid_ = false;
	}

	template<typename T>
	bool read(const YamlNode &node, const std::string &path, T &value)
	{
		if (node.isEmpty())
			return false;

		std::optional<T> v = node.get<T>();
		if (!v) {
			error(path, "invalid value");
			return false;
		}

		value = *v;
		return true;
	}

	bool readMs(const YamlNode &node, const std::string &path,
		    utils::Duration &value)
	{
		uint32_t ms;
		if (!read(node, path, ms))
			return false;

		value = std::chrono::milliseconds(ms);
		return true;
	}

	template<typename T>
	void checkRange(const std::string &path, T value, T min, T max)
	{
		if (value >= min && value <= max)
			return;

		std::ostringstream ss;
		ss << value << " out of range [" << min << ", " << max << "]";
		error(path, ss.str());
	}

	void checkRangeMs(const std::string &path, utils::Duration value,
			  unsigned int min, unsigned int max)
	{
		checkRange<double>(path, value.get<std::milli>(), min, max);
	}

private:
	bool valid_;
};

void parseCameras(ConfigParser &parser, const YamlNode &node,
		  Configuration &config)
{
	if (!node.isList() || node.size() == 0) {
		parser.error("cameras", "at least one camera is required");
		return;
	}

	std::set<unsigned int> ids;

	for (std::size_t i = 0; i < node.size(); ++i) {
		const YamlNode &entry = node[i];
		std::string path = "cameras[" + std::to_string(i) + "]";

		CameraConfig camera{};
		if (!parser.read(entry["id"], path + ".id", camera.id)) {
			parser.error(path + ".id", "missing camera id");
			continue;
		}

		parser.read(entry["address"], path + ".address", camera.address);
		parser.read(entry["enabled"], path + ".enabled", camera.enabled);

		if (!ids.insert(camera.id).second)
			parser.error(path + ".id", "duplicate camera id " +
						   std::to_string(camera.id));

		if (camera.address.empty()) {
			if (!config.venue)
				parser.error(path + ".address",
					     "no address and no venue to derive it from");
			else if (camera.id > 9)
				parser.error(path + ".address",
					     "address can't be derived for camera ids above 9");
			else
				camera.address = Configuration::cameraAddress(*config.venue,
									      camera.id);
		}

		config.cameras.push_back(camera);
	}
}

void parseProtocol(ConfigParser &parser, const YamlNode &node,
		   Configuration &config)
{
	parser.read(node["type"], "protocol.type", config.protocol);
	if (!TransportFactoryBase::getFactoryByName(config.protocol))
		parser.error("protocol.type", "unknown protocol '" + config.protocol + "'");

	const YamlNode &cgiNode = node["cgi"];
	CgiOptions &cgi = config.transport.cgi;

	parser.read(cgiNode["username"], "protocol.cgi.username", cgi.username);
	parser.read(cgiNode["password"], "protocol.cgi.password", cgi.password);
	if (parser.read(cgiNode["pool_size"], "protocol.cgi.pool_size", cgi.poolSize))
		parser.checkRange("protocol.cgi.pool_size", cgi.poolSize, 1u, 64u);
	if (parser.readMs(cgiNode["timeout_ms"], "protocol.cgi.timeout_ms", cgi.timeout))
		parser.checkRangeMs("protocol.cgi.timeout_ms", cgi.timeout, 1, 60000);
	if (parser.read(cgiNode["max_attempts"], "protocol.cgi.max_attempts", cgi.maxAttempts))
		parser.checkRange("protocol.cgi.max_attempts", cgi.maxAttempts, 1u, 1000u);
	parser.readMs(cgiNode["retry_delay_ms"], "protocol.cgi.retry_delay_ms", cgi.retryDelay);
	parser.read(cgiNode["fixed_arguments"], "protocol.cgi.fixed_arguments",
		    cgi.fixedArguments);
	parser.read(cgiNode["initial_arguments"], "protocol.cgi.initial_arguments",
		    cgi.initialArguments);

	const YamlNode &viscaNode = node["visca"];
	ViscaOptions &visca = config.transport.visca;

	uint32_t port;
	if (parser.read(viscaNode["port"], "protocol.visca.port", port)) {
		parser.checkRange("protocol.visca.port", port, 1u, 65535u);
		visca.port = port;
	}
	if (parser.readMs(viscaNode["timeout_ms"], "protocol.visca.timeout_ms", visca.timeout))
		parser.checkRangeMs("protocol.visca.timeout_ms", visca.timeout, 1, 10000);
	parser.read(viscaNode["max_retries"], "protocol.visca.max_retries", visca.maxRetries);
	parser.readMs(viscaNode["retry_delay_ms"], "protocol.visca.retry_delay_ms",
		      visca.retryDelay);
	if (parser.read(viscaNode["batch_size"], "protocol.visca.batch_size", visca.batchSize))
		parser.checkRange("protocol.visca.batch_size", visca.batchSize, 1u, 64u);
}

void parseConcurrency(ConfigParser &parser, const YamlNode &node,
		      Configuration &config)
{
	ConcurrencyConfig &concurrency = config.concurrency;

	parser.read(node["enabled"], "concurrency.enabled", concurrency.enabled);
	if (parser.read(node["max_concurrent_operations"],
			"concurrency.max_concurrent_operations",
			concurrency.maxConcurrentOperations))
		parser.checkRange("concurrency.max_concurrent_operations",
				  concurrency.maxConcurrentOperations, 1u, 10u);
	parser.read(node["fallback_to_sequential"], "concurrency.fallback_to_sequential",
		    concurrency.fallbackToSequential);

	const YamlNode &recovery = node["recovery"];
	if (parser.read(recovery["window"], "concurrency.recovery.window",
			concurrency.recovery.window))
		parser.checkRange("concurrency.recovery.window",
				  concurrency.recovery.window, 1u, 1000u);
	if (parser.read(recovery["step"], "concurrency.recovery.step",
			concurrency.recovery.step))
		parser.checkRange("concurrency.recovery.step",
				  concurrency.recovery.step, 1u, 10u);
	parser.readMs(recovery["cooldown_ms"], "concurrency.recovery.cooldown_ms",
		      concurrency.recovery.cooldown);

	const YamlNode &pacing = node["pacing"];
	PacingConfig &p = concurrency.pacing;
	if (parser.readMs(pacing["concurrent_ms"], "concurrency.pacing.concurrent_ms",
			  p.concurrent))
		parser.checkRangeMs("concurrency.pacing.concurrent_ms", p.concurrent, 5, 100);
	if (parser.readMs(pacing["sequential_ms"], "concurrency.pacing.sequential_ms",
			  p.sequential))
		parser.checkRangeMs("concurrency.pacing.sequential_ms", p.sequential, 5, 100);
	if (parser.readMs(pacing["retry_delay_ms"], "concurrency.pacing.retry_delay_ms",
			  p.retryDelay))
		parser.checkRangeMs("concurrency.pacing.retry_delay_ms", p.retryDelay, 5, 100);

	const YamlNode &rate = node["rate_limiting"];
	RateLimitConfig &r = concurrency.rateLimiting;
	parser.read(rate["set_operations"], "concurrency.rate_limiting.set_operations",
		    r.setOperations);
	parser.read(rate["get_operations"], "concurrency.rate_limiting.get_operations",
		    r.getOperations);
	if (parser.read(rate["max_requests_per_second"],
			"concurrency.rate_limiting.max_requests_per_second",
			r.maxRequestsPerSecond))
		parser.checkRange("concurrency.rate_limiting.max_requests_per_second",
				  r.maxRequestsPerSecond, 5.0, 50.0);
	if (parser.read(rate["burst"], "concurrency.rate_limiting.burst", r.burst))
		parser.checkRange("concurrency.rate_limiting.burst", r.burst, 1u, 50u);

	/* The burst counts against the per second maximum. */
	if (r.burst > std::floor(r.maxRequestsPerSecond))
		parser.error("concurrency.rate_limiting.burst",
			     "must not exceed max_requests_per_second");
}

void parseParameters(ConfigParser &parser, const YamlNode &node,
		     Configuration &config)
{
	for (const auto &[name, entry] : node.asDict()) {
		std::string path = "parameters." + name;

		ParameterRange range{ 0, 0, 1 };
		auto it = config.parameters.find(name);
		if (it != config.parameters.end())
			range = it->second;
		else if (!entry.contains("min") || !entry.contains("max"))
			parser.error(path, "min and max are required");

		parser.read(entry["min"], path + ".min", range.min);
		parser.read(entry["max"], path + ".max", range.max);
		parser.read(entry["step"], path + ".step", range.step);

		if (range.min >= range.max)
			parser.error(path, "min must be lower than max");
		if (range.step <= 0)
			parser.error(path + ".step", "step must be positive");

		config.parameters[name] = range;
	}
}

void parseCost(ConfigParser &parser, const YamlNode &node,
	       Configuration &config)
{
	CostModelConfig &cost = config.cost;

	std::string tieBreak;
	if (parser.read(node["tie_break"], "cost.tie_break", tieBreak)) {
		if (tieBreak == "order")
			cost.tieBreak = CostModelConfig::TieBreak::Order;
		else if (tieBreak == "headroom")
			cost.tieBreak = CostModelConfig::TieBreak::Headroom;
		else
			parser.error("cost.tie_break", "unknown tie break '" + tieBreak + "'");
	}

	parser.read(node["bound_margin_steps"], "cost.bound_margin_steps",
		    cost.boundMarginSteps);
	if (parser.read(node["against_penalty"], "cost.against_penalty",
			cost.againstPenalty))
		parser.checkRange("cost.against_penalty", cost.againstPenalty, 1.0, 10.0);
	if (parser.read(node["bound_penalty"], "cost.bound_penalty", cost.boundPenalty))
		parser.checkRange("cost.bound_penalty", cost.boundPenalty, 0.0, 1.0);

	for (const auto &[name, entry] : node["weights"].asDict()) {
		std::string path = "cost.weights." + name;

		CostSpec spec{ 0.0, 0.0, 0.0, Direction::Either };
		auto it = cost.specs.find(name);
		if (it != cost.specs.end())
			spec = it->second;
		else if (!entry.contains("base") || !entry.contains("max") ||
			 !entry.contains("min"))
			parser.error(path, "base, max and min are required");

		parser.read(entry["base"], path + ".base", spec.baseCost);
		parser.read(entry["max"], path + ".max", spec.maxCost);
		parser.read(entry["min"], path + ".min", spec.minCost);
		parser.read(entry["weight"], path + ".weight", spec.weight);
		parser.read(entry["inverted"], path + ".inverted", spec.inverted);

		std::string direction;
		if (parser.read(entry["direction"], path + ".direction", direction)) {
			std::optional<Direction> d = directionFromName(direction);
			if (d)
				spec.preferred = *d;
			else
				parser.error(path + ".direction",
					     "unknown direction '" + direction + "'");
		}

		if (spec.minCost < 0.0 || spec.minCost > spec.baseCost ||
		    spec.baseCost > spec.maxCost)
			parser.error(path, "costs must satisfy 0 <= min <= base <= max");
		if (spec.weight < 0.0)
			parser.error(path + ".weight", "weight must not be negative");

		cost.specs[name] = spec;
	}
}

void parseHysteresis(ConfigParser &parser, const YamlNode &node,
		     const std::string &path, HysteresisConfig &hysteresis)
{
	parser.read(node["dead_band_pct"], path + ".dead_band_pct", hysteresis.deadBandPct);
	parser.read(node["inner_pct"], path + ".inner_pct", hysteresis.innerPct);
	parser.read(node["outer_pct"], path + ".outer_pct", hysteresis.outerPct);

	if (hysteresis.deadBandPct < 0.0 || hysteresis.innerPct < 0.0 ||
	    hysteresis.outerPct < 0.0)
		parser.error(path, "percentages must not be negative");
	if (hysteresis.innerPct >= hysteresis.outerPct)
		parser.error(path, "inner_pct must be lower than outer_pct");
}

void parseFeatures(ConfigParser &parser, const YamlNode &node,
		   Configuration &config)
{
	std::vector<FeatureConfig> defaults = FeatureConfig::defaults();

	if (node.isEmpty()) {
		config.features = defaults;
	} else {
		config.features.clear();

		for (const auto &[name, entry] : node.asDict()) {
			std::string path = "features." + name;

			FeatureConfig feature{ name, { 0.0, 0.0, {} }, {} };
			auto it = std::find_if(defaults.begin(), defaults.end(),
					       [&](const FeatureConfig &f) {
						       return f.name == name;
					       });
			if (it != defaults.end())
				feature = *it;
			else if (!entry.contains("acceptable") ||
				 !entry.contains("parameters"))
				parser.error(path, "acceptable and parameters are required");

			const YamlNode &acceptable = entry["acceptable"];
			if (!acceptable.isEmpty()) {
				std::optional<std::vector<double>> range =
					acceptable.getList<double>();
				if (!range || range->size() != 2) {
					parser.error(path + ".acceptable",
						     "expected [low, high]");
				} else {
					feature.band.acceptableLow = (*range)[0];
					feature.band.acceptableHigh = (*range)[1];
				}
			}

			const YamlNode &parameters = entry["parameters"];
			if (!parameters.isEmpty()) {
				std::optional<std::vector<std::string>> names =
					parameters.getList<std::string>();
				if (!names || names->empty())
					parser.error(path + ".parameters",
						     "expected a list of parameter names");
				else
					feature.parameters = *names;
			}

			config.features.push_back(std::move(feature));
		}
	}

	for (FeatureConfig &feature : config.features) {
		std::string path = "features." + feature.name;

		feature.band.hysteresis = config.hysteresis;
		parseHysteresis(parser, node[feature.name]["hysteresis"],
				path + ".hysteresis", feature.band.hysteresis);

		if (feature.band.acceptableLow >= feature.band.acceptableHigh)
			parser.error(path + ".acceptable", "low must be lower than high");

		for (const std::string &parameter : feature.parameters) {
			if (!config.parameters.count(parameter))
				parser.error(path + ".parameters",
					     "no range for parameter " + parameter);
			if (!config.cost.specs.count(parameter))
				parser.error(path + ".parameters",
					     "no cost for parameter " + parameter);
		}
	}
}

void parseSync(ConfigParser &parser, const YamlNode &node,
	       Configuration &config)
{
	SyncConfig &sync = config.sync;

	parser.read(node["enabled"], "sync.enabled", sync.enabled);

	std::string publish;
	if (parser.read(node["publish"], "sync.publish", publish)) {
		if (publish == "target")
			sync.publish = SyncConfig::Publish::Target;
		else if (publish == "measured")
			sync.publish = SyncConfig::Publish::Measured;
		else
			parser.error("sync.publish", "unknown mode '" + publish + "'");
	}

	parser.read(node["group"], "sync.group", sync.group);

	uint32_t port;
	if (parser.read(node["port"], "sync.port", port)) {
		parser.checkRange("sync.port", port, 1u, 65535u);
		sync.port = port;
	}

	if (parser.readMs(node["staleness_ms"], "sync.staleness_ms", sync.staleness) &&
	    !sync.staleness)
		parser.error("sync.staleness_ms", "staleness must be positive");

	if (sync.enabled && !config.masterCamera)
		parser.error("sync.enabled", "sync requires master_camera");
}

} /* namespace */

/**
 * \struct CameraConfig
 * \brief A camera of the deployment
 */

/**
 * \struct SyncConfig
 * \brief Master/slave synchronization configuration
 */

/**
 * \struct HealthConfig
 * \brief Camera health tracking configuration
 */

/**
 * \class Configuration
 * \brief Deployment configuration
 *
 * A default constructed configuration holds the built-in defaults and no
 * camera. Configurations are normally obtained from load() or parse(), which
 * overlay the YAML document on the defaults and validate the result. Every
 * invalid field is reported in the log.
 */

Configuration::Configuration()
	: cycleInterval(std::chrono::milliseconds(1000)),
	  statsInterval(std::chrono::seconds(60)),
	  protocol("cgi"),
	  parameters(CostModelConfig::defaultRanges()),
	  features(FeatureConfig::defaults()),
	  presets(defaultPresets())
{
}

/**
 * \brief Load a configuration file
 * \param[in] path The configuration file path
 * \return The configuration, or std::nullopt if the file can't be read or is
 * invalid
 */
std::optional<Configuration> Configuration::load(const std::string &path)
{
	std::optional<YamlNode> root = YamlParser::parse(path);
	if (!root) {
		LOG(Config, Error) << "Failed to parse " << path;
		return std::nullopt;
	}

	std::optional<Configuration> config = fromYaml(*root);
	if (!config)
		LOG(Config, Error) << "Invalid configuration " << path;

	return config;
}

/**
 * \brief Parse a configuration document
 * \param[in] text The YAML document
 * \return The configuration, or std::nullopt if the document is invalid
 */
std::optional<Configuration> Configuration::parse(const std::string &text)
{
	std::optional<YamlNode> root = YamlParser::parseString(text);
	if (!root) {
		LOG(Config, Error) << "Failed to parse configuration";
		return std::nullopt;
	}

	return fromYaml(*root);
}

std::optional<Configuration> Configuration::fromYaml(const YamlNode &root)
{
	if (!root.isDictionary()) {
		LOG(Config, Error) << "Configuration must be a mapping";
		return std::nullopt;
	}

	ConfigParser parser;
	Configuration config;

	uint32_t venue;
	if (parser.read(root["venue"], "venue", venue))
		config.venue = venue;

	parseCameras(parser, root["cameras"], config);

	uint32_t master;
	if (parser.read(root["master_camera"], "master_camera", master)) {
		config.masterCamera = master;
		if (!config.camera(master))
			parser.error("master_camera", "unknown camera " +
						      std::to_string(master));
	}

	if (parser.readMs(root["cycle_interval_ms"], "cycle_interval_ms",
			  config.cycleInterval) && !config.cycleInterval)
		parser.error("cycle_interval_ms", "interval must be positive");
	parser.readMs(root["stats_interval_ms"], "stats_interval_ms",
		      config.statsInterval);

	parseProtocol(parser, root["protocol"], config);
	parseConcurrency(parser, root["concurrency"], config);

	/* VISCA-over-IP minimum command spacing. */
	if (config.protocol == "visca") {
		const PacingConfig &pacing = config.concurrency.pacing;
		if (pacing.concurrent < std::chrono::milliseconds(10))
			parser.error("concurrency.pacing.concurrent_ms",
				     "VISCA requires at least 10 ms");
		if (pacing.sequential < std::chrono::milliseconds(20))
			parser.error("concurrency.pacing.sequential_ms",
				     "VISCA requires at least 20 ms");
	}

	parseParameters(parser, root["parameters"], config);
	parseCost(parser, root["cost"], config);
	parseHysteresis(parser, root["hysteresis"], "hysteresis", config.hysteresis);
	parseFeatures(parser, root["features"], config);
	parseSync(parser, root["sync"], config);

	if (parser.read(root["health"]["max_reconnect_failures"],
			"health.max_reconnect_failures",
			config.health.maxReconnectFailures))
		parser.checkRange("health.max_reconnect_failures",
				  config.health.maxReconnectFailures, 1u, 1000u);

	for (const auto &[name, entry] : root["presets"].asDict())
		parser.read(entry, "presets." + name, config.presets[name]);

	if (!parser.valid())
		return std::nullopt;

	return config;
}

/**
 * \brief Derive the address of a camera from the venue number
 * \param[in] venue The venue number
 * \param[in] id The camera identifier, between 0 and 9
 * \return The camera IPv4 address
 */
std::string Configuration::cameraAddress(unsigned int venue, unsigned int id)
{
	return "192.168." + std::to_string(venue + 54) + ".5" + std::to_string(id);
}

/**
 * \brief Retrieve the built-in presets
 *
 * The scramble preset moves the exposure away from any reasonable setting, to
 * exercise recovery.
 *
 * \return The presets keyed by name
 */
const std::map<std::string, std::string> &Configuration::defaultPresets()
{
	static const std::map<std::string, std::string> presets = {
		{ "scramble", "ExposureIris=0&WhiteBalanceMode=outdoor&"
			      "ColorMatrixEnable=off&DetailLevel=0&DigitalBrightLevel=0" },
	};

	return presets;
}

/**
 * \brief Retrieve the configuration of a camera
 * \param[in] id The camera identifier
 * \return The camera configuration, or nullptr if the camera isn't configured
 */
const CameraConfig *Configuration::camera(unsigned int id) const
{
	for (const CameraConfig &camera : cameras) {
		if (camera.id == id)
			return &camera;
	}

	return nullptr;
}

/**
 * \brief Build the transport options of a camera
 * \param[in] camera The camera
 * \return The transport options
 */
TransportOptions Configuration::transportOptions(const CameraConfig &camera) const
{
	TransportOptions options = transport;
	options.cameraId = camera.id;
	options.address = camera.address;

	return options;
}

} /* namespace camtune */
