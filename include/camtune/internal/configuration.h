/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Deployment configuration
 */

#pragma once

#include <map>
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

#include <camtune/base/utils.h>

#include "camtune/internal/adjustment_engine.h"
#include "camtune/internal/concurrency_controller.h"
#include "camtune/internal/cost_model.h"
#include "camtune/internal/hysteresis_gate.h"
#include "camtune/internal/protocol_transport.h"

namespace camtune {

class YamlNode;

struct CameraConfig {
	unsigned int id;
	std::string address;
	bool enabled = true;
};

struct SyncConfig {
	enum class Publish {
		Target,
		Measured,
	};

	bool enabled = false;
	Publish publish = Publish::Target;
	std::string group = "239.255.42.1";
	uint16_t port = 5600;
	utils::Duration staleness = std::chrono::seconds(5);
};

struct HealthConfig {
	unsigned int maxReconnectFailures = 3;
};

class Configuration
{
public:
	Configuration();

	static std::optional<Configuration> load(const std::string &path);
	static std::optional<Configuration> parse(const std::string &text);

	static std::string cameraAddress(unsigned int venue, unsigned int id);
	static const std::map<std::string, std::string> &defaultPresets();

	const CameraConfig *camera(unsigned int id) const;
	TransportOptions transportOptions(const CameraConfig &camera) const;

	std::optional<unsigned int> masterCamera;
	utils::Duration cycleInterval;
	utils::Duration statsInterval;
	std::optional<unsigned int> venue;
	std::vector<CameraConfig> cameras;

	std::string protocol;
	TransportOptions transport;
	ConcurrencyConfig concurrency;

	std::map<std::string, ParameterRange> parameters;
	CostModelConfig cost;
	HysteresisConfig hysteresis;
	std::vector<FeatureConfig> features;

	SyncConfig sync;
	HealthConfig health;
	std::map<std::string, std::string> presets;

private:
	static std::optional<Configuration> fromYaml(const YamlNode &root);
};

} /* namespace camtune */
