/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Camera protocol transport interface
 */

#pragma once

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

#include <camtune/base/utils.h>

#include "camtune/internal/command.h"

namespace camtune {

struct CgiOptions {
	std::string username;
	std::string password;
	unsigned int poolSize = 6;
	utils::Duration timeout = std::chrono::seconds(2);
	unsigned int maxAttempts = 50;
	utils::Duration retryDelay = std::chrono::milliseconds(500);
	std::string fixedArguments = "ExposureMode=manual&WhiteBalanceMode=atw";
	std::string initialArguments;
};

struct ViscaOptions {
	uint16_t port = 52381;
	utils::Duration timeout = std::chrono::milliseconds(100);
	unsigned int maxRetries = 2;
	utils::Duration retryDelay = std::chrono::milliseconds(10);
	unsigned int batchSize = 5;
};

struct TransportOptions {
	unsigned int cameraId = 0;
	std::string address;
	CgiOptions cgi;
	ViscaOptions visca;
};

class ProtocolTransport
{
public:
	virtual ~ProtocolTransport() = default;

	virtual int connect() = 0;
	virtual void disconnect() = 0;
	virtual bool isConnected() const = 0;

	virtual std::vector<CommandResult>
	getParameters(const std::vector<std::string> &names) = 0;
	virtual std::vector<CommandResult>
	setParameters(const ParameterValues &values) = 0;

	virtual int applyPreset(const std::string &arguments) = 0;

	virtual void abort() = 0;

	const std::string &name() const { return name_; }

private:
	friend class TransportFactoryBase;

	std::string name_;
};

class TransportFactoryBase
{
public:
	TransportFactoryBase(const char *name);
	virtual ~TransportFactoryBase() = default;

	std::unique_ptr<ProtocolTransport> create(const TransportOptions &options) const;

	const std::string &name() const { return name_; }

	static std::vector<TransportFactoryBase *> &factories();
	static const TransportFactoryBase *getFactoryByName(const std::string &name);

private:
	static void registerType(TransportFactoryBase *factory);

	virtual std::unique_ptr<ProtocolTransport>
	createInstance(const TransportOptions &options) const = 0;

	std::string name_;
};

template<typename _Transport>
class TransportFactory final : public TransportFactoryBase
{
public:
	TransportFactory(const char *name)
		: TransportFactoryBase(name)
	{
	}

private:
	std::unique_ptr<ProtocolTransport>
	createInstance(const TransportOptions &options) const override
	{
		return std::make_unique<_Transport>(options);
	}
};

#define REGISTER_TRANSPORT(transport, name) \
	static TransportFactory<transport> global_##transport##Factory(name);

std::vector<std::pair<std::string, std::string>>
parseArguments(const std::string &arguments);

} /* namespace camtune */
