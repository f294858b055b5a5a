/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Camera protocol transport interface
 */

#include "camtune/internal/protocol_transport.h"

#include <algorithm>

#include <camtune/base/log.h>
#include <camtune/base/utils.h>

/**
 * \file internal/protocol_transport.h
 * \brief Raw request/response exchange with one camera
 */

namespace camtune {

LOG_DEFINE_CATEGORY(Transport)

/**
 * \file internal/command.h
 * \brief Results of parameter operations
 */

/**
 * \enum Outcome
 * \brief Terminal outcome of a parameter operation
 * \var Outcome::Ok
 * \brief The camera acknowledged the operation
 * \var Outcome::Timeout
 * \brief No response within the deadline after all attempts
 * \var Outcome::Rejected
 * \brief The camera refused the value or doesn't support the parameter
 * \var Outcome::Error
 * \brief Socket or connection fault
 * \var Outcome::Cancelled
 * \brief The operation was abandoned before reaching the camera
 */

/**
 * \brief Retrieve a printable name for an outcome
 * \param[in] outcome The outcome
 * \return The outcome name
 */
const char *outcomeName(Outcome outcome)
{
	switch (outcome) {
	case Outcome::Ok:
		return "ok";
	case Outcome::Timeout:
		return "timeout";
	case Outcome::Rejected:
		return "rejected";
	case Outcome::Error:
		return "error";
	case Outcome::Cancelled:
		return "cancelled";
	}

	return "unknown";
}

std::ostream &operator<<(std::ostream &out, Outcome outcome)
{
	return out << outcomeName(outcome);
}

/**
 * \struct CommandResult
 * \brief Result of one GET or SET of one parameter
 *
 * \var CommandResult::parameter
 * \brief The parameter name
 * \var CommandResult::requested
 * \brief The value requested by a SET, unset for GET operations
 * \var CommandResult::achieved
 * \brief The value reported or acknowledged by the camera, if any
 * \var CommandResult::outcome
 * \brief The operation outcome
 */

/**
 * \class ProtocolTransport
 * \brief Request/response exchange with one camera
 *
 * A ProtocolTransport talks to a single camera over one wire protocol.
 * Implementations register themselves by name with REGISTER_TRANSPORT() and
 * are instantiated through TransportFactoryBase::create().
 *
 * All operations return one CommandResult per parameter. Implementations
 * handle their protocol's own retries internally and report only the
 * terminal outcome. The getParameters() and setParameters() functions may be
 * called concurrently from multiple threads.
 */

/**
 * \fn ProtocolTransport::connect()
 * \brief Establish the link with the camera
 *
 * Connecting also clears a previous abort().
 *
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \fn ProtocolTransport::disconnect()
 * \brief Tear down the link with the camera
 */

/**
 * \fn ProtocolTransport::isConnected()
 * \brief Check if the transport is connected
 */

/**
 * \fn ProtocolTransport::getParameters()
 * \brief Read the current value of parameters
 * \param[in] names The parameter names
 * \return One result per name, in the order of \a names
 */

/**
 * \fn ProtocolTransport::setParameters()
 * \brief Write parameter values
 * \param[in] values The parameter values
 * \return One result per parameter, in the order of \a values
 */

/**
 * \fn ProtocolTransport::applyPreset()
 * \brief Apply a preset expressed as a "Name=Value&..." argument list
 * \param[in] arguments The preset arguments
 *
 * Presets may contain non-numeric values that only some protocols support.
 *
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \fn ProtocolTransport::abort()
 * \brief Give up pending retries and fail new operations promptly
 *
 * This is used on shutdown. Operations aborted before reaching the camera
 * complete with Outcome::Cancelled.
 */

/**
 * \fn ProtocolTransport::name()
 * \brief Retrieve the name of the transport factory that created the instance
 */

/**
 * \class TransportFactoryBase
 * \brief Base class for transport factories
 *
 * Factories are registered in a global list at static initialization time
 * by the REGISTER_TRANSPORT() macro.
 */

/**
 * \brief Construct a transport factory base
 * \param[in] name Name of the transport
 */
TransportFactoryBase::TransportFactoryBase(const char *name)
	: name_(name)
{
	registerType(this);
}

/**
 * \brief Create an instance of the transport corresponding to the factory
 * \param[in] options The camera address and protocol options
 *
 * \return A new transport instance
 */
std::unique_ptr<ProtocolTransport>
TransportFactoryBase::create(const TransportOptions &options) const
{
	std::unique_ptr<ProtocolTransport> transport = createInstance(options);
	transport->name_ = name_;

	LOG(Transport, Debug)
		<< "Created " << name_ << " transport for camera "
		<< options.cameraId << " at " << options.address;

	return transport;
}

/**
 * \fn TransportFactoryBase::name()
 * \brief Retrieve the factory name
 */

void TransportFactoryBase::registerType(TransportFactoryBase *factory)
{
	factories().push_back(factory);
}

/**
 * \brief Retrieve the list of all transport factories
 * \return The list of transport factories
 */
std::vector<TransportFactoryBase *> &TransportFactoryBase::factories()
{
	/*
	 * The static factories vector is defined inside the function to ensure
	 * it gets initialized on first use, without any dependency on link
	 * order.
	 */
	static std::vector<TransportFactoryBase *> factories;
	return factories;
}

/**
 * \brief Return the factory for the transport with name \a name
 * \param[in] name The transport name
 * \return The factory of the transport, or nullptr if not found
 */
const TransportFactoryBase *TransportFactoryBase::getFactoryByName(const std::string &name)
{
	const std::vector<TransportFactoryBase *> &list = factories();

	auto iter = std::find_if(list.begin(), list.end(),
				 [&name](const TransportFactoryBase *f) {
					 return f->name() == name;
				 });

	if (iter != list.end())
		return *iter;

	return nullptr;
}

/**
 * \class TransportFactory
 * \brief Registration of TransportFactory class and creation of instances
 * \tparam _Transport The transport class type for this factory
 */

/**
 * \def REGISTER_TRANSPORT
 * \brief Register a transport with the transport factory
 * \param[in] transport Class name of ProtocolTransport derived class
 * \param[in] name Name assigned to the transport, matching the
 * protocol.type configuration key
 */

/**
 * \brief Split a "Name=Value&Name=Value" argument list
 * \param[in] arguments The argument list
 *
 * Empty entries are skipped. Entries without a '=' produce an empty value.
 *
 * \return The list of name/value pairs, in order
 */
std::vector<std::pair<std::string, std::string>>
parseArguments(const std::string &arguments)
{
	std::vector<std::pair<std::string, std::string>> pairs;

	for (const std::string &entry : utils::split(arguments, "&")) {
		std::string item = utils::trim(entry);
		if (item.empty())
			continue;

		std::string::size_type pos = item.find('=');
		if (pos == std::string::npos)
			pairs.emplace_back(item, std::string{});
		else
			pairs.emplace_back(item.substr(0, pos), item.substr(pos + 1));
	}

	return pairs;
}

} /* namespace camtune */
