/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Control loop of one camera
 */

#include "camtune/internal/camera_session.h"

#include <errno.h>

#include "camtune/internal/concurrency_controller.h"
#include "camtune/internal/protocol_transport.h"
#include "camtune/internal/sync.h"

/**
 * \file internal/camera_session.h
 * \brief Per camera stack and worker thread
 */

namespace camtune {

LOG_DEFINE_CATEGORY(Session)

/**
 * \class CameraSession
 * \brief Own the control stack of one camera and run its cycles
 *
 * The session creates the camera transport from the configured protocol
 * name, wraps it in a concurrency controller and drives an adjustment engine
 * from a worker thread. Feature measurements are posted by the caller; when
 * measurements arrive while a cycle is running, only the latest ones are
 * kept for the next cycle.
 *
 * A slave session takes its feature targets from the target cache. The master
 * session publishes its targets after each cycle.
 *
 * The session is marked unhealthy after the configured number of consecutive
 * reconnection failures and keeps cycling at the sequential floor. It becomes
 * healthy again on the next successful operation.
 */

/**
 * \brief Construct a camera session
 * \param[in] config The deployment configuration, must outlive the session
 * \param[in] camera The camera configuration
 * \param[in] targets The cache of master targets, or nullptr
 * \param[in] publisher The target publisher, used by the master camera only
 */
CameraSession::CameraSession(const Configuration &config, const CameraConfig &camera,
			     TargetCache *targets, SyncPublisher *publisher)
	: config_(config), camera_(camera), targets_(targets),
	  publisher_(publisher), costModel_(config.cost), healthy_(true),
	  cycles_(0), running_(false)
{
}

CameraSession::~CameraSession()
{
	stop();
}

std::string CameraSession::logPrefix() const
{
	return "camera " + std::to_string(camera_.id);
}

/**
 * \brief Check if the session is the master of the deployment
 * \return True if the camera is the configured master camera
 */
bool CameraSession::isMaster() const
{
	return config_.masterCamera && *config_.masterCamera == camera_.id;
}

/**
 * \brief Connect to the camera and start the worker thread
 *
 * A camera that can't be reached at start is not fatal, the session keeps
 * reconnecting as part of its cycles.
 *
 * \return 0 on success or a negative error code if the session can't be
 * created
 */
int CameraSession::start()
{
	const TransportFactoryBase *factory =
		TransportFactoryBase::getFactoryByName(config_.protocol);
	if (!factory) {
		LOG(Session, Error) << "Unknown protocol " << config_.protocol;
		return -EINVAL;
	}

	transport_ = factory->create(config_.transportOptions(camera_));
	if (!transport_)
		return -ENOMEM;

	controller_ = std::make_unique<ConcurrencyController>(transport_.get(),
							      config_.concurrency,
							      camera_.id);
	engine_ = std::make_unique<AdjustmentEngine>(controller_.get(), &costModel_,
						     config_.features,
						     config_.parameters, camera_.id);

	int ret = transport_->connect();
	if (ret < 0)
		LOG(Session, Warning)
			<< "Camera " << camera_.address << " unreachable, will retry";

	{
		MutexLocker locker(mutex_);
		running_ = true;
	}

	thread_ = std::thread(&CameraSession::run, this);

	LOG(Session, Info)
		<< "Started " << transport_->name() << " session for "
		<< camera_.address << (isMaster() ? " (master)" : "");

	return 0;
}

/**
 * \brief Stop the worker thread and disconnect from the camera
 *
 * Pending operations are cancelled, a running cycle completes with cancelled
 * results.
 */
void CameraSession::stop()
{
	{
		MutexLocker locker(mutex_);
		if (!running_ && !thread_.joinable())
			return;

		running_ = false;
		pending_.reset();
	}
	cv_.notify_all();

	if (controller_)
		controller_->cancel();

	if (thread_.joinable())
		thread_.join();

	if (transport_)
		transport_->disconnect();

	LOG(Session, Debug) << "Stopped after " << cycles_ << " cycle(s)";
}

/**
 * \brief Post feature measurements for the next cycle
 * \param[in] features The measured feature values
 *
 * Measurements that haven't been processed yet are replaced.
 */
void CameraSession::post(const FeatureValues &features)
{
	{
		MutexLocker locker(mutex_);
		if (!running_)
			return;

		if (pending_)
			LOG(Session, Debug) << "Dropping unprocessed features";

		pending_ = features;
	}

	cv_.notify_one();
}

void CameraSession::run()
{
	while (true) {
		FeatureValues features;

		{
			MutexLocker locker(mutex_);
			cv_.wait(locker, [this]() CAMTUNE_TSA_REQUIRES(mutex_) {
				return !running_ || pending_;
			});

			if (!running_)
				break;

			features = std::move(*pending_);
			pending_.reset();
		}

		runCycle(features);
	}
}

void CameraSession::runCycle(const FeatureValues &features)
{
	FeatureValues targets;
	if (targets_ && !isMaster())
		targets = targets_->targets();

	CycleSummary summary = engine_->cycle(features, targets);
	cycles_++;

	{
		MutexLocker locker(mutex_);
		summary_ = summary;
	}

	if (summary.requested || summary.stalls)
		LOG(Session, Debug)
			<< "Cycle " << cycles_ << ": " << summary.applied << "/"
			<< summary.requested << " applied, " << summary.stalls
			<< " stall(s)";

	updateHealth();

	if (publisher_ && isMaster())
		publishTargets(features);
}

void CameraSession::publishTargets(const FeatureValues &features)
{
	for (const FeatureConfig &feature : config_.features) {
		double value = feature.band.midpoint();

		if (config_.sync.publish == SyncConfig::Publish::Measured) {
			auto it = features.find(feature.name);
			if (it == features.end())
				continue;
			value = it->second;
		}

		int ret = publisher_->publish(feature.name, value);
		if (ret < 0) {
			LOG(Session, Warning)
				<< "Failed to publish " << feature.name << " target";
			return;
		}
	}
}

void CameraSession::updateHealth()
{
	unsigned int failures = controller_->reconnectFailures();

	if (healthy_ && failures >= config_.health.maxReconnectFailures) {
		healthy_ = false;
		LOG(Session, Error)
			<< "Camera unhealthy after " << failures
			<< " consecutive reconnection failures";
	} else if (!healthy_ && failures == 0) {
		healthy_ = true;
		LOG(Session, Info) << "Camera healthy again";
	}
}

/**
 * \brief Retrieve the concurrency statistics of the camera connection
 * \return The statistics
 */
ConcurrencyStats CameraSession::stats() const
{
	if (!controller_)
		return {};

	return controller_->stats();
}

/**
 * \brief Retrieve the summary of the last cycle
 * \return The cycle summary
 */
CycleSummary CameraSession::lastSummary() const
{
	MutexLocker locker(mutex_);
	return summary_;
}

} /* namespace camtune */
