/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Bounded, rate limited and adaptive execution of parameter operations
 */

#include "camtune/internal/concurrency_controller.h"

#include <algorithm>
#include <errno.h>
#include <system_error>
#include <thread>

#include "camtune/internal/protocol_transport.h"

/**
 * \file internal/concurrency_controller.h
 * \brief Execution policy for parameter operations on one camera
 */

namespace camtune {

LOG_DEFINE_CATEGORY(Concurrency)

/**
 * \struct ConcurrencyConfig
 * \brief Execution policy knobs
 *
 * \var ConcurrencyConfig::enabled
 * \brief Run operations in parallel and rate limit them. When false,
 * operations run one by one in the calling thread with the sequential pacing
 * \var ConcurrencyConfig::maxConcurrentOperations
 * \brief Hard ceiling on simultaneously in-flight operations
 * \var ConcurrencyConfig::fallbackToSequential
 * \brief Lower the limit on failures and raise it back on success
 */

/**
 * \struct ConcurrencyStats
 * \brief Snapshot of the controller state
 */

/**
 * \class ConcurrencyController
 * \brief Issue independent parameter operations against one camera
 *
 * The controller splits GET and SET requests into one operation per
 * parameter and runs them on up to current limit threads. Every dispatch to
 * the transport is gated by, in order:
 *
 * - an admission check that keeps the number of in-flight operations below
 *   the current limit and never runs two operations on the same parameter
 *   concurrently,
 * - a token bucket shared by GET and SET traffic, for each operation type
 *   enabled in the rate limiting configuration,
 * - a minimum spacing from the previous dispatch, which is the sequential
 *   spacing when the limit is 1 and the concurrent spacing otherwise.
 *
 * Each operation that times out or fails at the transport level lowers the
 * limit by one, down to 1, when fallback is enabled. Rejected operations are
 * neither successes nor failures. After a window of consecutive successes, and once the optional
 * cooldown since the last change has elapsed, the limit climbs back by the
 * configured step up to the maximum.
 *
 * Operations failing with Outcome::Error reconnect the transport and are
 * retried once after the retry delay. Concurrent failures share a single
 * reconnection.
 *
 * All counters are owned by the controller and only read through stats().
 */

/**
 * \brief Construct a controller for \a transport
 * \param[in] transport The transport, must outlive the controller
 * \param[in] config The execution policy
 * \param[in] cameraId The camera identifier, used in log messages
 */
ConcurrencyController::ConcurrencyController(ProtocolTransport *transport,
					     const ConcurrencyConfig &config,
					     unsigned int cameraId)
	: transport_(transport), config_(config), cameraId_(cameraId),
	  cancelled_(false), inFlight_(0), peakInFlight_(0),
	  successCount_(0), failureCount_(0), cleanStreak_(0),
	  lastChange_(utils::clock::now()), generation_(0),
	  reconnectFailures_(0), lastReconnectOk_(true)
{
	currentLimit_ = config_.enabled
		      ? std::max(config_.maxConcurrentOperations, 1u) : 1;

	if (config_.enabled &&
	    (config_.rateLimiting.setOperations || config_.rateLimiting.getOperations))
		bucket_ = std::make_unique<TokenBucket>(
			TokenBucket::refillRate(config_.rateLimiting.maxRequestsPerSecond,
						config_.rateLimiting.burst),
			config_.rateLimiting.burst);
}

ConcurrencyController::~ConcurrencyController()
{
}

std::string ConcurrencyController::logPrefix() const
{
	return "camera " + std::to_string(cameraId_);
}

/**
 * \brief Read parameters
 * \param[in] names The parameter names
 * \return One result per name, in order
 */
std::vector<CommandResult> ConcurrencyController::get(const std::vector<std::string> &names)
{
	std::vector<Operation> operations;
	for (const std::string &name : names)
		operations.push_back({ name, std::nullopt });

	return dispatch(Type::Get, operations);
}

/**
 * \brief Write parameters
 * \param[in] values The parameter values
 *
 * Each parameter is applied and reported independently, a failure of one
 * parameter doesn't prevent the others from being applied.
 *
 * \return One result per parameter, in the order of \a values
 */
std::vector<CommandResult> ConcurrencyController::set(const ParameterValues &values)
{
	std::vector<Operation> operations;
	for (const auto &[name, value] : values)
		operations.push_back({ name, value });

	return dispatch(Type::Set, operations);
}

std::vector<CommandResult>
ConcurrencyController::dispatch(Type type, std::vector<Operation> &operations)
{
	std::vector<CommandResult> results(operations.size());
	if (operations.empty())
		return results;

	std::atomic<size_t> next(0);
	auto worker = [&]() {
		for (size_t i = next++; i < operations.size(); i = next++)
			results[i] = execute(type, operations[i]);
	};

	unsigned int count = 1;
	if (config_.enabled)
		count = std::min<size_t>(config_.maxConcurrentOperations,
					 operations.size());

	/*
	 * The calling thread is one of the workers, it drains the remaining
	 * operations if no other worker can be started.
	 */
	std::vector<std::thread> workers;
	for (unsigned int i = 1; i < count; ++i) {
		try {
			workers.emplace_back(worker);
		} catch (const std::system_error &e) {
			LOG(Concurrency, Warning)
				<< "Failed to start a worker thread: " << e.what()
				<< ", continuing with " << workers.size() + 1
				<< " worker(s)";
			break;
		}
	}

	worker();

	for (std::thread &thread : workers)
		thread.join();

	return results;
}

CommandResult ConcurrencyController::execute(Type type, const Operation &operation)
{
	CommandResult result{ operation.parameter, operation.value, std::nullopt,
			      Outcome::Cancelled };

	if (!admit(operation.parameter))
		return result;

	utils::ScopeGuard finished([&]() { finish(operation.parameter); });

	uint64_t generation = generation_;
	result = attempt(type, operation);

	if (result.outcome == Outcome::Error && !cancelled_) {
		LOG(Concurrency, Warning)
			<< operation.parameter << ": transport error, reconnecting";

		if (reconnectAfterError(generation) &&
		    sleep(config_.pacing.retryDelay))
			result = attempt(type, operation);
	}

	account(result);

	if (!result.ok() && result.outcome != Outcome::Cancelled)
		LOG(Concurrency, Debug)
			<< operation.parameter << ": " << result.outcome;

	return result;
}

CommandResult ConcurrencyController::attempt(Type type, const Operation &operation)
{
	CommandResult result{ operation.parameter, operation.value, std::nullopt,
			      Outcome::Cancelled };

	if (rateLimited(type) && !bucket_->acquire())
		return result;

	if (!pace())
		return result;

	std::vector<CommandResult> results;
	if (type == Type::Get)
		results = transport_->getParameters({ operation.parameter });
	else
		results = transport_->setParameters({ { operation.parameter, *operation.value } });

	if (results.empty()) {
		LOG(Concurrency, Error)
			<< "Transport returned no result for " << operation.parameter;
		result.outcome = Outcome::Error;
		return result;
	}

	return results.front();
}

bool ConcurrencyController::rateLimited(Type type) const
{
	if (!bucket_)
		return false;

	return type == Type::Get ? config_.rateLimiting.getOperations
				 : config_.rateLimiting.setOperations;
}

bool ConcurrencyController::admit(const std::string &parameter)
{
	MutexLocker locker(mutex_);

	cv_.wait(locker, [&]() CAMTUNE_TSA_REQUIRES(mutex_) {
		return cancelled_ ||
		       (inFlight_ < currentLimit_ && !busy_.count(parameter));
	});

	if (cancelled_)
		return false;

	inFlight_++;
	busy_.insert(parameter);
	peakInFlight_ = std::max(peakInFlight_, inFlight_);

	return true;
}

void ConcurrencyController::finish(const std::string &parameter)
{
	{
		MutexLocker locker(mutex_);
		inFlight_--;
		busy_.erase(parameter);
	}

	cv_.notify_all();
}

/*
 * Keep the minimum spacing between two consecutive dispatches to the
 * transport. Dispatches are serialized here, the transport calls themselves
 * run in parallel.
 */
bool ConcurrencyController::pace()
{
	utils::Duration spacing = currentLimit() == 1 ? config_.pacing.sequential
						      : config_.pacing.concurrent;

	MutexLocker locker(dispatchMutex_);

	if (lastDispatch_) {
		utils::time_point ready = *lastDispatch_ + spacing.toClock();
		dispatchCv_.wait_until(locker, ready, [this]() {
			return cancelled_.load();
		});
	}

	if (cancelled_)
		return false;

	lastDispatch_ = utils::clock::now();
	return true;
}

bool ConcurrencyController::sleep(utils::Duration duration)
{
	MutexLocker locker(mutex_);
	cv_.wait_for(locker, duration.toClock(), [this]() {
		return cancelled_.load();
	});

	return !cancelled_;
}

/**
 * \brief Reconnect the transport
 *
 * \return 0 on success, -ECANCELED if the controller has been cancelled, or
 * another negative error code otherwise
 */
int ConcurrencyController::reconnect()
{
	MutexLocker locker(reconnectMutex_);

	/* A new connection would clear the abort issued by cancel(). */
	if (cancelled_)
		return -ECANCELED;

	transport_->disconnect();
	int ret = transport_->connect();
	generation_++;

	lastReconnectOk_ = ret == 0;
	if (ret < 0) {
		unsigned int failures = ++reconnectFailures_;
		LOG(Concurrency, Warning)
			<< "Reconnection failed (" << failures
			<< " consecutive failure(s))";
	} else {
		reconnectFailures_ = 0;
	}

	return ret;
}

/*
 * Reconnect unless another operation already did since \a generation was
 * sampled, in which case its result is reused.
 */
bool ConcurrencyController::reconnectAfterError(uint64_t generation)
{
	{
		MutexLocker locker(reconnectMutex_);
		if (generation_ != generation)
			return lastReconnectOk_;
	}

	return reconnect() == 0;
}

void ConcurrencyController::account(const CommandResult &result)
{
	if (result.outcome == Outcome::Cancelled)
		return;

	if (result.ok() || result.outcome == Outcome::Rejected)
		reconnectFailures_ = 0;

	/* A refused value says nothing about the health of the link. */
	if (result.outcome == Outcome::Rejected)
		return;

	MutexLocker locker(mutex_);

	if (result.ok()) {
		successCount_++;
		cleanStreak_++;
		recover(utils::clock::now());
		return;
	}

	failureCount_++;
	cleanStreak_ = 0;

	if (!config_.enabled || !config_.fallbackToSequential || currentLimit_ <= 1)
		return;

	currentLimit_--;
	lastChange_ = utils::clock::now();

	if (currentLimit_ == 1)
		LOG(Concurrency, Warning)
			<< "Falling back to sequential operation";
	else
		LOG(Concurrency, Info)
			<< "Concurrency limit lowered to " << currentLimit_;
}

void ConcurrencyController::recover(utils::time_point now)
{
	unsigned int maxLimit = std::max(config_.maxConcurrentOperations, 1u);

	if (!config_.enabled || !config_.fallbackToSequential ||
	    currentLimit_ >= maxLimit)
		return;

	if (cleanStreak_ < config_.recovery.window)
		return;

	if (config_.recovery.cooldown &&
	    now - lastChange_ < config_.recovery.cooldown.toClock())
		return;

	currentLimit_ = std::min(currentLimit_ + std::max(config_.recovery.step, 1u),
				 maxLimit);
	cleanStreak_ = 0;
	lastChange_ = now;

	LOG(Concurrency, Info) << "Concurrency limit raised to " << currentLimit_;

	/* Admission may now let more operations through. */
	cv_.notify_all();
}

/**
 * \brief Abandon pending operations
 *
 * Operations that haven't been dispatched yet complete with
 * Outcome::Cancelled. In-flight operations are aborted by the transport and
 * drain without further retries. The controller can't be used after being
 * cancelled.
 */
void ConcurrencyController::cancel()
{
	{
		MutexLocker locker(mutex_);
		cancelled_ = true;
	}
	cv_.notify_all();

	{
		MutexLocker locker(dispatchMutex_);
	}
	dispatchCv_.notify_all();

	if (bucket_)
		bucket_->cancel();

	/* Serialize with reconnect() so that the abort outlives it. */
	{
		MutexLocker locker(reconnectMutex_);
		transport_->abort();
	}

	LOG(Concurrency, Debug) << "Cancelled";
}

/**
 * \brief Retrieve the current concurrency limit
 * \return The current limit
 */
unsigned int ConcurrencyController::currentLimit() const
{
	MutexLocker locker(mutex_);
	return currentLimit_;
}

/**
 * \brief Retrieve a snapshot of the controller state
 * \return The controller statistics
 */
ConcurrencyStats ConcurrencyController::stats() const
{
	MutexLocker locker(mutex_);

	uint64_t total = successCount_ + failureCount_;

	ConcurrencyStats stats;
	stats.enabled = config_.enabled;
	stats.currentLimit = currentLimit_;
	stats.maxLimit = std::max(config_.maxConcurrentOperations, 1u);
	stats.successCount = successCount_;
	stats.failureCount = failureCount_;
	stats.successRate = total ? static_cast<double>(successCount_) / total : 1.0;
	stats.rateLimitingActive = bucket_ != nullptr;
	stats.peakInFlight = peakInFlight_;
	stats.reconnectFailures = reconnectFailures_;

	return stats;
}

} /* namespace camtune */
