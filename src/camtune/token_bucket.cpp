/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Blocking token bucket rate limiter
 */

#include "camtune/internal/token_bucket.h"

#include <algorithm>
#include <cmath>

/**
 * \file internal/token_bucket.h
 * \brief Blocking token bucket rate limiter
 */

namespace camtune {

/**
 * \class TokenBucket
 * \brief Rate limiter that suspends callers until a token is available
 *
 * The bucket holds at most \a burst tokens and refills continuously at
 * \a rate tokens per second. It starts full. Callers are never refused a
 * token, acquire() blocks until one is available or the bucket is
 * cancelled.
 *
 * A half-open one second window contains at most \a burst - 1 + \a rate
 * acquisitions. Use refillRate() to derive the rate from a per second cap.
 */

/**
 * \brief Construct a token bucket
 * \param[in] rate The refill rate in tokens per second, must be positive
 * \param[in] burst The bucket capacity
 */
TokenBucket::TokenBucket(double rate, unsigned int burst)
	: rate_(rate), burst_(std::max(burst, 1u)), tokens_(burst_),
	  last_(utils::clock::now()), cancelled_(false)
{
}

/**
 * \brief Compute the refill rate that honours a per second cap
 * \param[in] perSecond The maximum number of acquisitions in any one second
 * window
 * \param[in] burst The bucket capacity
 *
 * The burst is drawn from the same one second budget, the bucket refills at
 * what remains of it. A burst equal to the cap leaves a rate of one token per
 * second.
 *
 * \return The refill rate in tokens per second
 */
double TokenBucket::refillRate(double perSecond, unsigned int burst)
{
	double cap = std::floor(perSecond);
	return std::max(cap - std::max(burst, 1u) + 1.0, 1.0);
}

void TokenBucket::refill(utils::time_point now)
{
	std::chrono::duration<double> elapsed = now - last_;
	tokens_ = std::min<double>(burst_, tokens_ + elapsed.count() * rate_);
	last_ = now;
}

/**
 * \brief Take a token, waiting for one if the bucket is empty
 *
 * \return True when a token has been taken, false if the bucket has been
 * cancelled
 */
bool TokenBucket::acquire()
{
	MutexLocker locker(mutex_);

	while (!cancelled_) {
		refill(utils::clock::now());

		if (tokens_ >= 1.0) {
			tokens_ -= 1.0;
			return true;
		}

		std::chrono::duration<double> wait((1.0 - tokens_) / rate_);
		cv_.wait_for(locker, wait, [this]() CAMTUNE_TSA_REQUIRES(mutex_) {
			return cancelled_;
		});
	}

	return false;
}

/**
 * \brief Take a token if one is available
 * \return True if a token has been taken, false otherwise
 */
bool TokenBucket::tryAcquire()
{
	MutexLocker locker(mutex_);

	if (cancelled_)
		return false;

	refill(utils::clock::now());

	if (tokens_ < 1.0)
		return false;

	tokens_ -= 1.0;
	return true;
}

/**
 * \brief Wake up all waiters and refuse further acquisitions
 */
void TokenBucket::cancel()
{
	{
		MutexLocker locker(mutex_);
		cancelled_ = true;
	}

	cv_.notify_all();
}

} /* namespace camtune */
