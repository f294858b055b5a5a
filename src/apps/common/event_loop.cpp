/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * libevent based main loop for the camtune daemon
 */

#include "event_loop.h"

#include <errno.h>
#include <event2/event.h>

#include <camtune/base/log.h>

namespace camtune {

LOG_DEFINE_CATEGORY(EventLoop)

} /* namespace camtune */

using namespace camtune;

EventLoop::Source::~Source()
{
	if (event)
		event_free(event);
}

EventLoop::EventLoop()
	: base_(event_base_new()), exitCode_(0)
{
	if (!base_)
		LOG(EventLoop, Error) << "Failed to create event base";
}

EventLoop::~EventLoop()
{
	/* Events must be freed before their base. */
	sources_.clear();

	if (base_)
		event_base_free(base_);
}

void EventLoop::dispatch([[maybe_unused]] int fd, [[maybe_unused]] short what,
			 void *arg)
{
	static_cast<Source *>(arg)->handler();
}

int EventLoop::arm(std::unique_ptr<Source> source, const struct timeval *timeout)
{
	if (!source->event)
		return -ENOMEM;

	if (event_add(source->event, timeout) < 0)
		return -EINVAL;

	sources_.push_back(std::move(source));
	return 0;
}

int EventLoop::watchReadable(int fd, Handler handler)
{
	if (!base_)
		return -ENOMEM;

	auto source = std::make_unique<Source>();
	source->handler = std::move(handler);
	source->event = event_new(base_, fd, EV_READ | EV_PERSIST,
				  &EventLoop::dispatch, source.get());

	int ret = arm(std::move(source), nullptr);
	if (ret < 0)
		LOG(EventLoop, Error) << "Failed to watch fd " << fd;

	return ret;
}

int EventLoop::every(std::chrono::microseconds period, Handler handler)
{
	if (!base_)
		return -ENOMEM;

	auto source = std::make_unique<Source>();
	source->handler = std::move(handler);
	source->event = event_new(base_, -1, EV_PERSIST, &EventLoop::dispatch,
				  source.get());

	auto seconds = std::chrono::duration_cast<std::chrono::seconds>(period);
	struct timeval tv;
	tv.tv_sec = seconds.count();
	tv.tv_usec = (period - seconds).count();

	int ret = arm(std::move(source), &tv);
	if (ret < 0)
		LOG(EventLoop, Error) << "Failed to add a timer";

	return ret;
}

int EventLoop::onSignal(int signal, Handler handler)
{
	if (!base_)
		return -ENOMEM;

	auto source = std::make_unique<Source>();
	source->handler = std::move(handler);
	source->event = evsignal_new(base_, signal, &EventLoop::dispatch,
				     source.get());

	int ret = arm(std::move(source), nullptr);
	if (ret < 0)
		LOG(EventLoop, Error) << "Failed to handle signal " << signal;

	return ret;
}

/* Dispatch events until stop() is called. */
int EventLoop::run()
{
	if (!base_)
		return -ENOMEM;

	exitCode_ = 0;
	if (event_base_loop(base_, EVLOOP_NO_EXIT_ON_EMPTY) < 0)
		return -EIO;

	return exitCode_;
}

void EventLoop::stop(int code)
{
	exitCode_ = code;
	if (base_)
		event_base_loopbreak(base_);
}
