/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * libevent based main loop for the camtune daemon
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include <camtune/base/class.h>

struct event;
struct event_base;

/*
 * Single threaded dispatcher for file descriptor, timer and signal sources.
 * Handlers run from run() in the calling thread.
 */
class EventLoop
{
public:
	using Handler = std::function<void()>;

	EventLoop();
	~EventLoop();

	int watchReadable(int fd, Handler handler);
	int every(std::chrono::microseconds period, Handler handler);
	int onSignal(int signal, Handler handler);

	int run();
	void stop(int code = 0);

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(EventLoop)

	struct Source {
		Handler handler;
		struct event *event = nullptr;

		~Source();
	};

	int arm(std::unique_ptr<Source> source, const struct timeval *timeout);
	static void dispatch(int fd, short what, void *arg);

	struct event_base *base_;
	int exitCode_;

	std::vector<std::unique_ptr<Source>> sources_;
};
