/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Owning file descriptor
 */

#pragma once

#include <camtune/base/class.h>

namespace camtune {

/* Closes the descriptor it holds when destroyed or reset. */
class UniqueFD final
{
public:
	UniqueFD() = default;
	explicit UniqueFD(int fd)
		: fd_(fd)
	{
	}

	UniqueFD(UniqueFD &&other)
		: fd_(other.release())
	{
	}

	UniqueFD &operator=(UniqueFD &&other)
	{
		if (this != &other)
			reset(other.release());
		return *this;
	}

	~UniqueFD() { reset(); }

	[[nodiscard]] int release();
	void reset(int fd = -1);

	int get() const { return fd_; }
	bool isValid() const { return fd_ >= 0; }

private:
	CAMTUNE_DISABLE_COPY(UniqueFD)

	int fd_ = -1;
};

} /* namespace camtune */
