/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Owning file descriptor
 */

#include <camtune/base/unique_fd.h>

#include <unistd.h>

namespace camtune {

/* Give up ownership, the caller becomes responsible for closing. */
int UniqueFD::release()
{
	int fd = fd_;
	fd_ = -1;
	return fd;
}

void UniqueFD::reset(int fd)
{
	if (fd == fd_)
		return;

	if (fd_ >= 0)
		close(fd_);

	fd_ = fd;
}

} /* namespace camtune */
