/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Class declaration helpers
 */

#pragma once

/* Delete the copy constructor and copy assignment of \a klass. */
#define CAMTUNE_DISABLE_COPY(klass)                \
	klass(const klass &) = delete;             \
	klass &operator=(const klass &) = delete;

/* Delete copy and move, for objects whose address is shared. */
#define CAMTUNE_DISABLE_COPY_AND_MOVE(klass)       \
	CAMTUNE_DISABLE_COPY(klass)                \
	klass(klass &&) = delete;                  \
	klass &operator=(klass &&) = delete;
