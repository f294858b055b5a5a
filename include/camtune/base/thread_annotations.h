/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2021, Google Inc.
 *
 * Clang thread safety analysis macros
 */

#pragma once

/* The attributes are only understood by clang and erased otherwise. */
#if defined(__clang__)
#define CAMTUNE_TSA_ATTRIBUTE__(x) __attribute__((x))
#else
#define CAMTUNE_TSA_ATTRIBUTE__(x) /* no-op */
#endif

#define CAMTUNE_TSA_CAPABILITY(x) \
	CAMTUNE_TSA_ATTRIBUTE__(capability(x))

#define CAMTUNE_TSA_SCOPED_CAPABILITY \
	CAMTUNE_TSA_ATTRIBUTE__(scoped_lockable)

#define CAMTUNE_TSA_GUARDED_BY(x) \
	CAMTUNE_TSA_ATTRIBUTE__(guarded_by(x))

#define CAMTUNE_TSA_REQUIRES(...) \
	CAMTUNE_TSA_ATTRIBUTE__(requires_capability(__VA_ARGS__))

#define CAMTUNE_TSA_ACQUIRE(...) \
	CAMTUNE_TSA_ATTRIBUTE__(acquire_capability(__VA_ARGS__))

#define CAMTUNE_TSA_RELEASE(...) \
	CAMTUNE_TSA_ATTRIBUTE__(release_capability(__VA_ARGS__))

#define CAMTUNE_TSA_EXCLUDES(...) \
	CAMTUNE_TSA_ATTRIBUTE__(locks_excluded(__VA_ARGS__))
