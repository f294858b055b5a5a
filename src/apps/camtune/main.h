/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * camtune - Exposure control daemon
 */

#pragma once

enum {
	OptCamera = 'C',
	OptConfig = 'c',
	OptFeatures = 'f',
	OptHelp = 'h',
	OptLogLevel = 'l',
};
