/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * camtune-ctl - One-shot camera parameter control
 */

#pragma once

enum {
	OptCamera = 'C',
	OptConfig = 'c',
	OptHelp = 'h',
	OptLogLevel = 'l',
};
