/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Logging control for applications and tests
 */

#pragma once

#include <ostream>

namespace camtune {

int logSetFile(const char *path);
void logSetStream(std::ostream *stream);
void logSetSyslog();
void logSetStderr();

int logSetLevel(const char *category, const char *level);

} /* namespace camtune */
