// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#pragma once

/* Native Win32 build (MSVC or MinGW, not Cygwin); everything else is treated as POSIX */
#if defined(_WIN32) && !defined(__CYGWIN__)
#define TURDUS_PLATFORM_WIN_NATIVE 1
#else
#define TURDUS_PLATFORM_WIN_NATIVE 0
#endif
