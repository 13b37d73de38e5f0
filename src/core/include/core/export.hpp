/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#if defined(_WIN32) && defined(GOOP_BUILD_SHARED)
#ifdef GOOP_CORE_EXPORTS
#define GOOP_CORE_API __declspec(dllexport)
#else
#define GOOP_CORE_API __declspec(dllimport)
#endif
#define GOOP_LOGGER_API GOOP_CORE_API
#elif defined(__GNUC__) && defined(GOOP_BUILD_SHARED)
#define GOOP_CORE_API   __attribute__((visibility("default")))
#define GOOP_LOGGER_API GOOP_CORE_API
#else
#define GOOP_CORE_API
#define GOOP_LOGGER_API
#endif
