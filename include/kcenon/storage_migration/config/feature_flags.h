// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Optional kcenon ecosystem integrations of storage_migration
 *
 * The build defines BUILD_WITH_<SYSTEM> for each optional library it links.
 * This header turns those into the KCENON_WITH_* values shared with the
 * other kcenon systems (0 or 1, never undefined) and derives the
 * storage_migration switches from them.
 *
 * | Macro                                | Effect                              |
 * |--------------------------------------|-------------------------------------|
 * | KCENON_WITH_THREAD_SYSTEM            | job worker pools use thread_pool    |
 * | STORAGE_MIGRATION_USE_LOGGER_SYSTEM  | SM_LOG_* route to logger_system     |
 */

#pragma once

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#endif

#ifndef KCENON_WITH_COMMON_SYSTEM
#if defined(BUILD_WITH_COMMON_SYSTEM)
#define KCENON_WITH_COMMON_SYSTEM 1
#else
#define KCENON_WITH_COMMON_SYSTEM 0
#endif
#endif

#ifndef KCENON_WITH_THREAD_SYSTEM
#if defined(BUILD_WITH_THREAD_SYSTEM)
#define KCENON_WITH_THREAD_SYSTEM 1
#else
#define KCENON_WITH_THREAD_SYSTEM 0
#endif
#endif

#ifndef KCENON_WITH_LOGGER_SYSTEM
#if defined(BUILD_WITH_LOGGER_SYSTEM)
#define KCENON_WITH_LOGGER_SYSTEM 1
#else
#define KCENON_WITH_LOGGER_SYSTEM 0
#endif
#endif

// logger_system is built on common_system; both must be linked.
#ifndef STORAGE_MIGRATION_USE_LOGGER_SYSTEM
#if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
#define STORAGE_MIGRATION_USE_LOGGER_SYSTEM 1
#else
#define STORAGE_MIGRATION_USE_LOGGER_SYSTEM 0
#endif
#endif
