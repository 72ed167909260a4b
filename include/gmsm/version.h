/**
 * @file version.h
 * @brief Version information for the gmsm library
 *
 * Single source of version macros. Bump here only when releasing.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_VERSION_H
#define GMSM_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define GMSM_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define GMSM_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define GMSM_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define GMSM_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define GMSM_VERSION_NUMBER ((GMSM_VERSION_MAJOR * 10000) + \
                             (GMSM_VERSION_MINOR * 100) + \
                             GMSM_VERSION_PATCH)

/** Library name */
#define GMSM_LIBRARY_NAME "gmsm"

/** Full library description */
#define GMSM_DESCRIPTION "SM2/SM3 toolkit (GM/T 0003, GB/T 32905)"

#ifdef NDEBUG
#define GMSM_BUILD_TYPE "Release"
#else
#define GMSM_BUILD_TYPE "Debug"
#endif

#define GMSM_VERSION_AT_LEAST(major, minor, patch) \
    (GMSM_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* GMSM_VERSION_H */
