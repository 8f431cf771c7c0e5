// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for aws_signer_system
 *
 * Central entry point for the integration flags of the aws_signer_system
 * library. Include this header to get access to all KCENON_WITH_* and
 * AWS_SIGNER_* feature macros.
 *
 * Feature categories:
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 * - AWS_SIGNER_USE_*     : Derived flags consumed by this library
 *
 * Usage:
 * @code
 * #include <kcenon/aws_signer/config/feature_flags.h>
 *
 * #if AWS_SIGNER_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#define AWS_SIGNER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define AWS_SIGNER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in aws_signer
 *
 * logger_system depends on common_system, so both must be enabled.
 */
#ifndef AWS_SIGNER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define AWS_SIGNER_USE_LOGGER_SYSTEM 1
    #else
        #define AWS_SIGNER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef AWS_SIGNER_PRINT_FEATURE_SUMMARY

#pragma message("=== AWS Signer System Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("=========================================")

#endif // AWS_SIGNER_PRINT_FEATURE_SUMMARY
