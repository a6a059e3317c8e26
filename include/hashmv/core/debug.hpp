#pragma once

/**
 * Diagnostic logging for hashmv.
 *
 * All output goes to stderr and is compiled out entirely below the
 * configured level, so the hot forward path carries no logging cost in
 * release builds.
 *
 *   HASHMV_DEBUG_LEVEL 0  silent
 *   HASHMV_DEBUG_LEVEL 1  model patching phases, checkpoint save/load
 *   HASHMV_DEBUG_LEVEL 2  adds weight-code cache rebuilds in HashKernel
 *
 * Unless set on the command line, NDEBUG builds use 0 and others use 1.
 */

#include <iostream>

#ifndef HASHMV_DEBUG_LEVEL
    #ifdef NDEBUG
        #define HASHMV_DEBUG_LEVEL 0
    #else
        #define HASHMV_DEBUG_LEVEL 1
    #endif
#endif

// ============================================================================
// Level 1: patching and checkpoint events
// ============================================================================

#if HASHMV_DEBUG_LEVEL >= 1

/// One-line event, e.g. a substituted layer path or a checkpoint file
#define HASHMV_DEBUG(msg) \
    std::cerr << "[hashmv] " << msg << "\n"

/// Numbered step of patch_model (1 = select, 2 = build kernels, 3 = install)
#define HASHMV_DEBUG_PHASE(phase_num, description) \
    std::cerr << "[hashmv] Phase " << (phase_num) << ": " << (description) << "\n"

#else

#define HASHMV_DEBUG(msg) ((void)0)
#define HASHMV_DEBUG_PHASE(phase_num, description) ((void)(phase_num))

#endif

// ============================================================================
// Level 2: per-forward cache activity
// ============================================================================

#if HASHMV_DEBUG_LEVEL >= 2

#define HASHMV_DEBUG_DETAIL(msg) \
    std::cerr << "[hashmv:DETAIL] " << msg << "\n"

#else

#define HASHMV_DEBUG_DETAIL(msg) ((void)0)

#endif
