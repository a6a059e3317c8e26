#pragma once

#include <cstddef>
#include <cstdint>
#include <numbers>

namespace hashmv {

// ============================================================================
// Basic Type Definitions
// ============================================================================

/// Float type for weights, activations and projections
using Float = float;

/// Hamming distance type (max distance = k)
using HammingDist = uint32_t;

/// Half pi, used by the angle mapping cos(pi/2 * (1 - s))
constexpr Float HALF_PI = static_cast<Float>(std::numbers::pi / 2.0);

// ============================================================================
// Kernel Variants
// ============================================================================

/**
 * KernelVariant: Which projection source backs a HashKernel.
 *
 *   - RandomProj:  P drawn once from N(0, 1), frozen
 *   - LearnedProj: P initialized from N(0, 1), trained with straight-through
 *                  gradients
 */
enum class KernelVariant : uint8_t {
    RandomProj = 0,
    LearnedProj = 1,
};

/**
 * NormGuard: Policy for zero-norm rows presented for normalization.
 * Applies identically to both kernel variants.
 */
enum class NormGuard : uint8_t {
    Raise = 0,         // throw DegenerateVectorError
    EpsilonFloor = 1,  // divide by max(norm, epsilon), keep the true norm
};

inline const char* variant_name(KernelVariant v) {
    switch (v) {
        case KernelVariant::RandomProj: return "RandomProj";
        case KernelVariant::LearnedProj: return "LearnedProj";
    }
    return "Unknown";
}

// ============================================================================
// Utility Functions
// ============================================================================

/// Number of 64-bit words needed to hold `bits` bits
constexpr size_t words_for_bits(size_t bits) {
    return (bits + 63) / 64;
}

}  // namespace hashmv
