#pragma once

#include "../core/errors.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <set>
#include <string>
#include <utility>

namespace hashmv {

// ============================================================================
// Layer Selection
// ============================================================================

/**
 * LayerInfo: What a selector sees about a candidate layer.
 */
struct LayerInfo {
    /// Dotted path from the model root ("encoder.0.fc"); empty for the root
    std::string path;

    /// Layer type name ("Linear", "ReLU", "Sequential", "HashKernel")
    std::string type;

    size_t in_dim = 0;
    size_t out_dim = 0;
};

using LayerSelector = std::function<bool(const LayerInfo&)>;

/// Every Linear layer
inline LayerSelector select_all_linear() {
    return [](const LayerInfo& info) { return info.type == "Linear"; };
}

/// Linear layers whose path is in `names`
inline LayerSelector select_by_name(std::set<std::string> names) {
    return [names = std::move(names)](const LayerInfo& info) {
        return info.type == "Linear" && names.count(info.path) > 0;
    };
}

/// Linear layers whose path starts with `prefix`
inline LayerSelector select_by_prefix(std::string prefix) {
    return [prefix = std::move(prefix)](const LayerInfo& info) {
        return info.type == "Linear" && info.path.compare(0, prefix.size(), prefix) == 0;
    };
}

/// Linear layers with at least `min_in_dim` input features
inline LayerSelector select_min_in_dim(size_t min_in_dim) {
    return [min_in_dim](const LayerInfo& info) {
        return info.type == "Linear" && info.in_dim >= min_in_dim;
    };
}

// ============================================================================
// Kernel Configuration
// ============================================================================

/**
 * KernelConfig: Configuration for HashKernel construction and model patching.
 */
struct KernelConfig {
    /// Projection source: frozen random (RandomProj) or trainable (LearnedProj)
    KernelVariant variant = KernelVariant::RandomProj;

    /// Code width in bits; higher = better approximation, more work
    /// Typical values: 32, 64, 128 (512 for near-exact reconstruction)
    size_t k = 64;

    /// Which layers the patcher replaces
    LayerSelector selector = select_all_linear();

    /// Base seed for projection draws; patched layer i uses seed + i
    uint64_t seed = 42;

    /// Zero-norm handling, shared by both variants
    NormGuard norm_guard = NormGuard::Raise;

    /// Floor used by NormGuard::EpsilonFloor
    Float epsilon = 1e-12f;

    /// Straight-through clip range |v| <= ste_clip; +inf disables clipping
    Float ste_clip = std::numeric_limits<Float>::infinity();

    /// RandomProj only: also route straight-through gradients through the
    /// hash codes of W and x. LearnedProj always does.
    bool straight_through = false;

    /// Reuse weight codes across forward calls in evaluation mode
    bool cache_in_eval = true;

    // Builder pattern
    KernelConfig& set_variant(KernelVariant v) { variant = v; return *this; }
    KernelConfig& set_k(size_t bits) { k = bits; return *this; }
    KernelConfig& set_selector(LayerSelector s) { selector = std::move(s); return *this; }
    KernelConfig& set_seed(uint64_t s) { seed = s; return *this; }
    KernelConfig& set_norm_guard(NormGuard g, Float eps = 1e-12f) { norm_guard = g; epsilon = eps; return *this; }
    KernelConfig& set_ste_clip(Float clip) { ste_clip = clip; return *this; }
    KernelConfig& set_straight_through(bool on) { straight_through = on; return *this; }
    KernelConfig& set_cache_in_eval(bool on) { cache_in_eval = on; return *this; }

    /// Whether backward propagates through the sign step
    bool uses_straight_through() const {
        return variant == KernelVariant::LearnedProj || straight_through;
    }

    /**
     * @throws InvalidConfigError on k == 0, a missing selector, a non-positive
     *         clip or a non-positive epsilon
     */
    void validate() const {
        if (k == 0) {
            throw InvalidConfigError("k must be >= 1");
        }
        if (!selector) {
            throw InvalidConfigError("layer selector is empty");
        }
        if (!(ste_clip > 0.0f)) {
            throw InvalidConfigError("ste_clip must be > 0");
        }
        if (norm_guard == NormGuard::EpsilonFloor && !(epsilon > 0.0f && std::isfinite(epsilon))) {
            throw InvalidConfigError("epsilon must be a positive finite value");
        }
    }
};

}  // namespace hashmv
