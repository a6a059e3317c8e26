#pragma once

#include "../api/config.hpp"
#include "../core/debug.hpp"
#include "../core/errors.hpp"
#include "hash_kernel.hpp"
#include "layer.hpp"
#include "linear.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace hashmv {

/**
 * PatchReport: What a patch pass did.
 */
struct PatchReport {
    /// Paths of the Linear layers that were replaced, in traversal order
    std::vector<std::string> patched;

    /// Number of layers the selector was shown
    size_t visited = 0;
};

// ============================================================================
// ModelPatcher: Replace Linear layers with HashKernels
// ============================================================================

/**
 * ModelPatcher: Visits a layer tree and substitutes every Linear layer the
 * selector accepts with a HashKernel of the configured variant.
 *
 * Replacement contract:
 *   - the kernel receives copies of the layer's W and b
 *   - tree order, child names and shapes are preserved
 *   - the superseded Linear is released, never modified
 *   - patched layer i (traversal order) draws its projection with seed + i
 *   - every kernel is built before the first replacement is made, so a
 *     selector that matches nothing (InvalidConfigError) or a layer that
 *     cannot be hashed (e.g. DegenerateVectorError for a zero weight row)
 *     leaves the model exactly as it was
 */
class ModelPatcher {
public:
    explicit ModelPatcher(KernelConfig config)
        : config_(std::move(config)) {
        config_.validate();
    }

    const KernelConfig& config() const { return config_; }

    /**
     * Paths of the layers a patch pass would replace.
     */
    std::vector<std::string> plan(const Layer& model, size_t* visited = nullptr) const {
        std::vector<std::string> paths;
        size_t count = 0;
        walk(model, [&](const Layer& layer, const std::string& path) {
            ++count;
            if (matches(layer, path)) paths.push_back(path);
        });
        if (visited) *visited = count;
        return paths;
    }

    /**
     * Patch a copy of `model`; the original is left untouched.
     */
    std::unique_ptr<Layer> patch(const Layer& model, PatchReport* report = nullptr) const {
        PatchReport local;
        Replacements kernels = build_kernels(model, local);
        std::unique_ptr<Layer> patched = install(model.clone(), kernels);
        if (report) *report = std::move(local);
        return patched;
    }

    /**
     * Patch `model` in place of its owner. On failure `model` is left
     * as it was; on success it is consumed and the patched tree returned.
     */
    std::unique_ptr<Layer> patch(std::unique_ptr<Layer>&& model, PatchReport* report = nullptr) const {
        if (!model) {
            throw InvalidConfigError("patch_model: null model");
        }
        PatchReport local;
        Replacements kernels = build_kernels(*model, local);
        std::unique_ptr<Layer> patched = install(std::move(model), kernels);
        if (report) *report = std::move(local);
        return patched;
    }

private:
    /// Finished kernels keyed by the path of the Linear they replace
    using Replacements = std::map<std::string, std::unique_ptr<Layer>>;

    bool matches(const Layer& layer, const std::string& path) const {
        return dynamic_cast<const Linear*>(&layer) != nullptr && config_.selector(layer.info(path));
    }

    /**
     * Phases 1-2: select the layers and construct every kernel. Reads the
     * model only; anything that can throw happens here.
     */
    Replacements build_kernels(const Layer& model, PatchReport& report) const {
        std::vector<std::string> planned = plan(model, &report.visited);
        if (planned.empty()) {
            throw InvalidConfigError("patch_model: layer selector matched none of the " +
                                     std::to_string(report.visited) + " layers");
        }
        HASHMV_DEBUG_PHASE(1, std::to_string(planned.size()) + " of " +
                              std::to_string(report.visited) + " layers selected");
        report.patched.reserve(planned.size());

        HASHMV_DEBUG_PHASE(2, "building " + std::string(variant_name(config_.variant)) + " kernels");
        Replacements kernels;
        walk(model, [&](const Layer& layer, const std::string& path) {
            if (matches(layer, path)) {
                kernels.emplace(path, build_kernel(layer, path, report));
            }
        });
        return kernels;
    }

    std::unique_ptr<HashKernel> build_kernel(const Layer& layer, const std::string& path,
                                             PatchReport& report) const {
        const auto& linear = static_cast<const Linear&>(layer);
        const uint64_t seed = config_.seed + report.patched.size();
        std::unique_ptr<HashKernel> kernel = HashKernel::from_linear(linear, config_, seed);

        HASHMV_DEBUG("built kernel for " << (path.empty() ? "<root>" : path) << " ("
                     << linear.out_features() << "x" << linear.in_features() << ") -> "
                     << variant_name(config_.variant) << " k=" << config_.k);
        report.patched.push_back(path);
        return kernel;
    }

    /**
     * Phase 3: swap the built kernels into the tree.
     */
    std::unique_ptr<Layer> install(std::unique_ptr<Layer> root, Replacements& kernels) const {
        HASHMV_DEBUG_PHASE(3, "installing " + std::to_string(kernels.size()) + " kernels");
        if (auto it = kernels.find(""); it != kernels.end()) {
            return std::move(it->second);
        }
        install_children(*root, "", kernels);
        return root;
    }

    void install_children(Layer& parent, const std::string& path, Replacements& kernels) const {
        for (size_t i = 0; i < parent.num_children(); ++i) {
            const std::string child_path = detail::join_path(path, parent.child_name(i));
            if (auto it = kernels.find(child_path); it != kernels.end()) {
                parent.replace_child(i, std::move(it->second));
            } else if (parent.child(i).num_children() > 0) {
                install_children(parent.child(i), child_path, kernels);
            }
        }
    }

    KernelConfig config_;
};

/**
 * Return a copy of `model` with matching Linear layers replaced by HashKernels.
 */
inline std::unique_ptr<Layer> patch_model(const Layer& model, const KernelConfig& config,
                                          PatchReport* report = nullptr) {
    return ModelPatcher(config).patch(model, report);
}

/**
 * Patch an owned model; the superseded Linear layers are released.
 */
inline std::unique_ptr<Layer> patch_model(std::unique_ptr<Layer>&& model, const KernelConfig& config,
                                          PatchReport* report = nullptr) {
    return ModelPatcher(config).patch(std::move(model), report);
}

}  // namespace hashmv
