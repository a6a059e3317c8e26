#pragma once

#include "../api/config.hpp"
#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "../core/parameter.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace hashmv {

using NamedParameter = std::pair<std::string, Parameter*>;

/// Incoming values for one layer's parameters, keyed by local name
using LocalState = std::map<std::string, const Matrix*>;

// ============================================================================
// Layer: Abstract node of a network tree
// ============================================================================

/**
 * Layer: A node in a network's layer tree.
 *
 * Leaves (Linear, ReLU, HashKernel) transform a (batch x features) matrix;
 * containers (Sequential) own named children and chain them. forward()
 * caches whatever backward() needs, so backward() must follow a forward()
 * on the same layer.
 *
 * New layers start in training mode.
 */
class Layer {
public:
    virtual ~Layer() = default;

    virtual std::string type_name() const = 0;

    virtual Matrix forward(const Matrix& x) = 0;

    /**
     * Accumulate parameter gradients and return dL/dx.
     * @param grad_out dL/dy with the shape of the last forward output
     */
    virtual Matrix backward(const Matrix& grad_out) = 0;

    /// Deep copy, including parameters and mode
    virtual std::unique_ptr<Layer> clone() const = 0;

    /// Parameters owned directly by this layer, keyed by local name
    virtual std::vector<NamedParameter> local_parameters() { return {}; }

    /// Feature dimensions for layers with a fixed shape contract (0 = any)
    virtual size_t in_features() const { return 0; }
    virtual size_t out_features() const { return 0; }

    // ------------------------------------------------------------------------
    // Children (containers override)
    // ------------------------------------------------------------------------

    virtual size_t num_children() const { return 0; }

    virtual Layer& child(size_t index) {
        throw std::out_of_range(type_name() + " has no child " + std::to_string(index));
    }

    const Layer& child(size_t index) const {
        return const_cast<Layer*>(this)->child(index);
    }

    virtual std::string child_name(size_t index) const {
        throw std::out_of_range(type_name() + " has no child " + std::to_string(index));
    }

    /**
     * Swap in a new child, returning the one it supersedes.
     */
    virtual std::unique_ptr<Layer> replace_child(size_t index, std::unique_ptr<Layer>) {
        throw std::out_of_range(type_name() + " has no child " + std::to_string(index));
    }

    // ------------------------------------------------------------------------
    // Mode
    // ------------------------------------------------------------------------

    /// Set training (true) or evaluation (false) mode on this subtree
    void train(bool on = true) {
        training_ = on;
        on_mode_change();
        for (size_t i = 0; i < num_children(); ++i) {
            child(i).train(on);
        }
    }

    void eval() { train(false); }

    bool is_training() const { return training_; }

    /**
     * Reject checkpoint values this layer cannot hold. Runs for every layer
     * before any parameter of the tree is written; shapes are already checked.
     */
    virtual void validate_state(const LocalState&) const {}

    /// Called after checkpoint state was written into this layer's parameters
    virtual void on_state_loaded() {}

    LayerInfo info(std::string path) const {
        return LayerInfo{std::move(path), type_name(), in_features(), out_features()};
    }

protected:
    Layer() = default;
    Layer(const Layer&) = default;
    Layer& operator=(const Layer&) = default;

    virtual void on_mode_change() {}

private:
    bool training_ = true;
};

// ============================================================================
// Tree Traversal
// ============================================================================

namespace detail {

inline std::string join_path(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "." + name;
}

}  // namespace detail

/**
 * Pre-order traversal of a layer tree. The root's path is "".
 */
inline void walk(Layer& root,
                 const std::function<void(Layer&, const std::string&)>& visit,
                 const std::string& path = "") {
    visit(root, path);
    for (size_t i = 0; i < root.num_children(); ++i) {
        walk(root.child(i), visit, detail::join_path(path, root.child_name(i)));
    }
}

inline void walk(const Layer& root,
                 const std::function<void(const Layer&, const std::string&)>& visit,
                 const std::string& path = "") {
    visit(root, path);
    for (size_t i = 0; i < root.num_children(); ++i) {
        walk(root.child(i), visit, detail::join_path(path, root.child_name(i)));
    }
}

/**
 * All parameters of the tree keyed by dotted path ("fc1.weight").
 */
inline std::vector<NamedParameter> named_parameters(Layer& root) {
    std::vector<NamedParameter> result;
    walk(root, [&](Layer& layer, const std::string& path) {
        for (auto& [name, param] : layer.local_parameters()) {
            result.emplace_back(detail::join_path(path, name), param);
        }
    });
    return result;
}

inline void zero_grad(Layer& root) {
    for (auto& [name, param] : named_parameters(root)) {
        param->zero_grad();
    }
}

}  // namespace hashmv
