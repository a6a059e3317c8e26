#pragma once

#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "layer.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace hashmv {

// ============================================================================
// Sequential: Ordered container of named children
// ============================================================================

/**
 * Sequential: Runs its children in order.
 *
 * Children are named explicitly or by their index ("0", "1", ...), and
 * the names form the dotted paths used by selectors and checkpoints.
 */
class Sequential : public Layer {
public:
    Sequential() = default;

    Sequential(const Sequential& other) : Layer(other) {
        children_.reserve(other.children_.size());
        for (const auto& [name, layer] : other.children_) {
            children_.emplace_back(name, layer->clone());
        }
    }

    Sequential& add(std::unique_ptr<Layer> layer) {
        return add(std::to_string(children_.size()), std::move(layer));
    }

    Sequential& add(std::string name, std::unique_ptr<Layer> layer) {
        if (!layer) {
            throw InvalidConfigError("Sequential::add: null layer '" + name + "'");
        }
        for (const auto& child : children_) {
            if (child.first == name) {
                throw InvalidConfigError("Sequential::add: duplicate child name '" + name + "'");
            }
        }
        children_.emplace_back(std::move(name), std::move(layer));
        return *this;
    }

    std::string type_name() const override { return "Sequential"; }

    size_t in_features() const override {
        return children_.empty() ? 0 : children_.front().second->in_features();
    }

    size_t out_features() const override {
        for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
            if (it->second->out_features() != 0) return it->second->out_features();
        }
        return 0;
    }

    Matrix forward(const Matrix& x) override {
        Matrix h = x;
        for (auto& [name, layer] : children_) {
            h = layer->forward(h);
        }
        return h;
    }

    Matrix backward(const Matrix& grad_out) override {
        Matrix g = grad_out;
        for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
            g = it->second->backward(g);
        }
        return g;
    }

    std::unique_ptr<Layer> clone() const override {
        return std::make_unique<Sequential>(*this);
    }

    size_t num_children() const override { return children_.size(); }

    using Layer::child;

    Layer& child(size_t index) override {
        check_index(index);
        return *children_[index].second;
    }

    std::string child_name(size_t index) const override {
        check_index(index);
        return children_[index].first;
    }

    std::unique_ptr<Layer> replace_child(size_t index, std::unique_ptr<Layer> layer) override {
        check_index(index);
        if (!layer) {
            throw InvalidConfigError("Sequential::replace_child: null layer");
        }
        std::swap(children_[index].second, layer);
        return layer;
    }

private:
    void check_index(size_t index) const {
        if (index >= children_.size()) {
            throw std::out_of_range("Sequential: child index " + std::to_string(index) +
                                    " out of range (" + std::to_string(children_.size()) + ")");
        }
    }

    std::vector<std::pair<std::string, std::unique_ptr<Layer>>> children_;
};

}  // namespace hashmv
