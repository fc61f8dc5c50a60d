//
//  tree.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace syncforge {

/**
 * @brief Generic ordered multi-way tree.
 *
 * Every node owns its children and an optional payload. The root of a sync map never carries a
 * payload. Sibling order is document order.
 */
template <typename T>
class Tree {
   public:
    using Ptr = std::unique_ptr<Tree<T>>;

    Tree() = default;
    explicit Tree(std::unique_ptr<T> value) : value_(std::move(value)) {}

    Tree(const Tree &) = delete;
    Tree &operator=(const Tree &) = delete;

    // Factory.
    static Ptr create(std::unique_ptr<T> value = nullptr) {
        return std::make_unique<Tree<T>>(std::move(value));
    }

    T *value() { return value_.get(); }
    const T *value() const { return value_.get(); }
    bool has_value() const { return value_ != nullptr; }

    Tree *parent() const { return parent_; }
    bool is_root() const { return parent_ == nullptr; }
    bool is_leaf() const { return children_.empty(); }

    // True if neither this node nor any descendant carries a payload.
    bool is_empty() const {
        if (value_) {
            return false;
        }
        return std::all_of(children_.begin(), children_.end(),
                           [](const Ptr &c) { return c->is_empty(); });
    }

    // Attach child as first or last child; the tree takes ownership.
    void add_child(Ptr child, bool as_last = true) {
        if (!child) {
            return;
        }
        child->parent_ = this;
        if (as_last) {
            children_.push_back(std::move(child));
        } else {
            children_.insert(children_.begin(), std::move(child));
        }
    }

    const std::vector<Ptr> &children() const { return children_; }

    // Non-empty children in order. A payload-less child that still holds fragments below it
    // is transparent: its own non-empty children take its place.
    std::vector<Tree *> children_not_empty() {
        std::vector<Tree *> out;
        for (auto &c : children_) {
            if (c->is_empty()) {
                continue;
            }
            if (c->has_value()) {
                out.push_back(c.get());
            } else {
                auto sub = c->children_not_empty();
                out.insert(out.end(), sub.begin(), sub.end());
            }
        }
        return out;
    }

    std::vector<const Tree *> children_not_empty() const {
        std::vector<const Tree *> out;
        for (const auto &c : children_) {
            if (c->is_empty()) {
                continue;
            }
            if (c->has_value()) {
                out.push_back(c.get());
            } else {
                auto sub = static_cast<const Tree &>(*c).children_not_empty();
                out.insert(out.end(), sub.begin(), sub.end());
            }
        }
        return out;
    }

    // Payloads of children_not_empty().
    std::vector<T *> vchildren_not_empty() {
        std::vector<T *> out;
        for (auto *c : children_not_empty()) {
            out.push_back(c->value());
        }
        return out;
    }

    std::vector<const T *> vchildren_not_empty() const {
        std::vector<const T *> out;
        for (const auto *c : children_not_empty()) {
            out.push_back(c->value());
        }
        return out;
    }

    // Number of levels below and including this node; a lone node has height 1.
    size_t height() const {
        size_t deepest = 0;
        for (const auto &c : children_) {
            deepest = std::max(deepest, c->height());
        }
        return deepest + 1;
    }

    // Depth from the root; the root is level 0.
    size_t level() const { return parent_ ? parent_->level() + 1 : 0; }

    // Visit this node and all descendants, parents before children.
    template <typename Fn>
    void pre_order(Fn &&fn) {
        fn(*this);
        for (auto &c : children_) {
            c->pre_order(fn);
        }
    }

    template <typename Fn>
    void pre_order(Fn &&fn) const {
        fn(*this);
        for (const auto &c : children_) {
            static_cast<const Tree &>(*c).pre_order(fn);
        }
    }

    // Drop payload and all children.
    void clear() {
        value_.reset();
        children_.clear();
    }

   private:
    std::unique_ptr<T> value_;
    std::vector<Ptr> children_;
    Tree *parent_ = nullptr;
};

}  // namespace syncforge
