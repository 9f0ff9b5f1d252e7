#pragma once

#include <memory>
#include <utility>

// A binary tree node; each node exclusively owns its two children (no sharing, no cycles).
template <class Value>
struct BinaryNode {
    using value_type = Value;
    using owner = std::unique_ptr<BinaryNode>;

    Value value;
    owner left;
    owner right;

    explicit BinaryNode(Value v) : value(std::move(v)) {}

    bool is_leaf() const { return left == nullptr and right == nullptr; }
};

// A tree is identified by its root; the empty tree is a null root.
template <class Value>
using BinaryTree = std::unique_ptr<BinaryNode<Value>>;

using IntNode = BinaryNode<int>;
using IntTree = BinaryTree<int>;

template <class Value>
BinaryTree<Value> make_node(Value v) {
    return std::make_unique<BinaryNode<Value>>(std::move(v));
}
