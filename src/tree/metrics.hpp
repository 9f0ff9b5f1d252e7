#pragma once

#include <algorithm>
#include <cstdlib>
#include <utility>
#include "node.hpp"

/*==================================================================================================
  Structural metrics over an already-built tree. All are single bottom-up passes; recursion depth
  is the height of the tree. None of them fail: the empty tree has depth 0, is balanced and has
  diameter 0.
==================================================================================================*/

template <class Value>
std::size_t node_count(const BinaryNode<Value>* node) {
    if (node == nullptr) { return 0; }
    return 1 + node_count(node->left.get()) + node_count(node->right.get());
}

// number of nodes on the longest root-to-leaf path
template <class Value>
int max_depth(const BinaryNode<Value>* node) {
    if (node == nullptr) { return 0; }
    return 1 + std::max(max_depth(node->left.get()), max_depth(node->right.get()));
}

namespace metrics_detail {
    struct BalanceInfo {
        bool balanced;
        int height;
    };

    template <class Value>
    BalanceInfo check_balance(const BinaryNode<Value>* node) {
        if (node == nullptr) { return {true, 0}; }
        auto left = check_balance(node->left.get());
        auto right = check_balance(node->right.get());
        bool balanced =
            left.balanced and right.balanced and std::abs(left.height - right.height) <= 1;
        return {balanced, 1 + std::max(left.height, right.height)};
    }

    struct DiameterInfo {
        int diameter;  // in edges, within the subtree
        int height;    // in nodes
    };

    template <class Value>
    DiameterInfo longest_path(const BinaryNode<Value>* node) {
        if (node == nullptr) { return {0, 0}; }
        auto left = longest_path(node->left.get());
        auto right = longest_path(node->right.get());
        // the path bending at this node goes down height(left) edges on one side and
        // height(right) edges on the other
        int through_node = left.height + right.height;
        return {std::max({left.diameter, right.diameter, through_node}),
            1 + std::max(left.height, right.height)};
    }
}  // namespace metrics_detail

// every node has subtrees whose heights differ by at most one
template <class Value>
bool is_balanced(const BinaryNode<Value>* node) {
    return metrics_detail::check_balance(node).balanced;
}

// longest path between any two nodes, counted in edges
template <class Value>
int diameter(const BinaryNode<Value>* node) {
    return metrics_detail::longest_path(node).diameter;
}

// Overloads taking the owning handle directly
template <class Value>
std::size_t node_count(const BinaryTree<Value>& tree) {
    return node_count(tree.get());
}

template <class Value>
int max_depth(const BinaryTree<Value>& tree) {
    return max_depth(tree.get());
}

template <class Value>
bool is_balanced(const BinaryTree<Value>& tree) {
    return is_balanced(tree.get());
}

template <class Value>
int diameter(const BinaryTree<Value>& tree) {
    return diameter(tree.get());
}
