#pragma once

#include <queue>
#include <sstream>
#include <string>
#include <vector>
#include "node.hpp"

/*==================================================================================================
  Serializers: write a tree back into one of the textual/linear formats.
==================================================================================================*/

// Breadth-first listing where absent children are written as null_marker. Trailing markers are
// dropped, so build_from_level_order(to_level_order(t, m), {m}) rebuilds t.
template <class Value>
std::vector<Value> to_level_order(const BinaryTree<Value>& tree, Value null_marker) {
    std::vector<Value> result;
    if (tree == nullptr) { return result; }

    std::queue<const BinaryNode<Value>*> bfs_queue;
    bfs_queue.push(tree.get());
    result.push_back(tree->value);
    while (not bfs_queue.empty()) {
        auto node = bfs_queue.front();
        bfs_queue.pop();
        for (auto child : {node->left.get(), node->right.get()}) {
            if (child != nullptr) {
                result.push_back(child->value);
                bfs_queue.push(child);
            } else {
                result.push_back(null_marker);
            }
        }
    }
    while (not result.empty() and result.back() == null_marker) { result.pop_back(); }
    return result;
}

inline std::vector<int> to_level_order(const IntTree& tree) { return to_level_order(tree, -1); }

// "1(2(4)(5))(3)"; a missing left child is written "()" when a right child follows.
template <class Value>
void write_parenthesis(std::ostream& os, const BinaryNode<Value>* node) {
    if (node == nullptr) { return; }
    os << node->value;
    if (node->left != nullptr or node->right != nullptr) {
        os << "(";
        write_parenthesis(os, node->left.get());
        os << ")";
    }
    if (node->right != nullptr) {
        os << "(";
        write_parenthesis(os, node->right.get());
        os << ")";
    }
}

template <class Value>
std::string to_parenthesis(const BinaryTree<Value>& tree) {
    std::stringstream ss;
    write_parenthesis(ss, tree.get());
    return ss.str();
}

namespace export_detail {
    enum visit_order { pre, in, post };

    template <class Value>
    void depth_first(const BinaryNode<Value>* node, visit_order order, std::vector<Value>& out) {
        if (node == nullptr) { return; }
        if (order == pre) { out.push_back(node->value); }
        depth_first(node->left.get(), order, out);
        if (order == in) { out.push_back(node->value); }
        depth_first(node->right.get(), order, out);
        if (order == post) { out.push_back(node->value); }
    }

    template <class Value>
    std::vector<Value> listing(const BinaryTree<Value>& tree, visit_order order) {
        std::vector<Value> result;
        depth_first(tree.get(), order, result);
        return result;
    }
}  // namespace export_detail

template <class Value>
std::vector<Value> to_pre_order(const BinaryTree<Value>& tree) {
    return export_detail::listing(tree, export_detail::pre);
}

template <class Value>
std::vector<Value> to_in_order(const BinaryTree<Value>& tree) {
    return export_detail::listing(tree, export_detail::in);
}

template <class Value>
std::vector<Value> to_post_order(const BinaryTree<Value>& tree) {
    return export_detail::listing(tree, export_detail::post);
}
