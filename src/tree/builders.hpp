#pragma once

#include <algorithm>
#include <queue>
#include <set>
#include <string>
#include <vector>
#include "errors.hpp"
#include "global/logging.hpp"
#include "metrics.hpp"
#include "node.hpp"
#include "options.hpp"

/*==================================================================================================
  Reconstruction of a tree from a linear traversal. All builders return the empty tree for an
  empty input.
==================================================================================================*/

namespace builders_detail {
    template <class Value>
    void check_node_count(const BinaryTree<Value>& tree, std::size_t expected,
        const std::string& format) {
        std::size_t built = node_count(tree);
        if (built != expected) {
            throw StrictValidationException("Error: " + format + " input describes " +
                                            std::to_string(expected) + " nodes but " +
                                            std::to_string(built) + " were reconstructed.");
        }
    }

    // cursor: index of the next value to consume; advanced by every node created
    template <class Value>
    BinaryTree<Value> pre_order_recursive(const std::vector<Value>& values, std::size_t& cursor) {
        if (cursor >= values.size()) { return nullptr; }
        auto node = make_node(values[cursor]);
        cursor++;
        node->left = pre_order_recursive(values, cursor);
        node->right = pre_order_recursive(values, cursor);
        return node;
    }

    // remaining: number of values not consumed yet, consumed from the back
    template <class Value>
    BinaryTree<Value> post_order_recursive(
        const std::vector<Value>& values, std::size_t& remaining) {
        if (remaining == 0) { return nullptr; }
        auto node = make_node(values[remaining - 1]);
        remaining--;
        // right-to-left consumption: right subtree comes before left subtree
        node->right = post_order_recursive(values, remaining);
        node->left = post_order_recursive(values, remaining);
        return node;
    }
}  // namespace builders_detail

/*==================================================================================================
  Level-order (breadth-first) with null markers for absent children, e.g. [3, 1, 2, -1, -1].
  Nodes awaiting children sit in a FIFO queue; each takes the next two values as left and right
  child. Values left over once the queue is empty are ignored (strict mode rejects them).
==================================================================================================*/
template <class Value>
BinaryTree<Value> build_from_level_order(
    const std::vector<Value>& values, const std::set<Value>& null_markers, bool strict = false) {
    auto is_null = [&null_markers](const Value& v) { return null_markers.count(v) != 0; };
    BinaryTree<Value> root;

    if (not values.empty() and not is_null(values.front())) {
        root = make_node(values.front());
        std::queue<BinaryNode<Value>*> awaiting_children;
        awaiting_children.push(root.get());
        std::size_t i = 1;

        while (not awaiting_children.empty() and i < values.size()) {
            BinaryNode<Value>* current = awaiting_children.front();
            awaiting_children.pop();

            if (i < values.size() and not is_null(values[i])) {
                current->left = make_node(values[i]);
                awaiting_children.push(current->left.get());
            }
            i++;

            if (i < values.size() and not is_null(values[i])) {
                current->right = make_node(values[i]);
                awaiting_children.push(current->right.get());
            }
            i++;
        }
    }

    if (strict) {
        std::size_t expected = std::count_if(
            values.begin(), values.end(), [&is_null](const Value& v) { return not is_null(v); });
        builders_detail::check_node_count(root, expected, "level-order");
    }
    return root;
}

inline IntTree build_from_level_order(
    const std::vector<int>& values, const BuildOptions& options = BuildOptions()) {
    auto tree = build_from_level_order(values, options.null_markers, options.strict);
    tree_logger()->debug("Level-order input of {} values gave {} nodes.", values.size(),
        node_count(tree));
    return tree;
}

/*==================================================================================================
  Pre-order (node, left, right) without markers. Each value becomes one node and the left
  subtree is always filled first, so an unmarked listing always decodes as a left spine: the
  format is only meaningful with a serializer that produced exactly that shape.
==================================================================================================*/
template <class Value>
BinaryTree<Value> build_from_pre_order(
    const std::vector<Value>& values, const BuildOptions& options = BuildOptions()) {
    std::size_t cursor = 0;
    auto tree = builders_detail::pre_order_recursive(values, cursor);
    if (options.strict) { builders_detail::check_node_count(tree, values.size(), "pre-order"); }
    return tree;
}

// Post-order (left, right, node): mirror of the above, decoding as a right spine.
template <class Value>
BinaryTree<Value> build_from_post_order(
    const std::vector<Value>& values, const BuildOptions& options = BuildOptions()) {
    std::size_t remaining = values.size();
    auto tree = builders_detail::post_order_recursive(values, remaining);
    if (options.strict) { builders_detail::check_node_count(tree, values.size(), "post-order"); }
    return tree;
}
