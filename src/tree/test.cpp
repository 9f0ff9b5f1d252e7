#include "doctest.h"

#include <climits>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "builders.hpp"
#include "dispatch.hpp"
#include "errors.hpp"
#include "export.hpp"
#include "format.hpp"
#include "metrics.hpp"
#include "parenthesis_parser.hpp"
#include "value_list.hpp"

using namespace std;

using values_t = vector<int>;

// level-order inputs used as fixtures (complete listings, markers included)
const vector<values_t> level_order_cases{
    {3, 1, 2, -1, -1, -1, -1},
    {3, -1, 1, 2, -1, -1, -1},
    {2, -1, -1},
    {27, 16, 33, 14, 15, -1, -1, 17, 34, 10, 37, 21, -1, -1, 44, 13, -1, 22, 38, 45, 11, 31, -1,
        -1, -1, -1, -1, -1, 47, -1, 20, -1, -1, -1, 43, 39, -1, -1, -1, -1, -1, 36, -1, -1, -1},
    {31, -1, 32, 1, 21, 5, -1, -1, -1, 30, 33, 22, 26, -1, -1, -1, -1, 11, -1, -1, -1},
    {41, 45, 37, 33, 21, 28, 4, 1, -1, 8, -1, 32, 10, 19, -1, -1, -1, -1, 35, -1, 46, 3, 34, -1,
        30, 16, -1, 14, -1, 24, -1, 17, -1, -1, -1, -1, -1, -1, -1, -1, -1, 13, -1, -1, -1}};

/*==================================================================================================
  Format detection
==================================================================================================*/
TEST_CASE("Format detection on value sequences") {
    CHECK(detect_format(values_t{}) == tree_format::none);
    CHECK(detect_format(values_t{3, 1, 2, -1, -1, -1, -1}) == tree_format::level_order);
    CHECK(detect_format(values_t{5, -999, 8}) == tree_format::level_order);
    CHECK(detect_format(values_t{5, 3, 8}) == tree_format::pre_order);
    // markers outside the default set are not seen by the detector
    CHECK(detect_format(values_t{5, 0, 8}) == tree_format::pre_order);
}

TEST_CASE("Format detection with caller-supplied null markers") {
    set<int> zero{0};
    CHECK(detect_format(values_t{1, 0, 2}, zero) == tree_format::level_order);
    CHECK(detect_format(values_t{1, -1, 2}, zero) == tree_format::pre_order);
    CHECK(detect_format(string("[1, 0, 2]"), zero) == tree_format::level_order);
    CHECK(resolve_format(values_t{1, 0, 2}, tree_format::none, zero) == tree_format::level_order);
    CHECK(resolve_format(values_t{1, 0, 2}, tree_format::pre_order, zero) == tree_format::pre_order);

    BuildOptions options;
    options.null_markers = zero;
    CHECK(to_parenthesis(build_tree(values_t{1, 0, 2}, tree_format::none, options)) == "1()(2)");
    CHECK(to_parenthesis(build_tree(string("[1, 0, 2]"), tree_format::none, options)) == "1()(2)");
    // without the override, 0 is an ordinary value and the list decodes as pre-order
    CHECK(to_parenthesis(build_tree(string("[1, 0, 2]"))) == "1(0(2))");
}

TEST_CASE("Format detection on text") {
    CHECK(detect_format(string("")) == tree_format::none);
    CHECK(detect_format(string("  \n")) == tree_format::none);
    CHECK(detect_format(string("1(2)(3)")) == tree_format::parenthesis);
    CHECK(detect_format(string("1)")) == tree_format::parenthesis);
    CHECK(detect_format(string("[3, 1, 2, -1, -1, -1, -1]")) == tree_format::level_order);
    CHECK(detect_format(string("5 3 8")) == tree_format::pre_order);
    CHECK(detect_format(string("[]")) == tree_format::none);
    CHECK(detect_format(string("five three")) == tree_format::unknown);
}

TEST_CASE("Format names") {
    CHECK(format_from_name("level_order") == tree_format::level_order);
    CHECK(format_from_name("pre_order") == tree_format::pre_order);
    CHECK(format_from_name("post_order") == tree_format::post_order);
    CHECK(format_from_name("in_order") == tree_format::in_order);
    CHECK(format_from_name("parenthesis") == tree_format::parenthesis);
    CHECK_THROWS_AS(format_from_name("zigzag"), UnsupportedFormatException);
    CHECK_THROWS_AS(format_from_name("none"), UnsupportedFormatException);

    stringstream ss("post_order");
    format_t f{tree_format::none};
    ss >> f;
    CHECK(f == tree_format::post_order);

    stringstream out;
    out << tree_format::parenthesis << " " << tree_format::unknown;
    CHECK(out.str() == "parenthesis unknown");
}

/*==================================================================================================
  Level-order
==================================================================================================*/
TEST_CASE("Level-order reconstruction") {
    auto tree = build_from_level_order(values_t{3, 1, 2, -1, -1, -1, -1});
    REQUIRE(tree != nullptr);
    CHECK(tree->value == 3);
    REQUIRE(tree->left != nullptr);
    REQUIRE(tree->right != nullptr);
    CHECK(tree->left->value == 1);
    CHECK(tree->right->value == 2);
    CHECK(tree->left->is_leaf());
    CHECK(tree->right->is_leaf());

    CHECK(max_depth(tree) == 2);
    CHECK(is_balanced(tree) == true);
    CHECK(diameter(tree) == 2);
}

TEST_CASE("Level-order with a missing left child") {
    auto tree = build_from_level_order(values_t{3, -1, 1, 2, -1, -1, -1});
    CHECK(to_parenthesis(tree) == "3()(1(2))");
    CHECK(max_depth(tree) == 3);
    CHECK(is_balanced(tree) == false);
    CHECK(diameter(tree) == 2);
}

TEST_CASE("Level-order empty and degenerate inputs") {
    CHECK(build_from_level_order(values_t{}) == nullptr);
    CHECK(build_from_level_order(values_t{-1, 4, 5}) == nullptr);
    CHECK(build_from_level_order(values_t{-999}) == nullptr);

    auto single = build_from_level_order(values_t{2, -1, -1});
    REQUIRE(single != nullptr);
    CHECK(single->is_leaf());

    // input exhausted before every node got its children
    auto partial = build_from_level_order(values_t{1, 2});
    CHECK(to_parenthesis(partial) == "1(2)");
}

TEST_CASE("Level-order with custom null markers") {
    BuildOptions options;
    options.null_markers = {0};
    auto tree = build_from_level_order(values_t{1, 0, 2}, options);
    CHECK(to_parenthesis(tree) == "1()(2)");

    // -1 is an ordinary value once it is no longer a marker
    auto with_minus_one = build_from_level_order(values_t{1, -1, 0}, options);
    CHECK(to_parenthesis(with_minus_one) == "1(-1)");
}

TEST_CASE("Level-order strict mode") {
    BuildOptions options;
    options.strict = true;
    CHECK_NOTHROW(build_from_level_order(values_t{3, 1, 2, -1, -1, -1, -1}, options));
    // 5 is never reached: the queue is empty after the root
    CHECK_THROWS_AS(build_from_level_order(values_t{1, -1, -1, 5}, options),
        StrictValidationException);
    CHECK_THROWS_AS(build_from_level_order(values_t{-1, 5}, options), StrictValidationException);

    options.strict = false;
    CHECK(node_count(build_from_level_order(values_t{1, -1, -1, 5}, options)) == 1);
}

TEST_CASE("Level-order over other value types") {
    vector<string> values{"a", "b", "#", "c"};
    auto tree = build_from_level_order(values, set<string>{"#"});
    REQUIRE(tree != nullptr);
    CHECK(tree->value == "a");
    CHECK(tree->left->value == "b");
    CHECK(tree->right == nullptr);
    CHECK(tree->left->left->value == "c");
    CHECK(max_depth(tree) == 3);
}

/*==================================================================================================
  Pre-order / post-order
==================================================================================================*/
TEST_CASE("Pre-order reconstruction gives a left spine") {
    auto tree = build_from_pre_order(values_t{1, 2, 4, 5, 3});
    CHECK(to_parenthesis(tree) == "1(2(4(5(3))))");

    const IntNode* node = tree.get();
    for (int expected : {1, 2, 4, 5, 3}) {
        REQUIRE(node != nullptr);
        CHECK(node->value == expected);
        CHECK(node->right == nullptr);
        node = node->left.get();
    }
    CHECK(node == nullptr);

    CHECK(max_depth(tree) == 5);
    CHECK(diameter(tree) == 4);
    CHECK(is_balanced(tree) == false);
    CHECK(to_pre_order(tree) == values_t{1, 2, 4, 5, 3});
}

TEST_CASE("Post-order reconstruction gives a right spine") {
    auto tree = build_from_post_order(values_t{4, 5, 2, 3, 1});
    CHECK(to_parenthesis(tree) == "1()(3()(2()(5()(4))))");

    const IntNode* node = tree.get();
    for (int expected : {1, 3, 2, 5, 4}) {
        REQUIRE(node != nullptr);
        CHECK(node->value == expected);
        CHECK(node->left == nullptr);
        node = node->right.get();
    }
    CHECK(node == nullptr);
    CHECK(to_post_order(tree) == values_t{4, 5, 2, 3, 1});
}

TEST_CASE("Pre-order and post-order empty input and strict mode") {
    CHECK(build_from_pre_order(values_t{}) == nullptr);
    CHECK(build_from_post_order(values_t{}) == nullptr);

    BuildOptions options;
    options.strict = true;
    CHECK(node_count(build_from_pre_order(values_t{5, 3, 8}, options)) == 3);
    CHECK(node_count(build_from_post_order(values_t{5, 3, 8}, options)) == 3);
}

TEST_CASE("Pre-order over strings") {
    auto tree = build_from_pre_order(vector<string>{"x", "y"});
    REQUIRE(tree != nullptr);
    CHECK(tree->value == "x");
    CHECK(tree->left->value == "y");
}

TEST_CASE("Deep chains") {
    values_t values(5000);
    for (int i = 0; i < 5000; i++) { values[i] = i; }

    auto pre = build_from_pre_order(values);
    CHECK(node_count(pre) == 5000);
    CHECK(max_depth(pre) == 5000);
    CHECK(diameter(pre) == 4999);
    CHECK(is_balanced(pre) == false);

    auto post = build_from_post_order(values);
    CHECK(max_depth(post) == 5000);
    CHECK(post->value == 4999);
}

/*==================================================================================================
  Parenthesized text
==================================================================================================*/
TEST_CASE("Parenthesis reconstruction") {
    auto tree = build_from_parenthesis("1(2(4)(5))(3)");
    REQUIRE(tree != nullptr);
    CHECK(tree->value == 1);
    REQUIRE(tree->left != nullptr);
    CHECK(tree->left->value == 2);
    CHECK(tree->left->left->value == 4);
    CHECK(tree->left->right->value == 5);
    CHECK(tree->left->left->is_leaf());
    CHECK(tree->left->right->is_leaf());
    REQUIRE(tree->right != nullptr);
    CHECK(tree->right->value == 3);
    CHECK(tree->right->is_leaf());
    CHECK(max_depth(tree) == 3);

    CHECK(to_pre_order(tree) == values_t{1, 2, 4, 5, 3});
    CHECK(to_in_order(tree) == values_t{4, 2, 5, 1, 3});
    CHECK(to_post_order(tree) == values_t{4, 5, 2, 3, 1});
}

TEST_CASE("Parenthesis variants") {
    CHECK(build_from_parenthesis("") == nullptr);
    CHECK(build_from_parenthesis("   ") == nullptr);
    CHECK(to_parenthesis(build_from_parenthesis("1(2(4)(5))(3(6)(7))")) == "1(2(4)(5))(3(6)(7))");
    CHECK(to_parenthesis(build_from_parenthesis("-4(-12)")) == "-4(-12)");
    CHECK(to_parenthesis(build_from_parenthesis(" 1 ( 2 ) ( 3 ) ")) == "1(2)(3)");
    CHECK(to_parenthesis(build_from_parenthesis("1()(3)")) == "1()(3)");
    CHECK(to_parenthesis(build_from_parenthesis("1(2)()")) == "1(2)");
    auto lowest = build_from_parenthesis("-2147483648");
    REQUIRE(lowest != nullptr);
    CHECK(lowest->value == INT_MIN);
}

TEST_CASE("Malformed parenthesized text") {
    CHECK_THROWS_AS(build_from_parenthesis("1(2"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("1(2))"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("(2)"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("1(a)"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("1(2)(3)(4)"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("1(2(4)(5)(6))"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("1-2"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("-"), ParenthesisParseException);
    CHECK_THROWS_AS(build_from_parenthesis("99999999999"), ParenthesisParseException);

    string message;
    try {
        build_from_parenthesis("1(2(3)");
    } catch (const ParenthesisParseException& e) { message = e.what(); }
    CHECK(message.find("expected ')'") != string::npos);
    CHECK(message.find("position 6") != string::npos);
}

/*==================================================================================================
  Dispatch
==================================================================================================*/
TEST_CASE("Dispatch with detection") {
    CHECK(to_parenthesis(build_tree(values_t{3, 1, 2, -1, -1, -1, -1})) == "3(1)(2)");
    CHECK(to_parenthesis(build_tree(values_t{1, 2, 4, 5, 3})) == "1(2(4(5(3))))");
    CHECK(to_parenthesis(build_tree(string("1(2(4)(5))(3)"))) == "1(2(4)(5))(3)");
    CHECK(to_parenthesis(build_tree(string("[3, 1, 2, -1, -1, -1, -1]"))) == "3(1)(2)");
    CHECK(build_tree(values_t{}) == nullptr);
    CHECK(build_tree(string("")) == nullptr);
}

TEST_CASE("Dispatch with an explicit format") {
    // explicit format wins over detection
    CHECK(to_parenthesis(build_tree(values_t{3, -1, 1}, tree_format::pre_order)) == "3(-1(1))");
    CHECK(to_parenthesis(build_tree(values_t{4, 5, 2, 3, 1}, "post_order")) ==
          "1()(3()(2()(5()(4))))");
    CHECK(to_parenthesis(build_tree(string("4 5 2 3 1"), tree_format::post_order)) ==
          "1()(3()(2()(5()(4))))");
    CHECK(to_parenthesis(build_tree(string("1(2)"), "parenthesis")) == "1(2)");
    CHECK(resolve_format(values_t{1}, tree_format::level_order) == tree_format::level_order);
    CHECK(resolve_format(values_t{1}) == tree_format::pre_order);
}

TEST_CASE("Dispatch errors") {
    CHECK_THROWS_AS(build_tree(values_t{4, 2, 5, 1, 3}, "in_order"),
        InsufficientInformationException);
    CHECK_THROWS_AS(build_tree(string("4 2 5"), tree_format::in_order),
        InsufficientInformationException);
    CHECK_THROWS_AS(build_tree(values_t{1, 2}, "breadth_first"), UnsupportedFormatException);
    CHECK_THROWS_AS(build_tree(values_t{1, 2}, tree_format::parenthesis),
        UnsupportedFormatException);
    CHECK_THROWS_AS(build_tree(string("five three")), UnsupportedFormatException);
    CHECK_THROWS_AS(build_tree(string("1 two"), tree_format::pre_order), ValueListParseException);
    CHECK_THROWS_AS(build_tree(string("1(2")), ParenthesisParseException);

    BuildOptions options;
    options.strict = true;
    CHECK_THROWS_AS(build_tree(values_t{1, -1, -1, 5}, tree_format::none, options),
        StrictValidationException);

    // all construction failures share a base class
    CHECK_THROWS_AS(build_tree(values_t{1}, "in_order"), TreeBuildException);

    string message;
    try {
        build_tree(values_t{1}, "zigzag");
    } catch (const UnsupportedFormatException& e) { message = e.what(); }
    CHECK(message == "Unsupported construction method: zigzag");
}

/*==================================================================================================
  Metrics and serializers
==================================================================================================*/
TEST_CASE("Metrics of the empty tree and of a single node") {
    IntTree empty;
    CHECK(node_count(empty) == 0);
    CHECK(max_depth(empty) == 0);
    CHECK(is_balanced(empty) == true);
    CHECK(diameter(empty) == 0);

    auto single = make_node(7);
    CHECK(node_count(single) == 1);
    CHECK(max_depth(single) == 1);
    CHECK(is_balanced(single) == true);
    CHECK(diameter(single) == 0);
}

TEST_CASE("Diameter not going through the root") {
    // longest path 8-4-2-5-9: 4 edges, all in the left subtree
    auto tree = build_from_parenthesis("1(2(4(8))(5()(9)))");
    CHECK(diameter(tree) == 4);
    CHECK(max_depth(tree) == 4);
    CHECK(is_balanced(tree) == false);
}

TEST_CASE("Balance is checked at every node") {
    // root heights are 3 and 3 but both children are unbalanced
    auto tree = build_from_parenthesis("1(2(3(4)))(5()(6()(7)))");
    CHECK(is_balanced(tree) == false);
    CHECK(is_balanced(build_from_parenthesis("1(2(4)(5))(3)")) == true);
    CHECK(is_balanced(build_from_parenthesis("1(2(4))(3)")) == true);
}

TEST_CASE("Diameter bound") {
    for (auto& values : level_order_cases) {
        auto tree = build_from_level_order(values);
        if (node_count(tree) >= 2) { CHECK(diameter(tree) <= 2 * max_depth(tree) - 1); }
    }
}

TEST_CASE("Level-order serialization rebuilds the same tree") {
    for (auto& values : level_order_cases) {
        auto tree = build_from_level_order(values);
        auto serialized = to_level_order(tree);
        auto rebuilt = build_from_level_order(serialized);
        CHECK(to_parenthesis(rebuilt) == to_parenthesis(tree));
        CHECK(to_level_order(rebuilt) == serialized);
    }
    CHECK(to_level_order(build_from_level_order(values_t{3, 1, 2, -1, -1, -1, -1})) ==
          values_t{3, 1, 2});
    CHECK(to_level_order(build_from_parenthesis("1()(2)"), -999) == values_t{1, -999, 2});
    CHECK(to_level_order(IntTree{}).empty());
}

TEST_CASE("Parenthesized serialization rebuilds the same tree") {
    for (auto& values : level_order_cases) {
        auto tree = build_from_level_order(values);
        auto text = to_parenthesis(tree);
        CHECK(to_level_order(build_from_parenthesis(text)) == to_level_order(tree));
    }
    CHECK(to_parenthesis(IntTree{}) == "");
}

/*==================================================================================================
  Value lists
==================================================================================================*/
TEST_CASE("Reading value lists") {
    CHECK(read_value_list("[3, 1, 2, -1]") == values_t{3, 1, 2, -1});
    CHECK(read_value_list("3 1\t2\n-1") == values_t{3, 1, 2, -1});
    CHECK(read_value_list(" [ 3,,1 ] ") == values_t{3, 1});
    CHECK(read_value_list("[1, null, None, +4]") == values_t{1, -1, -1, 4});
    CHECK(read_value_list("") == values_t{});
    CHECK(read_value_list("[]") == values_t{});

    CHECK_THROWS_AS(read_value_list("[1, 2"), ValueListParseException);
    CHECK_THROWS_AS(read_value_list("1, 2]"), ValueListParseException);
    CHECK_THROWS_AS(read_value_list("1 x"), ValueListParseException);
    CHECK_THROWS_AS(read_value_list("1 -"), ValueListParseException);
    CHECK_THROWS_AS(read_value_list("99999999999"), ValueListParseException);

    CHECK(format_values(values_t{3, 1, 2}) == "[3, 1, 2]");
    CHECK(format_values(values_t{}) == "[]");
}
