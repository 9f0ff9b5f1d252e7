#include <algorithm>
#include <iostream>
#include "components/TreeBuildArgParse.hpp"
#include "global/logging.hpp"
#include "tree/dispatch.hpp"
#include "tree/errors.hpp"
#include "tree/export.hpp"
#include "tree/metrics.hpp"
#include "tree/value_list.hpp"

using namespace std;

int main(int argc, char* argv[]) {
    // parsing command-line arguments
    TreeBuildCmdLine cmd{argc, argv, "TreeBuild", ' ', "0.1"};
    TreeBuildArgParse args(cmd);
    try {
        cmd.parse();
    } catch (const TreeBuildException& e) {
        ERROR("Invalid command line: {}", e.what());
        return 1;
    }

    if (args.verbose.getValue()) { set_log_level(spdlog::level::debug); }

    string text = args.input_text();
    BuildOptions options = args.build_options();
    bool detected = args.format.getValue() == tree_format::none;

    IntTree tree;
    format_t used_format{tree_format::none};
    try {
        used_format = resolve_format(text, args.format.getValue(), options.null_markers);
        DEBUG("Input format: {}{}.", format_name(used_format), detected ? " (detected)" : "");
        tree = build_tree(text, used_format, options);
    } catch (const TreeBuildException& e) {
        ERROR("Tree construction failed: {}", e.what());
        return 1;
    }

    INFO("Built tree with {} nodes.", node_count(tree));

    int marker = options.is_null(-1) ? -1 : *options.null_markers.begin();
    auto values = to_pre_order(tree);
    if (find(values.begin(), values.end(), marker) != values.end()) {
        WARNING("Tree holds the value {} which is also the level-order null marker; the "
                "level_order line does not rebuild this tree.",
            marker);
    }

    cout << "format\t" << used_format << '\n';
    cout << "nodes\t" << node_count(tree) << '\n';
    cout << "max_depth\t" << max_depth(tree) << '\n';
    cout << "balanced\t" << (is_balanced(tree) ? "true" : "false") << '\n';
    cout << "diameter\t" << diameter(tree) << '\n';
    cout << "parenthesis\t" << to_parenthesis(tree) << '\n';
    cout << "level_order\t" << format_values(to_level_order(tree, marker)) << '\n';
}
