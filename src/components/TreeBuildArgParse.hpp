#pragma once

#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "global/logging.hpp"
#include "tclap/CmdLine.h"
#include "tree/format.hpp"
#include "tree/options.hpp"

using namespace TCLAP;

// --format is read through tree_format::operator>>
namespace TCLAP {
    template <>
    struct ArgTraits<tree_format::format_t> {
        typedef ValueLike ValueCategory;
    };
}  // namespace TCLAP

class TreeBuildCmdLine {
    CmdLine cmd;
    int argc;
    char** argv;

  public:
    template <class... Args>
    TreeBuildCmdLine(int argc, char* argv[], Args&&... args)
        : cmd(std::forward<Args>(args)...), argc(argc), argv(argv) {}

    void parse() { cmd.parse(argc, argv); }

    CmdLine& get() { return cmd; }
};

class TreeBuildArgParse {
  protected:
    CmdLine& cmd;

  public:
    explicit TreeBuildArgParse(TreeBuildCmdLine& cmd) : cmd(cmd.get()) {}

    UnlabeledValueArg<std::string> input{"input",
        "Tree to build: parenthesized text such as '1(2)(3)' or a value list such as "
        "'[3, 1, 2, -1, -1]'.",
        false, "", "string", cmd};
    ValueArg<std::string> input_file{
        "i", "input-file", "File containing the tree to build (instead of <input>).", false, "",
        "string", cmd};
    ValueArg<format_t> format{"f", "format",
        "Input format: level_order, pre_order, post_order or parenthesis (detected if omitted).",
        false, tree_format::none, "format", cmd};
    MultiArg<int> null_markers{"n", "null-marker",
        "Null marker for level-order input (repeatable; default -1 and -999).", false, "int", cmd};
    SwitchArg strict{"s", "strict", "Fail if some input value does not end up in the tree.", cmd};
    SwitchArg verbose{"v", "verbose", "Debug-level logging.", cmd};

    // command-line input or the contents of --input-file
    std::string input_text() {
        if (input_file.getValue() == "") { return input.getValue(); }
        if (input.getValue() != "") {
            WARNING("Both <input> and --input-file given; using {}.", input_file.getValue());
        }
        std::ifstream is{input_file.getValue()};
        if (not is) { FAIL("Could not open input file '{}'.", input_file.getValue()); }
        std::stringstream ss;
        ss << is.rdbuf();
        return ss.str();
    }

    BuildOptions build_options() {
        BuildOptions options;
        if (not null_markers.getValue().empty()) {
            options.null_markers =
                std::set<int>(null_markers.getValue().begin(), null_markers.getValue().end());
        }
        options.strict = strict.getValue();
        return options;
    }
};
