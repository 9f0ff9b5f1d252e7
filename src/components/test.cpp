#include "doctest.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include "TreeBuildArgParse.hpp"
#include "tree/errors.hpp"

using namespace std;

// argv-like array backed by a vector of strings
struct FakeArgs {
    vector<string> storage;
    vector<char*> pointers;

    explicit FakeArgs(vector<string> args) : storage(move(args)) {
        for (auto& arg : storage) { pointers.push_back(&arg[0]); }
        pointers.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }
};

TEST_CASE("Command line with an inline tree") {
    FakeArgs fake({"treebuild", "-f", "level_order", "-n", "0", "-n", "7", "--strict", "[1,0,2]"});
    TreeBuildCmdLine cmd{fake.argc(), fake.argv(), "TreeBuild", ' ', "0.1"};
    TreeBuildArgParse args(cmd);
    cmd.parse();

    CHECK(args.format.getValue() == tree_format::level_order);
    CHECK(args.input_text() == "[1,0,2]");
    auto options = args.build_options();
    CHECK(options.null_markers == set<int>{0, 7});
    CHECK(options.strict == true);
    CHECK(options.is_null(-1) == false);
    CHECK(args.verbose.getValue() == false);
}

TEST_CASE("Command line defaults") {
    FakeArgs fake({"treebuild", "1(2)(3)"});
    TreeBuildCmdLine cmd{fake.argc(), fake.argv(), "TreeBuild", ' ', "0.1"};
    TreeBuildArgParse args(cmd);
    cmd.parse();

    CHECK(args.format.getValue() == tree_format::none);
    CHECK(args.input_text() == "1(2)(3)");
    auto options = args.build_options();
    CHECK(options.null_markers == default_null_markers);
    CHECK(options.strict == false);
}

TEST_CASE("Command line reading the tree from a file") {
    string path = "treebuild_cmdline_test_input.txt";
    {
        ofstream os{path};
        os << "1(2(4)(5))(3)\n";
    }
    FakeArgs fake({"treebuild", "-v", "-i", path});
    TreeBuildCmdLine cmd{fake.argc(), fake.argv(), "TreeBuild", ' ', "0.1"};
    TreeBuildArgParse args(cmd);
    cmd.parse();

    CHECK(args.verbose.getValue() == true);
    CHECK(args.input_text() == "1(2(4)(5))(3)\n");
    std::remove(path.c_str());
}

TEST_CASE("Command line format names") {
    FakeArgs in_order({"treebuild", "--format", "in_order", "1 2 3"});
    TreeBuildCmdLine cmd{in_order.argc(), in_order.argv(), "TreeBuild", ' ', "0.1"};
    TreeBuildArgParse args(cmd);
    cmd.parse();
    CHECK(args.format.getValue() == tree_format::in_order);

    FakeArgs zigzag({"treebuild", "-f", "zigzag", "1 2 3"});
    TreeBuildCmdLine bad_cmd{zigzag.argc(), zigzag.argv(), "TreeBuild", ' ', "0.1"};
    TreeBuildArgParse bad_args(bad_cmd);
    CHECK_THROWS_AS(bad_cmd.parse(), UnsupportedFormatException);
}
