#pragma once

#include <stdexcept>
#include <string>

/*================================================================================================*/
struct TreeBuildException : public std::runtime_error {
    TreeBuildException(std::string s = "") : std::runtime_error(s) {}
};

// explicit format name not recognized, or not applicable to the given input
struct UnsupportedFormatException : public TreeBuildException {
    UnsupportedFormatException(std::string s = "") : TreeBuildException(s) {}
};

// in-order alone never determines the shape of a tree
struct InsufficientInformationException : public TreeBuildException {
    InsufficientInformationException(std::string s = "") : TreeBuildException(s) {}
};

struct ParenthesisParseException : public TreeBuildException {
    ParenthesisParseException(std::string s = "") : TreeBuildException(s) {}
};

struct ValueListParseException : public TreeBuildException {
    ValueListParseException(std::string s = "") : TreeBuildException(s) {}
};

// strict mode: reconstructed node count differs from what the input describes
struct StrictValidationException : public TreeBuildException {
    StrictValidationException(std::string s = "") : TreeBuildException(s) {}
};
