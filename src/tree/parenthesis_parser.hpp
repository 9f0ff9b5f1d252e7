#pragma once

#include <string>
#include "node.hpp"

/*==================================================================================================
  Parser for the parenthesized notation:
      node := integer [ '(' [node] ')' [ '(' [node] ')' ] ]
  e.g. "1(2(4)(5))(3(6)(7))". The first group is the left subtree, the second the right subtree;
  an empty group "()" stands for an absent subtree ("1()(3)": right child only). Whitespace
  between tokens is ignored. Malformed text throws ParenthesisParseException.
==================================================================================================*/
class ParenthesisParser {
    std::string input;
    std::string::const_iterator it;

    [[noreturn]] void error(const std::string& s) const;
    std::string next_char() const;  // for error messages
    void skip_spaces();
    bool at(char c) const { return it != input.end() and *it == c; }

    int value();
    IntTree node();
    IntTree group();

  public:
    explicit ParenthesisParser(std::string text);

    // empty (or blank) text gives the empty tree
    IntTree parse();
};

inline IntTree build_from_parenthesis(const std::string& text) {
    return ParenthesisParser(text).parse();
}
