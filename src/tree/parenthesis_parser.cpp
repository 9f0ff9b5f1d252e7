#include "parenthesis_parser.hpp"
#include <cctype>
#include <climits>
#include <iterator>
#include <sstream>
#include "errors.hpp"
#include "global/logging.hpp"

using scit = std::string::const_iterator;

ParenthesisParser::ParenthesisParser(std::string text) : input(std::move(text)) {
    it = input.begin();
}

void ParenthesisParser::error(const std::string& s) const {
    auto position = std::distance(scit(input.begin()), it);
    bool at_begining = position <= 15;
    bool at_end = std::distance(it, scit(input.end())) <= 15;
    scit excerpt_begin = at_begining ? scit(input.begin()) : it - 15;
    scit excerpt_end = at_end ? scit(input.end()) : it + 15;

    std::stringstream ss;
    ss << s;
    ss << "Error at position " << position << ":\n";
    ss << "\t" << (at_begining ? "" : "...") << std::string(excerpt_begin, excerpt_end)
       << (at_end ? "" : "...") << "\n";
    ss << "\t" << (at_begining ? "" : "   ") << std::string(at_begining ? position : 15, ' ')
       << "^\n";
    throw ParenthesisParseException(ss.str());
}

std::string ParenthesisParser::next_char() const {
    return it == input.end() ? std::string("end of input") : "'" + std::string(1, *it) + "'";
}

void ParenthesisParser::skip_spaces() {
    while (it != input.end() and std::isspace(static_cast<unsigned char>(*it))) { it++; }
}

int ParenthesisParser::value() {
    skip_spaces();
    scit start = it;
    bool negative = at('-');
    if (negative) { it++; }
    if (it == input.end() or not std::isdigit(static_cast<unsigned char>(*it))) {
        error("Error: expected an integer node value but got " + next_char() + ".\n");
    }
    long long result = 0;
    while (it != input.end() and std::isdigit(static_cast<unsigned char>(*it))) {
        result = result * 10 + (*it - '0');
        if (result > static_cast<long long>(INT_MAX) + 1) {
            it = start;
            error("Error: node value does not fit in an int.\n");
        }
        it++;
    }
    if (negative) { result = -result; }
    if (result > INT_MAX) {
        it = start;
        error("Error: node value does not fit in an int.\n");
    }
    return static_cast<int>(result);
}

// '(' [node] ')'; the opening parenthesis has already been checked
IntTree ParenthesisParser::group() {
    it++;
    skip_spaces();
    IntTree subtree;
    if (not at(')')) { subtree = node(); }
    skip_spaces();
    if (not at(')')) {
        error("Error: expected ')' to close subtree but got " + next_char() + ".\n");
    }
    it++;
    return subtree;
}

IntTree ParenthesisParser::node() {
    auto result = make_node(value());
    skip_spaces();
    if (at('(')) {
        result->left = group();
        skip_spaces();
        if (at('(')) { result->right = group(); }
    }
    return result;
}

IntTree ParenthesisParser::parse() {
    it = input.begin();
    skip_spaces();
    if (it == input.end()) { return nullptr; }

    auto tree = node();
    skip_spaces();
    if (it != input.end()) {
        if (at('(')) {
            error("Error: a node has at most two parenthesized subtrees.\n");
        } else if (at(')')) {
            error("Error: unbalanced ')' after tree expression.\n");
        } else {
            error("Error: unexpected trailing text after tree expression.\n");
        }
    }
    tree_logger()->debug("Parsed parenthesized tree of {} characters.", input.size());
    return tree;
}
