#include "value_list.hpp"
#include <cctype>
#include <climits>
#include <sstream>
#include "errors.hpp"

namespace {
    bool is_separator(char c) { return std::isspace(static_cast<unsigned char>(c)) or c == ','; }

    int read_token(const std::string& token, size_t position) {
        if (token == "null" or token == "None") { return -1; }

        auto fail = [&token, position](std::string msg) {
            throw ValueListParseException("Error: invalid value '" + token + "' at position " +
                                          std::to_string(position) + ": " + msg);
        };

        size_t first_digit = (token[0] == '-' or token[0] == '+') ? 1 : 0;
        if (first_digit == token.size()) { fail("expected digits"); }
        for (size_t i = first_digit; i < token.size(); i++) {
            if (not std::isdigit(static_cast<unsigned char>(token[i]))) {
                fail("expected an integer");
            }
        }
        long long value = 0;
        try {
            value = std::stoll(token);
        } catch (const std::out_of_range&) { fail("integer out of range"); }
        if (value < INT_MIN or value > INT_MAX) { fail("integer out of range"); }
        return static_cast<int>(value);
    }
}  // namespace

std::vector<int> read_value_list(const std::string& text) {
    size_t begin = 0, end = text.size();
    while (begin < end and std::isspace(static_cast<unsigned char>(text[begin]))) { begin++; }
    while (end > begin and std::isspace(static_cast<unsigned char>(text[end - 1]))) { end--; }

    // optional brackets
    bool opening = begin < end and text[begin] == '[';
    bool closing = end > begin and text[end - 1] == ']';
    if (opening != closing or (opening and end - begin == 1)) {
        throw ValueListParseException("Error: unbalanced square brackets in value list.");
    }
    if (opening) {
        begin++;
        end--;
    }

    std::vector<int> result;
    size_t i = begin;
    while (i < end) {
        if (is_separator(text[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < end and not is_separator(text[i])) { i++; }
        result.push_back(read_token(text.substr(start, i - start), start));
    }
    return result;
}

std::string format_values(const std::vector<int>& values) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < values.size(); i++) { ss << (i == 0 ? "" : ", ") << values[i]; }
    ss << "]";
    return ss.str();
}
