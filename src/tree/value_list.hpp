#pragma once

#include <string>
#include <vector>

// Reads integers separated by whitespace and/or commas, optionally wrapped in one pair of square
// brackets ("[3, 1, 2, -1]" or "3 1 2 -1"). The words null and None stand for -1.
// Throws ValueListParseException on anything else.
std::vector<int> read_value_list(const std::string& text);

// "[3, 1, 2]"
std::string format_values(const std::vector<int>& values);
