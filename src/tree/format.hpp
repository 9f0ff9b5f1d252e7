#pragma once

#include <iostream>
#include <set>
#include <string>
#include <vector>
#include "options.hpp"

namespace tree_format {
    // none: empty input (empty tree); unknown: the detector could not make sense of the input
    enum format_t { none, level_order, pre_order, post_order, in_order, parenthesis, unknown };

    std::ostream& operator<<(std::ostream& os, const format_t& f);

    // reads a format name; throws UnsupportedFormatException on anything else
    std::istream& operator>>(std::istream& is, format_t& f);

}  // namespace tree_format

using tree_format::format_t;

// "level_order" -> level_order, etc.; throws UnsupportedFormatException for unknown names
format_t format_from_name(const std::string& name);
std::string format_name(format_t format);

/*==================================================================================================
  Format detection (first match wins):
    1. empty input                                  -> none
    2. value sequence holding a null marker         -> level_order
    3. text holding '(' or ')'                      -> parenthesis
    4. anything else                                -> pre_order
  Rule 4 is a heuristic: a flat list without markers is assumed to be pre-order, which silently
  mis-decodes post-order or in-order data. Pass the format explicitly for those.
  Null markers default to -1 and -999; callers with their own marker set pass it along.
==================================================================================================*/
format_t detect_format(const std::vector<int>& values,
    const std::set<int>& null_markers = default_null_markers);

// Text without parentheses is read as a value list and classified with rules 2 and 4; text that
// is not a readable value list is reported as unknown.
format_t detect_format(
    const std::string& text, const std::set<int>& null_markers = default_null_markers);
