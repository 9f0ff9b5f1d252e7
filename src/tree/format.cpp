#include "format.hpp"
#include <algorithm>
#include <cctype>
#include "errors.hpp"
#include "global/logging.hpp"
#include "value_list.hpp"

namespace tree_format {
    std::ostream& operator<<(std::ostream& os, const format_t& f) {
        os << format_name(f);
        return os;
    }

    std::istream& operator>>(std::istream& is, format_t& f) {
        std::string input;
        is >> input;
        f = format_from_name(input);
        return is;
    }
}  // namespace tree_format

format_t format_from_name(const std::string& name) {
    if (name == "level_order") {
        return tree_format::level_order;
    } else if (name == "pre_order") {
        return tree_format::pre_order;
    } else if (name == "post_order") {
        return tree_format::post_order;
    } else if (name == "in_order") {
        return tree_format::in_order;
    } else if (name == "parenthesis") {
        return tree_format::parenthesis;
    } else {
        throw UnsupportedFormatException("Unsupported construction method: " + name);
    }
}

std::string format_name(format_t format) {
    switch (format) {
        case tree_format::none: return "none";
        case tree_format::level_order: return "level_order";
        case tree_format::pre_order: return "pre_order";
        case tree_format::post_order: return "post_order";
        case tree_format::in_order: return "in_order";
        case tree_format::parenthesis: return "parenthesis";
        default: return "unknown";
    }
}

format_t detect_format(const std::vector<int>& values, const std::set<int>& null_markers) {
    if (values.empty()) { return tree_format::none; }
    bool has_marker = std::any_of(values.begin(), values.end(),
        [&null_markers](int v) { return null_markers.count(v) != 0; });
    return has_marker ? tree_format::level_order : tree_format::pre_order;
}

format_t detect_format(const std::string& text, const std::set<int>& null_markers) {
    auto blank = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    if (std::all_of(text.begin(), text.end(), blank)) { return tree_format::none; }
    if (text.find_first_of("()") != std::string::npos) { return tree_format::parenthesis; }

    std::vector<int> values;
    try {
        values = read_value_list(text);
    } catch (const ValueListParseException& e) {
        tree_logger()->debug("Input is neither parenthesized nor a value list: {}", e.what());
        return tree_format::unknown;
    }
    return detect_format(values, null_markers);
}
