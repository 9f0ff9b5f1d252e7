#include "dispatch.hpp"
#include "builders.hpp"
#include "errors.hpp"
#include "global/logging.hpp"
#include "parenthesis_parser.hpp"
#include "value_list.hpp"

namespace {
    [[noreturn]] void reject_in_order() {
        throw InsufficientInformationException(
            "Insufficient information: in-order traversal alone does not determine the shape of a "
            "tree (a pre-order or post-order traversal is also needed).");
    }

    IntTree build_from_values(
        const std::vector<int>& values, format_t format, const BuildOptions& options) {
        switch (format) {
            case tree_format::none: return nullptr;
            case tree_format::level_order: return build_from_level_order(values, options);
            case tree_format::pre_order: return build_from_pre_order(values, options);
            case tree_format::post_order: return build_from_post_order(values, options);
            case tree_format::in_order: reject_in_order();
            case tree_format::parenthesis:
                throw UnsupportedFormatException(
                    "Unsupported construction method: parenthesis (requires parenthesized text, "
                    "got a value sequence)");
            default:
                throw UnsupportedFormatException(
                    "Unsupported construction method: " + format_name(format));
        }
    }
}  // namespace

format_t resolve_format(
    const std::vector<int>& values, format_t format, const std::set<int>& null_markers) {
    return format == tree_format::none ? detect_format(values, null_markers) : format;
}

format_t resolve_format(
    const std::string& text, format_t format, const std::set<int>& null_markers) {
    return format == tree_format::none ? detect_format(text, null_markers) : format;
}

IntTree build_tree(const std::vector<int>& values, format_t format, const BuildOptions& options) {
    auto resolved = resolve_format(values, format, options.null_markers);
    tree_logger()->debug(
        "Building tree from {} values as {}.", values.size(), format_name(resolved));
    return build_from_values(values, resolved, options);
}

IntTree build_tree(const std::string& text, format_t format, const BuildOptions& options) {
    auto resolved = resolve_format(text, format, options.null_markers);
    tree_logger()->debug("Building tree from text as {}.", format_name(resolved));
    switch (resolved) {
        case tree_format::parenthesis: return build_from_parenthesis(text);
        case tree_format::in_order: reject_in_order();
        case tree_format::unknown:
            throw UnsupportedFormatException(
                "Unsupported construction method: could not detect the format of the input.");
        default: return build_from_values(read_value_list(text), resolved, options);
    }
}

IntTree build_tree(
    const std::vector<int>& values, const std::string& name, const BuildOptions& options) {
    return build_tree(values, format_from_name(name), options);
}

IntTree build_tree(
    const std::string& text, const std::string& name, const BuildOptions& options) {
    return build_tree(text, format_from_name(name), options);
}
