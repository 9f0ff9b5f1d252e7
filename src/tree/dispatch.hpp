#pragma once

#include <set>
#include <string>
#include <vector>
#include "format.hpp"
#include "node.hpp"
#include "options.hpp"

/*==================================================================================================
  Tree construction entry points. The format is either given explicitly or detected (see
  detect_format); the matching reconstruction algorithm is then run.
  Failures are reported by exceptions deriving from TreeBuildException:
    - UnsupportedFormatException: unknown format name, undetectable input, or a format that does
      not apply to the input (parenthesis for a value sequence)
    - InsufficientInformationException: in_order
    - ParenthesisParseException, ValueListParseException: malformed text
    - StrictValidationException: strict mode node-count mismatch
  No partial tree is ever returned.
==================================================================================================*/

// format == none means "detect"
IntTree build_tree(const std::vector<int>& values, format_t format = tree_format::none,
    const BuildOptions& options = BuildOptions());

IntTree build_tree(const std::string& text, format_t format = tree_format::none,
    const BuildOptions& options = BuildOptions());

// format given by name (e.g. from the command line); an unrecognized name fails with
// "Unsupported construction method"
IntTree build_tree(const std::vector<int>& values, const std::string& name,
    const BuildOptions& options = BuildOptions());

IntTree build_tree(const std::string& text, const std::string& name,
    const BuildOptions& options = BuildOptions());

// The format build_tree would use for this input (explicit format if any, else detection with
// the given null markers; build_tree passes options.null_markers).
format_t resolve_format(const std::vector<int>& values, format_t format = tree_format::none,
    const std::set<int>& null_markers = default_null_markers);
format_t resolve_format(const std::string& text, format_t format = tree_format::none,
    const std::set<int>& null_markers = default_null_markers);
