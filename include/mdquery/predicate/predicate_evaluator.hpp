#pragma once

#include <string>

#include "mdquery/predicate/predicate.hpp"

namespace mdquery {

/**
 * Evaluates a predicate tree against an item's fetched values (keyed by
 * backend key), with the same semantics the compiled query string has:
 *
 *  - string options fold case (ASCII and Latin-1) and diacritics
 *  - list values match when any element matches; != holds only when no
 *    element is equal
 *  - a missing value fails every comparison except !=
 *  - file extension comparisons test the file name suffix
 *
 * An empty predicate matches every item.
 */
bool evaluate_predicate(const Predicate& predicate, const AttributeValues& values);

// String comparison under the given options. Supports Equal, Contains,
// BeginsWith and EndsWith; word-based matching anchors the needle at word
// boundaries.
bool match_string(const std::string& candidate, const std::string& needle, ComparisonOp op,
                  const StringMatchOptions& options);

}  // namespace mdquery
