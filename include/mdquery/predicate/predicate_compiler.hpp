#pragma once

#include <set>
#include <string>

#include "mdquery/predicate/predicate.hpp"

namespace mdquery {

// Query the backend runs when no predicate is set: every item.
inline constexpr const char* kMatchAllItemsQuery = "kMDItemContentTypeTree == \"public.item\"";

struct CompiledPredicate {
  std::string query;
  std::set<AttributeId> referenced_attributes;
};

/**
 * Compiles a predicate tree to the backend's query string syntax, e.g.
 *   (kMDItemFSName == "*report*"cd && kMDItemFSSize >= 1000000)
 *
 * Pure and deterministic: the same tree always yields the same string.
 */
CompiledPredicate compile_predicate(const Predicate& predicate);

// Escapes '"', '\' and '*' so user text is matched literally.
std::string escape_query_string(const std::string& value);

// Literal form of a value inside a query: quoted strings, $time.iso(...)
// for dates, 1/0 for booleans.
std::string format_query_value(const AttributeValue& value);

}  // namespace mdquery
