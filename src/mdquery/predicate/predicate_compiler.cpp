#include "mdquery/predicate/predicate_compiler.hpp"

#include <iomanip>
#include <sstream>

namespace mdquery {

namespace {

std::string compile_node(const PredicateNodePtr& node);

std::string quoted(const std::string& pattern, const StringMatchOptions& options) {
  return "\"" + pattern + "\"" + options.modifier_suffix();
}

std::string compile_comparison(const Comparison& c) {
  const auto& catalog = AttributeCatalog::get_instance();
  const std::string& key = catalog.primary_key(c.attribute);

  if (c.op == ComparisonOp::Exists) {
    // An extension exists when the file name has a suffix.
    if (c.attribute == AttributeId::FileExtension) {
      return std::string(keys::kFileName) + " == \"*.*\"";
    }
    return key + " == \"*\"";
  }

  // The index has no extension key; match the file name suffix instead.
  if (c.attribute == AttributeId::FileExtension) {
    const auto* extension = std::get_if<std::string>(&c.value);
    std::string pattern = "*." + (extension ? escape_query_string(*extension) : std::string());
    const char* op = c.op == ComparisonOp::NotEqual ? " != " : " == ";
    return std::string(keys::kFileName) + op + quoted(pattern, StringMatchOptions{});
  }

  if (const auto* text = std::get_if<std::string>(&c.value)) {
    std::string escaped = escape_query_string(*text);
    switch (c.op) {
      case ComparisonOp::Contains:
        return key + " == " + quoted("*" + escaped + "*", c.options);
      case ComparisonOp::BeginsWith:
        return key + " == " + quoted(escaped + "*", c.options);
      case ComparisonOp::EndsWith:
        return key + " == " + quoted("*" + escaped, c.options);
      default:
        return key + " " + to_string(c.op) + " " + quoted(escaped, c.options);
    }
  }

  return key + " " + to_string(c.op) + " " + format_query_value(c.value);
}

std::string compile_between(const Between& b) {
  const std::string& key = AttributeCatalog::get_instance().primary_key(b.attribute);
  return "(" + key + " >= " + format_query_value(b.low) + " && " + key +
         (b.upper_inclusive ? " <= " : " < ") + format_query_value(b.high) + ")";
}

std::string join_children(const std::vector<PredicateNodePtr>& children, const char* glue) {
  if (children.size() == 1) {
    return compile_node(children.front());
  }
  std::string out = "(";
  for (size_t i = 0; i < children.size(); ++i) {
    if (i > 0) out += glue;
    out += compile_node(children[i]);
  }
  out += ")";
  return out;
}

std::string compile_node(const PredicateNodePtr& node) {
  if (const auto* c = std::get_if<Comparison>(&node->node)) {
    return compile_comparison(*c);
  }
  if (const auto* b = std::get_if<Between>(&node->node)) {
    return compile_between(*b);
  }
  if (const auto* a = std::get_if<And>(&node->node)) {
    return join_children(a->children, " && ");
  }
  if (const auto* o = std::get_if<Or>(&node->node)) {
    return join_children(o->children, " || ");
  }
  const auto& n = std::get<Not>(node->node);
  return "!(" + compile_node(n.child) + ")";
}

}  // namespace

std::string escape_query_string(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    if (ch == '"' || ch == '\\' || ch == '*') {
      out += '\\';
    }
    out += ch;
  }
  return out;
}

std::string format_query_value(const AttributeValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return "\"" + escape_query_string(*s) + "\"";
  }
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    std::ostringstream ss;
    ss << std::setprecision(15) << *d;
    return ss.str();
  }
  if (const auto* b = std::get_if<bool>(&value)) {
    return *b ? "1" : "0";
  }
  if (const auto* t = std::get_if<TimePoint>(&value)) {
    return "$time.iso(" + format_iso8601(*t) + ")";
  }
  if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
    std::string out = "(";
    for (size_t i = 0; i < list->size(); ++i) {
      if (i > 0) out += ", ";
      out += "\"" + escape_query_string((*list)[i]) + "\"";
    }
    return out + ")";
  }
  return "\"*\"";
}

CompiledPredicate compile_predicate(const Predicate& predicate) {
  CompiledPredicate compiled;
  if (predicate.empty()) {
    compiled.query = kMatchAllItemsQuery;
    compiled.referenced_attributes.insert(AttributeId::ContentTypeTree);
    return compiled;
  }
  compiled.query = compile_node(predicate.root());
  compiled.referenced_attributes = predicate.referenced_attributes();
  return compiled;
}

}  // namespace mdquery
