#include "mdquery/predicate/predicate.hpp"

namespace mdquery {

namespace {

PredicateNodePtr make_node(PredicateNode node) {
  return std::make_shared<const PredicateNode>(std::move(node));
}

void collect_attributes(const PredicateNodePtr& node, std::set<AttributeId>& out) {
  if (!node) return;
  if (const auto* c = std::get_if<Comparison>(&node->node)) {
    out.insert(c->attribute);
  } else if (const auto* b = std::get_if<Between>(&node->node)) {
    out.insert(b->attribute);
  } else if (const auto* a = std::get_if<And>(&node->node)) {
    for (const auto& child : a->children) collect_attributes(child, out);
  } else if (const auto* o = std::get_if<Or>(&node->node)) {
    for (const auto& child : o->children) collect_attributes(child, out);
  } else if (const auto* n = std::get_if<Not>(&node->node)) {
    collect_attributes(n->child, out);
  }
}

// Flattens nested connectives of the same kind: (a && b) && c -> (a && b && c)
template <typename Connective>
void append_flattened(std::vector<PredicateNodePtr>& children, const PredicateNodePtr& node) {
  if (const auto* same = std::get_if<Connective>(&node->node)) {
    children.insert(children.end(), same->children.begin(), same->children.end());
  } else {
    children.push_back(node);
  }
}

template <typename Connective>
Predicate combine(const std::vector<Predicate>& predicates) {
  std::vector<PredicateNodePtr> children;
  for (const auto& p : predicates) {
    if (p.empty()) continue;
    append_flattened<Connective>(children, p.root());
  }
  if (children.empty()) {
    return Predicate();
  }
  if (children.size() == 1) {
    return Predicate(children.front());
  }
  return Predicate(make_node(PredicateNode{Connective{std::move(children)}}));
}

}  // namespace

std::string StringMatchOptions::modifier_suffix() const {
  std::string suffix;
  if (!case_sensitive) suffix += 'c';
  if (!diacritic_sensitive) suffix += 'd';
  if (word_based) suffix += 'w';
  return suffix;
}

std::string to_string(ComparisonOp op) {
  switch (op) {
    case ComparisonOp::Equal:
      return "==";
    case ComparisonOp::NotEqual:
      return "!=";
    case ComparisonOp::Less:
      return "<";
    case ComparisonOp::LessOrEqual:
      return "<=";
    case ComparisonOp::Greater:
      return ">";
    case ComparisonOp::GreaterOrEqual:
      return ">=";
    case ComparisonOp::Contains:
      return "contains";
    case ComparisonOp::BeginsWith:
      return "begins_with";
    case ComparisonOp::EndsWith:
      return "ends_with";
    case ComparisonOp::Exists:
      return "exists";
    default:
      return "?";
  }
}

Predicate Predicate::comparison(Comparison comparison) {
  return Predicate(make_node(PredicateNode{std::move(comparison)}));
}

Predicate Predicate::between(Between between) {
  return Predicate(make_node(PredicateNode{std::move(between)}));
}

Predicate Predicate::and_(const Predicate& other) const {
  return combine<And>({*this, other});
}

Predicate Predicate::or_(const Predicate& other) const {
  return combine<Or>({*this, other});
}

Predicate Predicate::not_() const {
  if (empty()) {
    throw PredicateError("Cannot negate an empty predicate");
  }
  // !!a -> a
  if (const auto* inner = std::get_if<Not>(&root_->node)) {
    return Predicate(inner->child);
  }
  return Predicate(make_node(PredicateNode{Not{root_}}));
}

std::set<AttributeId> Predicate::referenced_attributes() const {
  std::set<AttributeId> attributes;
  collect_attributes(root_, attributes);
  return attributes;
}

Predicate all_of(const std::vector<Predicate>& predicates) {
  return combine<And>(predicates);
}

Predicate any_of(const std::vector<Predicate>& predicates) {
  return combine<Or>(predicates);
}

}  // namespace mdquery
