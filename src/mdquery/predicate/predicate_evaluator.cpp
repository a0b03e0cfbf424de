#include "mdquery/predicate/predicate_evaluator.hpp"

#include <utf8.h>

#include <iterator>
#include <optional>

namespace mdquery {

namespace {

struct BaseLetter {
  char32_t letter;  // lowercase base letter, 0 when there is none
  bool upper;
};

// Latin-1 supplement and Latin Extended-A letters to their ASCII base.
BaseLetter base_letter(char32_t cp) {
  if (cp >= 0xC0 && cp <= 0xFF) {
    static const char kLatin1[] =
        "aaaaaa\0ceeeeiiii"   // C0-CF
        "dnooooo\0ouuuuy\0\0"  // D0-DF
        "aaaaaa\0ceeeeiiii"   // E0-EF
        "dnooooo\0ouuuuy\0y";  // F0-FF
    char base = kLatin1[cp - 0xC0];
    if (base == '\0') return {0, false};
    return {static_cast<char32_t>(base), cp < 0xE0};
  }
  if (cp >= 0x100 && cp <= 0x17F) {
    struct Range {
      char32_t first;
      char32_t last;
      char base;
    };
    static const Range kRanges[] = {
        {0x100, 0x105, 'a'}, {0x106, 0x10D, 'c'}, {0x10E, 0x111, 'd'}, {0x112, 0x11B, 'e'},
        {0x11C, 0x123, 'g'}, {0x124, 0x127, 'h'}, {0x128, 0x131, 'i'}, {0x134, 0x135, 'j'},
        {0x136, 0x137, 'k'}, {0x139, 0x142, 'l'}, {0x143, 0x148, 'n'}, {0x14C, 0x151, 'o'},
        {0x154, 0x159, 'r'}, {0x15A, 0x161, 's'}, {0x162, 0x167, 't'}, {0x168, 0x173, 'u'},
        {0x174, 0x175, 'w'}, {0x176, 0x178, 'y'}, {0x179, 0x17E, 'z'},
    };
    for (const auto& r : kRanges) {
      if (cp >= r.first && cp <= r.last) {
        bool upper;
        if (cp == 0x130 || cp == 0x178) {
          upper = true;
        } else if (cp == 0x131) {
          upper = false;
        } else if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
          upper = (cp % 2) == 1;
        } else {
          upper = (cp % 2) == 0;
        }
        return {static_cast<char32_t>(r.base), upper};
      }
    }
  }
  return {0, false};
}

char32_t fold_case(char32_t cp) {
  if (cp >= 'A' && cp <= 'Z') return cp + 32;
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 32;
  if (cp >= 0x100 && cp <= 0x17F) {
    BaseLetter b = base_letter(cp);
    if (b.letter != 0 && b.upper && cp != 0x130 && cp != 0x178) return cp + 1;
  }
  return cp;
}

std::u32string fold(const std::string& text, const StringMatchOptions& options) {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
  std::u32string decoded;
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(decoded));

  for (auto& cp : decoded) {
    if (!options.diacritic_sensitive) {
      BaseLetter b = base_letter(cp);
      if (b.letter != 0) {
        cp = b.upper ? b.letter - 32 : b.letter;
      }
    }
    if (!options.case_sensitive) {
      cp = fold_case(cp);
    }
  }
  return decoded;
}

bool is_word_char(char32_t cp) {
  if (cp < 0x80) {
    return (cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
  }
  return true;
}

bool is_word_start(const std::u32string& s, size_t pos) {
  return pos == 0 || !is_word_char(s[pos - 1]);
}

bool is_word_end(const std::u32string& s, size_t pos) {
  return pos >= s.size() || !is_word_char(s[pos]);
}

bool match_folded(const std::u32string& c, const std::u32string& n, ComparisonOp op,
                  bool word_based) {
  if (n.size() > c.size()) return false;
  if (!word_based) {
    switch (op) {
      case ComparisonOp::Equal:
        return c == n;
      case ComparisonOp::Contains:
        return c.find(n) != std::u32string::npos;
      case ComparisonOp::BeginsWith:
        return c.compare(0, n.size(), n) == 0;
      case ComparisonOp::EndsWith:
        return c.compare(c.size() - n.size(), n.size(), n) == 0;
      default:
        return false;
    }
  }
  for (size_t pos = c.find(n); pos != std::u32string::npos; pos = c.find(n, pos + 1)) {
    bool starts = is_word_start(c, pos);
    bool ends = is_word_end(c, pos + n.size());
    switch (op) {
      case ComparisonOp::Equal:
        if (starts && ends) return true;
        break;
      case ComparisonOp::Contains:
      case ComparisonOp::BeginsWith:
        if (starts) return true;
        break;
      case ComparisonOp::EndsWith:
        if (ends) return true;
        break;
      default:
        return false;
    }
  }
  return false;
}

std::optional<double> as_number(const AttributeValue& v) {
  if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
  if (const auto* d = std::get_if<double>(&v)) return *d;
  if (const auto* b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
  return std::nullopt;
}

// -1 / 0 / 1, or nullopt when the kinds are not comparable.
std::optional<int> three_way(const AttributeValue& actual, const AttributeValue& expected) {
  const auto* ai = std::get_if<std::int64_t>(&actual);
  const auto* ei = std::get_if<std::int64_t>(&expected);
  if (ai && ei) {
    return *ai < *ei ? -1 : (*ai > *ei ? 1 : 0);
  }
  auto an = as_number(actual);
  auto en = as_number(expected);
  if (an && en) {
    return *an < *en ? -1 : (*an > *en ? 1 : 0);
  }
  const auto* at = std::get_if<TimePoint>(&actual);
  const auto* et = std::get_if<TimePoint>(&expected);
  if (at && et) {
    return *at < *et ? -1 : (*at > *et ? 1 : 0);
  }
  const auto* as = std::get_if<std::string>(&actual);
  const auto* es = std::get_if<std::string>(&expected);
  if (as && es) {
    int r = as->compare(*es);
    return r < 0 ? -1 : (r > 0 ? 1 : 0);
  }
  return std::nullopt;
}

bool compare_scalar(const AttributeValue& actual, const Comparison& c) {
  const auto* as = std::get_if<std::string>(&actual);
  const auto* es = std::get_if<std::string>(&c.value);
  if (as && es) {
    switch (c.op) {
      case ComparisonOp::Equal:
      case ComparisonOp::Contains:
      case ComparisonOp::BeginsWith:
      case ComparisonOp::EndsWith:
        return match_string(*as, *es, c.op, c.options);
      case ComparisonOp::NotEqual:
        return !match_string(*as, *es, ComparisonOp::Equal, c.options);
      default:
        break;
    }
  }

  auto order = three_way(actual, c.value);
  if (!order) {
    return c.op == ComparisonOp::NotEqual;
  }
  switch (c.op) {
    case ComparisonOp::Equal:
      return *order == 0;
    case ComparisonOp::NotEqual:
      return *order != 0;
    case ComparisonOp::Less:
      return *order < 0;
    case ComparisonOp::LessOrEqual:
      return *order <= 0;
    case ComparisonOp::Greater:
      return *order > 0;
    case ComparisonOp::GreaterOrEqual:
      return *order >= 0;
    default:
      return false;
  }
}

bool compare_value(const AttributeValue& actual, const Comparison& c) {
  if (const auto* list = std::get_if<std::vector<std::string>>(&actual)) {
    if (c.op == ComparisonOp::NotEqual) {
      Comparison equal = c;
      equal.op = ComparisonOp::Equal;
      for (const auto& element : *list) {
        if (compare_scalar(element, equal)) return false;
      }
      return true;
    }
    for (const auto& element : *list) {
      if (compare_scalar(element, c)) return true;
    }
    return false;
  }
  return compare_scalar(actual, c);
}

bool evaluate_any_text(const Comparison& c, const AttributeValues& values) {
  Comparison per_value = c;
  if (c.op == ComparisonOp::NotEqual) per_value.op = ComparisonOp::Equal;
  bool any = false;
  for (const auto& [key, value] : values) {
    if (std::holds_alternative<std::string>(value) ||
        std::holds_alternative<std::vector<std::string>>(value)) {
      if (compare_value(value, per_value)) {
        any = true;
        break;
      }
    }
  }
  return c.op == ComparisonOp::NotEqual ? !any : any;
}

bool evaluate_extension(const Comparison& c, const AttributeValues& values) {
  auto it = values.find(keys::kFileName);
  const std::string* name = it == values.end() ? nullptr : std::get_if<std::string>(&it->second);
  if (c.op == ComparisonOp::Exists) {
    // A dot after the first character; dotfiles have no extension.
    return name && name->size() > 1 && name->find('.', 1) != std::string::npos;
  }
  const auto* extension = std::get_if<std::string>(&c.value);
  if (!name || !extension) {
    return c.op == ComparisonOp::NotEqual;
  }
  bool match = match_string(*name, "." + *extension, ComparisonOp::EndsWith, StringMatchOptions{});
  return c.op == ComparisonOp::NotEqual ? !match : match;
}

bool evaluate_comparison(const Comparison& c, const AttributeValues& values) {
  if (c.attribute == AttributeId::AnyText) {
    return evaluate_any_text(c, values);
  }
  if (c.attribute == AttributeId::FileExtension) {
    return evaluate_extension(c, values);
  }
  const std::string& key = AttributeCatalog::get_instance().primary_key(c.attribute);
  auto it = values.find(key);
  if (it == values.end() || is_null(it->second)) {
    return c.op == ComparisonOp::NotEqual;
  }
  if (c.op == ComparisonOp::Exists) {
    return true;
  }
  return compare_value(it->second, c);
}

bool evaluate_between(const Between& b, const AttributeValues& values) {
  const std::string& key = AttributeCatalog::get_instance().primary_key(b.attribute);
  auto it = values.find(key);
  if (it == values.end()) {
    return false;
  }
  auto low = three_way(it->second, b.low);
  auto high = three_way(it->second, b.high);
  if (!low || !high) {
    return false;
  }
  return *low >= 0 && (b.upper_inclusive ? *high <= 0 : *high < 0);
}

bool evaluate_node(const PredicateNodePtr& node, const AttributeValues& values) {
  if (const auto* c = std::get_if<Comparison>(&node->node)) {
    return evaluate_comparison(*c, values);
  }
  if (const auto* b = std::get_if<Between>(&node->node)) {
    return evaluate_between(*b, values);
  }
  if (const auto* a = std::get_if<And>(&node->node)) {
    for (const auto& child : a->children) {
      if (!evaluate_node(child, values)) return false;
    }
    return true;
  }
  if (const auto* o = std::get_if<Or>(&node->node)) {
    for (const auto& child : o->children) {
      if (evaluate_node(child, values)) return true;
    }
    return false;
  }
  return !evaluate_node(std::get<Not>(node->node).child, values);
}

}  // namespace

bool match_string(const std::string& candidate, const std::string& needle, ComparisonOp op,
                  const StringMatchOptions& options) {
  return match_folded(fold(candidate, options), fold(needle, options), op, options.word_based);
}

bool evaluate_predicate(const Predicate& predicate, const AttributeValues& values) {
  if (predicate.empty()) {
    return true;
  }
  return evaluate_node(predicate.root(), values);
}

}  // namespace mdquery
