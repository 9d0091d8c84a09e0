#include <tocss/naming.hpp>

#include <cstdio>
#include <unordered_set>

namespace tocss {

  namespace {

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

    bool
    is_vendor_prefix(std::string_view segment) {
      return segment == "Moz" || segment == "Webkit" || segment == "Servo";
    }

    // Split off the leading camel-case segment: the first character plus
    // everything up to the next uppercase letter.
    std::string_view
    next_camel_segment(std::string_view& rest) {
      std::size_t end = 1;
      while (end < rest.size() && !is_upper(rest[end]))
        ++end;
      auto segment = rest.substr(0, end);
      rest.remove_prefix(end);
      return segment;
    }

    const std::unordered_set<std::string>&
    cpp_keywords() {
      static const std::unordered_set<std::string> keywords = {
          "alignas",       "alignof",     "and",
          "and_eq",        "asm",         "auto",
          "bitand",        "bitor",       "bool",
          "break",         "case",        "catch",
          "char",          "char8_t",     "char16_t",
          "char32_t",      "class",       "compl",
          "concept",       "const",       "consteval",
          "constexpr",     "constinit",   "const_cast",
          "continue",      "co_await",    "co_return",
          "co_yield",      "decltype",    "default",
          "delete",        "do",          "double",
          "dynamic_cast",  "else",        "enum",
          "explicit",      "export",      "extern",
          "false",         "float",       "for",
          "friend",        "goto",        "if",
          "inline",        "int",         "long",
          "mutable",       "namespace",   "new",
          "noexcept",      "not",         "not_eq",
          "nullptr",       "operator",    "or",
          "or_eq",         "private",     "protected",
          "public",        "register",    "reinterpret_cast",
          "requires",      "return",      "short",
          "signed",        "sizeof",      "static",
          "static_assert", "static_cast", "struct",
          "switch",        "template",    "this",
          "thread_local",  "throw",       "true",
          "try",           "typedef",     "typeid",
          "typename",      "union",       "unsigned",
          "using",         "virtual",     "void",
          "volatile",      "wchar_t",     "while",
          "xor",           "xor_eq",
      };
      return keywords;
    }

  } // namespace

  std::string
  to_css_identifier(std::string_view name) {
    while (!name.empty() && name.back() == '_')
      name.remove_suffix(1);

    std::string result;
    result.reserve(name.size() + 4);

    bool first = true;
    while (!name.empty()) {
      auto segment = next_camel_segment(name);
      if (first && is_vendor_prefix(segment)) first = false;
      if (!first) result += '-';
      first = false;
      for (char c : segment)
        result += to_lower(c);
    }

    return result;
  }

  std::string
  to_snake_case(std::string_view name) {
    if (name.empty()) return {};

    std::string result;
    result.reserve(name.size() + 4);

    for (std::size_t i = 0; i < name.size(); ++i) {
      char c = name[i];

      if (c == '-' || c == '.') {
        result += '_';
        continue;
      }

      if (is_upper(c)) {
        // Word boundary after a lowercase letter ("boxShadow") or at the end
        // of an abbreviation run (the 'P' in "CSSProperty").
        if (!result.empty() && result.back() != '_') {
          bool prev_lower = is_lower(name[i - 1]) || is_digit(name[i - 1]);
          bool prev_upper = is_upper(name[i - 1]);
          bool next_lower = (i + 1 < name.size()) && is_lower(name[i + 1]);

          if (prev_lower || (prev_upper && next_lower)) result += '_';
        }
        result += to_lower(c);
      } else {
        result += c;
      }
    }

    return result;
  }

  std::string
  to_cpp_identifier(std::string_view name) {
    std::string result(name);

    for (auto& c : result) {
      if (c == '-' || c == '.') c = '_';
    }

    if (!result.empty() && is_digit(result[0]))
      result.insert(result.begin(), '_');

    if (cpp_keywords().count(result)) result += '_';

    return result;
  }

  std::string
  cpp_string_literal(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);
    result += '"';
    for (char c : text) {
      switch (c) {
      case '"': result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n"; break;
      case '\r': result += "\\r"; break;
      case '\t': result += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\x%02x",
                        static_cast<unsigned char>(c));
          result += buf;
          // A following hex digit would extend the escape sequence.
          result += "\"\"";
        } else {
          result += c;
        }
      }
    }
    result += '"';
    return result;
  }

} // namespace tocss
