#include <tocss/bound_collector.hpp>

#include <algorithm>
#include <string_view>
#include <utility>

namespace tocss {

  namespace {

    bool
    is_ident_start(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool
    is_ident_char(char c) {
      return is_ident_start(c) || (c >= '0' && c <= '9');
    }

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    // Unqualified identifier tokens of a C++ type expression. A token
    // following "::" names a member of some scope, never a type parameter.
    std::vector<std::string_view>
    unqualified_identifiers(std::string_view expr) {
      std::vector<std::string_view> result;
      std::size_t i = 0;
      while (i < expr.size()) {
        if (!is_ident_start(expr[i])) {
          ++i;
          continue;
        }
        std::size_t start = i;
        while (i < expr.size() && is_ident_char(expr[i]))
          ++i;

        std::size_t before = start;
        while (before > 0 && is_space(expr[before - 1]))
          --before;
        bool qualified = before >= 2 && expr[before - 1] == ':' &&
                         expr[before - 2] == ':';
        if (!qualified) result.push_back(expr.substr(start, i - start));
      }
      return result;
    }

  } // namespace

  bound_collector::bound_collector(std::vector<std::string> type_params)
      : type_params_(std::move(type_params)) {}

  bool
  bound_collector::mentions_type_param(const std::string& type_expr) const {
    for (auto ident : unqualified_identifiers(type_expr)) {
      if (std::find(type_params_.begin(), type_params_.end(), ident) !=
          type_params_.end())
        return true;
    }
    return false;
  }

  void
  bound_collector::require_bound(const std::string& type_expr) {
    if (!mentions_type_param(type_expr)) return;
    if (std::find(bounded_types_.begin(), bounded_types_.end(), type_expr) !=
        bounded_types_.end())
      return;
    bounded_types_.push_back(type_expr);
  }

  std::vector<std::string>
  bound_collector::bounded_params() const {
    std::vector<std::string> result;
    for (const auto& param : type_params_) {
      bool used = std::any_of(
          bounded_types_.begin(), bounded_types_.end(),
          [&param](const std::string& expr) {
            auto idents = unqualified_identifiers(expr);
            return std::find(idents.begin(), idents.end(), param) !=
                   idents.end();
          });
      if (used) result.push_back(param);
    }
    return result;
  }

} // namespace tocss
