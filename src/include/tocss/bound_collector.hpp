#pragma once

#include <string>
#include <vector>

namespace tocss {

  // Accumulates, for one generation pass, the field types whose values are
  // rendered directly and therefore need the `css_writable` bound. Only types
  // that mention one of the schema's own type parameters are recorded: the
  // others are concrete and checked where the procedure is defined.
  class bound_collector {
    std::vector<std::string> type_params_;
    std::vector<std::string> bounded_types_;

  public:
    explicit bound_collector(std::vector<std::string> type_params = {});

    void
    require_bound(const std::string& type_expr);

    // Distinct type expressions, in first-use order.
    const std::vector<std::string>&
    bounded_types() const {
      return bounded_types_;
    }

    // Type parameters mentioned by at least one bounded type, in parameter
    // declaration order.
    std::vector<std::string>
    bounded_params() const;

    // True if `type_expr` refers to any of the type parameters.
    bool
    mentions_type_param(const std::string& type_expr) const;
  };

} // namespace tocss
