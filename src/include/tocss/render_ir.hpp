#pragma once

#include <tocss/schema.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tocss {

  // Render IR: what a generated procedure writes, independent of how a back
  // end expresses it. Fields are referenced by their schema name.

  struct write_literal {
    std::string text;

    bool
    operator==(const write_literal&) const = default;
  };

  struct write_field {
    std::string field;

    bool
    operator==(const write_field&) const = default;
  };

  struct item_field {
    std::string field;

    bool
    operator==(const item_field&) const = default;
  };

  // Every element of an iterable field; `if_empty` is written verbatim as the
  // only item when there are no elements.
  struct item_each {
    std::string field;
    std::optional<std::string> if_empty;

    bool
    operator==(const item_each&) const = default;
  };

  using sequence_item = std::variant<item_field, item_each>;

  struct write_sequence {
    std::string separator;
    std::vector<sequence_item> items;

    bool
    operator==(const write_sequence&) const = default;
  };

  using render_step = std::variant<write_literal, write_field, write_sequence>;

  struct render_fragment {
    std::vector<render_step> steps;

    void
    append(render_step step) {
      steps.push_back(std::move(step));
    }

    void
    prepend(render_step step) {
      steps.insert(steps.begin(), std::move(step));
    }

    bool
    operator==(const render_fragment&) const = default;
  };

  struct variant_arm {
    std::string variant;
    std::size_t index = 0;
    render_fragment body;

    bool
    operator==(const variant_arm&) const = default;
  };

  struct render_procedure {
    std::string type_name;
    type_kind kind = type_kind::structure;
    std::vector<std::string> type_params;
    std::vector<variant_arm> arms;
    std::vector<std::string> bounds;
    bool derive_debug = false;

    bool
    operator==(const render_procedure&) const = default;
  };

} // namespace tocss
