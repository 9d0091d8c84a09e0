#pragma once

#include <tocss/bound_collector.hpp>
#include <tocss/render_ir.hpp>
#include <tocss/schema.hpp>

#include <optional>

namespace tocss {

  // How one field contributes to its variant's sequence of items.
  class field_renderer {
  public:
    virtual ~field_renderer() = default;

    // Nothing for a field that is absent from the output.
    virtual std::optional<sequence_item>
    render(const field_def& field, bound_collector& bounds) const = 0;
  };

  const field_renderer&
  select_field_renderer(const field_attrs& attrs);

  std::optional<sequence_item>
  render_field(const field_def& field, bound_collector& bounds);

} // namespace tocss
