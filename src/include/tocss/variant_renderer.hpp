#pragma once

#include <tocss/bound_collector.hpp>
#include <tocss/render_ir.hpp>
#include <tocss/schema.hpp>

namespace tocss {

  // Separator between the items of a variant's field sequence.
  inline const char*
  separator_for(const variant_attrs& attrs) {
    return attrs.comma ? ", " : " ";
  }

  // Compile one variant into the fragment that renders it. `attrs` are the
  // effective directives (see effective_variant_attrs); the variant is
  // expected to have passed validate_schema.
  render_fragment
  render_variant(const variant_def& variant, const variant_attrs& attrs,
                 bound_collector& bounds);

} // namespace tocss
