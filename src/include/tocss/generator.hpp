#pragma once

#include <tocss/render_ir.hpp>
#include <tocss/schema.hpp>

#include <vector>

namespace tocss {

  class generator {
    const type_schema& schema_;

  public:
    explicit generator(const type_schema& schema);

    // Validates the schema (throwing schema_error) and compiles one arm per
    // variant, in declaration order.
    render_procedure
    generate() const;
  };

  std::vector<render_procedure>
  generate_module(const schema_module& module);

} // namespace tocss
