#include <tocss/bound_collector.hpp>
#include <tocss/generator.hpp>
#include <tocss/variant_renderer.hpp>

namespace tocss {

  generator::generator(const type_schema& schema) : schema_(schema) {}

  render_procedure
  generator::generate() const {
    validate_schema(schema_);

    render_procedure proc;
    proc.type_name = schema_.name;
    proc.kind = schema_.kind;
    proc.type_params = schema_.type_params;
    proc.derive_debug = schema_.attrs.derive_debug;

    bound_collector bounds(schema_.type_params);
    for (std::size_t i = 0; i < schema_.variants.size(); ++i) {
      const auto& variant = schema_.variants[i];
      auto attrs = effective_variant_attrs(schema_, variant);

      variant_arm arm;
      arm.variant = variant.name;
      arm.index = i;
      arm.body = render_variant(variant, attrs, bounds);
      proc.arms.push_back(std::move(arm));
    }

    proc.bounds = bounds.bounded_types();
    return proc;
  }

  std::vector<render_procedure>
  generate_module(const schema_module& module) {
    std::vector<render_procedure> result;
    result.reserve(module.types.size());
    for (const auto& type : module.types)
      result.push_back(generator(type).generate());
    return result;
  }

} // namespace tocss
