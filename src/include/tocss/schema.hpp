#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tocss {

  // A `function` directive either reuses the canonical identifier of the
  // variant or names the function explicitly.
  class function_override {
    std::optional<std::string> explicit_name_;

  public:
    function_override() = default;

    explicit function_override(std::string name)
        : explicit_name_(std::move(name)) {}

    static function_override
    inherit() {
      return function_override();
    }

    bool
    is_explicit() const {
      return explicit_name_.has_value();
    }

    const std::optional<std::string>&
    explicit_name() const {
      return explicit_name_;
    }

    // The explicit name, or `fallback` when the override is inherited.
    std::string
    resolve(const std::string& fallback) const {
      return explicit_name_.value_or(fallback);
    }

    bool
    operator==(const function_override&) const = default;
  };

  struct type_attrs {
    bool derive_debug = false;
    std::optional<function_override> function;
    bool comma = false;

    bool
    operator==(const type_attrs&) const = default;
  };

  struct variant_attrs {
    std::optional<function_override> function;
    bool comma = false;
    bool dimension = false;
    std::optional<std::string> keyword;
    std::optional<std::string> aliases;

    bool
    operator==(const variant_attrs&) const = default;
  };

  struct field_attrs {
    bool skip = false;
    bool iterable = false;
    std::optional<std::string> if_empty;
    bool ignore_bound = false;

    bool
    operator==(const field_attrs&) const = default;
  };

  struct field_def {
    std::string name;
    std::string type;
    field_attrs attrs;

    bool
    operator==(const field_def&) const = default;
  };

  struct variant_def {
    std::string name;
    std::vector<field_def> fields;
    variant_attrs attrs;

    bool
    operator==(const variant_def&) const = default;
  };

  enum class type_kind { structure, enumeration };

  struct type_schema {
    std::string name;
    type_kind kind = type_kind::structure;
    std::vector<std::string> type_params;
    std::vector<variant_def> variants;
    type_attrs attrs;

    bool
    operator==(const type_schema&) const = default;
  };

  struct schema_module {
    std::string namespace_name;
    std::string header;
    std::vector<std::string> includes;
    std::vector<type_schema> types;

    bool
    operator==(const schema_module&) const = default;
  };

  // An illegal directive combination, detected before any rendering logic is
  // generated.
  class schema_error : public std::runtime_error {
    std::string location_;
    std::string rule_;

  public:
    schema_error(std::string location, std::string rule)
        : std::runtime_error(location + ": " + rule),
          location_(std::move(location)), rule_(std::move(rule)) {}

    // "Type", "Type::Variant" or "Type::Variant::field"
    const std::string&
    location() const {
      return location_;
    }

    const std::string&
    rule() const {
      return rule_;
    }
  };

  // Throws schema_error on the first violated rule.
  void
  validate_schema(const type_schema& schema);

  // Variant directives as they apply when rendering: for a structure, the
  // type-level `function` and `comma` directives belong to its sole variant.
  variant_attrs
  effective_variant_attrs(const type_schema& schema,
                          const variant_def& variant);

} // namespace tocss
