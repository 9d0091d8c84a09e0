#include <tocss/naming.hpp>
#include <tocss/schema.hpp>

#include <set>
#include <string>

namespace tocss {

  namespace {

    std::string
    variant_location(const type_schema& schema, const variant_def& variant) {
      if (schema.kind == type_kind::structure) return schema.name;
      return schema.name + "::" + variant.name;
    }

    // Names the generated C++ declares or qualifies with.
    const std::set<std::string>&
    generated_names() {
      static const std::set<std::string> names = {
          "dest", "item", "os",    "self",  "sink",
          "std",  "tocss", "v", "value", "writer"};
      return names;
    }

    void
    validate_type_params(const type_schema& schema) {
      std::set<std::string> seen;
      for (const auto& param : schema.type_params) {
        if (param.empty())
          throw schema_error(schema.name, "type parameter name is empty");
        if (!seen.insert(param).second)
          throw schema_error(schema.name,
                             "duplicate type parameter '" + param + "'");
        if (generated_names().count(param))
          throw schema_error(schema.name, "type parameter '" + param +
                                              "' collides with a generated "
                                              "name");
        if (param == to_cpp_identifier(schema.name))
          throw schema_error(schema.name, "type parameter '" + param +
                                              "' has the name of its type");
      }
    }

    // A template parameter cannot be redeclared inside the template, and a
    // member cannot share the name of its class.
    void
    validate_member_name(const type_schema& schema, const std::string& location,
                         const std::string& enclosing, const std::string& name,
                         const char* what) {
      auto ident = to_cpp_identifier(name);
      for (const auto& param : schema.type_params) {
        if (ident == param)
          throw schema_error(location, std::string(what) + " '" + name +
                                           "' has the name of type parameter "
                                           "'" + param + "'");
      }
      if (ident == enclosing)
        throw schema_error(location, std::string(what) + " '" + name +
                                         "' has the name of its enclosing "
                                         "type");
    }

    void
    validate_field(const std::string& location, const field_def& field) {
      if (field.name.empty())
        throw schema_error(location, "field name is empty");
      if (field.type.empty())
        throw schema_error(location + "::" + field.name,
                           "field type is empty");
      if (field.attrs.if_empty.has_value() && !field.attrs.iterable)
        throw schema_error(location + "::" + field.name,
                           "'if_empty' requires 'iterable'");
    }

    void
    validate_variant(const type_schema& schema, const variant_def& variant) {
      std::string location = variant_location(schema, variant);
      auto attrs = effective_variant_attrs(schema, variant);

      std::string enclosing = schema.kind == type_kind::structure
                                  ? to_cpp_identifier(schema.name)
                                  : to_cpp_identifier(variant.name);
      std::set<std::string> names;
      for (const auto& field : variant.fields) {
        validate_field(location, field);
        validate_member_name(schema, location, enclosing, field.name, "field");
        if (!names.insert(field.name).second)
          throw schema_error(location,
                             "duplicate field '" + field.name + "'");
      }

      // Raw binding count: skipped fields still count here.
      if (attrs.dimension) {
        if (variant.fields.size() != 1)
          throw schema_error(location,
                             "'dimension' requires exactly one field (found " +
                                 std::to_string(variant.fields.size()) + ")");
        if (attrs.function.has_value())
          throw schema_error(location,
                             "'dimension' cannot be combined with 'function'");
        if (attrs.keyword.has_value())
          throw schema_error(location,
                             "'dimension' cannot be combined with 'keyword'");
      }

      if (attrs.keyword.has_value() && !variant.fields.empty())
        throw schema_error(location, "'keyword' requires a variant without "
                                     "fields (found " +
                                         std::to_string(variant.fields.size()) +
                                         ")");
    }

  } // namespace

  variant_attrs
  effective_variant_attrs(const type_schema& schema,
                          const variant_def& variant) {
    variant_attrs attrs = variant.attrs;
    if (schema.kind == type_kind::structure) {
      if (!attrs.function.has_value()) attrs.function = schema.attrs.function;
      attrs.comma = attrs.comma || schema.attrs.comma;
    }
    return attrs;
  }

  void
  validate_schema(const type_schema& schema) {
    if (schema.name.empty()) throw schema_error("<unnamed>", "type name is empty");

    if (schema.kind == type_kind::enumeration) {
      if (schema.attrs.function.has_value())
        throw schema_error(schema.name, "'function' is not allowed on enums");
      if (schema.attrs.comma)
        throw schema_error(schema.name, "'comma' is not allowed on enums");
      if (schema.variants.empty())
        throw schema_error(schema.name,
                           "an enum must declare at least one variant");
    } else if (schema.variants.size() != 1) {
      throw schema_error(schema.name,
                         "a struct must have exactly one variant (found " +
                             std::to_string(schema.variants.size()) + ")");
    }

    validate_type_params(schema);

    std::set<std::string> names;
    for (const auto& variant : schema.variants) {
      if (variant.name.empty())
        throw schema_error(schema.name, "variant name is empty");
      if (!names.insert(variant.name).second)
        throw schema_error(schema.name,
                           "duplicate variant '" + variant.name + "'");
      if (schema.kind == type_kind::enumeration) {
        if (to_cpp_identifier(variant.name) == "value")
          throw schema_error(schema.name,
                             "variant 'value' collides with the member "
                             "holding the active variant");
        validate_member_name(schema, schema.name,
                             to_cpp_identifier(schema.name), variant.name,
                             "variant");
      }
      validate_variant(schema, variant);
    }
  }

} // namespace tocss
