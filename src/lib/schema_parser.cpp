#include <tocss/schema_parser.hpp>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tocss {

  namespace {

    bool
    is_whitespace_only(std::string_view sv) {
      return std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

    [[noreturn]] void
    fail(const xml_reader& reader, const std::string& message) {
      throw std::runtime_error("schema_parser: line " +
                               std::to_string(reader.line()) + ": " + message);
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    void
    check_attributes(const xml_reader& reader,
                     std::initializer_list<std::string_view> allowed) {
      for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
        const auto& name = reader.attribute_name(i);
        if (std::find(allowed.begin(), allowed.end(), name) == allowed.end())
          fail(reader, "unknown attribute '" + name + "' on <" +
                           reader.name() + ">");
      }
    }

    std::optional<std::string>
    opt_attr(const xml_reader& reader, std::string_view name) {
      auto value = reader.attribute_value(name);
      if (!value.has_value()) return std::nullopt;
      return std::string(*value);
    }

    std::string
    req_attr(const xml_reader& reader, std::string_view name) {
      auto value = opt_attr(reader, name);
      if (!value.has_value())
        fail(reader, "missing required attribute '" + std::string(name) +
                         "' on <" + reader.name() + ">");
      return *value;
    }

    bool
    bool_attr(const xml_reader& reader, std::string_view name) {
      auto value = opt_attr(reader, name);
      if (!value.has_value()) return false;
      if (*value == "true" || *value == "1") return true;
      if (*value == "false" || *value == "0") return false;
      fail(reader, "attribute '" + std::string(name) + "' on <" +
                       reader.name() + "> must be a boolean, got '" + *value +
                       "'");
    }

    // An empty value reuses the canonical identifier.
    std::optional<function_override>
    function_attr(const xml_reader& reader) {
      auto value = opt_attr(reader, "function");
      if (!value.has_value()) return std::nullopt;
      if (value->empty()) return function_override::inherit();
      return function_override(*value);
    }

    // The current element must have no children.
    void
    expect_empty(xml_reader& reader) {
      std::string name = reader.name();
      std::size_t depth = reader.depth();
      if (!read_skip_ws(reader))
        fail(reader, "unexpected end of document in <" + name + ">");
      if (reader.node_type() != xml_node_type::end_element ||
          reader.depth() != depth)
        fail(reader, "<" + name + "> must be empty");
    }

    // Iterates the children of the current element, calling `on_child` with
    // the reader positioned on each child's start tag. `on_child` must consume
    // the child through its end tag.
    template <typename F>
    void
    for_each_child(xml_reader& reader, F&& on_child) {
      std::string name = reader.name();
      std::size_t depth = reader.depth();
      while (read_skip_ws(reader)) {
        if (reader.node_type() == xml_node_type::end_element &&
            reader.depth() == depth)
          return;
        if (reader.node_type() == xml_node_type::characters)
          fail(reader, "unexpected text in <" + name + ">");
        if (reader.node_type() == xml_node_type::start_element) on_child();
      }
      fail(reader, "unexpected end of document in <" + name + ">");
    }

    std::string
    parse_param(xml_reader& reader) {
      check_attributes(reader, {"name"});
      auto name = req_attr(reader, "name");
      expect_empty(reader);
      return name;
    }

    field_def
    parse_field(xml_reader& reader, std::size_t index) {
      check_attributes(reader, {"name", "type", "skip", "iterable", "if-empty",
                                "ignore-bound"});
      field_def field;
      field.name = opt_attr(reader, "name").value_or("_" + std::to_string(index));
      field.type = req_attr(reader, "type");
      field.attrs.skip = bool_attr(reader, "skip");
      field.attrs.iterable = bool_attr(reader, "iterable");
      field.attrs.if_empty = opt_attr(reader, "if-empty");
      field.attrs.ignore_bound = bool_attr(reader, "ignore-bound");
      expect_empty(reader);
      return field;
    }

    void
    parse_variant_directives(const xml_reader& reader, variant_attrs& attrs) {
      attrs.dimension = bool_attr(reader, "dimension");
      attrs.keyword = opt_attr(reader, "keyword");
      attrs.aliases = opt_attr(reader, "aliases");
    }

    variant_def
    parse_variant(xml_reader& reader) {
      check_attributes(reader, {"name", "function", "comma", "dimension",
                                "keyword", "aliases"});
      variant_def variant;
      variant.name = req_attr(reader, "name");
      variant.attrs.function = function_attr(reader);
      variant.attrs.comma = bool_attr(reader, "comma");
      parse_variant_directives(reader, variant.attrs);

      for_each_child(reader, [&] {
        if (reader.name() != "field")
          fail(reader, "unexpected <" + reader.name() + "> in <variant>");
        variant.fields.push_back(parse_field(reader, variant.fields.size()));
      });
      return variant;
    }

    // A struct is its own single variant: the variant directives live on the
    // <struct> element, next to the type directives.
    type_schema
    parse_struct(xml_reader& reader) {
      check_attributes(reader, {"name", "derive-debug", "function", "comma",
                                "dimension", "keyword", "aliases"});
      type_schema schema;
      schema.kind = type_kind::structure;
      schema.name = req_attr(reader, "name");
      schema.attrs.derive_debug = bool_attr(reader, "derive-debug");
      schema.attrs.function = function_attr(reader);
      schema.attrs.comma = bool_attr(reader, "comma");

      variant_def variant;
      variant.name = schema.name;
      parse_variant_directives(reader, variant.attrs);

      for_each_child(reader, [&] {
        if (reader.name() == "param") {
          schema.type_params.push_back(parse_param(reader));
        } else if (reader.name() == "field") {
          variant.fields.push_back(parse_field(reader, variant.fields.size()));
        } else {
          fail(reader, "unexpected <" + reader.name() + "> in <struct>");
        }
      });

      schema.variants.push_back(std::move(variant));
      return schema;
    }

    type_schema
    parse_enum(xml_reader& reader) {
      check_attributes(reader, {"name", "derive-debug", "function", "comma"});
      type_schema schema;
      schema.kind = type_kind::enumeration;
      schema.name = req_attr(reader, "name");
      schema.attrs.derive_debug = bool_attr(reader, "derive-debug");
      schema.attrs.function = function_attr(reader);
      schema.attrs.comma = bool_attr(reader, "comma");

      for_each_child(reader, [&] {
        if (reader.name() == "param") {
          schema.type_params.push_back(parse_param(reader));
        } else if (reader.name() == "variant") {
          schema.variants.push_back(parse_variant(reader));
        } else {
          fail(reader, "unexpected <" + reader.name() + "> in <enum>");
        }
      });
      return schema;
    }

  } // namespace

  schema_module
  schema_parser::parse(xml_reader& reader) {
    if (!read_skip_ws(reader) ||
        reader.node_type() != xml_node_type::start_element)
      throw std::runtime_error("schema_parser: expected <css-schema>");
    if (reader.name() != "css-schema")
      fail(reader, "expected <css-schema>, got <" + reader.name() + ">");

    check_attributes(reader, {"namespace", "header"});
    schema_module module;
    module.namespace_name = req_attr(reader, "namespace");
    module.header = opt_attr(reader, "header").value_or("");

    for_each_child(reader, [&] {
      const auto& name = reader.name();
      if (name == "include") {
        check_attributes(reader, {"path"});
        module.includes.push_back(req_attr(reader, "path"));
        expect_empty(reader);
      } else if (name == "struct") {
        module.types.push_back(parse_struct(reader));
      } else if (name == "enum") {
        module.types.push_back(parse_enum(reader));
      } else {
        fail(reader, "unexpected <" + name + "> in <css-schema>");
      }
    });

    return module;
  }

} // namespace tocss
