#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tocss {

  // A dynamically typed value for the interpreter back end.
  class css_value {
  public:
    enum class value_kind { text, list, instance };

    using field_list = std::vector<std::pair<std::string, css_value>>;

  private:
    value_kind kind_ = value_kind::text;
    std::string text_;
    std::vector<css_value> elements_;
    std::string type_name_;
    std::string variant_;
    field_list fields_;

  public:
    css_value() = default;

    // Already-rendered text, written as is.
    static css_value
    literal(std::string text);

    static css_value
    list(std::vector<css_value> elements);

    // A value of a schema type. For a struct `variant` is the type name.
    static css_value
    instance(std::string type_name, std::string variant, field_list fields);

    value_kind
    kind() const {
      return kind_;
    }

    const std::string&
    text() const {
      return text_;
    }

    const std::vector<css_value>&
    elements() const {
      return elements_;
    }

    const std::string&
    type_name() const {
      return type_name_;
    }

    const std::string&
    variant() const {
      return variant_;
    }

    const field_list&
    fields() const {
      return fields_;
    }

    // nullptr if there is no field named `name`.
    const css_value*
    find_field(const std::string& name) const;
  };

} // namespace tocss
