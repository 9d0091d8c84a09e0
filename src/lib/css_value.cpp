#include <tocss/css_value.hpp>

namespace tocss {

  css_value
  css_value::literal(std::string text) {
    css_value v;
    v.kind_ = value_kind::text;
    v.text_ = std::move(text);
    return v;
  }

  css_value
  css_value::list(std::vector<css_value> elements) {
    css_value v;
    v.kind_ = value_kind::list;
    v.elements_ = std::move(elements);
    return v;
  }

  css_value
  css_value::instance(std::string type_name, std::string variant,
                      field_list fields) {
    css_value v;
    v.kind_ = value_kind::instance;
    v.type_name_ = std::move(type_name);
    v.variant_ = std::move(variant);
    v.fields_ = std::move(fields);
    return v;
  }

  const css_value*
  css_value::find_field(const std::string& name) const {
    for (const auto& [field_name, value] : fields_) {
      if (field_name == name) return &value;
    }
    return nullptr;
  }

} // namespace tocss
