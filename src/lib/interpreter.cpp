#include <tocss/interpreter.hpp>
#include <tocss/string_sink.hpp>

#include <stdexcept>
#include <type_traits>

namespace tocss {

  namespace {

    const css_value&
    field_of(const css_value& self, const std::string& name) {
      const auto* field = self.find_field(name);
      if (field == nullptr)
        throw std::invalid_argument("interpreter: value of " +
                                    self.type_name() + "::" + self.variant() +
                                    " has no field '" + name + "'");
      return *field;
    }

    const std::vector<css_value>&
    elements_of(const css_value& self, const std::string& name) {
      const auto& field = field_of(self, name);
      if (field.kind() != css_value::value_kind::list)
        throw std::invalid_argument("interpreter: iterable field '" + name +
                                    "' of " + self.type_name() +
                                    " does not hold a list");
      return field.elements();
    }

  } // namespace

  interpreter::interpreter(std::vector<render_procedure> procedures) {
    for (auto& proc : procedures)
      add(std::move(proc));
  }

  void
  interpreter::add(render_procedure procedure) {
    auto name = procedure.type_name;
    procedures_.insert_or_assign(std::move(name), std::move(procedure));
  }

  void
  interpreter::render(const css_value& value, css_writer& dest) const {
    switch (value.kind()) {
    case css_value::value_kind::text:
      dest.write_str(value.text());
      return;
    case css_value::value_kind::list:
      throw std::invalid_argument(
          "interpreter: a list can only be rendered through an iterable field");
    case css_value::value_kind::instance:
      render_instance(value, dest);
      return;
    }
  }

  std::string
  interpreter::to_css_string(const css_value& value) const {
    string_sink sink;
    css_writer dest(sink);
    render(value, dest);
    return sink.take();
  }

  void
  interpreter::render_instance(const css_value& value,
                               css_writer& dest) const {
    auto it = procedures_.find(value.type_name());
    if (it == procedures_.end())
      throw std::invalid_argument("interpreter: no procedure for type '" +
                                  value.type_name() + "'");

    for (const auto& arm : it->second.arms) {
      if (arm.variant != value.variant()) continue;
      for (const auto& step : arm.body.steps)
        run_step(step, value, dest);
      return;
    }

    throw std::invalid_argument("interpreter: type '" + value.type_name() +
                                "' has no variant '" + value.variant() + "'");
  }

  void
  interpreter::run_step(const render_step& step, const css_value& self,
                        css_writer& dest) const {
    std::visit(
        [&](const auto& s) {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, write_literal>) {
            dest.write_str(s.text);
          } else if constexpr (std::is_same_v<T, write_field>) {
            render(field_of(self, s.field), dest);
          } else if constexpr (std::is_same_v<T, write_sequence>) {
            sequence_writer writer(dest, s.separator);
            for (const auto& item : s.items)
              run_item(item, self, writer);
          }
        },
        step);
  }

  void
  interpreter::run_item(const sequence_item& item, const css_value& self,
                        sequence_writer& writer) const {
    auto render_into = [this](const css_value& value) {
      return [this, &value](css_writer& dest) { render(value, dest); };
    };

    if (const auto* single = std::get_if<item_field>(&item)) {
      writer.write_item(render_into(field_of(self, single->field)));
      return;
    }

    const auto& each = std::get<item_each>(item);
    const auto& elements = elements_of(self, each.field);
    if (elements.empty()) {
      if (each.if_empty.has_value()) writer.item(verbatim{*each.if_empty});
      return;
    }
    for (const auto& element : elements)
      writer.write_item(render_into(element));
  }

} // namespace tocss
