#pragma once

#include <tocss/css_value.hpp>
#include <tocss/css_writer.hpp>
#include <tocss/render_ir.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace tocss {

  // Executes render procedures directly against css_values.
  class interpreter {
    std::unordered_map<std::string, render_procedure> procedures_;

  public:
    interpreter() = default;
    explicit interpreter(std::vector<render_procedure> procedures);

    // Replaces any procedure for the same type.
    void
    add(render_procedure procedure);

    // Throws std::invalid_argument for a value the procedures do not
    // describe; sink failures propagate as write_error.
    void
    render(const css_value& value, css_writer& dest) const;

    std::string
    to_css_string(const css_value& value) const;

  private:
    void
    render_instance(const css_value& value, css_writer& dest) const;

    void
    run_step(const render_step& step, const css_value& self,
             css_writer& dest) const;

    void
    run_item(const sequence_item& item, const css_value& self,
             sequence_writer& writer) const;
  };

} // namespace tocss
