#include <tocss/ir_printer.hpp>
#include <tocss/naming.hpp>

#include <sstream>
#include <type_traits>

namespace tocss {

  namespace {

    void
    print_item(std::ostream& os, const sequence_item& item) {
      os << "      ";
      if (const auto* single = std::get_if<item_field>(&item)) {
        os << "item " << single->field << '\n';
        return;
      }
      const auto& each = std::get<item_each>(item);
      os << "each " << each.field;
      if (each.if_empty.has_value())
        os << " if-empty " << cpp_string_literal(*each.if_empty);
      os << '\n';
    }

    void
    print_step(std::ostream& os, const render_step& step) {
      std::visit(
          [&os](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            os << "    ";
            if constexpr (std::is_same_v<T, write_literal>) {
              os << "literal " << cpp_string_literal(s.text) << '\n';
            } else if constexpr (std::is_same_v<T, write_field>) {
              os << "field " << s.field << '\n';
            } else if constexpr (std::is_same_v<T, write_sequence>) {
              os << "sequence " << cpp_string_literal(s.separator) << '\n';
              for (const auto& item : s.items)
                print_item(os, item);
            }
          },
          step);
    }

    void
    print_list(std::ostream& os, const std::vector<std::string>& names) {
      bool first = true;
      for (const auto& name : names) {
        if (!first) os << ", ";
        os << name;
        first = false;
      }
    }

  } // namespace

  std::string
  print_procedure(const render_procedure& proc) {
    std::ostringstream os;
    os << (proc.kind == type_kind::enumeration ? "enum " : "struct ")
       << proc.type_name;
    if (!proc.type_params.empty()) {
      os << '<';
      print_list(os, proc.type_params);
      os << '>';
    }
    if (!proc.bounds.empty()) {
      os << " requires ";
      print_list(os, proc.bounds);
    }
    if (proc.derive_debug) os << " debug";
    os << '\n';

    for (const auto& arm : proc.arms) {
      os << "  arm " << arm.index << ' ' << arm.variant << '\n';
      for (const auto& step : arm.body.steps)
        print_step(os, step);
    }
    return os.str();
  }

} // namespace tocss
