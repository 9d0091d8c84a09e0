#pragma once

#include <tocss/render_ir.hpp>

#include <string>

namespace tocss {

  // Indented, line-oriented description of a render procedure:
  //
  //   enum Shadow<L> requires L
  //     arm 0 None
  //       literal "none"
  //     arm 1 Offset
  //       sequence " "
  //         item x
  //         each blur
  std::string
  print_procedure(const render_procedure& proc);

} // namespace tocss
