#pragma once

#include <string>
#include <string_view>

namespace tocss {

  // Canonical CSS spelling of a structural name: "FitContent" -> "fit-content",
  // "MozBox" -> "-moz-box".
  std::string
  to_css_identifier(std::string_view name);

  std::string
  to_snake_case(std::string_view name);

  // Make a schema name usable as a C++ identifier without otherwise changing
  // its spelling.
  std::string
  to_cpp_identifier(std::string_view name);

  // Quoted and escaped C++ string literal for `text`.
  std::string
  cpp_string_literal(std::string_view text);

} // namespace tocss
