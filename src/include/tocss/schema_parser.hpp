#pragma once

#include <tocss/schema.hpp>
#include <tocss/xml_reader.hpp>

namespace tocss {

  // Reads a <css-schema> document. Structural problems (unknown elements or
  // attributes, malformed booleans, missing required attributes) throw
  // std::runtime_error; directive combinations are left to validate_schema.
  class schema_parser {
  public:
    schema_module
    parse(xml_reader& reader);
  };

} // namespace tocss
