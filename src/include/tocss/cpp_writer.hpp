#pragma once

#include <tocss/cpp_code.hpp>

#include <string>

namespace tocss {

  class cpp_writer {
  public:
    std::string
    write(const cpp_file& file) const;
  };

} // namespace tocss
