#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tocss {

  class write_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Destination of rendered text. A failing write throws write_error; the
  // error aborts the render call in progress.
  class text_sink {
  public:
    virtual ~text_sink() = default;

    virtual void
    write(std::string_view text) = 0;
  };

} // namespace tocss
