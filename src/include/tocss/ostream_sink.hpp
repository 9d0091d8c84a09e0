#pragma once

#include <tocss/text_sink.hpp>

#include <ostream>

namespace tocss {

  class ostream_sink : public text_sink {
    std::ostream& os_;

  public:
    explicit ostream_sink(std::ostream& os);

    ostream_sink(const ostream_sink&) = delete;
    ostream_sink&
    operator=(const ostream_sink&) = delete;

    // Throws write_error once the stream has failed.
    void
    write(std::string_view text) override;
  };

} // namespace tocss
