#include <tocss/ostream_sink.hpp>

namespace tocss {

  ostream_sink::ostream_sink(std::ostream& os) : os_(os) {}

  void
  ostream_sink::write(std::string_view text) {
    if (!os_) throw write_error("ostream_sink: stream is in a failed state");
    os_.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!os_) throw write_error("ostream_sink: write failed");
  }

} // namespace tocss
