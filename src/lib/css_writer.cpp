#include <tocss/css_writer.hpp>

#include <charconv>

namespace tocss {

  namespace {

    template <typename T>
    void
    write_number(T value, css_writer& dest) {
      char buf[64];
      auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
      if (ec != std::errc())
        throw write_error("css_writer: cannot format number");
      dest.write_str(std::string_view(buf, static_cast<std::size_t>(end - buf)));
    }

  } // namespace

  css_writer::css_writer(text_sink& sink) : sink_(sink) {}

  void
  css_writer::write_str(std::string_view text) {
    if (text.empty()) return;
    if (prefix_.has_value()) {
      auto prefix = *prefix_;
      prefix_.reset();
      if (!prefix.empty()) sink_.write(prefix);
    }
    sink_.write(text);
  }

  void
  to_css(verbatim value, css_writer& dest) {
    dest.write_str(value.text);
  }

  void
  to_css(std::string_view text, css_writer& dest) {
    dest.write_str(text);
  }

  void
  to_css(long long value, css_writer& dest) {
    write_number(value, dest);
  }

  void
  to_css(unsigned long long value, css_writer& dest) {
    write_number(value, dest);
  }

  void
  to_css(double value, css_writer& dest) {
    write_number(value, dest);
  }

  void
  to_css(float value, css_writer& dest) {
    write_number(value, dest);
  }

  sequence_writer::sequence_writer(css_writer& dest, std::string_view separator)
      : dest_(dest), separator_(separator) {
    // An empty prefix marks "nothing written by this sequence yet" unless an
    // enclosing sequence already left its separator pending.
    if (!dest_.prefix_.has_value()) dest_.prefix_ = std::string_view();
  }

} // namespace tocss
