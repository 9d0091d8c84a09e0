#pragma once

#include <tocss/text_sink.hpp>

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tocss {

  class sequence_writer;

  // Writes CSS text to a sink. A pending prefix (set by sequence_writer) is
  // written just before the next non-empty text, so separators only appear
  // between items that produced output.
  class css_writer {
    text_sink& sink_;
    std::optional<std::string_view> prefix_;

    friend class sequence_writer;

  public:
    explicit css_writer(text_sink& sink);

    css_writer(const css_writer&) = delete;
    css_writer&
    operator=(const css_writer&) = delete;

    void
    write_str(std::string_view text);
  };

  // Text written exactly as given.
  struct verbatim {
    std::string_view text;
  };

  void
  to_css(verbatim value, css_writer& dest);

  void
  to_css(std::string_view text, css_writer& dest);

  void
  to_css(long long value, css_writer& dest);

  void
  to_css(unsigned long long value, css_writer& dest);

  void
  to_css(double value, css_writer& dest);

  template <std::integral T>
    requires(!std::same_as<T, bool>)
  void
  to_css(T value, css_writer& dest) {
    if constexpr (std::is_signed_v<T>)
      to_css(static_cast<long long>(value), dest);
    else
      to_css(static_cast<unsigned long long>(value), dest);
  }

  void
  to_css(float value, css_writer& dest);

  namespace detail {

    template <typename T>
    concept adl_to_css = requires(const T& value, css_writer& dest) {
      to_css(value, dest);
    };

  } // namespace detail

  // The rendering capability: an ADL-visible to_css(const T&, css_writer&).
  template <typename T>
  concept css_writable = detail::adl_to_css<T>;

  template <css_writable T>
  void
  write_css(const T& value, css_writer& dest) {
    to_css(value, dest);
  }

  // Inserts a separator between successive items that produce output.
  class sequence_writer {
    css_writer& dest_;
    std::string_view separator_;

  public:
    sequence_writer(css_writer& dest, std::string_view separator);

    sequence_writer(const sequence_writer&) = delete;
    sequence_writer&
    operator=(const sequence_writer&) = delete;

    template <typename F>
    void
    write_item(F&& render) {
      auto old_prefix = dest_.prefix_;
      // No pending prefix means an earlier item wrote something.
      if (!old_prefix.has_value()) dest_.prefix_ = separator_;
      std::forward<F>(render)(dest_);
      // This item wrote nothing: drop the separator it would have needed.
      if (!old_prefix.has_value() && dest_.prefix_.has_value())
        dest_.prefix_.reset();
    }

    template <css_writable T>
    void
    item(const T& value) {
      write_item([&value](css_writer& dest) { write_css(value, dest); });
    }
  };

} // namespace tocss
