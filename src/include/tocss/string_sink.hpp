#pragma once

#include <tocss/text_sink.hpp>

#include <string>
#include <utility>

namespace tocss {

  class string_sink : public text_sink {
    std::string buffer_;

  public:
    void
    write(std::string_view text) override {
      buffer_.append(text);
    }

    const std::string&
    str() const {
      return buffer_;
    }

    std::string
    take() {
      return std::move(buffer_);
    }
  };

} // namespace tocss
