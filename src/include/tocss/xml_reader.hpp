#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tocss {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull-style cursor over the nodes of an XML document.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const std::string&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const std::string&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::optional<std::string_view>
    attribute_value(std::string_view name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // Line of the current node in the source document.
    virtual std::size_t
    line() const = 0;
  };

} // namespace tocss
