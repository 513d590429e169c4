#pragma once

#include <mosdl/qname.hpp>

#include <cstddef>
#include <string_view>

namespace mosdl {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull interface over a parsed XML document. After read() returns true the
  // accessors describe the current node.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const qname&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const qname&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // Source line of the current node, 1-based.
    virtual std::size_t
    line() const = 0;
  };

} // namespace mosdl
