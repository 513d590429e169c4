#pragma once

#include <mosdl/xml_reader.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mosdl {

  bool
  is_whitespace_only(std::string_view sv);

  // Advance to the next node that is not whitespace-only character data.
  bool
  read_skip_ws(xml_reader& reader);

  // Skip the current element and all of its children. The reader must be
  // positioned on a start_element; afterwards it sits on the matching
  // end_element.
  void
  skip_element(xml_reader& reader);

  // Advance to the next child start_element of the element opened at
  // parent_depth. Returns false once that element's end_element is reached.
  bool
  next_child(xml_reader& reader, std::size_t parent_depth);

  // Attributes are matched by local name and must be unqualified.
  std::optional<std::string>
  opt_attr(const xml_reader& reader, std::string_view local);

  std::string
  req_attr(const xml_reader& reader, std::string_view local);

  std::optional<std::int64_t>
  opt_int_attr(const xml_reader& reader, std::string_view local);

  std::int64_t
  req_int_attr(const xml_reader& reader, std::string_view local);

  bool
  bool_attr(const xml_reader& reader, std::string_view local,
            bool default_value);

} // namespace mosdl
