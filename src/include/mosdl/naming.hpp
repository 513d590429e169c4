#pragma once

#include <string>
#include <string_view>

namespace mosdl {

  bool
  is_reserved_word(std::string_view id);

  // Wrap MOSDL keywords in double quotes so they can be used as names.
  std::string
  escape_identifier(std::string_view id);

} // namespace mosdl
