#pragma once

#include <mosdl/render_context.hpp>
#include <mosdl/specification.hpp>

#include <string>
#include <string_view>

namespace mosdl {

  inline constexpr std::string_view mal_area = "MAL";

  // True for the fundamental and attribute types of the MAL area, which are
  // always printed without qualification.
  bool
  is_mal_builtin(const type_reference& ref);

  // Print a type reference relative to the area and service being rendered.
  std::string
  resolve_type(const type_reference& ref, bool nullable,
               const render_context& ctx);

  inline std::string
  resolve_type(const type_reference& ref, const render_context& ctx) {
    return resolve_type(ref, false, ctx);
  }

} // namespace mosdl
