#pragma once

#include <mosdl/error_view.hpp>
#include <mosdl/line_writer.hpp>
#include <mosdl/render_context.hpp>
#include <mosdl/specification.hpp>

#include <string>
#include <vector>

namespace mosdl {

  // Comma-separated "name: Type" list of a message, without parentheses.
  std::string
  format_fields(const std::vector<field>& fields, const render_context& ctx);

  // Writes the extra information of an error: ": Type" on the same line, or,
  // when show_comment is set and it has a comment, ":" and then the comment
  // and the type on the following lines one level deeper. The layout does not
  // depend on the documentation mode; only the comment itself does.
  void
  write_error_extra_info(line_writer& out, const render_context& ctx,
                         const extra_information* extra_info,
                         bool show_comment);

  // Writes the documentation, the operation line with its message sequence
  // and the throws clause, followed by a blank line.
  void
  write_operation(line_writer& out, const render_context& ctx,
                  const operation& op);

} // namespace mosdl
