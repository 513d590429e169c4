#pragma once

#include <mosdl/error_view.hpp>
#include <mosdl/line_writer.hpp>
#include <mosdl/render_context.hpp>
#include <mosdl/specification.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mosdl {

  // Write a comment at the current indentation: "/// text" for a single line,
  // a """ block for text spanning several lines. Nothing is written when the
  // mode is suppress.
  void
  write_doc(line_writer& out, doc_mode mode, std::string_view doc);

  void
  write_doc(line_writer& out, doc_mode mode,
            const std::optional<std::string>& doc);

  // Aggregate the documentation of an operation, its messages, fields and
  // errors into a single tagged text block. May be empty.
  std::string
  synthesize_operation_doc(const operation& op,
                           const std::vector<error_view>& errors);

  // Documentation written ahead of an operation line according to the mode.
  void
  write_operation_doc(line_writer& out, const render_context& ctx,
                      const operation& op,
                      const std::vector<error_view>& errors);

} // namespace mosdl
