#pragma once

#include <mosdl/render_context.hpp>
#include <mosdl/specification.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mosdl {

  // Uniform view of an error declared in a throws clause, whether it
  // references an existing error or defines a new one.
  struct error_view {
    // Name used in documentation tags.
    std::string name;
    // Text written into the throws clause ahead of any extra information.
    std::string declaration;
    const std::optional<std::string>* comment = nullptr;
    const extra_information* extra_info = nullptr;

    bool
    has_comment() const {
      return comment != nullptr && comment->has_value();
    }

    bool
    has_extra_info_comment() const {
      return extra_info != nullptr && extra_info->comment.has_value();
    }

    bool
    has_doc() const {
      return has_comment() || has_extra_info_comment();
    }
  };

  error_view
  describe_error(const operation_error& error, const render_context& ctx);

  std::vector<error_view>
  describe_errors(const std::vector<operation_error>& errors,
                  const render_context& ctx);

  // "error <Name> [<number>]"
  std::string
  error_declaration(const error_definition& error);

} // namespace mosdl
