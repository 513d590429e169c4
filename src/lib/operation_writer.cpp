#include <mosdl/operation_writer.hpp>

#include <mosdl/doc_formatter.hpp>
#include <mosdl/generator_error.hpp>
#include <mosdl/naming.hpp>
#include <mosdl/type_resolver.hpp>

#include <algorithm>

namespace mosdl {

  namespace {

    bool
    any_field_comment(const message& msg) {
      return std::any_of(msg.fields.begin(), msg.fields.end(),
                         [](const field& f) { return f.comment.has_value(); });
    }

    std::string
    format_field(const field& f, const render_context& ctx) {
      return escape_identifier(f.name) + ": " +
             resolve_type(f.type, f.can_be_null, ctx);
    }

    // A message continuing the sequence, or one whose comment is shown,
    // starts on a line of its own.
    void
    write_message(line_writer& out, const render_context& ctx,
                  std::string_view prefix, const message& msg,
                  bool continuation) {
      bool inline_docs = ctx.docs == doc_mode::inline_docs;
      bool show_comment = inline_docs && msg.comment.has_value();

      if (continuation || show_comment) {
        out.end_line();
        if (show_comment) write_doc(out, ctx.docs, msg.comment);
        out.write_indent();
      }
      out.write(prefix).write("(");

      if (!inline_docs || !any_field_comment(msg)) {
        out.write(format_fields(msg.fields, ctx));
        out.write(")");
        return;
      }

      out.end_line();
      {
        indent_guard fields_indent(out);
        for (std::size_t i = 0; i < msg.fields.size(); ++i) {
          const auto& f = msg.fields[i];
          write_doc(out, ctx.docs, f.comment);
          out.write_indent();
          out.write(format_field(f, ctx));
          if (i + 1 < msg.fields.size()) out.write(",");
          out.end_line();
        }
      }
      out.write_indent();
      out.write(")");
    }

    void
    write_operation_error(line_writer& out, const render_context& ctx,
                          const error_view& error) {
      out.write(error.declaration);
      write_error_extra_info(out, ctx, error.extra_info,
                             ctx.docs == doc_mode::inline_docs);
    }

    void
    write_throws(line_writer& out, const render_context& ctx,
                 const std::vector<error_view>& errors) {
      out.end_line();
      out.write_indent();
      out.write("throws");

      bool has_error_doc = std::any_of(
          errors.begin(), errors.end(), [](const auto& e) { return e.has_doc(); });

      if (!(has_error_doc && ctx.docs == doc_mode::inline_docs)) {
        out.write(" ");
        for (std::size_t i = 0; i < errors.size(); ++i) {
          if (i > 0) out.write(", ");
          write_operation_error(out, ctx, errors[i]);
        }
        return;
      }

      indent_guard errors_indent(out);
      out.end_line();
      for (std::size_t i = 0; i < errors.size(); ++i) {
        if (errors[i].comment != nullptr)
          write_doc(out, ctx.docs, *errors[i].comment);
        out.write_indent();
        write_operation_error(out, ctx, errors[i]);
        if (i + 1 < errors.size()) {
          out.write(",");
          out.end_line();
        }
      }
    }

  } // namespace

  std::string
  format_fields(const std::vector<field>& fields, const render_context& ctx) {
    std::string result;
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) result += ", ";
      result += format_field(fields[i], ctx);
    }
    return result;
  }

  void
  write_error_extra_info(line_writer& out, const render_context& ctx,
                         const extra_information* extra_info,
                         bool show_comment) {
    if (extra_info == nullptr) return;

    if (!show_comment || !extra_info->comment.has_value()) {
      out.write(": ").write(resolve_type(extra_info->type, ctx));
      return;
    }

    out.write(":");
    out.end_line();
    indent_guard info_indent(out);
    write_doc(out, ctx.docs, extra_info->comment);
    out.write_indent();
    out.write(resolve_type(extra_info->type, ctx));
  }

  void
  write_operation(line_writer& out, const render_context& ctx,
                  const operation& op) {
    if (op.messages.size() != message_count(op.pattern)) {
      throw generator_error("operation '" + op.name + "': " +
                            std::string(pattern_keyword(op.pattern)) +
                            " requires " +
                            std::to_string(message_count(op.pattern)) +
                            " message(s), found " +
                            std::to_string(op.messages.size()));
    }

    auto errors = describe_errors(op.errors, ctx);
    write_operation_doc(out, ctx, op, errors);

    out.write_indent();
    out.write(pattern_keyword(op.pattern)).write(" ");
    if (op.support_in_replay) out.write("*");
    out.write(escape_identifier(op.name))
        .write(" [")
        .write(op.number)
        .write("] ");

    {
      indent_guard body_indent(out);
      const auto& m = op.messages;
      switch (op.pattern) {
        case interaction_pattern::send:
        case interaction_pattern::submit:
          write_message(out, ctx, "", m[0], false);
          break;
        case interaction_pattern::request:
          write_message(out, ctx, "", m[0], false);
          write_message(out, ctx, "-> ", m[1], true);
          break;
        case interaction_pattern::invoke:
          write_message(out, ctx, "", m[0], false);
          write_message(out, ctx, "-> ", m[1], true);
          write_message(out, ctx, "-> ", m[2], true);
          break;
        case interaction_pattern::progress:
          write_message(out, ctx, "", m[0], false);
          write_message(out, ctx, "-> ", m[1], true);
          write_message(out, ctx, "-> ", m[2], true);
          out.write("*");
          write_message(out, ctx, "-> ", m[3], true);
          break;
        case interaction_pattern::pubsub:
          write_message(out, ctx, "<- ", m[0], false);
          break;
      }

      if (!errors.empty()) write_throws(out, ctx, errors);
    }

    out.end_line();
    out.end_line();
  }

} // namespace mosdl
