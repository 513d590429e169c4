#include <mosdl/doc_formatter.hpp>

#include <algorithm>

namespace mosdl {

  namespace {

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    std::string_view
    trim(std::string_view text) {
      while (!text.empty() && is_space(text.front()))
        text.remove_prefix(1);
      while (!text.empty() && is_space(text.back()))
        text.remove_suffix(1);
      return text;
    }

    bool
    is_blank(std::string_view text) {
      return std::all_of(text.begin(), text.end(), is_space);
    }

    void
    append_tag(std::string& doc, std::string_view tag, std::string_view name,
               std::string_view text) {
      doc += '\n';
      doc += '@';
      doc += tag;
      if (!name.empty()) {
        doc += ' ';
        doc += name;
      }
      doc += ": ";
      doc += text;
    }

  } // namespace

  void
  write_doc(line_writer& out, doc_mode mode, std::string_view doc) {
    if (mode == doc_mode::suppress) return;

    if (doc.find('\n') == std::string_view::npos) {
      out.write_indent();
      out.write("/// ").write(doc).end_line();
      return;
    }

    out.line("\"\"\"");
    auto body = trim(doc);
    while (true) {
      auto eol = body.find('\n');
      auto text = body.substr(0, eol);
      if (!text.empty() && text.back() == '\r') text.remove_suffix(1);
      out.line(text);
      if (eol == std::string_view::npos) break;
      body.remove_prefix(eol + 1);
    }
    out.line("\"\"\"");
  }

  void
  write_doc(line_writer& out, doc_mode mode,
            const std::optional<std::string>& doc) {
    if (doc.has_value()) write_doc(out, mode, std::string_view(*doc));
  }

  std::string
  synthesize_operation_doc(const operation& op,
                           const std::vector<error_view>& errors) {
    std::string doc = op.comment.value_or("");

    for (const auto& msg : op.messages) {
      if (msg.comment.has_value() || !msg.fields.empty()) doc += '\n';

      auto tag = std::string(stage_tag(msg.stage));
      if (msg.comment.has_value()) append_tag(doc, tag, {}, *msg.comment);
      for (const auto& f : msg.fields) {
        if (f.comment.has_value())
          append_tag(doc, tag + "param", f.name, *f.comment);
      }
    }

    bool has_error_doc = std::any_of(errors.begin(), errors.end(),
                                     [](const auto& e) { return e.has_doc(); });
    if (has_error_doc) doc += '\n';
    for (const auto& e : errors) {
      if (e.has_comment()) append_tag(doc, "error", e.name, **e.comment);
      if (e.has_extra_info_comment())
        append_tag(doc, "errorinfo", e.name, *e.extra_info->comment);
    }

    return doc;
  }

  void
  write_operation_doc(line_writer& out, const render_context& ctx,
                      const operation& op,
                      const std::vector<error_view>& errors) {
    switch (ctx.docs) {
      case doc_mode::suppress:
        return;
      case doc_mode::inline_docs:
        write_doc(out, ctx.docs, op.comment);
        return;
      case doc_mode::bulk:
        break;
    }

    auto doc = synthesize_operation_doc(op, errors);
    if (is_blank(doc)) return;
    write_doc(out, ctx.docs, std::string_view(doc));
  }

} // namespace mosdl
