#include <mosdl/line_writer.hpp>

namespace mosdl {

  void
  line_writer::outdent() {
    if (indent_ > 0) --indent_;
  }

  void
  line_writer::write_indent() {
    for (int i = 0; i < indent_; ++i)
      os_ << '\t';
  }

  line_writer&
  line_writer::write(std::string_view text) {
    os_ << text;
    return *this;
  }

  line_writer&
  line_writer::write(std::int64_t value) {
    os_ << value;
    return *this;
  }

  void
  line_writer::line(std::string_view text) {
    write_indent();
    os_ << text << '\n';
  }

  void
  line_writer::end_line() {
    os_ << '\n';
  }

} // namespace mosdl
