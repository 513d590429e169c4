#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace mosdl {

  // Writes tab-indented text to a stream. The indent level is applied by
  // write_indent() and line(); write() appends raw text to the current line.
  class line_writer {
    std::ostream& os_;
    int indent_ = 0;

  public:
    explicit line_writer(std::ostream& os) : os_(os) {}

    line_writer(const line_writer&) = delete;
    line_writer&
    operator=(const line_writer&) = delete;

    int
    depth() const {
      return indent_;
    }

    void
    indent() {
      ++indent_;
    }

    // Never drops below zero.
    void
    outdent();

    void
    write_indent();

    line_writer&
    write(std::string_view text);

    line_writer&
    write(std::int64_t value);

    // Indentation, text and a line break.
    void
    line(std::string_view text);

    // A bare line break without indentation.
    void
    end_line();
  };

  // Indents for the lifetime of the guard.
  class indent_guard {
    line_writer& out_;

  public:
    explicit indent_guard(line_writer& out) : out_(out) { out_.indent(); }
    ~indent_guard() { out_.outdent(); }

    indent_guard(const indent_guard&) = delete;
    indent_guard&
    operator=(const indent_guard&) = delete;
  };

} // namespace mosdl
