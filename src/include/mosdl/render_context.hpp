#pragma once

#include <mosdl/specification.hpp>

namespace mosdl {

  enum class doc_mode {
    // Operation documentation, including that of its messages, fields and
    // errors, is collected into one block ahead of the operation.
    bulk,
    // Every comment is written right in front of the element it documents.
    inline_docs,
    // No documentation at all.
    suppress,
  };

  // Where the renderer currently is in the specification tree. Type
  // references are qualified relative to this.
  struct render_context {
    const area* current_area = nullptr;
    const service* current_service = nullptr;
    doc_mode docs = doc_mode::bulk;

    render_context
    in_service(const service& s) const {
      render_context ctx = *this;
      ctx.current_service = &s;
      return ctx;
    }
  };

} // namespace mosdl
