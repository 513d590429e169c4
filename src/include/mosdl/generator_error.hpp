#pragma once

#include <stdexcept>
#include <string>

namespace mosdl {

  // Raised when a specification cannot be rendered, most notably when an
  // output unit cannot be created or written.
  class generator_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace mosdl
