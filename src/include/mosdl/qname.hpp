#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace mosdl {

  // Namespace-qualified XML element or attribute name.
  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    bool
    is(std::string_view local) const {
      return local_name_ == local;
    }

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      if (q.namespace_uri_.empty()) { return os << q.local_name_; }
      return os << '{' << q.namespace_uri_ << '}' << q.local_name_;
    }
  };

} // namespace mosdl
