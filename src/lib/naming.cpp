#include <mosdl/naming.hpp>

#include <unordered_set>

namespace mosdl {

  namespace {

    const std::unordered_set<std::string_view>&
    mosdl_keywords() {
      static const std::unordered_set<std::string_view> keywords = {
          "area",     "service",    "composite", "enum",
          "attribute", "fundamental", "error",    "extends",
          "import",   "throws",     "abstract",  "capability",
          "send",     "submit",     "request",   "invoke",
          "progress", "pubsub",
      };
      return keywords;
    }

  } // namespace

  bool
  is_reserved_word(std::string_view id) {
    return mosdl_keywords().count(id) != 0;
  }

  std::string
  escape_identifier(std::string_view id) {
    if (!is_reserved_word(id)) return std::string(id);
    std::string result;
    result.reserve(id.size() + 2);
    result += '"';
    result += id;
    result += '"';
    return result;
  }

} // namespace mosdl
