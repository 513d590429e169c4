#include <mosdl/xml_io.hpp>

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace mosdl {

  namespace {

    std::string
    where(const xml_reader& reader) {
      return "<" + reader.name().local_name() + "> at line " +
             std::to_string(reader.line());
    }

    std::int64_t
    parse_int(const xml_reader& reader, std::string_view local,
              const std::string& value) {
      std::int64_t result = 0;
      const char* first = value.data();
      const char* last = value.data() + value.size();
      if (!value.empty() && *first == '+') ++first;
      auto [ptr, ec] = std::from_chars(first, last, result);
      if (ec != std::errc{} || ptr != last || first == last) {
        throw std::runtime_error("spec_parser: attribute '" +
                                 std::string(local) + "' of " + where(reader) +
                                 " is not an integer: '" + value + "'");
      }
      return result;
    }

  } // namespace

  bool
  is_whitespace_only(std::string_view sv) {
    return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
      return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    });
  }

  bool
  read_skip_ws(xml_reader& reader) {
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::characters &&
          is_whitespace_only(reader.text()))
        continue;
      return true;
    }
    return false;
  }

  void
  skip_element(xml_reader& reader) {
    auto start_depth = reader.depth();

    while (reader.read()) {
      if (reader.node_type() == xml_node_type::end_element &&
          reader.depth() == start_depth)
        return;
    }
  }

  bool
  next_child(xml_reader& reader, std::size_t parent_depth) {
    while (read_skip_ws(reader)) {
      if (reader.node_type() == xml_node_type::end_element &&
          reader.depth() == parent_depth)
        return false;
      if (reader.node_type() == xml_node_type::start_element) return true;
    }
    throw std::runtime_error("spec_parser: unexpected end of document");
  }

  std::optional<std::string>
  opt_attr(const xml_reader& reader, std::string_view local) {
    for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
      if (reader.attribute_name(i).local_name() == local &&
          reader.attribute_name(i).namespace_uri().empty()) {
        return std::string(reader.attribute_value(i));
      }
    }
    return std::nullopt;
  }

  std::string
  req_attr(const xml_reader& reader, std::string_view local) {
    auto val = opt_attr(reader, local);
    if (!val.has_value()) {
      throw std::runtime_error("spec_parser: missing required attribute '" +
                               std::string(local) + "' on " + where(reader));
    }
    return val.value();
  }

  std::optional<std::int64_t>
  opt_int_attr(const xml_reader& reader, std::string_view local) {
    auto val = opt_attr(reader, local);
    if (!val.has_value() || val->empty()) return std::nullopt;
    return parse_int(reader, local, val.value());
  }

  std::int64_t
  req_int_attr(const xml_reader& reader, std::string_view local) {
    return parse_int(reader, local, req_attr(reader, local));
  }

  bool
  bool_attr(const xml_reader& reader, std::string_view local,
            bool default_value) {
    auto val = opt_attr(reader, local);
    if (!val.has_value()) return default_value;
    if (val.value() == "true" || val.value() == "1") return true;
    if (val.value() == "false" || val.value() == "0") return false;
    throw std::runtime_error("spec_parser: attribute '" + std::string(local) +
                             "' of " + where(reader) +
                             " is not a boolean: '" + val.value() + "'");
  }

} // namespace mosdl
