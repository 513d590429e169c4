#pragma once

#include <mosdl/specification.hpp>
#include <mosdl/xml_reader.hpp>

#include <string_view>

namespace mosdl {

  inline constexpr std::string_view service_schema_ns =
      "http://www.ccsds.org/schema/ServiceSchema";

  // Reads a CCSDS MO service specification (ServiceSchema XML) into a
  // specification tree. Elements are matched by local name so that COM
  // extensions of the schema load as well; unknown elements are skipped.
  class spec_parser {
  public:
    specification
    parse(xml_reader& reader);
  };

} // namespace mosdl
