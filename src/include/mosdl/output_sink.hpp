#pragma once

#include <mosdl/specification.hpp>

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

namespace mosdl {

  inline constexpr std::string_view mosdl_file_extension = ".mosdl";

  // "<AreaName>.mosdl"
  std::string
  output_unit_name(const area& a);

  // Destination of the rendered text, one stream per area. Destroying the
  // returned stream releases the unit.
  class output_sink {
  public:
    virtual ~output_sink() = default;

    virtual std::unique_ptr<std::ostream>
    open(const std::string& unit_name) = 0;
  };

  // Writes each unit to a file of the same name inside a directory.
  class directory_sink : public output_sink {
    std::filesystem::path directory_;

  public:
    explicit directory_sink(std::filesystem::path directory);

    std::unique_ptr<std::ostream>
    open(const std::string& unit_name) override;
  };

} // namespace mosdl
