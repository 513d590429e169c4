#include <mosdl/output_sink.hpp>

#include <mosdl/generator_error.hpp>

#include <fstream>
#include <system_error>

namespace mosdl {

  std::string
  output_unit_name(const area& a) {
    return a.name + std::string(mosdl_file_extension);
  }

  directory_sink::directory_sink(std::filesystem::path directory)
      : directory_(std::move(directory)) {}

  std::unique_ptr<std::ostream>
  directory_sink::open(const std::string& unit_name) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
      throw generator_error("cannot create output directory '" +
                            directory_.string() + "': " + ec.message());
    }

    auto path = directory_ / unit_name;
    auto out = std::make_unique<std::ofstream>(path, std::ios::binary |
                                                         std::ios::trunc);
    if (!*out) {
      throw generator_error("cannot write file: " + path.string());
    }
    return out;
  }

} // namespace mosdl
