#pragma once

#include <mosdl/generator_error.hpp>
#include <mosdl/line_writer.hpp>
#include <mosdl/output_sink.hpp>
#include <mosdl/render_context.hpp>
#include <mosdl/specification.hpp>

#include <ostream>

namespace mosdl {

  struct generator_options {
    doc_mode docs = doc_mode::bulk;
  };

  // Renders a specification as MOSDL text, one output unit per area.
  class generator {
    generator_options options_;

  public:
    explicit generator(generator_options options = {});

    // Render every area into its own unit of the sink, in declaration order.
    // The first failure aborts the remaining areas with a generator_error.
    void
    generate(const specification& spec, output_sink& sink) const;

    // Render a single area into a stream.
    void
    render_area(const area& a, std::ostream& os) const;
  };

  // Building blocks of render_area, usable on their own.
  void
  write_data_type(line_writer& out, const render_context& ctx,
                  const data_type& type);

  void
  write_errors(line_writer& out, const render_context& ctx,
               const std::vector<error_definition>& errors);

  void
  write_capability_set(line_writer& out, const render_context& ctx,
                       const capability_set& cs);

  void
  write_service(line_writer& out, const render_context& ctx,
                const service& s);

} // namespace mosdl
