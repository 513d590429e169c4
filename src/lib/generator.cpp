#include <mosdl/generator.hpp>

#include <mosdl/doc_formatter.hpp>
#include <mosdl/error_view.hpp>
#include <mosdl/log.hpp>
#include <mosdl/naming.hpp>
#include <mosdl/operation_writer.hpp>
#include <mosdl/type_resolver.hpp>

#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>

namespace mosdl {

  namespace {

    // Cause of a failed write: the system error if one was recorded, else the
    // stream state.
    std::string
    stream_failure(const std::ostream& os, int error) {
      if (error != 0) return std::generic_category().message(error);
      if (os.bad()) return "stream badbit set";
      return "stream failbit set";
    }

    std::string
    bracketed(std::int64_t number) {
      return "[" + std::to_string(number) + "]";
    }

    void
    write_composite(line_writer& out, const render_context& ctx,
                    const composite_type& composite) {
      write_doc(out, ctx.docs, composite.comment);

      bool is_abstract = composite.is_abstract();
      out.write_indent();
      if (is_abstract) out.write("abstract ");
      out.write("composite ").write(escape_identifier(composite.name));
      if (!is_abstract) {
        out.write(" ").write(bracketed(*composite.short_form_part));
        if (composite.extends)
          out.write(" extends ").write(resolve_type(*composite.extends, ctx));
      }
      out.write(" {").end_line();
      {
        indent_guard fields_indent(out);
        for (const auto& f : composite.fields) {
          write_doc(out, ctx.docs, f.comment);
          out.line(escape_identifier(f.name) + ": " +
                   resolve_type(f.type, f.can_be_null, ctx));
        }
      }
      out.line("}");
    }

    void
    write_enumeration(line_writer& out, const render_context& ctx,
                      const enumeration_type& enumeration) {
      write_doc(out, ctx.docs, enumeration.comment);
      out.line("enum " + escape_identifier(enumeration.name) + " " +
               bracketed(enumeration.short_form_part) + " {");
      {
        indent_guard items_indent(out);
        for (const auto& item : enumeration.items) {
          write_doc(out, ctx.docs, item.comment);
          out.line(escape_identifier(item.value) + " " +
                   bracketed(item.nvalue));
        }
      }
      out.line("}");
    }

    void
    write_attribute(line_writer& out, const render_context& ctx,
                    const attribute_type& attribute) {
      write_doc(out, ctx.docs, attribute.comment);
      out.line("attribute " + escape_identifier(attribute.name) + " " +
               bracketed(attribute.short_form_part));
    }

    void
    write_fundamental(line_writer& out, const render_context& ctx,
                      const fundamental_type& fundamental) {
      std::string extension;
      if (fundamental.extends)
        extension = " extends " + resolve_type(*fundamental.extends, ctx);
      write_doc(out, ctx.docs, fundamental.comment);
      out.line("fundamental " + escape_identifier(fundamental.name) +
               extension);
    }

  } // namespace

  void
  write_data_type(line_writer& out, const render_context& ctx,
                  const data_type& type) {
    std::visit(
        [&out, &ctx](const auto& t) {
          using T = std::decay_t<decltype(t)>;
          if constexpr (std::is_same_v<T, composite_type>) {
            write_composite(out, ctx, t);
          } else if constexpr (std::is_same_v<T, enumeration_type>) {
            write_enumeration(out, ctx, t);
          } else if constexpr (std::is_same_v<T, attribute_type>) {
            write_attribute(out, ctx, t);
          } else if constexpr (std::is_same_v<T, fundamental_type>) {
            write_fundamental(out, ctx, t);
          }
        },
        type);
  }

  void
  write_errors(line_writer& out, const render_context& ctx,
               const std::vector<error_definition>& errors) {
    for (const auto& error : errors) {
      write_doc(out, ctx.docs, error.comment);
      out.write_indent();
      out.write(error_declaration(error));
      write_error_extra_info(out, ctx,
                             error.extra_info ? &*error.extra_info : nullptr,
                             true);
      out.end_line();
      out.end_line();
    }
  }

  void
  write_capability_set(line_writer& out, const render_context& ctx,
                       const capability_set& cs) {
    write_doc(out, ctx.docs, cs.comment);
    if (cs.number)
      out.line("capability " + bracketed(*cs.number) + " {");
    else
      out.line("capability {");
    {
      indent_guard operations_indent(out);
      for (const auto& op : cs.operations)
        write_operation(out, ctx, op);
    }
    out.line("}");
    out.end_line();
  }

  void
  write_service(line_writer& out, const render_context& ctx,
                const service& s) {
    write_doc(out, ctx.docs, s.comment);
    out.line("service " + escape_identifier(s.name) + " " +
             bracketed(s.number) + " {");
    {
      indent_guard service_indent(out);
      for (const auto& cs : s.capability_sets)
        write_capability_set(out, ctx, cs);
      for (const auto& type : s.data_types) {
        write_data_type(out, ctx, type);
        out.end_line();
      }
      write_errors(out, ctx, s.errors);
    }
    out.line("}");
    out.end_line();
  }

  generator::generator(generator_options options) : options_(options) {}

  void
  generator::render_area(const area& a, std::ostream& os) const {
    line_writer out(os);
    render_context ctx;
    ctx.current_area = &a;
    ctx.docs = options_.docs;

    write_doc(out, ctx.docs, a.comment);
    std::string header = "area " + escape_identifier(a.name) + " [" +
                         std::to_string(a.number);
    if (a.version != 1) header += "." + std::to_string(a.version);
    header += "]";
    out.line(header);
    out.end_line();

    // TODO: emit import statements once cross-area dependencies are tracked

    for (const auto& s : a.services)
      write_service(out, ctx.in_service(s), s);

    for (const auto& type : a.data_types) {
      write_data_type(out, ctx, type);
      out.end_line();
    }

    write_errors(out, ctx, a.errors);

    if (out.depth() != 0) {
      throw generator_error("area '" + a.name +
                            "': indentation not balanced at end of area");
    }
  }

  void
  generator::generate(const specification& spec, output_sink& sink) const {
    logger()->debug("Generating MOSDL output for {} area(s).",
                    spec.areas.size());
    for (const auto& a : spec.areas) {
      auto unit_name = output_unit_name(a);
      logger()->debug("Generating MOSDL unit '{}'.", unit_name);

      auto os = sink.open(unit_name);
      if (!os || !*os) {
        throw generator_error(unit_name + ": cannot open output");
      }

      errno = 0;
      try {
        render_area(a, *os);
      } catch (const generator_error& e) {
        throw generator_error(unit_name + ": " + e.what());
      }

      os->flush();
      if (!*os) {
        throw generator_error(unit_name + ": write failed: " +
                              stream_failure(*os, errno));
      }
      os.reset();

      logger()->debug("Generated MOSDL unit '{}'.", unit_name);
    }
    logger()->debug("Generated all MOSDL units.");
  }

} // namespace mosdl
