#include <mosdl/type_resolver.hpp>

#include <mosdl/naming.hpp>

#include <unordered_set>

namespace mosdl {

  namespace {

    const std::unordered_set<std::string_view>&
    mal_builtins() {
      static const std::unordered_set<std::string_view> names = {
          "Blob",     "Boolean",  "Double",    "Duration",  "FineTime",
          "Float",    "Identifier", "Integer", "Long",      "Octet",
          "Short",    "String",   "Time",      "UInteger",  "ULong",
          "UOctet",   "URI",      "UShort",    "Attribute", "Composite",
          "Element",
      };
      return names;
    }

  } // namespace

  bool
  is_mal_builtin(const type_reference& ref) {
    return ref.area == mal_area && !ref.service.has_value() &&
           mal_builtins().count(ref.name) != 0;
  }

  std::string
  resolve_type(const type_reference& ref, bool nullable,
               const render_context& ctx) {
    bool same_area =
        ctx.current_area != nullptr && ctx.current_area->name == ref.area;
    // Outside of a service nothing counts as the same service.
    bool same_service = ctx.current_service != nullptr &&
                        ref.service.has_value() &&
                        *ref.service == ctx.current_service->name;

    std::string result;
    if (ref.list) {
      result += "List";
      if (nullable) result += '?';
      result += '<';
    }
    // A type of the same name may exist at area level and in a service, so
    // the area may only be dropped when the service matches as well.
    if (!is_mal_builtin(ref) && !(same_area && same_service)) {
      result += escape_identifier(ref.area);
      result += "::";
    }
    if (ref.service.has_value() && !same_service) {
      result += escape_identifier(*ref.service);
      result += '.';
    }
    result += escape_identifier(ref.name);
    if (!ref.list && nullable) result += '?';
    if (ref.list) result += '>';
    return result;
  }

} // namespace mosdl
