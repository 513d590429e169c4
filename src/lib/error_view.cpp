#include <mosdl/error_view.hpp>

#include <mosdl/naming.hpp>
#include <mosdl/type_resolver.hpp>

#include <type_traits>

namespace mosdl {

  std::string
  error_declaration(const error_definition& error) {
    return "error " + escape_identifier(error.name) + " [" +
           std::to_string(error.number) + "]";
  }

  error_view
  describe_error(const operation_error& error, const render_context& ctx) {
    return std::visit(
        [&ctx](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          error_view view;
          if constexpr (std::is_same_v<T, error_reference>) {
            view.name = resolve_type(e.type, ctx);
            view.declaration = view.name;
          } else {
            view.name = e.name;
            view.declaration = error_declaration(e);
          }
          view.comment = &e.comment;
          view.extra_info = e.extra_info ? &*e.extra_info : nullptr;
          return view;
        },
        error);
  }

  std::vector<error_view>
  describe_errors(const std::vector<operation_error>& errors,
                  const render_context& ctx) {
    std::vector<error_view> views;
    views.reserve(errors.size());
    for (const auto& e : errors)
      views.push_back(describe_error(e, ctx));
    return views;
  }

} // namespace mosdl
