#include <mosdl/spec_parser.hpp>

#include <mosdl/xml_io.hpp>

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace mosdl {

  namespace {

    std::string
    location(const xml_reader& reader) {
      return "<" + reader.name().local_name() + "> at line " +
             std::to_string(reader.line());
    }

    // Empty comments carry no documentation and load as absent.
    std::optional<std::string>
    comment_attr(const xml_reader& reader) {
      auto comment = opt_attr(reader, "comment");
      if (comment && comment->empty()) return std::nullopt;
      return comment;
    }

    type_reference
    parse_type(xml_reader& reader) {
      type_reference ref;
      ref.area = req_attr(reader, "area");
      auto service = opt_attr(reader, "service");
      if (service && !service->empty()) ref.service = std::move(service);
      ref.name = req_attr(reader, "name");
      ref.list = bool_attr(reader, "list", false);
      skip_element(reader);
      return ref;
    }

    // The single <type> child of the current element.
    type_reference
    parse_type_child(xml_reader& reader) {
      auto where = location(reader);
      auto depth = reader.depth();
      std::optional<type_reference> ref;
      while (next_child(reader, depth)) {
        if (reader.name().is("type"))
          ref = parse_type(reader);
        else
          skip_element(reader);
      }
      if (!ref) {
        throw std::runtime_error("spec_parser: missing <type> in " + where);
      }
      return std::move(*ref);
    }

    field
    parse_field(xml_reader& reader) {
      field f;
      f.name = req_attr(reader, "name");
      f.can_be_null = bool_attr(reader, "canBeNull", true);
      f.comment = comment_attr(reader);
      f.type = parse_type_child(reader);
      return f;
    }

    extra_information
    parse_extra_information(xml_reader& reader) {
      extra_information info;
      info.comment = comment_attr(reader);
      info.type = parse_type_child(reader);
      return info;
    }

    void
    parse_message(xml_reader& reader, message& msg) {
      msg.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("field"))
          msg.fields.push_back(parse_field(reader));
        else
          skip_element(reader);
      }
    }

    error_definition
    parse_error_definition(xml_reader& reader) {
      error_definition error;
      error.name = req_attr(reader, "name");
      error.number = req_int_attr(reader, "number");
      error.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("extraInformation"))
          error.extra_info = parse_extra_information(reader);
        else
          skip_element(reader);
      }
      return error;
    }

    error_reference
    parse_error_reference(xml_reader& reader) {
      auto where = location(reader);
      error_reference error;
      error.comment = comment_attr(reader);
      std::optional<type_reference> type;
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("type"))
          type = parse_type(reader);
        else if (reader.name().is("extraInformation"))
          error.extra_info = parse_extra_information(reader);
        else
          skip_element(reader);
      }
      if (!type) {
        throw std::runtime_error("spec_parser: missing <type> in " + where);
      }
      error.type = std::move(*type);
      return error;
    }

    void
    parse_operation_errors(xml_reader& reader,
                           std::vector<operation_error>& errors) {
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("errorRef"))
          errors.emplace_back(parse_error_reference(reader));
        else if (reader.name().is("error"))
          errors.emplace_back(parse_error_definition(reader));
        else
          skip_element(reader);
      }
    }

    void
    parse_error_definitions(xml_reader& reader,
                            std::vector<error_definition>& errors) {
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("error"))
          errors.push_back(parse_error_definition(reader));
        else
          skip_element(reader);
      }
    }

    std::optional<interaction_pattern>
    pattern_for_element(const qname& name) {
      static const std::array<std::pair<std::string_view, interaction_pattern>,
                              6>
          patterns = {{
              {"sendIP", interaction_pattern::send},
              {"submitIP", interaction_pattern::submit},
              {"requestIP", interaction_pattern::request},
              {"invokeIP", interaction_pattern::invoke},
              {"progressIP", interaction_pattern::progress},
              {"pubsubIP", interaction_pattern::pubsub},
          }};
      for (const auto& [element, pattern] : patterns) {
        if (name.is(element)) return pattern;
      }
      return std::nullopt;
    }

    // Position of a message element within the stage sequence of a pattern.
    std::optional<std::size_t>
    message_index(interaction_pattern pattern, const qname& name) {
      const auto& local = name.local_name();
      switch (pattern) {
        case interaction_pattern::send:
          if (local == "send") return 0;
          break;
        case interaction_pattern::submit:
          if (local == "submit") return 0;
          break;
        case interaction_pattern::request:
          if (local == "request") return 0;
          if (local == "response") return 1;
          break;
        case interaction_pattern::invoke:
          if (local == "invoke") return 0;
          if (local == "acknowledgement") return 1;
          if (local == "response") return 2;
          break;
        case interaction_pattern::progress:
          if (local == "progress") return 0;
          if (local == "acknowledgement") return 1;
          if (local == "update") return 2;
          if (local == "response") return 3;
          break;
        case interaction_pattern::pubsub:
          if (local == "publishNotify") return 0;
          break;
      }
      return std::nullopt;
    }

    operation
    parse_operation(xml_reader& reader, interaction_pattern pattern) {
      operation op;
      op.name = req_attr(reader, "name");
      op.number = req_int_attr(reader, "number");
      op.support_in_replay = bool_attr(reader, "supportInReplay", false);
      op.comment = comment_attr(reader);
      op.pattern = pattern;
      for (auto stage : pattern_stages(pattern))
        op.messages.push_back(message{stage, std::nullopt, {}});

      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("messages")) {
          auto messages_depth = reader.depth();
          while (next_child(reader, messages_depth)) {
            auto index = message_index(pattern, reader.name());
            if (index)
              parse_message(reader, op.messages[*index]);
            else
              skip_element(reader);
          }
        } else if (reader.name().is("errors")) {
          parse_operation_errors(reader, op.errors);
        } else {
          skip_element(reader);
        }
      }
      return op;
    }

    capability_set
    parse_capability_set(xml_reader& reader) {
      capability_set cs;
      cs.number = opt_int_attr(reader, "number");
      cs.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        auto pattern = pattern_for_element(reader.name());
        if (pattern)
          cs.operations.push_back(parse_operation(reader, *pattern));
        else
          skip_element(reader);
      }
      return cs;
    }

    composite_type
    parse_composite(xml_reader& reader) {
      composite_type composite;
      composite.name = req_attr(reader, "name");
      composite.short_form_part = opt_int_attr(reader, "shortFormPart");
      composite.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("extends"))
          composite.extends = parse_type_child(reader);
        else if (reader.name().is("field"))
          composite.fields.push_back(parse_field(reader));
        else
          skip_element(reader);
      }
      return composite;
    }

    enumeration_type
    parse_enumeration(xml_reader& reader) {
      enumeration_type enumeration;
      enumeration.name = req_attr(reader, "name");
      enumeration.short_form_part = req_int_attr(reader, "shortFormPart");
      enumeration.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("item")) {
          enumeration_item item;
          item.value = req_attr(reader, "value");
          item.nvalue = req_int_attr(reader, "nvalue");
          item.comment = comment_attr(reader);
          enumeration.items.push_back(std::move(item));
        }
        skip_element(reader);
      }
      return enumeration;
    }

    attribute_type
    parse_attribute(xml_reader& reader) {
      attribute_type attribute;
      attribute.name = req_attr(reader, "name");
      attribute.short_form_part = req_int_attr(reader, "shortFormPart");
      attribute.comment = comment_attr(reader);
      skip_element(reader);
      return attribute;
    }

    fundamental_type
    parse_fundamental(xml_reader& reader) {
      fundamental_type fundamental;
      fundamental.name = req_attr(reader, "name");
      fundamental.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("extends"))
          fundamental.extends = parse_type_child(reader);
        else
          skip_element(reader);
      }
      return fundamental;
    }

    void
    parse_data_types(xml_reader& reader, std::vector<data_type>& types) {
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        const auto& name = reader.name();
        if (name.is("composite"))
          types.emplace_back(parse_composite(reader));
        else if (name.is("enumeration"))
          types.emplace_back(parse_enumeration(reader));
        else if (name.is("attribute"))
          types.emplace_back(parse_attribute(reader));
        else if (name.is("fundamental"))
          types.emplace_back(parse_fundamental(reader));
        else
          skip_element(reader);
      }
    }

    service
    parse_service(xml_reader& reader) {
      service s;
      s.name = req_attr(reader, "name");
      s.number = req_int_attr(reader, "number");
      s.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("capabilitySet"))
          s.capability_sets.push_back(parse_capability_set(reader));
        else if (reader.name().is("dataTypes"))
          parse_data_types(reader, s.data_types);
        else if (reader.name().is("errors"))
          parse_error_definitions(reader, s.errors);
        else
          skip_element(reader);
      }
      return s;
    }

    area
    parse_area(xml_reader& reader) {
      area a;
      a.name = req_attr(reader, "name");
      a.number = req_int_attr(reader, "number");
      a.version = opt_int_attr(reader, "version").value_or(1);
      a.comment = comment_attr(reader);
      auto depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name().is("service") || reader.name().is("extendedService"))
          a.services.push_back(parse_service(reader));
        else if (reader.name().is("dataTypes"))
          parse_data_types(reader, a.data_types);
        else if (reader.name().is("errors"))
          parse_error_definitions(reader, a.errors);
        else
          skip_element(reader);
      }
      return a;
    }

  } // namespace

  specification
  spec_parser::parse(xml_reader& reader) {
    if (!read_skip_ws(reader) ||
        reader.node_type() != xml_node_type::start_element ||
        reader.name() !=
            qname(std::string(service_schema_ns), "specification")) {
      throw std::runtime_error(
          "spec_parser: expected <specification> root element in namespace " +
          std::string(service_schema_ns));
    }

    specification spec;
    auto depth = reader.depth();
    while (next_child(reader, depth)) {
      if (reader.name().is("area"))
        spec.areas.push_back(parse_area(reader));
      else
        skip_element(reader);
    }
    return spec;
  }

} // namespace mosdl
