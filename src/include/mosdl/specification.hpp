#pragma once

#include <mosdl/interaction.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mosdl {

  // Reference to a data type or error by area, optional service and name.
  struct type_reference {
    std::string area;
    std::optional<std::string> service;
    std::string name;
    bool list = false;

    bool
    operator==(const type_reference&) const = default;
  };

  struct field {
    std::string name;
    type_reference type;
    bool can_be_null = true;
    std::optional<std::string> comment;

    bool
    operator==(const field&) const = default;
  };

  struct message {
    interaction_stage stage = interaction_stage::send;
    std::optional<std::string> comment;
    std::vector<field> fields;

    bool
    operator==(const message&) const = default;
  };

  struct extra_information {
    type_reference type;
    std::optional<std::string> comment;

    bool
    operator==(const extra_information&) const = default;
  };

  // Reuse of an error defined elsewhere, optionally narrowing its extra
  // information.
  struct error_reference {
    type_reference type;
    std::optional<std::string> comment;
    std::optional<extra_information> extra_info;

    bool
    operator==(const error_reference&) const = default;
  };

  struct error_definition {
    std::string name;
    std::int64_t number = 0;
    std::optional<std::string> comment;
    std::optional<extra_information> extra_info;

    bool
    operator==(const error_definition&) const = default;
  };

  using operation_error = std::variant<error_reference, error_definition>;

  struct operation {
    std::string name;
    std::int64_t number = 0;
    std::optional<std::string> comment;
    bool support_in_replay = false;
    interaction_pattern pattern = interaction_pattern::send;
    std::vector<message> messages;
    std::vector<operation_error> errors;

    bool
    operator==(const operation&) const = default;
  };

  struct capability_set {
    std::optional<std::int64_t> number;
    std::optional<std::string> comment;
    std::vector<operation> operations;

    bool
    operator==(const capability_set&) const = default;
  };

  struct composite_type {
    std::string name;
    std::optional<std::int64_t> short_form_part;
    std::optional<type_reference> extends;
    std::vector<field> fields;
    std::optional<std::string> comment;

    // Composites without a short form part cannot be instantiated.
    bool
    is_abstract() const {
      return !short_form_part.has_value() || *short_form_part == 0;
    }

    bool
    operator==(const composite_type&) const = default;
  };

  struct enumeration_item {
    std::string value;
    std::int64_t nvalue = 0;
    std::optional<std::string> comment;

    bool
    operator==(const enumeration_item&) const = default;
  };

  struct enumeration_type {
    std::string name;
    std::int64_t short_form_part = 0;
    std::vector<enumeration_item> items;
    std::optional<std::string> comment;

    bool
    operator==(const enumeration_type&) const = default;
  };

  struct attribute_type {
    std::string name;
    std::int64_t short_form_part = 0;
    std::optional<std::string> comment;

    bool
    operator==(const attribute_type&) const = default;
  };

  struct fundamental_type {
    std::string name;
    std::optional<type_reference> extends;
    std::optional<std::string> comment;

    bool
    operator==(const fundamental_type&) const = default;
  };

  using data_type = std::variant<composite_type, enumeration_type,
                                 attribute_type, fundamental_type>;

  struct service {
    std::string name;
    std::int64_t number = 0;
    std::optional<std::string> comment;
    std::vector<capability_set> capability_sets;
    std::vector<data_type> data_types;
    std::vector<error_definition> errors;

    bool
    operator==(const service&) const = default;
  };

  struct area {
    std::string name;
    std::int64_t number = 0;
    std::int64_t version = 1;
    std::optional<std::string> comment;
    std::vector<service> services;
    std::vector<data_type> data_types;
    std::vector<error_definition> errors;

    bool
    operator==(const area&) const = default;
  };

  struct specification {
    std::vector<area> areas;

    // Append the areas of another document.
    void
    merge(specification other) {
      for (auto& a : other.areas)
        areas.push_back(std::move(a));
    }

    bool
    operator==(const specification&) const = default;
  };

} // namespace mosdl
