#include <mosdl/generator_error.hpp>
#include <mosdl/operation_writer.hpp>

#include <catch2/catch.hpp>

#include <sstream>

using namespace mosdl;

namespace {

  type_reference
  mal(std::string name, bool list = false) {
    return type_reference{"MAL", std::nullopt, std::move(name), list};
  }

  field
  required(std::string name, type_reference type) {
    return field{std::move(name), std::move(type), false, std::nullopt};
  }

  operation
  make_operation(std::string name, std::int64_t number,
                 interaction_pattern pattern) {
    operation op;
    op.name = std::move(name);
    op.number = number;
    op.pattern = pattern;
    for (auto stage : pattern_stages(pattern))
      op.messages.push_back(message{stage, std::nullopt, {}});
    return op;
  }

  operation
  get_definition() {
    auto op = make_operation("getDefinition", 2, interaction_pattern::request);
    op.messages[0].fields.push_back(
        required("definitionId", mal("Identifier")));
    op.messages[1].fields.push_back(required("definition", mal("Element")));

    error_reference unknown;
    unknown.type = mal("UNKNOWN");
    unknown.comment = "Definition does not exist.";
    unknown.extra_info =
        extra_information{mal("UInteger"), "Index of the unknown identifier."};
    op.errors.emplace_back(std::move(unknown));
    return op;
  }

  struct fixture {
    area test_area;
    service svc;

    fixture() {
      test_area.name = "test";
      svc.name = "ServiceName";
    }

    render_context
    context(doc_mode docs) const {
      render_context ctx;
      ctx.current_area = &test_area;
      ctx.docs = docs;
      return ctx.in_service(svc);
    }

    std::string
    render(const operation& op, doc_mode docs = doc_mode::bulk) const {
      std::ostringstream os;
      line_writer out(os);
      write_operation(out, context(docs), op);
      return os.str();
    }
  };

} // namespace

TEST_CASE("send operation supporting replay", "[operation_writer]") {
  fixture f;
  auto op = make_operation("ping", 4, interaction_pattern::send);
  op.support_in_replay = true;
  CHECK(f.render(op) == "send *ping [4] ()\n\n");
}

TEST_CASE("submit operation lists its fields", "[operation_writer]") {
  fixture f;
  auto op = make_operation("addDefinition", 3, interaction_pattern::submit);
  op.messages[0].fields = {required("definitionId", mal("Identifier")),
                           required("newDefinition", mal("Element"))};
  CHECK(f.render(op) == "submit addDefinition [3] (definitionId: Identifier, "
                        "newDefinition: Element)\n\n");
}

TEST_CASE("invoke operation with a reserved name", "[operation_writer]") {
  fixture f;
  auto op = make_operation("import", 5, interaction_pattern::invoke);
  op.messages[0].fields.push_back(field{"source", mal("URI"), true, {}});
  op.messages[2].fields.push_back(required("count", mal("UInteger")));
  CHECK(f.render(op) == "invoke \"import\" [5] (source: URI?)\n"
                        "\t-> ()\n"
                        "\t-> (count: UInteger)\n\n");
}

TEST_CASE("progress operation marks the update message", "[operation_writer]") {
  fixture f;
  auto op = make_operation("copy", 6, interaction_pattern::progress);
  op.messages[0].fields.push_back(
      field{"ids", mal("Identifier", true), true, {}});
  op.messages[2].fields.push_back(required("percent", mal("UOctet")));
  CHECK(f.render(op) == "progress copy [6] (ids: List?<Identifier>)\n"
                        "\t-> ()\n"
                        "\t-> (percent: UOctet)*\n"
                        "\t-> ()\n\n");
}

TEST_CASE("pubsub operation publishes a single message", "[operation_writer]") {
  fixture f;
  auto op =
      make_operation("monitorDefinitions", 7, interaction_pattern::pubsub);
  op.messages[0].fields.push_back(
      field{"details",
            type_reference{"test", "ServiceName", "DefinitionDetails", true},
            true,
            {}});
  CHECK(f.render(op) == "pubsub monitorDefinitions [7] <- (details: "
                        "List?<DefinitionDetails>)\n\n");
}

TEST_CASE("bulk mode gathers error documentation", "[operation_writer]") {
  fixture f;
  CHECK(f.render(get_definition()) ==
        "\"\"\"\n"
        "@error MAL::UNKNOWN: Definition does not exist.\n"
        "@errorinfo MAL::UNKNOWN: Index of the unknown identifier.\n"
        "\"\"\"\n"
        "request getDefinition [2] (definitionId: Identifier)\n"
        "\t-> (definition: Element)\n"
        "\tthrows MAL::UNKNOWN: UInteger\n\n");
}

TEST_CASE("inline mode documents each error", "[operation_writer]") {
  fixture f;
  auto op = get_definition();
  auto& unknown = std::get<error_reference>(op.errors[0]);
  unknown.extra_info->comment = "Index of the\nunknown identifier.";

  CHECK(f.render(op, doc_mode::inline_docs) ==
        "request getDefinition [2] (definitionId: Identifier)\n"
        "\t-> (definition: Element)\n"
        "\tthrows\n"
        "\t\t/// Definition does not exist.\n"
        "\t\tMAL::UNKNOWN:\n"
        "\t\t\t\"\"\"\n"
        "\t\t\tIndex of the\n"
        "\t\t\tunknown identifier.\n"
        "\t\t\t\"\"\"\n"
        "\t\t\tUInteger\n\n");
}

TEST_CASE("inline mode separates documented errors with commas",
          "[operation_writer]") {
  fixture f;
  auto op = get_definition();
  op.errors.emplace_back(
      error_definition{"IMPORT_FAILED", 70001, "Cannot read.", std::nullopt});

  CHECK(f.render(op, doc_mode::inline_docs) ==
        "request getDefinition [2] (definitionId: Identifier)\n"
        "\t-> (definition: Element)\n"
        "\tthrows\n"
        "\t\t/// Definition does not exist.\n"
        "\t\tMAL::UNKNOWN:\n"
        "\t\t\t/// Index of the unknown identifier.\n"
        "\t\t\tUInteger,\n"
        "\t\t/// Cannot read.\n"
        "\t\terror IMPORT_FAILED [70001]\n\n");
}

TEST_CASE("suppress mode keeps errors on one line", "[operation_writer]") {
  fixture f;
  auto op = get_definition();
  op.errors.emplace_back(
      error_definition{"IMPORT_FAILED", 70001, "Cannot read.", std::nullopt});

  CHECK(f.render(op, doc_mode::suppress) ==
        "request getDefinition [2] (definitionId: Identifier)\n"
        "\t-> (definition: Element)\n"
        "\tthrows MAL::UNKNOWN: UInteger, error IMPORT_FAILED [70001]\n\n");
}

TEST_CASE("inline mode puts documented fields on their own lines",
          "[operation_writer]") {
  fixture f;
  auto op = make_operation("getValue", 1, interaction_pattern::request);
  op.comment = "Looks up a value.";
  op.messages[0].fields = {
      field{"key", mal("Identifier"), false, "The key."},
      required("scope", mal("String")),
  };
  op.messages[1].comment = "The result.";
  op.messages[1].fields.push_back(field{"value", mal("Element"), true, {}});

  CHECK(f.render(op, doc_mode::inline_docs) == "/// Looks up a value.\n"
                                               "request getValue [1] (\n"
                                               "\t\t/// The key.\n"
                                               "\t\tkey: Identifier,\n"
                                               "\t\tscope: String\n"
                                               "\t)\n"
                                               "\t/// The result.\n"
                                               "\t-> (value: Element?)\n\n");
}

TEST_CASE("inline mode breaks the line before a documented first message",
          "[operation_writer]") {
  fixture f;
  auto op = make_operation("notify", 8, interaction_pattern::send);
  op.messages[0].comment = "Sent once.";
  op.messages[0].fields.push_back(required("id", mal("Long")));

  CHECK(f.render(op, doc_mode::inline_docs) == "send notify [8] \n"
                                               "\t/// Sent once.\n"
                                               "\t(id: Long)\n\n");
}

TEST_CASE("message count must match the pattern", "[operation_writer]") {
  fixture f;
  auto op = make_operation("getValue", 1, interaction_pattern::request);
  op.messages.pop_back();
  CHECK_THROWS_AS(f.render(op), generator_error);
}

TEST_CASE("format_fields joins fields with commas", "[operation_writer]") {
  fixture f;
  std::vector<field> fields = {
      required("a", mal("Boolean")),
      field{"b", type_reference{"test", std::nullopt, "Kind", true}, true, {}},
  };
  CHECK(format_fields(fields, f.context(doc_mode::bulk)) ==
        "a: Boolean, b: List?<test::Kind>");
  CHECK(format_fields({}, f.context(doc_mode::bulk)).empty());
}
