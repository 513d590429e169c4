#include <mosdl/generator.hpp>

#include <catch2/catch.hpp>

#include <map>
#include <memory>
#include <sstream>
#include <string>

using namespace mosdl;

namespace {

  // Keeps every unit in memory.
  class memory_sink : public output_sink {
    std::map<std::string, std::unique_ptr<std::stringbuf>> units_;

  public:
    std::unique_ptr<std::ostream>
    open(const std::string& unit_name) override {
      auto& buf = units_[unit_name];
      buf = std::make_unique<std::stringbuf>();
      return std::make_unique<std::ostream>(buf.get());
    }

    std::size_t
    size() const {
      return units_.size();
    }

    bool
    contains(const std::string& unit_name) const {
      return units_.count(unit_name) != 0;
    }

    std::string
    text(const std::string& unit_name) const {
      return units_.at(unit_name)->str();
    }
  };

  type_reference
  mal(std::string name, bool list = false) {
    return type_reference{"MAL", std::nullopt, std::move(name), list};
  }

  field
  required(std::string name, type_reference type) {
    return field{std::move(name), std::move(type), false, std::nullopt};
  }

  operation
  request(std::string name, std::int64_t number, std::vector<field> in,
          std::vector<field> out) {
    operation op;
    op.name = std::move(name);
    op.number = number;
    op.pattern = interaction_pattern::request;
    op.messages = {message{interaction_stage::request, std::nullopt,
                           std::move(in)},
                   message{interaction_stage::request_response, std::nullopt,
                           std::move(out)}};
    return op;
  }

  area
  test_area() {
    operation add;
    add.name = "addDefinition";
    add.number = 3;
    add.pattern = interaction_pattern::submit;
    add.messages = {message{interaction_stage::submit,
                            std::nullopt,
                            {required("definitionId", mal("Identifier")),
                             required("newDefinition", mal("Element"))}}};

    service svc;
    svc.name = "ServiceName";
    svc.number = 1;
    svc.capability_sets = {
        capability_set{
            7,
            std::nullopt,
            {request("listDefinitions", 1, {},
                     {required("definitionIds", mal("Identifier", true))}),
             request("getDefinition", 2,
                     {required("definitionId", mal("Identifier"))},
                     {required("definition", mal("Element"))})}},
        capability_set{std::nullopt, std::nullopt, {add}},
    };

    area a;
    a.name = "test";
    a.number = 4711;
    a.services.push_back(std::move(svc));
    return a;
  }

  struct context_fixture {
    area a;
    service svc;

    context_fixture() {
      a.name = "test";
      svc.name = "ServiceName";
    }

    render_context
    at_area(doc_mode docs = doc_mode::bulk) const {
      render_context ctx;
      ctx.current_area = &a;
      ctx.docs = docs;
      return ctx;
    }
  };

  std::string
  render(const data_type& type, const render_context& ctx, int depth = 0) {
    std::ostringstream os;
    line_writer out(os);
    for (int i = 0; i < depth; ++i)
      out.indent();
    write_data_type(out, ctx, type);
    return os.str();
  }

} // namespace

TEST_CASE("area with one service", "[generator]") {
  generator gen;
  std::ostringstream os;
  gen.render_area(test_area(), os);

  CHECK(os.str() == "area test [4711]\n"
                    "\n"
                    "service ServiceName [1] {\n"
                    "\tcapability [7] {\n"
                    "\t\trequest listDefinitions [1] ()\n"
                    "\t\t\t-> (definitionIds: List<Identifier>)\n"
                    "\n"
                    "\t\trequest getDefinition [2] (definitionId: Identifier)\n"
                    "\t\t\t-> (definition: Element)\n"
                    "\n"
                    "\t}\n"
                    "\n"
                    "\tcapability {\n"
                    "\t\tsubmit addDefinition [3] (definitionId: Identifier, "
                    "newDefinition: Element)\n"
                    "\n"
                    "\t}\n"
                    "\n"
                    "}\n"
                    "\n");
}

TEST_CASE("area header carries the version unless it is 1", "[generator]") {
  area a;
  a.name = "COM";
  a.number = 2;
  a.version = 3;
  a.comment = "Common object model.";

  generator gen;
  std::ostringstream os;
  gen.render_area(a, os);
  CHECK(os.str() == "/// Common object model.\n"
                    "area COM [2.3]\n"
                    "\n");
}

TEST_CASE("area names are escaped", "[generator]") {
  area a;
  a.name = "error";
  a.number = 9;

  generator gen(generator_options{doc_mode::suppress});
  std::ostringstream os;
  gen.render_area(a, os);
  CHECK(os.str() == "area \"error\" [9]\n\n");
}

TEST_CASE("composite with fields", "[generator]") {
  context_fixture f;
  composite_type composite;
  composite.name = "DefinitionDetails";
  composite.short_form_part = 1;
  composite.extends = mal("Composite");
  composite.comment = "Details of a definition.";
  composite.fields = {
      field{"name", mal("Identifier"), false, "Name of the definition."},
      field{"kind", type_reference{"test", std::nullopt, "Kind", false}, true,
            std::nullopt},
  };

  CHECK(render(composite, f.at_area().in_service(f.svc), 1) ==
        "\t/// Details of a definition.\n"
        "\tcomposite DefinitionDetails [1] extends Composite {\n"
        "\t\t/// Name of the definition.\n"
        "\t\tname: Identifier\n"
        "\t\tkind: test::Kind?\n"
        "\t}\n");
}

TEST_CASE("abstract composite omits id and parent", "[generator]") {
  context_fixture f;
  composite_type composite;
  composite.name = "BaseDetails";
  composite.extends = mal("Composite");
  composite.fields = {required("id", mal("Long"))};

  CHECK(render(composite, f.at_area()) == "abstract composite BaseDetails {\n"
                                          "\tid: Long\n"
                                          "}\n");

  composite.short_form_part = 0;
  CHECK(render(composite, f.at_area()).rfind("abstract composite", 0) == 0);
}

TEST_CASE("enumeration items", "[generator]") {
  context_fixture f;
  enumeration_type enumeration;
  enumeration.name = "Kind";
  enumeration.short_form_part = 2;
  enumeration.comment = "Kind of definition.";
  enumeration.items = {enumeration_item{"SIMPLE", 1, "A simple one."},
                       enumeration_item{"COMPLEX", 2, std::nullopt}};

  CHECK(render(enumeration, f.at_area()) == "/// Kind of definition.\n"
                                            "enum Kind [2] {\n"
                                            "\t/// A simple one.\n"
                                            "\tSIMPLE [1]\n"
                                            "\tCOMPLEX [2]\n"
                                            "}\n");
}

TEST_CASE("attribute and fundamental types", "[generator]") {
  context_fixture f;
  CHECK(render(attribute_type{"Counter", 3, std::nullopt}, f.at_area()) ==
        "attribute Counter [3]\n");
  CHECK(render(fundamental_type{"Base", mal("Element"), std::nullopt},
               f.at_area()) == "fundamental Base extends Element\n");
  CHECK(render(fundamental_type{"Root", std::nullopt, std::nullopt},
               f.at_area()) == "fundamental Root\n");
}

TEST_CASE("suppressed data type documentation", "[generator]") {
  context_fixture f;
  enumeration_type enumeration;
  enumeration.name = "Kind";
  enumeration.short_form_part = 2;
  enumeration.comment = "Kind of definition.";
  enumeration.items = {enumeration_item{"SIMPLE", 1, "A simple one."}};

  CHECK(render(enumeration, f.at_area(doc_mode::suppress)) ==
        "enum Kind [2] {\n"
        "\tSIMPLE [1]\n"
        "}\n");
}

TEST_CASE("area errors", "[generator]") {
  context_fixture f;
  std::vector<error_definition> errors = {
      error_definition{"DUPLICATE", 70002, "Definition exists already.",
                       extra_information{mal("Identifier"), std::nullopt}},
      error_definition{"LIMIT_REACHED", 70003, std::nullopt, std::nullopt},
  };

  std::ostringstream os;
  line_writer out(os);
  write_errors(out, f.at_area(), errors);
  CHECK(os.str() == "/// Definition exists already.\n"
                    "error DUPLICATE [70002]: Identifier\n"
                    "\n"
                    "error LIMIT_REACHED [70003]\n"
                    "\n");
}

TEST_CASE("documented extra information of an area error",
          "[generator]") {
  context_fixture f;
  std::vector<error_definition> errors = {
      error_definition{"DUPLICATE", 70002, std::nullopt,
                       extra_information{mal("Identifier"), "The existing id."}},
  };

  SECTION("bulk") {
    std::ostringstream os;
    line_writer out(os);
    write_errors(out, f.at_area(), errors);
    CHECK(os.str() == "error DUPLICATE [70002]:\n"
                      "\t/// The existing id.\n"
                      "\tIdentifier\n"
                      "\n");
  }

  SECTION("suppress") {
    std::ostringstream os;
    line_writer out(os);
    write_errors(out, f.at_area(doc_mode::suppress), errors);
    CHECK(os.str() == "error DUPLICATE [70002]:\n"
                      "\tIdentifier\n"
                      "\n");
  }
}

TEST_CASE("service data types and errors follow the capability sets",
          "[generator]") {
  area a;
  a.name = "test";
  a.number = 4711;

  service svc;
  svc.name = "Defs";
  svc.number = 2;
  svc.comment = "Definitions.";
  svc.data_types.emplace_back(attribute_type{"Counter", 3, std::nullopt});
  svc.errors.push_back(
      error_definition{"DUPLICATE", 70002, std::nullopt, std::nullopt});
  a.services.push_back(svc);
  a.data_types.emplace_back(
      fundamental_type{"Base", mal("Element"), std::nullopt});

  generator gen;
  std::ostringstream os;
  gen.render_area(a, os);
  CHECK(os.str() == "area test [4711]\n"
                    "\n"
                    "/// Definitions.\n"
                    "service Defs [2] {\n"
                    "\tattribute Counter [3]\n"
                    "\n"
                    "\terror DUPLICATE [70002]\n"
                    "\n"
                    "}\n"
                    "\n"
                    "fundamental Base extends Element\n"
                    "\n");
}

TEST_CASE("generate writes one unit per area", "[generator]") {
  specification spec;
  spec.areas.push_back(test_area());
  area com;
  com.name = "COM";
  com.number = 2;
  spec.areas.push_back(com);

  memory_sink sink;
  generator gen;
  gen.generate(spec, sink);

  REQUIRE(sink.size() == 2);
  REQUIRE(sink.contains("test.mosdl"));
  REQUIRE(sink.contains("COM.mosdl"));
  CHECK(sink.text("COM.mosdl") == "area COM [2]\n\n");

  std::ostringstream expected;
  gen.render_area(spec.areas[0], expected);
  CHECK(sink.text("test.mosdl") == expected.str());
}

TEST_CASE("area-level references inside the area are qualified",
          "[generator]") {
  area a;
  a.name = "test";
  a.number = 4711;
  type_reference base{"test", std::nullopt, "Base", false};

  a.data_types.emplace_back(
      fundamental_type{"Base", mal("Element"), std::nullopt});
  composite_type child;
  child.name = "Child";
  child.short_form_part = 2;
  child.extends = base;
  child.fields = {required("b", base)};
  a.data_types.emplace_back(child);
  a.errors.push_back(error_definition{"E", 5, std::nullopt,
                                      extra_information{base, std::nullopt}});

  generator gen;
  std::ostringstream os;
  gen.render_area(a, os);
  CHECK(os.str() == "area test [4711]\n"
                    "\n"
                    "fundamental Base extends Element\n"
                    "\n"
                    "composite Child [2] extends test::Base {\n"
                    "\tb: test::Base\n"
                    "}\n"
                    "\n"
                    "error E [5]: test::Base\n"
                    "\n");
}

TEST_CASE("generate reports a failed write", "[generator]") {
  // A stream buffer without storage whose overflow always fails.
  class failing_buf : public std::streambuf {};

  class failing_sink : public output_sink {
    failing_buf buf_;

  public:
    std::unique_ptr<std::ostream>
    open(const std::string&) override {
      return std::make_unique<std::ostream>(&buf_);
    }
  };

  specification spec;
  spec.areas.push_back(test_area());

  failing_sink sink;
  generator gen;
  try {
    gen.generate(spec, sink);
    FAIL("expected generator_error");
  } catch (const generator_error& e) {
    std::string msg = e.what();
    CHECK(msg.rfind("test.mosdl: write failed: ", 0) == 0);
    CHECK(msg.size() > std::string("test.mosdl: write failed: ").size());
  }
}

TEST_CASE("generate reports the failing unit", "[generator]") {
  specification spec;
  area a = test_area();
  a.services[0].capability_sets[0].operations[0].messages.pop_back();
  spec.areas.push_back(a);

  memory_sink sink;
  generator gen;
  try {
    gen.generate(spec, sink);
    FAIL("expected generator_error");
  } catch (const generator_error& e) {
    std::string msg = e.what();
    CHECK(msg.rfind("test.mosdl: ", 0) == 0);
    CHECK(msg.find("listDefinitions") != std::string::npos);
  }
}

TEST_CASE("output unit names", "[generator]") {
  area a;
  a.name = "MAL";
  CHECK(output_unit_name(a) == "MAL.mosdl");
}
