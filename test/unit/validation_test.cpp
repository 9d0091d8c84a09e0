#include <tocss/schema.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tocss;

namespace {

  field_def
  field(std::string name, std::string type) {
    return {std::move(name), std::move(type), {}};
  }

  type_schema
  make_enum(std::string name, std::vector<variant_def> variants) {
    type_schema s;
    s.name = std::move(name);
    s.kind = type_kind::enumeration;
    s.variants = std::move(variants);
    return s;
  }

  type_schema
  make_struct(std::string name, std::vector<field_def> fields) {
    type_schema s;
    s.name = name;
    s.kind = type_kind::structure;
    s.variants.push_back({std::move(name), std::move(fields), {}});
    return s;
  }

  // The rule text of the schema_error thrown by validate_schema.
  std::string
  violation(const type_schema& schema, std::string* location = nullptr) {
    try {
      validate_schema(schema);
    } catch (const schema_error& e) {
      if (location) *location = e.location();
      return e.rule();
    }
    return {};
  }

} // namespace

TEST_CASE("valid enum and struct pass", "[validation]") {
  variant_def px{"Px", {field("value", "float")}, {}};
  px.attrs.dimension = true;
  variant_def none{"None", {}, {}};
  none.attrs.keyword = "none";
  CHECK_NOTHROW(validate_schema(make_enum("Length", {px, none})));

  auto s = make_struct("Pair", {field("a", "int"), field("b", "int")});
  s.attrs.function = function_override::inherit();
  s.attrs.comma = true;
  CHECK_NOTHROW(validate_schema(s));
}

TEST_CASE("dimension with keyword rejected", "[validation]") {
  variant_def v{"Px", {field("value", "float")}, {}};
  v.attrs.dimension = true;
  v.attrs.keyword = "px";
  std::string location;
  auto rule = violation(make_enum("Length", {v}), &location);
  // The field count rule for keyword would also fire; the combination is
  // reported first.
  CHECK(rule == "'dimension' cannot be combined with 'keyword'");
  CHECK(location == "Length::Px");
}

TEST_CASE("dimension with function rejected", "[validation]") {
  variant_def v{"Px", {field("value", "float")}, {}};
  v.attrs.dimension = true;
  v.attrs.function = function_override("calc");
  CHECK(violation(make_enum("Length", {v})) ==
        "'dimension' cannot be combined with 'function'");
}

TEST_CASE("dimension with struct-level function rejected", "[validation]") {
  auto s = make_struct("Px", {field("value", "float")});
  s.variants.front().attrs.dimension = true;
  s.attrs.function = function_override::inherit();
  std::string location;
  CHECK(violation(s, &location) ==
        "'dimension' cannot be combined with 'function'");
  CHECK(location == "Px");
}

TEST_CASE("dimension needs exactly one field", "[validation]") {
  variant_def none{"Px", {}, {}};
  none.attrs.dimension = true;
  CHECK(violation(make_enum("L", {none})) ==
        "'dimension' requires exactly one field (found 0)");

  variant_def two{"Px", {field("a", "float"), field("b", "float")}, {}};
  two.attrs.dimension = true;
  CHECK(violation(make_enum("L", {two})) ==
        "'dimension' requires exactly one field (found 2)");
}

TEST_CASE("dimension counts skipped fields", "[validation]") {
  auto skipped = field("cache", "int");
  skipped.attrs.skip = true;
  variant_def v{"Px", {field("value", "float"), skipped}, {}};
  v.attrs.dimension = true;
  CHECK(violation(make_enum("L", {v})) ==
        "'dimension' requires exactly one field (found 2)");
}

TEST_CASE("keyword needs a variant without fields", "[validation]") {
  auto skipped = field("cache", "int");
  skipped.attrs.skip = true;
  variant_def v{"Hidden", {skipped}, {}};
  v.attrs.keyword = "none";
  CHECK(violation(make_enum("K", {v})) ==
        "'keyword' requires a variant without fields (found 1)");
}

TEST_CASE("function and comma not allowed on enums", "[validation]") {
  auto e = make_enum("K", {{"A", {}, {}}});
  e.attrs.function = function_override::inherit();
  CHECK(violation(e) == "'function' is not allowed on enums");

  e.attrs.function.reset();
  e.attrs.comma = true;
  CHECK(violation(e) == "'comma' is not allowed on enums");
}

TEST_CASE("enum without variants rejected", "[validation]") {
  CHECK(violation(make_enum("K", {})) ==
        "an enum must declare at least one variant");
}

TEST_CASE("struct must have one variant", "[validation]") {
  auto s = make_struct("S", {});
  s.variants.push_back({"Other", {}, {}});
  CHECK(violation(s) == "a struct must have exactly one variant (found 2)");
}

TEST_CASE("duplicate names rejected", "[validation]") {
  CHECK(violation(make_enum("K", {{"A", {}, {}}, {"A", {}, {}}})) ==
        "duplicate variant 'A'");
  CHECK(violation(make_struct("S", {field("x", "int"), field("x", "int")})) ==
        "duplicate field 'x'");

  auto s = make_struct("S", {});
  s.type_params = {"T", "T"};
  CHECK(violation(s) == "duplicate type parameter 'T'");
}

TEST_CASE("type parameters may not reuse generated names", "[validation]") {
  for (std::string name :
       {"v", "self", "dest", "writer", "item", "sink", "os", "value"}) {
    auto s = make_enum("Pair", {{"A", {field("x", "int")}, {}}});
    s.type_params = {name};
    CHECK(violation(s) ==
          "type parameter '" + name + "' collides with a generated name");
  }

  auto s = make_struct("Pair", {field("x", "Pair")});
  s.type_params = {"Pair"};
  CHECK(violation(s) == "type parameter 'Pair' has the name of its type");
}

TEST_CASE("members may not reuse a type parameter", "[validation]") {
  auto s = make_struct("Pair", {field("L", "int")});
  s.type_params = {"L"};
  std::string location;
  CHECK(violation(s, &location) ==
        "field 'L' has the name of type parameter 'L'");
  CHECK(location == "Pair");

  auto e = make_enum("Shadow", {{"L", {}, {}}});
  e.type_params = {"L"};
  CHECK(violation(e) == "variant 'L' has the name of type parameter 'L'");
}

TEST_CASE("variants may not reuse the enum's own names", "[validation]") {
  CHECK(violation(make_enum("Color", {{"value", {}, {}}})) ==
        "variant 'value' collides with the member holding the active "
        "variant");
  CHECK(violation(make_enum("Color", {{"Color", {}, {}}})) ==
        "variant 'Color' has the name of its enclosing type");
}

TEST_CASE("fields may not share the name of their type", "[validation]") {
  CHECK(violation(make_struct("pair", {field("pair", "int")})) ==
        "field 'pair' has the name of its enclosing type");

  std::string location;
  CHECK(violation(make_enum("K", {{"rgb", {field("rgb", "int")}, {}}}),
                  &location) == "field 'rgb' has the name of its enclosing type");
  CHECK(location == "K::rgb");

  // Fields named like the generated locals are reached through a member
  // access, so they stay valid.
  CHECK_NOTHROW(validate_schema(make_struct(
      "Box", {field("value", "int"), field("dest", "int"), field("v", "int")})));
}

TEST_CASE("empty names rejected", "[validation]") {
  CHECK(violation(make_struct("", {})) == "type name is empty");
  CHECK(violation(make_enum("K", {{"", {}, {}}})) == "variant name is empty");
  CHECK(violation(make_struct("S", {field("x", "")})) ==
        "field type is empty");
}

TEST_CASE("if_empty requires iterable", "[validation]") {
  auto f = field("names", "std::vector<int>");
  f.attrs.if_empty = "none";
  std::string location;
  CHECK(violation(make_struct("S", {f}), &location) ==
        "'if_empty' requires 'iterable'");
  CHECK(location == "S::names");

  f.attrs.iterable = true;
  CHECK_NOTHROW(validate_schema(make_struct("S", {f})));
}

TEST_CASE("error message carries location and rule", "[validation]") {
  auto f = field("names", "std::vector<int>");
  f.attrs.if_empty = "none";
  try {
    validate_schema(make_enum("K", {{"List", {f}, {}}}));
    FAIL("expected schema_error");
  } catch (const schema_error& e) {
    CHECK(std::string(e.what()) ==
          "K::List::names: 'if_empty' requires 'iterable'");
  }
}

TEST_CASE("struct directives apply to its variant", "[validation]") {
  auto s = make_struct("Pair", {field("a", "int")});
  s.attrs.function = function_override("pair");
  s.attrs.comma = true;
  auto attrs = effective_variant_attrs(s, s.variants.front());
  REQUIRE(attrs.function.has_value());
  CHECK(attrs.function->resolve("x") == "pair");
  CHECK(attrs.comma);
}

TEST_CASE("enum variants keep their own directives", "[validation]") {
  variant_def v{"A", {}, {}};
  v.attrs.comma = true;
  auto e = make_enum("K", {v});
  auto attrs = effective_variant_attrs(e, e.variants.front());
  CHECK(attrs.comma);
  CHECK_FALSE(attrs.function.has_value());
}
