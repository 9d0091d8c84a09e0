#include <tocss/variant_renderer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tocss;

namespace {

  field_def
  field(std::string name, std::string type, field_attrs attrs = {}) {
    return {std::move(name), std::move(type), std::move(attrs)};
  }

  field_attrs
  skipped() {
    field_attrs attrs;
    attrs.skip = true;
    return attrs;
  }

  field_attrs
  iterable() {
    field_attrs attrs;
    attrs.iterable = true;
    return attrs;
  }

  render_fragment
  fragment(std::vector<render_step> steps) {
    return render_fragment{std::move(steps)};
  }

  render_fragment
  render(const variant_def& v, bound_collector& bounds) {
    return render_variant(v, v.attrs, bounds);
  }

} // namespace

TEST_CASE("separator follows comma directive", "[variant_renderer]") {
  variant_attrs attrs;
  CHECK(std::string(separator_for(attrs)) == " ");
  attrs.comma = true;
  CHECK(std::string(separator_for(attrs)) == ", ");
}

TEST_CASE("unit variant writes its identifier", "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"FitContent", {}, {}};
  CHECK(render(v, bounds) == fragment({write_literal{"fit-content"}}));
}

TEST_CASE("keyword replaces the identifier", "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"Hidden", {}, {}};
  v.attrs.keyword = "none";
  v.attrs.aliases = "hide";
  CHECK(render(v, bounds) == fragment({write_literal{"none"}}));
}

TEST_CASE("all fields skipped writes the identifier", "[variant_renderer]") {
  bound_collector bounds({"T"});
  variant_def v{"Auto", {field("cache", "T", skipped())}, {}};
  CHECK(render(v, bounds) == fragment({write_literal{"auto"}}));
  CHECK(bounds.bounded_types().empty());
}

TEST_CASE("single field is written directly", "[variant_renderer]") {
  bound_collector bounds({"T"});
  variant_def v{"Wrapped", {field("inner", "T"), field("n", "int", skipped())},
                {}};
  CHECK(render(v, bounds) == fragment({write_field{"inner"}}));
  CHECK(bounds.bounded_types() == std::vector<std::string>{"T"});
}

TEST_CASE("single iterable field still uses a sequence", "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"List", {field("xs", "std::vector<int>", iterable())}, {}};
  v.attrs.comma = true;
  write_sequence seq{", ", {item_each{"xs", std::nullopt}}};
  CHECK(render(v, bounds) == fragment({seq}));
}

TEST_CASE("several fields form a sequence in order", "[variant_renderer]") {
  bound_collector bounds({"L"});
  variant_def v{"Offset",
                {field("x", "L"), field("cache", "int", skipped()),
                 field("y", "L"), field("blur", "std::vector<L>", iterable())},
                {}};
  write_sequence seq{
      " ", {item_field{"x"}, item_field{"y"}, item_each{"blur", std::nullopt}}};
  CHECK(render(v, bounds) == fragment({seq}));
  CHECK(bounds.bounded_types() == std::vector<std::string>{"L"});
}

TEST_CASE("dimension appends the identifier", "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"Px", {field("value", "float")}, {}};
  v.attrs.dimension = true;
  CHECK(render(v, bounds) ==
        fragment({write_field{"value"}, write_literal{"px"}}));
}

TEST_CASE("function wraps the body", "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"Translate", {field("x", "int"), field("y", "int")}, {}};
  v.attrs.function = function_override::inherit();
  v.attrs.comma = true;
  write_sequence seq{", ", {item_field{"x"}, item_field{"y"}}};
  CHECK(render(v, bounds) == fragment({write_literal{"translate("}, seq,
                                       write_literal{")"}}));
}

TEST_CASE("explicit function name", "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"Scale", {field("factor", "int")}, {}};
  v.attrs.function = function_override("scale-factor");
  CHECK(render(v, bounds) ==
        fragment({write_literal{"scale-factor("}, write_field{"factor"},
                  write_literal{")"}}));
}

TEST_CASE("function around a unit variant", "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"Reset", {}, {}};
  v.attrs.function = function_override::inherit();
  CHECK(render(v, bounds) ==
        fragment({write_literal{"reset("}, write_literal{"reset"},
                  write_literal{")"}}));
}

TEST_CASE("function uses the effective directives passed in",
          "[variant_renderer]") {
  bound_collector bounds;
  variant_def v{"Pair", {field("a", "int"), field("b", "int")}, {}};
  variant_attrs attrs;
  attrs.function = function_override::inherit();
  attrs.comma = true;
  auto result = render_variant(v, attrs, bounds);
  REQUIRE(result.steps.size() == 3);
  CHECK(result.steps.front() == render_step{write_literal{"pair("}});
  CHECK(std::get<write_sequence>(result.steps[1]).separator == ", ");
}
