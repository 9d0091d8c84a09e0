#include <tocss/cpp_code.hpp>
#include <tocss/cpp_writer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tocss;

static const cpp_writer writer;

TEST_CASE("empty file produces pragma once", "[cpp_writer]") {
  cpp_file file;
  file.filename = "empty.hpp";
  CHECK(writer.write(file) == "#pragma once\n");
}

TEST_CASE("system includes before local includes", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.includes.push_back({"\"colors.hpp\""});
  file.includes.push_back({"<string>"});
  file.includes.push_back({"<tocss/css_writer.hpp>"});

  auto expected = R"(#pragma once

#include <string>
#include <tocss/css_writer.hpp>

#include "colors.hpp"
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("empty struct without equality", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_struct s;
  s.name = "marker";
  s.generate_equality = false;
  file.namespaces.push_back({"ns", {s}});

  auto expected = R"(#pragma once

namespace ns {

struct marker {};

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("empty struct with equality", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_struct s;
  s.name = "Auto";
  file.namespaces.push_back({"ns", {s}});

  auto expected = R"(#pragma once

namespace ns {

struct Auto {
  bool operator==(const Auto&) const = default;
};

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("template struct with fields", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_struct s;
  s.name = "Translate";
  s.template_params = {"L"};
  s.fields.push_back({"L", "x", ""});
  s.fields.push_back({"int", "count", "0"});
  file.namespaces.push_back({"ns", {s}});

  auto expected = R"(#pragma once

namespace ns {

template <typename L>
struct Translate {
  L x;
  int count = 0;

  bool operator==(const Translate&) const = default;
};

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("nested structs", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_struct px;
  px.name = "Px";
  px.fields.push_back({"float", "value", ""});
  cpp_struct none;
  none.name = "None";
  cpp_struct length;
  length.name = "Length";
  length.nested = {px, none};
  length.fields.push_back({"std::variant<Px, None>", "value", ""});
  file.namespaces.push_back({"ns", {length}});

  auto expected = R"(#pragma once

namespace ns {

struct Length {
  struct Px {
    float value;

    bool operator==(const Px&) const = default;
  };

  struct None {
    bool operator==(const None&) const = default;
  };

  std::variant<Px, None> value;

  bool operator==(const Length&) const = default;
};

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("inline function", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_function fn;
  fn.return_type = "void";
  fn.name = "to_css";
  fn.parameters = "const Auto&, ::tocss::css_writer& dest";
  fn.body = "  dest.write_str(\"auto\");\n";
  file.namespaces.push_back({"ns", {fn}});

  auto expected = R"(#pragma once

namespace ns {

inline void to_css(const Auto&, ::tocss::css_writer& dest) {
  dest.write_str("auto");
}

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("constrained function template", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_function fn;
  fn.template_params = {"A", "B"};
  fn.constraints = {"C<A>", "C<B>"};
  fn.return_type = "void";
  fn.name = "f";
  fn.parameters = "const P<A, B>& p";
  fn.body = "  g(p);\n";
  fn.is_inline = false;
  file.namespaces.push_back({"ns", {fn}});

  auto expected = R"(#pragma once

namespace ns {

template <typename A, typename B>
  requires C<A> && C<B>
void f(const P<A, B>& p) {
  g(p);
}

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}

TEST_CASE("declarations separated by blank lines", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.includes.push_back({"<string>"});
  cpp_struct s;
  s.name = "a";
  s.generate_equality = false;
  cpp_function fn;
  fn.return_type = "int";
  fn.name = "b";
  fn.body = "  return 0;\n";
  file.namespaces.push_back({"ns", {s, fn}});

  auto expected = R"(#pragma once

#include <string>

namespace ns {

struct a {};

inline int b() {
  return 0;
}

} // namespace ns
)";
  CHECK(writer.write(file) == expected);
}
