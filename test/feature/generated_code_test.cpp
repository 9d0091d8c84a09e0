// Exercises the header the tocss tool generates from schemas/shapes.xml at
// build time.
#include "shapes.hpp"

#include <tocss/css_writer.hpp>
#include <tocss/string_sink.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace shapes;

namespace {

  template <typename T>
  std::string
  render(const T& value) {
    tocss::string_sink sink;
    tocss::css_writer dest(sink);
    tocss::write_css(value, dest);
    return sink.take();
  }

  Length
  px(float v) {
    return Length{Length::Px{v}};
  }

  Length
  em(float v) {
    return Length{Length::Em{v}};
  }

  class failing_sink : public tocss::text_sink {
    std::size_t writes_left_;

  public:
    std::string written;

    explicit failing_sink(std::size_t writes) : writes_left_(writes) {}

    void
    write(std::string_view text) override {
      if (writes_left_ == 0) throw tocss::write_error("sink full");
      --writes_left_;
      written.append(text);
    }
  };

  struct not_writable {
    bool
    operator==(const not_writable&) const = default;
  };

} // namespace

TEST_CASE("generated enum renders canonical identifiers", "[generated]") {
  CHECK(render(Keyword{Keyword::Auto{}}) == "auto");
  CHECK(render(Keyword{Keyword::FitContent{}}) == "fit-content");
  CHECK(render(Keyword{Keyword::MozMaxContent{}}) == "-moz-max-content");
}

TEST_CASE("generated keyword variant", "[generated]") {
  CHECK(render(Keyword{Keyword::Hidden{}}) == "none");
}

TEST_CASE("generated dimension variants", "[generated]") {
  CHECK(render(px(3.0f)) == "3px");
  CHECK(render(em(1.5f)) == "1.5em");
}

TEST_CASE("generated variants may share the name of a module type",
          "[generated]") {
  using LK = LengthOrKeyword;
  CHECK(render(LK{LK::Length{px(2.0f)}}) == "2px");
  CHECK(render(LK{LK::Keyword{Keyword{Keyword::FitContent{}}}}) ==
        "fit-content");
}

TEST_CASE("generated function struct with comma separator", "[generated]") {
  Translate<Length> t{px(1.0f), em(2.0f)};
  CHECK(render(t) == "translate(1px, 2em)");
}

TEST_CASE("generated iterable field with fallback", "[generated]") {
  CHECK(render(FontFamilies{}) == "none");
  CHECK(render(FontFamilies{{"Arial", "serif"}}) == "Arial, serif");
  CHECK(render(FontFamilies{{"serif"}}) == "serif");
}

TEST_CASE("generated generic enum", "[generated]") {
  using S = Shadow<Length>;

  CHECK(render(S{S::None{}}) == "none");
  CHECK(render(S{S::Offset{px(1.0f), px(2.0f), {}, 42}}) == "1px 2px");
  CHECK(render(S{S::Offset{px(1.0f), px(2.0f), {px(3.0f), em(4.0f)}, 0}}) ==
        "1px 2px 3px 4em");
  CHECK(render(S{S::Scale{2}}) == "scale-factor(2)");
  CHECK(render(S{S::Wrapped{em(0.5f)}}) == "0.5em");
}

TEST_CASE("generated debug output matches to_css", "[generated]") {
  std::ostringstream os;
  os << Keyword{Keyword::FitContent{}} << ' ' << px(3.0f) << ' '
     << Translate<Length>{px(1.0f), px(2.0f)};
  CHECK(os.str() == "fit-content 3px translate(1px, 2px)");
}

TEST_CASE("generated bounds follow directly rendered parameters",
          "[generated]") {
  STATIC_REQUIRE(tocss::css_writable<Translate<Length>>);
  STATIC_REQUIRE(tocss::css_writable<Shadow<Length>>);
  STATIC_REQUIRE_FALSE(tocss::css_writable<Translate<not_writable>>);
  STATIC_REQUIRE_FALSE(tocss::css_writable<Shadow<not_writable>>);
}

TEST_CASE("generated function stops at the first failed write",
          "[generated]") {
  failing_sink sink(1);
  tocss::css_writer dest(sink);
  Translate<Length> t{px(1.0f), px(2.0f)};
  CHECK_THROWS_AS(tocss::write_css(t, dest), tocss::write_error);
  CHECK(sink.written == "translate(");
}

TEST_CASE("generated rendering is repeatable", "[generated]") {
  const Shadow<Length> s{Shadow<Length>::Offset{px(1.0f), em(2.0f), {}, 0}};
  CHECK(render(s) == render(s));
}
