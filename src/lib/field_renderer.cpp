#include <tocss/field_renderer.hpp>

namespace tocss {

  namespace {

    class skipped_field : public field_renderer {
    public:
      std::optional<sequence_item>
      render(const field_def&, bound_collector&) const override {
        return std::nullopt;
      }
    };

    class direct_field : public field_renderer {
    public:
      std::optional<sequence_item>
      render(const field_def& field, bound_collector& bounds) const override {
        if (!field.attrs.ignore_bound) bounds.require_bound(field.type);
        return item_field{field.name};
      }
    };

    // The element type's renderability is checked by the iteration itself,
    // so the container type never gets a bound.
    class iterated_field : public field_renderer {
    public:
      std::optional<sequence_item>
      render(const field_def& field, bound_collector&) const override {
        return item_each{field.name, std::nullopt};
      }
    };

    class iterated_field_with_fallback : public field_renderer {
    public:
      std::optional<sequence_item>
      render(const field_def& field, bound_collector&) const override {
        return item_each{field.name, field.attrs.if_empty};
      }
    };

  } // namespace

  const field_renderer&
  select_field_renderer(const field_attrs& attrs) {
    static const skipped_field skipped{};
    static const direct_field direct{};
    static const iterated_field iterated{};
    static const iterated_field_with_fallback iterated_with_fallback{};

    if (attrs.skip) return skipped;
    if (attrs.iterable) {
      if (attrs.if_empty.has_value()) return iterated_with_fallback;
      return iterated;
    }
    return direct;
  }

  std::optional<sequence_item>
  render_field(const field_def& field, bound_collector& bounds) {
    return select_field_renderer(field.attrs).render(field, bounds);
  }

} // namespace tocss
