#include <tocss/field_renderer.hpp>
#include <tocss/naming.hpp>
#include <tocss/variant_renderer.hpp>

#include <vector>

namespace tocss {

  namespace {

    render_fragment
    render_fields(const std::vector<const field_def*>& active,
                  const variant_attrs& attrs, bound_collector& bounds) {
      render_fragment fragment;

      // A lone directly rendered value needs no sequence: with a single item
      // no separator could ever be written.
      if (active.size() == 1 && !active.front()->attrs.iterable) {
        const auto& field = *active.front();
        if (!field.attrs.ignore_bound) bounds.require_bound(field.type);
        fragment.append(write_field{field.name});
        return fragment;
      }

      write_sequence sequence;
      sequence.separator = separator_for(attrs);
      for (const auto* field : active) {
        if (auto item = render_field(*field, bounds))
          sequence.items.push_back(std::move(*item));
      }
      fragment.append(std::move(sequence));
      return fragment;
    }

  } // namespace

  render_fragment
  render_variant(const variant_def& variant, const variant_attrs& attrs,
                 bound_collector& bounds) {
    std::string identifier = to_css_identifier(variant.name);

    std::vector<const field_def*> active;
    for (const auto& field : variant.fields) {
      if (!field.attrs.skip) active.push_back(&field);
    }

    render_fragment fragment;
    if (attrs.keyword.has_value()) {
      fragment.append(write_literal{*attrs.keyword});
    } else if (active.empty()) {
      fragment.append(write_literal{identifier});
    } else {
      fragment = render_fields(active, attrs, bounds);
    }

    if (attrs.dimension) {
      fragment.append(write_literal{identifier});
    } else if (attrs.function.has_value()) {
      fragment.prepend(write_literal{attrs.function->resolve(identifier) + "("});
      fragment.append(write_literal{")"});
    }

    return fragment;
  }

} // namespace tocss
