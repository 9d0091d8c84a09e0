#include <tocss/expat_reader.hpp>

#include <expat.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tocss {

  namespace {

    struct parser_deleter {
      void
      operator()(XML_Parser parser) const {
        XML_ParserFree(parser);
      }
    };

    using parser_ptr = std::unique_ptr<XML_ParserStruct, parser_deleter>;

    struct attribute {
      std::string name;
      std::string value;
    };

    struct node {
      xml_node_type type;
      std::string name;
      std::string text;
      std::vector<attribute> attributes;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

  } // namespace

  // The document is parsed eagerly into a flat list of nodes; read() walks it.
  struct expat_reader::impl {
    XML_Parser parser = nullptr;
    std::vector<node> nodes;
    std::size_t position = 0;
    std::size_t open_elements = 0;

    node&
    push(xml_node_type type) {
      node& n = nodes.emplace_back();
      n.type = type;
      n.depth = open_elements;
      n.line = static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
      return n;
    }

    static void XMLCALL
    start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      ++self->open_elements;
      node& n = self->push(xml_node_type::start_element);
      n.name = name;
      for (const char** p = atts; *p != nullptr; p += 2)
        n.attributes.push_back({p[0], p[1]});
    }

    static void XMLCALL
    end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);
      self->push(xml_node_type::end_element).name = name;
      --self->open_elements;
    }

    // Expat may split one run of text over several callbacks.
    static void XMLCALL
    character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);
      auto count = static_cast<std::size_t>(len);
      if (!self->nodes.empty() &&
          self->nodes.back().type == xml_node_type::characters) {
        self->nodes.back().text.append(s, count);
        return;
      }
      self->push(xml_node_type::characters).text.assign(s, count);
    }

    const node&
    current() const {
      return nodes[position - 1];
    }
  };

  expat_reader::expat_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    parser_ptr parser(XML_ParserCreate(nullptr));
    if (!parser) throw std::runtime_error("failed to create expat parser");

    impl_->parser = parser.get();
    XML_SetUserData(parser.get(), impl_.get());
    XML_SetElementHandler(parser.get(), impl::start_element,
                          impl::end_element);
    XML_SetCharacterDataHandler(parser.get(), impl::character_data);

    auto status = XML_Parse(parser.get(), xml.data(),
                            static_cast<int>(xml.size()), XML_TRUE);
    impl_->parser = nullptr;

    if (status == XML_STATUS_ERROR) {
      throw std::runtime_error(
          "XML parse error at line " +
          std::to_string(XML_GetCurrentLineNumber(parser.get())) +
          ", column " +
          std::to_string(XML_GetCurrentColumnNumber(parser.get())) + ": " +
          XML_ErrorString(XML_GetErrorCode(parser.get())));
    }
    if (impl_->nodes.empty())
      throw std::runtime_error("XML parse error: no content");
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader&
  expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->position >= impl_->nodes.size()) return false;
    ++impl_->position;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current().type;
  }

  const std::string&
  expat_reader::name() const {
    return impl_->current().name;
  }

  std::size_t
  expat_reader::attribute_count() const {
    return impl_->current().attributes.size();
  }

  const std::string&
  expat_reader::attribute_name(std::size_t index) const {
    return impl_->current().attributes[index].name;
  }

  std::string_view
  expat_reader::attribute_value(std::size_t index) const {
    return impl_->current().attributes[index].value;
  }

  std::optional<std::string_view>
  expat_reader::attribute_value(std::string_view attr_name) const {
    for (const auto& attr : impl_->current().attributes) {
      if (attr.name == attr_name) return std::string_view(attr.value);
    }
    return std::nullopt;
  }

  std::string_view
  expat_reader::text() const {
    return impl_->current().text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->current().depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->current().line;
  }

} // namespace tocss
