#include <tocss/cpp_backend.hpp>
#include <tocss/generator.hpp>
#include <tocss/naming.hpp>

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace tocss {

  namespace {

    std::string
    join(const std::vector<std::string>& parts, const std::string& sep) {
      std::string result;
      for (const auto& p : parts) {
        if (!result.empty()) result += sep;
        result += p;
      }
      return result;
    }

    // "Name" or "Name<A, B>"
    std::string
    type_reference(const type_schema& schema) {
      std::string ref = to_cpp_identifier(schema.name);
      if (!schema.type_params.empty())
        ref += "<" + join(schema.type_params, ", ") + ">";
      return ref;
    }

    std::vector<std::string>
    bound_constraints(const render_procedure& proc) {
      std::vector<std::string> result;
      for (const auto& bound : proc.bounds)
        result.push_back("::tocss::css_writable<" + bound + ">");
      return result;
    }

    bool
    is_ident_start(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool
    is_ident_char(char c) {
      return is_ident_start(c) || (c >= '0' && c <= '9');
    }

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    // Prefixes each unqualified mention of a scope type with the scope's
    // namespace. Type parameters of `schema` are left alone.
    std::string
    qualify_type(std::string_view expr, const type_schema& schema,
                 const type_scope& scope) {
      std::string result;
      std::size_t i = 0;
      while (i < expr.size()) {
        if (!is_ident_start(expr[i])) {
          result += expr[i++];
          continue;
        }
        std::size_t start = i;
        while (i < expr.size() && is_ident_char(expr[i]))
          ++i;
        std::string ident(expr.substr(start, i - start));

        std::size_t before = start;
        while (before > 0 && is_space(expr[before - 1]))
          --before;
        bool qualified = before >= 2 && expr[before - 1] == ':' &&
                         expr[before - 2] == ':';
        bool in_scope = std::find(scope.type_names.begin(),
                                  scope.type_names.end(),
                                  ident) != scope.type_names.end();
        bool is_param = std::find(schema.type_params.begin(),
                                  schema.type_params.end(),
                                  ident) != schema.type_params.end();
        if (!qualified && in_scope && !is_param)
          result += "::" + scope.namespace_name + "::";
        result += ident;
      }
      return result;
    }

    std::vector<cpp_field>
    lower_fields(const variant_def& variant) {
      std::vector<cpp_field> fields;
      for (const auto& field : variant.fields)
        fields.push_back({field.type, to_cpp_identifier(field.name), ""});
      return fields;
    }

    bool
    reads_fields(const render_fragment& fragment) {
      for (const auto& step : fragment.steps) {
        if (!std::holds_alternative<write_literal>(step)) return true;
      }
      return false;
    }

    class body_emitter {
      std::string& body_;
      std::string object_;

    public:
      body_emitter(std::string& body, std::string object)
          : body_(body), object_(std::move(object)) {}

      void
      emit(const render_fragment& fragment, const std::string& indent) {
        for (const auto& step : fragment.steps)
          emit_step(step, indent);
      }

    private:
      std::string
      member(const std::string& field) const {
        return object_ + "." + to_cpp_identifier(field);
      }

      void
      emit_step(const render_step& step, const std::string& indent) {
        std::visit(
            [&](const auto& s) {
              using T = std::decay_t<decltype(s)>;
              if constexpr (std::is_same_v<T, write_literal>) {
                body_ += indent + "dest.write_str(" +
                         cpp_string_literal(s.text) + ");\n";
              } else if constexpr (std::is_same_v<T, write_field>) {
                body_ += indent + "::tocss::write_css(" + member(s.field) +
                         ", dest);\n";
              } else if constexpr (std::is_same_v<T, write_sequence>) {
                emit_sequence(s, indent);
              }
            },
            step);
      }

      void
      emit_each(const std::string& range, const std::string& indent) {
        body_ += indent + "for (const auto& item : " + range + ")\n";
        body_ += indent + "  writer.item(item);\n";
      }

      void
      emit_sequence(const write_sequence& seq, const std::string& indent) {
        std::string inner = indent + "  ";
        body_ += indent + "{\n";
        body_ += inner + "::tocss::sequence_writer writer(dest, " +
                 cpp_string_literal(seq.separator) + ");\n";

        for (const auto& item : seq.items) {
          if (const auto* single = std::get_if<item_field>(&item)) {
            body_ += inner + "writer.item(" + member(single->field) + ");\n";
            continue;
          }

          const auto& each = std::get<item_each>(item);
          std::string range = member(each.field);
          if (!each.if_empty.has_value()) {
            emit_each(range, inner);
            continue;
          }
          body_ += inner + "if (std::begin(" + range + ") == std::end(" +
                   range + ")) {\n";
          body_ += inner + "  writer.item(::tocss::verbatim{" +
                   cpp_string_literal(*each.if_empty) + "});\n";
          body_ += inner + "} else {\n";
          emit_each(range, inner + "  ");
          body_ += inner + "}\n";
        }

        body_ += indent + "}\n";
      }
    };

    std::string
    lower_structure_body(const render_procedure& proc) {
      std::string body;
      body_emitter emitter(body, "self");
      emitter.emit(proc.arms.front().body, "  ");
      return body;
    }

    std::string
    lower_enumeration_body(const render_procedure& proc) {
      std::string body = "  switch (self.value.index()) {\n";
      for (const auto& arm : proc.arms) {
        auto index = std::to_string(arm.index);
        body += "  case " + index + ": {\n";
        if (reads_fields(arm.body))
          body += "    const auto& v = std::get<" + index + ">(self.value);\n";
        body_emitter emitter(body, "v");
        emitter.emit(arm.body, "    ");
        body += "    break;\n";
        body += "  }\n";
      }
      body += "  }\n";
      return body;
    }

    bool
    any_derive_debug(const std::vector<render_procedure>& procs) {
      for (const auto& proc : procs) {
        if (proc.derive_debug) return true;
      }
      return false;
    }

    bool
    any_enumeration(const schema_module& module) {
      for (const auto& type : module.types) {
        if (type.kind == type_kind::enumeration) return true;
      }
      return false;
    }

  } // namespace

  cpp_struct
  lower_type(const type_schema& schema, const type_scope& scope) {
    cpp_struct s;
    s.name = to_cpp_identifier(schema.name);
    s.template_params = schema.type_params;

    if (schema.kind == type_kind::structure) {
      s.fields = lower_fields(schema.variants.front());
      return s;
    }

    std::vector<std::string> alternatives;
    for (const auto& variant : schema.variants) {
      cpp_struct nested;
      nested.name = to_cpp_identifier(variant.name);
      nested.fields = lower_fields(variant);
      if (!scope.namespace_name.empty()) {
        for (auto& field : nested.fields)
          field.type = qualify_type(field.type, schema, scope);
      }
      s.nested.push_back(std::move(nested));
      alternatives.push_back(to_cpp_identifier(variant.name));
    }
    s.fields.push_back(
        {"std::variant<" + join(alternatives, ", ") + ">", "value", ""});
    return s;
  }

  cpp_function
  lower_procedure(const type_schema& schema, const render_procedure& proc) {
    cpp_function fn;
    fn.template_params = proc.type_params;
    fn.constraints = bound_constraints(proc);
    fn.return_type = "void";
    fn.name = "to_css";

    bool uses_self = proc.kind == type_kind::enumeration ||
                     reads_fields(proc.arms.front().body);
    fn.parameters = "const " + type_reference(schema) + "&" +
                    (uses_self ? " self" : "") + ", ::tocss::css_writer& dest";

    if (proc.kind == type_kind::structure)
      fn.body = lower_structure_body(proc);
    else
      fn.body = lower_enumeration_body(proc);
    return fn;
  }

  cpp_function
  lower_debug_wrapper(const type_schema& schema, const render_procedure& proc) {
    cpp_function fn;
    fn.template_params = proc.type_params;
    fn.constraints = bound_constraints(proc);
    fn.return_type = "std::ostream&";
    fn.name = "operator<<";
    fn.parameters =
        "std::ostream& os, const " + type_reference(schema) + "& self";
    fn.body = "  ::tocss::ostream_sink sink(os);\n"
              "  ::tocss::css_writer dest(sink);\n"
              "  to_css(self, dest);\n"
              "  return os;\n";
    return fn;
  }

  cpp_backend::cpp_backend(const schema_module& module,
                           codegen_options options)
      : module_(module), options_(std::move(options)) {}

  cpp_file
  cpp_backend::generate() const {
    auto procs = generate_module(module_);

    cpp_file file;
    file.filename = options_.header.empty() ? module_.header : options_.header;
    if (file.filename.empty())
      throw std::invalid_argument("cpp_backend: no header name for schema");

    std::string ns_name = options_.namespace_name.empty()
                              ? module_.namespace_name
                              : options_.namespace_name;
    if (ns_name.empty())
      throw std::invalid_argument("cpp_backend: no namespace for schema");

    bool debug = any_derive_debug(procs);
    file.includes.push_back({"<iterator>"});
    if (debug) file.includes.push_back({"<ostream>"});
    file.includes.push_back({"<string>"});
    if (any_enumeration(module_)) file.includes.push_back({"<variant>"});
    file.includes.push_back({"<vector>"});
    file.includes.push_back({"<tocss/css_writer.hpp>"});
    if (debug) file.includes.push_back({"<tocss/ostream_sink.hpp>"});
    for (const auto& inc : module_.includes) {
      if (!inc.empty() && (inc.front() == '<' || inc.front() == '"'))
        file.includes.push_back({inc});
      else
        file.includes.push_back({"\"" + inc + "\""});
    }

    // All types first, so every to_css sees complete types.
    type_scope scope;
    scope.namespace_name = ns_name;
    for (const auto& type : module_.types)
      scope.type_names.push_back(to_cpp_identifier(type.name));

    cpp_namespace ns;
    ns.name = ns_name;
    for (const auto& type : module_.types)
      ns.declarations.push_back(lower_type(type, scope));
    for (std::size_t i = 0; i < module_.types.size(); ++i) {
      ns.declarations.push_back(lower_procedure(module_.types[i], procs[i]));
      if (procs[i].derive_debug)
        ns.declarations.push_back(
            lower_debug_wrapper(module_.types[i], procs[i]));
    }
    file.namespaces.push_back(std::move(ns));
    return file;
  }

} // namespace tocss
