#include <tocss/cpp_writer.hpp>

#include <sstream>
#include <string>
#include <type_traits>

namespace tocss {

  namespace {

    void
    write_includes(std::ostream& os, const std::vector<cpp_include>& includes) {
      if (includes.empty()) return;

      // Partition into system (<...>) and local ("...") includes
      std::vector<const cpp_include*> system_includes;
      std::vector<const cpp_include*> local_includes;

      for (const auto& inc : includes) {
        if (!inc.path.empty() && inc.path.front() == '<')
          system_includes.push_back(&inc);
        else
          local_includes.push_back(&inc);
      }

      os << '\n';

      for (const auto* inc : system_includes)
        os << "#include " << inc->path << '\n';

      if (!system_includes.empty() && !local_includes.empty()) os << '\n';

      for (const auto* inc : local_includes)
        os << "#include " << inc->path << '\n';
    }

    void
    write_template_header(std::ostream& os, const std::string& indent,
                          const std::vector<std::string>& params) {
      if (params.empty()) return;
      os << indent << "template <";
      bool first = true;
      for (const auto& p : params) {
        if (!first) os << ", ";
        os << "typename " << p;
        first = false;
      }
      os << ">\n";
    }

    void
    write_field(std::ostream& os, const std::string& indent,
                const cpp_field& field) {
      os << indent << "  " << field.type << ' ' << field.name;
      if (!field.default_value.empty()) os << " = " << field.default_value;
      os << ";\n";
    }

    void
    write_struct(std::ostream& os, const cpp_struct& s,
                 const std::string& indent) {
      write_template_header(os, indent, s.template_params);

      if (s.nested.empty() && s.fields.empty() && !s.generate_equality) {
        os << indent << "struct " << s.name << " {};\n";
        return;
      }

      os << indent << "struct " << s.name << " {\n";

      bool first = true;
      for (const auto& n : s.nested) {
        if (!first) os << '\n';
        write_struct(os, n, indent + "  ");
        first = false;
      }

      if (!s.nested.empty() && !s.fields.empty()) os << '\n';
      for (const auto& f : s.fields)
        write_field(os, indent, f);

      if (s.generate_equality) {
        if (!s.fields.empty() || !s.nested.empty()) os << '\n';
        os << indent << "  bool operator==(const " << s.name
           << "&) const = default;\n";
      }

      os << indent << "};\n";
    }

    void
    write_function_signature(std::ostream& os, const cpp_function& f) {
      write_template_header(os, "", f.template_params);
      if (!f.constraints.empty()) {
        os << "  requires ";
        bool first = true;
        for (const auto& c : f.constraints) {
          if (!first) os << " && ";
          os << c;
          first = false;
        }
        os << '\n';
      }
      if (f.is_inline) os << "inline ";
      os << f.return_type << ' ' << f.name << '(' << f.parameters << ')';
    }

    void
    write_function(std::ostream& os, const cpp_function& f) {
      write_function_signature(os, f);
      os << " {\n";
      os << f.body;
      os << "}\n";
    }

    void
    write_decl(std::ostream& os, const cpp_decl& decl) {
      std::visit(
          [&os](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, cpp_function>) {
              write_function(os, d);
            } else if constexpr (std::is_same_v<T, cpp_struct>) {
              write_struct(os, d, "");
            }
          },
          decl);
    }

    void
    write_namespace(std::ostream& os, const cpp_namespace& ns) {
      os << "\nnamespace " << ns.name << " {\n";
      for (const auto& decl : ns.declarations) {
        os << '\n';
        write_decl(os, decl);
      }
      os << "\n} // namespace " << ns.name << '\n';
    }

  } // namespace

  std::string
  cpp_writer::write(const cpp_file& file) const {
    std::ostringstream os;
    os << "#pragma once\n";
    write_includes(os, file.includes);
    for (const auto& ns : file.namespaces)
      write_namespace(os, ns);
    return os.str();
  }

} // namespace tocss
