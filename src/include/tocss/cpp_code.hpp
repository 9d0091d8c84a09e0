#pragma once

#include <string>
#include <variant>
#include <vector>

namespace tocss {

  struct cpp_include {
    std::string path;

    bool
    operator==(const cpp_include&) const = default;
  };

  struct cpp_field {
    std::string type;
    std::string name;
    std::string default_value;

    bool
    operator==(const cpp_field&) const = default;
  };

  struct cpp_struct {
    std::string name;
    std::vector<std::string> template_params;
    std::vector<cpp_struct> nested;
    std::vector<cpp_field> fields;
    bool generate_equality = true;

    bool
    operator==(const cpp_struct&) const = default;
  };

  struct cpp_function {
    std::vector<std::string> template_params;
    std::vector<std::string> constraints;
    std::string return_type;
    std::string name;
    std::string parameters;
    std::string body;
    bool is_inline = true;

    bool
    operator==(const cpp_function&) const = default;
  };

  using cpp_decl = std::variant<cpp_struct, cpp_function>;

  struct cpp_namespace {
    std::string name;
    std::vector<cpp_decl> declarations;

    bool
    operator==(const cpp_namespace&) const = default;
  };

  struct cpp_file {
    std::string filename;
    std::vector<cpp_include> includes;
    std::vector<cpp_namespace> namespaces;

    bool
    operator==(const cpp_file&) const = default;
  };

} // namespace tocss
