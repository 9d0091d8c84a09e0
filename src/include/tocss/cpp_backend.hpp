#pragma once

#include <tocss/cpp_code.hpp>
#include <tocss/render_ir.hpp>
#include <tocss/schema.hpp>

#include <string>
#include <vector>

namespace tocss {

  struct codegen_options {
    // Overrides the schema document's namespace when non-empty.
    std::string namespace_name;
    // Overrides the schema document's header name when non-empty.
    std::string header;
  };

  // Lowers a schema module to one C++ header: the data types it describes and
  // a to_css function per type.
  class cpp_backend {
    const schema_module& module_;
    codegen_options options_;

  public:
    explicit cpp_backend(const schema_module& module,
                         codegen_options options = {});

    // Throws schema_error for an invalid type.
    cpp_file
    generate() const;
  };

  // The namespace a header's types live in and the names it declares there.
  struct type_scope {
    std::string namespace_name;
    std::vector<std::string> type_names;
  };

  // Field types of enum variants refer to the scope's types by their
  // qualified name, since a variant struct may share the name of one.
  cpp_struct
  lower_type(const type_schema& schema, const type_scope& scope = {});

  // `proc` must have been generated from `schema`.
  cpp_function
  lower_procedure(const type_schema& schema, const render_procedure& proc);

  cpp_function
  lower_debug_wrapper(const type_schema& schema, const render_procedure& proc);

} // namespace tocss
