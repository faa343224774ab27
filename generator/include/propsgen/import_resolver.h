/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <set>
#include <string>
#include <vector>

#include "propsgen/schema.h"

namespace propsgen
{
    // header paths, std::set keeps them sorted so the generated include list is stable
    using import_set = std::set<std::string>;

    std::string get_native_primitive_import(native_primitive_kind kind);

    // headers needed by the fromRawValue overloads of nested object fields
    import_set get_conversion_imports(const std::vector<prop>& properties);

    // headers needed by the declarations of a component's fields and nested structs
    import_set get_local_imports(const std::vector<prop>& properties);

    import_set get_extends_imports(const std::vector<extends_clause>& extends_props);
}
