/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "propsgen/import_resolver.h"
#include "propsgen/schema.h"
#include "propsgen/writer.h"

namespace propsgen
{
    struct generator_options
    {
        std::string library_name;
        std::string file_name = "Props.h";
        std::vector<std::string> namespaces = {"facebook", "react"};
    };

    std::string get_props_class_name(const component& comp);

    // renders the enums, structs and props class of one component, adding its includes to imports
    void write_component(const component& comp, writer& header, import_set& imports);

    // entry point
    void write_files(const schema& sch, std::ostream& os, const generator_options& options);

    // file name -> contents
    std::map<std::string, std::string> generate(const schema& sch, const generator_options& options);
}
