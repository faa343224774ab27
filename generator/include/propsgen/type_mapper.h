/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

#include "propsgen/schema.h"

namespace propsgen
{
    // C++ type of a field, path_segments are the prop names between the component and the prop's owner
    std::string get_native_type(
        const std::string& component_name, const prop& property, const std::vector<std::string>& path_segments);
}
