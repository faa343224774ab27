/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <filesystem>
#include <istream>
#include <string>

#include "propsgen/schema.h"

namespace propsgen
{
    // all of these throw invalid_schema on malformed input
    schema parse_schema(const std::string& json_text);
    schema parse_schema(std::istream& input);
    schema load_schema(const std::filesystem::path& path);
}
