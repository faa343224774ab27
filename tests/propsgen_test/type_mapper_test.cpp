/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include "propsgen/errors.h"
#include "propsgen/type_mapper.h"

using namespace propsgen;

TEST(TypeMapperTest, Scalars)
{
    EXPECT_EQ(get_native_type("Slider", make_prop("disabled", make_boolean()), {}), "bool");
    EXPECT_EQ(get_native_type("Slider", make_prop("title", make_string()), {}), "std::string");
    EXPECT_EQ(get_native_type("Slider", make_prop("steps", make_int32()), {}), "int");
    EXPECT_EQ(get_native_type("Slider", make_prop("ratio", make_double()), {}), "double");
    EXPECT_EQ(get_native_type("Slider", make_prop("value", make_float()), {}), "Float");
}

TEST(TypeMapperTest, NativePrimitives)
{
    EXPECT_EQ(get_native_type("Slider", make_prop("color", make_native_primitive(native_primitive_kind::color)), {}),
        "SharedColor");
    EXPECT_EQ(get_native_type(
                  "Slider", make_prop("thumb", make_native_primitive(native_primitive_kind::image_source)), {}),
        "ImageSource");
    EXPECT_EQ(get_native_type("Slider", make_prop("origin", make_native_primitive(native_primitive_kind::point)), {}),
        "Point");
}

TEST(TypeMapperTest, ArraysOfScalarsAndPrimitives)
{
    EXPECT_EQ(get_native_type("Slider", make_prop("names", make_array(make_string())), {}), "std::vector<std::string>");
    EXPECT_EQ(get_native_type("Slider", make_prop("steps", make_array(make_int32())), {}), "std::vector<int>");
    EXPECT_EQ(get_native_type("Slider",
                  make_prop("colors", make_array(make_native_primitive(native_primitive_kind::color))),
                  {}),
        "std::vector<SharedColor>");
}

TEST(TypeMapperTest, ObjectsNameTheirStructByPath)
{
    auto insets = make_prop("insets", make_object({make_prop("top", make_float())}));
    EXPECT_EQ(get_native_type("Slider", insets, {}), "SliderInsetsStruct");
    EXPECT_EQ(get_native_type("Slider", insets, {"outer"}), "SliderOuterInsetsStruct");

    auto points = make_prop("points", make_array(make_object({make_prop("x", make_float())})));
    EXPECT_EQ(get_native_type("Slider", points, {}), "std::vector<SliderPointsStruct>");
    EXPECT_EQ(get_native_type("Slider", points, {"track"}), "std::vector<SliderTrackPointsStruct>");
}

TEST(TypeMapperTest, EnumsUseComponentAndPropName)
{
    EXPECT_EQ(get_native_type("Slider", make_prop("alignment", make_string_enum({"left", "right"})), {}),
        "SliderAlignment");
    EXPECT_EQ(
        get_native_type("Slider", make_prop("edges", make_array(make_string_enum({"top", "bottom"}))), {}),
        "SliderEdgesMask");
}

TEST(TypeMapperTest, ArrayOfArraysIsRejected)
{
    auto matrix = make_prop("matrix", make_array(make_array(make_float())));
    EXPECT_THROW(get_native_type("Slider", matrix, {}), unsupported_nesting);
    EXPECT_THROW(get_native_type("Slider", matrix, {}), generator_error);
}
