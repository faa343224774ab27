/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include "propsgen/errors.h"
#include "propsgen/import_resolver.h"

using namespace propsgen;

TEST(ImportResolverTest, NativePrimitiveHeaders)
{
    EXPECT_EQ(get_native_primitive_import(native_primitive_kind::color), "react/graphics/Color.h");
    EXPECT_EQ(get_native_primitive_import(native_primitive_kind::image_source), "react/imagemanager/primitives.h");
    EXPECT_EQ(get_native_primitive_import(native_primitive_kind::point), "react/graphics/Geometry.h");
}

TEST(ImportResolverTest, ScalarsNeedNothing)
{
    std::vector<prop> props = {
        make_prop("disabled", make_boolean()),
        make_prop("title", make_string()),
        make_prop("steps", make_int32()),
        make_prop("value", make_float()),
        make_prop("alignment", make_string_enum({"left", "right"}), std::string("left")),
    };
    EXPECT_TRUE(get_local_imports(props).empty());
    EXPECT_TRUE(get_conversion_imports(props).empty());
}

TEST(ImportResolverTest, ColorProp)
{
    std::vector<prop> props = {make_prop("color", make_native_primitive(native_primitive_kind::color))};
    EXPECT_EQ(get_local_imports(props), (import_set{"react/graphics/Color.h"}));
    EXPECT_TRUE(get_conversion_imports(props).empty());
}

TEST(ImportResolverTest, Arrays)
{
    EXPECT_EQ(get_local_imports({make_prop("names", make_array(make_string()))}), (import_set{"vector"}));
    EXPECT_EQ(get_local_imports({make_prop("edges", make_array(make_string_enum({"top"})), std::string("top"))}),
        (import_set{"cinttypes", "vector"}));
    EXPECT_EQ(get_local_imports({make_prop("points", make_array(make_native_primitive(native_primitive_kind::point)))}),
        (import_set{"react/graphics/Geometry.h", "vector"}));
}

TEST(ImportResolverTest, ObjectsPullInConversionsAndNestedHeaders)
{
    std::vector<prop> props = {
        make_prop("style",
            make_object({
                make_prop("tint", make_native_primitive(native_primitive_kind::color)),
                make_prop("thumb", make_native_primitive(native_primitive_kind::image_source)),
            })),
    };

    EXPECT_EQ(get_local_imports(props),
        (import_set{"react/components/image/conversions.h",
            "react/core/propsConversions.h",
            "react/graphics/Color.h",
            "react/imagemanager/primitives.h"}));
    EXPECT_EQ(get_conversion_imports(props), (import_set{"react/components/image/conversions.h"}));
}

TEST(ImportResolverTest, ArrayOfObjects)
{
    std::vector<prop> props = {
        make_prop("items", make_array(make_object({make_prop("origin", make_native_primitive(native_primitive_kind::point))}))),
    };

    EXPECT_EQ(get_local_imports(props),
        (import_set{"react/core/propsConversions.h", "react/graphics/Geometry.h", "vector"}));
}

TEST(ImportResolverTest, ImageSourceArrayNeedsConversion)
{
    std::vector<prop> props = {
        make_prop("images", make_array(make_native_primitive(native_primitive_kind::image_source))),
    };
    EXPECT_EQ(get_conversion_imports(props), (import_set{"react/components/image/conversions.h"}));
    EXPECT_EQ(get_local_imports(props), (import_set{"react/imagemanager/primitives.h", "vector"}));
}

TEST(ImportResolverTest, ExtendsViewProps)
{
    EXPECT_TRUE(get_extends_imports({}).empty());
    EXPECT_EQ(get_extends_imports({make_view_props_extension()}), (import_set{"react/components/view/ViewProps.h"}));
}

TEST(ImportResolverTest, ObjectWithoutPropertiesIsRejected)
{
    std::vector<prop> props = {make_prop("style", make_object_without_properties())};
    EXPECT_THROW(get_local_imports(props), missing_object_properties);
}
