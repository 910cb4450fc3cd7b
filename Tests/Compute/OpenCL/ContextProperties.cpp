/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <cstdint>
#include <optional>
#include <vector>

#include <gtest/gtest.h>

#include "Ocelot.h"

namespace Ocelot::Compute::Tests
{
    using namespace Ocelot::Compute::OpenCL;

    namespace
    {
        cl_platform_id fakePlatform( uintptr_t value ) {
            return reinterpret_cast<cl_platform_id>( value );
        }

        /// @brief Finds the value written after key in a raw property list.
        std::optional<cl_context_properties> rawValue( const std::vector<cl_context_properties>& raw, cl_context_properties key ) {
            for ( size_t i = 0; i + 1 < raw.size(); i += 2 ) {
                if ( raw[ i ] == key ) {
                    return raw[ i + 1 ];
                }
            }
            return std::nullopt;
        }
    }

    TEST( ContextPropertyList, EmptyListIsTerminatorOnly ) {
        ContextPropertyList properties;

        EXPECT_TRUE( properties.empty() );
        EXPECT_EQ( properties.toRaw(), std::vector<cl_context_properties>{ 0 } );
    }

    TEST( ContextPropertyList, ToRawWritesPairsAndTerminator ) {
        ContextPropertyList properties;
        properties.platform( fakePlatform( 0x1000 ) ).interopUserSync( true );

        auto raw = properties.toRaw();

        ASSERT_EQ( raw.size(), 5u );
        EXPECT_EQ( raw.back(), 0 );
        EXPECT_EQ( rawValue( raw, CL_CONTEXT_PLATFORM ), static_cast<cl_context_properties>( 0x1000 ) );
        EXPECT_EQ( rawValue( raw, CL_CONTEXT_INTEROP_USER_SYNC ), static_cast<cl_context_properties>( CL_TRUE ) );
    }

    TEST( ContextPropertyList, InteropUserSyncFalseIsClFalse ) {
        ContextPropertyList properties;
        properties.setInteropUserSync( false );

        EXPECT_EQ( rawValue( properties.toRaw(), CL_CONTEXT_INTEROP_USER_SYNC ), static_cast<cl_context_properties>( CL_FALSE ) );
    }

    TEST( ContextPropertyList, SettingTwiceKeepsLastValue ) {
        ContextPropertyList properties;
        properties.setPlatform( fakePlatform( 0x10 ) );
        properties.setPlatform( fakePlatform( 0x20 ) );

        EXPECT_EQ( properties.size(), 1u );
        EXPECT_EQ( properties.getPlatform(), fakePlatform( 0x20 ) );
        EXPECT_EQ( properties.toRaw().size(), 3u );
    }

    TEST( ContextPropertyList, GettersReturnStoredValues ) {
        int sharegroup = 0;
        ContextPropertyList properties;
        properties.glContext( 0x77 ).cglSharegroup( &sharegroup );

        EXPECT_FALSE( properties.getPlatform().has_value() );
        EXPECT_FALSE( properties.getInteropUserSync().has_value() );
        EXPECT_EQ( properties.getGlContext(), static_cast<cl_context_properties>( 0x77 ) );
        EXPECT_EQ( properties.getCglSharegroup(), static_cast<void*>( &sharegroup ) );
        EXPECT_TRUE( properties.contains( ContextProperty::GlContext ) );
        EXPECT_FALSE( properties.contains( ContextProperty::EglDisplay ) );
    }

    TEST( ContextPropertyList, GlAndCglValuesAreWrittenRaw ) {
        int sharegroup = 0;
        ContextPropertyList properties;
        properties.propertyValue( ContextPropertyValues::GlContext{ 0x55 } )
            .propertyValue( ContextPropertyValues::CglSharegroup{ &sharegroup } );

        auto raw = properties.toRaw();

        EXPECT_EQ( rawValue( raw, CL_GL_CONTEXT_KHR ), static_cast<cl_context_properties>( 0x55 ) );
        EXPECT_EQ( rawValue( raw, CL_CGL_SHAREGROUP_KHR ), reinterpret_cast<cl_context_properties>( &sharegroup ) );
    }

    TEST( ContextPropertyList, ToString ) {
        ContextPropertyList properties;
        EXPECT_EQ( properties.toString(), "ContextPropertyList {  }" );

        properties.setPlatform( fakePlatform( 1 ) );
        EXPECT_EQ( properties.toString(), "ContextPropertyList { Platform }" );
    }

    TEST( ContextProperty, WireIdentifiers ) {
        EXPECT_EQ( toClContextProperty( ContextProperty::Platform ), CL_CONTEXT_PLATFORM );
        EXPECT_EQ( toClContextProperty( ContextProperty::InteropUserSync ), CL_CONTEXT_INTEROP_USER_SYNC );
        EXPECT_EQ( toClContextProperty( ContextProperty::GlxDisplay ), CL_GLX_DISPLAY_KHR );
        EXPECT_EQ( toClContextProperty( ContextProperty::D3d10Device ), 0x4014 );
        EXPECT_EQ( toClContextProperty( ContextProperty::D3d11Device ), 0x401D );
        EXPECT_EQ( contextPropertyToString( ContextProperty::AdapterDxva ), "AdapterDxva" );
        EXPECT_EQ( kindOf( ContextPropertyValues::WglHdc{ nullptr } ), ContextProperty::WglHdc );
    }

    TEST( ContextPropertyListDeathTest, UnsupportedValueTerminates ) {
        EXPECT_DEATH( {
            ContextPropertyList properties;
            properties.setPropertyValue( ContextPropertyValues::EglDisplay{ nullptr } );
        }, "not yet a supported context property" );
    }
}
