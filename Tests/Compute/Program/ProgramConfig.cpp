/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <cstdio>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "Ocelot.h"

namespace Ocelot::Compute::Tests
{
    using namespace Ocelot::Compute;
    using namespace Ocelot::Compute::OpenCL;

    class ProgramConfigTest : public ::testing::Test {
    protected:
        void TearDown() override {
            if ( !path_.empty() ) {
                std::error_code ec;
                std::filesystem::remove( path_, ec );
            }
        }

        std::filesystem::path writeFile( const std::string& contents ) {
            path_ = std::filesystem::temp_directory_path() /
                ("ocelot_program_config_" + std::to_string( ::testing::UnitTest::GetInstance()->random_seed() ) + ".json");
            std::ofstream file( path_ );
            file << contents;
            return path_;
        }

        std::filesystem::path path_;
    };

    TEST_F( ProgramConfigTest, Validate_AcceptsMinimalConfig ) {
        auto config = ProgramConfig( "saxpy" ).withSourceFile( "saxpy.cl" );

        EXPECT_NO_THROW( config.validate() );
    }

    TEST_F( ProgramConfigTest, Validate_AppendedSourceCountsAsSource ) {
        auto config = ProgramConfig( "inline" ).withOption( SourceAppend{ "kernel void k() {}" } );

        EXPECT_NO_THROW( config.validate() );
    }

    TEST_F( ProgramConfigTest, Validate_RejectsInvalidName ) {
        EXPECT_THROW( ProgramConfig( "1st" ).withSourceFile( "a.cl" ).validate(), ConfigurationError );
        EXPECT_THROW( ProgramConfig( "" ).withSourceFile( "a.cl" ).validate(), ConfigurationError );
        EXPECT_THROW( ProgramConfig( "has space" ).withSourceFile( "a.cl" ).validate(), ConfigurationError );
    }

    TEST_F( ProgramConfigTest, Validate_RejectsMissingSource ) {
        EXPECT_THROW( ProgramConfig( "empty" ).withOption( CompilerRaw{ "-w" } ).validate(), ConfigurationError );
    }

    TEST_F( ProgramConfigTest, Validate_RejectsUnnamedDefine ) {
        auto config = ProgramConfig( "bad" ).withSourceFile( "a.cl" ).withOption( CompilerDefine{ "", "1" } );

        EXPECT_THROW( config.validate(), ConfigurationError );
    }

    TEST_F( ProgramConfigTest, ToJson_WritesAllFields ) {
        auto config = ProgramConfig( "saxpy" )
            .withOption( CompilerDefine{ "WIDTH", "64" } )
            .withOption( SourceAppend{ "// tail" } )
            .withSourceFile( "kernels/saxpy.cl" )
            .withDeviceSelector( DeviceSelector::indices( { 0, 2 } ) );

        auto j = config.toJson();

        EXPECT_EQ( j.at( "name" ), "saxpy" );
        ASSERT_EQ( j.at( "options" ).size(), 2u );
        EXPECT_EQ( j.at( "options" )[ 0 ].at( "kind" ), "compiler_define" );
        EXPECT_EQ( j.at( "options" )[ 0 ].at( "value" ), "64" );
        EXPECT_EQ( j.at( "options" )[ 1 ].at( "kind" ), "source_append" );
        EXPECT_EQ( j.at( "source_files" )[ 0 ], "kernels/saxpy.cl" );
        EXPECT_EQ( j.at( "devices" ), json::array( { 0, 2 } ) );
    }

    TEST_F( ProgramConfigTest, ToJson_DeviceHandlesCannotBeSerialized ) {
        auto config = ProgramConfig( "handles" ).withDeviceSelector( DeviceSelector::single( nullptr ) );

        EXPECT_THROW( config.toJson(), ConfigurationError );
    }

    TEST_F( ProgramConfigTest, FromJson_ReadsOptionsAndSelector ) {
        auto j = json::parse( R"({
            "name": "scale",
            "options": [
                { "kind": "compiler_define", "name": "N", "value": 16 },
                { "kind": "compiler_include_dir", "path": "inc" },
                { "kind": "source_define", "name": "M", "value": "4" }
            ],
            "source_files": [ "scale.cl", "common.cl" ],
            "devices": { "type": "Gpu" }
        })" );

        ProgramConfig config;
        config.fromJson( j );

        EXPECT_EQ( config.getName(), "scale" );
        ASSERT_EQ( config.getOptions().size(), 3u );
        EXPECT_EQ( render( config.getOptions()[ 0 ] ), "-DN=16" );
        EXPECT_EQ( render( config.getOptions()[ 1 ] ), "-Iinc" );
        EXPECT_EQ( render( config.getOptions()[ 2 ] ), "#define M  4\n" );
        EXPECT_EQ( config.getSourceFiles().size(), 2u );
        ASSERT_TRUE( config.getDeviceSelector().has_value() );
        EXPECT_EQ( config.getDeviceSelector()->toString(), "Type(Gpu)" );
    }

    TEST_F( ProgramConfigTest, FromJson_MissingKeysKeepCurrentValues ) {
        auto config = ProgramConfig( "kept" ).withSourceFile( "a.cl" );
        config.fromJson( json::parse( R"({ "devices": "all" })" ) );

        EXPECT_EQ( config.getName(), "kept" );
        EXPECT_EQ( config.getSourceFiles().size(), 1u );
        EXPECT_EQ( config.getDeviceSelector()->toString(), "All" );
    }

    TEST_F( ProgramConfigTest, FromJson_RejectsUnknownKinds ) {
        ProgramConfig config;

        EXPECT_THROW( config.fromJson( json::parse( R"({ "options": [ { "kind": "linker_flag" } ] })" ) ), ConfigurationError );
        EXPECT_THROW( config.fromJson( json::parse( R"({ "devices": "fastest" })" ) ), ConfigurationError );
        EXPECT_THROW( config.fromJson( json::parse( R"({ "devices": { "type": "Quantum" } })" ) ), ConfigurationError );
    }

    TEST_F( ProgramConfigTest, FromJson_WrappingIndices ) {
        ProgramConfig config;
        config.fromJson( json::parse( R"({ "devices": { "wrapping_indices": [ 0, 3 ] } })" ) );

        EXPECT_EQ( config.getDeviceSelector()->toString(), "WrappingIndices[0, 3]" );
    }

    TEST_F( ProgramConfigTest, FromFile_LoadsAndValidates ) {
        auto path = writeFile( R"({ "name": "file-config", "source_files": [ "k.cl" ], "devices": "first" })" );

        auto config = ProgramConfig::fromFile( path );

        EXPECT_EQ( config.getName(), "file-config" );
        EXPECT_EQ( config.getDeviceSelector()->toString(), "First" );
    }

    TEST_F( ProgramConfigTest, FromFile_ReportsParseErrors ) {
        auto path = writeFile( "{ not json" );

        EXPECT_THROW( ProgramConfig::fromFile( path ), ConfigurationError );
    }

    TEST_F( ProgramConfigTest, FromFile_ReportsMissingFile ) {
        EXPECT_THROW( ProgramConfig::fromFile( "/nonexistent/ocelot/config.json" ), ConfigurationError );
    }

    TEST_F( ProgramConfigTest, ToString ) {
        auto config = ProgramConfig( "saxpy" ).withSourceFile( "a.cl" ).withDeviceSelector( DeviceSelector::first() );

        EXPECT_EQ( config.toString(), "ProgramConfig(name=\"saxpy\", options=0, source_files=1, devices=First)" );
    }
}
