/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <fstream>
#include <sstream>
#include <type_traits>

#include "ProgramConfig.h"
#include "../ComputeError.h"

namespace Ocelot::Compute
{
    using namespace Ocelot::Compute::OpenCL;

    namespace
    {
        bool isIdentifier( const std::string& s ) noexcept
        {
            constexpr std::size_t kMaxLen = 128;

            if ( s.empty() || s.size() > kMaxLen )
            {
                return false;
            }

            auto isAsciiAlpha = []( unsigned char c ) noexcept {
                return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
                };

            if ( !isAsciiAlpha( static_cast<unsigned char>( s[ 0 ] ) ) )
            {
                return false;
            }

            for ( unsigned char uc : s )
            {
                if ( isAsciiAlpha( uc ) || (uc >= '0' && uc <= '9') || uc == '.' || uc == '_' || uc == '-' )
                {
                    continue;
                }

                return false;
            }

            return true;
        }

        std::string valueToString( const json& value )
        {
            if ( value.is_string() )
            {
                return value.get<std::string>();
            }

            return value.dump();
        }

        json optionToJson( const BuildOption& option )
        {
            return std::visit( []( const auto& opt ) -> json {
                using TOption = std::decay_t<decltype(opt)>;

                if constexpr ( std::is_same_v<TOption, CompilerDefine> ) {
                    return { { "kind", "compiler_define" }, { "name", opt.name }, { "value", opt.value } };
                }
                else if constexpr ( std::is_same_v<TOption, CompilerIncludeDir> ) {
                    return { { "kind", "compiler_include_dir" }, { "path", opt.path } };
                }
                else if constexpr ( std::is_same_v<TOption, CompilerRaw> ) {
                    return { { "kind", "compiler_raw" }, { "text", opt.text } };
                }
                else if constexpr ( std::is_same_v<TOption, SourceDefine> ) {
                    return { { "kind", "source_define" }, { "name", opt.name }, { "value", opt.value } };
                }
                else if constexpr ( std::is_same_v<TOption, SourceInclude> ) {
                    return { { "kind", "source_include" }, { "text", opt.text } };
                }
                else {
                    return { { "kind", "source_append" }, { "text", opt.text } };
                }
                }, option );
        }

        BuildOption optionFromJson( const json& j )
        {
            const auto kind = j.at( "kind" ).get<std::string>();

            if ( kind == "compiler_define" )
            {
                return CompilerDefine{ j.at( "name" ).get<std::string>(), valueToString( j.at( "value" ) ) };
            }
            if ( kind == "compiler_include_dir" )
            {
                return CompilerIncludeDir{ j.at( "path" ).get<std::string>() };
            }
            if ( kind == "compiler_raw" )
            {
                return CompilerRaw{ j.at( "text" ).get<std::string>() };
            }
            if ( kind == "source_define" )
            {
                return SourceDefine{ j.at( "name" ).get<std::string>(), valueToString( j.at( "value" ) ) };
            }
            if ( kind == "source_include" )
            {
                return SourceInclude{ j.at( "text" ).get<std::string>() };
            }
            if ( kind == "source_append" )
            {
                return SourceAppend{ j.at( "text" ).get<std::string>() };
            }

            throw ConfigurationError( "ProgramConfig::fromJson: unknown build option kind '" + kind + "'" );
        }

        json selectorToJson( const DeviceSelector& selector )
        {
            return std::visit( [&selector]( const auto& selection ) -> json {
                using TSelection = std::decay_t<decltype(selection)>;

                if constexpr ( std::is_same_v<TSelection, DeviceSelector::First> ) {
                    return "first";
                }
                else if constexpr ( std::is_same_v<TSelection, DeviceSelector::All> ) {
                    return "all";
                }
                else if constexpr ( std::is_same_v<TSelection, DeviceSelector::Indices> ) {
                    return selection.indices;
                }
                else if constexpr ( std::is_same_v<TSelection, DeviceSelector::WrappingIndices> ) {
                    return { { "wrapping_indices", selection.indices } };
                }
                else if constexpr ( std::is_same_v<TSelection, DeviceSelector::Type> ) {
                    return { { "type", deviceTypeToString( selection.type ) } };
                }
                else {
                    throw ConfigurationError( "ProgramConfig::toJson: device selector " + selector.toString() +
                        " names device handles and cannot be serialized" );
                }
                }, selector.getSelection() );
        }

        DeviceSelector selectorFromJson( const json& j )
        {
            if ( j.is_string() )
            {
                const auto text = j.get<std::string>();

                if ( text == "first" )
                {
                    return DeviceSelector::first();
                }
                if ( text == "all" )
                {
                    return DeviceSelector::all();
                }
            }
            else if ( j.is_array() )
            {
                return DeviceSelector::indices( j.get<std::vector<size_t>>() );
            }
            else if ( j.is_object() && j.contains( "wrapping_indices" ) )
            {
                return DeviceSelector::wrappingIndices( j.at( "wrapping_indices" ).get<std::vector<size_t>>() );
            }
            else if ( j.is_object() && j.contains( "type" ) )
            {
                try
                {
                    return DeviceSelector::type( toDeviceType( j.at( "type" ).get<std::string>() ) );
                }
                catch ( const std::invalid_argument& e )
                {
                    throw ConfigurationError( std::string( "ProgramConfig::fromJson: " ) + e.what() );
                }
            }

            throw ConfigurationError( "ProgramConfig::fromJson: unsupported device selection " + j.dump() );
        }
    }

    void ProgramConfig::validate() const
    {
        if ( !isIdentifier( name_ ) )
        {
            throw ConfigurationError(
                "ProgramConfig::validate: name must start with a letter and contain only "
                "letters, digits, '.', '_', '-' (1..128 chars)" );
        }

        bool has_source = !source_files_.empty();

        for ( const auto& option : options_ )
        {
            if ( const auto* define = std::get_if<CompilerDefine>( &option ); define && define->name.empty() )
            {
                throw ConfigurationError( "ProgramConfig::validate: compiler define with an empty name" );
            }

            if ( const auto* define = std::get_if<SourceDefine>( &option ); define && define->name.empty() )
            {
                throw ConfigurationError( "ProgramConfig::validate: source define with an empty name" );
            }

            if ( std::holds_alternative<SourceAppend>( option ) )
            {
                has_source = true;
            }
        }

        for ( const auto& path : source_files_ )
        {
            if ( path.empty() )
            {
                throw ConfigurationError( "ProgramConfig::validate: empty source file path" );
            }
        }

        if ( !has_source )
        {
            throw ConfigurationError( "ProgramConfig::validate: no source files or appended source" );
        }
    }

    json ProgramConfig::toJson() const
    {
        json j;
        j[ "name" ] = name_;

        j[ "options" ] = json::array();
        for ( const auto& option : options_ )
        {
            j[ "options" ].push_back( optionToJson( option ) );
        }

        j[ "source_files" ] = json::array();
        for ( const auto& path : source_files_ )
        {
            j[ "source_files" ].push_back( path.generic_string() );
        }

        if ( device_selector_ )
        {
            j[ "devices" ] = selectorToJson( *device_selector_ );
        }

        return j;
    }

    void ProgramConfig::fromJson( const json& j )
    {
        if ( j.contains( "name" ) )
        {
            name_ = j.at( "name" ).get<std::string>();
        }

        if ( j.contains( "options" ) )
        {
            options_.clear();
            for ( const auto& option : j.at( "options" ) )
            {
                options_.push_back( optionFromJson( option ) );
            }
        }

        if ( j.contains( "source_files" ) )
        {
            source_files_.clear();
            for ( const auto& path : j.at( "source_files" ) )
            {
                source_files_.emplace_back( path.get<std::string>() );
            }
        }

        if ( j.contains( "devices" ) )
        {
            device_selector_ = selectorFromJson( j.at( "devices" ) );
        }
    }

    ProgramConfig ProgramConfig::fromFile( const std::filesystem::path& path )
    {
        std::ifstream file( path );

        if ( !file.is_open() )
        {
            throw ConfigurationError( "ProgramConfig::fromFile: unable to open '" + path.string() + "'" );
        }

        json j;
        try
        {
            j = json::parse( file );
        }
        catch ( const json::parse_error& e )
        {
            throw ConfigurationError( "ProgramConfig::fromFile: '" + path.string() + "': " + e.what() );
        }

        ProgramConfig config;
        config.fromJson( j );
        config.validate();

        return config;
    }

    std::string ProgramConfig::toString() const
    {
        std::ostringstream oss;
        oss << "ProgramConfig(name=\"" << name_ << "\""
            << ", options=" << options_.size()
            << ", source_files=" << source_files_.size()
            << ", devices=" << (device_selector_ ? device_selector_->toString() : "unset")
            << ")";

        return oss.str();
    }
}
