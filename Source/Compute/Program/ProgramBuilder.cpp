/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <set>

#include "ProgramBuilder.h"
#include "ProgramCompiler.h"
#include "../ComputeError.h"
#include "../../Utils/Logger.h"

namespace Ocelot::Compute
{
    using namespace Ocelot::Compute::OpenCL;

    ProgramBuilder::ProgramBuilder( const ProgramConfig& config )
        : options_( config.getOptions() ), source_files_( config.getSourceFiles() ),
        device_selector_( config.getDeviceSelector() )
    {
    }

    ProgramBuilder& ProgramBuilder::addOption( BuildOption option )
    {
        options_.push_back( std::move( option ) );
        return *this;
    }

    ProgramBuilder& ProgramBuilder::addCompilerDefine( const std::string& name, int value )
    {
        return addOption( CompilerDefine{ name, std::to_string( value ) } );
    }

    ProgramBuilder& ProgramBuilder::addCompilerDefine( const std::string& name, const std::string& value )
    {
        return addOption( CompilerDefine{ name, value } );
    }

    ProgramBuilder& ProgramBuilder::addIncludeDir( const std::string& path )
    {
        return addOption( CompilerIncludeDir{ path } );
    }

    ProgramBuilder& ProgramBuilder::addCompilerOption( const std::string& text )
    {
        return addOption( CompilerRaw{ text } );
    }

    ProgramBuilder& ProgramBuilder::addSourceDefine( const std::string& name, int value )
    {
        return addOption( SourceDefine{ name, std::to_string( value ) } );
    }

    ProgramBuilder& ProgramBuilder::addSourceDefine( const std::string& name, const std::string& value )
    {
        return addOption( SourceDefine{ name, value } );
    }

    ProgramBuilder& ProgramBuilder::addSourceInclude( const std::string& text )
    {
        return addOption( SourceInclude{ text } );
    }

    ProgramBuilder& ProgramBuilder::addSource( const std::string& text )
    {
        return addOption( SourceAppend{ text } );
    }

    ProgramBuilder& ProgramBuilder::addSourceFile( const std::filesystem::path& path )
    {
        source_files_.push_back( path );
        return *this;
    }

    ProgramBuilder& ProgramBuilder::addDeviceSelector( DeviceSelector selector )
    {
        if ( device_selector_ )
        {
            throw ConfigurationError( "ProgramBuilder::addDeviceSelector: a device selector has already been set ("
                + device_selector_->toString() + ")." );
        }

        device_selector_ = std::move( selector );
        return *this;
    }

    std::vector<std::string> ProgramBuilder::assembleSources( SourceReader& reader ) const
    {
        std::vector<std::string> blocks;
        blocks.emplace_back( "\n" );

        for ( const auto& option : options_ )
        {
            if ( std::holds_alternative<SourceDefine>( option ) || std::holds_alternative<SourceInclude>( option ) )
            {
                blocks.push_back( render( option ) );
                checkNoNul( blocks.back(), toString( option ) );
            }
        }

        std::set<std::filesystem::path> emitted;

        for ( auto it = source_files_.rbegin(); it != source_files_.rend(); ++it )
        {
            if ( !emitted.insert( *it ).second )
            {
                continue;
            }

            blocks.push_back( reader.read( *it ) );
            checkNoNul( blocks.back(), "Source file '" + it->string() + "'" );
        }

        blocks.emplace_back( "\n" );

        for ( const auto& option : options_ )
        {
            if ( std::holds_alternative<SourceAppend>( option ) )
            {
                blocks.push_back( render( option ) );
                checkNoNul( blocks.back(), toString( option ) );
            }
        }

        return blocks;
    }

    std::vector<std::string> ProgramBuilder::assembleSources() const
    {
        FileSystemSourceReader reader;
        return assembleSources( reader );
    }

    std::string ProgramBuilder::assembleCompilerOptions() const
    {
        std::string options = " ";

        for ( const auto& option : options_ )
        {
            if ( isCompilerOption( option ) )
            {
                options += " " + render( option );
            }
        }

        checkNoNul( options, "Compiler options" );

        return options;
    }

    Program ProgramBuilder::build( const Context& context ) const
    {
        FileSystemSourceReader reader;
        return build( context, reader );
    }

    Program ProgramBuilder::build( const Context& context, SourceReader& reader ) const
    {
        std::vector<cl_device_id> devices;

        if ( device_selector_ )
        {
            devices = device_selector_->resolve( context.getPlatform() );
        }

        if ( devices.empty() )
        {
            throw ConfigurationError( "ProgramBuilder::build: No devices found." );
        }

        auto sources = assembleSources( reader );
        auto options = assembleCompilerOptions();

        Utils::Logger::debug( "ProgramBuilder: " + std::to_string( sources.size() ) + " source block(s) assembled." );

        return compileProgram( context, devices, sources, options );
    }
}
