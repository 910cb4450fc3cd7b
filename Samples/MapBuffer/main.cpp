/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include "Ocelot.h"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

using namespace std;
using namespace Ocelot;
using namespace Ocelot::Compute;
using namespace Ocelot::Compute::OpenCL;

namespace
{
    constexpr size_t kElementCount = 1024;

    Context createContext( const std::shared_ptr<ClDriver>& driver )
    {
        try
        {
            return Context::create( driver, ContextPropertyList(), DeviceSelector::type( DeviceType::Gpu ) );
        }
        catch ( const ConfigurationError& e )
        {
            Utils::Logger::warning( std::string( e.what() ) + " Falling back to the first device." );
        }

        return Context::create( driver );
    }
}

int main( int argc, char* argv[] )
{
    if ( !Ocelot::initialize( Utils::LogLevel::Info ) )
    {
        return 1;
    }

    int result = 0;

    try
    {
        std::filesystem::path kernel_dir = argc > 1 ? argv[ 1 ] : std::filesystem::path( argv[ 0 ] ).parent_path();

        cout << "Ocelot Version: " << getAPIVersion().ToString() << endl;

        auto context = createContext( ClRuntimeDriver::shared() );
        auto platform = context.getPlatform();

        cout << "Platform: " << platform.getName() << " (" << platform.getVersionString() << ")" << endl;

        ProgramBuilder builder;
        builder.addCompilerDefine( "SCALE", 2 )
            .addSourceDefine( "ELEMENT_COUNT", static_cast<int>( kElementCount ) )
            .addSourceFile( kernel_dir / "scale.cl" )
            .addDeviceSelector( DeviceSelector::list( context.getDevices() ) );

        auto program = builder.build( context );
        cout << program.toString() << endl;

        auto queue = std::make_shared<CommandQueue>( CommandQueue::create( context, context.getDevices()[ 0 ] ) );
        auto buffer = std::make_shared<MemObject>(
            MemObject::createBuffer( context, CL_MEM_READ_WRITE, kElementCount * sizeof( float ) ) );

        auto region = mapBuffer<float>( queue, buffer, CL_MAP_WRITE, 0, kElementCount,
            UserEvent::create( context ), UnmapStrategy::Deferred );

        auto values = region.slice();
        for ( size_t i = 0; i < values.size(); ++i )
        {
            values[ i ] = static_cast<float>( i );
        }

        Event unmapped;
        region.unmap( nullptr, {}, &unmapped );
        unmapped.wait();

        auto readback = mapBuffer<float>( queue, buffer, CL_MAP_READ, 0, kElementCount,
            std::nullopt, UnmapStrategy::Deferred );
        cout << "Last element: " << readback[ kElementCount - 1 ] << endl;
        readback.unmap();

        queue->finish();
    }
    catch ( const ProgramBuildError& e )
    {
        cerr << e.what() << endl;
        result = 2;
    }
    catch ( const std::exception& e )
    {
        cerr << "MapBuffer sample failed: " << e.what() << endl;
        result = 1;
    }

    Ocelot::shutdown();

    return result;
}
