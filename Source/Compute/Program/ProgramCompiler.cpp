/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include "ProgramCompiler.h"
#include "../ComputeError.h"
#include "../../Utils/Logger.h"

namespace Ocelot::Compute
{
    using namespace Ocelot::Compute::OpenCL;

    void checkNoNul( const std::string& text, const std::string& what )
    {
        if ( text.find( '\0' ) != std::string::npos )
        {
            throw EncodingError( what + " contains an embedded NUL byte." );
        }
    }

    Program compileProgram( const Context& context, const std::vector<cl_device_id>& devices,
        const std::vector<std::string>& sources, const std::string& options )
    {
        if ( devices.empty() )
        {
            throw ConfigurationError( "compileProgram: No devices found." );
        }

        for ( size_t i = 0; i < sources.size(); ++i )
        {
            checkNoNul( sources[ i ], "Source block " + std::to_string( i ) );
        }
        checkNoNul( options, "Compiler options" );

        ClDriver& driver = context.getDriver();

        cl_int status = CL_SUCCESS;
        cl_program handle = driver.createProgramWithSource( context, sources, &status );
        clCheckStatus( status, "clCreateProgramWithSource" );

        Program program( context.getSharedDriver(), handle, devices );

        Utils::Logger::info( "Building program for " + std::to_string( devices.size() ) +
            " device(s) with options '" + options + "'." );

        status = driver.buildProgram( program, devices, options );

        if ( status != CL_SUCCESS )
        {
            std::vector<DeviceBuildLog> logs;
            for ( cl_device_id device : devices )
            {
                std::string log;
                try
                {
                    log = program.getBuildLog( device );
                }
                catch ( const ClError& e )
                {
                    log = "<build log unavailable: " + statusToString( e.getStatus() ) + ">";
                }

                logs.push_back( DeviceBuildLog{ device, std::move( log ) } );
                Utils::Logger::error( "Program build log:\n" + logs.back().log );
            }

            // program is released as the exception leaves this scope.
            throw ProgramBuildError( status, std::move( logs ) );
        }

        Utils::Logger::debug( "Program built." );

        return program;
    }
}
