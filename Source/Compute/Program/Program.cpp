/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <sstream>

#include "Program.h"
#include "../OpenCL/ClError.h"
#include "../OpenCL/ClInfo.h"

namespace Ocelot::Compute
{
    using namespace Ocelot::Compute::OpenCL;

    std::string buildStatusToString( BuildStatus status )
    {
        switch ( status ) {
            case BuildStatus::Success:    return "Success";
            case BuildStatus::None:       return "None";
            case BuildStatus::Error:      return "Error";
            case BuildStatus::InProgress: return "InProgress";
        }
        return "Unknown";
    }

    Program::Program( std::shared_ptr<ClDriver> driver, cl_program program, std::vector<cl_device_id> devices )
        : ClUniqueHandle<cl_program, Program>( std::move( driver ), program ), devices_( std::move( devices ) )
    {
    }

    BuildStatus Program::getBuildStatus( cl_device_id device ) const
    {
        auto status = Detail::getInfoValue<cl_build_status>( [this, device]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getProgramBuildInfo( handle_, device, CL_PROGRAM_BUILD_STATUS, size, value, size_ret );
            }, "clGetProgramBuildInfo" );

        switch ( status ) {
            case CL_BUILD_SUCCESS:     return BuildStatus::Success;
            case CL_BUILD_NONE:        return BuildStatus::None;
            case CL_BUILD_IN_PROGRESS: return BuildStatus::InProgress;
            default:                   return BuildStatus::Error;
        }
    }

    std::string Program::getBuildLog( cl_device_id device ) const
    {
        return Detail::getInfoString( [this, device]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getProgramBuildInfo( handle_, device, CL_PROGRAM_BUILD_LOG, size, value, size_ret );
            }, "clGetProgramBuildInfo" );
    }

    std::string Program::getBuildOptions( cl_device_id device ) const
    {
        return Detail::getInfoString( [this, device]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getProgramBuildInfo( handle_, device, CL_PROGRAM_BUILD_OPTIONS, size, value, size_ret );
            }, "clGetProgramBuildInfo" );
    }

    size_t Program::getNumKernels() const
    {
        return Detail::getInfoValue<size_t>( [this]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getProgramInfo( handle_, CL_PROGRAM_NUM_KERNELS, size, value, size_ret );
            }, "clGetProgramInfo" );
    }

    std::vector<std::string> Program::getKernelNames() const
    {
        std::string names = Detail::getInfoString( [this]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getProgramInfo( handle_, CL_PROGRAM_KERNEL_NAMES, size, value, size_ret );
            }, "clGetProgramInfo" );

        std::vector<std::string> kernels;
        std::istringstream stream( names );
        std::string name;

        while ( std::getline( stream, name, ';' ) )
        {
            if ( !name.empty() )
            {
                kernels.push_back( name );
            }
        }

        return kernels;
    }

    std::string Program::getSource() const
    {
        return Detail::getInfoString( [this]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getProgramInfo( handle_, CL_PROGRAM_SOURCE, size, value, size_ret );
            }, "clGetProgramInfo" );
    }

    cl_uint Program::getReferenceCount() const
    {
        return Detail::getInfoValue<cl_uint>( [this]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getProgramInfo( handle_, CL_PROGRAM_REFERENCE_COUNT, size, value, size_ret );
            }, "clGetProgramInfo" );
    }

    std::string Program::toString() const
    {
        std::ostringstream oss;
        oss << "Program { ReferenceCount: " << getReferenceCount()
            << ", NumDevices: " << devices_.size()
            << ", NumKernels: " << getNumKernels()
            << ", KernelNames: [";

        auto names = getKernelNames();
        for ( size_t i = 0; i < names.size(); ++i )
        {
            oss << (i > 0 ? ", " : "") << names[ i ];
        }

        oss << "], BuildStatus: [";
        for ( size_t i = 0; i < devices_.size(); ++i )
        {
            oss << (i > 0 ? ", " : "") << buildStatusToString( getBuildStatus( devices_[ i ] ) );
        }
        oss << "] }";

        return oss.str();
    }

    cl_int Program::DestroyHandle( ClDriver& driver, cl_program program )
    {
        return driver.releaseProgram( program );
    }
}
