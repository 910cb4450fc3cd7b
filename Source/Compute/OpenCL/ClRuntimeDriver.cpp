/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include "ClRuntimeDriver.h"

namespace Ocelot::Compute::OpenCL
{
    namespace
    {
        // CL_PLATFORM_NOT_FOUND_KHR (cl_khr_icd): the loader found no installed ICD.
        constexpr cl_int kPlatformNotFoundKhr = -1001;

        const cl_event* waitListPtr( std::span<const cl_event> wait_list )
        {
            return wait_list.empty() ? nullptr : wait_list.data();
        }
    }

    std::shared_ptr<ClDriver> ClRuntimeDriver::shared()
    {
        static std::shared_ptr<ClDriver> instance = std::make_shared<ClRuntimeDriver>();
        return instance;
    }

    cl_int ClRuntimeDriver::getPlatformIds( std::vector<cl_platform_id>& platforms )
    {
        platforms.clear();

        cl_uint count = 0;
        cl_int status = clGetPlatformIDs( 0, nullptr, &count );

        if ( status == kPlatformNotFoundKhr || (status == CL_SUCCESS && count == 0) )
        {
            return CL_SUCCESS;
        }

        if ( status != CL_SUCCESS )
        {
            return status;
        }

        platforms.resize( count );
        return clGetPlatformIDs( count, platforms.data(), nullptr );
    }

    cl_int ClRuntimeDriver::getPlatformInfo( cl_platform_id platform, cl_platform_info param,
        size_t value_size, void* value, size_t* value_size_ret )
    {
        return clGetPlatformInfo( platform, param, value_size, value, value_size_ret );
    }

    cl_int ClRuntimeDriver::getDeviceIds( cl_platform_id platform, cl_device_type type,
        std::vector<cl_device_id>& devices )
    {
        devices.clear();

        cl_uint count = 0;
        cl_int status = clGetDeviceIDs( platform, type, 0, nullptr, &count );

        if ( status != CL_SUCCESS )
        {
            return status;
        }

        devices.resize( count );
        return clGetDeviceIDs( platform, type, count, devices.data(), nullptr );
    }

    cl_int ClRuntimeDriver::getDeviceInfo( cl_device_id device, cl_device_info param,
        size_t value_size, void* value, size_t* value_size_ret )
    {
        return clGetDeviceInfo( device, param, value_size, value, value_size_ret );
    }

    cl_context ClRuntimeDriver::createContext( const cl_context_properties* properties,
        const std::vector<cl_device_id>& devices, cl_int* status )
    {
        return clCreateContext( properties, static_cast<cl_uint>( devices.size() ), devices.data(),
            nullptr, nullptr, status );
    }

    cl_int ClRuntimeDriver::releaseContext( cl_context context )
    {
        return clReleaseContext( context );
    }

    cl_command_queue ClRuntimeDriver::createCommandQueue( cl_context context, cl_device_id device,
        cl_command_queue_properties properties, cl_int* status )
    {
        return clCreateCommandQueue( context, device, properties, status );
    }

    cl_int ClRuntimeDriver::finish( cl_command_queue queue )
    {
        return clFinish( queue );
    }

    cl_int ClRuntimeDriver::releaseCommandQueue( cl_command_queue queue )
    {
        return clReleaseCommandQueue( queue );
    }

    cl_mem ClRuntimeDriver::createBuffer( cl_context context, cl_mem_flags flags, size_t size,
        void* host_ptr, cl_int* status )
    {
        return clCreateBuffer( context, flags, size, host_ptr, status );
    }

    void* ClRuntimeDriver::enqueueMapBuffer( cl_command_queue queue, cl_mem buffer, cl_bool blocking,
        cl_map_flags flags, size_t offset, size_t size,
        std::span<const cl_event> wait_list, cl_event* event, cl_int* status )
    {
        return clEnqueueMapBuffer( queue, buffer, blocking, flags, offset, size,
            static_cast<cl_uint>( wait_list.size() ), waitListPtr( wait_list ), event, status );
    }

    cl_int ClRuntimeDriver::enqueueUnmapMemObject( cl_command_queue queue, cl_mem memobj, void* mapped_ptr,
        std::span<const cl_event> wait_list, cl_event* event )
    {
        return clEnqueueUnmapMemObject( queue, memobj, mapped_ptr,
            static_cast<cl_uint>( wait_list.size() ), waitListPtr( wait_list ), event );
    }

    cl_int ClRuntimeDriver::releaseMemObject( cl_mem memobj )
    {
        return clReleaseMemObject( memobj );
    }

    cl_event ClRuntimeDriver::createUserEvent( cl_context context, cl_int* status )
    {
        return clCreateUserEvent( context, status );
    }

    cl_int ClRuntimeDriver::setUserEventStatus( cl_event event, cl_int execution_status )
    {
        return clSetUserEventStatus( event, execution_status );
    }

    cl_int ClRuntimeDriver::setEventCallback( cl_event event, cl_int callback_type,
        EventCallback callback, void* user_data )
    {
        return clSetEventCallback( event, callback_type, callback, user_data );
    }

    cl_int ClRuntimeDriver::waitForEvents( std::span<const cl_event> events )
    {
        return clWaitForEvents( static_cast<cl_uint>( events.size() ), events.data() );
    }

    cl_int ClRuntimeDriver::retainEvent( cl_event event )
    {
        return clRetainEvent( event );
    }

    cl_int ClRuntimeDriver::releaseEvent( cl_event event )
    {
        return clReleaseEvent( event );
    }

    cl_program ClRuntimeDriver::createProgramWithSource( cl_context context,
        const std::vector<std::string>& sources, cl_int* status )
    {
        std::vector<const char*> strings;
        std::vector<size_t> lengths;
        strings.reserve( sources.size() );
        lengths.reserve( sources.size() );

        for ( const auto& source : sources )
        {
            strings.push_back( source.c_str() );
            lengths.push_back( source.size() );
        }

        return clCreateProgramWithSource( context, static_cast<cl_uint>( strings.size() ),
            strings.data(), lengths.data(), status );
    }

    cl_int ClRuntimeDriver::buildProgram( cl_program program, const std::vector<cl_device_id>& devices,
        const std::string& options )
    {
        return clBuildProgram( program, static_cast<cl_uint>( devices.size() ), devices.data(),
            options.c_str(), nullptr, nullptr );
    }

    cl_int ClRuntimeDriver::getProgramInfo( cl_program program, cl_program_info param,
        size_t value_size, void* value, size_t* value_size_ret )
    {
        return clGetProgramInfo( program, param, value_size, value, value_size_ret );
    }

    cl_int ClRuntimeDriver::getProgramBuildInfo( cl_program program, cl_device_id device,
        cl_program_build_info param, size_t value_size, void* value, size_t* value_size_ret )
    {
        return clGetProgramBuildInfo( program, device, param, value_size, value, value_size_ret );
    }

    cl_int ClRuntimeDriver::releaseProgram( cl_program program )
    {
        return clReleaseProgram( program );
    }
}
