/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_RUNTIME_DRIVER_H_
#define OCELOT_COMPUTE_OPENCL_RUNTIME_DRIVER_H_

#include <memory>

#include "ClDriver.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief ClDriver backed by the installed OpenCL ICD loader.
     */
    class ClRuntimeDriver : public ClDriver
    {
    public:

        /**
         * @brief Returns the process-wide runtime driver.
         */
        static std::shared_ptr<ClDriver> shared();

        cl_int getPlatformIds( std::vector<cl_platform_id>& platforms ) override;
        cl_int getPlatformInfo( cl_platform_id platform, cl_platform_info param,
            size_t value_size, void* value, size_t* value_size_ret ) override;
        cl_int getDeviceIds( cl_platform_id platform, cl_device_type type,
            std::vector<cl_device_id>& devices ) override;
        cl_int getDeviceInfo( cl_device_id device, cl_device_info param,
            size_t value_size, void* value, size_t* value_size_ret ) override;

        cl_context createContext( const cl_context_properties* properties,
            const std::vector<cl_device_id>& devices, cl_int* status ) override;
        cl_int releaseContext( cl_context context ) override;

        cl_command_queue createCommandQueue( cl_context context, cl_device_id device,
            cl_command_queue_properties properties, cl_int* status ) override;
        cl_int finish( cl_command_queue queue ) override;
        cl_int releaseCommandQueue( cl_command_queue queue ) override;

        cl_mem createBuffer( cl_context context, cl_mem_flags flags, size_t size,
            void* host_ptr, cl_int* status ) override;
        void* enqueueMapBuffer( cl_command_queue queue, cl_mem buffer, cl_bool blocking,
            cl_map_flags flags, size_t offset, size_t size,
            std::span<const cl_event> wait_list, cl_event* event, cl_int* status ) override;
        cl_int enqueueUnmapMemObject( cl_command_queue queue, cl_mem memobj, void* mapped_ptr,
            std::span<const cl_event> wait_list, cl_event* event ) override;
        cl_int releaseMemObject( cl_mem memobj ) override;

        cl_event createUserEvent( cl_context context, cl_int* status ) override;
        cl_int setUserEventStatus( cl_event event, cl_int execution_status ) override;
        cl_int setEventCallback( cl_event event, cl_int callback_type,
            EventCallback callback, void* user_data ) override;
        cl_int waitForEvents( std::span<const cl_event> events ) override;
        cl_int retainEvent( cl_event event ) override;
        cl_int releaseEvent( cl_event event ) override;

        cl_program createProgramWithSource( cl_context context,
            const std::vector<std::string>& sources, cl_int* status ) override;
        cl_int buildProgram( cl_program program, const std::vector<cl_device_id>& devices,
            const std::string& options ) override;
        cl_int getProgramInfo( cl_program program, cl_program_info param,
            size_t value_size, void* value, size_t* value_size_ret ) override;
        cl_int getProgramBuildInfo( cl_program program, cl_device_id device,
            cl_program_build_info param, size_t value_size, void* value, size_t* value_size_ret ) override;
        cl_int releaseProgram( cl_program program ) override;
    };
}
#endif
