/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_PROGRAM_PROGRAM_H_
#define OCELOT_COMPUTE_PROGRAM_PROGRAM_H_

#include <memory>
#include <string>
#include <vector>

#include "../OpenCL/ClHeaders.h"
#include "../OpenCL/ClUniqueHandle.h"

namespace Ocelot::Compute
{
    enum class BuildStatus {
        Success,
        None,
        Error,
        InProgress
    };

    std::string buildStatusToString( BuildStatus status );

    /**
     * @brief A compiled OpenCL program and the devices it was built for.
     */
    class Program : public OpenCL::ClUniqueHandle<cl_program, Program>
    {
    public:

        Program( std::shared_ptr<OpenCL::ClDriver> driver, cl_program program, std::vector<cl_device_id> devices );

        const std::vector<cl_device_id>& getDevices() const noexcept
        {
            return devices_;
        }

        // Per-device build information

        BuildStatus getBuildStatus( cl_device_id device ) const;
        std::string getBuildLog( cl_device_id device ) const;
        std::string getBuildOptions( cl_device_id device ) const;

        // Program information

        size_t getNumKernels() const;
        std::vector<std::string> getKernelNames() const;
        std::string getSource() const;
        cl_uint getReferenceCount() const;

        std::string toString() const;

        static cl_int DestroyHandle( OpenCL::ClDriver& driver, cl_program program );

    private:

        std::vector<cl_device_id> devices_;
    };
}
#endif
