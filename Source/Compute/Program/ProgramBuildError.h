/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_PROGRAM_BUILD_ERROR_H_
#define OCELOT_COMPUTE_PROGRAM_BUILD_ERROR_H_

#include <source_location>
#include <string>
#include <utility>
#include <vector>

#include "../OpenCL/ClError.h"
#include "../OpenCL/ClHeaders.h"

namespace Ocelot::Compute
{
    struct DeviceBuildLog
    {
        cl_device_id device;
        std::string log;
    };

    /**
     * @brief clBuildProgram failed. Carries the build log of every device.
     */
    class ProgramBuildError : public OpenCL::ClError
    {
    public:

        ProgramBuildError( cl_int status, std::vector<DeviceBuildLog> logs,
            const std::source_location& location = std::source_location::current() )
            : OpenCL::ClError( status, "clBuildProgram", formatLogs( logs ), location ),
            logs_( std::move( logs ) )
        {
        }

        const std::vector<DeviceBuildLog>& getBuildLogs() const noexcept
        {
            return logs_;
        }

    private:

        static std::string formatLogs( const std::vector<DeviceBuildLog>& logs )
        {
            std::string text;
            for ( size_t i = 0; i < logs.size(); ++i )
            {
                text += (i > 0 ? "\n" : "") + std::string( "[device " ) + std::to_string( i ) + "] " + logs[ i ].log;
            }
            return text;
        }

        std::vector<DeviceBuildLog> logs_;
    };
}
#endif
