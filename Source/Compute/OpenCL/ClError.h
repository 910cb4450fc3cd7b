/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_ERROR_H_
#define OCELOT_COMPUTE_OPENCL_ERROR_H_

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>

#include "ClHeaders.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief Returns the symbolic name of an OpenCL status code, e.g. "CL_INVALID_VALUE".
     */
    std::string statusToString( cl_int status );

    /**
     * @brief Exception wrapping a failed OpenCL API call.
     *
     * Carries the native status code, the name of the API function that failed
     * and the source location of the check.
     */
    class ClError : public std::runtime_error
    {
    public:
        /**
         * @brief Constructs a new ClError exception.
         *
         * @param status The OpenCL status code returned by the native call.
         * @param function The native entry point name, e.g. "clBuildProgram".
         * @param location Source location information (automatically populated by default).
         */
        ClError( cl_int status, const std::string& function,
            const std::source_location& location = std::source_location::current() )
            : ClError( status, function, std::string(), location )
        {
        }

        /**
         * @brief Constructs a ClError with additional detail appended to the message.
         */
        ClError( cl_int status, const std::string& function, const std::string& detail,
            const std::source_location& location = std::source_location::current() )
            : std::runtime_error( getMessage( status, function, detail, location ) ),
            status_( status ),
            function_( function ),
            file_( location.file_name() ),
            line_( location.line() )
        {
        }

        cl_int getStatus() const noexcept
        {
            return status_;
        }

        const std::string& getFunction() const noexcept
        {
            return function_;
        }

        const char* getFile() const noexcept
        {
            return file_;
        }

        uint32_t getLine() const noexcept
        {
            return line_;
        }

    private:
        cl_int status_ = CL_SUCCESS;
        std::string function_;
        const char* file_;
        uint32_t line_;

        static std::string getMessage( cl_int status, const std::string& function,
            const std::string& detail, const std::source_location& location );
    };

    /**
     * @brief Checks the status of an OpenCL call and throws if an error occurred.
     *
     * @throws ClError if status is not CL_SUCCESS.
     */
    inline void clCheckStatus( cl_int status, const char* function,
        const std::source_location& location = std::source_location::current() )
    {
        if ( status != CL_SUCCESS )
        {
            throw ClError( status, function, location );
        }
    }
}
#endif
