/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_PROGRAM_COMPILER_H_
#define OCELOT_COMPUTE_PROGRAM_COMPILER_H_

#include <string>
#include <vector>

#include "../OpenCL/ClHeaders.h"
#include "../OpenCL/Context.h"
#include "Program.h"
#include "ProgramBuildError.h"

namespace Ocelot::Compute
{
    /**
     * @brief Creates a program from source blocks and builds it for devices.
     *
     * No program escapes on failure: a program that fails to build is released
     * before ProgramBuildError is thrown.
     *
     * @throws ConfigurationError if devices is empty.
     * @throws EncodingError if a source block or the options contain a NUL byte.
     * @throws ProgramBuildError if clBuildProgram fails.
     * @throws ClError if program creation or a log query fails.
     */
    Program compileProgram( const OpenCL::Context& context, const std::vector<cl_device_id>& devices,
        const std::vector<std::string>& sources, const std::string& options );

    /**
     * @brief Throws EncodingError if text contains a NUL byte. what names the offending text.
     */
    void checkNoNul( const std::string& text, const std::string& what );
}
#endif
