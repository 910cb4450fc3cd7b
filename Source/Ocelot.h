/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_H_
#define OCELOT_H_

#include "Version.h"

#include "Utils/Logger.h"
#include "Utils/DefaultLogger.h"

#include "Compute/ComputeError.h"
#include "Compute/Contract.h"

#include "Compute/OpenCL/ClHeaders.h"
#include "Compute/OpenCL/ClError.h"
#include "Compute/OpenCL/ClDriver.h"
#include "Compute/OpenCL/ClRuntimeDriver.h"
#include "Compute/OpenCL/ClUniqueHandle.h"
#include "Compute/OpenCL/OpenclVersion.h"
#include "Compute/OpenCL/DeviceType.h"
#include "Compute/OpenCL/Platform.h"
#include "Compute/OpenCL/DeviceSelector.h"
#include "Compute/OpenCL/ContextProperties.h"
#include "Compute/OpenCL/Context.h"
#include "Compute/OpenCL/CommandQueue.h"
#include "Compute/OpenCL/MemObject.h"
#include "Compute/OpenCL/Event.h"
#include "Compute/OpenCL/BufferRegion.h"
#include "Compute/OpenCL/MappedRegion.h"

#include "Compute/Program/BuildOption.h"
#include "Compute/Program/SourceReader.h"
#include "Compute/Program/Program.h"
#include "Compute/Program/ProgramBuildError.h"
#include "Compute/Program/ProgramCompiler.h"
#include "Compute/Program/ProgramConfig.h"
#include "Compute/Program/ProgramBuilder.h"

namespace Ocelot
{
    /// <summary>
    /// Gets the current Ocelot API version.
    /// </summary>
    Version getAPIVersion();

    /// <summary>
    /// Installs the default console logger at the given level.
    /// </summary>
    void initializeLogger( Utils::LogLevel level = Utils::LogLevel::Info );

    /// <summary>
    /// Initializes the Ocelot library. Returns false if initialization failed.
    /// </summary>
    bool initialize( Utils::LogLevel level = Utils::LogLevel::Info );

    /// <summary>
    /// Removes the default logger installed by initialize().
    /// </summary>
    void shutdown();
}
#endif
