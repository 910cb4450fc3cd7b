/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <cstdlib>
#include <iostream>

#include "../Utils/Logger.h"
#include "Contract.h"

namespace Ocelot::Compute
{
    void contractViolation( std::string_view message, const std::source_location& location )
    {
        if ( Utils::Logger::hasDefaultLogger() )
        {
            Utils::Logger::critical( message, location );
        }
        else
        {
            std::cerr << "Ocelot contract violation at " << location.file_name() << ":" << location.line()
                << " in " << location.function_name() << ": " << message << std::endl;
        }

        std::abort();
    }
}
