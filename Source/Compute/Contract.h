/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_CONTRACT_H_
#define OCELOT_COMPUTE_CONTRACT_H_

#include <source_location>
#include <string_view>

namespace Ocelot::Compute
{
    /**
     * @brief Reports a fatal contract violation and terminates the process.
     *
     * The message is logged at Critical level (or written to std::cerr when no
     * default logger is installed) before std::abort() is called.
     */
    [[noreturn]] void contractViolation( std::string_view message,
        const std::source_location& location = std::source_location::current() );

    /**
     * @brief Terminates the process via contractViolation() when condition is false.
     */
    inline void contractCheck( bool condition, std::string_view message,
        const std::source_location& location = std::source_location::current() )
    {
        if ( !condition )
        {
            contractViolation( message, location );
        }
    }
}
#endif
