/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_VERSION_H_
#define OCELOT_COMPUTE_OPENCL_VERSION_H_

#include <cstdint>
#include <string>
#include <string_view>

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief OpenCL version as reported by platform and device info strings.
     *
     * "OpenCL 1.2 CUDA 12.4" parses to { 1, 2 }.
     */
    struct OpenclVersion
    {
        uint16_t major = 0;
        uint16_t minor = 0;

        /**
         * @brief Parses the "<major>.<minor>" word following the word "OpenCL" (any case).
         *
         * @throws ConfigurationError if no version can be found.
         */
        static OpenclVersion parse( std::string_view info );

        std::string toString() const
        {
            return std::to_string( major ) + "." + std::to_string( minor );
        }

        friend constexpr bool operator==( const OpenclVersion&, const OpenclVersion& ) = default;
        friend constexpr auto operator<=>( const OpenclVersion&, const OpenclVersion& ) = default;
    };
}
#endif
