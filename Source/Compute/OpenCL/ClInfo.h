/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_INFO_H_
#define OCELOT_COMPUTE_OPENCL_INFO_H_

#include <cstddef>
#include <string>
#include <vector>

#include "ClError.h"

namespace Ocelot::Compute::OpenCL::Detail
{
    // TGetter is invoked as getter( value_size, value, value_size_ret ) and returns a cl_int.

    template <typename TGetter>
    std::string getInfoString( TGetter&& getter, const char* function )
    {
        size_t size = 0;
        clCheckStatus( getter( 0, nullptr, &size ), function );

        std::string value( size, '\0' );

        if ( size > 0 )
        {
            clCheckStatus( getter( size, value.data(), nullptr ), function );
        }

        while ( !value.empty() && value.back() == '\0' )
        {
            value.pop_back();
        }

        return value;
    }

    template <typename TValue, typename TGetter>
    TValue getInfoValue( TGetter&& getter, const char* function )
    {
        TValue value{};
        clCheckStatus( getter( sizeof( TValue ), &value, nullptr ), function );

        return value;
    }

    template <typename TValue, typename TGetter>
    std::vector<TValue> getInfoVector( TGetter&& getter, const char* function )
    {
        size_t size = 0;
        clCheckStatus( getter( 0, nullptr, &size ), function );

        std::vector<TValue> values( size / sizeof( TValue ) );

        if ( !values.empty() )
        {
            clCheckStatus( getter( values.size() * sizeof( TValue ), values.data(), nullptr ), function );
        }

        return values;
    }
}
#endif
