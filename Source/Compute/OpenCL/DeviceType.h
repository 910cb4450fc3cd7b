/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_DEVICE_TYPE_H_
#define OCELOT_COMPUTE_OPENCL_DEVICE_TYPE_H_

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include "ClHeaders.h"

namespace Ocelot::Compute::OpenCL
{
    enum class DeviceType {
        Default,
        Cpu,
        Gpu,
        Accelerator,
        Custom,
        All
    };

    namespace Detail
    {
        inline constexpr std::array<std::pair<DeviceType, cl_device_type>, 6> kDeviceTypeTable{ {
            { DeviceType::Default,     CL_DEVICE_TYPE_DEFAULT },
            { DeviceType::Cpu,         CL_DEVICE_TYPE_CPU },
            { DeviceType::Gpu,         CL_DEVICE_TYPE_GPU },
            { DeviceType::Accelerator, CL_DEVICE_TYPE_ACCELERATOR },
            { DeviceType::Custom,      CL_DEVICE_TYPE_CUSTOM },
            { DeviceType::All,         CL_DEVICE_TYPE_ALL },
        } };

        constexpr bool isDeviceTypeTableOrdered()
        {
            for ( size_t i = 0; i < kDeviceTypeTable.size(); ++i )
            {
                if ( static_cast<size_t>( kDeviceTypeTable[ i ].first ) != i )
                {
                    return false;
                }
            }
            return true;
        }

        static_assert( kDeviceTypeTable.size() == static_cast<size_t>( DeviceType::All ) + 1,
            "Every DeviceType needs a cl_device_type entry." );
        static_assert( isDeviceTypeTableOrdered(), "kDeviceTypeTable must follow DeviceType order." );
    }

    constexpr cl_device_type toClDeviceType( DeviceType type )
    {
        return Detail::kDeviceTypeTable[ static_cast<size_t>( type ) ].second;
    }

    inline std::string deviceTypeToString( DeviceType type )
    {
        switch ( type ) {
            case DeviceType::Default:     return "Default";
            case DeviceType::Cpu:         return "Cpu";
            case DeviceType::Gpu:         return "Gpu";
            case DeviceType::Accelerator: return "Accelerator";
            case DeviceType::Custom:      return "Custom";
            case DeviceType::All:         return "All";
            default:
                throw std::runtime_error( "Invalid DeviceType." );
        }
    }

    /**
     * @brief Parses a case-sensitive device type name as produced by deviceTypeToString().
     *
     * @throws std::invalid_argument if the name is unknown.
     */
    inline DeviceType toDeviceType( const std::string& name )
    {
        for ( const auto& entry : Detail::kDeviceTypeTable )
        {
            if ( deviceTypeToString( entry.first ) == name )
            {
                return entry.first;
            }
        }

        throw std::invalid_argument( "Unknown device type: " + name );
    }
}
#endif
