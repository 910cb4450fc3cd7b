/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <sstream>
#include <type_traits>

#include "DeviceSelector.h"
#include "../ComputeError.h"

namespace Ocelot::Compute::OpenCL
{
    namespace
    {
        void appendIndices( std::ostringstream& oss, const std::vector<size_t>& indices )
        {
            oss << "[";
            for ( size_t i = 0; i < indices.size(); ++i )
            {
                oss << (i > 0 ? ", " : "") << indices[ i ];
            }
            oss << "]";
        }
    }

    std::vector<cl_device_id> DeviceSelector::resolve( const Platform& platform ) const
    {
        return std::visit( [&platform]( const auto& selection ) -> std::vector<cl_device_id> {
            using TSelection = std::decay_t<decltype(selection)>;

            if constexpr ( std::is_same_v<TSelection, Single> )
            {
                return { selection.device };
            }
            else if constexpr ( std::is_same_v<TSelection, List> )
            {
                return selection.devices;
            }
            else if constexpr ( std::is_same_v<TSelection, Type> )
            {
                return platform.getDeviceIds( selection.type );
            }
            else
            {
                auto available = platform.getDeviceIds( DeviceType::All );

                if constexpr ( std::is_same_v<TSelection, First> )
                {
                    if ( available.empty() )
                    {
                        return {};
                    }
                    return { available.front() };
                }
                else if constexpr ( std::is_same_v<TSelection, All> )
                {
                    return available;
                }
                else if constexpr ( std::is_same_v<TSelection, Indices> )
                {
                    std::vector<cl_device_id> devices;
                    for ( size_t index : selection.indices )
                    {
                        if ( index >= available.size() )
                        {
                            throw ConfigurationError( "Device index " + std::to_string( index ) +
                                " is out of range. The platform has " + std::to_string( available.size() ) + " device(s)." );
                        }
                        devices.push_back( available[ index ] );
                    }
                    return devices;
                }
                else
                {
                    static_assert( std::is_same_v<TSelection, WrappingIndices> );

                    std::vector<cl_device_id> devices;
                    if ( available.empty() )
                    {
                        return devices;
                    }
                    for ( size_t index : selection.indices )
                    {
                        devices.push_back( available[ index % available.size() ] );
                    }
                    return devices;
                }
            }
            }, selection_ );
    }

    std::string DeviceSelector::toString() const
    {
        std::ostringstream oss;

        std::visit( [&oss]( const auto& selection ) {
            using TSelection = std::decay_t<decltype(selection)>;

            if constexpr ( std::is_same_v<TSelection, First> ) {
                oss << "First";
            }
            else if constexpr ( std::is_same_v<TSelection, All> ) {
                oss << "All";
            }
            else if constexpr ( std::is_same_v<TSelection, Single> ) {
                oss << "Single";
            }
            else if constexpr ( std::is_same_v<TSelection, List> ) {
                oss << "List(" << selection.devices.size() << ")";
            }
            else if constexpr ( std::is_same_v<TSelection, Indices> ) {
                oss << "Indices";
                appendIndices( oss, selection.indices );
            }
            else if constexpr ( std::is_same_v<TSelection, WrappingIndices> ) {
                oss << "WrappingIndices";
                appendIndices( oss, selection.indices );
            }
            else {
                oss << "Type(" << deviceTypeToString( selection.type ) << ")";
            }
            }, selection_ );

        return oss.str();
    }
}
