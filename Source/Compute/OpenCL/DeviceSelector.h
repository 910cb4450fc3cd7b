/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_DEVICE_SELECTOR_H_
#define OCELOT_COMPUTE_OPENCL_DEVICE_SELECTOR_H_

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ClHeaders.h"
#include "DeviceType.h"
#include "Platform.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief Describes which devices of a platform a program or context should use.
     *
     * Resolution is deferred until a platform is known, see resolve().
     */
    class DeviceSelector
    {
    public:

        struct First {};
        struct All {};
        struct Single { cl_device_id device; };
        struct List { std::vector<cl_device_id> devices; };
        struct Indices { std::vector<size_t> indices; };
        struct WrappingIndices { std::vector<size_t> indices; };
        struct Type { DeviceType type; };

        using Selection = std::variant<First, All, Single, List, Indices, WrappingIndices, Type>;

        /// @brief Selects the first device of the platform.
        static DeviceSelector first()
        {
            return DeviceSelector( First{} );
        }

        static DeviceSelector all()
        {
            return DeviceSelector( All{} );
        }

        static DeviceSelector single( cl_device_id device )
        {
            return DeviceSelector( Single{ device } );
        }

        static DeviceSelector list( std::vector<cl_device_id> devices )
        {
            return DeviceSelector( List{ std::move( devices ) } );
        }

        /// @brief Selects devices by position; an index past the device count is a ConfigurationError.
        static DeviceSelector indices( std::vector<size_t> indices )
        {
            return DeviceSelector( Indices{ std::move( indices ) } );
        }

        /// @brief Selects devices by position modulo the device count.
        static DeviceSelector wrappingIndices( std::vector<size_t> indices )
        {
            return DeviceSelector( WrappingIndices{ std::move( indices ) } );
        }

        static DeviceSelector type( DeviceType type )
        {
            return DeviceSelector( Type{ type } );
        }

        /**
         * @brief Resolves the selection against the devices of platform.
         *
         * A platform without devices resolves every selection except Single and
         * List to an empty list.
         *
         * @throws ConfigurationError for an out of range strict index.
         * @throws ClError if the device query fails.
         */
        std::vector<cl_device_id> resolve( const Platform& platform ) const;

        const Selection& getSelection() const noexcept
        {
            return selection_;
        }

        std::string toString() const;

    private:

        explicit DeviceSelector( Selection selection )
            : selection_( std::move( selection ) )
        {
        }

        Selection selection_;
    };
}
#endif
