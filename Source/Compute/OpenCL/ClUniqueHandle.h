/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_UNIQUE_HANDLE_H_
#define OCELOT_COMPUTE_OPENCL_UNIQUE_HANDLE_H_

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../Utils/Logger.h"
#include "ClDriver.h"
#include "ClError.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief Move-only owner of one reference to a native OpenCL object.
     *
     * TResourceType supplies a static DestroyHandle( ClDriver&, handle_t ) returning
     * the native release status. The driver that produced the handle is kept alive
     * for as long as the handle is owned.
     */
    template <typename THandleType, typename TResourceType>
    class ClUniqueHandle
    {
    public:

        using handle_t = THandleType;

        ClUniqueHandle() : handle_( null_handle() )
        {
        }

        ClUniqueHandle( std::shared_ptr<ClDriver> driver, handle_t handle )
            : driver_( std::move( driver ) ), handle_( handle )
        {
        }

        ClUniqueHandle( const ClUniqueHandle& ) = delete;

        ClUniqueHandle& operator=( const ClUniqueHandle& ) = delete;

        ClUniqueHandle( ClUniqueHandle&& other ) noexcept
            : driver_( std::move( other.driver_ ) ), handle_( other.handle_ )
        {
            other.handle_ = null_handle();
        }

        ClUniqueHandle& operator=( ClUniqueHandle&& other ) noexcept
        {
            if ( this != &other )
            {
                reset();
                driver_ = std::move( other.driver_ );
                handle_ = other.handle_;
                other.handle_ = null_handle();
            }
            return *this;
        }

        operator handle_t() const noexcept
        {
            return handle_;
        }

        handle_t get() const noexcept
        {
            return handle_;
        }

        ClDriver& getDriver() const
        {
            if ( !driver_ )
            {
                throw std::logic_error( "Handle is not bound to an OpenCL driver." );
            }
            return *driver_;
        }

        const std::shared_ptr<ClDriver>& getSharedDriver() const noexcept
        {
            return driver_;
        }

        /**
         * @brief Releases the owned reference. Release failures are logged, never thrown.
         */
        void reset() noexcept
        {
            if ( !is_null_handle( handle_ ) && driver_ )
            {
                cl_int status = TResourceType::DestroyHandle( *driver_, handle_ );

                if ( status != CL_SUCCESS )
                {
                    Utils::Logger::warning( "Releasing OpenCL handle failed: " + statusToString( status ) );
                }
            }
            handle_ = null_handle();
        }

        void reset( handle_t handle ) noexcept
        {
            if ( handle != handle_ )
            {
                reset();
                handle_ = handle;
            }
        }

        handle_t release() noexcept
        {
            handle_t old = handle_;
            handle_ = null_handle();

            return old;
        }

        explicit operator bool() const noexcept
        {
            return !is_null_handle( handle_ );
        }

        static constexpr handle_t null_handle() noexcept
        {
            return {};
        }

        static constexpr bool is_null_handle( const handle_t& handle ) noexcept
        {
            return handle == null_handle();
        }

    protected:

        ~ClUniqueHandle()
        {
            reset();
        }

        std::shared_ptr<ClDriver> driver_;
        handle_t handle_;
    };
}
#endif
