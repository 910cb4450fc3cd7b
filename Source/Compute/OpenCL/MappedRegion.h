/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_MAPPED_REGION_H_
#define OCELOT_COMPUTE_OPENCL_MAPPED_REGION_H_

#include <cstddef>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>

#include "../../Utils/Logger.h"
#include "../ComputeError.h"
#include "../Contract.h"
#include "ClError.h"
#include "ClHeaders.h"
#include "CommandQueue.h"
#include "Event.h"
#include "MemObject.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief What a MappedRegion does about completion notification and end of life.
     */
    enum class UnmapStrategy {
        /// No completion trigger is registered. Destroying a region that is still mapped terminates the process.
        Strict,
        /// A completion trigger is registered on unmap. Destroying a mapped region attempts an unmap.
        Deferred
    };

    namespace Detail
    {
        /**
         * @brief Sets completion to CL_COMPLETE once unmap_event completes.
         *
         * Takes over the reference held by unmap_event and retains completion;
         * both are released by the driver callback. Nothing is signaled if the
         * driver never invokes the callback.
         *
         * @throws ClError if the callback cannot be registered.
         */
        void registerUnmapTrigger( Event&& unmap_event, const UserEvent& completion );
    }

    /**
     * @brief Host-visible view of count elements of type T in a mapped OpenCL buffer.
     *
     * A region is Mapped until unmap() has been enqueued successfully, after
     * which the host pointer must not be used again. Element access on an
     * unmapped region terminates the process.
     */
    template <typename T>
    class MappedRegion
    {
    public:

        /**
         * @brief Wraps a pointer returned by clEnqueueMapBuffer.
         *
         * @param ptr Mapped host pointer. Must not be null.
         * @param count Number of elements of type T at ptr.
         * @param buffer The mapped memory object.
         * @param queue The queue the map was enqueued on. Used by unmap() by default.
         * @param completion_event Optional event to signal once the unmap has completed.
         * @param strategy See UnmapStrategy.
         */
        MappedRegion( T* ptr, size_t count, ManagedMemObject buffer, ManagedCommandQueue queue,
            std::optional<UserEvent> completion_event = std::nullopt,
            UnmapStrategy strategy = UnmapStrategy::Strict )
            : state_( Mapped{ ptr } ), count_( count ),
            buffer_( std::move( buffer ) ), queue_( std::move( queue ) ),
            completion_event_( std::move( completion_event ) ), strategy_( strategy )
        {
            contractCheck( ptr != nullptr, "MappedRegion: null pointer passed." );
            contractCheck( buffer_ != nullptr && queue_ != nullptr, "MappedRegion: buffer and queue are required." );
        }

        MappedRegion( const MappedRegion& ) = delete;
        MappedRegion& operator=( const MappedRegion& ) = delete;

        MappedRegion( MappedRegion&& other ) noexcept
            : state_( std::exchange( other.state_, State( Unmapped{} ) ) ), count_( other.count_ ),
            buffer_( std::move( other.buffer_ ) ), queue_( std::move( other.queue_ ) ),
            completion_event_( std::move( other.completion_event_ ) ), strategy_( other.strategy_ ),
            callback_is_set_( other.callback_is_set_ )
        {
            other.completion_event_.reset();
        }

        MappedRegion& operator=( MappedRegion&& ) = delete;

        ~MappedRegion()
        {
            if ( isUnmapped() )
            {
                return;
            }

            if ( strategy_ == UnmapStrategy::Deferred )
            {
                try
                {
                    unmap();
                }
                catch ( const std::exception& e )
                {
                    Utils::Logger::warning( std::string( "MappedRegion: unmap on destruction failed: " ) + e.what() );
                }
            }
            else
            {
                contractViolation( "MappedRegion destroyed while still mapped. "
                    "Call unmap() before the region goes out of scope." );
            }
        }

        /**
         * @brief Enqueues the unmap of the region.
         *
         * The region is Unmapped as soon as the enqueue succeeds; the device may
         * still be executing the unmap. If the enqueue fails the region stays Mapped.
         *
         * @param queue Queue to enqueue on. Defaults to the queue the region was mapped on.
         * @param wait_list Events the unmap waits for.
         * @param out_event Receives an independent reference to the unmap event.
         *
         * @throws ContractViolation if the region has already been unmapped.
         * @throws ClError if the enqueue fails or yields no event.
         */
        void unmap( const CommandQueue* queue = nullptr, std::span<const cl_event> wait_list = {},
            Event* out_event = nullptr )
        {
            auto* mapped = std::get_if<Mapped>( &state_ );

            if ( mapped == nullptr )
            {
                throw ContractViolation( "MappedRegion::unmap: the region has already been unmapped." );
            }

            const CommandQueue& target = queue != nullptr ? *queue : *queue_;
            bool needs_event = out_event != nullptr || completion_event_.has_value();

            cl_event unmap_event = nullptr;
            clCheckStatus( target.getDriver().enqueueUnmapMemObject( target, *buffer_, mapped->ptr, wait_list,
                needs_event ? &unmap_event : nullptr ), "clEnqueueUnmapMemObject" );

            state_ = Unmapped{};

            Utils::Logger::debug( "MappedRegion: unmap of " + std::to_string( count_ * sizeof( T ) ) + " bytes enqueued." );

            if ( !needs_event )
            {
                return;
            }

            if ( unmap_event == nullptr )
            {
                throw ClError( CL_INVALID_EVENT, "clEnqueueUnmapMemObject", "no event was returned for the unmap" );
            }

            Event event( target.getSharedDriver(), unmap_event );

            if ( out_event != nullptr )
            {
                *out_event = event.clone();
            }

            if ( completion_event_ && strategy_ == UnmapStrategy::Deferred )
            {
                registerUnmapTrigger( std::move( event ) );
            }
        }

        /**
         * @brief Arranges for the completion event to be set once unmap_event completes.
         *
         * Called by unmap() under UnmapStrategy::Deferred. Under UnmapStrategy::Strict
         * callers may register the trigger themselves with a clone of the unmap event.
         *
         * @throws ContractViolation if a trigger is already registered, the region is
         *         still mapped or no completion event was supplied.
         */
        void registerUnmapTrigger( Event&& unmap_event )
        {
            if ( callback_is_set_ )
            {
                throw ContractViolation( "MappedRegion: an unmap trigger has already been registered." );
            }

            if ( !isUnmapped() || !completion_event_ )
            {
                throw ContractViolation( "MappedRegion: an unmap trigger requires an unmapped region with a completion event." );
            }

            Detail::registerUnmapTrigger( std::move( unmap_event ), *completion_event_ );
            callback_is_set_ = true;
        }

        std::span<T> slice()
        {
            return std::span<T>( mappedPointer(), count_ );
        }

        std::span<const T> slice() const
        {
            return std::span<const T>( mappedPointer(), count_ );
        }

        T& operator[]( size_t index )
        {
            return slice()[ index ];
        }

        const T& operator[]( size_t index ) const
        {
            return slice()[ index ];
        }

        T* data()
        {
            return mappedPointer();
        }

        const T* data() const
        {
            return mappedPointer();
        }

        size_t size() const noexcept
        {
            return count_;
        }

        bool isUnmapped() const noexcept
        {
            return std::holds_alternative<Unmapped>( state_ );
        }

        /// @brief The event signaled when the unmap completes, or nullptr.
        const UserEvent* getCompletionEvent() const noexcept
        {
            return completion_event_ ? &*completion_event_ : nullptr;
        }

        UnmapStrategy getStrategy() const noexcept
        {
            return strategy_;
        }

        const ManagedMemObject& getBuffer() const noexcept
        {
            return buffer_;
        }

        const ManagedCommandQueue& getQueue() const noexcept
        {
            return queue_;
        }

    private:

        struct Mapped { T* ptr; };
        struct Unmapped {};

        using State = std::variant<Mapped, Unmapped>;

        T* mappedPointer() const
        {
            const auto* mapped = std::get_if<Mapped>( &state_ );
            contractCheck( mapped != nullptr, "MappedRegion: mapped memory accessed after unmap()." );

            return mapped->ptr;
        }

        State state_;
        size_t count_;
        ManagedMemObject buffer_;
        ManagedCommandQueue queue_;
        std::optional<UserEvent> completion_event_;
        UnmapStrategy strategy_;
        bool callback_is_set_ = false;
    };

    /**
     * @brief Maps count elements of buffer starting at element offset, blocking until the map completes.
     *
     * @throws ClError if clEnqueueMapBuffer fails.
     */
    template <typename T>
    MappedRegion<T> mapBuffer( ManagedCommandQueue queue, ManagedMemObject buffer, cl_map_flags flags,
        size_t offset, size_t count,
        std::optional<UserEvent> completion_event = std::nullopt,
        UnmapStrategy strategy = UnmapStrategy::Strict,
        std::span<const cl_event> wait_list = {},
        Event* out_event = nullptr )
    {
        cl_int status = CL_SUCCESS;
        cl_event map_event = nullptr;

        void* ptr = queue->getDriver().enqueueMapBuffer( *queue, *buffer, CL_TRUE, flags,
            offset * sizeof( T ), count * sizeof( T ), wait_list,
            out_event != nullptr ? &map_event : nullptr, &status );
        clCheckStatus( status, "clEnqueueMapBuffer" );

        if ( out_event != nullptr )
        {
            *out_event = Event( queue->getSharedDriver(), map_event );
        }

        return MappedRegion<T>( static_cast<T*>( ptr ), count, std::move( buffer ), std::move( queue ),
            std::move( completion_event ), strategy );
    }
}
#endif
