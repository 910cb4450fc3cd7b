/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_TESTS_COMPUTE_FAKE_CL_DRIVER_H_
#define OCELOT_TESTS_COMPUTE_FAKE_CL_DRIVER_H_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Compute/OpenCL/ClDriver.h"

namespace Ocelot::Compute::Tests
{
    using namespace Ocelot::Compute::OpenCL;

    /**
     * @brief Recording ClDriver double.
     *
     * Hands out synthetic handles, counts calls by OpenCL entry point name,
     * tracks reference counts and stores event callbacks until fireCallbacks().
     * Any entry point can be made to fail with fail( "clXxx", status ).
     */
    class FakeClDriver : public ClDriver
    {
    public:

        struct FakeDevice
        {
            cl_device_id id;
            cl_device_type type;
            std::string name;
        };

        struct UnmapCall
        {
            cl_command_queue queue;
            cl_mem memobj;
            void* mapped_ptr;
            size_t wait_count;
            bool event_requested;
        };

        struct PendingCallback
        {
            cl_event event;
            cl_int type;
            EventCallback callback;
            void* user_data;
        };

        FakeClDriver()
            : platform_( makeHandle<cl_platform_id>() )
        {
        }

        static std::shared_ptr<FakeClDriver> create( size_t gpu_count = 1, size_t cpu_count = 0 )
        {
            auto driver = std::make_shared<FakeClDriver>();
            for ( size_t i = 0; i < gpu_count; ++i )
            {
                driver->addDevice( CL_DEVICE_TYPE_GPU, "Fake GPU " + std::to_string( i ) );
            }
            for ( size_t i = 0; i < cpu_count; ++i )
            {
                driver->addDevice( CL_DEVICE_TYPE_CPU, "Fake CPU " + std::to_string( i ) );
            }
            return driver;
        }

        // Configuration

        cl_device_id addDevice( cl_device_type type, const std::string& name )
        {
            auto id = makeHandle<cl_device_id>();
            devices_.push_back( FakeDevice{ id, type, name } );
            return id;
        }

        void fail( const std::string& function, cl_int status )
        {
            failures_[ function ] = status;
        }

        void clearFailures()
        {
            failures_.clear();
        }

        void setPlatformAvailable( bool available )
        {
            platform_available_ = available;
        }

        void setPlatformVersion( const std::string& version )
        {
            platform_version_ = version;
        }

        void setBuildLog( const std::string& log )
        {
            build_log_ = log;
        }

        void setKernelNames( const std::string& names )
        {
            kernel_names_ = names;
        }

        /// @brief Makes the next unmap succeed without producing an event.
        void omitUnmapEvent( bool omit )
        {
            omit_unmap_event_ = omit;
        }

        // Inspection

        int callCount( const std::string& function ) const
        {
            auto it = calls_.find( function );
            return it == calls_.end() ? 0 : it->second;
        }

        int refCount( const void* handle ) const
        {
            auto it = refs_.find( handle );
            return it == refs_.end() ? 0 : it->second;
        }

        /// @brief True when every handle created through this driver has been released.
        bool allReleased() const
        {
            for ( const auto& [handle, count] : refs_ )
            {
                if ( count != 0 )
                {
                    return false;
                }
            }
            return true;
        }

        std::optional<cl_int> userEventStatus( cl_event event ) const
        {
            auto it = user_event_status_.find( event );
            if ( it == user_event_status_.end() )
            {
                return std::nullopt;
            }
            return it->second;
        }

        size_t pendingCallbackCount() const
        {
            return callbacks_.size();
        }

        /// @brief Invokes and discards every stored event callback.
        void fireCallbacks( cl_int status = CL_COMPLETE )
        {
            auto pending = std::move( callbacks_ );
            callbacks_.clear();

            for ( const auto& cb : pending )
            {
                cb.callback( cb.event, status, cb.user_data );
            }
        }

        cl_platform_id getPlatform() const
        {
            return platform_;
        }

        const std::vector<FakeDevice>& getFakeDevices() const
        {
            return devices_;
        }

        const std::vector<cl_context_properties>& lastContextProperties() const
        {
            return last_context_properties_;
        }

        const std::vector<cl_device_id>& lastContextDevices() const
        {
            return last_context_devices_;
        }

        const std::vector<std::string>& lastSources() const
        {
            return last_sources_;
        }

        const std::string& lastBuildOptions() const
        {
            return last_build_options_;
        }

        const std::vector<cl_device_id>& lastBuildDevices() const
        {
            return last_build_devices_;
        }

        const std::vector<UnmapCall>& unmapCalls() const
        {
            return unmap_calls_;
        }

        cl_event lastUnmapEvent() const
        {
            return last_unmap_event_;
        }

        std::vector<unsigned char>& storage( cl_mem buffer )
        {
            return storage_.at( buffer );
        }

        // ClDriver

        cl_int getPlatformIds( std::vector<cl_platform_id>& platforms ) override
        {
            platforms.clear();
            if ( auto status = enter( "clGetPlatformIDs" ) ) return *status;

            if ( platform_available_ )
            {
                platforms.push_back( platform_ );
            }
            return CL_SUCCESS;
        }

        cl_int getPlatformInfo( cl_platform_id platform, cl_platform_info param,
            size_t value_size, void* value, size_t* value_size_ret ) override
        {
            if ( auto status = enter( "clGetPlatformInfo" ) ) return *status;
            if ( platform != platform_ ) return CL_INVALID_PLATFORM;

            switch ( param ) {
                case CL_PLATFORM_NAME:    return writeString( "Fake Platform", value_size, value, value_size_ret );
                case CL_PLATFORM_VENDOR:  return writeString( "Ocelot", value_size, value, value_size_ret );
                case CL_PLATFORM_PROFILE: return writeString( "FULL_PROFILE", value_size, value, value_size_ret );
                case CL_PLATFORM_VERSION: return writeString( platform_version_, value_size, value, value_size_ret );
                default:                  return CL_INVALID_VALUE;
            }
        }

        cl_int getDeviceIds( cl_platform_id platform, cl_device_type type,
            std::vector<cl_device_id>& devices ) override
        {
            devices.clear();
            if ( auto status = enter( "clGetDeviceIDs" ) ) return *status;
            if ( platform != platform_ ) return CL_INVALID_PLATFORM;

            for ( const auto& device : devices_ )
            {
                bool is_default = type == CL_DEVICE_TYPE_DEFAULT && devices.empty();
                if ( type == CL_DEVICE_TYPE_ALL || (device.type & type) != 0 || is_default )
                {
                    devices.push_back( device.id );
                }
            }

            return devices.empty() ? CL_DEVICE_NOT_FOUND : CL_SUCCESS;
        }

        cl_int getDeviceInfo( cl_device_id device, cl_device_info param,
            size_t value_size, void* value, size_t* value_size_ret ) override
        {
            if ( auto status = enter( "clGetDeviceInfo" ) ) return *status;

            const FakeDevice* found = nullptr;
            for ( const auto& candidate : devices_ )
            {
                if ( candidate.id == device ) found = &candidate;
            }
            if ( found == nullptr ) return CL_INVALID_DEVICE;

            switch ( param ) {
                case CL_DEVICE_NAME:    return writeString( found->name, value_size, value, value_size_ret );
                case CL_DEVICE_VENDOR:  return writeString( "Ocelot", value_size, value, value_size_ret );
                case CL_DEVICE_VERSION: return writeString( "OpenCL 1.2 Fake", value_size, value, value_size_ret );
                case CL_DEVICE_TYPE:    return writeInfo( &found->type, sizeof( found->type ), value_size, value, value_size_ret );
                default:                return CL_INVALID_VALUE;
            }
        }

        cl_context createContext( const cl_context_properties* properties,
            const std::vector<cl_device_id>& devices, cl_int* status ) override
        {
            if ( auto failure = enter( "clCreateContext" ) ) return failWith( status, *failure );

            last_context_properties_.clear();
            for ( const cl_context_properties* p = properties; p != nullptr; ++p )
            {
                last_context_properties_.push_back( *p );
                if ( *p == 0 ) break;
            }
            last_context_devices_ = devices;

            setStatus( status, CL_SUCCESS );
            return track( makeHandle<cl_context>() );
        }

        cl_int releaseContext( cl_context context ) override
        {
            return release( "clReleaseContext", context, CL_INVALID_CONTEXT );
        }

        cl_command_queue createCommandQueue( cl_context, cl_device_id,
            cl_command_queue_properties, cl_int* status ) override
        {
            if ( auto failure = enter( "clCreateCommandQueue" ) ) return failWith( status, *failure );

            setStatus( status, CL_SUCCESS );
            return track( makeHandle<cl_command_queue>() );
        }

        cl_int finish( cl_command_queue ) override
        {
            if ( auto status = enter( "clFinish" ) ) return *status;
            return CL_SUCCESS;
        }

        cl_int releaseCommandQueue( cl_command_queue queue ) override
        {
            return release( "clReleaseCommandQueue", queue, CL_INVALID_COMMAND_QUEUE );
        }

        cl_mem createBuffer( cl_context, cl_mem_flags, size_t size, void*, cl_int* status ) override
        {
            if ( auto failure = enter( "clCreateBuffer" ) ) return failWith( status, *failure );
            if ( size == 0 ) return failWith( status, CL_INVALID_BUFFER_SIZE );

            auto buffer = track( makeHandle<cl_mem>() );
            storage_[ buffer ].assign( size, 0 );

            setStatus( status, CL_SUCCESS );
            return buffer;
        }

        void* enqueueMapBuffer( cl_command_queue, cl_mem buffer, cl_bool, cl_map_flags, size_t offset, size_t size,
            std::span<const cl_event>, cl_event* event, cl_int* status ) override
        {
            if ( auto failure = enter( "clEnqueueMapBuffer" ) ) return failWith( status, *failure );

            auto it = storage_.find( buffer );
            if ( it == storage_.end() ) return failWith( status, CL_INVALID_MEM_OBJECT );
            if ( offset + size > it->second.size() ) return failWith( status, CL_INVALID_VALUE );

            if ( event != nullptr )
            {
                *event = track( makeHandle<cl_event>() );
            }

            setStatus( status, CL_SUCCESS );
            return it->second.data() + offset;
        }

        cl_int enqueueUnmapMemObject( cl_command_queue queue, cl_mem memobj, void* mapped_ptr,
            std::span<const cl_event> wait_list, cl_event* event ) override
        {
            if ( auto status = enter( "clEnqueueUnmapMemObject" ) ) return *status;

            unmap_calls_.push_back( UnmapCall{ queue, memobj, mapped_ptr, wait_list.size(), event != nullptr } );

            if ( event != nullptr )
            {
                *event = omit_unmap_event_ ? nullptr : track( makeHandle<cl_event>() );
                last_unmap_event_ = *event;
            }

            return CL_SUCCESS;
        }

        cl_int releaseMemObject( cl_mem memobj ) override
        {
            return release( "clReleaseMemObject", memobj, CL_INVALID_MEM_OBJECT );
        }

        cl_event createUserEvent( cl_context, cl_int* status ) override
        {
            if ( auto failure = enter( "clCreateUserEvent" ) ) return failWith( status, *failure );

            auto event = track( makeHandle<cl_event>() );
            user_event_status_[ event ] = CL_SUBMITTED;

            setStatus( status, CL_SUCCESS );
            return event;
        }

        cl_int setUserEventStatus( cl_event event, cl_int execution_status ) override
        {
            if ( auto status = enter( "clSetUserEventStatus" ) ) return *status;

            auto it = user_event_status_.find( event );
            if ( it == user_event_status_.end() || refCount( event ) == 0 ) return CL_INVALID_EVENT;
            if ( it->second != CL_SUBMITTED ) return CL_INVALID_OPERATION;

            it->second = execution_status;
            return CL_SUCCESS;
        }

        cl_int setEventCallback( cl_event event, cl_int callback_type,
            EventCallback callback, void* user_data ) override
        {
            if ( auto status = enter( "clSetEventCallback" ) ) return *status;
            if ( refCount( event ) == 0 ) return CL_INVALID_EVENT;

            callbacks_.push_back( PendingCallback{ event, callback_type, callback, user_data } );
            return CL_SUCCESS;
        }

        cl_int waitForEvents( std::span<const cl_event> events ) override
        {
            if ( auto status = enter( "clWaitForEvents" ) ) return *status;
            if ( events.empty() ) return CL_INVALID_VALUE;
            return CL_SUCCESS;
        }

        cl_int retainEvent( cl_event event ) override
        {
            if ( auto status = enter( "clRetainEvent" ) ) return *status;
            if ( refCount( event ) == 0 ) return CL_INVALID_EVENT;

            ++refs_[ event ];
            return CL_SUCCESS;
        }

        cl_int releaseEvent( cl_event event ) override
        {
            return release( "clReleaseEvent", event, CL_INVALID_EVENT );
        }

        cl_program createProgramWithSource( cl_context, const std::vector<std::string>& sources, cl_int* status ) override
        {
            if ( auto failure = enter( "clCreateProgramWithSource" ) ) return failWith( status, *failure );

            last_sources_ = sources;
            build_failed_ = false;

            setStatus( status, CL_SUCCESS );
            return track( makeHandle<cl_program>() );
        }

        cl_int buildProgram( cl_program, const std::vector<cl_device_id>& devices, const std::string& options ) override
        {
            last_build_options_ = options;
            last_build_devices_ = devices;

            if ( auto status = enter( "clBuildProgram" ) )
            {
                build_failed_ = true;
                return *status;
            }

            return CL_SUCCESS;
        }

        cl_int getProgramInfo( cl_program program, cl_program_info param,
            size_t value_size, void* value, size_t* value_size_ret ) override
        {
            if ( auto status = enter( "clGetProgramInfo" ) ) return *status;
            if ( refCount( program ) == 0 ) return CL_INVALID_PROGRAM;

            switch ( param ) {
                case CL_PROGRAM_REFERENCE_COUNT: {
                    cl_uint count = static_cast<cl_uint>( refCount( program ) );
                    return writeInfo( &count, sizeof( count ), value_size, value, value_size_ret );
                }
                case CL_PROGRAM_NUM_KERNELS: {
                    size_t count = kernel_names_.empty() ? 0 : 1;
                    for ( char c : kernel_names_ ) count += c == ';' ? 1 : 0;
                    return writeInfo( &count, sizeof( count ), value_size, value, value_size_ret );
                }
                case CL_PROGRAM_KERNEL_NAMES:
                    return writeString( kernel_names_, value_size, value, value_size_ret );
                case CL_PROGRAM_SOURCE: {
                    std::string source;
                    for ( const auto& block : last_sources_ ) source += block;
                    return writeString( source, value_size, value, value_size_ret );
                }
                default:
                    return CL_INVALID_VALUE;
            }
        }

        cl_int getProgramBuildInfo( cl_program program, cl_device_id, cl_program_build_info param,
            size_t value_size, void* value, size_t* value_size_ret ) override
        {
            if ( auto status = enter( "clGetProgramBuildInfo" ) ) return *status;
            if ( refCount( program ) == 0 ) return CL_INVALID_PROGRAM;

            switch ( param ) {
                case CL_PROGRAM_BUILD_STATUS: {
                    cl_build_status status = build_failed_ ? CL_BUILD_ERROR : CL_BUILD_SUCCESS;
                    return writeInfo( &status, sizeof( status ), value_size, value, value_size_ret );
                }
                case CL_PROGRAM_BUILD_LOG:
                    return writeString( build_failed_ ? build_log_ : std::string(), value_size, value, value_size_ret );
                case CL_PROGRAM_BUILD_OPTIONS:
                    return writeString( last_build_options_, value_size, value, value_size_ret );
                default:
                    return CL_INVALID_VALUE;
            }
        }

        cl_int releaseProgram( cl_program program ) override
        {
            return release( "clReleaseProgram", program, CL_INVALID_PROGRAM );
        }

    private:

        template <typename THandle>
        THandle makeHandle()
        {
            next_handle_ += 0x10;
            return reinterpret_cast<THandle>( next_handle_ );
        }

        template <typename THandle>
        THandle track( THandle handle )
        {
            refs_[ handle ] = 1;
            return handle;
        }

        std::optional<cl_int> enter( const std::string& function )
        {
            ++calls_[ function ];

            auto it = failures_.find( function );
            if ( it != failures_.end() )
            {
                return it->second;
            }
            return std::nullopt;
        }

        cl_int release( const std::string& function, const void* handle, cl_int invalid )
        {
            if ( auto status = enter( function ) ) return *status;

            auto it = refs_.find( handle );
            if ( it == refs_.end() || it->second == 0 ) return invalid;

            --it->second;
            return CL_SUCCESS;
        }

        static void setStatus( cl_int* status, cl_int value )
        {
            if ( status != nullptr ) *status = value;
        }

        static std::nullptr_t failWith( cl_int* status, cl_int value )
        {
            setStatus( status, value );
            return nullptr;
        }

        static cl_int writeInfo( const void* data, size_t size, size_t value_size, void* value, size_t* value_size_ret )
        {
            if ( value_size_ret != nullptr ) *value_size_ret = size;

            if ( value != nullptr )
            {
                if ( value_size < size ) return CL_INVALID_VALUE;
                std::memcpy( value, data, size );
            }
            return CL_SUCCESS;
        }

        static cl_int writeString( const std::string& text, size_t value_size, void* value, size_t* value_size_ret )
        {
            return writeInfo( text.c_str(), text.size() + 1, value_size, value, value_size_ret );
        }

        uintptr_t next_handle_ = 0x1000;
        cl_platform_id platform_;
        bool platform_available_ = true;
        std::string platform_version_ = "OpenCL 1.2 Fake Platform";
        std::vector<FakeDevice> devices_;

        std::map<std::string, int> calls_;
        std::map<std::string, cl_int> failures_;
        std::map<const void*, int> refs_;
        std::map<cl_event, cl_int> user_event_status_;
        std::map<cl_mem, std::vector<unsigned char>> storage_;
        std::vector<PendingCallback> callbacks_;

        std::vector<cl_context_properties> last_context_properties_;
        std::vector<cl_device_id> last_context_devices_;
        std::vector<std::string> last_sources_;
        std::string last_build_options_;
        std::vector<cl_device_id> last_build_devices_;
        std::vector<UnmapCall> unmap_calls_;
        cl_event last_unmap_event_ = nullptr;
        std::string build_log_ = "error: fake build failure";
        std::string kernel_names_;
        bool build_failed_ = false;
        bool omit_unmap_event_ = false;
    };
}
#endif
