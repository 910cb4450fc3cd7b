/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_CONTEXT_PROPERTIES_H_
#define OCELOT_COMPUTE_OPENCL_CONTEXT_PROPERTIES_H_

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "ClHeaders.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief Context property kinds accepted by clCreateContext.
     */
    enum class ContextProperty {
        Platform,
        InteropUserSync,
        D3d10Device,
        GlContext,
        EglDisplay,
        GlxDisplay,
        CglSharegroup,
        WglHdc,
        AdapterD3d9,
        AdapterD3d9Ex,
        AdapterDxva,
        D3d11Device
    };

    namespace Detail
    {
        // The Direct3D ids live in cl_d3d10.h, cl_dx9_media_sharing.h and cl_d3d11.h,
        // which are only shipped with Windows SDKs.
        inline constexpr std::array<std::pair<ContextProperty, cl_context_properties>, 12> kContextPropertyTable{ {
            { ContextProperty::Platform,        CL_CONTEXT_PLATFORM },
            { ContextProperty::InteropUserSync, CL_CONTEXT_INTEROP_USER_SYNC },
            { ContextProperty::D3d10Device,     0x4014 },
            { ContextProperty::GlContext,       CL_GL_CONTEXT_KHR },
            { ContextProperty::EglDisplay,      CL_EGL_DISPLAY_KHR },
            { ContextProperty::GlxDisplay,      CL_GLX_DISPLAY_KHR },
            { ContextProperty::CglSharegroup,   CL_CGL_SHAREGROUP_KHR },
            { ContextProperty::WglHdc,          CL_WGL_HDC_KHR },
            { ContextProperty::AdapterD3d9,     0x2025 },
            { ContextProperty::AdapterD3d9Ex,   0x2026 },
            { ContextProperty::AdapterDxva,     0x2027 },
            { ContextProperty::D3d11Device,     0x401D },
        } };

        constexpr bool isContextPropertyTableOrdered()
        {
            for ( size_t i = 0; i < kContextPropertyTable.size(); ++i )
            {
                if ( static_cast<size_t>( kContextPropertyTable[ i ].first ) != i )
                {
                    return false;
                }
            }
            return true;
        }

        static_assert( kContextPropertyTable.size() == static_cast<size_t>( ContextProperty::D3d11Device ) + 1,
            "Every ContextProperty needs a wire id." );
        static_assert( isContextPropertyTableOrdered(), "kContextPropertyTable must follow ContextProperty order." );
    }

    /// @brief The cl_context_properties key written for kind.
    constexpr cl_context_properties toClContextProperty( ContextProperty kind )
    {
        return Detail::kContextPropertyTable[ static_cast<size_t>( kind ) ].second;
    }

    std::string contextPropertyToString( ContextProperty kind );

    /**
     * @brief Property values, one alternative per ContextProperty in the same order.
     *
     * Only Platform, InteropUserSync, GlContext and CglSharegroup can be stored
     * in a ContextPropertyList.
     */
    namespace ContextPropertyValues
    {
        struct Platform { cl_platform_id id; };
        struct InteropUserSync { bool enabled; };
        struct D3d10Device { void* device; };
        struct GlContext { cl_context_properties handle; };
        struct EglDisplay { void* display; };
        struct GlxDisplay { void* display; };
        struct CglSharegroup { void* sharegroup; };
        struct WglHdc { void* hdc; };
        struct AdapterD3d9 { void* adapter; };
        struct AdapterD3d9Ex { void* adapter; };
        struct AdapterDxva { void* adapter; };
        struct D3d11Device { void* device; };
    }

    using ContextPropertyValue = std::variant<
        ContextPropertyValues::Platform,
        ContextPropertyValues::InteropUserSync,
        ContextPropertyValues::D3d10Device,
        ContextPropertyValues::GlContext,
        ContextPropertyValues::EglDisplay,
        ContextPropertyValues::GlxDisplay,
        ContextPropertyValues::CglSharegroup,
        ContextPropertyValues::WglHdc,
        ContextPropertyValues::AdapterD3d9,
        ContextPropertyValues::AdapterD3d9Ex,
        ContextPropertyValues::AdapterDxva,
        ContextPropertyValues::D3d11Device>;

    static_assert( std::variant_size_v<ContextPropertyValue> == Detail::kContextPropertyTable.size(),
        "Every ContextProperty needs a value alternative." );

    /// @brief The property kind a value is stored under.
    constexpr ContextProperty kindOf( const ContextPropertyValue& value )
    {
        return static_cast<ContextProperty>( value.index() );
    }

    /**
     * @brief Keyed set of context creation properties.
     *
     * Setting a kind twice keeps the last value. toRaw() produces the
     * zero-terminated (key, value) array passed to clCreateContext; the order of
     * the pairs is unspecified.
     */
    class ContextPropertyList
    {
    public:

        ContextPropertyList() = default;

        void setPlatform( cl_platform_id platform );
        void setInteropUserSync( bool enabled );
        void setGlContext( cl_context_properties gl_context );
        void setCglSharegroup( void* sharegroup );

        /**
         * @brief Inserts or replaces the value for its kind.
         *
         * Terminates the process for alternatives other than Platform,
         * InteropUserSync, GlContext and CglSharegroup.
         */
        void setPropertyValue( const ContextPropertyValue& value );

        ContextPropertyList& platform( cl_platform_id platform )
        {
            setPlatform( platform );
            return *this;
        }

        ContextPropertyList& interopUserSync( bool enabled )
        {
            setInteropUserSync( enabled );
            return *this;
        }

        ContextPropertyList& glContext( cl_context_properties gl_context )
        {
            setGlContext( gl_context );
            return *this;
        }

        ContextPropertyList& cglSharegroup( void* sharegroup )
        {
            setCglSharegroup( sharegroup );
            return *this;
        }

        ContextPropertyList& propertyValue( const ContextPropertyValue& value )
        {
            setPropertyValue( value );
            return *this;
        }

        std::optional<cl_platform_id> getPlatform() const;
        std::optional<bool> getInteropUserSync() const;
        std::optional<cl_context_properties> getGlContext() const;
        std::optional<void*> getCglSharegroup() const;

        bool contains( ContextProperty kind ) const
        {
            return properties_.find( kind ) != properties_.end();
        }

        size_t size() const noexcept
        {
            return properties_.size();
        }

        bool empty() const noexcept
        {
            return properties_.empty();
        }

        /**
         * @brief Packs the list as (key, value) words followed by a terminating 0.
         */
        std::vector<cl_context_properties> toRaw() const;

        std::string toString() const;

    private:

        template <typename TValue>
        const TValue* find( ContextProperty kind ) const;

        std::unordered_map<ContextProperty, ContextPropertyValue> properties_;
    };
}
#endif
