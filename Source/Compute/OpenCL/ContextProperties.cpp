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

#include "ContextProperties.h"
#include "../Contract.h"

namespace Ocelot::Compute::OpenCL
{
    std::string contextPropertyToString( ContextProperty kind )
    {
        switch ( kind ) {
            case ContextProperty::Platform:        return "Platform";
            case ContextProperty::InteropUserSync: return "InteropUserSync";
            case ContextProperty::D3d10Device:     return "D3d10Device";
            case ContextProperty::GlContext:       return "GlContext";
            case ContextProperty::EglDisplay:      return "EglDisplay";
            case ContextProperty::GlxDisplay:      return "GlxDisplay";
            case ContextProperty::CglSharegroup:   return "CglSharegroup";
            case ContextProperty::WglHdc:          return "WglHdc";
            case ContextProperty::AdapterD3d9:     return "AdapterD3d9";
            case ContextProperty::AdapterD3d9Ex:   return "AdapterD3d9Ex";
            case ContextProperty::AdapterDxva:     return "AdapterDxva";
            case ContextProperty::D3d11Device:     return "D3d11Device";
        }
        return "Unknown";
    }

    void ContextPropertyList::setPlatform( cl_platform_id platform )
    {
        properties_.insert_or_assign( ContextProperty::Platform, ContextPropertyValues::Platform{ platform } );
    }

    void ContextPropertyList::setInteropUserSync( bool enabled )
    {
        properties_.insert_or_assign( ContextProperty::InteropUserSync, ContextPropertyValues::InteropUserSync{ enabled } );
    }

    void ContextPropertyList::setGlContext( cl_context_properties gl_context )
    {
        properties_.insert_or_assign( ContextProperty::GlContext, ContextPropertyValues::GlContext{ gl_context } );
    }

    void ContextPropertyList::setCglSharegroup( void* sharegroup )
    {
        properties_.insert_or_assign( ContextProperty::CglSharegroup, ContextPropertyValues::CglSharegroup{ sharegroup } );
    }

    void ContextPropertyList::setPropertyValue( const ContextPropertyValue& value )
    {
        ContextProperty kind = kindOf( value );

        switch ( kind ) {
            case ContextProperty::Platform:
            case ContextProperty::InteropUserSync:
            case ContextProperty::GlContext:
            case ContextProperty::CglSharegroup:
                properties_.insert_or_assign( kind, value );
                break;
            default:
                contractViolation( "'" + contextPropertyToString( kind ) + "' is not yet a supported context property." );
        }
    }

    template <typename TValue>
    const TValue* ContextPropertyList::find( ContextProperty kind ) const
    {
        auto it = properties_.find( kind );

        if ( it == properties_.end() )
        {
            return nullptr;
        }

        const TValue* value = std::get_if<TValue>( &it->second );
        contractCheck( value != nullptr,
            "Context property '" + contextPropertyToString( kind ) + "' holds a value of another kind." );

        return value;
    }

    std::optional<cl_platform_id> ContextPropertyList::getPlatform() const
    {
        if ( auto value = find<ContextPropertyValues::Platform>( ContextProperty::Platform ) )
        {
            return value->id;
        }
        return std::nullopt;
    }

    std::optional<bool> ContextPropertyList::getInteropUserSync() const
    {
        if ( auto value = find<ContextPropertyValues::InteropUserSync>( ContextProperty::InteropUserSync ) )
        {
            return value->enabled;
        }
        return std::nullopt;
    }

    std::optional<cl_context_properties> ContextPropertyList::getGlContext() const
    {
        if ( auto value = find<ContextPropertyValues::GlContext>( ContextProperty::GlContext ) )
        {
            return value->handle;
        }
        return std::nullopt;
    }

    std::optional<void*> ContextPropertyList::getCglSharegroup() const
    {
        if ( auto value = find<ContextPropertyValues::CglSharegroup>( ContextProperty::CglSharegroup ) )
        {
            return value->sharegroup;
        }
        return std::nullopt;
    }

    std::vector<cl_context_properties> ContextPropertyList::toRaw() const
    {
        std::vector<cl_context_properties> raw;
        raw.reserve( properties_.size() * 2 + 1 );

        for ( const auto& [kind, value] : properties_ )
        {
            raw.push_back( toClContextProperty( kind ) );

            if ( auto platform = std::get_if<ContextPropertyValues::Platform>( &value ) )
            {
                raw.push_back( reinterpret_cast<cl_context_properties>( platform->id ) );
            }
            else if ( auto sync = std::get_if<ContextPropertyValues::InteropUserSync>( &value ) )
            {
                raw.push_back( sync->enabled ? CL_TRUE : CL_FALSE );
            }
            else if ( auto gl_context = std::get_if<ContextPropertyValues::GlContext>( &value ) )
            {
                raw.push_back( gl_context->handle );
            }
            else if ( auto sharegroup = std::get_if<ContextPropertyValues::CglSharegroup>( &value ) )
            {
                raw.push_back( reinterpret_cast<cl_context_properties>( sharegroup->sharegroup ) );
            }
            else
            {
                contractViolation( "'" + contextPropertyToString( kind ) + "' is not yet a supported context property." );
            }
        }

        raw.push_back( 0 );

        return raw;
    }

    std::string ContextPropertyList::toString() const
    {
        std::ostringstream oss;
        oss << "ContextPropertyList { ";

        bool first = true;
        for ( const auto& [kind, value] : properties_ )
        {
            oss << (first ? "" : ", ") << contextPropertyToString( kind );
            first = false;
        }

        oss << " }";
        return oss.str();
    }
}
