/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <cctype>
#include <charconv>
#include <sstream>
#include <string>
#include <system_error>

#include "OpenclVersion.h"
#include "../ComputeError.h"

namespace Ocelot::Compute::OpenCL
{
    namespace
    {
        bool isOpenclWord( std::string_view word )
        {
            constexpr std::string_view kOpencl = "opencl";

            if ( word.size() < kOpencl.size() )
            {
                return false;
            }

            for ( size_t i = 0; i < kOpencl.size(); ++i )
            {
                if ( std::tolower( static_cast<unsigned char>( word[ i ] ) ) != kOpencl[ i ] )
                {
                    return false;
                }
            }
            return true;
        }

        bool parseNumber( std::string_view text, uint16_t& value )
        {
            if ( text.empty() )
            {
                return false;
            }

            auto [ end, ec ] = std::from_chars( text.data(), text.data() + text.size(), value );
            return ec == std::errc() && end == text.data() + text.size();
        }
    }

    OpenclVersion OpenclVersion::parse( std::string_view info )
    {
        std::istringstream words{ std::string( info ) };
        std::string word;

        while ( words >> word )
        {
            if ( !isOpenclWord( word ) )
            {
                continue;
            }

            // Only the word directly after "OpenCL" is considered.
            std::string number;
            if ( words >> number )
            {
                std::string_view text( number );
                size_t dot = text.find( '.' );

                OpenclVersion version;
                if ( dot != std::string_view::npos &&
                    text.find( '.', dot + 1 ) == std::string_view::npos &&
                    parseNumber( text.substr( 0, dot ), version.major ) &&
                    parseNumber( text.substr( dot + 1 ), version.minor ) )
                {
                    return version;
                }
            }
            break;
        }

        throw ConfigurationError( "Unable to parse an OpenCL version from '" + std::string( info ) + "'." );
    }
}
