/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <cstdint>
#include <fstream>
#include <string>
#include <system_error>

#include "SourceReader.h"
#include "../ComputeError.h"

namespace Ocelot::Compute
{
    std::string FileSystemSourceReader::read( const std::filesystem::path& path )
    {
        std::error_code ec;

        if ( !std::filesystem::is_regular_file( path, ec ) )
        {
            throw SourceFileError( path, ec ? "unable to open file: " + ec.message() : "not a regular file" );
        }

        auto size = std::filesystem::file_size( path, ec );

        if ( ec )
        {
            throw SourceFileError( path, "unable to query file size: " + ec.message() );
        }

        std::ifstream file( path, std::ios::in | std::ios::binary );

        if ( !file.is_open() )
        {
            throw SourceFileError( path, "unable to open file" );
        }

        std::string contents( static_cast<size_t>( size ), '\0' );
        file.read( contents.data(), static_cast<std::streamsize>( contents.size() ) );

        if ( file.bad() || static_cast<uintmax_t>( file.gcount() ) != size )
        {
            throw SourceFileError( path, "read failed after " + std::to_string( file.gcount() ) +
                " of " + std::to_string( size ) + " bytes" );
        }

        return contents;
    }
}
