/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_ERROR_H_
#define OCELOT_COMPUTE_ERROR_H_

#include <filesystem>
#include <stdexcept>
#include <string>

namespace Ocelot::Compute
{
    /**
     * @brief Caller-fixable configuration problem.
     *
     * Raised for an empty device list, a second device selector, an
     * out-of-range device index or an invalid ProgramConfig.
     */
    class ConfigurationError : public std::invalid_argument
    {
    public:
        explicit ConfigurationError( const std::string& message )
            : std::invalid_argument( message )
        {
        }
    };

    /**
     * @brief A program source file could not be opened or read.
     */
    class SourceFileError : public std::runtime_error
    {
    public:
        SourceFileError( const std::filesystem::path& path, const std::string& reason )
            : std::runtime_error( "Source file '" + path.string() + "': " + reason ), path_( path )
        {
        }

        const std::filesystem::path& getPath() const noexcept
        {
            return path_;
        }

    private:
        std::filesystem::path path_;
    };

    /**
     * @brief Text destined for the native layer contains an embedded NUL byte.
     */
    class EncodingError : public std::invalid_argument
    {
    public:
        explicit EncodingError( const std::string& message )
            : std::invalid_argument( message )
        {
        }
    };

    /**
     * @brief A programming contract was broken by the caller.
     *
     * Thrown to abort the offending operation (unmapping twice, registering a
     * second unmap trigger). Never caught inside Ocelot.
     */
    class ContractViolation : public std::logic_error
    {
    public:
        explicit ContractViolation( const std::string& message )
            : std::logic_error( message )
        {
        }
    };
}
#endif
