/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_PROGRAM_BUILDER_H_
#define OCELOT_COMPUTE_PROGRAM_BUILDER_H_

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../OpenCL/Context.h"
#include "../OpenCL/DeviceSelector.h"
#include "BuildOption.h"
#include "Program.h"
#include "ProgramConfig.h"
#include "SourceReader.h"

namespace Ocelot::Compute
{
    /**
     * @brief Collects build options, source files and a device selector, then builds a Program.
     *
     * The assembled program source is, in order:
     * - a "\n" block,
     * - every SourceDefine and SourceInclude in insertion order,
     * - the contents of every source file, last added first, each path at most once,
     * - a "\n" block,
     * - every SourceAppend in insertion order.
     *
     * Files added later therefore act as base code for files added earlier.
     *
     * @code
     * auto program = ProgramBuilder()
     *     .addCompilerDefine( "WIDTH", 64 )
     *     .addSourceFile( "kernels/main.cl" )
     *     .addSourceFile( "kernels/common.cl" )
     *     .addDeviceSelector( DeviceSelector::first() )
     *     .build( context );
     * @endcode
     */
    class ProgramBuilder
    {
    public:

        ProgramBuilder() = default;

        /**
         * @brief Seeds the builder with the options, files and device selector of config.
         */
        explicit ProgramBuilder( const ProgramConfig& config );

        ProgramBuilder& addOption( BuildOption option );

        ProgramBuilder& addCompilerDefine( const std::string& name, int value );
        ProgramBuilder& addCompilerDefine( const std::string& name, const std::string& value );
        ProgramBuilder& addIncludeDir( const std::string& path );
        ProgramBuilder& addCompilerOption( const std::string& text );

        ProgramBuilder& addSourceDefine( const std::string& name, int value );
        ProgramBuilder& addSourceDefine( const std::string& name, const std::string& value );
        ProgramBuilder& addSourceInclude( const std::string& text );

        /// @brief Appends text after all source files.
        ProgramBuilder& addSource( const std::string& text );

        /// @brief Adds a source file. The file is read when sources are assembled.
        ProgramBuilder& addSourceFile( const std::filesystem::path& path );

        /**
         * @brief Sets the devices to build for.
         *
         * @throws ConfigurationError if a selector has already been set. The first selector is kept.
         */
        ProgramBuilder& addDeviceSelector( OpenCL::DeviceSelector selector );

        const BuildOptionList& getOptions() const noexcept
        {
            return options_;
        }

        const std::vector<std::filesystem::path>& getSourceFiles() const noexcept
        {
            return source_files_;
        }

        const std::optional<OpenCL::DeviceSelector>& getDeviceSelector() const noexcept
        {
            return device_selector_;
        }

        /**
         * @brief Produces the program source blocks.
         *
         * @throws SourceFileError if a file cannot be read.
         * @throws EncodingError if a block contains a NUL byte.
         */
        std::vector<std::string> assembleSources( SourceReader& reader ) const;

        std::vector<std::string> assembleSources() const;

        /**
         * @brief Produces the compiler option string: " " followed by each compiler option, space separated.
         *
         * @throws EncodingError if an option contains a NUL byte.
         */
        std::string assembleCompilerOptions() const;

        /**
         * @brief Builds the program for the devices the selector resolves to on the context's platform.
         *
         * @throws ConfigurationError if no device is selected. No native call is made in that case.
         */
        Program build( const OpenCL::Context& context ) const;

        Program build( const OpenCL::Context& context, SourceReader& reader ) const;

    private:

        BuildOptionList options_;
        std::vector<std::filesystem::path> source_files_;
        std::optional<OpenCL::DeviceSelector> device_selector_;
    };
}
#endif
