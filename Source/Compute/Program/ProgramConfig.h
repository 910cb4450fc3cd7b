/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_PROGRAM_CONFIG_H_
#define OCELOT_COMPUTE_PROGRAM_CONFIG_H_

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../OpenCL/DeviceSelector.h"
#include "BuildOption.h"

namespace Ocelot::Compute
{
    using json = nlohmann::json;

    /**
     * @brief Declarative description of a program build.
     *
     * Typical usage:
     * @code
     * auto config = ProgramConfig( "saxpy" )
     *     .withOption( CompilerDefine{ "WIDTH", "64" } )
     *     .withSourceFile( "kernels/saxpy.cl" )
     *     .withDeviceSelector( OpenCL::DeviceSelector::first() );
     * config.validate();
     * @endcode
     *
     * JSON layout:
     * @code
     * {
     *   "name": "saxpy",
     *   "options": [ { "kind": "compiler_define", "name": "WIDTH", "value": "64" },
     *                { "kind": "source_append", "text": "..." } ],
     *   "source_files": [ "kernels/saxpy.cl" ],
     *   "devices": "first" | "all" | [ 0, 1 ] | { "wrapping_indices": [ 0, 5 ] } | { "type": "Gpu" }
     * }
     * @endcode
     *
     * Option kinds: compiler_define, compiler_include_dir, compiler_raw,
     * source_define, source_include, source_append.
     */
    class ProgramConfig
    {
    public:

        explicit ProgramConfig( std::string name = "program" )
            : name_( std::move( name ) )
        {
        }

        ProgramConfig& withName( std::string name )
        {
            name_ = std::move( name );
            return *this;
        }

        ProgramConfig& withOption( BuildOption option )
        {
            options_.push_back( std::move( option ) );
            return *this;
        }

        ProgramConfig& withSourceFile( std::filesystem::path path )
        {
            source_files_.push_back( std::move( path ) );
            return *this;
        }

        ProgramConfig& withDeviceSelector( OpenCL::DeviceSelector selector )
        {
            device_selector_ = std::move( selector );
            return *this;
        }

        const std::string& getName() const
        {
            return name_;
        }

        const BuildOptionList& getOptions() const
        {
            return options_;
        }

        const std::vector<std::filesystem::path>& getSourceFiles() const
        {
            return source_files_;
        }

        const std::optional<OpenCL::DeviceSelector>& getDeviceSelector() const
        {
            return device_selector_;
        }

        /**
         * @brief Validates the configuration.
         *
         * @throws ConfigurationError if the name is not an identifier, a define has
         *         an empty name, a source file path is empty, or the configuration
         *         carries no source at all.
         */
        void validate() const;

        /**
         * @brief Serialize configuration to JSON.
         *
         * @throws ConfigurationError for device selectors naming device handles,
         *         which have no JSON form.
         */
        json toJson() const;

        /**
         * @brief Deserialize configuration from JSON.
         *
         * Missing keys leave fields at their current values. Type errors are
         * propagated from nlohmann::json getters.
         *
         * @throws ConfigurationError for an unknown option kind or device selection.
         */
        void fromJson( const json& j );

        /**
         * @brief Loads and validates a configuration from a JSON file.
         *
         * @throws ConfigurationError if the file cannot be opened or parsed.
         */
        static ProgramConfig fromFile( const std::filesystem::path& path );

        std::string toString() const;

    private:

        std::string name_;
        BuildOptionList options_;
        std::vector<std::filesystem::path> source_files_;
        std::optional<OpenCL::DeviceSelector> device_selector_;
    };
}
#endif
