/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_PROGRAM_BUILD_OPTION_H_
#define OCELOT_COMPUTE_PROGRAM_BUILD_OPTION_H_

#include <string>
#include <variant>
#include <vector>

namespace Ocelot::Compute
{
    /// @brief Compiler command line definition, rendered as "-D{name}={value}".
    struct CompilerDefine
    {
        std::string name;
        std::string value;
    };

    /// @brief Compiler include directory, rendered as "-I{path}".
    struct CompilerIncludeDir
    {
        std::string path;
    };

    /// @brief Compiler option passed through verbatim.
    struct CompilerRaw
    {
        std::string text;
    };

    /// @brief Definition placed ahead of the program source as "#define {name}  {value}".
    struct SourceDefine
    {
        std::string name;
        std::string value;
    };

    /// @brief Raw text placed ahead of the program source.
    struct SourceInclude
    {
        std::string text;
    };

    /// @brief Raw text placed after the program source.
    struct SourceAppend
    {
        std::string text;
    };

    using BuildOption = std::variant<CompilerDefine, CompilerIncludeDir, CompilerRaw,
        SourceDefine, SourceInclude, SourceAppend>;

    using BuildOptionList = std::vector<BuildOption>;

    /// @brief True for options that end up on the compiler command line.
    bool isCompilerOption( const BuildOption& option ) noexcept;

    /**
     * @brief Renders the option the way it is handed to the compiler or spliced into the source.
     */
    std::string render( const BuildOption& option );

    /// @brief Short description for logs, e.g. "CompilerDefine(WIDTH=64)".
    std::string toString( const BuildOption& option );
}
#endif
