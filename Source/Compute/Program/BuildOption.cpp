/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <type_traits>

#include "BuildOption.h"

namespace Ocelot::Compute
{
    bool isCompilerOption( const BuildOption& option ) noexcept
    {
        return std::holds_alternative<CompilerDefine>( option ) ||
            std::holds_alternative<CompilerIncludeDir>( option ) ||
            std::holds_alternative<CompilerRaw>( option );
    }

    std::string render( const BuildOption& option )
    {
        return std::visit( []( const auto& opt ) -> std::string {
            using TOption = std::decay_t<decltype(opt)>;

            if constexpr ( std::is_same_v<TOption, CompilerDefine> ) {
                return "-D" + opt.name + "=" + opt.value;
            }
            else if constexpr ( std::is_same_v<TOption, CompilerIncludeDir> ) {
                return "-I" + opt.path;
            }
            else if constexpr ( std::is_same_v<TOption, SourceDefine> ) {
                return "#define " + opt.name + "  " + opt.value + "\n";
            }
            else {
                return opt.text;
            }
            }, option );
    }

    std::string toString( const BuildOption& option )
    {
        return std::visit( []( const auto& opt ) -> std::string {
            using TOption = std::decay_t<decltype(opt)>;

            if constexpr ( std::is_same_v<TOption, CompilerDefine> ) {
                return "CompilerDefine(" + opt.name + "=" + opt.value + ")";
            }
            else if constexpr ( std::is_same_v<TOption, CompilerIncludeDir> ) {
                return "CompilerIncludeDir(" + opt.path + ")";
            }
            else if constexpr ( std::is_same_v<TOption, CompilerRaw> ) {
                return "CompilerRaw(" + opt.text + ")";
            }
            else if constexpr ( std::is_same_v<TOption, SourceDefine> ) {
                return "SourceDefine(" + opt.name + "=" + opt.value + ")";
            }
            else if constexpr ( std::is_same_v<TOption, SourceInclude> ) {
                return "SourceInclude(" + std::to_string( opt.text.size() ) + " chars)";
            }
            else {
                return "SourceAppend(" + std::to_string( opt.text.size() ) + " chars)";
            }
            }, option );
    }
}
