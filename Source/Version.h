/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_VERSION_H_
#define OCELOT_VERSION_H_

#include <string>
#include <sstream>

#define OCELOT_VERSION_MAJOR 0
#define OCELOT_VERSION_MINOR 9
#define OCELOT_VERSION_PATCH 2
#define OCELOT_VERSION_PRERELEASE_TAG "alpha"
#define OCELOT_VERSION_PRERELEASE 1

namespace Ocelot
{
    /// <summary>
    /// Semantic Version data.
    /// </summary>
    struct Version
    {
    public:

        /// <summary>
        /// Semantic Version Constructor
        /// </summary>
        /// <param name="major">Major API version</param>
        /// <param name="minor">Minor version for functional changes</param>
        /// <param name="patch">Patch for bug fixes</param>
        /// <param name="prerelease_tag">Optional pre-release text</param>
        /// <param name="prerelease">Optional pre-release number</param>
        Version( int major, int minor, int patch, const std::string& prerelease_tag = "", int prerelease = 0 )
            : major_( major ), minor_( minor ), patch_( patch ), pre_release_tag_( prerelease_tag ), pre_release_( prerelease )
        {
        }

        std::string ToString() const
        {
            std::stringstream ss;

            ss << std::to_string( major_ )
                << "." << std::to_string( minor_ )
                << "." << std::to_string( patch_ );

            if ( !pre_release_tag_.empty() )
            {
                ss << "-" << pre_release_tag_ << "." << std::to_string( pre_release_ );
            }

            return ss.str();
        }

        int getMajor() const { return major_; }
        int getMinor() const { return minor_; }
        int getPatch() const { return patch_; }

    private:

        int major_;
        int minor_;
        int patch_;
        std::string pre_release_tag_;
        int pre_release_;
    };
}
#endif
