/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_PROGRAM_SOURCE_READER_H_
#define OCELOT_COMPUTE_PROGRAM_SOURCE_READER_H_

#include <filesystem>
#include <string>

namespace Ocelot::Compute
{
    /**
     * @brief Supplies the contents of program source files.
     */
    class SourceReader
    {
    public:

        virtual ~SourceReader() = default;

        /**
         * @brief Returns the full contents of the file at path.
         *
         * @throws SourceFileError if the file cannot be read.
         */
        virtual std::string read( const std::filesystem::path& path ) = 0;
    };

    /**
     * @brief Reads source files from the file system in binary mode.
     */
    class FileSystemSourceReader : public SourceReader
    {
    public:

        std::string read( const std::filesystem::path& path ) override;
    };
}
#endif
