#ifndef Texpack_FileVFile_h
#define Texpack_FileVFile_h
/*
    This file is part of Texpack.

    Copyright © 2022, 2023 Texpack contributors

    Permission is hereby granted, free of charge, to any person obtaining a
    copy of this software and associated documentation files (the "Software"),
    to deal in the Software without restriction, including without limitation
    the rights to use, copy, modify, merge, publish, distribute, sublicense,
    and/or sell copies of the Software, and to permit persons to whom the
    Software is furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be included
    in all copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
    IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
    FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL
    THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
    LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
    FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
    DEALINGS IN THE SOFTWARE.
*/

/** @file
 * @brief Class @ref Texpack::FileVFile, enum @ref Texpack::FileMode
 */

#include <cstdio>
#include <Corrade/Containers/StringView.h>

#include "Texpack/VFile.h"

namespace Texpack {

/**
@brief File open mode

@see @ref FileVFile::open()
*/
enum class FileMode: UnsignedByte {
    /** Open an existing file for reading */
    Read,

    /** Open an existing file for reading and writing */
    ReadWrite,

    /** Create or truncate a file for reading and writing */
    Create
};

/** @debugoperatorenum{FileMode} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, FileMode value);

/**
@brief Operating system file byte source

Thin wrapper over a C stdio file handle. Failures of the underlying calls are
printed to @ref Corrade::Utility::Error together with the system error
message. Seeking outside of the file bounds fails with
@ref ErrorCode::SeekError, seeking to the end is allowed.
*/
class TEXPACK_EXPORT FileVFile: public VFile {
    public:
        /**
         * @brief Default constructor
         *
         * Creates a closed instance, call @ref open() afterwards.
         */
        explicit FileVFile();

        /**
         * @brief Adopt an already opened handle
         *
         * If @p takeOwnership is @cpp true @ce, the handle is closed on
         * destruction or @ref close().
         */
        explicit FileVFile(std::FILE* handle, bool takeOwnership = true);

        /** @brief Copying is not allowed */
        FileVFile(const FileVFile&) = delete;

        /** @brief Move constructor */
        FileVFile(FileVFile&& other) noexcept;

        ~FileVFile();

        /** @brief Copying is not allowed */
        FileVFile& operator=(const FileVFile&) = delete;

        /** @brief Move assignment */
        FileVFile& operator=(FileVFile&& other) noexcept;

        /**
         * @brief Open a file
         *
         * Closes the previously opened file, if any. Returns
         * @ref ErrorCode::InitError if the file can't be opened.
         */
        ErrorCode open(Containers::StringView filename, FileMode mode = FileMode::Read);

        /** @brief Underlying handle */
        std::FILE* handle() { return _handle; }

    private:
        TEXPACK_LOCAL VFileType doType() const override;
        TEXPACK_LOCAL bool doIsOpen() const override;
        TEXPACK_LOCAL ErrorCode doRead(Containers::ArrayView<char> buffer, std::size_t& count) override;
        TEXPACK_LOCAL ErrorCode doWrite(Containers::ArrayView<const char> buffer, std::size_t& count) override;
        TEXPACK_LOCAL ErrorCode doSeekFromStart(UnsignedLong offset) override;
        TEXPACK_LOCAL ErrorCode doSeekFromCurrent(Long offset) override;
        TEXPACK_LOCAL ErrorCode doSeekFromEnd(Long offset) override;
        TEXPACK_LOCAL std::size_t doTell() const override;
        TEXPACK_LOCAL std::size_t doByteCount() const override;
        TEXPACK_LOCAL ErrorCode doFlush() override;
        TEXPACK_LOCAL void doClose() override;

        TEXPACK_LOCAL ErrorCode seekTo(const char* function, Long offset);

        std::FILE* _handle;
        bool _owned;
        /* Whether the last operation was a write. The C standard requires a
           flush or seek between a write and a subsequent read, and a seek
           between a read and a subsequent write. */
        bool _lastWasWrite;
};

}

#endif
