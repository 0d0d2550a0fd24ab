#ifndef Texpack_VFile_h
#define Texpack_VFile_h
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
 * @brief Class @ref Texpack::VFile, enum @ref Texpack::VFileType
 */

#include <cstddef>
#include <Corrade/Containers/ArrayView.h>
#include <Corrade/Utility/Endianness.h>

#include "Texpack/ErrorCode.h"

namespace Texpack {

/**
@brief Byte source type

Four-character code identifying the backend of a @ref VFile.
@see @ref VFile::type()
*/
enum class VFileType: UnsignedInt {
    /** Operating system file, @ref FileVFile */
    File = Utility::Endianness::fourCC('F', 'I', 'L', 'E'),

    /** Memory buffer, @ref MemoryVFile */
    Memory = Utility::Endianness::fourCC('M', 'E', 'M', '_')
};

/** @debugoperatorenum{VFileType} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, VFileType value);

/**
@brief Seekable byte source

Uniform interface over a random-access byte source with a single position.
All loaders in the library consume data through this class. Fallible
operations return @ref ErrorCode::NoError on success; the position is left
unchanged if a seek fails.

@section Texpack-VFile-subclassing Subclassing

The public functions check that the source is open and then delegate to the
private @cpp do*() @ce implementations:

-   @ref doType(), @ref doIsOpen(), @ref doTell(), @ref doByteCount() and
    @ref doEndOfFile() report state
-   @ref doRead() and @ref doWrite() transfer bytes at the current position
    and report the transferred count
-   the @cpp doSeek*() @ce functions reposition
-   @ref doFlush() and @ref doClose() finish the work
*/
class TEXPACK_EXPORT VFile {
    public:
        explicit VFile();

        /** @brief Copying is not allowed */
        VFile(const VFile&) = delete;

        virtual ~VFile();

        /** @brief Copying is not allowed */
        VFile& operator=(const VFile&) = delete;

        /** @brief Backend type */
        VFileType type() const { return doType(); }

        /** @brief Whether the source is open */
        bool isOpen() const { return doIsOpen(); }

        /**
         * @brief Read bytes at the current position
         * @param[out] buffer   Buffer to fill
         * @param[out] count    Count of bytes actually read
         *
         * Returns @ref ErrorCode::ReadError if the backend fails to read.
         * What a read crossing the end does is backend-specific: a
         * @ref MemoryVFile fails and reads nothing, a @ref FileVFile succeeds
         * and sets @p count to the bytes actually read. Expects that the
         * source is open.
         */
        ErrorCode read(Containers::ArrayView<char> buffer, std::size_t& count);

        /**
         * @brief Read exactly the size of the buffer
         *
         * Like @ref read(Containers::ArrayView<char>, std::size_t&), but
         * returns @ref ErrorCode::ReadError also if fewer than
         * @cpp buffer.size() @ce bytes were read.
         */
        ErrorCode read(Containers::ArrayView<char> buffer);

        /**
         * @brief Write bytes at the current position
         * @param[in] buffer    Bytes to write
         * @param[out] count    Count of bytes actually written
         *
         * Returns @ref ErrorCode::WriteError if not everything could be
         * written. Expects that the source is open.
         */
        ErrorCode write(Containers::ArrayView<const char> buffer, std::size_t& count);

        /** @overload */
        ErrorCode write(Containers::ArrayView<const char> buffer);

        /** @brief Seek to an absolute offset */
        ErrorCode seekFromStart(UnsignedLong offset);

        /** @brief Seek relative to the current position */
        ErrorCode seekFromCurrent(Long offset);

        /** @brief Seek relative to the end */
        ErrorCode seekFromEnd(Long offset);

        /** @brief Current position */
        std::size_t tell() const;

        /** @brief Total size in bytes */
        std::size_t byteCount() const;

        /**
         * @brief Whether the position is at the end
         *
         * Returns @cpp true @ce if @ref tell() is at or past
         * @ref byteCount().
         */
        bool endOfFile() const;

        /** @brief Flush pending writes */
        ErrorCode flush();

        /**
         * @brief Close the source
         *
         * Releases the underlying resource. Does nothing if the source is
         * already closed.
         */
        void close();

    private:
        /** @brief Implementation for @ref type() */
        virtual VFileType doType() const = 0;

        /** @brief Implementation for @ref isOpen() */
        virtual bool doIsOpen() const = 0;

        /** @brief Implementation for @ref read() */
        virtual ErrorCode doRead(Containers::ArrayView<char> buffer, std::size_t& count) = 0;

        /** @brief Implementation for @ref write() */
        virtual ErrorCode doWrite(Containers::ArrayView<const char> buffer, std::size_t& count) = 0;

        /** @brief Implementation for @ref seekFromStart() */
        virtual ErrorCode doSeekFromStart(UnsignedLong offset) = 0;

        /** @brief Implementation for @ref seekFromCurrent() */
        virtual ErrorCode doSeekFromCurrent(Long offset) = 0;

        /** @brief Implementation for @ref seekFromEnd() */
        virtual ErrorCode doSeekFromEnd(Long offset) = 0;

        /** @brief Implementation for @ref tell() */
        virtual std::size_t doTell() const = 0;

        /** @brief Implementation for @ref byteCount() */
        virtual std::size_t doByteCount() const = 0;

        /**
         * @brief Implementation for @ref endOfFile()
         *
         * Default implementation compares @ref doTell() and
         * @ref doByteCount().
         */
        virtual bool doEndOfFile() const;

        /**
         * @brief Implementation for @ref flush()
         *
         * Default implementation does nothing.
         */
        virtual ErrorCode doFlush();

        /** @brief Implementation for @ref close() */
        virtual void doClose() = 0;
};

}

#endif
