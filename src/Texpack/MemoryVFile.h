#ifndef Texpack_MemoryVFile_h
#define Texpack_MemoryVFile_h
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
 * @brief Class @ref Texpack::MemoryVFile
 */

#include <Corrade/Containers/Array.h>

#include "Texpack/VFile.h"

namespace Texpack {

/**
@brief Memory byte source

Either borrows an external buffer or owns one. Reads and writes are
all-or-nothing: if the full request doesn't fit into the buffer, nothing is
transferred and @ref ErrorCode::ReadError or @ref ErrorCode::WriteError is
returned. An owning growable buffer is enlarged on writes past the end
instead.

Seeking with @ref seekFromStart() and @ref seekFromCurrent() accepts targets
inside the buffer and a seek to the start of an empty buffer. The end of the
buffer is reachable only with @ref seekFromEnd(), which accepts zero or
negative offsets that stay inside the buffer.
*/
class TEXPACK_EXPORT MemoryVFile: public VFile {
    public:
        /**
         * @brief Default constructor
         *
         * Creates an empty owned growable buffer.
         */
        explicit MemoryVFile();

        /**
         * @brief Borrow an external buffer
         *
         * The buffer is expected to stay in scope for the whole lifetime of
         * the instance. It can't grow.
         */
        explicit MemoryVFile(Containers::ArrayView<char> buffer);

        /** @brief Take over an existing buffer */
        explicit MemoryVFile(Containers::Array<char>&& buffer, bool growable = false);

        /** @brief Allocate a zero-filled buffer of given size */
        explicit MemoryVFile(std::size_t size, bool growable = false);

        /** @brief Copying is not allowed */
        MemoryVFile(const MemoryVFile&) = delete;

        ~MemoryVFile();

        /** @brief Copying is not allowed */
        MemoryVFile& operator=(const MemoryVFile&) = delete;

        /** @brief Whether the buffer is owned by the instance */
        bool isOwned() const { return _owned; }

        /** @brief Whether the buffer can grow on writes */
        bool isGrowable() const { return _growable; }

        /**
         * @brief Buffer contents
         *
         * The view is invalidated by a growing write.
         */
        Containers::ArrayView<char> data() { return _data; }
        Containers::ArrayView<const char> data() const { return _data; } /**< @overload */

        /**
         * @brief Release the owned buffer
         *
         * Expects that the buffer is owned. The instance is closed
         * afterwards.
         */
        Containers::Array<char> release();

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
        TEXPACK_LOCAL void doClose() override;

        Containers::Array<char> _storage;
        Containers::ArrayView<char> _data;
        std::size_t _offset;
        bool _owned, _growable, _open;
};

}

#endif
