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

#include "VFile.h"

#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>

namespace Texpack {

Debug& operator<<(Debug& debug, const VFileType value) {
    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case VFileType::value: return debug << "Texpack::VFileType::" #value;
        _c(File)
        _c(Memory)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "Texpack::VFileType(" << Debug::nospace << reinterpret_cast<void*>(UnsignedInt(value)) << Debug::nospace << ")";
}

VFile::VFile() = default;

VFile::~VFile() = default;

ErrorCode VFile::read(const Containers::ArrayView<char> buffer, std::size_t& count) {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::read(): no file opened", ErrorCode::ReadError);
    count = 0;
    return doRead(buffer, count);
}

ErrorCode VFile::read(const Containers::ArrayView<char> buffer) {
    std::size_t count;
    const ErrorCode error = read(buffer, count);
    if(error != ErrorCode::NoError) return error;
    return count == buffer.size() ? ErrorCode::NoError : ErrorCode::ReadError;
}

ErrorCode VFile::write(const Containers::ArrayView<const char> buffer, std::size_t& count) {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::write(): no file opened", ErrorCode::WriteError);
    count = 0;
    return doWrite(buffer, count);
}

ErrorCode VFile::write(const Containers::ArrayView<const char> buffer) {
    std::size_t count;
    return write(buffer, count);
}

ErrorCode VFile::seekFromStart(const UnsignedLong offset) {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::seekFromStart(): no file opened", ErrorCode::SeekError);
    return doSeekFromStart(offset);
}

ErrorCode VFile::seekFromCurrent(const Long offset) {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::seekFromCurrent(): no file opened", ErrorCode::SeekError);
    return doSeekFromCurrent(offset);
}

ErrorCode VFile::seekFromEnd(const Long offset) {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::seekFromEnd(): no file opened", ErrorCode::SeekError);
    return doSeekFromEnd(offset);
}

std::size_t VFile::tell() const {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::tell(): no file opened", {});
    return doTell();
}

std::size_t VFile::byteCount() const {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::byteCount(): no file opened", {});
    return doByteCount();
}

bool VFile::endOfFile() const {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::endOfFile(): no file opened", true);
    return doEndOfFile();
}

bool VFile::doEndOfFile() const {
    return doTell() >= doByteCount();
}

ErrorCode VFile::flush() {
    CORRADE_ASSERT(isOpen(), "Texpack::VFile::flush(): no file opened", ErrorCode::WriteError);
    return doFlush();
}

ErrorCode VFile::doFlush() { return ErrorCode::NoError; }

void VFile::close() {
    if(isOpen()) doClose();
}

}
