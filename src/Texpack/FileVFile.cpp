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

#include "FileVFile.h"

#include <cerrno>
#include <cstring>
#include <utility>
#include <Corrade/Containers/String.h>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>

#ifndef CORRADE_TARGET_WINDOWS
#include <sys/types.h>
#endif

namespace Texpack {

namespace {

/* 64-bit offsets on every platform */
inline int fileSeek(std::FILE* const handle, const Long offset, const int origin) {
    #ifdef CORRADE_TARGET_WINDOWS
    return _fseeki64(handle, offset, origin);
    #else
    return fseeko(handle, offset, origin);
    #endif
}

inline Long fileTell(std::FILE* const handle) {
    #ifdef CORRADE_TARGET_WINDOWS
    return _ftelli64(handle);
    #else
    return ftello(handle);
    #endif
}

}

Debug& operator<<(Debug& debug, const FileMode value) {
    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case FileMode::value: return debug << "Texpack::FileMode::" #value;
        _c(Read)
        _c(ReadWrite)
        _c(Create)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "Texpack::FileMode(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

FileVFile::FileVFile(): _handle{}, _owned{}, _lastWasWrite{} {}

FileVFile::FileVFile(std::FILE* const handle, const bool takeOwnership): _handle{handle}, _owned{takeOwnership}, _lastWasWrite{} {}

FileVFile::FileVFile(FileVFile&& other) noexcept: _handle{other._handle}, _owned{other._owned}, _lastWasWrite{other._lastWasWrite} {
    other._handle = nullptr;
    other._owned = false;
}

FileVFile::~FileVFile() { close(); }

FileVFile& FileVFile::operator=(FileVFile&& other) noexcept {
    using std::swap;
    swap(_handle, other._handle);
    swap(_owned, other._owned);
    swap(_lastWasWrite, other._lastWasWrite);
    return *this;
}

ErrorCode FileVFile::open(const Containers::StringView filename, const FileMode mode) {
    close();

    const char* modeString{};
    switch(mode) {
        case FileMode::Read: modeString = "rb"; break;
        case FileMode::ReadWrite: modeString = "r+b"; break;
        case FileMode::Create: modeString = "w+b"; break;
    }
    CORRADE_INTERNAL_ASSERT(modeString);

    /* The view isn't guaranteed to be null-terminated */
    const Containers::String nullTerminated = Containers::String::nullTerminatedView(filename);
    _handle = std::fopen(nullTerminated.data(), modeString);
    if(!_handle) {
        Error{} << "Texpack::FileVFile::open(): can't open" << filename << "with" << mode << Debug::nospace << ":" << std::strerror(errno);
        return ErrorCode::InitError;
    }

    _owned = true;
    _lastWasWrite = false;
    return ErrorCode::NoError;
}

VFileType FileVFile::doType() const { return VFileType::File; }

bool FileVFile::doIsOpen() const { return _handle; }

ErrorCode FileVFile::doRead(const Containers::ArrayView<char> buffer, std::size_t& count) {
    if(_lastWasWrite) {
        if(std::fflush(_handle) != 0) {
            Error{} << "Texpack::FileVFile::read(): can't flush pending writes:" << std::strerror(errno);
            return ErrorCode::ReadError;
        }
        _lastWasWrite = false;
    }

    /* Hitting the end is not an error, the caller gets a short count */
    count = std::fread(buffer.data(), 1, buffer.size(), _handle);
    if(count != buffer.size() && std::ferror(_handle)) {
        Error{} << "Texpack::FileVFile::read(): can't read" << buffer.size() << "bytes:" << std::strerror(errno);
        std::clearerr(_handle);
        return ErrorCode::ReadError;
    }

    return ErrorCode::NoError;
}

ErrorCode FileVFile::doWrite(const Containers::ArrayView<const char> buffer, std::size_t& count) {
    if(!_lastWasWrite) {
        /* A no-op seek to switch the stream from reading to writing */
        if(fileSeek(_handle, 0, SEEK_CUR) != 0) {
            Error{} << "Texpack::FileVFile::write(): can't switch to writing:" << std::strerror(errno);
            return ErrorCode::WriteError;
        }
        _lastWasWrite = true;
    }

    count = std::fwrite(buffer.data(), 1, buffer.size(), _handle);
    if(count != buffer.size()) {
        Error{} << "Texpack::FileVFile::write(): can't write" << buffer.size() << "bytes:" << std::strerror(errno);
        std::clearerr(_handle);
        return ErrorCode::WriteError;
    }

    return ErrorCode::NoError;
}

ErrorCode FileVFile::seekTo(const char* const function, const Long offset) {
    if(offset < 0 || std::size_t(offset) > doByteCount()) {
        Error{} << "Texpack::FileVFile::" << Debug::nospace << function << Debug::nospace << "(): can't seek to" << offset << "in a file of" << doByteCount() << "bytes";
        return ErrorCode::SeekError;
    }

    if(fileSeek(_handle, offset, SEEK_SET) != 0) {
        Error{} << "Texpack::FileVFile::" << Debug::nospace << function << Debug::nospace << "():" << std::strerror(errno);
        return ErrorCode::SeekError;
    }

    return ErrorCode::NoError;
}

ErrorCode FileVFile::doSeekFromStart(const UnsignedLong offset) {
    if(offset > UnsignedLong(~0ull >> 1)) {
        Error{} << "Texpack::FileVFile::seekFromStart(): offset" << offset << "too large";
        return ErrorCode::SeekError;
    }
    return seekTo("seekFromStart", Long(offset));
}

ErrorCode FileVFile::doSeekFromCurrent(const Long offset) {
    return seekTo("seekFromCurrent", Long(doTell()) + offset);
}

ErrorCode FileVFile::doSeekFromEnd(const Long offset) {
    return seekTo("seekFromEnd", Long(doByteCount()) + offset);
}

std::size_t FileVFile::doTell() const {
    const auto position = fileTell(_handle);
    CORRADE_INTERNAL_ASSERT(position >= 0);
    return std::size_t(position);
}

std::size_t FileVFile::doByteCount() const {
    /* Flush pending writes so the size reflects them, then seek to the end
       and back. The stream is const from the user point of view. */
    if(_lastWasWrite) std::fflush(_handle);

    const auto position = fileTell(_handle);
    CORRADE_INTERNAL_ASSERT(position >= 0);
    CORRADE_INTERNAL_ASSERT_OUTPUT(fileSeek(_handle, 0, SEEK_END) == 0);
    const auto size = fileTell(_handle);
    CORRADE_INTERNAL_ASSERT_OUTPUT(fileSeek(_handle, position, SEEK_SET) == 0);
    return std::size_t(size);
}

ErrorCode FileVFile::doFlush() {
    if(std::fflush(_handle) != 0) {
        Error{} << "Texpack::FileVFile::flush():" << std::strerror(errno);
        return ErrorCode::WriteError;
    }

    return ErrorCode::NoError;
}

void FileVFile::doClose() {
    if(_owned && std::fclose(_handle) != 0)
        Error{} << "Texpack::FileVFile::close():" << std::strerror(errno);
    _handle = nullptr;
    _owned = false;
    _lastWasWrite = false;
}

}
