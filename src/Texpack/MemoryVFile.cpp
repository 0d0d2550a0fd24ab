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

#include "MemoryVFile.h"

#include <Corrade/Containers/GrowableArray.h>
#include <Corrade/Utility/Algorithms.h>
#include <Corrade/Utility/Assert.h>

namespace Texpack {

MemoryVFile::MemoryVFile(): _offset{}, _owned{true}, _growable{true}, _open{true} {}

MemoryVFile::MemoryVFile(const Containers::ArrayView<char> buffer): _data{buffer}, _offset{}, _owned{false}, _growable{false}, _open{true} {}

MemoryVFile::MemoryVFile(Containers::Array<char>&& buffer, const bool growable): _storage{std::move(buffer)}, _data{_storage}, _offset{}, _owned{true}, _growable{growable}, _open{true} {}

MemoryVFile::MemoryVFile(const std::size_t size, const bool growable): _storage{ValueInit, size}, _data{_storage}, _offset{}, _owned{true}, _growable{growable}, _open{true} {}

MemoryVFile::~MemoryVFile() = default;

Containers::Array<char> MemoryVFile::release() {
    CORRADE_ASSERT(_owned, "Texpack::MemoryVFile::release(): the buffer is not owned", {});
    /* A grown buffer has capacity past the logical size, shrink it back */
    if(_growable) Containers::arrayShrink(_storage);
    _data = nullptr;
    _offset = 0;
    _open = false;
    return std::move(_storage);
}

VFileType MemoryVFile::doType() const { return VFileType::Memory; }

bool MemoryVFile::doIsOpen() const { return _open; }

ErrorCode MemoryVFile::doRead(const Containers::ArrayView<char> buffer, std::size_t& count) {
    if(buffer.size() > _data.size() - _offset)
        return ErrorCode::ReadError;

    Utility::copy(_data.slice(_offset, _offset + buffer.size()), buffer);
    _offset += buffer.size();
    count = buffer.size();
    return ErrorCode::NoError;
}

ErrorCode MemoryVFile::doWrite(const Containers::ArrayView<const char> buffer, std::size_t& count) {
    if(buffer.size() > _data.size() - _offset) {
        if(!_owned || !_growable)
            return ErrorCode::WriteError;

        Containers::arrayResize(_storage, NoInit, _offset + buffer.size());
        _data = _storage;
    }

    Utility::copy(buffer, _data.slice(_offset, _offset + buffer.size()));
    _offset += buffer.size();
    count = buffer.size();
    return ErrorCode::NoError;
}

ErrorCode MemoryVFile::doSeekFromStart(const UnsignedLong offset) {
    if(offset != 0 && offset >= _data.size())
        return ErrorCode::SeekError;

    _offset = offset;
    return ErrorCode::NoError;
}

ErrorCode MemoryVFile::doSeekFromCurrent(const Long offset) {
    if(offset < 0 && UnsignedLong(-offset) > _offset)
        return ErrorCode::SeekError;

    return doSeekFromStart(_offset + offset);
}

ErrorCode MemoryVFile::doSeekFromEnd(const Long offset) {
    if(offset > 0 || UnsignedLong(-offset) > _data.size())
        return ErrorCode::SeekError;

    _offset = _data.size() + offset;
    return ErrorCode::NoError;
}

std::size_t MemoryVFile::doTell() const { return _offset; }

std::size_t MemoryVFile::doByteCount() const { return _data.size(); }

void MemoryVFile::doClose() {
    _storage = nullptr;
    _data = nullptr;
    _offset = 0;
    _open = false;
}

}
