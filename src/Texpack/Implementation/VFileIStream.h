#ifndef Texpack_Implementation_VFileIStream_h
#define Texpack_Implementation_VFileIStream_h
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

#include <cstdint>

/* OpenEXR as a CMake subproject adds the OpenEXR/ directory to include path
   but not the parent directory, so we can't #include <OpenEXR/blah>. Same is
   done for an external OpenEXR for consistency. */
#include <IexBaseExc.h>
#include <ImfIO.h>

#include "Texpack/VFile.h"

namespace Texpack { namespace Implementation {

/* OpenEXR input stream reading from a VFile. Positions are relative to where
   the file was when the stream got constructed, the VFile is seeked only when
   OpenEXR jumps around. */
class VFileIStream: public Imf::IStream {
    public:
        explicit VFileIStream(VFile& file): Imf::IStream{""}, _file(file), _start{file.tell()}, _size{file.byteCount() > _start ? file.byteCount() - _start : 0}, _position{} {}

        bool read(char c[], const int n) override {
            if(_position + n > _size)
                throw Iex::InputExc{"Reading past end of file."};

            /* Raw tile data queries call this with a null pointer just to
               advance the position */
            if(c && n) {
                if(_file.tell() != _start + _position && _file.seekFromStart(_start + _position) != ErrorCode::NoError)
                    throw Iex::InputExc{"Can't seek in the file."};
                if(_file.read({c, std::size_t(n)}) != ErrorCode::NoError)
                    throw Iex::InputExc{"Can't read from the file."};
            }

            _position += n;
            return _position < _size;
        }

        /* Imath::Int64 in 2.5 and older is unsigned as well */
        std::uint64_t tellg() override { return _position; }
        void seekg(const std::uint64_t pos) override { _position = pos; }

    private:
        VFile& _file;
        std::uint64_t _start, _size, _position;
};

}}

#endif
