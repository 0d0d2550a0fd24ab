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

#include "ErrorCode.h"

#include <Corrade/Utility/Debug.h>

namespace Texpack {

Debug& operator<<(Debug& debug, const ErrorCode value) {
    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case ErrorCode::value: return debug << "Texpack::ErrorCode::" #value;
        _c(NoError)
        _c(InitError)
        _c(ReadError)
        _c(WriteError)
        _c(SeekError)
        _c(NotValidError)
        _c(UnsupportedError)
        _c(MipMapError)
        _c(BadVersionError)
        _c(BadHeaderError)
        _c(BadImageError)
        _c(UnknownFormatError)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "Texpack::ErrorCode(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

}
