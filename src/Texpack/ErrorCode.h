#ifndef Texpack_ErrorCode_h
#define Texpack_ErrorCode_h
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
 * @brief Enum @ref Texpack::ErrorCode
 */

#include "Texpack/Texpack.h"
#include "Texpack/visibility.h"

namespace Texpack {

/**
@brief Error code

Returned from every fallible operation of the library. The details are
printed to @ref Corrade::Utility::Error at the point of failure where
available.
*/
enum class ErrorCode: UnsignedByte {
    NoError = 0,            /**< Success */

    /* Byte sources */
    InitError,              /**< File couldn't be opened or created */
    ReadError,              /**< Read failed or the source was too short */
    WriteError,             /**< Write failed or the buffer can't grow */
    SeekError,              /**< Seek target out of bounds */

    /* KTX */
    NotValidError,          /**< Header missing or invalid */
    UnsupportedError,       /**< Format or layout not supported */
    MipMapError,            /**< Mip level out of range or truncated */

    /* OpenEXR */
    BadVersionError,        /**< Not an OpenEXR file or unknown version */
    BadHeaderError,         /**< OpenEXR header couldn't be parsed */
    BadImageError,          /**< OpenEXR pixel data couldn't be read */

    /* Importer */
    UnknownFormatError      /**< File format not recognized */
};

/** @debugoperatorenum{ErrorCode} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, ErrorCode value);

}

#endif
