#ifndef Texpack_Implementation_ImageLayout_h
#define Texpack_Implementation_ImageLayout_h
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

#include <cstddef>

#include "Texpack/Texpack.h"

/* Binary layout of image records, shared by Image and ImageExtension. Fields
   are in machine endianness, records are meant for in-memory use only.

    +--------------+-------------------+------------------------------------+
    | ImageHeader  | data, padded to 8 | extension block, if any            |
    +--------------+-------------------+------------------------------------+

   The extension block is an ExtensionBlockHeader, followed by one UnsignedInt
   offset per extension padded to 8 bytes and the payload. Offsets are relative
   to the payload start, each extension starts with an ExtensionHeader and is
   padded to 8 bytes. Every record is thus a multiple of 8 bytes and the next
   record in a chain starts right after it. */

namespace Texpack { namespace Implementation {

struct ImageHeader {
    UnsignedInt width;
    UnsignedInt height;
    UnsignedShort depth;
    UnsignedShort slices;
    UnsignedInt format;         /* PixelFormat or CompressedPixelFormat */
    UnsignedByte compressed;    /* Whether format is compressed */
    UnsignedByte usage;         /* UsageHint */
    UnsignedByte layerType;     /* LayerType */
    UnsignedByte flags;         /* ImageFlags */
    UnsignedInt reserved;
};

static_assert(sizeof(ImageHeader) == 24,
    "Improper size of ImageHeader struct");

struct ExtensionBlockHeader {
    UnsignedInt count;
    UnsignedInt payloadSize;
};

static_assert(sizeof(ExtensionBlockHeader) == 8,
    "Improper size of ExtensionBlockHeader struct");

struct ExtensionHeader {
    char tag[4];
    UnsignedInt size;           /* Including this header */
};

static_assert(sizeof(ExtensionHeader) == 8,
    "Improper size of ExtensionHeader struct");

constexpr std::size_t ImageAlignment = 8;

constexpr std::size_t alignImage(std::size_t size) {
    return (size + ImageAlignment - 1)/ImageAlignment*ImageAlignment;
}

/* Size of the block header and the offset table, i.e. where the payload
   starts */
constexpr std::size_t extensionBlockPrefixSize(std::size_t count) {
    return sizeof(ExtensionBlockHeader) + alignImage(count*sizeof(UnsignedInt));
}

}}

#endif
