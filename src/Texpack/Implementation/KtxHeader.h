#ifndef Texpack_Implementation_KtxHeader_h
#define Texpack_Implementation_KtxHeader_h
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

/* Used by KtxLoader and by the GL format mapping in ImageFormat.cpp, which is
   why it isn't directly inside KtxLoader.cpp. OTOH it doesn't need to be
   exposed publicly, which is why it has no docblocks. */

namespace Texpack { namespace Implementation {

/* Selected OpenGL pixel types. UnsignedInt instead of enums to allow
   arbitrary numeric values from glFormatMapping.hpp in comparisons. */
enum: UnsignedInt {
    GL_BYTE = 0x1400,
    GL_UNSIGNED_BYTE = 0x1401,
    GL_SHORT = 0x1402,
    GL_UNSIGNED_SHORT = 0x1403,
    GL_INT = 0x1404,
    GL_UNSIGNED_INT = 0x1405,
    GL_FLOAT = 0x1406,
    GL_HALF_FLOAT = 0x140B
};

/* Pixel formats, also used as unsized internal formats */
enum: UnsignedInt {
    GL_RED = 0x1903,
    GL_RGB = 0x1907,
    GL_RGBA = 0x1908,
    GL_RG = 0x8227,
    GL_RG_INTEGER = 0x8228,
    GL_RED_INTEGER = 0x8D94,
    GL_RGB_INTEGER = 0x8D98,
    GL_RGBA_INTEGER = 0x8D99
};

/* Sized internal formats */
enum: UnsignedInt {
    GL_RGB8 = 0x8051,
    GL_RGB16 = 0x8054,
    GL_RGBA8 = 0x8058,
    GL_RGBA16 = 0x805B,
    GL_R8 = 0x8229,
    GL_R16 = 0x822A,
    GL_RG8 = 0x822B,
    GL_RG16 = 0x822C,
    GL_R16F = 0x822D,
    GL_R32F = 0x822E,
    GL_RG16F = 0x822F,
    GL_RG32F = 0x8230,
    GL_R8I = 0x8231,
    GL_R8UI = 0x8232,
    GL_R16I = 0x8233,
    GL_R16UI = 0x8234,
    GL_R32I = 0x8235,
    GL_R32UI = 0x8236,
    GL_RG8I = 0x8237,
    GL_RG8UI = 0x8238,
    GL_RG16I = 0x8239,
    GL_RG16UI = 0x823A,
    GL_RG32I = 0x823B,
    GL_RG32UI = 0x823C,
    GL_RGBA32F = 0x8814,
    GL_RGB32F = 0x8815,
    GL_RGBA16F = 0x881A,
    GL_RGB16F = 0x881B,
    GL_SRGB8 = 0x8C41,
    GL_SRGB8_ALPHA8 = 0x8C43,
    GL_RGBA32UI = 0x8D70,
    GL_RGB32UI = 0x8D71,
    GL_RGBA16UI = 0x8D76,
    GL_RGB16UI = 0x8D77,
    GL_RGBA8UI = 0x8D7C,
    GL_RGB8UI = 0x8D7D,
    GL_RGBA32I = 0x8D82,
    GL_RGB32I = 0x8D83,
    GL_RGBA16I = 0x8D88,
    GL_RGB16I = 0x8D89,
    GL_RGBA8I = 0x8D8E,
    GL_RGB8I = 0x8D8F,
    GL_R8_SNORM = 0x8F94,
    GL_RG8_SNORM = 0x8F95,
    GL_RGB8_SNORM = 0x8F96,
    GL_RGBA8_SNORM = 0x8F97,
    GL_R16_SNORM = 0x8F98,
    GL_RG16_SNORM = 0x8F99,
    GL_RGB16_SNORM = 0x8F9A,
    GL_RGBA16_SNORM = 0x8F9B
};

/* Compressed internal formats */
enum: UnsignedInt {
    GL_COMPRESSED_RGB_S3TC_DXT1_EXT = 0x83F0,
    GL_COMPRESSED_RGBA_S3TC_DXT1_EXT = 0x83F1,
    GL_COMPRESSED_RGBA_S3TC_DXT3_EXT = 0x83F2,
    GL_COMPRESSED_RGBA_S3TC_DXT5_EXT = 0x83F3,
    GL_COMPRESSED_SRGB_S3TC_DXT1_EXT = 0x8C4C,
    GL_COMPRESSED_SRGB_ALPHA_S3TC_DXT1_EXT = 0x8C4D,
    GL_COMPRESSED_SRGB_ALPHA_S3TC_DXT3_EXT = 0x8C4E,
    GL_COMPRESSED_SRGB_ALPHA_S3TC_DXT5_EXT = 0x8C4F,
    GL_ETC1_RGB8_OES = 0x8D64,
    GL_COMPRESSED_RED_RGTC1 = 0x8DBB,
    GL_COMPRESSED_SIGNED_RED_RGTC1 = 0x8DBC,
    GL_COMPRESSED_RG_RGTC2 = 0x8DBD,
    GL_COMPRESSED_SIGNED_RG_RGTC2 = 0x8DBE,
    GL_COMPRESSED_RGBA_BPTC_UNORM = 0x8E8C,
    GL_COMPRESSED_SRGB_ALPHA_BPTC_UNORM = 0x8E8D,
    GL_COMPRESSED_RGB_BPTC_SIGNED_FLOAT = 0x8E8E,
    GL_COMPRESSED_RGB_BPTC_UNSIGNED_FLOAT = 0x8E8F,
    GL_COMPRESSED_R11_EAC = 0x9270,
    GL_COMPRESSED_SIGNED_R11_EAC = 0x9271,
    GL_COMPRESSED_RG11_EAC = 0x9272,
    GL_COMPRESSED_SIGNED_RG11_EAC = 0x9273,
    GL_COMPRESSED_RGB8_ETC2 = 0x9274,
    GL_COMPRESSED_SRGB8_ETC2 = 0x9275,
    GL_COMPRESSED_RGB8_PUNCHTHROUGH_ALPHA1_ETC2 = 0x9276,
    GL_COMPRESSED_SRGB8_PUNCHTHROUGH_ALPHA1_ETC2 = 0x9277,
    GL_COMPRESSED_RGBA8_ETC2_EAC = 0x9278,
    GL_COMPRESSED_SRGB8_ALPHA8_ETC2_EAC = 0x9279,
    GL_COMPRESSED_RGBA_ASTC_4x4_KHR = 0x93B0,
    GL_COMPRESSED_RGBA_ASTC_5x4_KHR = 0x93B1,
    GL_COMPRESSED_RGBA_ASTC_5x5_KHR = 0x93B2,
    GL_COMPRESSED_RGBA_ASTC_6x5_KHR = 0x93B3,
    GL_COMPRESSED_RGBA_ASTC_6x6_KHR = 0x93B4,
    GL_COMPRESSED_RGBA_ASTC_8x5_KHR = 0x93B5,
    GL_COMPRESSED_RGBA_ASTC_8x6_KHR = 0x93B6,
    GL_COMPRESSED_RGBA_ASTC_8x8_KHR = 0x93B7,
    GL_COMPRESSED_RGBA_ASTC_10x5_KHR = 0x93B8,
    GL_COMPRESSED_RGBA_ASTC_10x6_KHR = 0x93B9,
    GL_COMPRESSED_RGBA_ASTC_10x8_KHR = 0x93BA,
    GL_COMPRESSED_RGBA_ASTC_10x10_KHR = 0x93BB,
    GL_COMPRESSED_RGBA_ASTC_12x10_KHR = 0x93BC,
    GL_COMPRESSED_RGBA_ASTC_12x12_KHR = 0x93BD,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_4x4_KHR = 0x93D0,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_5x4_KHR = 0x93D1,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_5x5_KHR = 0x93D2,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_6x5_KHR = 0x93D3,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_6x6_KHR = 0x93D4,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_8x5_KHR = 0x93D5,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_8x6_KHR = 0x93D6,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_8x8_KHR = 0x93D7,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x5_KHR = 0x93D8,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x6_KHR = 0x93D9,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x8_KHR = 0x93DA,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x10_KHR = 0x93DB,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_12x10_KHR = 0x93DC,
    GL_COMPRESSED_SRGB8_ALPHA8_ASTC_12x12_KHR = 0x93DD
};

/* KTX 1.1 file header. All fields are in the endianness of the writer,
   detectable from the endianness field. */
struct KtxHeader {
    char        identifier[12];         /* File identifier */
    UnsignedInt endianness;             /* 0x04030201 in writer endianness */
    UnsignedInt glType;                 /* Pixel type, 0 for compressed */
    UnsignedInt glTypeSize;             /* Size of the pixel type for swapping */
    UnsignedInt glFormat;               /* Pixel format, 0 for compressed */
    UnsignedInt glInternalFormat;       /* Sized or compressed internal format */
    UnsignedInt glBaseInternalFormat;   /* Base internal format */
    UnsignedInt pixelWidth;
    UnsignedInt pixelHeight;            /* 0 for 1D textures */
    UnsignedInt pixelDepth;             /* 0 for 1D and 2D textures */
    UnsignedInt numberOfArrayElements;  /* 0 if not an array */
    UnsignedInt numberOfFaces;          /* 6 for cube maps, 1 otherwise */
    UnsignedInt numberOfMipmapLevels;   /* 0 means generate mips at load */
    UnsignedInt bytesOfKeyValueData;
};

static_assert(sizeof(KtxHeader) == 64,
    "Improper size of KtxHeader struct");

constexpr char KtxFileIdentifier[12]{
    /* https://registry.khronos.org/KTX/specs/1.0/ktxspec_v1.html */
    '\xab', 'K', 'T', 'X', ' ', '1', '1', '\xbb', '\r', '\n', '\x1a', '\n'
};

static_assert(sizeof(KtxFileIdentifier) == sizeof(KtxHeader::identifier),
    "Improper size of KtxFileIdentifier data");

enum: UnsignedInt {
    KtxEndianness = 0x04030201,
    KtxEndiannessSwapped = 0x01020304
};

/* Image data and key/value pairs are padded to four bytes */
constexpr std::size_t KtxAlignment = 4;

}}

#endif
