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

/*
    _u() -- uncompressed format, (sized internal format, type, PixelFormat)
    _l() -- uncompressed format with an unsized internal format, (format,
            type, PixelFormat)
    _c() -- compressed format, (internal format, CompressedPixelFormat)
*/
#ifdef _u
_u(GL_R8,               GL_UNSIGNED_BYTE,   R8Unorm)
_u(GL_RG8,              GL_UNSIGNED_BYTE,   RG8Unorm)
_u(GL_RGB8,             GL_UNSIGNED_BYTE,   RGB8Unorm)
_u(GL_RGBA8,            GL_UNSIGNED_BYTE,   RGBA8Unorm)
_u(GL_R8_SNORM,         GL_BYTE,            R8Snorm)
_u(GL_RG8_SNORM,        GL_BYTE,            RG8Snorm)
_u(GL_RGB8_SNORM,       GL_BYTE,            RGB8Snorm)
_u(GL_RGBA8_SNORM,      GL_BYTE,            RGBA8Snorm)
_u(GL_SRGB8,            GL_UNSIGNED_BYTE,   RGB8Srgb)
_u(GL_SRGB8_ALPHA8,     GL_UNSIGNED_BYTE,   RGBA8Srgb)
_u(GL_R8UI,             GL_UNSIGNED_BYTE,   R8UI)
_u(GL_RG8UI,            GL_UNSIGNED_BYTE,   RG8UI)
_u(GL_RGB8UI,           GL_UNSIGNED_BYTE,   RGB8UI)
_u(GL_RGBA8UI,          GL_UNSIGNED_BYTE,   RGBA8UI)
_u(GL_R8I,              GL_BYTE,            R8I)
_u(GL_RG8I,             GL_BYTE,            RG8I)
_u(GL_RGB8I,            GL_BYTE,            RGB8I)
_u(GL_RGBA8I,           GL_BYTE,            RGBA8I)
_u(GL_R16,              GL_UNSIGNED_SHORT,  R16Unorm)
_u(GL_RG16,             GL_UNSIGNED_SHORT,  RG16Unorm)
_u(GL_RGB16,            GL_UNSIGNED_SHORT,  RGB16Unorm)
_u(GL_RGBA16,           GL_UNSIGNED_SHORT,  RGBA16Unorm)
_u(GL_R16_SNORM,        GL_SHORT,           R16Snorm)
_u(GL_RG16_SNORM,       GL_SHORT,           RG16Snorm)
_u(GL_RGB16_SNORM,      GL_SHORT,           RGB16Snorm)
_u(GL_RGBA16_SNORM,     GL_SHORT,           RGBA16Snorm)
_u(GL_R16UI,            GL_UNSIGNED_SHORT,  R16UI)
_u(GL_RG16UI,           GL_UNSIGNED_SHORT,  RG16UI)
_u(GL_RGB16UI,          GL_UNSIGNED_SHORT,  RGB16UI)
_u(GL_RGBA16UI,         GL_UNSIGNED_SHORT,  RGBA16UI)
_u(GL_R16I,             GL_SHORT,           R16I)
_u(GL_RG16I,            GL_SHORT,           RG16I)
_u(GL_RGB16I,           GL_SHORT,           RGB16I)
_u(GL_RGBA16I,          GL_SHORT,           RGBA16I)
_u(GL_R16F,             GL_HALF_FLOAT,      R16F)
_u(GL_RG16F,            GL_HALF_FLOAT,      RG16F)
_u(GL_RGB16F,           GL_HALF_FLOAT,      RGB16F)
_u(GL_RGBA16F,          GL_HALF_FLOAT,      RGBA16F)
_u(GL_R32UI,            GL_UNSIGNED_INT,    R32UI)
_u(GL_RG32UI,           GL_UNSIGNED_INT,    RG32UI)
_u(GL_RGB32UI,          GL_UNSIGNED_INT,    RGB32UI)
_u(GL_RGBA32UI,         GL_UNSIGNED_INT,    RGBA32UI)
_u(GL_R32I,             GL_INT,             R32I)
_u(GL_RG32I,            GL_INT,             RG32I)
_u(GL_RGB32I,           GL_INT,             RGB32I)
_u(GL_RGBA32I,          GL_INT,             RGBA32I)
_u(GL_R32F,             GL_FLOAT,           R32F)
_u(GL_RG32F,            GL_FLOAT,           RG32F)
_u(GL_RGB32F,           GL_FLOAT,           RGB32F)
_u(GL_RGBA32F,          GL_FLOAT,           RGBA32F)
#endif
#ifdef _l
_l(GL_RED,              GL_UNSIGNED_BYTE,   R8Unorm)
_l(GL_RG,               GL_UNSIGNED_BYTE,   RG8Unorm)
_l(GL_RGB,              GL_UNSIGNED_BYTE,   RGB8Unorm)
_l(GL_RGBA,             GL_UNSIGNED_BYTE,   RGBA8Unorm)
_l(GL_RED,              GL_UNSIGNED_SHORT,  R16Unorm)
_l(GL_RG,               GL_UNSIGNED_SHORT,  RG16Unorm)
_l(GL_RGB,              GL_UNSIGNED_SHORT,  RGB16Unorm)
_l(GL_RGBA,             GL_UNSIGNED_SHORT,  RGBA16Unorm)
_l(GL_RED,              GL_HALF_FLOAT,      R16F)
_l(GL_RG,               GL_HALF_FLOAT,      RG16F)
_l(GL_RGB,              GL_HALF_FLOAT,      RGB16F)
_l(GL_RGBA,             GL_HALF_FLOAT,      RGBA16F)
_l(GL_RED,              GL_FLOAT,           R32F)
_l(GL_RG,               GL_FLOAT,           RG32F)
_l(GL_RGB,              GL_FLOAT,           RGB32F)
_l(GL_RGBA,             GL_FLOAT,           RGBA32F)
_l(GL_RED_INTEGER,      GL_UNSIGNED_BYTE,   R8UI)
_l(GL_RG_INTEGER,       GL_UNSIGNED_BYTE,   RG8UI)
_l(GL_RGB_INTEGER,      GL_UNSIGNED_BYTE,   RGB8UI)
_l(GL_RGBA_INTEGER,     GL_UNSIGNED_BYTE,   RGBA8UI)
_l(GL_RED_INTEGER,      GL_UNSIGNED_INT,    R32UI)
_l(GL_RG_INTEGER,       GL_UNSIGNED_INT,    RG32UI)
_l(GL_RGB_INTEGER,      GL_UNSIGNED_INT,    RGB32UI)
_l(GL_RGBA_INTEGER,     GL_UNSIGNED_INT,    RGBA32UI)
#endif
#ifdef _c
_c(GL_COMPRESSED_RGB_S3TC_DXT1_EXT,                 Bc1RGBUnorm)
_c(GL_COMPRESSED_SRGB_S3TC_DXT1_EXT,                Bc1RGBSrgb)
_c(GL_COMPRESSED_RGBA_S3TC_DXT1_EXT,                Bc1RGBAUnorm)
_c(GL_COMPRESSED_SRGB_ALPHA_S3TC_DXT1_EXT,          Bc1RGBASrgb)
_c(GL_COMPRESSED_RGBA_S3TC_DXT3_EXT,                Bc2RGBAUnorm)
_c(GL_COMPRESSED_SRGB_ALPHA_S3TC_DXT3_EXT,          Bc2RGBASrgb)
_c(GL_COMPRESSED_RGBA_S3TC_DXT5_EXT,                Bc3RGBAUnorm)
_c(GL_COMPRESSED_SRGB_ALPHA_S3TC_DXT5_EXT,          Bc3RGBASrgb)
_c(GL_COMPRESSED_RED_RGTC1,                         Bc4RUnorm)
_c(GL_COMPRESSED_SIGNED_RED_RGTC1,                  Bc4RSnorm)
_c(GL_COMPRESSED_RG_RGTC2,                          Bc5RGUnorm)
_c(GL_COMPRESSED_SIGNED_RG_RGTC2,                   Bc5RGSnorm)
_c(GL_COMPRESSED_RGB_BPTC_UNSIGNED_FLOAT,           Bc6hRGBUfloat)
_c(GL_COMPRESSED_RGB_BPTC_SIGNED_FLOAT,             Bc6hRGBSfloat)
_c(GL_COMPRESSED_RGBA_BPTC_UNORM,                   Bc7RGBAUnorm)
_c(GL_COMPRESSED_SRGB_ALPHA_BPTC_UNORM,             Bc7RGBASrgb)
_c(GL_COMPRESSED_R11_EAC,                           EacR11Unorm)
_c(GL_COMPRESSED_SIGNED_R11_EAC,                    EacR11Snorm)
_c(GL_COMPRESSED_RG11_EAC,                          EacRG11Unorm)
_c(GL_COMPRESSED_SIGNED_RG11_EAC,                   EacRG11Snorm)
_c(GL_ETC1_RGB8_OES,                                Etc2RGB8Unorm) /* ETC1 is a subset of ETC2 */
_c(GL_COMPRESSED_RGB8_ETC2,                         Etc2RGB8Unorm)
_c(GL_COMPRESSED_SRGB8_ETC2,                        Etc2RGB8Srgb)
_c(GL_COMPRESSED_RGB8_PUNCHTHROUGH_ALPHA1_ETC2,     Etc2RGB8A1Unorm)
_c(GL_COMPRESSED_SRGB8_PUNCHTHROUGH_ALPHA1_ETC2,    Etc2RGB8A1Srgb)
_c(GL_COMPRESSED_RGBA8_ETC2_EAC,                    Etc2RGBA8Unorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ETC2_EAC,             Etc2RGBA8Srgb)
_c(GL_COMPRESSED_RGBA_ASTC_4x4_KHR,                 Astc4x4RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_4x4_KHR,         Astc4x4RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_5x4_KHR,                 Astc5x4RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_5x4_KHR,         Astc5x4RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_5x5_KHR,                 Astc5x5RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_5x5_KHR,         Astc5x5RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_6x5_KHR,                 Astc6x5RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_6x5_KHR,         Astc6x5RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_6x6_KHR,                 Astc6x6RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_6x6_KHR,         Astc6x6RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_8x5_KHR,                 Astc8x5RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_8x5_KHR,         Astc8x5RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_8x6_KHR,                 Astc8x6RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_8x6_KHR,         Astc8x6RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_8x8_KHR,                 Astc8x8RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_8x8_KHR,         Astc8x8RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_10x5_KHR,                Astc10x5RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x5_KHR,        Astc10x5RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_10x6_KHR,                Astc10x6RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x6_KHR,        Astc10x6RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_10x8_KHR,                Astc10x8RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x8_KHR,        Astc10x8RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_10x10_KHR,               Astc10x10RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_10x10_KHR,       Astc10x10RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_12x10_KHR,               Astc12x10RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_12x10_KHR,       Astc12x10RGBASrgb)
_c(GL_COMPRESSED_RGBA_ASTC_12x12_KHR,               Astc12x12RGBAUnorm)
_c(GL_COMPRESSED_SRGB8_ALPHA8_ASTC_12x12_KHR,       Astc12x12RGBASrgb)
#endif
