#ifndef Texpack_ImageFormat_h
#define Texpack_ImageFormat_h
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
 * @brief Class @ref Texpack::ImageFormat, function @ref Texpack::blockByteSize(), @ref Texpack::blockPixelCount(), @ref Texpack::canDecodeToF32(), @ref Texpack::canEncodeFromF32(), @ref Texpack::decodePixelsToF32(), @ref Texpack::encodePixelsFromF32(), @ref Texpack::imageFormatFromGl()
 */

#include <Corrade/Containers/ArrayView.h>
#include <Magnum/PixelFormat.h>

#include "Texpack/Texpack.h"
#include "Texpack/visibility.h"

namespace Texpack {

/**
@brief Pixel format

Either an uncompressed @ref Magnum::PixelFormat or a block-compressed
@ref Magnum::CompressedPixelFormat. A default-constructed instance is an
invalid format, used to signal a format that couldn't be resolved.
*/
class ImageFormat {
    public:
        /** @brief Construct an invalid format */
        constexpr /*implicit*/ ImageFormat() noexcept: _value{}, _compressed{} {}

        /** @brief Construct from an uncompressed format */
        constexpr /*implicit*/ ImageFormat(PixelFormat format) noexcept: _value{UnsignedInt(format)}, _compressed{false} {}

        /** @brief Construct from a compressed format */
        constexpr /*implicit*/ ImageFormat(CompressedPixelFormat format) noexcept: _value{UnsignedInt(format)}, _compressed{true} {}

        /**
         * @brief Construct from a raw value
         *
         * Used when deserializing image records.
         * @see @ref value(), @ref isCompressed()
         */
        static constexpr ImageFormat fromValue(UnsignedInt value, bool compressed) {
            return ImageFormat{value, compressed};
        }

        /** @brief Whether the format is valid */
        constexpr explicit operator bool() const { return _value; }

        /** @brief Whether the format is block-compressed */
        constexpr bool isCompressed() const { return _compressed; }

        /**
         * @brief Uncompressed format
         *
         * Expects that the format is not compressed.
         */
        PixelFormat uncompressed() const;

        /**
         * @brief Compressed format
         *
         * Expects that the format is compressed.
         */
        CompressedPixelFormat compressed() const;

        /** @brief Raw enum value */
        constexpr UnsignedInt value() const { return _value; }

        constexpr bool operator==(const ImageFormat& other) const {
            return _value == other._value && _compressed == other._compressed;
        }

        constexpr bool operator!=(const ImageFormat& other) const {
            return !operator==(other);
        }

    private:
        constexpr explicit ImageFormat(UnsignedInt value, bool compressed) noexcept: _value{value}, _compressed{compressed} {}

        UnsignedInt _value;
        bool _compressed;
};

/** @debugoperator{ImageFormat} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, const ImageFormat& value);

/**
@brief Size of a single block in bytes

For uncompressed formats a block is one pixel and this is the pixel size, for
compressed formats it's the size of one compressed block. Expects that the
format is valid.
*/
TEXPACK_EXPORT UnsignedInt blockByteSize(const ImageFormat& format);

/**
@brief Count of pixels in a single block

@cpp 1 @ce for uncompressed formats, product of the block dimensions for
compressed formats. Expects that the format is valid.
*/
TEXPACK_EXPORT UnsignedInt blockPixelCount(const ImageFormat& format);

/**
@brief Block dimensions

@cpp {1, 1, 1} @ce for uncompressed formats.
*/
TEXPACK_EXPORT Vector3i blockSize(const ImageFormat& format);

/**
@brief Whether pixels in given format can be decoded to floats

Supported are all one- to four-channel 8-, 16- and 32-bit normalized,
integer, half-float and float formats and four-channel and three-channel
sRGB formats. Compressed formats can't be decoded.
*/
TEXPACK_EXPORT bool canDecodeToF32(const ImageFormat& format);

/**
@brief Whether pixels in given format can be encoded from floats

Same set as @ref canDecodeToF32().
*/
TEXPACK_EXPORT bool canEncodeFromF32(const ImageFormat& format);

/**
@brief Decode pixels to floats

Decodes @cpp out.size() @ce pixels from @p in, which is expected to be
large enough. Channels missing in the format are set to @cpp 0.0f @ce,
missing alpha to @cpp 1.0f @ce. Normalized formats are unpacked to the
@f$ [0, 1] @f$ or @f$ [-1, 1] @f$ range, integer formats converted as-is.
Expects that @ref canDecodeToF32() is @cpp true @ce for @p format.
*/
TEXPACK_EXPORT void decodePixelsToF32(const ImageFormat& format, Containers::ArrayView<const char> in, Containers::ArrayView<Vector4> out);

/**
@brief Encode pixels from floats

Encodes @cpp in.size() @ce pixels to @p out, which is expected to be large
enough. Channels not present in the format are ignored, values outside of the
representable range are clamped. Expects that @ref canEncodeFromF32() is
@cpp true @ce for @p format.
*/
TEXPACK_EXPORT void encodePixelsFromF32(const ImageFormat& format, Containers::ArrayView<const Vector4> in, Containers::ArrayView<char> out);

/**
@brief Resolve an OpenGL format triple

Returns the format matching given OpenGL pixel type, pixel format and
internal format as stored in KTX files, or an invalid format if there's no
match. Compressed formats are matched only by @p glInternalFormat.
*/
TEXPACK_EXPORT ImageFormat imageFormatFromGl(UnsignedInt glType, UnsignedInt glFormat, UnsignedInt glInternalFormat);

}

#endif
