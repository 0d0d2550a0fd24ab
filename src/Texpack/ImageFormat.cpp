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

#include "ImageFormat.h"

#include <cstring>
#include <limits>
#include <type_traits>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Magnum/Math/Color.h>
#include <Magnum/Math/Functions.h>
#include <Magnum/Math/Half.h>
#include <Magnum/Math/Packing.h>
#include <Magnum/Math/Vector4.h>

#include "Texpack/Implementation/KtxHeader.h"

namespace Texpack {

PixelFormat ImageFormat::uncompressed() const {
    CORRADE_ASSERT(!_compressed,
        "Texpack::ImageFormat::uncompressed(): the format is compressed", {});
    return PixelFormat(_value);
}

CompressedPixelFormat ImageFormat::compressed() const {
    CORRADE_ASSERT(_compressed,
        "Texpack::ImageFormat::compressed(): the format is not compressed", {});
    return CompressedPixelFormat(_value);
}

Debug& operator<<(Debug& debug, const ImageFormat& value) {
    if(!value) return debug << "Texpack::ImageFormat{}";
    if(value.isCompressed()) return debug << value.compressed();
    return debug << value.uncompressed();
}

UnsignedInt blockByteSize(const ImageFormat& format) {
    CORRADE_ASSERT(format, "Texpack::blockByteSize(): invalid format", {});
    return format.isCompressed() ?
        compressedBlockDataSize(format.compressed()) :
        pixelSize(format.uncompressed());
}

UnsignedInt blockPixelCount(const ImageFormat& format) {
    CORRADE_ASSERT(format, "Texpack::blockPixelCount(): invalid format", {});
    return format.isCompressed() ? compressedBlockSize(format.compressed()).product() : 1;
}

Vector3i blockSize(const ImageFormat& format) {
    CORRADE_ASSERT(format, "Texpack::blockSize(): invalid format", {});
    return format.isCompressed() ? compressedBlockSize(format.compressed()) : Vector3i{1};
}

namespace {

/* Unaligned load and store of a whole pixel */
template<std::size_t channels, class T> inline Math::Vector<channels, T> load(const char* const data) {
    Math::Vector<channels, T> out{NoInit};
    std::memcpy(out.data(), data, sizeof(out));
    return out;
}

template<std::size_t channels, class T> inline void store(char* const data, const Math::Vector<channels, T>& value) {
    std::memcpy(data, value.data(), sizeof(value));
}

template<std::size_t channels> inline Vector4 expand(const Math::Vector<channels, Float>& value) {
    Vector4 out{0.0f, 0.0f, 0.0f, 1.0f};
    for(std::size_t i = 0; i != channels; ++i) out[i] = value[i];
    return out;
}

template<std::size_t channels> inline Math::Vector<channels, Float> shrink(const Vector4& value) {
    Math::Vector<channels, Float> out{NoInit};
    for(std::size_t i = 0; i != channels; ++i) out[i] = value[i];
    return out;
}

template<std::size_t channels, class T> void decodeNormalized(Containers::ArrayView<const char> in, Containers::ArrayView<Vector4> out) {
    for(std::size_t i = 0; i != out.size(); ++i)
        out[i] = expand(Math::unpack<Math::Vector<channels, Float>>(load<channels, T>(in + i*channels*sizeof(T))));
}

template<std::size_t channels, class T> void encodeNormalized(Containers::ArrayView<const Vector4> in, Containers::ArrayView<char> out) {
    /* Signed types clamp to [-1, 1], unsigned to [0, 1] */
    constexpr Float min = T(-1) < T(0) ? -1.0f : 0.0f;
    for(std::size_t i = 0; i != in.size(); ++i)
        store(out + i*channels*sizeof(T), Math::pack<Math::Vector<channels, T>>(Math::clamp(shrink<channels>(in[i]), min, 1.0f)));
}

/* Integer and float formats are converted without any scaling. Integer
   targets are clamped to the type range in double precision, which
   represents all 32-bit values exactly. */
template<class T> inline typename std::enable_if<std::is_integral<T>::value, T>::type castClamped(const Float value) {
    return T(Math::clamp(Double(value), Double(std::numeric_limits<T>::min()), Double(std::numeric_limits<T>::max())));
}

template<class T> inline typename std::enable_if<std::is_floating_point<T>::value, T>::type castClamped(const Float value) {
    return value;
}

template<std::size_t channels, class T> void decodeCast(Containers::ArrayView<const char> in, Containers::ArrayView<Vector4> out) {
    for(std::size_t i = 0; i != out.size(); ++i)
        out[i] = expand(Math::Vector<channels, Float>{load<channels, T>(in + i*channels*sizeof(T))});
}

template<std::size_t channels, class T> void encodeCast(Containers::ArrayView<const Vector4> in, Containers::ArrayView<char> out) {
    for(std::size_t i = 0; i != in.size(); ++i) {
        Math::Vector<channels, T> value{NoInit};
        for(std::size_t c = 0; c != channels; ++c)
            value[c] = castClamped<T>(in[i][c]);
        store(out + i*channels*sizeof(T), value);
    }
}

template<std::size_t channels> void decodeHalf(Containers::ArrayView<const char> in, Containers::ArrayView<Vector4> out) {
    for(std::size_t i = 0; i != out.size(); ++i)
        out[i] = expand(Math::unpackHalf(load<channels, UnsignedShort>(in + i*channels*2)));
}

template<std::size_t channels> void encodeHalf(Containers::ArrayView<const Vector4> in, Containers::ArrayView<char> out) {
    for(std::size_t i = 0; i != in.size(); ++i)
        store(out + i*channels*2, Math::packHalf(shrink<channels>(in[i])));
}

void decodeSrgb(Containers::ArrayView<const char> in, Containers::ArrayView<Vector4> out) {
    for(std::size_t i = 0; i != out.size(); ++i)
        out[i] = Vector4{Color3::fromSrgb(Math::Vector3<UnsignedByte>{load<3, UnsignedByte>(in + i*3)}), 1.0f};
}

void encodeSrgb(Containers::ArrayView<const Vector4> in, Containers::ArrayView<char> out) {
    for(std::size_t i = 0; i != in.size(); ++i)
        store<3, UnsignedByte>(out + i*3, Color3{Math::clamp(in[i].xyz(), 0.0f, 1.0f)}.toSrgb<UnsignedByte>());
}

void decodeSrgbAlpha(Containers::ArrayView<const char> in, Containers::ArrayView<Vector4> out) {
    for(std::size_t i = 0; i != out.size(); ++i)
        out[i] = Color4::fromSrgbAlpha(Math::Vector4<UnsignedByte>{load<4, UnsignedByte>(in + i*4)});
}

void encodeSrgbAlpha(Containers::ArrayView<const Vector4> in, Containers::ArrayView<char> out) {
    for(std::size_t i = 0; i != in.size(); ++i)
        store<4, UnsignedByte>(out + i*4, Color4{Math::clamp(in[i], 0.0f, 1.0f)}.toSrgbAlpha<UnsignedByte>());
}

typedef void(*Decoder)(Containers::ArrayView<const char>, Containers::ArrayView<Vector4>);
typedef void(*Encoder)(Containers::ArrayView<const Vector4>, Containers::ArrayView<char>);

struct Codec {
    Decoder decode;
    Encoder encode;
};

Codec codecFor(const ImageFormat& format) {
    if(!format || format.isCompressed()) return {};

    switch(format.uncompressed()) {
        #define _n(format, channels, type) case PixelFormat::format: return {decodeNormalized<channels, type>, encodeNormalized<channels, type>};
        #define _i(format, channels, type) case PixelFormat::format: return {decodeCast<channels, type>, encodeCast<channels, type>};
        #define _h(format, channels) case PixelFormat::format: return {decodeHalf<channels>, encodeHalf<channels>};
        _n(R8Unorm, 1, UnsignedByte)
        _n(RG8Unorm, 2, UnsignedByte)
        _n(RGB8Unorm, 3, UnsignedByte)
        _n(RGBA8Unorm, 4, UnsignedByte)
        _n(R8Snorm, 1, Byte)
        _n(RG8Snorm, 2, Byte)
        _n(RGB8Snorm, 3, Byte)
        _n(RGBA8Snorm, 4, Byte)
        _n(R16Unorm, 1, UnsignedShort)
        _n(RG16Unorm, 2, UnsignedShort)
        _n(RGB16Unorm, 3, UnsignedShort)
        _n(RGBA16Unorm, 4, UnsignedShort)
        _n(R16Snorm, 1, Short)
        _n(RG16Snorm, 2, Short)
        _n(RGB16Snorm, 3, Short)
        _n(RGBA16Snorm, 4, Short)
        _i(R8UI, 1, UnsignedByte)
        _i(RG8UI, 2, UnsignedByte)
        _i(RGB8UI, 3, UnsignedByte)
        _i(RGBA8UI, 4, UnsignedByte)
        _i(R8I, 1, Byte)
        _i(RG8I, 2, Byte)
        _i(RGB8I, 3, Byte)
        _i(RGBA8I, 4, Byte)
        _i(R16UI, 1, UnsignedShort)
        _i(RG16UI, 2, UnsignedShort)
        _i(RGB16UI, 3, UnsignedShort)
        _i(RGBA16UI, 4, UnsignedShort)
        _i(R16I, 1, Short)
        _i(RG16I, 2, Short)
        _i(RGB16I, 3, Short)
        _i(RGBA16I, 4, Short)
        _i(R32UI, 1, UnsignedInt)
        _i(RG32UI, 2, UnsignedInt)
        _i(RGB32UI, 3, UnsignedInt)
        _i(RGBA32UI, 4, UnsignedInt)
        _i(R32I, 1, Int)
        _i(RG32I, 2, Int)
        _i(RGB32I, 3, Int)
        _i(RGBA32I, 4, Int)
        _i(R32F, 1, Float)
        _i(RG32F, 2, Float)
        _i(RGB32F, 3, Float)
        _i(RGBA32F, 4, Float)
        _h(R16F, 1)
        _h(RG16F, 2)
        _h(RGB16F, 3)
        _h(RGBA16F, 4)
        #undef _h
        #undef _i
        #undef _n
        case PixelFormat::RGB8Srgb: return {decodeSrgb, encodeSrgb};
        case PixelFormat::RGBA8Srgb: return {decodeSrgbAlpha, encodeSrgbAlpha};

        /* Depth/stencil, single- and two-channel sRGB and any other formats
           are not supported */
        default: return {};
    }
}

}

bool canDecodeToF32(const ImageFormat& format) {
    return codecFor(format).decode;
}

bool canEncodeFromF32(const ImageFormat& format) {
    return codecFor(format).encode;
}

void decodePixelsToF32(const ImageFormat& format, const Containers::ArrayView<const char> in, const Containers::ArrayView<Vector4> out) {
    const Codec codec = codecFor(format);
    CORRADE_ASSERT(codec.decode,
        "Texpack::decodePixelsToF32(): can't decode" << format, );
    CORRADE_ASSERT(in.size() >= out.size()*blockByteSize(format),
        "Texpack::decodePixelsToF32(): expected at least" << out.size()*blockByteSize(format) << "bytes for" << out.size() << "pixels but got" << in.size(), );
    codec.decode(in, out);
}

void encodePixelsFromF32(const ImageFormat& format, const Containers::ArrayView<const Vector4> in, const Containers::ArrayView<char> out) {
    const Codec codec = codecFor(format);
    CORRADE_ASSERT(codec.encode,
        "Texpack::encodePixelsFromF32(): can't encode" << format, );
    CORRADE_ASSERT(out.size() >= in.size()*blockByteSize(format),
        "Texpack::encodePixelsFromF32(): expected at least" << in.size()*blockByteSize(format) << "bytes for" << in.size() << "pixels but got" << out.size(), );
    codec.encode(in, out);
}

namespace {

struct GlUncompressedMapping {
    UnsignedInt glFormat;
    UnsignedInt glType;
    PixelFormat format;
};

using namespace Implementation;

constexpr GlUncompressedMapping GlSizedFormatMapping[]{
    #define _u(internalFormat, type, format) {internalFormat, type, PixelFormat::format},
    #include "Texpack/Implementation/glFormatMapping.hpp"
    #undef _u
};

constexpr GlUncompressedMapping GlUnsizedFormatMapping[]{
    #define _l(glFormat, type, format) {glFormat, type, PixelFormat::format},
    #include "Texpack/Implementation/glFormatMapping.hpp"
    #undef _l
};

}

ImageFormat imageFormatFromGl(const UnsignedInt glType, const UnsignedInt glFormat, const UnsignedInt glInternalFormat) {
    /* Compressed formats have both type and format zero */
    if(!glType && !glFormat) switch(glInternalFormat) {
        #define _c(internalFormat, format) case internalFormat: return CompressedPixelFormat::format;
        #include "Texpack/Implementation/glFormatMapping.hpp"
        #undef _c
        default: return {};
    }

    for(const GlUncompressedMapping& mapping: GlSizedFormatMapping)
        if(mapping.glFormat == glInternalFormat && mapping.glType == glType)
            return mapping.format;

    /* Legacy files store an unsized internal format equal to the format */
    for(const GlUncompressedMapping& mapping: GlUnsizedFormatMapping)
        if(mapping.glFormat == glInternalFormat && mapping.glType == glType)
            return mapping.format;

    return {};
}

}
