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

#include "KtxLoader.h"

#include <cstring>
#include <utility>
#include <Corrade/Containers/Array.h>
#include <Corrade/Containers/Optional.h>
#include <Corrade/Utility/Algorithms.h>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/Endianness.h>
#include <Corrade/Utility/EndiannessBatch.h>
#include <Magnum/Math/Functions.h>

#include "Texpack/Image.h"
#include "Texpack/VFile.h"
#include "Texpack/Implementation/KtxHeader.h"

namespace Texpack {

namespace {

template<std::size_t> struct TypeForSize {};
template<> struct TypeForSize<2> { typedef UnsignedShort Type; };
template<> struct TypeForSize<4> { typedef UnsignedInt   Type; };
template<> struct TypeForSize<8> { typedef UnsignedLong  Type; };

void endianSwap(Containers::ArrayView<char> data, const UnsignedInt typeSize) {
    /* Trailing bytes that don't form a whole value are left as they are */
    data = data.prefix(data.size()/typeSize*typeSize);
    switch(typeSize) {
        case 1:
            /* Single-byte or block-compressed data, nothing to do */
            return;
        case 2:
            Utility::Endianness::swapInPlace(Containers::arrayCast<TypeForSize<2>::Type>(data));
            return;
        case 4:
            Utility::Endianness::swapInPlace(Containers::arrayCast<TypeForSize<4>::Type>(data));
            return;
        case 8:
            Utility::Endianness::swapInPlace(Containers::arrayCast<TypeForSize<8>::Type>(data));
            return;
    }

    CORRADE_INTERNAL_ASSERT_UNREACHABLE(); /* LCOV_EXCL_LINE */
}

constexpr std::size_t alignKtx(const std::size_t size) {
    return (size + Implementation::KtxAlignment - 1)/Implementation::KtxAlignment*Implementation::KtxAlignment;
}

}

struct KtxLoader::State {
    explicit State(VFile& file, ImporterFlags flags): file(file), flags{flags} {}

    VFile& file;
    ImporterFlags flags;

    Implementation::KtxHeader header{};
    bool headerRead{};
    bool headerValid{};
    bool sameEndian{true};
    ImageFormat format;
    Containers::Array<char> keyValueData;

    /* Position of the size prefix of the first level */
    UnsignedLong firstImagePosition{};

    /* Levels are resolved in order, level i is resolved if i is less than
       resolvedLevelCount. Positions point to the data after the size
       prefix. */
    UnsignedInt resolvedLevelCount{};
    Containers::Array<std::size_t> levelSizes;
    Containers::Array<UnsignedLong> levelPositions;
    Containers::Array<Containers::Array<char>> levelData;
};

KtxLoader::KtxLoader(VFile& file, const ImporterFlags flags): _state{InPlaceInit, file, flags} {}

KtxLoader::KtxLoader(KtxLoader&&) noexcept = default;

KtxLoader::~KtxLoader() = default;

KtxLoader& KtxLoader::operator=(KtxLoader&&) noexcept = default;

ErrorCode KtxLoader::readHeader() {
    CORRADE_ASSERT(!_state->headerRead,
        "Texpack::KtxLoader::readHeader(): header already read", ErrorCode::InitError);
    _state->headerRead = true;

    Implementation::KtxHeader& header = _state->header;
    if(_state->file.read({reinterpret_cast<char*>(&header), sizeof(header)}) != ErrorCode::NoError) {
        Error{} << "Texpack::KtxLoader::readHeader(): file too short, expected at least" << sizeof(header) << "bytes";
        return ErrorCode::NotValidError;
    }

    if(std::memcmp(header.identifier, Implementation::KtxFileIdentifier, sizeof(header.identifier)) != 0) {
        Error{} << "Texpack::KtxLoader::readHeader(): wrong file signature";
        return ErrorCode::NotValidError;
    }

    if(header.endianness == Implementation::KtxEndiannessSwapped) {
        _state->sameEndian = false;
        Utility::Endianness::swapInPlace(header.endianness,
            header.glType, header.glTypeSize, header.glFormat,
            header.glInternalFormat, header.glBaseInternalFormat,
            header.pixelWidth, header.pixelHeight, header.pixelDepth,
            header.numberOfArrayElements, header.numberOfFaces,
            header.numberOfMipmapLevels, header.bytesOfKeyValueData);
    } else if(header.endianness != Implementation::KtxEndianness) {
        Error{} << "Texpack::KtxLoader::readHeader(): invalid endianness marker" << reinterpret_cast<void*>(header.endianness);
        return ErrorCode::NotValidError;
    }

    if(header.numberOfFaces != 1 && header.numberOfFaces != 6) {
        Error{} << "Texpack::KtxLoader::readHeader(): expected either 1 or 6 faces but got" << header.numberOfFaces;
        return ErrorCode::UnsupportedError;
    }

    if(!_state->sameEndian && header.glTypeSize != 1 && header.glTypeSize != 2 && header.glTypeSize != 4 && header.glTypeSize != 8) {
        Error{} << "Texpack::KtxLoader::readHeader(): can't byte-swap data with type size" << header.glTypeSize;
        return ErrorCode::UnsupportedError;
    }

    if(!header.pixelWidth) {
        Error{} << "Texpack::KtxLoader::readHeader(): image width is zero";
        return ErrorCode::NotValidError;
    }

    /* A level count of 0 means the file has just the base level */
    const UnsignedInt levelCount = Math::max(header.numberOfMipmapLevels, 1u);
    const UnsignedInt maxLevelCount = Math::log2(Math::max({header.pixelWidth, header.pixelHeight, header.pixelDepth})) + 1;
    if(levelCount > maxLevelCount) {
        Error{} << "Texpack::KtxLoader::readHeader(): expected at most" << maxLevelCount << "mip levels but got" << levelCount;
        return ErrorCode::NotValidError;
    }

    /* Check against the file size before allocating anything */
    const std::size_t remaining = this->remaining();
    if(header.bytesOfKeyValueData > remaining) {
        Error{} << "Texpack::KtxLoader::readHeader(): file too short, expected" << header.bytesOfKeyValueData << "bytes of key/value data but got only" << remaining;
        return ErrorCode::NotValidError;
    }

    _state->keyValueData = Containers::Array<char>{NoInit, header.bytesOfKeyValueData};
    if(header.bytesOfKeyValueData && _state->file.read(_state->keyValueData) != ErrorCode::NoError) {
        Error{} << "Texpack::KtxLoader::readHeader(): can't read" << header.bytesOfKeyValueData << "bytes of key/value data";
        return ErrorCode::NotValidError;
    }

    _state->firstImagePosition = _state->file.tell();
    _state->format = imageFormatFromGl(header.glType, header.glFormat, header.glInternalFormat);

    _state->levelSizes = Containers::Array<std::size_t>{ValueInit, levelCount};
    _state->levelPositions = Containers::Array<UnsignedLong>{ValueInit, levelCount};
    _state->levelData = Containers::Array<Containers::Array<char>>{ValueInit, levelCount};
    _state->headerValid = true;

    if(_state->flags & ImporterFlag::Verbose) {
        Debug d;
        d << "Texpack::KtxLoader::readHeader():" << header.pixelWidth << Debug::nospace << "x" << Debug::nospace << header.pixelHeight << Debug::nospace << "x" << Debug::nospace << header.pixelDepth << "image with" << header.numberOfArrayElements << "array elements," << header.numberOfFaces << "faces and" << levelCount << "levels";
        if(_state->format)
            d << "in" << _state->format;
        else
            d << "in an unknown format" << reinterpret_cast<void*>(header.glInternalFormat);
        if(!_state->sameEndian)
            d << Debug::nospace << ", byte-swapped";
    }

    return ErrorCode::NoError;
}

std::size_t KtxLoader::remaining() const {
    const std::size_t position = _state->file.tell();
    const std::size_t size = _state->file.byteCount();
    return size > position ? size - position : 0;
}

bool KtxLoader::isHeaderValid() const { return _state->headerValid; }

bool KtxLoader::isSameEndian() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::isSameEndian(): no valid header read", {});
    return _state->sameEndian;
}

ImageFormat KtxLoader::format() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::format(): no valid header read", {});
    return _state->format;
}

UnsignedInt KtxLoader::typeSize() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::typeSize(): no valid header read", {});
    return _state->header.glTypeSize;
}

UnsignedInt KtxLoader::width() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::width(): no valid header read", {});
    return _state->header.pixelWidth;
}

UnsignedInt KtxLoader::height() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::height(): no valid header read", {});
    return _state->header.pixelHeight;
}

UnsignedInt KtxLoader::depth() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::depth(): no valid header read", {});
    return _state->header.pixelDepth;
}

UnsignedInt KtxLoader::arrayElementCount() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::arrayElementCount(): no valid header read", {});
    return _state->header.numberOfArrayElements;
}

UnsignedInt KtxLoader::faceCount() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::faceCount(): no valid header read", {});
    return _state->header.numberOfFaces;
}

UnsignedInt KtxLoader::levelCount() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::levelCount(): no valid header read", {});
    return _state->levelSizes.size();
}

bool KtxLoader::is1D() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::is1D(): no valid header read", {});
    return !_state->header.pixelHeight;
}

bool KtxLoader::is2D() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::is2D(): no valid header read", {});
    return _state->header.pixelHeight && !_state->header.pixelDepth;
}

bool KtxLoader::is3D() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::is3D(): no valid header read", {});
    return _state->header.pixelDepth;
}

bool KtxLoader::isCubemap() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::isCubemap(): no valid header read", {});
    return _state->header.numberOfFaces == 6;
}

bool KtxLoader::isArray() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::isArray(): no valid header read", {});
    return _state->header.numberOfArrayElements;
}

Containers::ArrayView<const char> KtxLoader::keyValueData() const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::keyValueData(): no valid header read", {});
    return _state->keyValueData;
}

Containers::Optional<Containers::StringView> KtxLoader::keyValue(const Containers::StringView key) const {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::keyValue(): no valid header read", {});

    const Containers::ArrayView<const char> data = _state->keyValueData;
    std::size_t offset = 0;
    while(offset < data.size()) {
        if(data.size() - offset < sizeof(UnsignedInt)) {
            Warning{} << "Texpack::KtxLoader::keyValue(): key/value data truncated at offset" << offset;
            return {};
        }

        UnsignedInt length;
        std::memcpy(&length, data + offset, sizeof(length));
        if(!_state->sameEndian) Utility::Endianness::swapInPlace(length);
        offset += sizeof(length);

        if(data.size() - offset < length) {
            Warning{} << "Texpack::KtxLoader::keyValue(): key/value pair at offset" << offset - sizeof(length) << "expected to have" << length << "bytes but got" << data.size() - offset;
            return {};
        }

        /* Key and value are separated by a null terminator, the value can be
           binary */
        const Containers::StringView entry{data + offset, length};
        const Containers::StringView separator = entry.find('\0');
        if(!separator.data()) {
            Warning{} << "Texpack::KtxLoader::keyValue(): key/value pair at offset" << offset - sizeof(length) << "has no key terminator";
            return {};
        }

        if(entry.prefix(separator.data() - entry.data()) == key) {
            Containers::StringView value = entry.exceptPrefix(separator.data() + 1 - entry.data());
            if(!value.isEmpty() && value.back() == '\0')
                value = value.exceptSuffix(1);
            return value;
        }

        offset += alignKtx(length);
    }

    return {};
}

ErrorCode KtxLoader::resolveLevel(const char* const function, const UnsignedInt level, const bool seekToData, std::size_t& size) {
    CORRADE_ASSERT(_state->headerValid,
        "Texpack::KtxLoader::" << Debug::nospace << function << Debug::nospace << "(): no valid header read", ErrorCode::InitError);

    if(level >= levelCount()) {
        Error{} << "Texpack::KtxLoader::" << Debug::nospace << function << Debug::nospace << "(): level" << level << "out of range for" << levelCount() << "levels";
        return ErrorCode::MipMapError;
    }

    /* Walk through the size prefixes of all levels up to the requested one */
    while(_state->resolvedLevelCount <= level) {
        const UnsignedInt i = _state->resolvedLevelCount;
        const UnsignedLong position = i ?
            _state->levelPositions[i - 1] + alignKtx(_state->levelSizes[i - 1]) :
            _state->firstImagePosition;

        UnsignedInt imageSize;
        if(_state->file.seekFromStart(position) != ErrorCode::NoError ||
           _state->file.read({reinterpret_cast<char*>(&imageSize), sizeof(imageSize)}) != ErrorCode::NoError) {
            Error{} << "Texpack::KtxLoader::" << Debug::nospace << function << Debug::nospace << "(): can't read the size of level" << i;
            return ErrorCode::NotValidError;
        }

        if(!_state->sameEndian) Utility::Endianness::swapInPlace(imageSize);
        if(!imageSize) {
            Error{} << "Texpack::KtxLoader::" << Debug::nospace << function << Debug::nospace << "(): level" << i << "is empty";
            return ErrorCode::MipMapError;
        }

        /* The size of a non-array cube map level is the size of one face,
           each face is padded to four bytes */
        _state->levelSizes[i] = isCubemap() && !isArray() ?
            alignKtx(imageSize)*6 : imageSize;
        _state->levelPositions[i] = position + sizeof(imageSize);
        ++_state->resolvedLevelCount;
    }

    size = _state->levelSizes[level];

    if(seekToData && _state->file.seekFromStart(_state->levelPositions[level]) != ErrorCode::NoError) {
        Error{} << "Texpack::KtxLoader::" << Debug::nospace << function << Debug::nospace << "(): data of level" << level << "are truncated";
        return ErrorCode::MipMapError;
    }

    return ErrorCode::NoError;
}

ErrorCode KtxLoader::imageSizeOf(const UnsignedInt level, std::size_t& size) {
    return resolveLevel("imageSizeOf", level, false, size);
}

ErrorCode KtxLoader::imageDataAt(const UnsignedInt level, Containers::ArrayView<const char>& data) {
    /* Read each level only once */
    if(level < _state->levelData.size() && !_state->levelData[level].isEmpty()) {
        data = _state->levelData[level];
        return ErrorCode::NoError;
    }

    std::size_t size;
    const ErrorCode error = resolveLevel("imageDataAt", level, true, size);
    if(error != ErrorCode::NoError) return error;

    const std::size_t remaining = this->remaining();
    if(size > remaining) {
        Error{} << "Texpack::KtxLoader::imageDataAt(): data of level" << level << "are truncated, expected" << size << "bytes but got only" << remaining;
        return ErrorCode::MipMapError;
    }

    Containers::Array<char> levelData{NoInit, size};
    if(_state->file.read(levelData) != ErrorCode::NoError) {
        Error{} << "Texpack::KtxLoader::imageDataAt(): can't read" << size << "bytes of level" << level;
        return ErrorCode::MipMapError;
    }

    if(!_state->sameEndian)
        endianSwap(levelData, _state->header.glTypeSize);

    _state->levelData[level] = std::move(levelData);
    data = _state->levelData[level];
    return ErrorCode::NoError;
}

ErrorCode imageFromKtx(VFile& file, Containers::Optional<Image>& image, const UnsignedInt levelLimit, const ImporterFlags flags) {
    KtxLoader loader{file, flags};
    ErrorCode error = loader.readHeader();
    if(error != ErrorCode::NoError) return error;

    const ImageFormat format = loader.format();
    if(!format) {
        Error{} << "Texpack::imageFromKtx(): unsupported format";
        return ErrorCode::UnsupportedError;
    }

    const UnsignedInt slices = loader.faceCount()*Math::max(loader.arrayElementCount(), 1u);
    if(slices > 0xffff || loader.depth() > 0xffff) {
        Error{} << "Texpack::imageFromKtx(): expected at most 65535 slices and depth but got" << slices << "and" << loader.depth();
        return ErrorCode::UnsupportedError;
    }

    const UnsignedInt levelCount = levelLimit ?
        Math::min(levelLimit, loader.levelCount()) : loader.levelCount();

    Containers::Optional<Image> out;
    for(UnsignedInt level = 0; level != levelCount; ++level) {
        Containers::ArrayView<const char> data;
        error = loader.imageDataAt(level, data);
        if(error != ErrorCode::NoError) return error;

        ImageConfig config{format,
            Math::max(loader.width() >> level, 1u),
            loader.height() ? Math::max(loader.height() >> level, 1u) : 1u,
            UnsignedShort(loader.depth() ? Math::max(loader.depth() >> level, 1u) : 1u),
            UnsignedShort(slices),
            loader.isCubemap() ? ImageFlags{ImageFlag::Cubemap} : ImageFlags{}};
        Image levelImage{config};
        const Containers::ArrayView<char> pixels = levelImage.pixels();

        if(format.isCompressed()) {
            /* Block sizes are multiples of four, there's no padding */
            if(data.size() < pixels.size()) {
                Error{} << "Texpack::imageFromKtx(): level" << level << "expected to have" << pixels.size() << "bytes but got" << data.size();
                return ErrorCode::MipMapError;
            }

            Utility::copy(data.prefix(pixels.size()), pixels);

        } else {
            /* Rows are padded to four bytes */
            const std::size_t rowSize = config.pixelCountPerRow()*blockByteSize(format);
            const std::size_t paddedRowSize = alignKtx(rowSize);
            const std::size_t rowCount = pixels.size()/rowSize;
            if(data.size() < rowCount*paddedRowSize) {
                Error{} << "Texpack::imageFromKtx(): level" << level << "expected to have" << rowCount*paddedRowSize << "bytes but got" << data.size();
                return ErrorCode::MipMapError;
            }

            for(std::size_t row = 0; row != rowCount; ++row)
                Utility::copy(data.sliceSize(row*paddedRowSize, rowSize),
                    pixels.sliceSize(row*rowSize, rowSize));
        }

        if(flags & ImporterFlag::Verbose)
            Debug{} << "Texpack::imageFromKtx(): loaded level" << level << "of" << config.width() << Debug::nospace << "x" << Debug::nospace << config.height() << Debug::nospace << "x" << Debug::nospace << config.depth() << "with" << config.slices() << "slices";

        if(!out)
            out = std::move(levelImage);
        else
            *out = Image::destructiveJoin(std::move(*out), std::move(levelImage));
    }

    image = std::move(out);
    return ErrorCode::NoError;
}

}
