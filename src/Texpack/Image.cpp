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

#include "Image.h"

#include <cstdint>
#include <cstring>
#include <utility>
#include <Corrade/Containers/EnumSet.hpp>
#include <Corrade/Containers/GrowableArray.h>
#include <Corrade/Utility/Algorithms.h>

#include "Texpack/Implementation/ImageLayout.h"

namespace Texpack {

using Implementation::ImageHeader;
using Implementation::ExtensionBlockHeader;
using Implementation::alignImage;

Debug& operator<<(Debug& debug, const UsageHint value) {
    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case UsageHint::value: return debug << "Texpack::UsageHint::" #value;
        _c(Generic)
        _c(DiffuseColour)
        _c(SpecularColour)
        _c(FinalColour)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "Texpack::UsageHint(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

Debug& operator<<(Debug& debug, const LayerType value) {
    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case LayerType::value: return debug << "Texpack::LayerType::" #value;
        _c(Generic)
        _c(Visual)
        _c(Gameplay)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "Texpack::LayerType(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

Debug& operator<<(Debug& debug, const ImageFlag value) {
    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case ImageFlag::value: return debug << "Texpack::ImageFlag::" #value;
        _c(Cubemap)
        _c(Clut)
        _c(HasExtensionData)
        _c(HasNextImageData)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "Texpack::ImageFlag(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

Debug& operator<<(Debug& debug, const ImageFlags value) {
    return Containers::enumSetDebugOutput(debug, value, "Texpack::ImageFlags{}", {
        ImageFlag::Cubemap,
        ImageFlag::Clut,
        ImageFlag::HasExtensionData,
        ImageFlag::HasNextImageData});
}

ImageConfig::ImageConfig(const ImageFormat format, const UnsignedInt width, const UnsignedInt height, const UnsignedShort depth, const UnsignedShort slices, const ImageFlags flags): _format{format}, _width{width}, _height{height}, _depth{depth}, _slices{slices}, _usage{}, _layerType{}, _flags{flags} {
    CORRADE_ASSERT(format,
        "Texpack::ImageConfig: invalid format", );
    CORRADE_ASSERT(width && height && depth && slices,
        "Texpack::ImageConfig: expected non-zero size but got" << width << height << depth << slices, );
}

std::size_t ImageConfig::dataSize() const {
    const Vector3ui blockSize{Texpack::blockSize(_format)};
    const std::size_t blockCount =
        std::size_t((_width + blockSize.x() - 1)/blockSize.x())*
        ((_height + blockSize.y() - 1)/blockSize.y())*
        ((_depth + blockSize.z() - 1)/blockSize.z())*_slices;
    return blockCount*blockByteSize(_format);
}

std::size_t ImageConfig::indexOf(const Vector3ui& position, const UnsignedInt slice) const {
    CORRADE_ASSERT(position.x() < _width && position.y() < _height && position.z() < _depth && slice < _slices,
        "Texpack::ImageConfig::indexOf(): position" << position << "and slice" << slice << "out of range for" << Vector3ui{_width, _height, _depth} << "and" << _slices << "slices", {});
    return slice*pixelCountPerSlice() + position.z()*pixelCountPerPage() + position.y()*pixelCountPerRow() + position.x();
}

std::size_t ImageConfig::byteOffsetOf(const Vector3ui& position, const UnsignedInt slice) const {
    CORRADE_ASSERT(!_format.isCompressed(),
        "Texpack::ImageConfig::byteOffsetOf(): not available for compressed formats", {});
    return indexOf(position, slice)*blockByteSize(_format);
}

namespace {

/* The records are accessed only through copies of the fixed-size parts to
   avoid aliasing the byte storage with typed structs */
ImageHeader readHeader(const char* const data) {
    ImageHeader header;
    std::memcpy(&header, data, sizeof(header));
    return header;
}

void writeHeader(char* const data, const ImageHeader& header) {
    std::memcpy(data, &header, sizeof(header));
}

ExtensionBlockHeader readExtensionBlockHeader(const char* const data) {
    ExtensionBlockHeader header;
    std::memcpy(&header, data, sizeof(header));
    return header;
}

ImageFormat formatFromHeader(const ImageHeader& header) {
    return ImageFormat::fromValue(header.format, header.compressed);
}

ImageConfig configFromHeader(const ImageHeader& header) {
    ImageConfig config{formatFromHeader(header), header.width, header.height, header.depth, header.slices, ImageFlag(header.flags)};
    config.setUsage(UsageHint(header.usage))
        .setLayerType(LayerType(header.layerType));
    return config;
}

ImageHeader headerFromConfig(const ImageConfig& config, const ImageFlags flags) {
    ImageHeader header{};
    header.width = config.width();
    header.height = config.height();
    header.depth = config.depth();
    header.slices = config.slices();
    header.format = config.format().value();
    header.compressed = config.format().isCompressed();
    header.usage = UnsignedByte(config.usage());
    header.layerType = UnsignedByte(config.layerType());
    header.flags = UnsignedByte(flags);
    return header;
}

/* Offset of the extension block */
std::size_t extensionBlockOffset(const ImageHeader& header) {
    return sizeof(ImageHeader) + alignImage(configFromHeader(header).dataSize());
}

std::size_t recordSize(const char* const data) {
    const ImageHeader header = readHeader(data);
    std::size_t size = extensionBlockOffset(header);
    if(ImageFlag(header.flags) & ImageFlag::HasExtensionData) {
        const ExtensionBlockHeader block = readExtensionBlockHeader(data + size);
        size += Implementation::extensionBlockPrefixSize(block.count) + block.payloadSize;
    }
    return size;
}

void addFlags(char* const data, const ImageFlags flags) {
    ImageHeader header = readHeader(data);
    header.flags |= UnsignedByte(flags);
    writeHeader(data, header);
}

}

template<class T> BasicImageRecord<T>::BasicImageRecord(const Containers::ArrayView<T> data) noexcept: _data{data} {
    CORRADE_INTERNAL_ASSERT(data.size() >= sizeof(ImageHeader));
}

template<class T> ImageConfig BasicImageRecord<T>::config() const {
    return configFromHeader(readHeader(_data));
}

template<class T> ImageFormat BasicImageRecord<T>::format() const {
    return formatFromHeader(readHeader(_data));
}

template<class T> ImageFlags BasicImageRecord<T>::flags() const {
    return ImageFlag(readHeader(_data).flags);
}

template<class T> Containers::ArrayView<T> BasicImageRecord<T>::data() const {
    return _data.slice(sizeof(ImageHeader), sizeof(ImageHeader) + config().dataSize());
}

template<class T> std::size_t BasicImageRecord<T>::sizeInBytes() const {
    return recordSize(_data);
}

template<class T> std::size_t BasicImageRecord<T>::totalSize() const {
    std::size_t size = 0;
    for(Containers::Optional<BasicImageRecord<T>> record = *this; record; record = record->next())
        size += record->sizeInBytes();
    return alignImage(size);
}

template<class T> std::size_t BasicImageRecord<T>::imageChainLength() const {
    std::size_t count = 0;
    for(Containers::Optional<BasicImageRecord<T>> record = *this; record; record = record->next())
        ++count;
    return count;
}

template<class T> Containers::Optional<BasicImageRecord<T>> BasicImageRecord<T>::next() const {
    if(!(flags() & ImageFlag::HasNextImageData)) return {};

    const std::size_t offset = alignImage(sizeInBytes());
    CORRADE_INTERNAL_ASSERT(offset < _data.size());
    return BasicImageRecord<T>{_data.exceptPrefix(offset)};
}

template<class T> Containers::Optional<ImageExtensions> BasicImageRecord<T>::extensions() const {
    if(!(flags() & ImageFlag::HasExtensionData)) return {};

    return ImageExtensions{_data.slice(extensionBlockOffset(readHeader(_data)), sizeInBytes())};
}

template<class T> Containers::ArrayView<T> BasicImageRecord<T>::pixelDataFrom(const std::size_t pixelOffset, const std::size_t count) const {
    const Containers::ArrayView<T> data = this->data();
    const std::size_t size = blockByteSize(format());
    CORRADE_ASSERT((pixelOffset + count)*size <= data.size(),
        "Texpack::BasicImageRecord: pixels" << pixelOffset << "to" << pixelOffset + count << "out of range for" << data.size()/size << "pixels", {});
    return data.slice(pixelOffset*size, (pixelOffset + count)*size);
}

template<class T> void BasicImageRecord<T>::decodePixelsAt(const std::size_t pixelOffset, const Containers::ArrayView<Vector4> out) const {
    decodePixelsToF32(format(), pixelDataFrom(pixelOffset, out.size()), out);
}

template<class T> Vector4 BasicImageRecord<T>::pixelAt(const std::size_t pixelOffset) const {
    Vector4 out;
    decodePixelsAt(pixelOffset, {&out, 1});
    return out;
}

template class TEXPACK_EXPORT BasicImageRecord<char>;
template class TEXPACK_EXPORT BasicImageRecord<const char>;

Image::Image(const ImageConfig& config): Image{config, Containers::ArrayView<const Containers::ArrayView<const char>>{}} {}

Image::Image(const ImageConfig& config, const std::initializer_list<Containers::ArrayView<const char>> extensions): Image{config, Containers::arrayView(extensions)} {}

Image::Image(const ImageConfig& config, const Containers::ArrayView<const Containers::ArrayView<const char>> extensions) {
    std::size_t payloadSize = 0;
    for(const Containers::ArrayView<const char> extension: extensions) {
        CORRADE_ASSERT(ImageExtension{extension}.size() == extension.size(),
            "Texpack::Image: extension size doesn't match the size in its header", );
        payloadSize += alignImage(extension.size());
    }

    const std::size_t dataSize = config.dataSize();
    const std::size_t extensionOffset = sizeof(ImageHeader) + alignImage(dataSize);
    const std::size_t prefixSize = Implementation::extensionBlockPrefixSize(extensions.size());
    std::size_t size = extensionOffset;
    if(!extensions.isEmpty()) size += prefixSize + payloadSize;

    ImageFlags flags = config.flags() & ~(ImageFlag::HasExtensionData|ImageFlag::HasNextImageData);
    if(!extensions.isEmpty()) flags |= ImageFlag::HasExtensionData;

    /* Header first, then the padding after the data. Pixel data stay
       uninitialized. */
    _data = Containers::Array<char>{NoInit, size};
    writeHeader(_data, headerFromConfig(config, flags));
    std::memset(_data + sizeof(ImageHeader) + dataSize, 0, extensionOffset - sizeof(ImageHeader) - dataSize);

    if(extensions.isEmpty()) return;

    /* Zero-fill the extension block to have the padding defined, then fill
       the header, the offset table and the payload */
    Containers::ArrayView<char> block = _data.exceptPrefix(extensionOffset);
    std::memset(block, 0, block.size());

    ExtensionBlockHeader blockHeader;
    blockHeader.count = extensions.size();
    blockHeader.payloadSize = payloadSize;
    std::memcpy(block, &blockHeader, sizeof(blockHeader));

    UnsignedInt offset = 0;
    for(std::size_t i = 0; i != extensions.size(); ++i) {
        std::memcpy(block + sizeof(ExtensionBlockHeader) + i*sizeof(UnsignedInt), &offset, sizeof(offset));
        Utility::copy(extensions[i], block.sliceSize(prefixSize + offset, extensions[i].size()));
        offset += alignImage(extensions[i].size());
    }
}

Image::Image(Containers::Array<char>&& data) noexcept: _data{std::move(data)} {}

Image::Image(Image&&) noexcept = default;

Image::~Image() = default;

Image& Image::operator=(Image&&) noexcept = default;

Containers::Optional<Image> Image::fromData(Containers::Array<char>&& data) {
    if(reinterpret_cast<std::uintptr_t>(data.data()) % Implementation::ImageAlignment) {
        Error{} << "Texpack::Image::fromData(): data not aligned to" << Implementation::ImageAlignment << "bytes";
        return {};
    }

    std::size_t offset = 0;
    for(std::size_t i = 0; ; ++i) {
        const Containers::ArrayView<const char> remaining = data.exceptPrefix(offset);
        if(remaining.size() < sizeof(ImageHeader)) {
            Error{} << "Texpack::Image::fromData(): record" << i << "expected to have at least" << sizeof(ImageHeader) << "bytes but got" << remaining.size();
            return {};
        }

        const ImageHeader header = readHeader(remaining);
        if(!header.format || header.compressed > 1 || !header.width || !header.height || !header.depth || !header.slices) {
            Error{} << "Texpack::Image::fromData(): record" << i << "has an invalid header";
            return {};
        }

        const std::size_t extensionOffset = extensionBlockOffset(header);
        if(remaining.size() < extensionOffset) {
            Error{} << "Texpack::Image::fromData(): record" << i << "expected to have at least" << extensionOffset << "bytes but got" << remaining.size();
            return {};
        }

        std::size_t size = extensionOffset;
        if(ImageFlag(header.flags) & ImageFlag::HasExtensionData) {
            if(remaining.size() < size + sizeof(ExtensionBlockHeader)) {
                Error{} << "Texpack::Image::fromData(): record" << i << "has a truncated extension block";
                return {};
            }

            const ExtensionBlockHeader block = readExtensionBlockHeader(remaining + size);
            const std::size_t prefixSize = Implementation::extensionBlockPrefixSize(block.count);
            if(remaining.size() < size + prefixSize + block.payloadSize) {
                Error{} << "Texpack::Image::fromData(): record" << i << "has a truncated extension block";
                return {};
            }

            /* Each extension has to fit into the payload including its
               header */
            for(std::size_t j = 0; j != block.count; ++j) {
                UnsignedInt extensionStart;
                std::memcpy(&extensionStart, remaining + size + sizeof(ExtensionBlockHeader) + j*sizeof(UnsignedInt), sizeof(extensionStart));
                Implementation::ExtensionHeader extensionHeader{};
                if(std::size_t(extensionStart) + sizeof(extensionHeader) <= block.payloadSize)
                    std::memcpy(&extensionHeader, remaining + size + prefixSize + extensionStart, sizeof(extensionHeader));
                if(extensionHeader.size < sizeof(extensionHeader) || std::size_t(extensionStart) + extensionHeader.size > block.payloadSize) {
                    Error{} << "Texpack::Image::fromData(): record" << i << "has an invalid extension" << j;
                    return {};
                }
            }

            size += prefixSize + block.payloadSize;
        }

        offset += alignImage(size);
        if(!(ImageFlag(header.flags) & ImageFlag::HasNextImageData)) break;
    }

    if(offset != data.size()) {
        Error{} << "Texpack::Image::fromData(): expected" << offset << "bytes for the whole chain but got" << data.size();
        return {};
    }

    return Image{std::move(data)};
}

Image Image::join(const Image& a, const Image& b) {
    CORRADE_ASSERT(!a._data.isEmpty() && !b._data.isEmpty(),
        "Texpack::Image::join(): can't join an empty image", Image{Containers::Array<char>{}});

    Containers::Array<char> data{NoInit, a._data.size() + b._data.size()};
    Utility::copy(a._data, data.prefix(a._data.size()));
    Utility::copy(b._data, data.exceptPrefix(a._data.size()));

    /* Link the last record of the first chain to the second chain */
    MutableImageRecord last{data};
    while(Containers::Optional<MutableImageRecord> next = last.next())
        last = *next;
    addFlags(last.data().data() - sizeof(ImageHeader), ImageFlag::HasNextImageData);

    return Image{std::move(data)};
}

Image Image::destructiveJoin(Image&& a, Image&& b) {
    Image out = join(a, b);
    a._data = nullptr;
    b._data = nullptr;
    return out;
}

Containers::Array<char> Image::release() {
    return std::move(_data);
}

MutableImageRecord Image::record() {
    CORRADE_ASSERT(!_data.isEmpty(),
        "Texpack::Image::record(): the image is empty", MutableImageRecord{nullptr});
    return MutableImageRecord{_data};
}

ImageRecord Image::record() const {
    CORRADE_ASSERT(!_data.isEmpty(),
        "Texpack::Image::record(): the image is empty", ImageRecord{nullptr});
    return ImageRecord{_data};
}

Containers::Array<MutableImageRecord> Image::records() {
    Containers::Array<MutableImageRecord> out;
    for(Containers::Optional<MutableImageRecord> record = this->record(); record; record = record->next())
        arrayAppend(out, *record);
    return out;
}

Containers::Array<ImageRecord> Image::records() const {
    Containers::Array<ImageRecord> out;
    for(Containers::Optional<ImageRecord> record = this->record(); record; record = record->next())
        arrayAppend(out, *record);
    return out;
}

std::size_t Image::imageChainLength() const {
    return record().imageChainLength();
}

std::size_t Image::totalSize() const {
    return record().totalSize();
}

ImageConfig Image::config() const {
    return record().config();
}

std::size_t Image::sizeInBytes() const {
    return record().sizeInBytes();
}

Containers::ArrayView<char> Image::pixels() {
    return record().data();
}

Containers::ArrayView<const char> Image::pixels() const {
    return record().data();
}

Containers::Optional<ImageExtensions> Image::extensions() const {
    return record().extensions();
}

Vector4 Image::pixelAt(const std::size_t pixelOffset) const {
    return record().pixelAt(pixelOffset);
}

void Image::setPixelAt(const std::size_t pixelOffset, const Vector4& value) {
    record().setPixelAt(pixelOffset, value);
}

void Image::clear() {
    for(Containers::Optional<MutableImageRecord> record = this->record(); record; record = record->next()) {
        const Containers::ArrayView<char> data = record->data();
        std::memset(data, 0, data.size());
    }
}

}
