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

#include "ImageExtension.h"

#include <cstddef>
#include <cstring>
#include <Corrade/Utility/Algorithms.h>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Magnum/Math/Functions.h>

#include "Texpack/Implementation/ImageLayout.h"

namespace Texpack {

using namespace Containers::Literals;

namespace {

UnsignedInt extensionSize(Containers::ArrayView<const char> data) {
    UnsignedInt size;
    std::memcpy(&size, data + offsetof(Implementation::ExtensionHeader, size), sizeof(size));
    return size;
}

}

ImageExtension::ImageExtension(const Containers::ArrayView<const char> data) {
    CORRADE_ASSERT(data.size() >= sizeof(Implementation::ExtensionHeader),
        "Texpack::ImageExtension: expected at least" << sizeof(Implementation::ExtensionHeader) << "bytes but got" << data.size(), );
    const UnsignedInt size = extensionSize(data);
    CORRADE_ASSERT(size >= sizeof(Implementation::ExtensionHeader) && size <= data.size(),
        "Texpack::ImageExtension: invalid size" << size << "for" << data.size() << "bytes of data", );
    _data = data.prefix(size);
}

Containers::StringView ImageExtension::tag() const {
    return {_data.data(), 4};
}

bool ImageExtension::is(const Containers::StringView tag) const {
    return this->tag() == tag;
}

Containers::ArrayView<const char> ImageExtension::payload() const {
    return _data.exceptPrefix(sizeof(Implementation::ExtensionHeader));
}

ImageExtensions::ImageExtensions(const Containers::ArrayView<const char> block): _block{block} {
    CORRADE_INTERNAL_ASSERT(block.size() >= sizeof(Implementation::ExtensionBlockHeader));
}

std::size_t ImageExtensions::count() const {
    Implementation::ExtensionBlockHeader header;
    std::memcpy(&header, _block.data(), sizeof(header));
    return header.count;
}

ImageExtension ImageExtensions::operator[](const std::size_t id) const {
    const std::size_t count = this->count();
    CORRADE_ASSERT(id < count,
        "Texpack::ImageExtensions::operator[](): index" << id << "out of range for" << count << "extensions", ImageExtension{nullptr});

    UnsignedInt offset;
    std::memcpy(&offset, _block + sizeof(Implementation::ExtensionBlockHeader) + id*sizeof(UnsignedInt), sizeof(offset));
    return ImageExtension{_block.exceptPrefix(Implementation::extensionBlockPrefixSize(count) + offset)};
}

Containers::Optional<ImageExtension> ImageExtensions::find(const Containers::StringView tag) const {
    for(std::size_t i = 0, count = this->count(); i != count; ++i) {
        const ImageExtension extension = (*this)[i];
        if(extension.is(tag)) return extension;
    }

    return {};
}

Containers::StringView LayerExtension::tag() { return "LAYR"_s; }

Containers::Optional<LayerExtension> LayerExtension::from(const ImageExtension& extension) {
    if(!extension.is(tag()) || extension.size() != sizeof(_data))
        return {};

    /* The name has to be null-terminated inside the field */
    const Containers::ArrayView<const char> name = extension.payload();
    if(!std::memchr(name.data(), '\0', name.size()))
        return {};

    LayerExtension out;
    Utility::copy(extension.data(), out._data);
    return out;
}

LayerExtension::LayerExtension(const Containers::StringView name) {
    CORRADE_ASSERT(name.size() < NameSize,
        "Texpack::LayerExtension: expected a name shorter than" << NameSize << "bytes but got" << name.size(), );

    Implementation::ExtensionHeader header;
    std::memcpy(header.tag, tag().data(), 4);
    header.size = sizeof(_data);
    std::memcpy(_data, &header, sizeof(header));

    char* const out = _data + sizeof(header);
    std::memset(out, 0, NameSize);
    std::memcpy(out, name.data(), Math::min(name.size(), std::size_t(NameSize - 1)));
}

Containers::StringView LayerExtension::name() const {
    return Containers::StringView{_data + sizeof(Implementation::ExtensionHeader)};
}

}
