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

#include "OpenExr.h"

#include <algorithm>
#include <cstring>
#include <thread> /* std::thread::hardware_concurrency() */
#include <utility>
#include <Corrade/Containers/Array.h>
#include <Corrade/Containers/GrowableArray.h>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Corrade/Utility/Endianness.h>
#include <Magnum/Math/Functions.h>

#include "Texpack/Image.h"
#include "Texpack/ImageExtension.h"
#include "Texpack/VFile.h"
#include "Texpack/Implementation/VFileIStream.h"

#include <IexBaseExc.h>
#include <ImfChannelList.h>
#include <ImfFrameBuffer.h>
#include <ImfHeader.h>
#include <ImfInputFile.h>
#include <ImfThreading.h>
#include <ImfVersion.h>

namespace Texpack {

namespace {

constexpr const char* PixelTypeName[] {
    "UINT",
    "HALF",
    "FLOAT"
};

constexpr PixelFormat Formats[3][4] {
    { /* UINT */
        PixelFormat::R32UI,
        PixelFormat::RG32UI,
        PixelFormat::RGB32UI,
        PixelFormat::RGBA32UI,
    }, { /* HALF */
        PixelFormat::R16F,
        PixelFormat::RG16F,
        PixelFormat::RGB16F,
        PixelFormat::RGBA16F,
    }, { /* FLOAT */
        PixelFormat::R32F,
        PixelFormat::RG32F,
        PixelFormat::RGB32F,
        PixelFormat::RGBA32F,
    }
};

constexpr std::size_t ChannelSizes[] {
    4, /* UINT */
    2, /* HALF */
    4  /* FLOAT */
};

struct Channel {
    /* Null-terminated, owned by the Imf::ChannelList */
    const char* name;
    Containers::StringView letter;
};

struct Layer {
    Containers::StringView name;
    Imf::PixelType type;
    Containers::Array<Channel> channels;
    /* Filled once all channels are known */
    const char* components[4]{};
    UnsignedInt componentCount{};
};

Int componentForLetter(const Containers::StringView letter) {
    if(letter == "R" || letter == "X") return 0;
    if(letter == "G" || letter == "Y") return 1;
    if(letter == "B" || letter == "Z") return 2;
    if(letter == "A") return 3;
    return -1;
}

}

ErrorCode imageFromExr(VFile& file, Containers::Optional<Image>& image, const Containers::StringView layerFilter, Int threadCount, const ImporterFlags flags) {
    const std::size_t position = file.tell();
    const std::size_t byteCount = file.byteCount();
    const std::size_t available = byteCount > position ? byteCount - position : 0;
    if(available < 8) {
        Error{} << "Texpack::imageFromExr(): file too short, expected at least 8 bytes but got" << available;
        return ErrorCode::BadVersionError;
    }

    char magic[8];
    if(file.read(magic) != ErrorCode::NoError) {
        Error{} << "Texpack::imageFromExr(): can't read" << sizeof(magic) << "bytes";
        return ErrorCode::ReadError;
    }

    Int version;
    std::memcpy(&version, magic + 4, sizeof(version));
    Utility::Endianness::littleEndianInPlace(version);
    if(!Imf::isImfMagic(magic)) {
        Error{} << "Texpack::imageFromExr(): wrong file signature";
        return ErrorCode::BadVersionError;
    }
    if(Imf::getVersion(version) != Imf::EXR_VERSION) {
        Error{} << "Texpack::imageFromExr(): unsupported version" << Imf::getVersion(version);
        return ErrorCode::BadVersionError;
    }

    /* Increase global thread count if it's not enough. Value of 0 means
       autodetection, 1 means single-threaded. */
    if(!threadCount) {
        threadCount = std::thread::hardware_concurrency();
        if(flags & ImporterFlag::Verbose)
            Debug{} << "Texpack::imageFromExr(): autodetected hardware concurrency to" << threadCount << "threads";
    }
    if(Imf::globalThreadCount() < threadCount - 1) {
        if(flags & ImporterFlag::Verbose)
            Debug{} << "Texpack::imageFromExr(): increasing global OpenEXR thread pool from" << Imf::globalThreadCount() << "to" << threadCount - 1 << "extra worker threads";
        Imf::setGlobalThreadCount(threadCount - 1);
    }

    /* OpenEXR parses the file from its start, including the magic */
    if(file.seekFromStart(position) != ErrorCode::NoError) {
        Error{} << "Texpack::imageFromExr(): can't seek back to" << position;
        return ErrorCode::SeekError;
    }

    Implementation::VFileIStream stream{file};
    Containers::Optional<Imf::InputFile> input;
    try {
        input.emplace(stream, Math::max(threadCount - 1, 0));
    } catch(const Iex::BaseExc& e) {
        /* e.message() is only since 2.3.0, use what() for compatibility */
        Error{} << "Texpack::imageFromExr(): can't read the header:" << e.what();
        return ErrorCode::BadHeaderError;
    }

    const Imath::Box2i dataWindow = input->header().dataWindow();
    const UnsignedInt width = dataWindow.max.x - dataWindow.min.x + 1;
    const UnsignedInt height = dataWindow.max.y - dataWindow.min.y + 1;

    /* Group channels into layers. The channel list is sorted by name, so
       channels of one layer are next to each other, but that's not relied
       upon. */
    Containers::Array<Layer> layers;
    const Imf::ChannelList& channels = input->header().channels();
    for(Imf::ChannelList::ConstIterator it = channels.begin(); it != channels.end(); ++it) {
        const Containers::StringView name = it.name();
        const Containers::StringView separator = name.findLast('.');
        const Containers::StringView layerName = separator.data() ?
            name.prefix(separator.data() - name.data()) : name.prefix(0);
        const Containers::StringView letter = separator.data() ?
            name.exceptPrefix(separator.data() + 1 - name.data()) : name;

        if(!layerFilter.isEmpty() && layerName != layerFilter)
            continue;

        const Imf::Channel& channel = it.channel();
        CORRADE_INTERNAL_ASSERT(UnsignedInt(channel.type) < Imf::NUM_PIXELTYPES);
        if(channel.xSampling != 1 || channel.ySampling != 1) {
            Warning{} << "Texpack::imageFromExr(): skipping subsampled channel" << name;
            continue;
        }

        Layer* layer = nullptr;
        for(Layer& i: layers) if(i.name == layerName) {
            layer = &i;
            break;
        }
        if(!layer) {
            Layer& newLayer = arrayAppend(layers, InPlaceInit);
            newLayer.name = layerName;
            newLayer.type = channel.type;
            layer = &newLayer;
        }

        if(channel.type != layer->type) {
            Warning{} << "Texpack::imageFromExr(): skipping channel" << name << "of type" << PixelTypeName[channel.type] << "in a layer of type" << PixelTypeName[layer->type];
            continue;
        }

        arrayAppend(layer->channels, Channel{it.name(), letter});
    }

    /* Assign components. A single channel always goes to the first one. */
    for(Layer& layer: layers) {
        if(layer.channels.size() == 1) {
            layer.components[0] = layer.channels[0].name;
            layer.componentCount = 1;
            continue;
        }

        for(const Channel& channel: layer.channels) {
            const Int component = componentForLetter(channel.letter);
            if(component == -1) {
                Warning{} << "Texpack::imageFromExr(): skipping channel" << channel.name << "with an unknown name";
                continue;
            }
            if(layer.components[component]) {
                Warning{} << "Texpack::imageFromExr(): skipping channel" << channel.name << "as it maps to the same component as" << layer.components[component];
                continue;
            }

            layer.components[component] = channel.name;
            layer.componentCount = Math::max(layer.componentCount, UnsignedInt(component) + 1);
        }
    }

    /* Create one image per layer and set up a single framebuffer for all of
       them. The images are zero-filled for the components with no channel. */
    Containers::Array<Image> images;
    Imf::FrameBuffer framebuffer;
    for(const Layer& layer: layers) {
        if(!layer.componentCount) continue;

        Containers::StringView layerName = layer.name;
        if(layerName.size() >= LayerExtension::NameSize) {
            Warning{} << "Texpack::imageFromExr(): layer name" << layerName << "too long, truncating to" << LayerExtension::NameSize - 1 << "characters";
            layerName = layerName.prefix(LayerExtension::NameSize - 1);
        }

        const LayerExtension extension{layerName};
        Image& out = arrayAppend(images, InPlaceInit,
            ImageConfig{Formats[layer.type][layer.componentCount - 1], width, height},
            std::initializer_list<Containers::ArrayView<const char>>{extension.data()});
        out.clear();

        const std::size_t channelSize = ChannelSizes[layer.type];
        const std::size_t pixelSize = channelSize*layer.componentCount;
        const std::size_t rowStride = pixelSize*width;
        for(std::size_t i = 0; i != layer.componentCount; ++i) {
            if(!layer.components[i]) continue;

            framebuffer.insert(layer.components[i], Imf::Slice{
                layer.type,
                out.pixels().data()
                    /* The pointer is expected to point to the first pixel
                       ever, not the first pixel inside the data window */
                    - dataWindow.min.y*rowStride
                    - dataWindow.min.x*pixelSize
                    /* And an offset to this channel, as they're interleaved */
                    + i*channelSize,
                pixelSize,
                rowStride});
        }

        if(flags & ImporterFlag::Verbose)
            Debug{} << "Texpack::imageFromExr(): importing layer" << layer.name << "as" << out.config().format();
    }

    if(images.isEmpty()) {
        Error{} << "Texpack::imageFromExr(): no usable layers found";
        return ErrorCode::BadImageError;
    }

    try {
        input->setFrameBuffer(framebuffer);
        input->readPixels(dataWindow.min.y, dataWindow.max.y);
    } catch(const Iex::BaseExc& e) {
        Error{} << "Texpack::imageFromExr(): can't read the pixels:" << e.what();
        return ErrorCode::BadImageError;
    }

    /* OpenEXR has the top row first, flip to have the bottom row first */
    for(Image& out: images) {
        const Containers::ArrayView<char> pixels = out.pixels();
        const std::size_t rowSize = pixels.size()/height;
        for(std::size_t y = 0; y != height/2; ++y) {
            char* const top = pixels + y*rowSize;
            std::swap_ranges(top, top + rowSize, pixels + (height - y - 1)*rowSize);
        }
    }

    Containers::Optional<Image> chain = std::move(images[0]);
    for(std::size_t i = 1; i != images.size(); ++i)
        *chain = Image::destructiveJoin(std::move(*chain), std::move(images[i]));

    image = std::move(chain);
    return ErrorCode::NoError;
}

}
