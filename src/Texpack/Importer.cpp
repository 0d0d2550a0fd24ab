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

#include "Importer.h"

#include <cstring>
#include <string>
#include <Corrade/Containers/Array.h>
#include <Corrade/Containers/EnumSet.hpp>
#include <Corrade/Containers/StringStl.h>
#include <Corrade/Utility/Algorithms.h>
#include <Corrade/Utility/ConfigurationGroup.h>
#include <Corrade/Utility/Debug.h>

#include "Texpack/FileVFile.h"
#include "Texpack/Image.h"
#include "Texpack/KtxLoader.h"
#include "Texpack/MemoryVFile.h"
#include "Texpack/OpenExr.h"

namespace Texpack {

Debug& operator<<(Debug& debug, const ImporterFlag value) {
    switch(value) {
        /* LCOV_EXCL_START */
        #define _c(value) case ImporterFlag::value: return debug << "Texpack::ImporterFlag::" #value;
        _c(Verbose)
        #undef _c
        /* LCOV_EXCL_STOP */
    }

    return debug << "Texpack::ImporterFlag(" << Debug::nospace << reinterpret_cast<void*>(UnsignedByte(value)) << Debug::nospace << ")";
}

Debug& operator<<(Debug& debug, const ImporterFlags value) {
    return Containers::enumSetDebugOutput(debug, value, "Texpack::ImporterFlags{}", {
        ImporterFlag::Verbose});
}

namespace {

constexpr char KtxMagic[4]{'\xab', 'K', 'T', 'X'};
constexpr char ExrMagic[4]{'\x76', '\x2f', '\x31', '\x01'};

}

struct Importer::State {
    ImporterFlags flags;
    Utility::ConfigurationGroup configuration;
};

Importer::Importer(const ImporterFlags flags): _state{InPlaceInit} {
    _state->flags = flags;
    _state->configuration.setValue("ktxLevels", 0u);
    _state->configuration.setValue("exrThreads", 1);
    _state->configuration.setValue("exrLayer", std::string{});
}

Importer::Importer(Importer&&) noexcept = default;

Importer::~Importer() = default;

Importer& Importer::operator=(Importer&&) noexcept = default;

ImporterFlags Importer::flags() const { return _state->flags; }

void Importer::setFlags(const ImporterFlags flags) { _state->flags = flags; }

Utility::ConfigurationGroup& Importer::configuration() { return _state->configuration; }

const Utility::ConfigurationGroup& Importer::configuration() const { return _state->configuration; }

ErrorCode Importer::open(VFile& file, Containers::Optional<Image>& image) {
    const std::size_t start = file.tell();
    char magic[4];
    if(file.read(magic) != ErrorCode::NoError) {
        Error{} << "Texpack::Importer::open(): file too short to detect its format";
        return ErrorCode::UnknownFormatError;
    }

    /* The loaders expect the file at the start again */
    const ErrorCode error = file.seekFromStart(start);
    if(error != ErrorCode::NoError) return error;

    if(std::memcmp(magic, KtxMagic, sizeof(magic)) == 0) {
        if(_state->flags & ImporterFlag::Verbose)
            Debug{} << "Texpack::Importer::open(): detected a KTX file";
        return imageFromKtx(file, image,
            _state->configuration.value<UnsignedInt>("ktxLevels"),
            _state->flags);
    }

    if(std::memcmp(magic, ExrMagic, sizeof(magic)) == 0) {
        if(_state->flags & ImporterFlag::Verbose)
            Debug{} << "Texpack::Importer::open(): detected an OpenEXR file";
        const std::string layer = _state->configuration.value<std::string>("exrLayer");
        return imageFromExr(file, image, layer,
            _state->configuration.value<Int>("exrThreads"),
            _state->flags);
    }

    Error{} << "Texpack::Importer::open(): unknown file signature" << Containers::StringView{magic, sizeof(magic)};
    return ErrorCode::UnknownFormatError;
}

ErrorCode Importer::openData(const Containers::ArrayView<const char> data, Containers::Optional<Image>& image) {
    Containers::Array<char> copy{NoInit, data.size()};
    Utility::copy(data, copy);
    MemoryVFile file{std::move(copy)};
    return open(file, image);
}

ErrorCode Importer::openFile(const Containers::StringView filename, Containers::Optional<Image>& image) {
    FileVFile file;
    const ErrorCode error = file.open(filename, FileMode::Read);
    if(error != ErrorCode::NoError) return error;

    return open(file, image);
}

}
