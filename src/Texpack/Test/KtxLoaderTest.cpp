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
#include <cstring>
#include <sstream>
#include <Corrade/Containers/Array.h>
#include <Corrade/Containers/GrowableArray.h>
#include <Corrade/Containers/Optional.h>
#include <Corrade/Containers/StringView.h>
#include <Corrade/TestSuite/Tester.h>
#include <Corrade/TestSuite/Compare/Container.h>
#include <Corrade/TestSuite/Compare/Numeric.h>
#include <Corrade/Utility/DebugStl.h>
#include <Corrade/Utility/Endianness.h>
#include <Corrade/Utility/FormatStl.h>

#include "Texpack/Image.h"
#include "Texpack/KtxLoader.h"
#include "Texpack/MemoryVFile.h"
#include "Texpack/Implementation/KtxHeader.h"

namespace Texpack { namespace Test { namespace {

using namespace Implementation;

struct KtxLoaderTest: TestSuite::Tester {
    explicit KtxLoaderTest();

    void readHeader();
    void readHeaderVerbose();
    void readHeaderShort();
    void readHeaderInvalid();
    void readHeaderKeyValueShort();
    void queryNoHeader();
    void readHeaderUnknownFormat();

    void dimensions1D();
    void dimensions3D();
    void dimensionsCubemapArray();

    void foreignEndian();
    void foreignEndianTypeSize();

    void keyValue();
    void keyValueMalformed();

    void imageSizeOf();
    void imageSizeOfCached();
    void imageSizeOfOutOfRange();
    void imageSizeOfCubemap();
    void imageSizeOfMissing();
    void imageSizeOfEmpty();

    void imageDataAt();
    void imageDataAtCached();
    void imageDataAtTruncated();
    void imageDataAtSizeTooLarge();

    void fromKtx();
    void fromKtxMipLevels();
    void fromKtxLevelLimit();
    void fromKtxCubemap();
    void fromKtxArray();
    void fromKtx3D();
    void fromKtxCompressed();
    void fromKtxUnknownFormat();
    void fromKtxTruncated();
};

const struct {
    const char* name;
    const std::size_t length;
} ShortData[]{
    {"identifier", sizeof(KtxHeader::identifier) - 1},
    {"header", sizeof(KtxHeader) - 1}
};

const struct {
    const char* name;
    const std::size_t offset;
    const UnsignedInt value;
    const ErrorCode error;
    const char* message;
} InvalidData[]{
    {"signature", offsetof(KtxHeader, identifier) + 8, 0,
        ErrorCode::NotValidError, "wrong file signature"},
    {"endianness", offsetof(KtxHeader, endianness), 0x12345678,
        ErrorCode::NotValidError, "invalid endianness marker 0x12345678"},
    {"face count", offsetof(KtxHeader, numberOfFaces), 3,
        ErrorCode::UnsupportedError, "expected either 1 or 6 faces but got 3"},
    {"zero width", offsetof(KtxHeader, pixelWidth), 0,
        ErrorCode::NotValidError, "image width is zero"},
    {"too many levels", offsetof(KtxHeader, numberOfMipmapLevels), 4,
        ErrorCode::NotValidError, "expected at most 3 mip levels but got 4"},
    {"level count overflow", offsetof(KtxHeader, numberOfMipmapLevels), 0xffffffffu,
        ErrorCode::NotValidError, "expected at most 3 mip levels but got 4294967295"},
    {"key/value data too large", offsetof(KtxHeader, bytesOfKeyValueData), 0xffffffffu,
        ErrorCode::NotValidError, "file too short, expected 4294967295 bytes of key/value data but got only 0"}
};

KtxLoaderTest::KtxLoaderTest() {
    addTests({&KtxLoaderTest::readHeader,
              &KtxLoaderTest::readHeaderVerbose});

    addInstancedTests({&KtxLoaderTest::readHeaderShort},
        Containers::arraySize(ShortData));

    addInstancedTests({&KtxLoaderTest::readHeaderInvalid},
        Containers::arraySize(InvalidData));

    addTests({&KtxLoaderTest::readHeaderKeyValueShort,
              &KtxLoaderTest::queryNoHeader,
              &KtxLoaderTest::readHeaderUnknownFormat,

              &KtxLoaderTest::dimensions1D,
              &KtxLoaderTest::dimensions3D,
              &KtxLoaderTest::dimensionsCubemapArray,

              &KtxLoaderTest::foreignEndian,
              &KtxLoaderTest::foreignEndianTypeSize,

              &KtxLoaderTest::keyValue,
              &KtxLoaderTest::keyValueMalformed,

              &KtxLoaderTest::imageSizeOf,
              &KtxLoaderTest::imageSizeOfCached,
              &KtxLoaderTest::imageSizeOfOutOfRange,
              &KtxLoaderTest::imageSizeOfCubemap,
              &KtxLoaderTest::imageSizeOfMissing,
              &KtxLoaderTest::imageSizeOfEmpty,

              &KtxLoaderTest::imageDataAt,
              &KtxLoaderTest::imageDataAtCached,
              &KtxLoaderTest::imageDataAtTruncated,
              &KtxLoaderTest::imageDataAtSizeTooLarge,

              &KtxLoaderTest::fromKtx,
              &KtxLoaderTest::fromKtxMipLevels,
              &KtxLoaderTest::fromKtxLevelLimit,
              &KtxLoaderTest::fromKtxCubemap,
              &KtxLoaderTest::fromKtxArray,
              &KtxLoaderTest::fromKtx3D,
              &KtxLoaderTest::fromKtxCompressed,
              &KtxLoaderTest::fromKtxUnknownFormat,
              &KtxLoaderTest::fromKtxTruncated});
}

/* Forwards to a memory file and counts the reads */
class CountingVFile: public VFile {
    public:
        explicit CountingVFile(Containers::ArrayView<char> data): _file{data}, _readCount{} {}

        std::size_t readCount() const { return _readCount; }

    private:
        VFileType doType() const override { return _file.type(); }
        bool doIsOpen() const override { return _file.isOpen(); }
        ErrorCode doRead(Containers::ArrayView<char> buffer, std::size_t& count) override {
            ++_readCount;
            return _file.read(buffer, count);
        }
        ErrorCode doWrite(Containers::ArrayView<const char> buffer, std::size_t& count) override {
            return _file.write(buffer, count);
        }
        ErrorCode doSeekFromStart(UnsignedLong offset) override {
            return _file.seekFromStart(offset);
        }
        ErrorCode doSeekFromCurrent(Long offset) override {
            return _file.seekFromCurrent(offset);
        }
        ErrorCode doSeekFromEnd(Long offset) override {
            return _file.seekFromEnd(offset);
        }
        std::size_t doTell() const override { return _file.tell(); }
        std::size_t doByteCount() const override { return _file.byteCount(); }
        void doClose() override { _file.close(); }

        MemoryVFile _file;
        std::size_t _readCount;
};

KtxHeader header(const UnsignedInt width, const UnsignedInt height, const UnsignedInt levels = 0) {
    KtxHeader header{};
    std::memcpy(header.identifier, KtxFileIdentifier, sizeof(header.identifier));
    header.endianness = KtxEndianness;
    header.glType = GL_UNSIGNED_BYTE;
    header.glTypeSize = 1;
    header.glFormat = GL_RGBA;
    header.glInternalFormat = GL_RGBA8;
    header.glBaseInternalFormat = GL_RGBA;
    header.pixelWidth = width;
    header.pixelHeight = height;
    header.numberOfFaces = 1;
    header.numberOfMipmapLevels = levels;
    return header;
}

Containers::Array<char> file(KtxHeader header, Containers::ArrayView<const char> keyValueData = {}) {
    header.bytesOfKeyValueData = keyValueData.size();

    Containers::Array<char> out;
    arrayAppend(out, Containers::arrayView(reinterpret_cast<const char*>(&header), sizeof(header)));
    arrayAppend(out, keyValueData);
    return out;
}

/* The data are expected to contain all padding */
void appendLevel(Containers::Array<char>& out, const UnsignedInt imageSize, Containers::ArrayView<const char> data) {
    arrayAppend(out, Containers::arrayView(reinterpret_cast<const char*>(&imageSize), sizeof(imageSize)));
    arrayAppend(out, data);
}

Containers::Array<char> sequence(const std::size_t size, const char start = 0) {
    Containers::Array<char> out{NoInit, size};
    for(std::size_t i = 0; i != size; ++i) out[i] = char(start + i);
    return out;
}

void KtxLoaderTest::readHeader() {
    Containers::Array<char> data = file(header(4, 2));
    appendLevel(data, 32, sequence(32));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_VERIFY(!loader.isHeaderValid());
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_VERIFY(loader.isHeaderValid());
    CORRADE_VERIFY(loader.isSameEndian());
    CORRADE_COMPARE(loader.format(), ImageFormat{PixelFormat::RGBA8Unorm});
    CORRADE_COMPARE(loader.typeSize(), 1);
    CORRADE_COMPARE(loader.width(), 4);
    CORRADE_COMPARE(loader.height(), 2);
    CORRADE_COMPARE(loader.depth(), 0);
    CORRADE_COMPARE(loader.arrayElementCount(), 0);
    CORRADE_COMPARE(loader.faceCount(), 1);
    /* Zero levels in the file mean just the top one */
    CORRADE_COMPARE(loader.levelCount(), 1);
    CORRADE_VERIFY(!loader.is1D());
    CORRADE_VERIFY(loader.is2D());
    CORRADE_VERIFY(!loader.is3D());
    CORRADE_VERIFY(!loader.isCubemap());
    CORRADE_VERIFY(!loader.isArray());
    CORRADE_VERIFY(loader.keyValueData().isEmpty());
}

void KtxLoaderTest::readHeaderVerbose() {
    Containers::Array<char> data = file(header(4, 2));
    MemoryVFile vfile{data};

    std::ostringstream out;
    Debug redirectOutput{&out};
    KtxLoader loader{vfile, ImporterFlag::Verbose};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::readHeader(): 4x2x0 image with 0 array elements, 1 faces and 1 levels in PixelFormat::RGBA8Unorm\n");
}

void KtxLoaderTest::readHeaderShort() {
    auto&& data = ShortData[testCaseInstanceId()];
    setTestCaseDescription(data.name);

    Containers::Array<char> fileData = file(header(4, 2));
    MemoryVFile vfile{fileData.prefix(data.length)};

    std::ostringstream out;
    Error redirectError{&out};
    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NotValidError);
    CORRADE_VERIFY(!loader.isHeaderValid());
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::readHeader(): file too short, expected at least 64 bytes\n");
}

void KtxLoaderTest::readHeaderInvalid() {
    auto&& data = InvalidData[testCaseInstanceId()];
    setTestCaseDescription(data.name);

    Containers::Array<char> fileData = file(header(4, 2));
    std::memcpy(fileData + data.offset, &data.value, sizeof(data.value));
    MemoryVFile vfile{fileData};

    std::ostringstream out;
    Error redirectError{&out};
    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), data.error);
    CORRADE_VERIFY(!loader.isHeaderValid());
    CORRADE_COMPARE(out.str(), Utility::formatString("Texpack::KtxLoader::readHeader(): {}\n", data.message));
}

void KtxLoaderTest::readHeaderKeyValueShort() {
    Containers::Array<char> data = file(header(4, 2), sequence(16));
    /* Claim more key/value data than there is */
    const UnsignedInt size = 100;
    std::memcpy(data + offsetof(KtxHeader, bytesOfKeyValueData), &size, sizeof(size));
    MemoryVFile vfile{data};

    std::ostringstream out;
    Error redirectError{&out};
    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NotValidError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::readHeader(): file too short, expected 100 bytes of key/value data but got only 16\n");
}

void KtxLoaderTest::queryNoHeader() {
    #ifdef CORRADE_NO_ASSERT
    CORRADE_SKIP("CORRADE_NO_ASSERT defined, can't test assertions");
    #endif

    /* The header is rejected, so nothing can be queried afterwards either */
    Containers::Array<char> data = file(header(4, 2, 4));
    MemoryVFile vfile{data};
    KtxLoader loader{vfile};

    std::ostringstream out;
    {
        Error redirectError{&out};
        CORRADE_COMPARE(loader.readHeader(), ErrorCode::NotValidError);
    }
    CORRADE_VERIFY(!loader.isHeaderValid());

    out.str({});
    Error redirectError{&out};
    loader.width();
    loader.levelCount();
    loader.format();
    loader.isCubemap();
    loader.keyValueData();
    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(0, size), ErrorCode::InitError);
    CORRADE_COMPARE(out.str(),
        "Texpack::KtxLoader::width(): no valid header read\n"
        "Texpack::KtxLoader::levelCount(): no valid header read\n"
        "Texpack::KtxLoader::format(): no valid header read\n"
        "Texpack::KtxLoader::isCubemap(): no valid header read\n"
        "Texpack::KtxLoader::keyValueData(): no valid header read\n"
        "Texpack::KtxLoader::imageSizeOf(): no valid header read\n");
}

void KtxLoaderTest::readHeaderUnknownFormat() {
    KtxHeader h = header(4, 2);
    h.glInternalFormat = 0xdead;
    Containers::Array<char> data = file(h);
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_VERIFY(!loader.format());
}

void KtxLoaderTest::dimensions1D() {
    Containers::Array<char> data = file(header(16, 0));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_VERIFY(loader.is1D());
    CORRADE_VERIFY(!loader.is2D());
    CORRADE_VERIFY(!loader.is3D());
}

void KtxLoaderTest::dimensions3D() {
    KtxHeader h = header(4, 4);
    h.pixelDepth = 4;
    Containers::Array<char> data = file(h);
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_VERIFY(!loader.is1D());
    CORRADE_VERIFY(!loader.is2D());
    CORRADE_VERIFY(loader.is3D());
}

void KtxLoaderTest::dimensionsCubemapArray() {
    KtxHeader h = header(4, 4);
    h.numberOfFaces = 6;
    h.numberOfArrayElements = 3;
    Containers::Array<char> data = file(h);
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_VERIFY(loader.is2D());
    CORRADE_VERIFY(loader.isCubemap());
    CORRADE_VERIFY(loader.isArray());
    CORRADE_COMPARE(loader.faceCount(), 6);
    CORRADE_COMPARE(loader.arrayElementCount(), 3);
}

void KtxLoaderTest::foreignEndian() {
    KtxHeader h = header(1, 1);
    h.glType = GL_UNSIGNED_SHORT;
    h.glTypeSize = 2;
    h.glInternalFormat = GL_RGBA16;
    Utility::Endianness::swapInPlace(h.endianness,
        h.glType, h.glTypeSize, h.glFormat, h.glInternalFormat,
        h.glBaseInternalFormat, h.pixelWidth, h.pixelHeight,
        h.numberOfFaces);
    Containers::Array<char> data = file(h);

    /* Image size and the pixel data swapped as well */
    UnsignedShort pixel[]{0x0102, 0x0304, 0x0506, 0x0708};
    for(UnsignedShort& i: pixel) Utility::Endianness::swapInPlace(i);
    appendLevel(data, Utility::Endianness::swap(UnsignedInt(sizeof(pixel))), Containers::arrayCast<const char>(Containers::arrayView(pixel)));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_VERIFY(!loader.isSameEndian());
    CORRADE_COMPARE(loader.width(), 1);
    CORRADE_COMPARE(loader.typeSize(), 2);
    CORRADE_COMPARE(loader.format(), ImageFormat{PixelFormat::RGBA16Unorm});

    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(0, size), ErrorCode::NoError);
    CORRADE_COMPARE(size, 8);

    Containers::ArrayView<const char> level;
    CORRADE_COMPARE(loader.imageDataAt(0, level), ErrorCode::NoError);
    CORRADE_COMPARE_AS(Containers::arrayCast<const UnsignedShort>(level),
        Containers::arrayView<UnsignedShort>({0x0102, 0x0304, 0x0506, 0x0708}),
        TestSuite::Compare::Container);
}

void KtxLoaderTest::foreignEndianTypeSize() {
    KtxHeader h = header(1, 1);
    h.glTypeSize = 3;
    Utility::Endianness::swapInPlace(h.endianness, h.glTypeSize,
        h.pixelWidth, h.pixelHeight, h.numberOfFaces);
    Containers::Array<char> data = file(h);
    MemoryVFile vfile{data};

    std::ostringstream out;
    Error redirectError{&out};
    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::UnsupportedError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::readHeader(): can't byte-swap data with type size 3\n");
}

/* Size prefix, key, value and padding to four bytes */
constexpr char KeyValueData[]{
    23, 0, 0, 0, 'K', 'T', 'X', 'o', 'r', 'i', 'e', 'n', 't', 'a', 't', 'i', 'o', 'n', '\0', 'S', '=', 'r', ',', 'T', '=', 'u', '\0', 0,
    9, 0, 0, 0, 'b', 'i', 'n', 'a', 'r', 'y', '\0', '\x01', '\x02', 0, 0, 0
};

void KtxLoaderTest::keyValue() {
    /* The sizes in the data are little-endian */
    if(Utility::Endianness::isBigEndian())
        CORRADE_SKIP("Key/value test data are little-endian.");

    Containers::Array<char> data = file(header(4, 2), KeyValueData);
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_COMPARE(loader.keyValueData().size(), sizeof(KeyValueData));

    Containers::Optional<Containers::StringView> orientation = loader.keyValue("KTXorientation");
    CORRADE_VERIFY(orientation);
    CORRADE_COMPARE(*orientation, "S=r,T=u");

    /* Binary value without a null terminator */
    Containers::Optional<Containers::StringView> binary = loader.keyValue("binary");
    CORRADE_VERIFY(binary);
    CORRADE_COMPARE(binary->size(), 2);
    CORRADE_COMPARE((*binary)[1], '\x02');

    CORRADE_VERIFY(!loader.keyValue("missing"));
    /* Keys are compared as a whole */
    CORRADE_VERIFY(!loader.keyValue("KTX"));
}

void KtxLoaderTest::keyValueMalformed() {
    if(Utility::Endianness::isBigEndian())
        CORRADE_SKIP("Key/value test data are little-endian.");

    /* The first entry claims more bytes than there are */
    constexpr char malformed[]{40, 0, 0, 0, 'k', 'e', 'y', '\0'};
    Containers::Array<char> data = file(header(4, 2), malformed);
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    std::ostringstream out;
    Warning redirectWarning{&out};
    CORRADE_VERIFY(!loader.keyValue("key"));
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::keyValue(): key/value pair at offset 0 expected to have 40 bytes but got 4\n");
}

Containers::Array<char> twoLevels() {
    Containers::Array<char> data = file(header(4, 4, 2));
    appendLevel(data, 64, sequence(64));
    appendLevel(data, 16, sequence(16, 100));
    return data;
}

void KtxLoaderTest::imageSizeOf() {
    Containers::Array<char> data = twoLevels();
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    CORRADE_COMPARE(loader.levelCount(), 2);

    /* Out of order to check that earlier levels get resolved as well */
    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(1, size), ErrorCode::NoError);
    CORRADE_COMPARE(size, 16);
    CORRADE_COMPARE(loader.imageSizeOf(0, size), ErrorCode::NoError);
    CORRADE_COMPARE(size, 64);
}

void KtxLoaderTest::imageSizeOfCached() {
    Containers::Array<char> data = twoLevels();
    CountingVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);
    const std::size_t headerReadCount = vfile.readCount();

    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(1, size), ErrorCode::NoError);
    CORRADE_COMPARE(size, 16);
    const std::size_t readCount = vfile.readCount();
    CORRADE_COMPARE_AS(readCount, headerReadCount, TestSuite::Compare::Greater);

    /* No I/O the second time */
    std::size_t sizeAgain;
    CORRADE_COMPARE(loader.imageSizeOf(1, sizeAgain), ErrorCode::NoError);
    CORRADE_COMPARE(sizeAgain, size);
    CORRADE_COMPARE(loader.imageSizeOf(0, sizeAgain), ErrorCode::NoError);
    CORRADE_COMPARE(vfile.readCount(), readCount);
}

void KtxLoaderTest::imageSizeOfOutOfRange() {
    Containers::Array<char> data = twoLevels();
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    std::ostringstream out;
    Error redirectError{&out};
    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(2, size), ErrorCode::MipMapError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::imageSizeOf(): level 2 out of range for 2 levels\n");
}

void KtxLoaderTest::imageSizeOfCubemap() {
    KtxHeader h = header(2, 2);
    h.numberOfFaces = 6;
    Containers::Array<char> data = file(h);
    /* The size prefix is for a single face */
    appendLevel(data, 16, sequence(6*16));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(0, size), ErrorCode::NoError);
    CORRADE_COMPARE(size, 96);
}

void KtxLoaderTest::imageSizeOfMissing() {
    Containers::Array<char> data = file(header(4, 4, 2));
    appendLevel(data, 64, sequence(64));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    std::ostringstream out;
    Error redirectError{&out};
    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(1, size), ErrorCode::NotValidError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::imageSizeOf(): can't read the size of level 1\n");
}

void KtxLoaderTest::imageSizeOfEmpty() {
    Containers::Array<char> data = file(header(4, 4));
    appendLevel(data, 0, nullptr);
    /* Some trailing bytes so the file isn't just a header */
    arrayAppend(data, Containers::arrayView("abcd", 4));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    std::ostringstream out;
    Error redirectError{&out};
    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(0, size), ErrorCode::MipMapError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::imageSizeOf(): level 0 is empty\n");
}

void KtxLoaderTest::imageDataAt() {
    Containers::Array<char> data = twoLevels();
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    Containers::ArrayView<const char> level1;
    CORRADE_COMPARE(loader.imageDataAt(1, level1), ErrorCode::NoError);
    CORRADE_COMPARE_AS(level1, sequence(16, 100), TestSuite::Compare::Container);

    Containers::ArrayView<const char> level0;
    CORRADE_COMPARE(loader.imageDataAt(0, level0), ErrorCode::NoError);
    CORRADE_COMPARE_AS(level0, sequence(64), TestSuite::Compare::Container);
}

void KtxLoaderTest::imageDataAtCached() {
    Containers::Array<char> data = twoLevels();
    CountingVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    Containers::ArrayView<const char> level;
    CORRADE_COMPARE(loader.imageDataAt(1, level), ErrorCode::NoError);
    const std::size_t readCount = vfile.readCount();

    Containers::ArrayView<const char> levelAgain;
    CORRADE_COMPARE(loader.imageDataAt(1, levelAgain), ErrorCode::NoError);
    CORRADE_COMPARE(static_cast<const void*>(levelAgain.data()), static_cast<const void*>(level.data()));
    CORRADE_COMPARE(levelAgain.size(), level.size());
    CORRADE_COMPARE(vfile.readCount(), readCount);
}

void KtxLoaderTest::imageDataAtTruncated() {
    Containers::Array<char> data = file(header(4, 4));
    appendLevel(data, 64, sequence(10));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    std::ostringstream out;
    Error redirectError{&out};
    Containers::ArrayView<const char> level;
    CORRADE_COMPARE(loader.imageDataAt(0, level), ErrorCode::MipMapError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::imageDataAt(): data of level 0 are truncated, expected 64 bytes but got only 10\n");
}

void KtxLoaderTest::imageDataAtSizeTooLarge() {
    /* The face size of a cube map gets multiplied by six, which would be
       about 24 GB here. It's rejected before allocating anything. */
    KtxHeader h = header(4, 4);
    h.numberOfFaces = 6;
    Containers::Array<char> data = file(h);
    appendLevel(data, 0xfffffffcu, sequence(8));
    MemoryVFile vfile{data};

    KtxLoader loader{vfile};
    CORRADE_COMPARE(loader.readHeader(), ErrorCode::NoError);

    std::size_t size;
    CORRADE_COMPARE(loader.imageSizeOf(0, size), ErrorCode::NoError);
    CORRADE_COMPARE(size, std::size_t{0xfffffffcu}*6);

    std::ostringstream out;
    Error redirectError{&out};
    Containers::ArrayView<const char> level;
    CORRADE_COMPARE(loader.imageDataAt(0, level), ErrorCode::MipMapError);
    CORRADE_COMPARE(out.str(), "Texpack::KtxLoader::imageDataAt(): data of level 0 are truncated, expected 25769803752 bytes but got only 8\n");
}

void KtxLoaderTest::fromKtx() {
    /* RGB rows of 3 pixels are padded from 9 to 12 bytes */
    KtxHeader h = header(3, 2);
    h.glFormat = GL_RGB;
    h.glInternalFormat = GL_RGB8;
    h.glBaseInternalFormat = GL_RGB;
    Containers::Array<char> data = file(h);
    constexpr char pixels[]{
        1, 2, 3, 4, 5, 6, 7, 8, 9, 0, 0, 0,
        10, 11, 12, 13, 14, 15, 16, 17, 18, 0, 0, 0
    };
    appendLevel(data, sizeof(pixels), pixels);
    MemoryVFile vfile{data};

    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::NoError);
    CORRADE_VERIFY(image);
    CORRADE_COMPARE(image->imageChainLength(), 1);

    const ImageConfig config = image->config();
    CORRADE_COMPARE(config.format(), ImageFormat{PixelFormat::RGB8Unorm});
    CORRADE_COMPARE(config.width(), 3);
    CORRADE_COMPARE(config.height(), 2);
    CORRADE_COMPARE(config.depth(), 1);
    CORRADE_COMPARE(config.slices(), 1);
    CORRADE_COMPARE(config.flags(), ImageFlags{});
    CORRADE_COMPARE_AS(image->pixels(), Containers::arrayView<char>({
        1, 2, 3, 4, 5, 6, 7, 8, 9,
        10, 11, 12, 13, 14, 15, 16, 17, 18
    }), TestSuite::Compare::Container);
}

void KtxLoaderTest::fromKtxMipLevels() {
    Containers::Array<char> data = file(header(4, 2, 3));
    appendLevel(data, 32, sequence(32));
    appendLevel(data, 8, sequence(8, 50));
    appendLevel(data, 4, sequence(4, 100));
    MemoryVFile vfile{data};

    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::NoError);
    CORRADE_VERIFY(image);

    Containers::Array<MutableImageRecord> records = image->records();
    CORRADE_COMPARE(records.size(), 3);
    CORRADE_COMPARE(records[0].config().width(), 4);
    CORRADE_COMPARE(records[0].config().height(), 2);
    CORRADE_COMPARE(records[1].config().width(), 2);
    CORRADE_COMPARE(records[1].config().height(), 1);
    CORRADE_COMPARE(records[2].config().width(), 1);
    CORRADE_COMPARE(records[2].config().height(), 1);
    CORRADE_COMPARE_AS(records[1].data(), sequence(8, 50), TestSuite::Compare::Container);
    CORRADE_COMPARE_AS(records[2].data(), sequence(4, 100), TestSuite::Compare::Container);
}

void KtxLoaderTest::fromKtxLevelLimit() {
    Containers::Array<char> data = file(header(4, 2, 3));
    appendLevel(data, 32, sequence(32));
    /* The other levels are never touched */
    MemoryVFile vfile{data};

    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image, 1), ErrorCode::NoError);
    CORRADE_VERIFY(image);
    CORRADE_COMPARE(image->imageChainLength(), 1);
    CORRADE_COMPARE(image->config().width(), 4);
}

void KtxLoaderTest::fromKtxCubemap() {
    KtxHeader h = header(1, 1);
    h.numberOfFaces = 6;
    Containers::Array<char> data = file(h);
    appendLevel(data, 4, sequence(24));
    MemoryVFile vfile{data};

    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::NoError);
    CORRADE_VERIFY(image);

    const ImageConfig config = image->config();
    CORRADE_COMPARE(config.slices(), 6);
    CORRADE_COMPARE(config.flags(), ImageFlag::Cubemap);
    CORRADE_COMPARE_AS(image->pixels(), sequence(24), TestSuite::Compare::Container);
}

void KtxLoaderTest::fromKtxArray() {
    /* Rows of two R8 pixels are padded to four bytes */
    KtxHeader h = header(2, 1);
    h.glFormat = GL_RED;
    h.glInternalFormat = GL_R8;
    h.glBaseInternalFormat = GL_RED;
    h.numberOfArrayElements = 3;
    Containers::Array<char> data = file(h);
    constexpr char pixels[]{
        1, 2, 0, 0,
        3, 4, 0, 0,
        5, 6, 0, 0
    };
    appendLevel(data, sizeof(pixels), pixels);
    MemoryVFile vfile{data};

    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::NoError);
    CORRADE_VERIFY(image);

    const ImageConfig config = image->config();
    CORRADE_COMPARE(config.format(), ImageFormat{PixelFormat::R8Unorm});
    CORRADE_COMPARE(config.slices(), 3);
    CORRADE_COMPARE(config.flags(), ImageFlags{});
    CORRADE_COMPARE_AS(image->pixels(), Containers::arrayView<char>({
        1, 2, 3, 4, 5, 6
    }), TestSuite::Compare::Container);
}

void KtxLoaderTest::fromKtx3D() {
    KtxHeader h = header(2, 2);
    h.glFormat = GL_RED;
    h.glInternalFormat = GL_R8;
    h.glBaseInternalFormat = GL_RED;
    h.pixelDepth = 2;
    Containers::Array<char> data = file(h);
    constexpr char pixels[]{
        1, 2, 0, 0,
        3, 4, 0, 0,
        5, 6, 0, 0,
        7, 8, 0, 0
    };
    appendLevel(data, sizeof(pixels), pixels);
    MemoryVFile vfile{data};

    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::NoError);
    CORRADE_VERIFY(image);
    CORRADE_COMPARE(image->config().depth(), 2);
    CORRADE_COMPARE(image->config().slices(), 1);
    CORRADE_COMPARE_AS(image->pixels(), Containers::arrayView<char>({
        1, 2, 3, 4, 5, 6, 7, 8
    }), TestSuite::Compare::Container);
}

void KtxLoaderTest::fromKtxCompressed() {
    KtxHeader h = header(4, 4);
    h.glType = 0;
    h.glFormat = 0;
    h.glInternalFormat = GL_COMPRESSED_RGBA_S3TC_DXT1_EXT;
    h.glBaseInternalFormat = GL_RGBA;
    Containers::Array<char> data = file(h);
    appendLevel(data, 8, sequence(8));
    MemoryVFile vfile{data};

    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::NoError);
    CORRADE_VERIFY(image);
    CORRADE_COMPARE(image->config().format(), ImageFormat{CompressedPixelFormat::Bc1RGBAUnorm});
    CORRADE_COMPARE_AS(image->pixels(), sequence(8), TestSuite::Compare::Container);
}

void KtxLoaderTest::fromKtxUnknownFormat() {
    KtxHeader h = header(4, 2);
    h.glInternalFormat = 0xdead;
    Containers::Array<char> data = file(h);
    appendLevel(data, 32, sequence(32));
    MemoryVFile vfile{data};

    std::ostringstream out;
    Error redirectError{&out};
    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::UnsupportedError);
    CORRADE_VERIFY(!image);
    CORRADE_COMPARE(out.str(), "Texpack::imageFromKtx(): unsupported format\n");
}

void KtxLoaderTest::fromKtxTruncated() {
    /* The level claims to be smaller than the image needs */
    Containers::Array<char> data = file(header(4, 2));
    appendLevel(data, 16, sequence(16));
    MemoryVFile vfile{data};

    std::ostringstream out;
    Error redirectError{&out};
    Containers::Optional<Image> image;
    CORRADE_COMPARE(imageFromKtx(vfile, image), ErrorCode::MipMapError);
    CORRADE_VERIFY(!image);
    CORRADE_COMPARE(out.str(), "Texpack::imageFromKtx(): level 0 expected to have 32 bytes but got 16\n");
}

}}}

CORRADE_TEST_MAIN(Texpack::Test::KtxLoaderTest)
