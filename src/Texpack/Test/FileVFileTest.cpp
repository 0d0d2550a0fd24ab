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

#include <sstream>
#include <Corrade/Containers/Array.h>
#include <Corrade/Containers/Optional.h>
#include <Corrade/Containers/String.h>
#include <Corrade/Containers/StringStl.h>
#include <Corrade/TestSuite/Tester.h>
#include <Corrade/TestSuite/Compare/Container.h>
#include <Corrade/TestSuite/Compare/String.h>
#include <Corrade/Utility/DebugStl.h>
#include <Corrade/Utility/Path.h>

#include "Texpack/FileVFile.h"

#include "configure.h"

namespace Texpack { namespace Test { namespace {

struct FileVFileTest: TestSuite::Tester {
    explicit FileVFileTest();

    void construct();
    void openNonexistent();
    void createWriteRead();
    void readPastEnd();
    void seek();
    void seekOutOfBounds();
    void adoptHandle();
    void move();

    void debugMode();
};

FileVFileTest::FileVFileTest() {
    addTests({&FileVFileTest::construct,
              &FileVFileTest::openNonexistent,
              &FileVFileTest::createWriteRead,
              &FileVFileTest::readPastEnd,
              &FileVFileTest::seek,
              &FileVFileTest::seekOutOfBounds,
              &FileVFileTest::adoptHandle,
              &FileVFileTest::move,

              &FileVFileTest::debugMode});
}

void FileVFileTest::construct() {
    FileVFile file;
    CORRADE_VERIFY(!file.isOpen());
    CORRADE_COMPARE(file.type(), VFileType::File);

    /* Closing a closed file is a no-op */
    file.close();
    CORRADE_VERIFY(!file.isOpen());
}

void FileVFileTest::openNonexistent() {
    FileVFile file;

    std::ostringstream out;
    Error redirectError{&out};
    CORRADE_COMPARE(file.open(Utility::Path::join(TEXPACK_TEST_OUTPUT_DIR, "nonexistent.bin"), FileMode::Read), ErrorCode::InitError);
    CORRADE_VERIFY(!file.isOpen());
    CORRADE_COMPARE_AS(out.str(),
        "Texpack::FileVFile::open(): can't open",
        TestSuite::Compare::StringHasPrefix);
}

void FileVFileTest::createWriteRead() {
    const Containers::String filename = Utility::Path::join(TEXPACK_TEST_OUTPUT_DIR, "create.bin");

    {
        FileVFile file;
        CORRADE_COMPARE(file.open(filename, FileMode::Create), ErrorCode::NoError);
        CORRADE_VERIFY(file.isOpen());
        CORRADE_COMPARE(file.byteCount(), 0);

        std::size_t count = 1234;
        CORRADE_COMPARE(file.write(Containers::arrayView({'t', 'e', 'x', 'p', 'a', 'c', 'k'}), count), ErrorCode::NoError);
        CORRADE_COMPARE(count, 7);
        CORRADE_COMPARE(file.tell(), 7);
        CORRADE_COMPARE(file.byteCount(), 7);

        /* Switching from writing to reading in the same handle */
        CORRADE_COMPARE(file.seekFromStart(3), ErrorCode::NoError);
        char out[4];
        CORRADE_COMPARE(file.read(out, count), ErrorCode::NoError);
        CORRADE_COMPARE(count, 4);
        CORRADE_COMPARE_AS(Containers::arrayView(out),
            Containers::arrayView({'p', 'a', 'c', 'k'}),
            TestSuite::Compare::Container);
        CORRADE_VERIFY(file.endOfFile());
        CORRADE_COMPARE(file.flush(), ErrorCode::NoError);
    }

    Containers::Optional<Containers::Array<char>> data = Utility::Path::read(filename);
    CORRADE_VERIFY(data);
    CORRADE_COMPARE_AS(*data,
        Containers::arrayView({'t', 'e', 'x', 'p', 'a', 'c', 'k'}),
        TestSuite::Compare::Container);

    FileVFile file;
    CORRADE_COMPARE(file.open(filename, FileMode::ReadWrite), ErrorCode::NoError);
    CORRADE_COMPARE(file.seekFromEnd(-4), ErrorCode::NoError);
    CORRADE_COMPARE(file.write(Containers::arrayView({'P'})), ErrorCode::NoError);
    file.close();
    CORRADE_VERIFY(!file.isOpen());

    data = Utility::Path::read(filename);
    CORRADE_VERIFY(data);
    CORRADE_COMPARE_AS(*data,
        Containers::arrayView({'t', 'e', 'x', 'P', 'a', 'c', 'k'}),
        TestSuite::Compare::Container);
}

void FileVFileTest::readPastEnd() {
    const Containers::String filename = Utility::Path::join(TEXPACK_TEST_OUTPUT_DIR, "short.bin");
    CORRADE_VERIFY(Utility::Path::write(filename, Containers::arrayView({'a', 'b', 'c'})));

    FileVFile file;
    CORRADE_COMPARE(file.open(filename), ErrorCode::NoError);
    /* A short read at the end succeeds with the count of bytes read */
    char out[4];
    std::size_t count = 1234;
    CORRADE_COMPARE(file.read(out, count), ErrorCode::NoError);
    CORRADE_COMPARE(count, 3);
    CORRADE_COMPARE_AS(Containers::arrayView(out).prefix(3),
        Containers::arrayView({'a', 'b', 'c'}),
        TestSuite::Compare::Container);
    CORRADE_VERIFY(file.endOfFile());

    /* Nothing left */
    CORRADE_COMPARE(file.read(out, count), ErrorCode::NoError);
    CORRADE_COMPARE(count, 0);

    /* Reading an exact size fails if the file is shorter */
    CORRADE_COMPARE(file.seekFromStart(1), ErrorCode::NoError);
    CORRADE_COMPARE(file.read(Containers::arrayView(out).prefix(3)), ErrorCode::ReadError);
    CORRADE_COMPARE(file.seekFromStart(1), ErrorCode::NoError);
    CORRADE_COMPARE(file.read(Containers::arrayView(out).prefix(2)), ErrorCode::NoError);
    CORRADE_COMPARE(out[0], 'b');
    CORRADE_COMPARE(out[1], 'c');
}

void FileVFileTest::seek() {
    const Containers::String filename = Utility::Path::join(TEXPACK_TEST_OUTPUT_DIR, "seek.bin");
    CORRADE_VERIFY(Utility::Path::write(filename, Containers::arrayView({'0', '1', '2', '3', '4', '5'})));

    FileVFile file;
    CORRADE_COMPARE(file.open(filename), ErrorCode::NoError);
    CORRADE_COMPARE(file.byteCount(), 6);

    CORRADE_COMPARE(file.seekFromStart(2), ErrorCode::NoError);
    CORRADE_COMPARE(file.tell(), 2);
    CORRADE_COMPARE(file.seekFromCurrent(3), ErrorCode::NoError);
    CORRADE_COMPARE(file.tell(), 5);
    CORRADE_COMPARE(file.seekFromCurrent(-1), ErrorCode::NoError);

    char out;
    CORRADE_COMPARE(file.read({&out, 1}), ErrorCode::NoError);
    CORRADE_COMPARE(out, '4');

    CORRADE_COMPARE(file.seekFromEnd(-6), ErrorCode::NoError);
    CORRADE_COMPARE(file.tell(), 0);
    CORRADE_COMPARE(file.seekFromEnd(0), ErrorCode::NoError);
    CORRADE_VERIFY(file.endOfFile());
}

void FileVFileTest::seekOutOfBounds() {
    const Containers::String filename = Utility::Path::join(TEXPACK_TEST_OUTPUT_DIR, "seek.bin");
    CORRADE_VERIFY(Utility::Path::write(filename, Containers::arrayView({'0', '1', '2', '3'})));

    FileVFile file;
    CORRADE_COMPARE(file.open(filename), ErrorCode::NoError);
    CORRADE_COMPARE(file.seekFromStart(1), ErrorCode::NoError);

    std::ostringstream out;
    {
        Error redirectError{&out};
        CORRADE_COMPARE(file.seekFromCurrent(-2), ErrorCode::SeekError);
        CORRADE_COMPARE(file.seekFromEnd(1), ErrorCode::SeekError);
        CORRADE_COMPARE(file.seekFromStart(5), ErrorCode::SeekError);
    }
    CORRADE_COMPARE(file.tell(), 1);
    CORRADE_COMPARE(out.str(),
        "Texpack::FileVFile::seekFromCurrent(): can't seek to -1 in a file of 4 bytes\n"
        "Texpack::FileVFile::seekFromEnd(): can't seek to 5 in a file of 4 bytes\n"
        "Texpack::FileVFile::seekFromStart(): can't seek to 5 in a file of 4 bytes\n");
}

void FileVFileTest::adoptHandle() {
    const Containers::String filename = Utility::Path::join(TEXPACK_TEST_OUTPUT_DIR, "adopt.bin");
    CORRADE_VERIFY(Utility::Path::write(filename, Containers::arrayView({'x', 'y'})));

    std::FILE* handle = std::fopen(filename.data(), "rb");
    CORRADE_VERIFY(handle);

    {
        FileVFile file{handle, false};
        CORRADE_VERIFY(file.isOpen());
        CORRADE_COMPARE(file.handle(), handle);
        CORRADE_COMPARE(file.byteCount(), 2);
    }

    /* Not owned, so still usable after the wrapper is gone */
    char out[2];
    CORRADE_COMPARE(std::fread(out, 1, 2, handle), 2);
    CORRADE_COMPARE(out[1], 'y');
    std::fclose(handle);
}

void FileVFileTest::move() {
    const Containers::String filename = Utility::Path::join(TEXPACK_TEST_OUTPUT_DIR, "move.bin");
    CORRADE_VERIFY(Utility::Path::write(filename, Containers::arrayView({'m'})));

    FileVFile a;
    CORRADE_COMPARE(a.open(filename), ErrorCode::NoError);

    FileVFile b{std::move(a)};
    CORRADE_VERIFY(!a.isOpen());
    CORRADE_VERIFY(b.isOpen());

    FileVFile c;
    c = std::move(b);
    CORRADE_VERIFY(!b.isOpen());
    CORRADE_VERIFY(c.isOpen());
    CORRADE_COMPARE(c.byteCount(), 1);
}

void FileVFileTest::debugMode() {
    std::ostringstream out;
    Debug{&out} << FileMode::Create << FileMode(0xbe);
    CORRADE_COMPARE(out.str(), "Texpack::FileMode::Create Texpack::FileMode(0xbe)\n");
}

}}}

CORRADE_TEST_MAIN(Texpack::Test::FileVFileTest)
