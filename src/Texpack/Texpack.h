#ifndef Texpack_Texpack_h
#define Texpack_Texpack_h
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
 * @brief Forward declarations for the @ref Texpack namespace
 */

#include <Magnum/Magnum.h>

/**
@brief Texture container library

Loads KTX and OpenEXR textures through the @ref VFile byte source abstraction
into @ref Image chains.
*/
namespace Texpack {

using namespace Magnum;

enum class ErrorCode: UnsignedByte;

enum class VFileType: UnsignedInt;
class VFile;
class MemoryVFile;
class FileVFile;

class KtxLoader;

class ImageFormat;
enum class UsageHint: UnsignedByte;
enum class LayerType: UnsignedByte;
enum class ImageFlag: UnsignedByte;
class ImageConfig;
template<class> class BasicImageRecord;
typedef BasicImageRecord<const char> ImageRecord;
typedef BasicImageRecord<char> MutableImageRecord;
class Image;

class ImageExtension;
class ImageExtensions;
class LayerExtension;

enum class ImporterFlag: UnsignedByte;
class Importer;

}

#endif
