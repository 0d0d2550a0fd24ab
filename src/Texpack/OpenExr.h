#ifndef Texpack_OpenExr_h
#define Texpack_OpenExr_h
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
 * @brief Function @ref Texpack::imageFromExr()
 */

#include <Corrade/Containers/Optional.h>
#include <Corrade/Containers/StringView.h>

#include "Texpack/ErrorCode.h"
#include "Texpack/ImporterFlags.h"

namespace Texpack {

/**
@brief Load an OpenEXR file into an image chain
@param[in] file         Byte source positioned at the file start
@param[out] image       Resulting image
@param[in] layer        Layer to import, empty for all
@param[in] threadCount  OpenEXR thread count, @cpp 0 @ce to autodetect,
    @cpp 1 @ce for single-threaded
@param[in] flags        Flags

Reads the rest of @p file into memory and decodes it with OpenEXR. Channels
are grouped into layers by the last @cb{.txt} . @ce in their name and the
part after it decides the component: @cb{.txt} R @ce or @cb{.txt} X @ce is
the first, @cb{.txt} G @ce or @cb{.txt} Y @ce the second, @cb{.txt} B @ce or
@cb{.txt} Z @ce the third and @cb{.txt} A @ce the fourth. A layer with just
one channel puts it into the first component regardless of its name. Other
channels, subsampled channels and channels with a type different from the
first channel in the layer are skipped with a warning.

Every layer becomes one record with an
@ref PixelFormat::R32UI "R32UI", @ref PixelFormat::R16F "R16F" or
@ref PixelFormat::R32F "R32F" format with one to four components, based on
the last used component. Components without a channel are zero. The rows are
flipped to have the bottom row first and the layer name is attached in a
@ref LayerExtension. Returns

-   @ref ErrorCode::ReadError if @p file can't be read
-   @ref ErrorCode::BadVersionError if the file isn't an OpenEXR file or has
    an unsupported version
-   @ref ErrorCode::BadHeaderError if OpenEXR fails to parse the header
-   @ref ErrorCode::BadImageError if OpenEXR fails to decode the pixels or
    there's no usable layer
*/
TEXPACK_EXPORT ErrorCode imageFromExr(VFile& file, Containers::Optional<Image>& image, Containers::StringView layer = {}, Int threadCount = 1, ImporterFlags flags = {});

}

#endif
