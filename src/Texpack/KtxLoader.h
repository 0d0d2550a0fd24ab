#ifndef Texpack_KtxLoader_h
#define Texpack_KtxLoader_h
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
 * @brief Class @ref Texpack::KtxLoader, function @ref Texpack::imageFromKtx()
 */

#include <Corrade/Containers/Optional.h>
#include <Corrade/Containers/Pointer.h>
#include <Corrade/Containers/StringView.h>

#include "Texpack/ErrorCode.h"
#include "Texpack/ImageFormat.h"
#include "Texpack/ImporterFlags.h"

namespace Texpack {

/**
@brief KTX 1.1 loader

Streaming parser over a @ref VFile. The source doesn't need to be loaded in
memory as a whole, only the header, the key/value data and the requested mip
levels are read.

Call @ref readHeader() exactly once before any other query, all accessors
expect that it succeeded. Afterwards,
@ref imageSizeOf() and @ref imageDataAt() resolve mip levels lazily: the
sizes are cached after the first query, the data of each level is read only
once and kept for the lifetime of the loader. Data of files written in a
foreign endianness are byte-swapped according to the header type size.

The loader keeps a reference to the source, which is expected to stay alive
and not be repositioned by anybody else for the lifetime of the loader.

@see @ref imageFromKtx()
*/
class TEXPACK_EXPORT KtxLoader {
    public:
        /** @brief Constructor */
        explicit KtxLoader(VFile& file, ImporterFlags flags = {});

        /** @brief Copying is not allowed */
        KtxLoader(const KtxLoader&) = delete;

        /** @brief Move constructor */
        KtxLoader(KtxLoader&&) noexcept;

        ~KtxLoader();

        /** @brief Copying is not allowed */
        KtxLoader& operator=(const KtxLoader&) = delete;

        /** @brief Move assignment */
        KtxLoader& operator=(KtxLoader&&) noexcept;

        /**
         * @brief Read and validate the header
         *
         * Reads the header at the current position of the source, followed
         * by the key/value data. Returns
         *
         * -    @ref ErrorCode::NotValidError if the file is too short, the
         *      identifier or the endianness marker doesn't match, the
         *      header describes an empty image or more mip levels than the
         *      size allows
         * -    @ref ErrorCode::UnsupportedError if the face count isn't
         *      @cpp 1 @ce or @cpp 6 @ce or the type size can't be
         *      byte-swapped
         *
         * An unknown pixel format doesn't fail, @ref format() is invalid in
         * that case. Expects that the header wasn't read yet.
         */
        ErrorCode readHeader();

        /** @brief Whether @ref readHeader() succeeded */
        bool isHeaderValid() const;

        /** @brief Whether the file is in the endianness of the machine */
        bool isSameEndian() const;

        /**
         * @brief Pixel format
         *
         * Resolved from the header OpenGL type, format and internal format
         * triple with @ref imageFormatFromGl().
         */
        ImageFormat format() const;

        /** @brief OpenGL type size used for byte swapping */
        UnsignedInt typeSize() const;

        /** @brief Width of the top level */
        UnsignedInt width() const;

        /** @brief Height of the top level, @cpp 0 @ce for 1D images */
        UnsignedInt height() const;

        /** @brief Depth of the top level, @cpp 0 @ce for 1D and 2D images */
        UnsignedInt depth() const;

        /** @brief Array element count, @cpp 0 @ce for non-array images */
        UnsignedInt arrayElementCount() const;

        /** @brief Face count, either @cpp 1 @ce or @cpp 6 @ce */
        UnsignedInt faceCount() const;

        /**
         * @brief Mip level count
         *
         * Files declaring zero levels contain just the top level and this
         * function returns @cpp 1 @ce for them.
         */
        UnsignedInt levelCount() const;

        /** @brief Whether the image is one-dimensional */
        bool is1D() const;

        /** @brief Whether the image is two-dimensional */
        bool is2D() const;

        /** @brief Whether the image is three-dimensional */
        bool is3D() const;

        /** @brief Whether the image is a cube map */
        bool isCubemap() const;

        /** @brief Whether the image is an array */
        bool isArray() const;

        /** @brief Raw key/value data */
        Containers::ArrayView<const char> keyValueData() const;

        /**
         * @brief Look up a key/value pair
         *
         * Returns the value for given key with the trailing null terminator
         * stripped, if there's any, or @relativeref{Corrade,Containers::NullOpt}
         * if the key isn't present. Malformed key/value data print a warning
         * and are treated as if the key wasn't present.
         */
        Containers::Optional<Containers::StringView> keyValue(Containers::StringView key) const;

        /**
         * @brief Byte size of a mip level
         *
         * For cube maps that aren't arrays the size covers all six faces
         * including the padding after each face. Returns
         * @ref ErrorCode::MipMapError if @p level is out of range or the
         * level is empty, @ref ErrorCode::NotValidError if the size prefix
         * can't be read.
         */
        ErrorCode imageSizeOf(UnsignedInt level, std::size_t& size);

        /**
         * @brief Data of a mip level
         *
         * The view stays valid for the lifetime of the loader. Returns
         * @ref ErrorCode::MipMapError if @p level is out of range, empty or
         * its data are truncated, @ref ErrorCode::NotValidError if the size
         * prefix can't be read.
         */
        ErrorCode imageDataAt(UnsignedInt level, Containers::ArrayView<const char>& data);

    private:
        struct State;

        TEXPACK_LOCAL std::size_t remaining() const;
        TEXPACK_LOCAL ErrorCode resolveLevel(const char* function, UnsignedInt level, bool seekToData, std::size_t& size);

        Containers::Pointer<State> _state;
};

/**
@brief Load a KTX file into an image chain
@param[in] file         Byte source positioned at the file start
@param[out] image       Resulting image
@param[in] levelLimit   Maximal count of mip levels to load, @cpp 0 @ce
    for all
@param[in] flags        Flags

Produces one record per mip level. All cube map faces and array elements of
a level are slices of the same record, in the order they're stored in the
file. The row padding required by KTX is removed. Returns
@ref ErrorCode::UnsupportedError if the pixel format isn't known or the
slice count doesn't fit into 16 bits and propagates errors from
@ref KtxLoader otherwise.
*/
TEXPACK_EXPORT ErrorCode imageFromKtx(VFile& file, Containers::Optional<Image>& image, UnsignedInt levelLimit = 0, ImporterFlags flags = {});

}

#endif
