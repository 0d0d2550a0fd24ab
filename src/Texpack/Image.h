#ifndef Texpack_Image_h
#define Texpack_Image_h
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
 * @brief Class @ref Texpack::ImageConfig, @ref Texpack::BasicImageRecord, @ref Texpack::Image, typedef @ref Texpack::ImageRecord, @ref Texpack::MutableImageRecord, enum @ref Texpack::UsageHint, @ref Texpack::LayerType, @ref Texpack::ImageFlag, enum set @ref Texpack::ImageFlags
 */

#include <initializer_list>
#include <type_traits>
#include <Corrade/Containers/Array.h>
#include <Corrade/Containers/EnumSet.h>
#include <Corrade/Containers/Optional.h>
#include <Corrade/Utility/Assert.h>
#include <Corrade/Utility/Debug.h>
#include <Magnum/Math/Vector3.h>
#include <Magnum/Math/Vector4.h>

#include "Texpack/ImageExtension.h"
#include "Texpack/ImageFormat.h"

namespace Texpack {

/**
@brief Usage hint

@see @ref ImageConfig::setUsage()
*/
enum class UsageHint: UnsignedByte {
    Generic = 0,        /**< Generic data */
    DiffuseColour,      /**< Diffuse color */
    SpecularColour,     /**< Specular color */
    FinalColour         /**< Final color, e.g. a rendered image */
};

/** @debugoperatorenum{UsageHint} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, UsageHint value);

/**
@brief Layer type

@see @ref ImageConfig::setLayerType()
*/
enum class LayerType: UnsignedByte {
    Generic = 0,        /**< Generic layer */
    Visual,             /**< Visual layer */
    Gameplay            /**< Gameplay data layer */
};

/** @debugoperatorenum{LayerType} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, LayerType value);

/**
@brief Image flag

@see @ref ImageFlags, @ref ImageConfig::setFlags()
*/
enum class ImageFlag: UnsignedByte {
    /** The slices are cube map faces */
    Cubemap = 1 << 0,

    /** The image is a color lookup table */
    Clut = 1 << 1,

    /**
     * The record has an extension block. Managed by @ref Image, ignored
     * when passed to @ref ImageConfig.
     */
    HasExtensionData = 1 << 2,

    /**
     * Another record follows in the chain. Managed by @ref Image, ignored
     * when passed to @ref ImageConfig.
     */
    HasNextImageData = 1 << 3
};

/**
@brief Image flags

@see @ref ImageConfig::setFlags()
*/
typedef Containers::EnumSet<ImageFlag> ImageFlags;

CORRADE_ENUMSET_OPERATORS(ImageFlags)

/** @debugoperatorenum{ImageFlag} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, ImageFlag value);

/** @debugoperatorenum{ImageFlags} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, ImageFlags value);

/**
@brief Image configuration

Describes the dimensions and the format of a single image record. Pixels are
laid out row by row, rows page by page and pages slice by slice, without any
padding. Slices are array elements or cube map faces.
*/
class TEXPACK_EXPORT ImageConfig {
    public:
        /**
         * @brief Constructor
         *
         * Expects that @p format is valid and all dimensions are at least
         * @cpp 1 @ce.
         */
        explicit ImageConfig(ImageFormat format, UnsignedInt width, UnsignedInt height = 1, UnsignedShort depth = 1, UnsignedShort slices = 1, ImageFlags flags = {});

        /** @brief Pixel format */
        ImageFormat format() const { return _format; }

        /** @brief Width */
        UnsignedInt width() const { return _width; }

        /** @brief Height */
        UnsignedInt height() const { return _height; }

        /** @brief Depth */
        UnsignedShort depth() const { return _depth; }

        /** @brief Slice count */
        UnsignedShort slices() const { return _slices; }

        /** @brief Usage hint */
        UsageHint usage() const { return _usage; }

        /**
         * @brief Set usage hint
         * @return Reference to self (for method chaining)
         *
         * Default is @ref UsageHint::Generic.
         */
        ImageConfig& setUsage(UsageHint usage) {
            _usage = usage;
            return *this;
        }

        /** @brief Layer type */
        LayerType layerType() const { return _layerType; }

        /**
         * @brief Set layer type
         * @return Reference to self (for method chaining)
         *
         * Default is @ref LayerType::Generic.
         */
        ImageConfig& setLayerType(LayerType type) {
            _layerType = type;
            return *this;
        }

        /** @brief Flags */
        ImageFlags flags() const { return _flags; }

        /**
         * @brief Set flags
         * @return Reference to self (for method chaining)
         */
        ImageConfig& setFlags(ImageFlags flags) {
            _flags = flags;
            return *this;
        }

        /** @brief Pixel count in a row */
        std::size_t pixelCountPerRow() const { return _width; }

        /** @brief Pixel count in a page */
        std::size_t pixelCountPerPage() const { return std::size_t(_width)*_height; }

        /** @brief Pixel count in a slice */
        std::size_t pixelCountPerSlice() const { return pixelCountPerPage()*_depth; }

        /** @brief Pixel count in the whole image */
        std::size_t pixelCount() const { return pixelCountPerSlice()*_slices; }

        /**
         * @brief Data size in bytes
         *
         * Equal to @ref pixelCount() multiplied by @ref blockByteSize() and
         * divided by @ref blockPixelCount(). For compressed formats the
         * dimensions are rounded up to whole blocks first.
         */
        std::size_t dataSize() const;

        /**
         * @brief Pixel index
         *
         * Expects that the position is inside the image.
         */
        std::size_t indexOf(const Vector3ui& position, UnsignedInt slice = 0) const;

        /**
         * @brief Pixel byte offset
         *
         * Expects that the format is uncompressed and the position is inside
         * the image.
         */
        std::size_t byteOffsetOf(const Vector3ui& position, UnsignedInt slice = 0) const;

    private:
        ImageFormat _format;
        UnsignedInt _width, _height;
        UnsignedShort _depth, _slices;
        UsageHint _usage;
        LayerType _layerType;
        ImageFlags _flags;
};

/**
@brief Image record view

View on a single record of an @ref Image chain. The view spans from the
record start to the end of the chain, which allows it to reach the following
records using @ref next(). See @ref ImageRecord and @ref MutableImageRecord
for the concrete types.
*/
template<class T> class BasicImageRecord {
    public:
        /**
         * @brief Raw data type
         *
         * @cpp const char @ce for an immutable record, @cpp char @ce for a
         * mutable record.
         */
        typedef T Type;

        /**
         * @brief Constructor
         *
         * Used internally by @ref Image, expects that @p data starts with a
         * valid record.
         */
        explicit BasicImageRecord(Containers::ArrayView<T> data) noexcept;

        /** @brief Convert a mutable record to an immutable one */
        template<class U, class = typename std::enable_if<std::is_const<T>::value && !std::is_const<U>::value>::type> /*implicit*/ BasicImageRecord(const BasicImageRecord<U>& other) noexcept: _data{other._data} {}

        /** @brief Configuration */
        ImageConfig config() const;

        /** @brief Pixel format */
        ImageFormat format() const;

        /** @brief Flags */
        ImageFlags flags() const;

        /**
         * @brief Pixel data
         *
         * Size is @ref ImageConfig::dataSize().
         */
        Containers::ArrayView<T> data() const;

        /**
         * @brief Typed view on pixel data
         *
         * The view starts at @p pixelOffset multiplied by the
         * @ref blockByteSize() of the format and spans the rest of the
         * pixel data. The data start is aligned to 8 bytes but there's no
         * check that @p U matches the format.
         */
        template<class U> Containers::ArrayView<U> dataAt(std::size_t pixelOffset) const;

        /**
         * @brief Size of the record in bytes
         *
         * Header, pixel data and the extension block, all padded to 8 bytes.
         */
        std::size_t sizeInBytes() const;

        /**
         * @brief Size of the chain from this record on in bytes
         *
         * Sum of @ref sizeInBytes() of all records, rounded up to 8 bytes.
         */
        std::size_t totalSize() const;

        /** @brief Count of records from this record on */
        std::size_t imageChainLength() const;

        /**
         * @brief Next record in the chain
         *
         * Returns @relativeref{Corrade,Containers::NullOpt} if
         * @ref ImageFlag::HasNextImageData isn't set.
         */
        Containers::Optional<BasicImageRecord<T>> next() const;

        /**
         * @brief Extensions
         *
         * Returns @relativeref{Corrade,Containers::NullOpt} if
         * @ref ImageFlag::HasExtensionData isn't set.
         */
        Containers::Optional<ImageExtensions> extensions() const;

        /**
         * @brief Decode pixels to floats
         *
         * Decodes @cpp out.size() @ce pixels starting at @p pixelOffset.
         * Expects that @ref canDecodeToF32() is @cpp true @ce for the format
         * and the pixels are in range.
         */
        void decodePixelsAt(std::size_t pixelOffset, Containers::ArrayView<Vector4> out) const;

        /** @brief Decode a single pixel */
        Vector4 pixelAt(std::size_t pixelOffset) const;

        /**
         * @brief Encode pixels from floats
         *
         * Encodes @cpp in.size() @ce pixels starting at @p pixelOffset.
         * Expects that @ref canEncodeFromF32() is @cpp true @ce for the
         * format and the pixels are in range. Available only on a mutable
         * record.
         */
        template<class U = T, class = typename std::enable_if<!std::is_const<U>::value>::type> void encodePixelsAt(std::size_t pixelOffset, Containers::ArrayView<const Vector4> in) const {
            encodePixelsFromF32(format(), in, pixelDataFrom(pixelOffset, in.size()));
        }

        /**
         * @brief Encode a single pixel
         *
         * Available only on a mutable record.
         */
        template<class U = T, class = typename std::enable_if<!std::is_const<U>::value>::type> void setPixelAt(std::size_t pixelOffset, const Vector4& value) const {
            encodePixelsAt(pixelOffset, {&value, 1});
        }

    private:
        template<class> friend class BasicImageRecord;

        Containers::ArrayView<T> pixelDataFrom(std::size_t pixelOffset, std::size_t count) const;

        Containers::ArrayView<T> _data;
};

/** @brief Immutable image record */
typedef BasicImageRecord<const char> ImageRecord;

/** @brief Mutable image record */
typedef BasicImageRecord<char> MutableImageRecord;

template<class T> template<class U> Containers::ArrayView<U> BasicImageRecord<T>::dataAt(const std::size_t pixelOffset) const {
    static_assert(std::is_const<U>::value || !std::is_const<T>::value,
        "can't get a mutable view on an immutable record");
    const Containers::ArrayView<T> data = this->data();
    const std::size_t offset = pixelOffset*blockByteSize(format());
    CORRADE_ASSERT(offset <= data.size(),
        "Texpack::BasicImageRecord::dataAt(): offset" << pixelOffset << "out of range for" << data.size() << "bytes", {});
    return {reinterpret_cast<U*>(data.data() + offset), (data.size() - offset)/sizeof(U)};
}

/**
@brief Image

Owns a chain of one or more image records in one contiguous allocation.
A new image has a single record, chains are formed with @ref join() and
@ref destructiveJoin(). The records are accessible through @ref record() and
@ref records(), or the first record directly through the convenience
functions.
*/
class TEXPACK_EXPORT Image {
    public:
        /**
         * @brief Construct an image without extensions
         *
         * Pixel data are not initialized, use @ref clear() to zero them.
         * The @ref ImageFlag::HasExtensionData and
         * @ref ImageFlag::HasNextImageData flags from @p config are ignored.
         */
        explicit Image(const ImageConfig& config);

        /**
         * @brief Construct an image with extensions
         *
         * Each item of @p extensions is expected to be a serialized
         * extension, such as @ref LayerExtension::data(). The extensions are
         * copied into the image.
         */
        explicit Image(const ImageConfig& config, Containers::ArrayView<const Containers::ArrayView<const char>> extensions);

        /** @overload */
        explicit Image(const ImageConfig& config, std::initializer_list<Containers::ArrayView<const char>> extensions);

        /**
         * @brief Take over existing data
         *
         * Validates that @p data contain a complete record chain and
         * returns @relativeref{Corrade,Containers::NullOpt} with a message
         * printed if not. The data are expected to be aligned to 8 bytes,
         * the deleter of @p data decides how they get freed.
         */
        static Containers::Optional<Image> fromData(Containers::Array<char>&& data);

        /**
         * @brief Join two images
         *
         * Creates a new chain with copies of all records of @p a followed by
         * all records of @p b.
         */
        static Image join(const Image& a, const Image& b);

        /**
         * @brief Join two images and release the originals
         *
         * Like @ref join(), but @p a and @p b are emptied and can't be used
         * afterwards.
         */
        static Image destructiveJoin(Image&& a, Image&& b);

        /** @brief Copying is not allowed */
        Image(const Image&) = delete;

        /** @brief Move constructor */
        Image(Image&& other) noexcept;

        ~Image();

        /** @brief Copying is not allowed */
        Image& operator=(const Image&) = delete;

        /** @brief Move assignment */
        Image& operator=(Image&& other) noexcept;

        /** @brief Raw data of the whole chain */
        Containers::ArrayView<char> data() { return _data; }
        Containers::ArrayView<const char> data() const { return _data; } /**< @overload */

        /**
         * @brief Release the data
         *
         * The image is empty afterwards.
         * @see @ref fromData()
         */
        Containers::Array<char> release();

        /** @brief First record */
        MutableImageRecord record();
        ImageRecord record() const; /**< @overload */

        /** @brief All records in chain order */
        Containers::Array<MutableImageRecord> records();
        Containers::Array<ImageRecord> records() const; /**< @overload */

        /** @brief Record count */
        std::size_t imageChainLength() const;

        /**
         * @brief Size of the whole chain
         *
         * Same as the size of @ref data().
         */
        std::size_t totalSize() const;

        /** @brief Configuration of the first record */
        ImageConfig config() const;

        /** @brief Size of the first record */
        std::size_t sizeInBytes() const;

        /** @brief Pixel data of the first record */
        Containers::ArrayView<char> pixels();
        Containers::ArrayView<const char> pixels() const; /**< @overload */

        /** @brief Extensions of the first record */
        Containers::Optional<ImageExtensions> extensions() const;

        /** @brief Decode a pixel of the first record */
        Vector4 pixelAt(std::size_t pixelOffset) const;

        /** @brief Encode a pixel of the first record */
        void setPixelAt(std::size_t pixelOffset, const Vector4& value);

        /** @brief Zero pixel data of all records */
        void clear();

    private:
        explicit Image(Containers::Array<char>&& data) noexcept;

        Containers::Array<char> _data;
};

#ifndef DOXYGEN_GENERATING_OUTPUT
extern template class TEXPACK_EXPORT BasicImageRecord<char>;
extern template class TEXPACK_EXPORT BasicImageRecord<const char>;
#endif

}

#endif
