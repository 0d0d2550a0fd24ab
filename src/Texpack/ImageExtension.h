#ifndef Texpack_ImageExtension_h
#define Texpack_ImageExtension_h
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
 * @brief Class @ref Texpack::ImageExtension, @ref Texpack::ImageExtensions, @ref Texpack::LayerExtension
 */

#include <Corrade/Containers/ArrayView.h>
#include <Corrade/Containers/Optional.h>
#include <Corrade/Containers/StringView.h>

#include "Texpack/Texpack.h"
#include "Texpack/visibility.h"

namespace Texpack {

/**
@brief Image extension view

Non-owning view on a single tagged metadata record appended to an image.
Every extension starts with a four-character tag and a 32-bit size that
includes this eight-byte header, followed by an extension-specific payload.
@see @ref ImageExtensions, @ref BasicImageRecord::extensions()
*/
class TEXPACK_EXPORT ImageExtension {
    public:
        /**
         * @brief Construct from raw bytes
         *
         * Expects that @p data is at least eight bytes and that the size in
         * the extension header is at least eight and at most
         * @cpp data.size() @ce. The view is trimmed to the declared size.
         */
        explicit ImageExtension(Containers::ArrayView<const char> data);

        /** @brief Four-character tag */
        Containers::StringView tag() const;

        /** @brief Whether the extension has given tag */
        bool is(Containers::StringView tag) const;

        /** @brief Size including the header */
        std::size_t size() const { return _data.size(); }

        /** @brief Raw bytes including the header */
        Containers::ArrayView<const char> data() const { return _data; }

        /** @brief Payload after the header */
        Containers::ArrayView<const char> payload() const;

    private:
        Containers::ArrayView<const char> _data;
};

/**
@brief Image extension list view

Non-owning view on the extension block of an image record, providing
indexed and tag-based access.
@see @ref BasicImageRecord::extensions()
*/
class TEXPACK_EXPORT ImageExtensions {
    public:
        /**
         * @brief Construct from an extension block
         *
         * Used internally by @ref BasicImageRecord::extensions(), expects
         * that @p block is a valid extension block.
         */
        explicit ImageExtensions(Containers::ArrayView<const char> block);

        /** @brief Extension count */
        std::size_t count() const;

        /**
         * @brief Extension at given index
         *
         * Expects that @p id is less than @ref count().
         */
        ImageExtension operator[](std::size_t id) const;

        /**
         * @brief Find the first extension with given tag
         *
         * Returns @relativeref{Corrade,Containers::NullOpt} if there's no
         * extension with such tag.
         */
        Containers::Optional<ImageExtension> find(Containers::StringView tag) const;

    private:
        Containers::ArrayView<const char> _block;
};

/**
@brief Layer name extension

Labels an image with a short name, used for channel groups of multi-layer
OpenEXR files. Serialized with a @cpp "LAYR" @ce tag and a null-padded name
of @ref NameSize bytes.
*/
class TEXPACK_EXPORT LayerExtension {
    public:
        enum: std::size_t {
            /** Size of the name field including the null terminator */
            NameSize = 32
        };

        /** @brief Extension tag */
        static Containers::StringView tag();

        /**
         * @brief Interpret an extension
         *
         * Returns @relativeref{Corrade,Containers::NullOpt} if the tag
         * doesn't match, the size is different or the name isn't null
         * terminated.
         */
        static Containers::Optional<LayerExtension> from(const ImageExtension& extension);

        /**
         * @brief Constructor
         *
         * Expects that @p name is shorter than @ref NameSize.
         */
        explicit LayerExtension(Containers::StringView name);

        /** @brief Layer name */
        Containers::StringView name() const;

        /**
         * @brief Serialized bytes
         *
         * Pass these to the @ref Image constructor.
         */
        Containers::ArrayView<const char> data() const { return _data; }

    private:
        explicit LayerExtension() = default;

        char _data[8 + NameSize];
};

}

#endif
