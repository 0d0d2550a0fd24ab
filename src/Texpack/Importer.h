#ifndef Texpack_Importer_h
#define Texpack_Importer_h
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
 * @brief Class @ref Texpack::Importer
 */

#include <Corrade/Containers/Optional.h>
#include <Corrade/Containers/Pointer.h>
#include <Corrade/Containers/StringView.h>
#include <Corrade/Utility/Utility.h>

#include "Texpack/ErrorCode.h"
#include "Texpack/ImporterFlags.h"

namespace Texpack {

/**
@brief Image importer

Detects the file format from its first four bytes and loads it into an
@ref Image chain with @ref imageFromKtx() or @ref imageFromExr().

@section Texpack-Importer-configuration Plugin-specific configuration

The importer behavior can be adjusted through @ref configuration():

-   @cb{.ini} ktxLevels @ce, unsigned integer, default @cpp 0 @ce. Count of
    KTX mip levels to import, @cpp 0 @ce for all.
-   @cb{.ini} exrThreads @ce, integer, default @cpp 1 @ce. OpenEXR thread
    count, @cpp 0 @ce to autodetect.
-   @cb{.ini} exrLayer @ce, string, default empty. When not empty, only the
    EXR layer of this name is imported.
*/
class TEXPACK_EXPORT Importer {
    public:
        /** @brief Constructor */
        explicit Importer(ImporterFlags flags = {});

        /** @brief Copying is not allowed */
        Importer(const Importer&) = delete;

        /** @brief Move constructor */
        Importer(Importer&&) noexcept;

        ~Importer();

        /** @brief Copying is not allowed */
        Importer& operator=(const Importer&) = delete;

        /** @brief Move assignment */
        Importer& operator=(Importer&&) noexcept;

        /** @brief Flags */
        ImporterFlags flags() const;

        /** @brief Set flags */
        void setFlags(ImporterFlags flags);

        /**
         * @brief Configuration
         *
         * Pre-filled with default values, see
         * @ref Texpack-Importer-configuration.
         */
        Utility::ConfigurationGroup& configuration();
        const Utility::ConfigurationGroup& configuration() const; /**< @overload */

        /**
         * @brief Import from a byte source
         *
         * The format is detected at the current position of @p file. Returns
         * @ref ErrorCode::UnknownFormatError if it's neither KTX nor OpenEXR
         * and propagates errors of the format loaders otherwise.
         */
        ErrorCode open(VFile& file, Containers::Optional<Image>& image);

        /**
         * @brief Import from memory
         *
         * The data are copied.
         */
        ErrorCode openData(Containers::ArrayView<const char> data, Containers::Optional<Image>& image);

        /**
         * @brief Import from a file
         *
         * Returns @ref ErrorCode::InitError if the file can't be opened.
         */
        ErrorCode openFile(Containers::StringView filename, Containers::Optional<Image>& image);

    private:
        struct State;

        Containers::Pointer<State> _state;
};

}

#endif
