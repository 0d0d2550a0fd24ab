#ifndef Texpack_ImporterFlags_h
#define Texpack_ImporterFlags_h
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
 * @brief Enum @ref Texpack::ImporterFlag, enum set @ref Texpack::ImporterFlags
 */

#include <Corrade/Containers/EnumSet.h>

#include "Texpack/Texpack.h"
#include "Texpack/visibility.h"

namespace Texpack {

/**
@brief Importer flag

@see @ref ImporterFlags, @ref Importer::setFlags()
*/
enum class ImporterFlag: UnsignedByte {
    /**
     * Print verbose diagnostic during import. By default the loaders print
     * only warnings and errors.
     */
    Verbose = 1 << 0
};

/**
@brief Importer flags

@see @ref Importer::setFlags()
*/
typedef Containers::EnumSet<ImporterFlag> ImporterFlags;

CORRADE_ENUMSET_OPERATORS(ImporterFlags)

/** @debugoperatorenum{ImporterFlag} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, ImporterFlag value);

/** @debugoperatorenum{ImporterFlags} */
TEXPACK_EXPORT Debug& operator<<(Debug& debug, ImporterFlags value);

}

#endif
