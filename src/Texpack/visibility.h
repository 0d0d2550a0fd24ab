#ifndef Texpack_visibility_h
#define Texpack_visibility_h
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

#include <Corrade/Utility/VisibilityMacros.h>

#include "Texpack/configure.h"

#ifndef DOXYGEN_GENERATING_OUTPUT
#ifndef TEXPACK_BUILD_STATIC
    #ifdef Texpack_EXPORTS
        #define TEXPACK_EXPORT CORRADE_VISIBILITY_EXPORT
    #else
        #define TEXPACK_EXPORT CORRADE_VISIBILITY_IMPORT
    #endif
#else
    #define TEXPACK_EXPORT CORRADE_VISIBILITY_STATIC
#endif
#define TEXPACK_LOCAL CORRADE_VISIBILITY_LOCAL
#else
#define TEXPACK_EXPORT
#define TEXPACK_LOCAL
#endif

#endif
