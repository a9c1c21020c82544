/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 * 
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 * 
 * 1. Redistributions of source code must retain the above copyright notice, 
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice, 
 *    this list of conditions and the following disclaimer in the documentation 
 *    and/or other materials provided with the distribution.
 * 
 * 3. Neither the name of the University of Washington nor the names of its 
 *    contributors may be used to endorse or promote products derived from this 
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED 
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR 
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, 
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, 
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, 
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR 
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF 
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef __h5cloud_stringlib__
#define __h5cloud_stringlib__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

#include <string>
#include <vector>

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#ifndef MAX_STR_SIZE
#define MAX_STR_SIZE 1024
#endif

/******************************************************************************
 * STRING LIBRARY CLASS
 ******************************************************************************/

class StringLib
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::vector<std::string> TokenList;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static char*            duplicate       (const char* str, int size=MAX_STR_SIZE);
        static char*            format          (char* dststr, int size, const char* _format, ...) VARG_CHECK(printf, 3, 4);
        static std::string      formatString    (const char* _format, ...) VARG_CHECK(printf, 1, 2);
        static char*            copy            (char* dst, const char* src, int _size);
        static char*            find            (const char* str, const char c, bool first=true);
        static int              size            (const char* str, int len=MAX_STR_SIZE);
        static bool             match           (const char* str1, const char* str2, int len=MAX_STR_SIZE);
        static TokenList        split           (const char* str, int len, char separator, bool strip);
        static std::string      trim            (const char* buffer, int64_t size);
        static bool             str2long        (const char* str, long* val, int base=0);
        static bool             str2llong       (const char* str, long long* val, int base=0);
        static char*            b64encode       (const void* data, int* size);

    private:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* B64CHARS;
};

#endif  /* __h5cloud_stringlib__ */
