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

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "StringLib.h"
#include "OsApi.h"

#include <assert.h>
#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <stdarg.h>
#include <stdlib.h>
#include <string.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* StringLib::B64CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * duplicate
 *----------------------------------------------------------------------------*/
char* StringLib::duplicate(const char* str1, int size)
{
    int len;
    if(str1 == NULL) return NULL;
    if(size > 0) len = (int)strnlen(str1, size - 1) + 1;
    else len = (int)strlen(str1) + 1;
    if(len < 1) return NULL;
    char* dup = new char[len];
    StringLib::copy(dup, str1, len);
    return dup;
}

/*----------------------------------------------------------------------------
 * format
 *----------------------------------------------------------------------------*/
char* StringLib::format(char* dststr, int size, const char* _format, ...)
{
    if (dststr == NULL) return NULL;
    va_list args;
    va_start(args, _format);
    const int vlen = vsnprintf(dststr, size, _format, args);
    const int slen = MIN(vlen, size - 1);
    va_end(args);
    if (slen < 1) return NULL;
    dststr[slen] = '\0';
    return dststr;
}

/*----------------------------------------------------------------------------
 * formatString
 *----------------------------------------------------------------------------*/
std::string StringLib::formatString(const char* _format, ...)
{
    char buffer[MAX_STR_SIZE];
    va_list args;
    va_start(args, _format);
    const int vlen = vsnprintf(buffer, MAX_STR_SIZE, _format, args);
    va_end(args);
    if(vlen < 0) return std::string();
    return std::string(buffer, MIN(vlen, MAX_STR_SIZE - 1));
}

/*----------------------------------------------------------------------------
 * copy
 *
 *  always null terminates
 *----------------------------------------------------------------------------*/
char* StringLib::copy(char* str1, const char* str2, int _size)
{
    if(str1 && str2 && (_size > 0))
    {
        const char* nptr = (char*)memccpy(str1, str2, 0, _size);
        if(!nptr) str1[_size - 1] = '\0';
    }
    else if(str1 && (_size > 0))
    {
        str1[0] = '\0';
    }

    return str1;
}

/*----------------------------------------------------------------------------
 * find
 *----------------------------------------------------------------------------*/
char* StringLib::find(const char* str, const char c, bool first)
{
    if(first)   return (char*)strchr(str, c);
    else        return (char*)strrchr(str, c);
}

/*----------------------------------------------------------------------------
 * size
 *----------------------------------------------------------------------------*/
int StringLib::size(const char* str, int len)
{
    return strnlen(str, len);
}

/*----------------------------------------------------------------------------
 * match
 *----------------------------------------------------------------------------*/
bool StringLib::match(const char* str1, const char* str2, int len)
{
    return strncmp(str1, str2, len) == 0;
}

/*----------------------------------------------------------------------------
 * split
 *
 *  empty tokens are dropped
 *----------------------------------------------------------------------------*/
StringLib::TokenList StringLib::split(const char* str, int len, char separator, bool strip)
{
    TokenList tokens;

    int i = 0;
    while(i < len && str[i] != '\0')
    {
        /* Create Token */
        std::string token;
        while( (i < len) && (str[i] != '\0') && (str[i] == separator) ) i++; // find first character
        while( (i < len) && (str[i] != '\0') && (str[i] != separator) && ((int)token.size() < (MAX_STR_SIZE - 1))) token += str[i++]; // copy characters in

        /*  Strip Leading and Trailing Spaces */
        if(strip)
        {
            size_t s1 = 0;
            size_t s2 = token.size();
            while( (s1 < s2) && isspace((unsigned char)token[s1]) ) s1++;
            while( (s2 > s1) && isspace((unsigned char)token[s2 - 1]) ) s2--;
            token = token.substr(s1, s2 - s1);
        }

        /* Add Token to List */
        if(!token.empty()) tokens.push_back(token);
    }

    return tokens;
}

/*----------------------------------------------------------------------------
 * trim
 *
 *  builds a string from a byte buffer dropping leading and trailing
 *  whitespace and null padding
 *----------------------------------------------------------------------------*/
std::string StringLib::trim(const char* buffer, int64_t size)
{
    int64_t s1 = 0;
    int64_t s2 = size;
    while( (s1 < s2) && (buffer[s1] == '\0' || isspace((unsigned char)buffer[s1])) ) s1++;
    while( (s2 > s1) && (buffer[s2 - 1] == '\0' || isspace((unsigned char)buffer[s2 - 1])) ) s2--;
    return std::string(&buffer[s1], s2 - s1);
}

/*----------------------------------------------------------------------------
 * str2long
 *----------------------------------------------------------------------------*/
bool StringLib::str2long(const char* str, long* val, int base)
{
    if(str == NULL) return false;
    char *endptr;
    errno = 0;
    const long result = strtol(str, &endptr, base);
    if( (endptr == str) || (*endptr != '\0') ||
        ((result == LONG_MAX || result == LONG_MIN) && errno == ERANGE) )
    {
        return false;
    }
    *val = result;
    return true;
}

/*----------------------------------------------------------------------------
 * str2llong
 *----------------------------------------------------------------------------*/
bool StringLib::str2llong(const char* str, long long* val, int base)
{
    if(str == NULL) return false;
    char *endptr;
    errno = 0;
    const long long result = strtoll(str, &endptr, base);
    if( (endptr == str) || (*endptr != '\0') ||
        ((result == LLONG_MAX || result == LLONG_MIN) && errno == ERANGE))
    {
        return false;
    }
    *val = result;
    return true;
}

/*----------------------------------------------------------------------------
 * b64encode
 *
 *  returned string must be freed by caller; size is updated to include
 *  the null terminator
 *----------------------------------------------------------------------------*/
char* StringLib::b64encode(const void* data, int* size)
{
    assert(size);

    const int len = *size;
    const int encoded_len = (len + 2) / 3 * 4;
    char* str = new char [encoded_len + 1];
    str[encoded_len] = '\0';
    if(encoded_len == 0)
    {
        *size = 1;
        return str;
    }
    str[encoded_len - 1] = '=';
    str[encoded_len - 2] = '=';

    const unsigned char *p = (const unsigned char*) data;
    size_t j = 0, pad = len % 3;
    const size_t last = len - pad;

    for (size_t i = 0; i < last; i += 3)
    {
        const int n = int(p[i]) << 16 | int(p[i + 1]) << 8 | p[i + 2];
        str[j++] = B64CHARS[n >> 18];
        str[j++] = B64CHARS[n >> 12 & 0x3F];
        str[j++] = B64CHARS[n >> 6 & 0x3F];
        str[j++] = B64CHARS[n & 0x3F];
    }

    if (pad)  /// Set padding
    {
        const int n = --pad ? int(p[last]) << 8 | p[last + 1] : p[last];
        str[j++] = B64CHARS[pad ? n >> 10 & 0x3F : n >> 2];
        str[j++] = B64CHARS[pad ? n >> 4 & 0x03F : n << 4 & 0x3F];
        str[j++] = pad ? B64CHARS[n << 2 & 0x3F] : '=';
    }

    *size = encoded_len + 1;
    return str;
}
