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

#include "UT_String.h"
#include "StringLib.h"
#include "TimeLib.h"
#include "UnitTest.h"
#include "OsApi.h"

#include <string.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_String::NAME = "UT_String";

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_String::UT_String (void):
    UnitTest(NAME)
{
}

/*----------------------------------------------------------------------------
 * run
 *----------------------------------------------------------------------------*/
bool UT_String::run (void)
{
    ut_initialize(this);

    testTrim();
    testSplit();
    testConversions();
    testEncode();
    testTimes();

    return ut_status(this);
}

/*----------------------------------------------------------------------------
 * testTrim - text datasets arrive padded with whitespace and nulls
 *----------------------------------------------------------------------------*/
void UT_String::testTrim (void)
{
    const char padded[] = {'\n', ' ', '<', 'a', '/', '>', ' ', '\n', '\0', '\0'};
    ut_assert(this, StringLib::trim(padded, sizeof(padded)) == "<a/>", "padded text not trimmed");

    const char inner[] = {'a', ' ', 'b', '\0'};
    ut_assert(this, StringLib::trim(inner, sizeof(inner)) == "a b", "inner whitespace removed");

    const char blank[] = {' ', '\0', '\t'};
    ut_assert(this, StringLib::trim(blank, sizeof(blank)).empty(), "blank text not empty");
    ut_assert(this, StringLib::trim(blank, 0).empty(), "zero length text not empty");
}

/*----------------------------------------------------------------------------
 * testSplit
 *----------------------------------------------------------------------------*/
void UT_String::testSplit (void)
{
    const char* str = "bucket//prefix/ key /";
    StringLib::TokenList tokens = StringLib::split(str, strlen(str), '/', true);
    if(ut_assert(this, tokens.size() == 3, "expected 3 tokens, got %ld", (long)tokens.size()))
    {
        ut_assert(this, tokens[0] == "bucket", "first token is %s", tokens[0].c_str());
        ut_assert(this, tokens[1] == "prefix", "second token is %s", tokens[1].c_str());
        ut_assert(this, tokens[2] == "key", "third token is %s", tokens[2].c_str());
    }

    tokens = StringLib::split(str, 6, '/', false);
    ut_assert(this, tokens.size() == 1 && tokens[0] == "bucket", "length limit not honored");

    char dst[8];
    StringLib::copy(dst, "truncated", sizeof(dst));
    ut_assert(this, StringLib::match(dst, "truncat"), "copy did not null terminate: %s", dst);

    const std::string formatted = StringLib::formatString("%s-%d", "range", 42);
    ut_assert(this, formatted == "range-42", "formatted string is %s", formatted.c_str());
}

/*----------------------------------------------------------------------------
 * testConversions
 *----------------------------------------------------------------------------*/
void UT_String::testConversions (void)
{
    long val = 0;
    ut_assert(this, StringLib::str2long("256", &val, 10) && val == 256, "decimal not converted");
    ut_assert(this, StringLib::str2long("0x10", &val) && val == 16, "hexadecimal not converted");
    ut_assert(this, !StringLib::str2long("12ab", &val, 10), "trailing characters accepted");
    ut_assert(this, !StringLib::str2long("", &val, 10), "empty string accepted");

    long long lval = 0;
    ut_assert(this, StringLib::str2llong("-9000000000", &lval, 10) && lval == -9000000000LL, "large value not converted");
    ut_assert(this, !StringLib::str2llong("99999999999999999999", &lval, 10), "overflow accepted");
}

/*----------------------------------------------------------------------------
 * testEncode
 *----------------------------------------------------------------------------*/
void UT_String::testEncode (void)
{
    const char* inputs[]  = {"",  "f",    "fo",   "foo",  "foob",     "fooba",    "foobar"};
    const char* outputs[] = {"",  "Zg==", "Zm8=", "Zm9v", "Zm9vYg==", "Zm9vYmE=", "Zm9vYmFy"};

    for(int i = 0; i < 7; i++)
    {
        int size = strlen(inputs[i]);
        char* encoded = StringLib::b64encode(inputs[i], &size);
        ut_assert(this, StringLib::match(encoded, outputs[i]), "encoded %s as %s", inputs[i], encoded);
        ut_assert(this, size == (int)strlen(outputs[i]) + 1, "encoded size of %s is %d", inputs[i], size);
        delete [] encoded;
    }
}

/*----------------------------------------------------------------------------
 * testTimes
 *----------------------------------------------------------------------------*/
void UT_String::testTimes (void)
{
    ut_assert(this, TimeLib::datetime2sys(1970, 1, 1) == 0, "epoch is not zero");
    ut_assert(this, TimeLib::datetime2sys(2020, 1, 1) == 1577836800000000LL, "2020 starts at %ld", (long)TimeLib::datetime2sys(2020, 1, 1));

    const int64_t t = TimeLib::str2systime("2020-03-01T12:30:15");
    ut_assert(this, t == TimeLib::datetime2sys(2020, 3, 1, 12, 30, 15), "parsed time is %ld", (long)t);

    const TimeLib::gmt_time_t gmt = TimeLib::sys2gmttime(t);
    ut_assert(this, gmt.year == 2020 && gmt.doy == 61 && gmt.hour == 12 && gmt.minute == 30 && gmt.second == 15, "gmt time is %d:%d:%d:%d:%d", gmt.year, gmt.doy, gmt.hour, gmt.minute, gmt.second);

    const TimeLib::date_t date = TimeLib::gmt2date(gmt);
    ut_assert(this, date.year == 2020 && date.month == 3 && date.day == 1, "date is %d-%d-%d", date.year, date.month, date.day);

    ut_assert(this, TimeLib::daysinmonth(2000, 2) == 29, "2000 is a leap year");
    ut_assert(this, TimeLib::daysinmonth(1900, 2) == 28, "1900 is not a leap year");

    const char* bad_times[] = {
        "yesterday",
        "2020-01-01",
        "2020-01-01T00:00",
        "2020-02-30T00:00:00",
        "2020-01-01T24:00:00",
        "2020-01-01T00:00:00:00",
        "2020-01-01T00:0x:00"
    };
    for(const char* bad: bad_times)
    {
        ut_assert(this, TimeLib::str2systime(bad) == TimeLib::INVALID_TIME, "accepted %s", bad);
    }
}
