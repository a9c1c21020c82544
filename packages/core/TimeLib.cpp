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

#include "TimeLib.h"
#include "StringLib.h"
#include "OsApi.h"

#include <time.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const int TimeLib::DaysInEachMonth[TimeLib::MONTHS_IN_YEAR] =
{// J   F   M   A   M   J   J   A   S   O   N   D
    31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31  };

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * gmttime
 *----------------------------------------------------------------------------*/
TimeLib::gmt_time_t TimeLib::gmttime(void)
{
    return sys2gmttime(OsApi::time(OsApi::SYS_CLK));
}

/*----------------------------------------------------------------------------
 * sys2gmttime
 *----------------------------------------------------------------------------*/
TimeLib::gmt_time_t TimeLib::sys2gmttime (int64_t sysnow)
{
    gmt_time_t gmt_time;

    const time_t secs = (time_t)(sysnow / 1000000);
    struct tm tm_time;
    gmtime_r(&secs, &tm_time);

    gmt_time.year = tm_time.tm_year + 1900;
    gmt_time.doy = tm_time.tm_yday + 1;
    gmt_time.hour = tm_time.tm_hour;
    gmt_time.minute = tm_time.tm_min;
    gmt_time.second = tm_time.tm_sec;
    gmt_time.millisecond = (int)((sysnow % 1000000) / 1000);

    return gmt_time;
}

/*----------------------------------------------------------------------------
 * gmt2date
 *----------------------------------------------------------------------------*/
TimeLib::date_t TimeLib::gmt2date (const gmt_time_t& gmt_time)
{
    TimeLib::date_t date;

    /* Determine Month */
    int month = 1, day = 0, preceding_day = 0;
    while(month <= MONTHS_IN_YEAR)
    {
        /* Accumulate Days */
        preceding_day = day;
        day += daysinmonth(gmt_time.year, month);

        /* Check Day */
        if(gmt_time.doy <= day)
        {
            break;
        }

        /* Go to Next Month */
        month++;
    }

    /* Set Date */
    date.year = gmt_time.year;
    date.month = month;
    date.day = gmt_time.doy - preceding_day;

    /* Return Date */
    return date;
}

/*----------------------------------------------------------------------------
 * datetime2sys
 *----------------------------------------------------------------------------*/
int64_t TimeLib::datetime2sys (int year, int month, int day, int hour, int minute, int second)
{
    /* Count Days Since Epoch */
    int64_t days = 0;
    if(year >= 1970)
    {
        for(int y = 1970; y < year; y++) days += dayofyear(y, 12, 31);
    }
    else
    {
        for(int y = year; y < 1970; y++) days -= dayofyear(y, 12, 31);
    }
    days += dayofyear(year, month, day) - 1;

    /* Convert to Microseconds */
    const int64_t secs = (days * TIME_SECS_IN_A_DAY) + (hour * TIME_SECS_IN_AN_HOUR) + (minute * TIME_SECS_IN_A_MINUTE) + second;
    return secs * 1000000;
}

/*----------------------------------------------------------------------------
 * str2systime
 *
 *  <year>-<month>-<day of month>T<hour in day>:<minute in hour>:<second in minute>
 *  returns INVALID_TIME if the string does not parse
 *----------------------------------------------------------------------------*/
int64_t TimeLib::str2systime (const char* time_str)
{
    const int max_time_size = 64;
    char time_buf[max_time_size];
    const int max_token_count = 6;
    char* token_ptr[max_token_count];

    /* Tokenize */
    int i;
    int token_count = 1;
    token_ptr[0] = &time_buf[0];
    for(i = 0; i < (max_time_size - 1) && time_str[i] != '\0'; i++)
    {
        time_buf[i] = time_str[i];
        const char expected = (token_count < 3) ? '-' : (token_count == 3) ? 'T' : ':';
        if(time_str[i] == expected)
        {
            if(token_count >= max_token_count) return INVALID_TIME;
            time_buf[i] = '\0';
            token_ptr[token_count++] = &time_buf[i+1];
        }
    }
    time_buf[i] = '\0';
    if(token_count != max_token_count) return INVALID_TIME;

    /* Convert Tokens */
    long fields[max_token_count];
    for(int t = 0; t < max_token_count; t++)
    {
        if(!StringLib::str2long(token_ptr[t], &fields[t], 10)) return INVALID_TIME;
    }

    /* Check Ranges */
    const long year = fields[0], month = fields[1], day = fields[2];
    const long hour = fields[3], minute = fields[4], second = fields[5];
    if(month < 1 || month > MONTHS_IN_YEAR) return INVALID_TIME;
    if(day < 1 || day > daysinmonth((int)year, (int)month)) return INVALID_TIME;
    if(hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return INVALID_TIME;

    return datetime2sys((int)year, (int)month, (int)day, (int)hour, (int)minute, (int)second);
}

/*----------------------------------------------------------------------------
 * dayofyear
 *----------------------------------------------------------------------------*/
int TimeLib::dayofyear(int year, int month, int day_of_month)
{
    int day_of_year = 0;

    for (int m = 1; m < month; m++)
    {
        day_of_year += daysinmonth(year, m);
    }

    day_of_year += day_of_month;

    return day_of_year;
}

/*----------------------------------------------------------------------------
 * daysinmonth
 *----------------------------------------------------------------------------*/
int TimeLib::daysinmonth (int year, int month)
{
    if(month < 1 || month > MONTHS_IN_YEAR) return 0;

    const int days_in_month = DaysInEachMonth[month - 1];

    int leap_day = 0;
    if(month == 2)
    {
        if(year % 4 == 0)
        {
            leap_day = 1;
            if(year % 100 == 0)
            {
                leap_day = 0;
                if(year % 400 == 0)
                {
                    leap_day = 1;
                }
            }
        }
    }

    return days_in_month + leap_day;
}
