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

/*
 * There are two types of time used by h5cloud
 *
 *  (1) CPU
 *      monotonically incrementing clock with unspecified starting point
 *      microsecond precision
 *      OsApi::time(OsApi::CPU_CLK); used for fetch deadlines
 *
 *  (2) SYS
 *      unix sytem time, no leap seconds, epoch of 1 Jan 1970 00:00:00
 *      microsecond precision
 *      OsApi::time(OsApi::SYS_CLK); used for log messages and trace times
 */

#ifndef __h5cloud_timelib__
#define __h5cloud_timelib__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include <time.h>

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#define TIME_SECS_IN_A_DAY          (60*60*24)
#define TIME_SECS_IN_AN_HOUR        (60*60)
#define TIME_SECS_IN_A_MINUTE       60

/******************************************************************************
 * TIME LIBRARY CLASS
 ******************************************************************************/

class TimeLib
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int64_t INVALID_TIME = -1;

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef struct {
            int year;
            int doy; // day of year
            int hour;
            int minute;
            int second;
            int millisecond;
        } gmt_time_t;

        typedef struct {
            int year;
            int month;
            int day;
        } date_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static gmt_time_t   gmttime         (void); // returns current GMT time
        static gmt_time_t   sys2gmttime     (int64_t sysnow); // takes system time (microseconds), returns GMT time
        static date_t       gmt2date        (const gmt_time_t& gmt_time); // returns date (taking into account leap years)
        static int64_t      datetime2sys    (int year, int month, int day, int hour=0, int minute=0, int second=0); // returns microseconds since unix epoch
        static int64_t      str2systime     (const char* time_str); // <year>-<month>-<day>T<hour>:<minute>:<second>, returns microseconds since unix epoch
        static int          dayofyear       (int year, int month, int day_of_month);
        static int          daysinmonth     (int year, int month);

    private:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int MONTHS_IN_YEAR = 12;
        static const int DaysInEachMonth[MONTHS_IN_YEAR];
};

#endif  /* __h5cloud_timelib__ */
