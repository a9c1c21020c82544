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

#include "OsApi.h"

#include <stdlib.h>
#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include <byteswap.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

OsApi::print_func_t OsApi::print_func = NULL;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void OsApi::init(print_func_t _print_func)
{
    print_func = _print_func;
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void OsApi::deinit(void)
{
    print_func = NULL;
}

/*----------------------------------------------------------------------------
 * print
 *----------------------------------------------------------------------------*/
void OsApi::print (const char* file_name, unsigned int line_number, const char* format_string, ...)
{
    char message[MAX_PRINT_MESSAGE];

    /* Build Formatted Message */
    va_list args;
    va_start(args, format_string);
    const int vlen = vsnprintf(message, MAX_PRINT_MESSAGE - 1, format_string, args);
    const int msglen = MIN(vlen, MAX_PRINT_MESSAGE - 1);
    va_end(args);
    if(msglen < 0) return;
    message[msglen] = '\0';

    /* Handle Message */
    if(print_func)
    {
        print_func(file_name, line_number, message);
    }
    else
    {
        fprintf(stderr, "%s:%u %s", file_name, line_number, message);
    }
}

/*----------------------------------------------------------------------------
 * printTerminal - standard output, unaffected by the log level
 *----------------------------------------------------------------------------*/
void OsApi::printTerminal (const char* format_string, ...)
{
    va_list args;
    va_start(args, format_string);
    vfprintf(stdout, format_string, args);
    va_end(args);
}

/*----------------------------------------------------------------------------
 * sleep
 *----------------------------------------------------------------------------*/
void OsApi::sleep(double secs)
{
    struct timespec waittime;

    waittime.tv_sec  = (time_t)secs;
    waittime.tv_nsec = (long)((secs - (long)secs) * 1000000000L);

    while( nanosleep(&waittime, &waittime) == -1 ) continue;
}

/*----------------------------------------------------------------------------
*  time
*
*   SYS_CLK returns microseconds since unix epoch
*   CPU_CLK returns monotonically incrementing time normalized number (us)
*-----------------------------------------------------------------------------*/
int64_t OsApi::time(int clkid)
{
    struct timespec now;

    if (clkid == SYS_CLK)
    {
        clock_gettime(CLOCK_REALTIME, &now);
    }
    else if (clkid == CPU_CLK)
    {
        clock_gettime(CLOCK_MONOTONIC, &now);
    }
    else
    {
        return 0;
    }

    return ((int64_t)now.tv_sec * 1000000) + (now.tv_nsec / 1000);
}

/*----------------------------------------------------------------------------
 * swaps
 *----------------------------------------------------------------------------*/
uint16_t OsApi::swaps(uint16_t val)
{
    return bswap_16(val);
}

/*----------------------------------------------------------------------------
 * swapl
 *----------------------------------------------------------------------------*/
uint32_t OsApi::swapl(uint32_t val)
{
    return bswap_32(val);
}

/*----------------------------------------------------------------------------
 * swapll
 *----------------------------------------------------------------------------*/
uint64_t OsApi::swapll(uint64_t val)
{
    return bswap_64(val);
}

/*----------------------------------------------------------------------------
 * performIOTimeout
 *----------------------------------------------------------------------------*/
void OsApi::performIOTimeout(void)
{
    OsApi::sleep(MAX(IO_DEFAULT_TIMEOUT / 1000.0, 0.1));
}
