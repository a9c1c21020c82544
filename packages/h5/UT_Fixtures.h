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

#ifndef __h5cloud_ut_fixtures__
#define __h5cloud_ut_fixtures__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Cloud.h"

#include <atomic>
#include <string>
#include <vector>

/******************************************************************************
 * TEST FIXTURES
 *
 *  files written with libhdf5 into a scratch directory before the suites run
 ******************************************************************************/

class UT_Fixtures
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char*  EARLIEST_FILE;      // earliest file format: symbol table groups, v1 headers
        static const char*  V18_FILE;           // link messages, v2 headers, dense links and attributes
        static const char*  ASDF_FILE;          // seismic waveform layout
        static const char*  BAD_SIGNATURE_FILE; // corrupted superblock signature

        static const int    ROWS = 100;
        static const int    COLS = 10;
        static const int    CHUNK_ROWS = 10;
        static const int    CHUNK_COLS = 10;
        static const int    WRITTEN_ROWS = 30;  // rows of /sparse written, remaining chunks left unallocated
        static const int    SPARSE_FILL = -1;
        static const int    CONTIGUOUS_SIZE = 50;
        static const int    BIGENDIAN_SIZE = 20;
        static const int    UNFILLED_SIZE = 16;
        static const int    DENSE_CHILDREN = 20;
        static const int    DENSE_ATTRIBUTES = 12;
        static const int    TRACE_SAMPLES = 101;
        static const int    LABEL_COUNT = 12;
        static const int    LABEL_SIZE = 16;

        static const char*  STATION_XML;
        static const char*  QUAKE_ML;
        static const char*  ASDF_DICT;
        static const char*  TRACE_BHZ;
        static const char*  TRACE_BH1;
        static const char*  TRACE_BAD;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static bool         create          (const char* directory);
        static std::string  path            (const char* file);
        static const char*  directory       (void);

        static int32_t      chunkedValue    (int row, int col) { return (row * COLS) + col; }
        static double       contiguousValue (int i) { return i * 0.5; }
        static int16_t      bigendianValue  (int i) { return (int16_t)(i - 10) * 300; }
        static float        traceValue      (int i) { return (float)i * 0.25f; }
        static void         label           (int i, char* buf) { snprintf(buf, LABEL_SIZE, "label-%02d", i); }

    private:

        static bool         writeEarliest   (const char* filename);
        static bool         writeV18        (const char* filename);
        static bool         writeAsdf       (const char* filename);
        static bool         writeBadSignature (const char* filename);

        static std::string  scratch;
};

/******************************************************************************
 * IN MEMORY OBJECT
 *
 *  backend over a byte buffer that counts reads and injects faults
 ******************************************************************************/

class UT_MemoryObject
{
    public:

        explicit            UT_MemoryObject (int64_t size);
        explicit            UT_MemoryObject (const char* filename);

        H5Cloud::backend_t  backend         (void);
        long                getReads        (void) const;
        int64_t             getBytes        (void) const;

        static uint8_t      pattern         (uint64_t pos) { return (uint8_t)((pos * 7) + (pos >> 8)); }

        std::vector<uint8_t>    data;
        int64_t                 maxRead;    // bytes returned per call, 0 for no limit
        int64_t                 failAt;     // reads covering this offset fail with IO_FAILURE, -1 for none
        int                     delayMs;    // sleep before each read

    private:

        int64_t             read            (uint8_t* buffer, int64_t size, uint64_t pos);

        std::atomic<long>       reads;
        std::atomic<int64_t>    bytes;
};

#endif  /* __h5cloud_ut_fixtures__ */
