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

#ifndef __h5cloud_h5cloud__
#define __h5cloud_h5cloud__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "Asset.h"

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#ifndef H5CLOUD_MAXIMUM_DIMENSIONS
#define H5CLOUD_MAXIMUM_DIMENSIONS      8
#endif

#ifndef H5CLOUD_MAXIMUM_NAME_SIZE
#define H5CLOUD_MAXIMUM_NAME_SIZE       1024
#endif

#ifndef H5CLOUD_VERBOSE
#define H5CLOUD_VERBOSE                 false
#endif

#ifndef H5CLOUD_ERROR_CHECKING
#define H5CLOUD_ERROR_CHECKING          true
#endif

/******************************************************************************
 * H5CLOUD NAMESPACE
 ******************************************************************************/

namespace H5Cloud
{
    /*--------------------------------------------------------------------
     * Constants
     *--------------------------------------------------------------------*/

    static const int        MAX_NDIMS = H5CLOUD_MAXIMUM_DIMENSIONS;
    static const int64_t    EOR = -1L; // end of range, slice runs to extent of dimension

    /*--------------------------------------------------------------------
     * Typedefs
     *--------------------------------------------------------------------*/

    /* storage capability: {size, read} */
    typedef Asset::io_driver_t backend_t;

    /* value translation requested by caller */
    typedef enum {
        RAW         = 0,    // declared type of dataset
        INTEGER     = 1,    // int64_t
        REAL        = 2     // double
    } valtype_t;

    /* element type of returned data */
    typedef enum {
        INVALID_TYPE    = 0,
        INT8            = 1,
        INT16           = 2,
        INT32           = 3,
        INT64           = 4,
        UINT8           = 5,
        UINT16          = 6,
        UINT32          = 7,
        UINT64          = 8,
        FLOAT           = 9,
        DOUBLE          = 10,
        STRING          = 11
    } datatype_t;

    /* per-dimension selection: [start, stop) every step elements */
    typedef struct {
        int64_t     start;
        int64_t     stop;   // EOR for extent of dimension
        int64_t     step;
    } slice_t;

    /* result of a read; caller owns data (free with delete []) */
    typedef struct {
        uint64_t    elements;                   // number of elements returned
        uint32_t    typesize;                   // number of bytes per element
        uint64_t    datasize;                   // total number of bytes in data
        uint8_t*    data;                       // allocated data buffer, NULL for metadata only
        datatype_t  datatype;                   // type of elements in data
        int         ndims;                      // number of dimensions in shape
        uint64_t    shape[MAX_NDIMS];           // elements per dimension
    } info_t;

    /*--------------------------------------------------------------------
     * Functions
     *--------------------------------------------------------------------*/

    void            clearInfo       (info_t& info);
    const char*     type2str        (datatype_t datatype);
    bool            isTransient     (int code);
}

#endif  /* __h5cloud_h5cloud__ */
