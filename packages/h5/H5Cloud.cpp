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

#include "H5Cloud.h"

/******************************************************************************
 * FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * clearInfo
 *----------------------------------------------------------------------------*/
void H5Cloud::clearInfo (info_t& info)
{
    info.elements = 0;
    info.typesize = 0;
    info.datasize = 0;
    info.data = NULL;
    info.datatype = INVALID_TYPE;
    info.ndims = 0;
    for(int d = 0; d < MAX_NDIMS; d++) info.shape[d] = 0;
}

/*----------------------------------------------------------------------------
 * type2str
 *----------------------------------------------------------------------------*/
const char* H5Cloud::type2str (datatype_t datatype)
{
    switch(datatype)
    {
        case INT8:      return "int8";
        case INT16:     return "int16";
        case INT32:     return "int32";
        case INT64:     return "int64";
        case UINT8:     return "uint8";
        case UINT16:    return "uint16";
        case UINT32:    return "uint32";
        case UINT64:    return "uint64";
        case FLOAT:     return "float";
        case DOUBLE:    return "double";
        case STRING:    return "string";
        default:        return "invalid";
    }
}

/*----------------------------------------------------------------------------
 * isTransient
 *
 *  whole call may be retried; fetches are pure byte-range reads
 *----------------------------------------------------------------------------*/
bool H5Cloud::isTransient (int code)
{
    return (code == RTE_IO_FAILURE) || (code == RTE_TIMEOUT);
}
