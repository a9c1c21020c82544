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

#ifndef __h5cloud_asset__
#define __h5cloud_asset__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

#include <functional>
#include <map>
#include <string>

/******************************************************************************
 * ASSET CLASS
 ******************************************************************************/

class Asset
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char*  DEFAULT_REGION;

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        /* I/O capability bound to one resource of an asset
         *  size - total number of bytes in the resource
         *  read - fill buffer with len bytes starting at pos; deadline is an
         *         absolute OsApi::time(CPU_CLK) value (0 means none); returns
         *         bytes read or throws */
        typedef struct {
            std::function<uint64_t (void)>                                  size;
            std::function<int64_t (uint8_t*, int64_t, uint64_t, int64_t)>   read;
        } io_driver_t;

        typedef io_driver_t (*io_driver_f) (const Asset* _asset, const char* resource);

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static Asset*       create          (const char* name, const char* format, const char* path,
                                             const char* region=NULL, const char* endpoint=NULL);
        static bool         registerDriver  (const char* _format, io_driver_f factory);

        io_driver_t         createDriver    (const char* resource) const;

                            ~Asset          (void);

        const char*         getName         (void) const;
        const char*         getPath         (void) const;
        const char*         getRegion       (void) const;
        const char*         getEndpoint     (void) const;

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            const char*     name;
            const char*     format;
            const char*     path;
            const char*     region;
            const char*     endpoint;
        } attributes_t;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        static Mutex                                ioDriverMut;
        static std::map<std::string, io_driver_f>   ioDrivers;

        attributes_t                                attributes;
        io_driver_f                                 factory;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                            Asset           (const attributes_t& _attributes, io_driver_f _factory);
};

#endif  /* __h5cloud_asset__ */
