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

#ifndef __h5cloud_h5session__
#define __h5cloud_h5session__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "Asset.h"
#include "H5Cloud.h"
#include "H5Future.h"
#include "H5RangeFetcher.h"
#include "H5ChunkCache.h"
#include "H5Parser.h"

#include <string>
#include <vector>

/******************************************************************************
 * H5 SESSION CLASS
 ******************************************************************************/

class H5Session
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int64_t    DEFAULT_CACHE_CEILING       = H5ChunkCache::DEFAULT_CEILING;
        static const int        DEFAULT_FETCH_TIMEOUT_MS    = 600000;
        static const int64_t    DEFAULT_READ_AHEAD_SIZE     = H5Parser::DEFAULT_READ_AHEAD_SIZE;
        static const int        DEFAULT_MAX_CONCURRENT      = H5RangeFetcher::DEFAULT_MAX_CONCURRENT_FETCHES;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            CLOSED      = 0,
            OPENING     = 1,
            OPEN        = 2
        } state_t;

        typedef struct {
            int64_t     cacheCeiling;           // bytes held by the cache before eviction
            int         fetchTimeoutMs;         // deadline applied to each call
            int64_t     readAheadSize;          // bytes fetched around small structural reads
            int         maxConcurrentFetches;   // fetches in flight per batch
            bool        verbose;                // log each call at INFO
        } config_t;

        typedef struct {
            std::string                     path;
            H5Cloud::valtype_t              valtype;
            std::vector<H5Cloud::slice_t>   slice;
        } request_t;

        typedef struct {
            long        fetches;
            long        bytesRead;
            long        cacheHits;
            long        cacheMisses;
            long        cacheEvictions;
            long        cacheEntries;
            int64_t     cacheResident;
        } stats_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static config_t             defaultConfig   (void);
        static const char*          state2str       (state_t state);

                                    H5Session       (const Asset* _asset, const char* _resource, const config_t& _config=defaultConfig());
                                    H5Session       (const H5Cloud::backend_t& _backend, const char* _name, const char* _resource, const config_t& _config=defaultConfig());
                                    ~H5Session      (void);

        void                        open            (void);
        void                        close           (void);
        state_t                     getState        (void);
        const char*                 getResource     (void) const;

        std::vector<std::string>    list            (const char* group_path);
        H5Cloud::info_t             read            (const char* path, H5Cloud::valtype_t valtype=H5Cloud::RAW,
                                                     const std::vector<H5Cloud::slice_t>& slice=std::vector<H5Cloud::slice_t>(),
                                                     const H5RangeFetcher::Cancel* cancel=NULL);
        H5Cloud::info_t             readAttribute   (const char* path, const char* name, H5Cloud::valtype_t valtype=H5Cloud::RAW);
        H5Cloud::info_t             meta            (const char* path);
        H5Future*                   readp           (const request_t& request);
        std::vector<H5Future*>      readp           (const std::vector<request_t>& requests);
        void                        cancel          (H5Future* future);
        stats_t                     stats           (void);

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            H5Session*      session;
            H5Future*       future;
            request_t       request;
        } readp_t;

        /* holds the session open for the duration of a call */
        class ReadGuard
        {
            public:
                explicit    ReadGuard   (H5Session* _session);
                            ~ReadGuard  (void);
            private:
                H5Session*  session;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                        beginRead       (void);
        void                        endRead         (void);
        H5Cloud::info_t             readDataset     (const char* path, H5Cloud::valtype_t valtype, const std::vector<H5Cloud::slice_t>& slice,
                                                     bool meta_only, const H5RangeFetcher::Cancel* cancel);
        void                        release         (void);
        stats_t                     collectStats    (void);

        static void*                readerThread    (void* parm);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        const Asset*                    asset;
        std::string                     name;
        std::string                     resource;
        H5Cloud::backend_t              backend;
        config_t                        config;

        Cond                            stateCond;      // guards state and active reads
        state_t                         state;
        int                             activeReads;
        stats_t                         closedStats;

        H5RangeFetcher::RemoteObject*   object;
        H5RangeFetcher*                 fetcher;
        H5ChunkCache*                   cache;
        H5Parser*                       parser;
};

#endif  /* __h5cloud_h5session__ */
