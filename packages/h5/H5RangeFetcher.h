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

#ifndef __h5cloud_h5rangefetcher__
#define __h5cloud_h5rangefetcher__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Cloud.h"

#include <atomic>
#include <string>
#include <vector>

/******************************************************************************
 * H5 RANGE FETCHER CLASS
 ******************************************************************************/

class H5RangeFetcher
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int DEFAULT_MAX_CONCURRENT_FETCHES = 8;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::vector<uint8_t> bytes_t;

        typedef struct {
            uint64_t    offset;
            int64_t     length;
        } range_t;

        /*--------------------------------------------------------------------
         * Cancel - cancellation token checked before each fetch is issued
         *--------------------------------------------------------------------*/

        class Cancel
        {
            public:
                        Cancel          (void);
                void    cancel          (void);
                bool    isCancelled     (void) const;
                void    check           (void) const;
            private:
                std::atomic<bool> cancelled;
        };

        /* per call controls */
        typedef struct {
            int64_t         deadline;   // absolute OsApi::time(CPU_CLK), 0 is none
            const Cancel*   cancel;     // NULL if call cannot be cancelled
        } control_t;

        /*--------------------------------------------------------------------
         * RemoteObject - identity and size of the object being read
         *--------------------------------------------------------------------*/

        class RemoteObject
        {
            public:
                                            RemoteObject    (const char* _name, const char* _resource, const H5Cloud::backend_t& _backend);
                const char*                 getName         (void) const;
                const char*                 getResource     (void) const;
                uint64_t                    getSize         (void) const;
                const H5Cloud::backend_t&   getBackend      (void) const;
            private:
                std::string                 name;
                std::string                 resource;
                H5Cloud::backend_t          backend;
                uint64_t                    size;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                        H5RangeFetcher  (const RemoteObject* _object, int max_concurrent_fetches=DEFAULT_MAX_CONCURRENT_FETCHES);
                        ~H5RangeFetcher (void);

        bytes_t         fetch           (uint64_t offset, int64_t length, const control_t& control);
        void            fetchMany       (const std::vector<range_t>& ranges, std::vector<bytes_t>& results, const control_t& control);

        const RemoteObject* getObject   (void) const;
        long            getFetches      (void) const;
        long            getBytesRead    (void) const;

        static control_t control        (int timeout_ms, const Cancel* cancel=NULL);

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            bool            failed;
            event_level_t   lvl;
            int             code;
            std::string     msg;
        } failure_t;

        typedef struct {
            H5RangeFetcher*                 fetcher;
            const std::vector<range_t>*     ranges;
            std::vector<bytes_t>*           results;
            std::vector<failure_t>          failures;
            const control_t*                control;
            Mutex                           mut;
            size_t                          next;
            bool                            failed;
        } batch_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void*    fetchThread     (void* parm);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        const RemoteObject*     object;
        int                     maxConcurrentFetches;
        std::atomic<long>       fetches;
        std::atomic<long>       bytesRead;
};

#endif  /* __h5cloud_h5rangefetcher__ */
