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

#ifndef __h5cloud_h5chunkcache__
#define __h5cloud_h5chunkcache__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5RangeFetcher.h"

#include <functional>
#include <list>
#include <map>
#include <utility>
#include <vector>

/******************************************************************************
 * H5 CHUNK CACHE CLASS
 ******************************************************************************/

class H5ChunkCache
{
    private:

        struct entry_t;

    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int64_t DEFAULT_CEILING = 0x10000000; // 256MB

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef H5RangeFetcher::range_t range_t;
        typedef H5RangeFetcher::bytes_t bytes_t;

        /* fills results positionally for the ranges given */
        typedef std::function<void (const std::vector<range_t>& ranges, std::vector<bytes_t>& results)> loader_t;

        typedef struct {
            long    hits;
            long    misses;
            long    fetches;
            long    evictions;
            long    entries;
            int64_t resident;   // bytes
        } stats_t;

        /*--------------------------------------------------------------------
         * Ref - pinned view of a cached range, released on destruction
         *--------------------------------------------------------------------*/

        class Ref
        {
            public:
                                Ref         (void);
                                Ref         (Ref&& other) noexcept;
                                ~Ref        (void);
                Ref&            operator=   (Ref&& other) noexcept;
                                Ref         (const Ref&) = delete;
                Ref&            operator=   (const Ref&) = delete;

                const uint8_t*  data        (void) const;
                int64_t         size        (void) const;
                uint64_t        offset      (void) const;
                bool            valid       (void) const;
                bool            contains    (uint64_t pos, int64_t len) const;
                void            release     (void);

            private:
                friend class H5ChunkCache;
                                Ref         (H5ChunkCache* _cache, entry_t* _entry, uint64_t _offset, int64_t _size);
                H5ChunkCache*   cache;
                entry_t*        entry;
                uint64_t        start;      // offset of view within object
                int64_t         length;     // bytes in view
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit            H5ChunkCache    (int64_t _ceiling=DEFAULT_CEILING);
                            ~H5ChunkCache   (void);

        Ref                 find            (uint64_t offset, int64_t length);
        Ref                 getOrFetch      (uint64_t offset, int64_t length, const loader_t& loader);
        std::vector<Ref>    getOrFetchMany  (const std::vector<range_t>& ranges, const loader_t& loader);
        void                clear           (void);
        stats_t             getStats        (void);

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::pair<uint64_t, int64_t> key_t;

        struct entry_t {
            key_t                       key;
            bytes_t                     data;
            int                         pins;
            std::list<entry_t*>::iterator lru;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        entry_t*            lookup          (uint64_t offset, int64_t length);
        void                touch           (entry_t* entry);
        void                unpin           (entry_t* entry);
        void                evict           (void);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        Cond                            cacheCond;      // guards all below, signals when in-flight fetches land
        std::map<key_t, entry_t*>       entries;
        std::map<key_t, int>            inflight;       // keys being fetched
        std::list<entry_t*>             lruList;        // front is most recently used
        int64_t                         ceiling;
        int64_t                         resident;
        int64_t                         maxEntrySize;
        long                            hits;
        long                            misses;
        long                            fetches;
        long                            evictions;
};

#endif  /* __h5cloud_h5chunkcache__ */
