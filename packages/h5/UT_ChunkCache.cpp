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

#include "UT_ChunkCache.h"
#include "UT_Fixtures.h"
#include "H5ChunkCache.h"
#include "UnitTest.h"
#include "OsApi.h"

#include <atomic>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_ChunkCache::NAME = "UT_ChunkCache";

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/* loader over the memory object pattern that counts calls and ranges */
struct PatternLoader
{
    std::atomic<long>   calls;
    std::atomic<long>   ranges;
    int                 delayMs;
    bool                fail;
    bool                truncate;

    PatternLoader(void): calls(0), ranges(0), delayMs(0), fail(false), truncate(false) {}

    H5ChunkCache::loader_t loader (void)
    {
        return [this](const std::vector<H5ChunkCache::range_t>& requested, std::vector<H5ChunkCache::bytes_t>& results) {
            calls++;
            ranges += requested.size();
            if(delayMs > 0) OsApi::sleep(delayMs / 1000.0);
            if(fail) throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "injected loader failure");
            results.resize(requested.size());
            for(size_t i = 0; i < requested.size(); i++)
            {
                const int64_t length = truncate ? requested[i].length / 2 : requested[i].length;
                results[i].resize(length);
                for(int64_t b = 0; b < length; b++) results[i][b] = UT_MemoryObject::pattern(requested[i].offset + b);
            }
        };
    }
};

/*----------------------------------------------------------------------------
 * matches
 *----------------------------------------------------------------------------*/
static bool matches (const H5ChunkCache::Ref& ref)
{
    if(!ref.valid()) return false;
    for(int64_t i = 0; i < ref.size(); i++)
    {
        if(ref.data()[i] != UT_MemoryObject::pattern(ref.offset() + i)) return false;
    }
    return true;
}

/* shared state for threads reading the same range */
typedef struct {
    H5ChunkCache*           cache;
    PatternLoader*          loader;
    std::atomic<int>*       valid;
} single_flight_t;

/*----------------------------------------------------------------------------
 * singleFlightThread
 *----------------------------------------------------------------------------*/
static void* singleFlightThread (void* parm)
{
    single_flight_t* sf = static_cast<single_flight_t*>(parm);
    try
    {
        const H5ChunkCache::Ref ref = sf->cache->getOrFetch(0x4000, 2048, sf->loader->loader());
        if(matches(ref)) (*sf->valid)++;
    }
    catch(const RunTimeException& e)
    {
        print2term("single flight reader failed: %s\n", e.what());
    }
    return NULL;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_ChunkCache::UT_ChunkCache (void):
    UnitTest(NAME)
{
}

/*----------------------------------------------------------------------------
 * run
 *----------------------------------------------------------------------------*/
bool UT_ChunkCache::run (void)
{
    ut_initialize(this);

    testHitAndMiss();
    testContainedRange();
    testDuplicateRanges();
    testSingleFlight();
    testEviction();
    testPinned();
    testLoaderFailure();
    testClear();

    return ut_status(this);
}

/*----------------------------------------------------------------------------
 * testHitAndMiss
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testHitAndMiss (void)
{
    H5ChunkCache cache;
    PatternLoader loader;

    try
    {
        {
            const H5ChunkCache::Ref ref = cache.getOrFetch(100, 400, loader.loader());
            ut_assert(this, matches(ref), "first fetch returned wrong bytes");
        }
        {
            const H5ChunkCache::Ref ref = cache.getOrFetch(100, 400, loader.loader());
            ut_assert(this, matches(ref), "cached fetch returned wrong bytes");
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    const H5ChunkCache::stats_t stats = cache.getStats();
    ut_assert(this, loader.calls == 1, "loader called %ld times", loader.calls.load());
    ut_assert(this, stats.hits == 1 && stats.misses == 1, "expected 1 hit and 1 miss, got %ld and %ld", stats.hits, stats.misses);
    ut_assert(this, stats.entries == 1 && stats.resident == 400, "expected 1 entry of 400 bytes, got %ld and %ld", stats.entries, (long)stats.resident);
}

/*----------------------------------------------------------------------------
 * testContainedRange - a range inside a cached entry is served from it
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testContainedRange (void)
{
    H5ChunkCache cache;
    PatternLoader loader;

    try
    {
        cache.getOrFetch(0, 1000, loader.loader()).release();
        cache.getOrFetch(5000, 100, loader.loader()).release();

        const H5ChunkCache::Ref inner = cache.find(100, 50);
        ut_assert(this, inner.valid(), "contained range not found");
        ut_assert(this, inner.offset() == 100 && inner.size() == 50, "view is <%lu, %ld>", (unsigned long)inner.offset(), (long)inner.size());
        ut_assert(this, matches(inner), "contained view returned wrong bytes");
        ut_assert(this, inner.contains(120, 30) && !inner.contains(120, 31), "view bounds are wrong");

        const H5ChunkCache::Ref straddle = cache.find(990, 20);
        ut_assert(this, !straddle.valid(), "range past end of entry was found");

        const H5ChunkCache::Ref between = cache.find(2000, 10);
        ut_assert(this, !between.valid(), "uncached range was found");

        const H5ChunkCache::Ref via_fetch = cache.getOrFetch(5010, 80, loader.loader());
        ut_assert(this, matches(via_fetch), "contained fetch returned wrong bytes");
        ut_assert(this, loader.calls == 2, "contained fetch went to the loader");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testDuplicateRanges - repeated ranges in one request load once
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testDuplicateRanges (void)
{
    H5ChunkCache cache;
    PatternLoader loader;

    try
    {
        const std::vector<H5ChunkCache::range_t> ranges = {{0, 64}, {64, 64}, {0, 64}, {128, 64}, {64, 64}};
        const std::vector<H5ChunkCache::Ref> refs = cache.getOrFetchMany(ranges, loader.loader());

        ut_assert(this, refs.size() == ranges.size(), "expected %ld refs, got %ld", (long)ranges.size(), (long)refs.size());
        for(size_t i = 0; i < refs.size(); i++)
        {
            ut_assert(this, matches(refs[i]) && refs[i].offset() == ranges[i].offset, "ref %ld is wrong", (long)i);
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    ut_assert(this, loader.ranges == 3, "loader fetched %ld ranges, expected 3", loader.ranges.load());
    ut_assert(this, cache.getStats().fetches == 3, "cache recorded %ld fetches", cache.getStats().fetches);
}

/*----------------------------------------------------------------------------
 * testSingleFlight - concurrent readers of one range share a single load
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testSingleFlight (void)
{
    const int num_threads = 8;
    H5ChunkCache cache;
    PatternLoader loader;
    loader.delayMs = 50;
    std::atomic<int> valid(0);

    single_flight_t sf = {&cache, &loader, &valid};
    Thread* pids[num_threads];
    for(int i = 0; i < num_threads; i++) pids[i] = new Thread(singleFlightThread, &sf);
    for(int i = 0; i < num_threads; i++) delete pids[i];

    ut_assert(this, valid == num_threads, "only %d of %d readers got valid data", valid.load(), num_threads);
    ut_assert(this, loader.calls == 1, "range was loaded %ld times", loader.calls.load());
}

/*----------------------------------------------------------------------------
 * testEviction - least recently used entries go first
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testEviction (void)
{
    H5ChunkCache cache(4096);
    PatternLoader loader;

    try
    {
        for(int i = 0; i < 4; i++)
        {
            cache.getOrFetch(i * 1024, 1024, loader.loader()).release();
        }

        /* Touch First Entry */
        cache.find(0, 1024).release();

        for(int i = 4; i < 6; i++)
        {
            cache.getOrFetch(i * 1024, 1024, loader.loader()).release();
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    const H5ChunkCache::stats_t stats = cache.getStats();
    ut_assert(this, stats.resident <= 4096, "resident bytes %ld over ceiling", (long)stats.resident);
    ut_assert(this, stats.evictions == 2, "expected 2 evictions, got %ld", stats.evictions);
    ut_assert(this, cache.find(0, 1024).valid(), "recently used entry was evicted");
    ut_assert(this, !cache.find(1024, 1024).valid(), "least recently used entry was kept");
    ut_assert(this, !cache.find(2048, 1024).valid(), "second least recently used entry was kept");
}

/*----------------------------------------------------------------------------
 * testPinned - an entry held by a caller is never evicted
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testPinned (void)
{
    H5ChunkCache cache(2048);
    PatternLoader loader;

    try
    {
        const H5ChunkCache::Ref pinned = cache.getOrFetch(0, 1024, loader.loader());
        for(int i = 1; i < 8; i++)
        {
            cache.getOrFetch(i * 1024, 1024, loader.loader()).release();
        }

        ut_assert(this, matches(pinned), "pinned entry was modified");
        const H5ChunkCache::Ref again = cache.find(0, 1024);
        ut_assert(this, again.valid(), "pinned entry was evicted");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    ut_assert(this, cache.getStats().resident <= 2048, "unpinned entries were not evicted");
}

/*----------------------------------------------------------------------------
 * testLoaderFailure - failed loads are not cached and can be retried
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testLoaderFailure (void)
{
    H5ChunkCache cache;
    PatternLoader loader;
    loader.fail = true;

    int code = RTE_INFO;
    try
    {
        cache.getOrFetch(0, 100, loader.loader());
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_IO_FAILURE, "expected io failure, got %s", RunTimeException::codeName(code));

    loader.fail = false;
    loader.truncate = true;
    code = RTE_INFO;
    try
    {
        cache.getOrFetch(0, 100, loader.loader());
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_IO_FAILURE, "expected io failure for short load, got %s", RunTimeException::codeName(code));
    ut_assert(this, cache.getStats().entries == 0, "failed load left an entry");

    loader.truncate = false;
    try
    {
        const H5ChunkCache::Ref ref = cache.getOrFetch(0, 100, loader.loader());
        ut_assert(this, matches(ref), "retry after failure returned wrong bytes");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "retry after failure failed: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testClear
 *----------------------------------------------------------------------------*/
void UT_ChunkCache::testClear (void)
{
    H5ChunkCache cache;
    PatternLoader loader;

    try
    {
        for(int i = 0; i < 10; i++)
        {
            cache.getOrFetch(i * 100, 100, loader.loader()).release();
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    ut_assert(this, cache.getStats().entries == 10, "expected 10 entries before clear");
    cache.clear();

    const H5ChunkCache::stats_t stats = cache.getStats();
    ut_assert(this, stats.entries == 0 && stats.resident == 0, "clear left %ld entries and %ld bytes", stats.entries, (long)stats.resident);
    ut_assert(this, !cache.find(0, 100).valid(), "cleared entry was found");
}
