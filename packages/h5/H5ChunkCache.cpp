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

#include "H5ChunkCache.h"
#include "EventLib.h"
#include "OsApi.h"

/******************************************************************************
 * REF METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref::Ref (void):
    cache(NULL),
    entry(NULL),
    start(0),
    length(0)
{
}

/*----------------------------------------------------------------------------
 * Constructor - entry already pinned by caller
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref::Ref (H5ChunkCache* _cache, entry_t* _entry, uint64_t _offset, int64_t _size):
    cache(_cache),
    entry(_entry),
    start(_offset),
    length(_size)
{
}

/*----------------------------------------------------------------------------
 * Move Constructor
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref::Ref (Ref&& other) noexcept:
    cache(other.cache),
    entry(other.entry),
    start(other.start),
    length(other.length)
{
    other.cache = NULL;
    other.entry = NULL;
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref::~Ref (void)
{
    release();
}

/*----------------------------------------------------------------------------
 * Move Assignment
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref& H5ChunkCache::Ref::operator= (Ref&& other) noexcept
{
    if(this != &other)
    {
        release();
        cache = other.cache;
        entry = other.entry;
        start = other.start;
        length = other.length;
        other.cache = NULL;
        other.entry = NULL;
    }
    return *this;
}

/*----------------------------------------------------------------------------
 * data
 *----------------------------------------------------------------------------*/
const uint8_t* H5ChunkCache::Ref::data (void) const
{
    if(!entry) return NULL;
    return entry->data.data() + (start - entry->key.first);
}

/*----------------------------------------------------------------------------
 * size
 *----------------------------------------------------------------------------*/
int64_t H5ChunkCache::Ref::size (void) const
{
    return length;
}

/*----------------------------------------------------------------------------
 * offset
 *----------------------------------------------------------------------------*/
uint64_t H5ChunkCache::Ref::offset (void) const
{
    return start;
}

/*----------------------------------------------------------------------------
 * valid
 *----------------------------------------------------------------------------*/
bool H5ChunkCache::Ref::valid (void) const
{
    return entry != NULL;
}

/*----------------------------------------------------------------------------
 * contains
 *----------------------------------------------------------------------------*/
bool H5ChunkCache::Ref::contains (uint64_t pos, int64_t len) const
{
    return entry && (pos >= start) && ((pos + len) <= (start + length));
}

/*----------------------------------------------------------------------------
 * release
 *----------------------------------------------------------------------------*/
void H5ChunkCache::Ref::release (void)
{
    if(cache && entry) cache->unpin(entry);
    cache = NULL;
    entry = NULL;
}

/******************************************************************************
 * CHUNK CACHE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5ChunkCache::H5ChunkCache (int64_t _ceiling):
    ceiling(_ceiling > 0 ? _ceiling : DEFAULT_CEILING),
    resident(0),
    maxEntrySize(0),
    hits(0),
    misses(0),
    fetches(0),
    evictions(0)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5ChunkCache::~H5ChunkCache (void)
{
    for(auto& kv: entries)
    {
        delete kv.second;
    }
}

/*----------------------------------------------------------------------------
 * find
 *
 *  returns an invalid reference when no entry holds the range
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref H5ChunkCache::find (uint64_t offset, int64_t length)
{
    Ref ref;
    cacheCond.lock();
    {
        entry_t* entry = lookup(offset, length);
        if(entry)
        {
            entry->pins++;
            touch(entry);
            hits++;
            ref = Ref(this, entry, offset, length);
        }
    }
    cacheCond.unlock();

    if(ref.valid()) count_metric(DEBUG, "h5cloud.cache_hits", 1);
    return ref;
}

/*----------------------------------------------------------------------------
 * getOrFetch
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref H5ChunkCache::getOrFetch (uint64_t offset, int64_t length, const loader_t& loader)
{
    const std::vector<range_t> ranges = {{offset, length}};
    std::vector<Ref> refs = getOrFetchMany(ranges, loader);
    return std::move(refs[0]);
}

/*----------------------------------------------------------------------------
 * getOrFetchMany
 *
 *  every range missing from the cache and not already being fetched is
 *  handed to the loader in a single call; ranges in flight on behalf of
 *  another caller are waited on instead of fetched again
 *----------------------------------------------------------------------------*/
std::vector<H5ChunkCache::Ref> H5ChunkCache::getOrFetchMany (const std::vector<range_t>& ranges, const loader_t& loader)
{
    std::vector<Ref> refs(ranges.size());

    while(true)
    {
        std::vector<size_t> to_fetch;
        std::vector<range_t> fetch_ranges;
        std::map<key_t, size_t> pending;
        bool waiting = false;
        bool done = true;
        long new_hits = 0;

        /* Claim Ranges */
        cacheCond.lock();
        {
            for(size_t i = 0; i < ranges.size(); i++)
            {
                if(refs[i].valid()) continue;
                done = false;

                const key_t key(ranges[i].offset, ranges[i].length);
                entry_t* entry = lookup(key.first, key.second);
                if(entry)
                {
                    entry->pins++;
                    touch(entry);
                    refs[i] = Ref(this, entry, key.first, key.second);
                    new_hits++;
                }
                else if(inflight.find(key) != inflight.end() || pending.find(key) != pending.end())
                {
                    waiting = true;
                }
                else
                {
                    inflight[key] = 1;
                    pending[key] = to_fetch.size();
                    to_fetch.push_back(i);
                    fetch_ranges.push_back(ranges[i]);
                }
            }

            hits += new_hits;
            misses += to_fetch.size();

            if(to_fetch.empty() && waiting)
            {
                cacheCond.wait(IO_PEND);
            }
        }
        cacheCond.unlock();

        if(new_hits > 0) count_metric(DEBUG, "h5cloud.cache_hits", new_hits);
        if(done) break;
        if(to_fetch.empty()) continue;

        count_metric(DEBUG, "h5cloud.cache_misses", to_fetch.size());

        /* Load Ranges */
        std::vector<bytes_t> results;
        try
        {
            loader(fetch_ranges, results);
            if(results.size() != fetch_ranges.size())
            {
                throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "loader returned %ld results for %ld ranges", (long)results.size(), (long)fetch_ranges.size());
            }

            for(size_t j = 0; j < results.size(); j++)
            {
                if((int64_t)results[j].size() != fetch_ranges[j].length)
                {
                    throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "loader returned %ld bytes for range <%lu, %ld>",
                                           (long)results[j].size(), (unsigned long)fetch_ranges[j].offset, (long)fetch_ranges[j].length);
                }
            }
        }
        catch(...)
        {
            /* Release Claims So Waiters Retry */
            cacheCond.lock();
            {
                for(const range_t& range: fetch_ranges)
                {
                    inflight.erase(key_t(range.offset, range.length));
                }
                cacheCond.signal();
            }
            cacheCond.unlock();
            throw;
        }

        /* Publish Entries */
        cacheCond.lock();
        {
            for(size_t j = 0; j < results.size(); j++)
            {
                const key_t key(fetch_ranges[j].offset, fetch_ranges[j].length);

                entry_t* entry = new entry_t;
                entry->key = key;
                entry->data = std::move(results[j]);
                entry->pins = 1;
                lruList.push_front(entry);
                entry->lru = lruList.begin();

                entries[key] = entry;
                inflight.erase(key);
                resident += key.second;
                maxEntrySize = MAX(maxEntrySize, key.second);
                fetches++;

                refs[to_fetch[j]] = Ref(this, entry, key.first, key.second);
            }

            evict();
            cacheCond.signal();
        }
        cacheCond.unlock();
    }

    return refs;
}

/*----------------------------------------------------------------------------
 * clear
 *
 *  pinned entries are left in place
 *----------------------------------------------------------------------------*/
void H5ChunkCache::clear (void)
{
    cacheCond.lock();
    {
        auto iter = entries.begin();
        while(iter != entries.end())
        {
            entry_t* entry = iter->second;
            if(entry->pins == 0)
            {
                resident -= entry->key.second;
                lruList.erase(entry->lru);
                delete entry;
                iter = entries.erase(iter);
            }
            else
            {
                iter++;
            }
        }
        if(entries.empty()) maxEntrySize = 0;
    }
    cacheCond.unlock();
}

/*----------------------------------------------------------------------------
 * getStats
 *----------------------------------------------------------------------------*/
H5ChunkCache::stats_t H5ChunkCache::getStats (void)
{
    stats_t stats;
    cacheCond.lock();
    {
        stats.hits = hits;
        stats.misses = misses;
        stats.fetches = fetches;
        stats.evictions = evictions;
        stats.entries = entries.size();
        stats.resident = resident;
    }
    cacheCond.unlock();
    return stats;
}

/*----------------------------------------------------------------------------
 * lookup - must be called with cacheCond locked
 *
 *  exact key first, then nearest entries starting at or below the offset
 *----------------------------------------------------------------------------*/
H5ChunkCache::entry_t* H5ChunkCache::lookup (uint64_t offset, int64_t length)
{
    auto exact = entries.find(key_t(offset, length));
    if(exact != entries.end()) return exact->second;

    auto iter = entries.upper_bound(key_t(offset, INT64_MAX));
    while(iter != entries.begin())
    {
        --iter;
        const entry_t* entry = iter->second;
        const uint64_t entry_offset = entry->key.first;
        if(entry_offset + maxEntrySize < offset + length) break; // nothing further down can contain range
        if(entry_offset + entry->key.second >= offset + length)
        {
            return iter->second;
        }
    }

    return NULL;
}

/*----------------------------------------------------------------------------
 * touch - must be called with cacheCond locked
 *----------------------------------------------------------------------------*/
void H5ChunkCache::touch (entry_t* entry)
{
    lruList.splice(lruList.begin(), lruList, entry->lru);
}

/*----------------------------------------------------------------------------
 * unpin
 *----------------------------------------------------------------------------*/
void H5ChunkCache::unpin (entry_t* entry)
{
    cacheCond.lock();
    {
        entry->pins--;
        if(entry->pins == 0 && resident > ceiling)
        {
            evict();
        }
    }
    cacheCond.unlock();
}

/*----------------------------------------------------------------------------
 * evict - must be called with cacheCond locked
 *----------------------------------------------------------------------------*/
void H5ChunkCache::evict (void)
{
    auto iter = lruList.end();
    while(resident > ceiling && iter != lruList.begin())
    {
        --iter;
        entry_t* entry = *iter;
        if(entry->pins > 0) continue;

        iter = lruList.erase(iter);
        entries.erase(entry->key);
        resident -= entry->key.second;
        evictions++;
        mlog(DEBUG, "Evicted cache entry <%lu, %ld>", (unsigned long)entry->key.first, (long)entry->key.second);
        delete entry;
    }
}
