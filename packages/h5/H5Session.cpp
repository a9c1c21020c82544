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

#include "H5Session.h"
#include "H5DatasetReader.h"
#include "EventLib.h"
#include "OsApi.h"

#include <exception>
#include <set>
#include <string.h>

/******************************************************************************
 * READ GUARD METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Session::ReadGuard::ReadGuard (H5Session* _session):
    session(_session)
{
    session->beginRead();
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5Session::ReadGuard::~ReadGuard (void)
{
    session->endRead();
}

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * defaultConfig
 *----------------------------------------------------------------------------*/
H5Session::config_t H5Session::defaultConfig (void)
{
    config_t config;
    config.cacheCeiling = DEFAULT_CACHE_CEILING;
    config.fetchTimeoutMs = DEFAULT_FETCH_TIMEOUT_MS;
    config.readAheadSize = DEFAULT_READ_AHEAD_SIZE;
    config.maxConcurrentFetches = DEFAULT_MAX_CONCURRENT;
    config.verbose = false;
    return config;
}

/*----------------------------------------------------------------------------
 * state2str
 *----------------------------------------------------------------------------*/
const char* H5Session::state2str (state_t state)
{
    switch(state)
    {
        case CLOSED:    return "CLOSED";
        case OPENING:   return "OPENING";
        case OPEN:      return "OPEN";
        default:        return "UNKNOWN";
    }
}

/*----------------------------------------------------------------------------
 * Constructor - backend created from asset when opened
 *----------------------------------------------------------------------------*/
H5Session::H5Session (const Asset* _asset, const char* _resource, const config_t& _config):
    asset(_asset),
    name(_asset ? _asset->getName() : ""),
    resource(_resource ? _resource : ""),
    config(_config),
    state(CLOSED),
    activeReads(0),
    object(NULL),
    fetcher(NULL),
    cache(NULL),
    parser(NULL)
{
    memset(&closedStats, 0, sizeof(closedStats));
}

/*----------------------------------------------------------------------------
 * Constructor - caller supplied backend
 *----------------------------------------------------------------------------*/
H5Session::H5Session (const H5Cloud::backend_t& _backend, const char* _name, const char* _resource, const config_t& _config):
    asset(NULL),
    name(_name ? _name : ""),
    resource(_resource ? _resource : ""),
    backend(_backend),
    config(_config),
    state(CLOSED),
    activeReads(0),
    object(NULL),
    fetcher(NULL),
    cache(NULL),
    parser(NULL)
{
    memset(&closedStats, 0, sizeof(closedStats));
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5Session::~H5Session (void)
{
    close();
}

/*----------------------------------------------------------------------------
 * open
 *
 *  Closed -> Opening -> Open; the superblock and root group are decoded
 *  while Opening, and any failure returns the session to Closed
 *----------------------------------------------------------------------------*/
void H5Session::open (void)
{
    stateCond.lock();
    {
        if(state != CLOSED)
        {
            const state_t current = state;
            stateCond.unlock();
            throw RunTimeException(CRITICAL, RTE_ERROR, "cannot open %s while %s", resource.c_str(), state2str(current));
        }
        state = OPENING;
    }
    stateCond.unlock();

    try
    {
        if(asset) backend = asset->createDriver(resource.c_str());

        object  = new H5RangeFetcher::RemoteObject(name.c_str(), resource.c_str(), backend);
        fetcher = new H5RangeFetcher(object, config.maxConcurrentFetches);
        cache   = new H5ChunkCache(config.cacheCeiling);
        parser  = new H5Parser(fetcher, cache, config.readAheadSize);

        const H5RangeFetcher::control_t control = H5RangeFetcher::control(config.fetchTimeoutMs);
        parser->readSuperblock(control);
        parser->getNode(parser->getSuperblock().root, control);
    }
    catch(const RunTimeException& e)
    {
        release();
        stateCond.lock();
        {
            state = CLOSED;
        }
        stateCond.unlock();
        throw RunTimeException(e.level(), e.code(), "failed to open %s: %s", resource.c_str(), e.what());
    }

    stateCond.lock();
    {
        state = OPEN;
    }
    stateCond.unlock();

    mlog(INFO, "Opened %s (%lu bytes), superblock version %d", resource.c_str(),
         (unsigned long)object->getSize(), parser->getSuperblock().version);
}

/*----------------------------------------------------------------------------
 * close
 *
 *  new calls are rejected immediately; calls in progress finish before the
 *  cache is released
 *----------------------------------------------------------------------------*/
void H5Session::close (void)
{
    stateCond.lock();
    {
        if(state != OPEN)
        {
            stateCond.unlock();
            return;
        }

        state = CLOSED;
        while(activeReads > 0)
        {
            stateCond.wait(IO_PEND);
        }
    }
    stateCond.unlock();

    closedStats = collectStats();
    release();

    mlog(INFO, "Closed %s after %ld fetches (%ld bytes)", resource.c_str(), closedStats.fetches, closedStats.bytesRead);
}

/*----------------------------------------------------------------------------
 * getState
 *----------------------------------------------------------------------------*/
H5Session::state_t H5Session::getState (void)
{
    state_t current;
    stateCond.lock();
    {
        current = state;
    }
    stateCond.unlock();
    return current;
}

/*----------------------------------------------------------------------------
 * getResource
 *----------------------------------------------------------------------------*/
const char* H5Session::getResource (void) const
{
    return resource.c_str();
}

/*----------------------------------------------------------------------------
 * list
 *
 *  child names in storage order; a repeated name is listed once
 *----------------------------------------------------------------------------*/
std::vector<std::string> H5Session::list (const char* group_path)
{
    const ReadGuard guard(this);

    std::vector<std::string> names;
    try
    {
        const H5RangeFetcher::control_t control = H5RangeFetcher::control(config.fetchTimeoutMs);
        const H5Parser::node_ptr_t node = parser->resolve(group_path, control);
        if(!node->isGroup())
        {
            throw RunTimeException(CRITICAL, RTE_PATH_NOT_FOUND, "not a group");
        }

        std::set<std::string> listed;
        for(const H5Parser::link_t& link: node->links)
        {
            if(listed.insert(link.name).second)
            {
                names.push_back(link.name);
            }
        }
    }
    catch(const RunTimeException& e)
    {
        throw RunTimeException(e.level(), e.code(), "%s: %s", group_path, e.what());
    }

    if(config.verbose)
    {
        mlog(INFO, "Listed %ld children of %s in %s", (long)names.size(), group_path, resource.c_str());
    }

    return names;
}

/*----------------------------------------------------------------------------
 * read
 *----------------------------------------------------------------------------*/
H5Cloud::info_t H5Session::read (const char* path, H5Cloud::valtype_t valtype, const std::vector<H5Cloud::slice_t>& slice, const H5RangeFetcher::Cancel* cancel)
{
    const ReadGuard guard(this);
    return readDataset(path, valtype, slice, false, cancel);
}

/*----------------------------------------------------------------------------
 * readAttribute
 *----------------------------------------------------------------------------*/
H5Cloud::info_t H5Session::readAttribute (const char* path, const char* name, H5Cloud::valtype_t valtype)
{
    const ReadGuard guard(this);

    H5DatasetReader reader(parser, H5RangeFetcher::control(config.fetchTimeoutMs));
    const H5Cloud::info_t info = reader.readAttribute(path, name, valtype);

    if(config.verbose)
    {
        mlog(INFO, "Read attribute %s of %s: %lu elements of %s", name, path, (unsigned long)info.elements, H5Cloud::type2str(info.datatype));
    }

    return info;
}

/*----------------------------------------------------------------------------
 * meta
 *----------------------------------------------------------------------------*/
H5Cloud::info_t H5Session::meta (const char* path)
{
    const ReadGuard guard(this);
    return readDataset(path, H5Cloud::RAW, std::vector<H5Cloud::slice_t>(), true, NULL);
}

/*----------------------------------------------------------------------------
 * readp - single request
 *----------------------------------------------------------------------------*/
H5Future* H5Session::readp (const request_t& request)
{
    beginRead();

    H5Future* future = new H5Future(request.path.c_str());
    readp_t* rqst = new readp_t;
    rqst->session = this;
    rqst->future = future;
    rqst->request = request;
    future->reader = new Thread(readerThread, rqst);

    return future;
}

/*----------------------------------------------------------------------------
 * readp - all requests run concurrently; futures are owned by the caller
 *----------------------------------------------------------------------------*/
std::vector<H5Future*> H5Session::readp (const std::vector<request_t>& requests)
{
    std::vector<H5Future*> futures;
    try
    {
        for(const request_t& request: requests)
        {
            futures.push_back(readp(request));
        }
    }
    catch(const RunTimeException&)
    {
        for(H5Future* future: futures) delete future;
        throw;
    }
    return futures;
}

/*----------------------------------------------------------------------------
 * cancel
 *----------------------------------------------------------------------------*/
void H5Session::cancel (H5Future* future)
{
    if(future)
    {
        mlog(DEBUG, "Cancelling read of %s in %s", future->getPath(), resource.c_str());
        future->cancel();
    }
}

/*----------------------------------------------------------------------------
 * stats
 *----------------------------------------------------------------------------*/
H5Session::stats_t H5Session::stats (void)
{
    stateCond.lock();
    {
        if(state != OPEN)
        {
            const stats_t last = closedStats;
            stateCond.unlock();
            return last;
        }
        activeReads++;
    }
    stateCond.unlock();

    const stats_t current = collectStats();
    endRead();

    gauge_metric(DEBUG, "h5cloud.cache_resident", current.cacheResident);
    return current;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * beginRead
 *----------------------------------------------------------------------------*/
void H5Session::beginRead (void)
{
    stateCond.lock();
    {
        if(state != OPEN)
        {
            const state_t current = state;
            stateCond.unlock();
            throw RunTimeException(CRITICAL, RTE_SESSION_CLOSED, "session for %s is %s", resource.c_str(), state2str(current));
        }
        activeReads++;
    }
    stateCond.unlock();
}

/*----------------------------------------------------------------------------
 * endRead
 *----------------------------------------------------------------------------*/
void H5Session::endRead (void)
{
    stateCond.lock();
    {
        activeReads--;
        if(activeReads == 0)
        {
            stateCond.signal();
        }
    }
    stateCond.unlock();
}

/*----------------------------------------------------------------------------
 * readDataset
 *----------------------------------------------------------------------------*/
H5Cloud::info_t H5Session::readDataset (const char* path, H5Cloud::valtype_t valtype, const std::vector<H5Cloud::slice_t>& slice,
                                        bool meta_only, const H5RangeFetcher::Cancel* cancel)
{
    const int64_t start = OsApi::time(OsApi::CPU_CLK);

    H5DatasetReader reader(parser, H5RangeFetcher::control(config.fetchTimeoutMs, cancel));
    const H5Cloud::info_t info = reader.readDataset(path, valtype, slice, meta_only);

    if(config.verbose)
    {
        const double elapsed = (double)(OsApi::time(OsApi::CPU_CLK) - start) / 1000000.0;
        mlog(INFO, "%s %s from %s: %lu elements of %s in %.3lf secs", meta_only ? "Described" : "Read", path, resource.c_str(),
             (unsigned long)info.elements, H5Cloud::type2str(info.datatype), elapsed);
    }

    return info;
}

/*----------------------------------------------------------------------------
 * release
 *----------------------------------------------------------------------------*/
void H5Session::release (void)
{
    delete parser;
    delete cache;
    delete fetcher;
    delete object;

    parser = NULL;
    cache = NULL;
    fetcher = NULL;
    object = NULL;
}

/*----------------------------------------------------------------------------
 * collectStats
 *----------------------------------------------------------------------------*/
H5Session::stats_t H5Session::collectStats (void)
{
    stats_t current;
    memset(&current, 0, sizeof(current));

    if(fetcher)
    {
        current.fetches = fetcher->getFetches();
        current.bytesRead = fetcher->getBytesRead();
    }

    if(cache)
    {
        const H5ChunkCache::stats_t cache_stats = cache->getStats();
        current.cacheHits = cache_stats.hits;
        current.cacheMisses = cache_stats.misses;
        current.cacheEvictions = cache_stats.evictions;
        current.cacheEntries = cache_stats.entries;
        current.cacheResident = cache_stats.resident;
    }

    return current;
}

/*----------------------------------------------------------------------------
 * readerThread
 *
 *  session was marked active by readp before this thread started
 *----------------------------------------------------------------------------*/
void* H5Session::readerThread (void* parm)
{
    readp_t* rqst = static_cast<readp_t*>(parm);
    H5Session* session = rqst->session;
    H5Future* future = rqst->future;

    try
    {
        future->info = session->readDataset(rqst->request.path.c_str(), rqst->request.valtype, rqst->request.slice, false, future->getCancel());
        future->finish(true);
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Failure reading %s from %s: %s", rqst->request.path.c_str(), session->resource.c_str(), e.what());
        future->finish(false, e.code(), e.what());
    }
    catch(const std::exception& e)
    {
        mlog(CRITICAL, "Failure reading %s from %s: %s", rqst->request.path.c_str(), session->resource.c_str(), e.what());
        future->finish(false, RTE_IO_FAILURE, e.what());
    }

    session->endRead();
    delete rqst;

    return NULL;
}
