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

#include "H5RangeFetcher.h"
#include "EventLib.h"
#include "OsApi.h"

#include <exception>

/******************************************************************************
 * CANCEL METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5RangeFetcher::Cancel::Cancel (void):
    cancelled(false)
{
}

/*----------------------------------------------------------------------------
 * cancel
 *----------------------------------------------------------------------------*/
void H5RangeFetcher::Cancel::cancel (void)
{
    cancelled = true;
}

/*----------------------------------------------------------------------------
 * isCancelled
 *----------------------------------------------------------------------------*/
bool H5RangeFetcher::Cancel::isCancelled (void) const
{
    return cancelled;
}

/*----------------------------------------------------------------------------
 * check
 *----------------------------------------------------------------------------*/
void H5RangeFetcher::Cancel::check (void) const
{
    if(cancelled)
    {
        throw RunTimeException(INFO, RTE_CANCELLED, "read cancelled");
    }
}

/******************************************************************************
 * REMOTE OBJECT METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *
 *  size is requested from the backend once and kept for the session
 *----------------------------------------------------------------------------*/
H5RangeFetcher::RemoteObject::RemoteObject (const char* _name, const char* _resource, const H5Cloud::backend_t& _backend):
    name(_name ? _name : ""),
    resource(_resource ? _resource : ""),
    backend(_backend),
    size(0)
{
    if(!backend.size || !backend.read)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "incomplete storage backend for %s", resource.c_str());
    }

    size = backend.size();
}

/*----------------------------------------------------------------------------
 * getName
 *----------------------------------------------------------------------------*/
const char* H5RangeFetcher::RemoteObject::getName (void) const
{
    return name.c_str();
}

/*----------------------------------------------------------------------------
 * getResource
 *----------------------------------------------------------------------------*/
const char* H5RangeFetcher::RemoteObject::getResource (void) const
{
    return resource.c_str();
}

/*----------------------------------------------------------------------------
 * getSize
 *----------------------------------------------------------------------------*/
uint64_t H5RangeFetcher::RemoteObject::getSize (void) const
{
    return size;
}

/*----------------------------------------------------------------------------
 * getBackend
 *----------------------------------------------------------------------------*/
const H5Cloud::backend_t& H5RangeFetcher::RemoteObject::getBackend (void) const
{
    return backend;
}

/******************************************************************************
 * RANGE FETCHER METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5RangeFetcher::H5RangeFetcher (const RemoteObject* _object, int max_concurrent_fetches):
    object(_object),
    maxConcurrentFetches(max_concurrent_fetches > 0 ? max_concurrent_fetches : 1),
    fetches(0),
    bytesRead(0)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5RangeFetcher::~H5RangeFetcher (void)
{
}

/*----------------------------------------------------------------------------
 * fetch
 *----------------------------------------------------------------------------*/
H5RangeFetcher::bytes_t H5RangeFetcher::fetch (uint64_t offset, int64_t length, const control_t& control)
{
    /* Check Cancellation */
    if(control.cancel) control.cancel->check();

    /* Check Range */
    if(length < 0 || offset > object->getSize() || (uint64_t)length > (object->getSize() - offset))
    {
        throw RunTimeException(CRITICAL, RTE_OUT_OF_RANGE_POINTER, "range <%lu, %ld> exceeds size of %s (%lu bytes)",
                               (unsigned long)offset, (long)length, object->getResource(), (unsigned long)object->getSize());
    }

    /* Check Deadline */
    if(control.deadline > 0 && OsApi::time(OsApi::CPU_CLK) >= control.deadline)
    {
        throw RunTimeException(CRITICAL, RTE_TIMEOUT, "deadline expired before fetch of <%lu, %ld>", (unsigned long)offset, (long)length);
    }

    /* Read Range */
    bytes_t buffer(length);
    int64_t bytes_read = 0;
    while(bytes_read < length)
    {
        int64_t bytes = 0;
        try
        {
            bytes = object->getBackend().read(&buffer[bytes_read], length - bytes_read, offset + bytes_read, control.deadline);
        }
        catch(const RunTimeException&)
        {
            throw;
        }
        catch(const std::exception& e)
        {
            throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "failed to read <%lu, %ld> from %s: %s",
                                   (unsigned long)(offset + bytes_read), (long)(length - bytes_read), object->getResource(), e.what());
        }

        if(bytes <= 0)
        {
            throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "failed to read <%lu, %ld> from %s: returned %ld",
                                   (unsigned long)(offset + bytes_read), (long)(length - bytes_read), object->getResource(), (long)bytes);
        }
        bytes_read += bytes;
    }

    /* Update Statistics */
    fetches++;
    bytesRead += length;
    count_metric(DEBUG, "h5cloud.fetches", 1);
    count_metric(DEBUG, "h5cloud.bytes_read", length);

    return buffer;
}

/*----------------------------------------------------------------------------
 * fetchMany
 *
 *  results correspond positionally to ranges; the first failure in request
 *  order is rethrown once every issued fetch has completed
 *----------------------------------------------------------------------------*/
void H5RangeFetcher::fetchMany (const std::vector<range_t>& ranges, std::vector<bytes_t>& results, const control_t& control)
{
    results.clear();
    results.resize(ranges.size());
    if(ranges.empty()) return;

    /* Fetch Inline */
    if(ranges.size() == 1 || maxConcurrentFetches == 1)
    {
        for(size_t i = 0; i < ranges.size(); i++)
        {
            results[i] = fetch(ranges[i].offset, ranges[i].length, control);
        }
        return;
    }

    /* Build Batch */
    batch_t batch;
    batch.fetcher = this;
    batch.ranges = &ranges;
    batch.results = &results;
    batch.failures.resize(ranges.size(), {false, INFO, RTE_INFO, ""});
    batch.control = &control;
    batch.next = 0;
    batch.failed = false;

    /* Start Workers */
    const int num_workers = MIN(maxConcurrentFetches, (int)ranges.size());
    std::vector<Thread*> workers;
    for(int t = 0; t < num_workers; t++)
    {
        workers.push_back(new Thread(fetchThread, &batch));
    }

    /* Join Workers */
    for(Thread* worker: workers)
    {
        delete worker;
    }

    /* Rethrow First Failure */
    for(size_t i = 0; i < ranges.size(); i++)
    {
        const failure_t& failure = batch.failures[i];
        if(failure.failed)
        {
            results.clear();
            throw RunTimeException(failure.lvl, failure.code, "%s", failure.msg.c_str());
        }
    }
}

/*----------------------------------------------------------------------------
 * getObject
 *----------------------------------------------------------------------------*/
const H5RangeFetcher::RemoteObject* H5RangeFetcher::getObject (void) const
{
    return object;
}

/*----------------------------------------------------------------------------
 * getFetches
 *----------------------------------------------------------------------------*/
long H5RangeFetcher::getFetches (void) const
{
    return fetches;
}

/*----------------------------------------------------------------------------
 * getBytesRead
 *----------------------------------------------------------------------------*/
long H5RangeFetcher::getBytesRead (void) const
{
    return bytesRead;
}

/*----------------------------------------------------------------------------
 * control
 *----------------------------------------------------------------------------*/
H5RangeFetcher::control_t H5RangeFetcher::control (int timeout_ms, const Cancel* cancel)
{
    control_t ctl;
    ctl.deadline = 0;
    if(timeout_ms > 0) ctl.deadline = OsApi::time(OsApi::CPU_CLK) + ((int64_t)timeout_ms * 1000L);
    ctl.cancel = cancel;
    return ctl;
}

/*----------------------------------------------------------------------------
 * fetchThread
 *----------------------------------------------------------------------------*/
void* H5RangeFetcher::fetchThread (void* parm)
{
    batch_t* batch = static_cast<batch_t*>(parm);

    while(true)
    {
        /* Claim Next Request */
        size_t index = 0;
        bool done = false;
        batch->mut.lock();
        {
            if(batch->failed || batch->next >= batch->ranges->size()) done = true;
            else index = batch->next++;
        }
        batch->mut.unlock();
        if(done) break;

        /* Perform Fetch */
        const range_t& range = (*batch->ranges)[index];
        try
        {
            (*batch->results)[index] = batch->fetcher->fetch(range.offset, range.length, *batch->control);
        }
        catch(const RunTimeException& e)
        {
            batch->mut.lock();
            {
                batch->failures[index] = {true, e.level(), e.code(), e.what()};
                batch->failed = true;
            }
            batch->mut.unlock();
        }
        catch(const std::exception& e)
        {
            batch->mut.lock();
            {
                batch->failures[index] = {true, CRITICAL, RTE_IO_FAILURE, e.what()};
                batch->failed = true;
            }
            batch->mut.unlock();
        }
    }

    return NULL;
}
