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

#include "UT_RangeFetcher.h"
#include "UT_Fixtures.h"
#include "H5RangeFetcher.h"
#include "UnitTest.h"
#include "OsApi.h"

#include <stdexcept>
#include <string.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_RangeFetcher::NAME = "UT_RangeFetcher";

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * matches - bytes equal the memory object pattern
 *----------------------------------------------------------------------------*/
static bool matches (const H5RangeFetcher::bytes_t& bytes, uint64_t offset)
{
    for(size_t i = 0; i < bytes.size(); i++)
    {
        if(bytes[i] != UT_MemoryObject::pattern(offset + i)) return false;
    }
    return true;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_RangeFetcher::UT_RangeFetcher (void):
    UnitTest(NAME)
{
}

/*----------------------------------------------------------------------------
 * run
 *----------------------------------------------------------------------------*/
bool UT_RangeFetcher::run (void)
{
    ut_initialize(this);

    testFetch();
    testShortReads();
    testOutOfRange();
    testFetchMany();
    testFetchManyFailure();
    testCancel();
    testDeadline();
    testIncompleteBackend();
    testForeignException();

    return ut_status(this);
}

/*----------------------------------------------------------------------------
 * testFetch
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testFetch (void)
{
    UT_MemoryObject memory(0x10000);
    const H5RangeFetcher::RemoteObject object("memory", "pattern", memory.backend());
    H5RangeFetcher fetcher(&object);
    const H5RangeFetcher::control_t control = H5RangeFetcher::control(1000);

    ut_assert(this, object.getSize() == 0x10000, "incorrect object size: %lu", (unsigned long)object.getSize());

    try
    {
        const H5RangeFetcher::bytes_t bytes = fetcher.fetch(1000, 500, control);
        ut_assert(this, bytes.size() == 500, "incorrect number of bytes: %ld", (long)bytes.size());
        ut_assert(this, matches(bytes, 1000), "fetched bytes do not match object");

        const H5RangeFetcher::bytes_t tail = fetcher.fetch(0x10000 - 16, 16, control);
        ut_assert(this, matches(tail, 0x10000 - 16), "fetched tail does not match object");

        const H5RangeFetcher::bytes_t empty = fetcher.fetch(0x10000, 0, control);
        ut_assert(this, empty.empty(), "zero length fetch returned %ld bytes", (long)empty.size());
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    ut_assert(this, fetcher.getBytesRead() == 516, "incorrect bytes read: %ld", fetcher.getBytesRead());
    ut_assert(this, memory.getBytes() == 516, "backend returned %ld bytes", (long)memory.getBytes());
}

/*----------------------------------------------------------------------------
 * testShortReads - backend returning fewer bytes than asked is read again
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testShortReads (void)
{
    UT_MemoryObject memory(4096);
    memory.maxRead = 7;
    const H5RangeFetcher::RemoteObject object("memory", "short", memory.backend());
    H5RangeFetcher fetcher(&object);

    try
    {
        const H5RangeFetcher::bytes_t bytes = fetcher.fetch(3, 100, H5RangeFetcher::control(1000));
        ut_assert(this, bytes.size() == 100 && matches(bytes, 3), "short reads were not assembled");
        ut_assert(this, memory.getReads() == 15, "expected 15 backend reads, got %ld", memory.getReads());
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testOutOfRange - rejected before the backend is called
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testOutOfRange (void)
{
    UT_MemoryObject memory(1024);
    const H5RangeFetcher::RemoteObject object("memory", "small", memory.backend());
    H5RangeFetcher fetcher(&object);

    int code = RTE_INFO;
    try
    {
        fetcher.fetch(1000, 100, H5RangeFetcher::control(1000));
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }

    ut_assert(this, code == RTE_OUT_OF_RANGE_POINTER, "expected out of range pointer, got %s", RunTimeException::codeName(code));
    ut_assert(this, memory.getReads() == 0, "backend was called %ld times", memory.getReads());
}

/*----------------------------------------------------------------------------
 * testFetchMany - results are positional regardless of completion order
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testFetchMany (void)
{
    UT_MemoryObject memory(0x20000);
    memory.delayMs = 2;
    const H5RangeFetcher::RemoteObject object("memory", "many", memory.backend());
    H5RangeFetcher fetcher(&object, 4);

    std::vector<H5RangeFetcher::range_t> ranges;
    for(int i = 0; i < 20; i++)
    {
        const H5RangeFetcher::range_t range = {(uint64_t)(0x20000 - ((i + 1) * 1000)), 100 + (i * 10)};
        ranges.push_back(range);
    }

    try
    {
        std::vector<H5RangeFetcher::bytes_t> results;
        fetcher.fetchMany(ranges, results, H5RangeFetcher::control(5000));

        ut_assert(this, results.size() == ranges.size(), "expected %ld results, got %ld", (long)ranges.size(), (long)results.size());
        for(size_t i = 0; i < results.size() && i < ranges.size(); i++)
        {
            ut_assert(this, (int64_t)results[i].size() == ranges[i].length, "result %ld has %ld bytes", (long)i, (long)results[i].size());
            ut_assert(this, matches(results[i], ranges[i].offset), "result %ld does not match its range", (long)i);
        }
        ut_assert(this, fetcher.getFetches() == 20, "expected 20 fetches, got %ld", fetcher.getFetches());
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testFetchManyFailure - any failed range fails the batch with its code
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testFetchManyFailure (void)
{
    UT_MemoryObject memory(0x10000);
    memory.failAt = 0x8000;
    const H5RangeFetcher::RemoteObject object("memory", "faulty", memory.backend());
    H5RangeFetcher fetcher(&object, 4);

    std::vector<H5RangeFetcher::range_t> ranges;
    for(int i = 0; i < 16; i++)
    {
        const H5RangeFetcher::range_t range = {(uint64_t)(i * 0x1000), 0x1000};
        ranges.push_back(range);
    }

    int code = RTE_INFO;
    try
    {
        std::vector<H5RangeFetcher::bytes_t> results;
        fetcher.fetchMany(ranges, results, H5RangeFetcher::control(5000));
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }

    ut_assert(this, code == RTE_IO_FAILURE, "expected io failure, got %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testCancel - no fetch is issued once cancelled
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testCancel (void)
{
    UT_MemoryObject memory(0x10000);
    const H5RangeFetcher::RemoteObject object("memory", "cancelled", memory.backend());
    H5RangeFetcher fetcher(&object, 4);

    H5RangeFetcher::Cancel token;
    ut_assert(this, !token.isCancelled(), "new token is cancelled");
    token.cancel();

    int code = RTE_INFO;
    try
    {
        std::vector<H5RangeFetcher::range_t> ranges(8, H5RangeFetcher::range_t{0, 64});
        std::vector<H5RangeFetcher::bytes_t> results;
        fetcher.fetchMany(ranges, results, H5RangeFetcher::control(1000, &token));
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }

    ut_assert(this, code == RTE_CANCELLED, "expected cancelled, got %s", RunTimeException::codeName(code));
    ut_assert(this, memory.getReads() == 0, "backend was called %ld times after cancel", memory.getReads());
}

/*----------------------------------------------------------------------------
 * testDeadline
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testDeadline (void)
{
    UT_MemoryObject memory(1024);
    const H5RangeFetcher::RemoteObject object("memory", "late", memory.backend());
    H5RangeFetcher fetcher(&object);

    H5RangeFetcher::control_t control = H5RangeFetcher::control(0);
    ut_assert(this, control.deadline == 0, "zero timeout should not set a deadline");
    control.deadline = OsApi::time(OsApi::CPU_CLK) - 1000;

    int code = RTE_INFO;
    try
    {
        fetcher.fetch(0, 10, control);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }

    ut_assert(this, code == RTE_TIMEOUT, "expected timeout, got %s", RunTimeException::codeName(code));
    ut_assert(this, H5Cloud::isTransient(code), "timeout should be transient");
}

/*----------------------------------------------------------------------------
 * testIncompleteBackend
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testIncompleteBackend (void)
{
    H5Cloud::backend_t backend;
    backend.size = []() -> uint64_t { return 10; };

    int code = RTE_INFO;
    try
    {
        const H5RangeFetcher::RemoteObject object("memory", "incomplete", backend);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }

    ut_assert(this, code == RTE_ERROR, "expected error for backend without read, got %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testForeignException - standard exceptions from a backend are io failures
 *----------------------------------------------------------------------------*/
void UT_RangeFetcher::testForeignException (void)
{
    H5Cloud::backend_t backend;
    backend.size = []() -> uint64_t { return 0x1000; };
    backend.read = [](uint8_t* buffer, int64_t size, uint64_t pos, int64_t deadline) -> int64_t {
        (void)buffer; (void)size; (void)pos; (void)deadline;
        throw std::runtime_error("connection reset by peer");
    };

    const H5RangeFetcher::RemoteObject object("memory", "throwing", backend);

    /* Concurrent */
    H5RangeFetcher fetcher(&object, 4);
    int code = RTE_INFO;
    try
    {
        const std::vector<H5RangeFetcher::range_t> ranges = {{0, 0x100}, {0x800, 0x100}};
        std::vector<H5RangeFetcher::bytes_t> results;
        fetcher.fetchMany(ranges, results, H5RangeFetcher::control(5000));
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
        ut_assert(this, strstr(e.what(), "connection reset by peer") != NULL, "backend message lost: %s", e.what());
    }
    ut_assert(this, code == RTE_IO_FAILURE, "expected io failure from concurrent fetch, got %s", RunTimeException::codeName(code));

    /* Inline */
    H5RangeFetcher serial(&object, 1);
    code = RTE_INFO;
    try
    {
        serial.fetch(0, 0x10, H5RangeFetcher::control(5000));
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_IO_FAILURE, "expected io failure from single fetch, got %s", RunTimeException::codeName(code));
    ut_assert(this, serial.getFetches() == 0, "failed fetch was counted");
}
