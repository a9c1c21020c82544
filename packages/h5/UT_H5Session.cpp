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

#include "UT_H5Session.h"
#include "UT_Fixtures.h"
#include "H5Session.h"
#include "StringLib.h"
#include "UnitTest.h"
#include "OsApi.h"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <string.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_H5Session::NAME = "UT_H5Session";

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * freeInfo
 *----------------------------------------------------------------------------*/
static void freeInfo (H5Cloud::info_t& info)
{
    delete [] info.data;
    info.data = NULL;
}

/*----------------------------------------------------------------------------
 * slices
 *----------------------------------------------------------------------------*/
static std::vector<H5Cloud::slice_t> slices (std::initializer_list<H5Cloud::slice_t> s)
{
    return std::vector<H5Cloud::slice_t>(s);
}

/*----------------------------------------------------------------------------
 * request
 *----------------------------------------------------------------------------*/
static H5Session::request_t request (const char* path, H5Cloud::valtype_t valtype, const std::vector<H5Cloud::slice_t>& slice=std::vector<H5Cloud::slice_t>())
{
    H5Session::request_t rqst;
    rqst.path = path;
    rqst.valtype = valtype;
    rqst.slice = slice;
    return rqst;
}

/*----------------------------------------------------------------------------
 * memoryConfig - small read ahead so reads are spread over many fetches
 *----------------------------------------------------------------------------*/
static H5Session::config_t memoryConfig (void)
{
    H5Session::config_t config = H5Session::defaultConfig();
    config.readAheadSize = 512;
    config.fetchTimeoutMs = 30000;
    return config;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_H5Session::UT_H5Session (void):
    UnitTest(NAME),
    asset(NULL)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
UT_H5Session::~UT_H5Session (void)
{
    delete asset;
}

/*----------------------------------------------------------------------------
 * run
 *----------------------------------------------------------------------------*/
bool UT_H5Session::run (void)
{
    ut_initialize(this);

    if(!asset)
    {
        try
        {
            asset = Asset::create("fixtures", "file", UT_Fixtures::directory());
        }
        catch(const RunTimeException& e)
        {
            ut_assert(this, false, "failed to create fixture asset: %s", e.what());
            return ut_status(this);
        }
    }

    testAsset();
    testOpenAndList();
    testRoundTrip();
    testSlices();
    testValueTypes();
    testFillValue();
    testEmptyValues();
    testStrings();
    testAttributes();
    testMeta();
    testErrors();
    testBadFiles();
    testNewerFormat();
    testIdempotence();
    testConcurrency();
    testCancel();
    testClose();

    return ut_status(this);
}

/*----------------------------------------------------------------------------
 * checkChunked - values of the (ROWS,COLS) fixture over a strided selection
 *----------------------------------------------------------------------------*/
bool UT_H5Session::checkChunked (const H5Cloud::info_t& info, int row0, int rows, int row_step, int col0, int cols, int col_step)
{
    if(!ut_assert(this, info.datatype == H5Cloud::INT32, "expected INT32, got %s", H5Cloud::type2str(info.datatype))) return false;
    if(!ut_assert(this, info.elements == (uint64_t)(rows * cols), "expected %d elements, got %lu", rows * cols, (unsigned long)info.elements)) return false;
    if(!ut_assert(this, info.ndims == 2 && info.shape[0] == (uint64_t)rows && info.shape[1] == (uint64_t)cols,
                  "unexpected shape (%lu,%lu)", (unsigned long)info.shape[0], (unsigned long)info.shape[1])) return false;

    const int32_t* values = reinterpret_cast<const int32_t*>(info.data);
    for(int r = 0; r < rows; r++)
    {
        for(int c = 0; c < cols; c++)
        {
            const int32_t expected = UT_Fixtures::chunkedValue(row0 + (r * row_step), col0 + (c * col_step));
            const int32_t actual = values[(r * cols) + c];
            if(!ut_assert(this, actual == expected, "value at (%d,%d) is %d, expected %d", r, c, actual, expected)) return false;
        }
    }

    return true;
}

/*----------------------------------------------------------------------------
 * expectFailure - returns the code of the failed read, RTE_INFO on success
 *----------------------------------------------------------------------------*/
int UT_H5Session::expectFailure (H5Session& session, const char* path, const std::vector<H5Cloud::slice_t>& slice)
{
    try
    {
        H5Cloud::info_t info = session.read(path, H5Cloud::RAW, slice);
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        if(e.code() != RTE_SESSION_CLOSED)
        {
            ut_assert(this, strstr(e.what(), path) != NULL, "error does not name %s: %s", path, e.what());
        }
        return e.code();
    }
    return RTE_INFO;
}

/*----------------------------------------------------------------------------
 * testAsset - attribute defaults and unregistered formats
 *----------------------------------------------------------------------------*/
void UT_H5Session::testAsset (void)
{
    ut_assert(this, strcmp(asset->getName(), "fixtures") == 0, "asset name is %s", asset->getName());
    ut_assert(this, strcmp(asset->getPath(), UT_Fixtures::directory()) == 0, "asset path is %s", asset->getPath());
    ut_assert(this, strcmp(asset->getRegion(), Asset::DEFAULT_REGION) == 0, "asset region is %s", asset->getRegion());
    ut_assert(this, asset->getEndpoint()[0] == '\0', "asset endpoint is %s", asset->getEndpoint());

    Asset* regional = NULL;
    try
    {
        regional = Asset::create("regional", "file", UT_Fixtures::directory(), "eu-central-1", "http://localhost:9000");
        ut_assert(this, strcmp(regional->getRegion(), "eu-central-1") == 0, "region not kept: %s", regional->getRegion());
        ut_assert(this, strcmp(regional->getEndpoint(), "http://localhost:9000") == 0, "endpoint not kept: %s", regional->getEndpoint());
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
    delete regional;

    int code = RTE_INFO;
    try
    {
        Asset* unknown = Asset::create("unknown", "ftp", "/tmp");
        delete unknown;
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
        ut_assert(this, strstr(e.what(), "ftp") != NULL, "error does not name the format: %s", e.what());
    }
    ut_assert(this, code == RTE_ERROR, "unregistered format returned %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testOpenAndList
 *----------------------------------------------------------------------------*/
void UT_H5Session::testOpenAndList (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);
    ut_assert(this, session.getState() == H5Session::CLOSED, "new session is %s", H5Session::state2str(session.getState()));

    try
    {
        session.open();
        ut_assert(this, session.getState() == H5Session::OPEN, "opened session is %s", H5Session::state2str(session.getState()));

        const std::vector<std::string> names = session.list("/");
        const std::set<std::string> listed(names.begin(), names.end());
        const char* expected[] = {"bigendian", "chunked", "compact", "compressed", "contiguous", "fletcher", "group", "names", "sparse", "unfilled"};
        ut_assert(this, names.size() == 10, "expected 10 children of root, got %ld", (long)names.size());
        for(const char* name: expected)
        {
            ut_assert(this, listed.count(name) == 1, "%s missing from root listing", name);
        }

        const std::vector<std::string> group = session.list("/group");
        const std::set<std::string> group_listed(group.begin(), group.end());
        ut_assert(this, group.size() == 3, "expected 3 children of /group, got %ld", (long)group.size());
        ut_assert(this, group_listed.count("sub") && group_listed.count("alias") && group_listed.count("outside"), "links missing from /group listing");

        const std::vector<std::string> sub = session.list("/group/sub/");
        ut_assert(this, sub.size() == 1 && sub[0] == "leaf", "unexpected listing of /group/sub");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    session.close();
    ut_assert(this, session.getState() == H5Session::CLOSED, "closed session is %s", H5Session::state2str(session.getState()));
}

/*----------------------------------------------------------------------------
 * testRoundTrip - values written by libhdf5 read back unchanged
 *----------------------------------------------------------------------------*/
void UT_H5Session::testRoundTrip (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        H5Cloud::info_t chunked = session.read("/chunked");
        checkChunked(chunked, 0, UT_Fixtures::ROWS, 1, 0, UT_Fixtures::COLS, 1);
        freeInfo(chunked);

        H5Cloud::info_t compressed = session.read("/compressed");
        checkChunked(compressed, 0, UT_Fixtures::ROWS, 1, 0, UT_Fixtures::COLS, 1);
        freeInfo(compressed);

        H5Cloud::info_t contiguous = session.read("/contiguous");
        ut_assert(this, contiguous.datatype == H5Cloud::DOUBLE && contiguous.elements == UT_Fixtures::CONTIGUOUS_SIZE, "unexpected contiguous dataset");
        const double* dvalues = reinterpret_cast<const double*>(contiguous.data);
        for(int i = 0; i < UT_Fixtures::CONTIGUOUS_SIZE && contiguous.data; i++)
        {
            if(!ut_assert(this, dvalues[i] == UT_Fixtures::contiguousValue(i), "contiguous[%d] is %lf", i, dvalues[i])) break;
        }
        freeInfo(contiguous);

        H5Cloud::info_t bigendian = session.read("/bigendian");
        ut_assert(this, bigendian.datatype == H5Cloud::INT16 && bigendian.elements == UT_Fixtures::BIGENDIAN_SIZE, "unexpected big endian dataset");
        const int16_t* svalues = reinterpret_cast<const int16_t*>(bigendian.data);
        for(int i = 0; i < UT_Fixtures::BIGENDIAN_SIZE && bigendian.data; i++)
        {
            if(!ut_assert(this, svalues[i] == UT_Fixtures::bigendianValue(i), "bigendian[%d] is %d", i, svalues[i])) break;
        }
        freeInfo(bigendian);

        H5Cloud::info_t compact = session.read("/compact");
        const int32_t* cvalues = reinterpret_cast<const int32_t*>(compact.data);
        ut_assert(this, compact.elements == 4 && cvalues && cvalues[0] == 7 && cvalues[3] == 10, "unexpected compact dataset");
        freeInfo(compact);

        H5Cloud::info_t leaf = session.read("/group/sub/leaf");
        const int32_t* lvalues = reinterpret_cast<const int32_t*>(leaf.data);
        ut_assert(this, leaf.elements == 4 && lvalues && lvalues[0] == 1 && lvalues[3] == 4, "unexpected nested dataset");
        freeInfo(leaf);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testSlices - strided selections across chunk boundaries
 *----------------------------------------------------------------------------*/
void UT_H5Session::testSlices (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        const char* datasets[] = {"/chunked", "/compressed"};
        for(const char* dataset: datasets)
        {
            H5Cloud::info_t block = session.read(dataset, H5Cloud::RAW, slices({{20, 30, 1}, {0, 10, 1}}));
            checkChunked(block, 20, 10, 1, 0, 10, 1);
            freeInfo(block);

            H5Cloud::info_t every_tenth = session.read(dataset, H5Cloud::RAW, slices({{0, 100, 10}, {0, H5Cloud::EOR, 1}}));
            checkChunked(every_tenth, 0, 10, 10, 0, UT_Fixtures::COLS, 1);
            freeInfo(every_tenth);

            H5Cloud::info_t strided = session.read(dataset, H5Cloud::RAW, slices({{5, 95, 10}, {2, 9, 3}}));
            checkChunked(strided, 5, 9, 10, 2, 3, 3);
            freeInfo(strided);

            H5Cloud::info_t row = session.read(dataset, H5Cloud::RAW, slices({{42, 43, 1}}));
            checkChunked(row, 42, 1, 1, 0, UT_Fixtures::COLS, 1);
            freeInfo(row);

            H5Cloud::info_t sparse_rows = session.read(dataset, H5Cloud::RAW, slices({{0, H5Cloud::EOR, 7}}));
            checkChunked(sparse_rows, 0, 15, 7, 0, UT_Fixtures::COLS, 1);
            freeInfo(sparse_rows);

            H5Cloud::info_t corner = session.read(dataset, H5Cloud::RAW, slices({{95, H5Cloud::EOR, 1}, {9, 10, 1}}));
            checkChunked(corner, 95, 5, 1, 9, 1, 1);
            freeInfo(corner);
        }

        H5Cloud::info_t contiguous = session.read("/contiguous", H5Cloud::RAW, slices({{10, 20, 2}}));
        ut_assert(this, contiguous.elements == 5 && contiguous.shape[0] == 5, "expected 5 contiguous elements, got %lu", (unsigned long)contiguous.elements);
        const double* values = reinterpret_cast<const double*>(contiguous.data);
        for(int i = 0; i < 5 && values; i++)
        {
            ut_assert(this, values[i] == UT_Fixtures::contiguousValue(10 + (i * 2)), "contiguous slice[%d] is %lf", i, values[i]);
        }
        freeInfo(contiguous);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testValueTypes
 *----------------------------------------------------------------------------*/
void UT_H5Session::testValueTypes (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        H5Cloud::info_t integers = session.read("/chunked", H5Cloud::INTEGER, slices({{10, 12, 1}}));
        ut_assert(this, integers.datatype == H5Cloud::INT64 && integers.typesize == 8, "expected INT64, got %s", H5Cloud::type2str(integers.datatype));
        const int64_t* ivalues = reinterpret_cast<const int64_t*>(integers.data);
        ut_assert(this, integers.elements == 20 && ivalues && ivalues[0] == 100 && ivalues[19] == 119, "unexpected integer translation");
        freeInfo(integers);

        H5Cloud::info_t truncated = session.read("/contiguous", H5Cloud::INTEGER);
        const int64_t* tvalues = reinterpret_cast<const int64_t*>(truncated.data);
        ut_assert(this, tvalues && tvalues[3] == 1 && tvalues[4] == 2, "unexpected real to integer translation");
        freeInfo(truncated);

        H5Cloud::info_t reals = session.read("/bigendian", H5Cloud::REAL);
        ut_assert(this, reals.datatype == H5Cloud::DOUBLE, "expected DOUBLE, got %s", H5Cloud::type2str(reals.datatype));
        const double* rvalues = reinterpret_cast<const double*>(reals.data);
        for(int i = 0; i < UT_Fixtures::BIGENDIAN_SIZE && rvalues; i++)
        {
            if(!ut_assert(this, rvalues[i] == (double)UT_Fixtures::bigendianValue(i), "real[%d] is %lf", i, rvalues[i])) break;
        }
        freeInfo(reals);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testFillValue - chunks never written read as the fill value
 *----------------------------------------------------------------------------*/
void UT_H5Session::testFillValue (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        H5Cloud::info_t info = session.read("/sparse");
        ut_assert(this, info.elements == (uint64_t)(UT_Fixtures::ROWS * UT_Fixtures::COLS), "unexpected number of elements");
        const int32_t* values = reinterpret_cast<const int32_t*>(info.data);
        for(int row = 0; row < UT_Fixtures::ROWS && values; row++)
        {
            const int col = row % UT_Fixtures::COLS;
            const int32_t expected = (row < UT_Fixtures::WRITTEN_ROWS) ? UT_Fixtures::chunkedValue(row, col) : UT_Fixtures::SPARSE_FILL;
            if(!ut_assert(this, values[(row * UT_Fixtures::COLS) + col] == expected, "sparse value at row %d is %d", row, values[(row * UT_Fixtures::COLS) + col])) break;
        }
        freeInfo(info);

        H5Cloud::info_t tail = session.read("/sparse", H5Cloud::RAW, slices({{55, 65, 1}, {3, 4, 1}}));
        const int32_t* tvalues = reinterpret_cast<const int32_t*>(tail.data);
        ut_assert(this, tail.elements == 10 && tvalues && tvalues[0] == UT_Fixtures::SPARSE_FILL && tvalues[9] == UT_Fixtures::SPARSE_FILL, "unwritten slice was not filled");
        freeInfo(tail);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testEmptyValues - zero length fill value and zero element attribute
 *----------------------------------------------------------------------------*/
void UT_H5Session::testEmptyValues (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        H5Cloud::info_t info = session.read("/unfilled");
        ut_assert(this, info.datatype == H5Cloud::INT32 && info.elements == UT_Fixtures::UNFILLED_SIZE, "unexpected unfilled dataset");
        const int32_t* values = reinterpret_cast<const int32_t*>(info.data);
        for(int i = 0; i < UT_Fixtures::UNFILLED_SIZE && values; i++)
        {
            if(!ut_assert(this, values[i] == 0, "unfilled[%d] is %d", i, values[i])) break;
        }
        freeInfo(info);

        H5Cloud::info_t empty = session.readAttribute("/unfilled", "empty");
        ut_assert(this, empty.elements == 0 && empty.datasize == 0 && empty.data == NULL, "empty attribute has %lu elements", (unsigned long)empty.elements);
        ut_assert(this, empty.ndims == 1 && empty.shape[0] == 0, "empty attribute has unexpected shape");
        freeInfo(empty);

        /* default fill value of a dataset that was written */
        H5Cloud::info_t contiguous = session.read("/contiguous", H5Cloud::RAW, slices({{0, 2, 1}}));
        ut_assert(this, contiguous.elements == 2, "expected 2 contiguous elements, got %lu", (unsigned long)contiguous.elements);
        freeInfo(contiguous);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testStrings
 *----------------------------------------------------------------------------*/
void UT_H5Session::testStrings (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        H5Cloud::info_t info = session.read("/names");
        ut_assert(this, info.datatype == H5Cloud::STRING && info.typesize == 8 && info.elements == 3, "unexpected string dataset");
        if(info.data && info.datasize == 24)
        {
            const char* text = reinterpret_cast<const char*>(info.data);
            ut_assert(this, StringLib::trim(&text[0], 8) == "ANMO", "first string is %s", StringLib::trim(&text[0], 8).c_str());
            ut_assert(this, StringLib::trim(&text[16], 8) == "KONO", "last string is %s", StringLib::trim(&text[16], 8).c_str());
        }
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    int code = RTE_INFO;
    try
    {
        H5Cloud::info_t info = session.read("/names", H5Cloud::INTEGER);
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_ERROR, "translating strings should fail, got %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testAttributes
 *----------------------------------------------------------------------------*/
void UT_H5Session::testAttributes (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        H5Cloud::info_t units = session.readAttribute("/chunked", "units");
        ut_assert(this, units.datatype == H5Cloud::STRING && units.typesize == 16, "unexpected units attribute");
        ut_assert(this, units.data && StringLib::trim(reinterpret_cast<const char*>(units.data), units.datasize) == "counts", "units attribute has wrong value");
        freeInfo(units);

        H5Cloud::info_t scale = session.readAttribute("/chunked", "scale", H5Cloud::REAL);
        ut_assert(this, scale.elements == 1 && scale.data && *reinterpret_cast<const double*>(scale.data) == 2.5, "scale attribute has wrong value");
        freeInfo(scale);

        H5Cloud::info_t count = session.readAttribute("/chunked", "count", H5Cloud::INTEGER);
        const int64_t* values = reinterpret_cast<const int64_t*>(count.data);
        ut_assert(this, count.elements == 3 && count.ndims == 1 && values && values[0] == 1 && values[2] == 3, "count attribute has wrong value");
        freeInfo(count);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    int code = RTE_INFO;
    try
    {
        H5Cloud::info_t info = session.readAttribute("/chunked", "missing");
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
        ut_assert(this, strstr(e.what(), "missing") != NULL, "error does not name attribute: %s", e.what());
    }
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "missing attribute returned %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testMeta - shape and type without reading data
 *----------------------------------------------------------------------------*/
void UT_H5Session::testMeta (void)
{
    try
    {
        UT_MemoryObject memory(UT_Fixtures::path(UT_Fixtures::EARLIEST_FILE).c_str());
        H5Session session(memory.backend(), "memory", UT_Fixtures::EARLIEST_FILE, memoryConfig());
        session.open();

        const int64_t before = memory.getBytes();
        H5Cloud::info_t info = session.meta("/compressed");
        const int64_t meta_bytes = memory.getBytes() - before;

        ut_assert(this, info.data == NULL, "metadata read returned data");
        ut_assert(this, info.datatype == H5Cloud::INT32 && info.typesize == 4, "unexpected type %s", H5Cloud::type2str(info.datatype));
        ut_assert(this, info.ndims == 2 && info.shape[0] == (uint64_t)UT_Fixtures::ROWS && info.shape[1] == (uint64_t)UT_Fixtures::COLS, "unexpected shape");
        ut_assert(this, info.elements == 1000 && info.datasize == 4000, "unexpected size %lu", (unsigned long)info.datasize);
        ut_assert(this, meta_bytes < 4000, "metadata read fetched %ld bytes", (long)meta_bytes);
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testErrors
 *----------------------------------------------------------------------------*/
void UT_H5Session::testErrors (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
        return;
    }

    int code;

    code = expectFailure(session, "/nothing");
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "missing dataset returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/group");
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "reading a group returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/group/alias");
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "soft link returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/group/outside");
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "external link returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/chunked/values");
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "path through a dataset returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/fletcher");
    ut_assert(this, code == RTE_UNSUPPORTED_FILTER, "fletcher32 dataset returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/chunked", slices({{0, 101, 1}}));
    ut_assert(this, code == RTE_OUT_OF_RANGE_SLICE, "slice past extent returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/chunked", slices({{50, 40, 1}}));
    ut_assert(this, code == RTE_OUT_OF_RANGE_SLICE, "reversed slice returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/chunked", slices({{0, 10, 0}}));
    ut_assert(this, code == RTE_OUT_OF_RANGE_SLICE, "zero step returned %s", RunTimeException::codeName(code));

    code = expectFailure(session, "/chunked", slices({{0, 10, 1}, {0, 10, 1}, {0, 1, 1}}));
    ut_assert(this, code == RTE_OUT_OF_RANGE_SLICE, "extra dimension returned %s", RunTimeException::codeName(code));

    code = RTE_INFO;
    try
    {
        session.list("/chunked");
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "listing a dataset returned %s", RunTimeException::codeName(code));

    /* Session Still Usable */
    try
    {
        H5Cloud::info_t info = session.read("/chunked", H5Cloud::RAW, slices({{0, 1, 1}}));
        checkChunked(info, 0, 1, 1, 0, UT_Fixtures::COLS, 1);
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "read after errors failed: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testBadFiles
 *----------------------------------------------------------------------------*/
void UT_H5Session::testBadFiles (void)
{
    int code;

    /* Corrupt Signature */
    H5Session badsig(asset, UT_Fixtures::BAD_SIGNATURE_FILE);
    code = RTE_INFO;
    try
    {
        badsig.open();
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_FORMAT_ERROR, "bad signature returned %s", RunTimeException::codeName(code));
    ut_assert(this, badsig.getState() == H5Session::CLOSED, "failed open left session %s", H5Session::state2str(badsig.getState()));

    /* Missing Object */
    H5Session missing(asset, "missing.h5");
    code = RTE_INFO;
    try
    {
        missing.open();
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_RESOURCE_DOES_NOT_EXIST, "missing file returned %s", RunTimeException::codeName(code));

    /* Never Opened */
    code = expectFailure(missing, "/chunked");
    ut_assert(this, code == RTE_SESSION_CLOSED, "read on unopened session returned %s", RunTimeException::codeName(code));

    /* Truncated Object */
    code = RTE_INFO;
    try
    {
        UT_MemoryObject memory(UT_Fixtures::path(UT_Fixtures::EARLIEST_FILE).c_str());
        memory.data.resize(2048);
        H5Session truncated(memory.backend(), "memory", "truncated.h5", memoryConfig());
        truncated.open();
        H5Cloud::info_t info = truncated.read("/compressed");
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_FORMAT_ERROR || code == RTE_OUT_OF_RANGE_POINTER, "truncated file returned %s", RunTimeException::codeName(code));

    /* Unterminated External Link */
    code = RTE_INFO;
    try
    {
        UT_MemoryObject memory(UT_Fixtures::path(UT_Fixtures::EARLIEST_FILE).c_str());
        const char link[] = "elsewhere.h5\0/data"; // flags byte precedes, terminator follows
        std::vector<uint8_t>::iterator target = std::search(memory.data.begin(), memory.data.end(), link, link + sizeof(link));
        if(ut_assert(this, target != memory.data.end(), "external link target not found in fixture"))
        {
            target[12] = '_';
            target[18] = '_';
            H5Session unterminated(memory.backend(), "memory", "unterminated.h5", memoryConfig());
            unterminated.open();
            H5Cloud::info_t info = unterminated.read("/group/outside");
            freeInfo(info);
        }
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
        ut_assert(this, strstr(e.what(), "elsewhere.h5_/data_:") != NULL, "link target not bounded by its length: %s", e.what());
    }
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "unterminated external link returned %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testNewerFormat - link messages, dense links and dense attributes
 *----------------------------------------------------------------------------*/
void UT_H5Session::testNewerFormat (void)
{
    H5Session session(asset, UT_Fixtures::V18_FILE);

    try
    {
        session.open();

        const std::vector<std::string> root = session.list("/");
        const std::set<std::string> root_listed(root.begin(), root.end());
        ut_assert(this, root.size() == 4 && root_listed.count("chunked") && root_listed.count("dense") && root_listed.count("labels") && root_listed.count("nested"), "unexpected root listing");

        const std::vector<std::string> dense = session.list("/dense");
        const std::set<std::string> dense_listed(dense.begin(), dense.end());
        ut_assert(this, dense.size() == (size_t)UT_Fixtures::DENSE_CHILDREN, "expected %d dense links, got %ld", UT_Fixtures::DENSE_CHILDREN, (long)dense.size());
        ut_assert(this, dense_listed.count("item00") && dense_listed.count("item19"), "dense links missing");

        H5Cloud::info_t item = session.read("/dense/item07", H5Cloud::INTEGER);
        ut_assert(this, item.elements == 1 && item.data && *reinterpret_cast<const int64_t*>(item.data) == 7, "dense item has wrong value");
        freeInfo(item);

        H5Cloud::info_t leaf = session.read("/nested/a/b/leaf");
        const int32_t* lvalues = reinterpret_cast<const int32_t*>(leaf.data);
        ut_assert(this, leaf.elements == 4 && lvalues && lvalues[1] == 2, "nested leaf has wrong value");
        freeInfo(leaf);

        H5Cloud::info_t chunked = session.read("/chunked", H5Cloud::RAW, slices({{33, 67, 11}}));
        checkChunked(chunked, 33, 4, 11, 0, UT_Fixtures::COLS, 1);
        freeInfo(chunked);

        H5Cloud::info_t labels = session.read("/labels", H5Cloud::RAW, slices({{3, 11, 2}}));
        ut_assert(this, labels.datatype == H5Cloud::STRING && labels.typesize == UT_Fixtures::LABEL_SIZE && labels.elements == 4, "unexpected shuffled string selection");
        for(int i = 0; i < 4 && labels.data && labels.datasize == (uint64_t)(4 * UT_Fixtures::LABEL_SIZE); i++)
        {
            char expected[UT_Fixtures::LABEL_SIZE];
            UT_Fixtures::label(3 + (i * 2), expected);
            const std::string actual = StringLib::trim(reinterpret_cast<const char*>(&labels.data[i * UT_Fixtures::LABEL_SIZE]), UT_Fixtures::LABEL_SIZE);
            if(!ut_assert(this, actual == expected, "label %d is <%s>, expected <%s>", i, actual.c_str(), expected)) break;
        }
        freeInfo(labels);

        for(int i = 0; i < UT_Fixtures::DENSE_ATTRIBUTES; i += 11)
        {
            char name[16];
            StringLib::format(name, sizeof(name), "attr%02d", i);
            H5Cloud::info_t attr = session.readAttribute("/chunked", name, H5Cloud::INTEGER);
            ut_assert(this, attr.data && *reinterpret_cast<const int64_t*>(attr.data) == i * 10, "dense attribute %s has wrong value", name);
            freeInfo(attr);
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testIdempotence - repeated reads are served from the cache
 *----------------------------------------------------------------------------*/
void UT_H5Session::testIdempotence (void)
{
    try
    {
        UT_MemoryObject memory(UT_Fixtures::path(UT_Fixtures::EARLIEST_FILE).c_str());
        H5Session session(memory.backend(), "memory", UT_Fixtures::EARLIEST_FILE, memoryConfig());
        session.open();

        H5Cloud::info_t first = session.read("/compressed", H5Cloud::RAW, slices({{20, 80, 3}}));
        const long reads = memory.getReads();
        H5Cloud::info_t second = session.read("/compressed", H5Cloud::RAW, slices({{20, 80, 3}}));

        ut_assert(this, memory.getReads() == reads, "second read fetched %ld more ranges", memory.getReads() - reads);
        ut_assert(this, first.datasize == second.datasize && first.data && second.data &&
                        memcmp(first.data, second.data, first.datasize) == 0, "repeated reads differ");
        checkChunked(second, 20, 20, 3, 0, UT_Fixtures::COLS, 1);
        freeInfo(first);
        freeInfo(second);

        const H5Session::stats_t stats = session.stats();
        ut_assert(this, stats.fetches == memory.getReads(), "session counted %ld fetches, backend saw %ld", stats.fetches, memory.getReads());
        ut_assert(this, stats.bytesRead == memory.getBytes(), "session counted %ld bytes, backend returned %ld", stats.bytesRead, (long)memory.getBytes());
        ut_assert(this, stats.cacheHits > 0, "no cache hits recorded");
        ut_assert(this, stats.cacheResident > 0 && stats.cacheEntries > 0, "cache is empty");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testConcurrency - parallel reads each get their own result
 *----------------------------------------------------------------------------*/
void UT_H5Session::testConcurrency (void)
{
    H5Session session(asset, UT_Fixtures::EARLIEST_FILE);

    try
    {
        session.open();

        std::vector<H5Session::request_t> requests;
        requests.push_back(request("/chunked", H5Cloud::RAW, slices({{10, 90, 1}})));
        requests.push_back(request("/compressed", H5Cloud::RAW));
        requests.push_back(request("/compressed", H5Cloud::RAW, slices({{0, 50, 5}})));
        requests.push_back(request("/sparse", H5Cloud::RAW, slices({{0, 30, 1}})));
        requests.push_back(request("/contiguous", H5Cloud::REAL));
        requests.push_back(request("/fletcher", H5Cloud::RAW));
        requests.push_back(request("/group/sub/leaf", H5Cloud::INTEGER));

        std::vector<H5Future*> futures = session.readp(requests);
        ut_assert(this, futures.size() == requests.size(), "expected %ld futures, got %ld", (long)requests.size(), (long)futures.size());

        for(size_t i = 0; i < futures.size(); i++)
        {
            const H5Future::rc_t rc = futures[i]->wait(30000);
            ut_assert(this, strcmp(futures[i]->getPath(), requests[i].path.c_str()) == 0, "future %ld is for %s", (long)i, futures[i]->getPath());
            if(requests[i].path == "/fletcher")
            {
                ut_assert(this, rc == H5Future::INVALID, "fletcher32 read did not fail");
                ut_assert(this, futures[i]->getCode() == RTE_UNSUPPORTED_FILTER, "fletcher32 read failed with %s", RunTimeException::codeName(futures[i]->getCode()));
            }
            else
            {
                ut_assert(this, rc == H5Future::COMPLETE, "read of %s did not complete: %s", requests[i].path.c_str(), futures[i]->getError().c_str());
            }
        }

        checkChunked(futures[0]->info, 10, 80, 1, 0, UT_Fixtures::COLS, 1);
        checkChunked(futures[1]->info, 0, UT_Fixtures::ROWS, 1, 0, UT_Fixtures::COLS, 1);
        checkChunked(futures[2]->info, 0, 10, 5, 0, UT_Fixtures::COLS, 1);
        checkChunked(futures[3]->info, 0, 30, 1, 0, UT_Fixtures::COLS, 1);
        ut_assert(this, futures[4]->info.datatype == H5Cloud::DOUBLE && futures[4]->info.elements == UT_Fixtures::CONTIGUOUS_SIZE, "unexpected contiguous result");
        ut_assert(this, futures[6]->info.datatype == H5Cloud::INT64 && futures[6]->info.elements == 4, "unexpected leaf result");

        for(H5Future* future: futures) delete future;
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testCancel
 *----------------------------------------------------------------------------*/
void UT_H5Session::testCancel (void)
{
    try
    {
        UT_MemoryObject memory(UT_Fixtures::path(UT_Fixtures::EARLIEST_FILE).c_str());
        H5Session session(memory.backend(), "memory", UT_Fixtures::EARLIEST_FILE, memoryConfig());
        session.open();

        memory.delayMs = 100;
        H5Future* future = session.readp(request("/compressed", H5Cloud::RAW));
        session.cancel(future);

        const H5Future::rc_t rc = future->wait(30000);
        ut_assert(this, rc == H5Future::INVALID, "cancelled read was not invalid: %d", (int)rc);
        ut_assert(this, future->getCode() == RTE_CANCELLED, "cancelled read failed with %s", RunTimeException::codeName(future->getCode()));
        ut_assert(this, future->info.data == NULL, "cancelled read returned data");
        delete future;

        /* Session Unaffected */
        memory.delayMs = 0;
        H5Cloud::info_t info = session.read("/compressed", H5Cloud::RAW, slices({{0, 10, 1}}));
        checkChunked(info, 0, 10, 1, 0, UT_Fixtures::COLS, 1);
        freeInfo(info);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testClose - close waits for reads in progress, then rejects new ones
 *----------------------------------------------------------------------------*/
void UT_H5Session::testClose (void)
{
    try
    {
        UT_MemoryObject memory(UT_Fixtures::path(UT_Fixtures::EARLIEST_FILE).c_str());
        H5Session session(memory.backend(), "memory", UT_Fixtures::EARLIEST_FILE, memoryConfig());
        session.open();

        memory.delayMs = 20;
        H5Future* future = session.readp(request("/chunked", H5Cloud::RAW));
        session.close();

        ut_assert(this, future->wait(0) == H5Future::COMPLETE, "read in progress did not complete before close: %s", future->getError().c_str());
        checkChunked(future->info, 0, UT_Fixtures::ROWS, 1, 0, UT_Fixtures::COLS, 1);
        delete future;

        ut_assert(this, session.getState() == H5Session::CLOSED, "session is %s after close", H5Session::state2str(session.getState()));

        int code = expectFailure(session, "/chunked");
        ut_assert(this, code == RTE_SESSION_CLOSED, "read after close returned %s", RunTimeException::codeName(code));

        code = RTE_INFO;
        try
        {
            session.list("/");
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(this, code == RTE_SESSION_CLOSED, "list after close returned %s", RunTimeException::codeName(code));

        code = RTE_INFO;
        try
        {
            delete session.readp(request("/chunked", H5Cloud::RAW));
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(this, code == RTE_SESSION_CLOSED, "readp after close returned %s", RunTimeException::codeName(code));

        const H5Session::stats_t closed = session.stats();
        ut_assert(this, closed.fetches > 0 && closed.cacheResident > 0, "stats not kept after close");

        /* Reopen */
        memory.delayMs = 0;
        session.open();
        H5Cloud::info_t info = session.read("/contiguous");
        ut_assert(this, info.elements == UT_Fixtures::CONTIGUOUS_SIZE, "read after reopen failed");
        freeInfo(info);
        session.close();
        session.close();
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}
