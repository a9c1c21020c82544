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

#include "UT_AsdfDataSet.h"
#include "UT_Fixtures.h"
#include "AsdfDataSet.h"
#include "H5Session.h"
#include "TimeLib.h"
#include "UnitTest.h"
#include "OsApi.h"

#include <math.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_AsdfDataSet::NAME = "UT_AsdfDataSet";

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_AsdfDataSet::UT_AsdfDataSet (void):
    UnitTest(NAME),
    asset(NULL)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
UT_AsdfDataSet::~UT_AsdfDataSet (void)
{
    delete asset;
}

/*----------------------------------------------------------------------------
 * run
 *----------------------------------------------------------------------------*/
bool UT_AsdfDataSet::run (void)
{
    ut_initialize(this);

    if(!asset)
    {
        try
        {
            asset = Asset::create("waveforms", "file", UT_Fixtures::directory());
        }
        catch(const RunTimeException& e)
        {
            ut_assert(this, false, "failed to create fixture asset: %s", e.what());
            return ut_status(this);
        }
    }

    testListing();
    testReadTrace();
    testTraceErrors();
    testDocuments();
    testParallelReads();
    testTraceNames();

    return ut_status(this);
}

/*----------------------------------------------------------------------------
 * testListing
 *----------------------------------------------------------------------------*/
void UT_AsdfDataSet::testListing (void)
{
    H5Session session(asset, UT_Fixtures::ASDF_FILE);

    try
    {
        session.open();
        AsdfDataSet asdf(&session);

        const std::vector<std::string> stations = asdf.waveforms();
        ut_assert(this, stations.size() == 2, "expected 2 stations, got %ld", (long)stations.size());

        const std::vector<std::string> traces = asdf.traces("IU.ANMO");
        ut_assert(this, traces.size() == 2, "expected 2 traces, got %ld", (long)traces.size());
        for(const std::string& trace: traces)
        {
            ut_assert(this, trace != AsdfDataSet::STATIONXML_NAME, "station document listed as a trace");
            ut_assert(this, trace == UT_Fixtures::TRACE_BHZ || trace == UT_Fixtures::TRACE_BH1, "unexpected trace %s", trace.c_str());
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testReadTrace
 *----------------------------------------------------------------------------*/
void UT_AsdfDataSet::testReadTrace (void)
{
    H5Session session(asset, UT_Fixtures::ASDF_FILE);

    try
    {
        session.open();
        AsdfDataSet asdf(&session);

        const AsdfDataSet::trace_t bhz = asdf.readTrace("IU.ANMO", UT_Fixtures::TRACE_BHZ);
        ut_assert(this, bhz.samples.size() == (size_t)UT_Fixtures::TRACE_SAMPLES, "expected %d samples, got %ld", UT_Fixtures::TRACE_SAMPLES, (long)bhz.samples.size());
        for(size_t i = 0; i < bhz.samples.size(); i++)
        {
            if(!ut_assert(this, bhz.samples[i] == (double)UT_Fixtures::traceValue(i), "sample %ld is %lf", (long)i, bhz.samples[i])) break;
        }
        ut_assert(this, fabs(bhz.samplingRate - 10.0) < 1e-9, "sampling rate is %lf", bhz.samplingRate);
        ut_assert(this, bhz.network == "IU" && bhz.station == "ANMO" && bhz.location == "00" && bhz.channel == "BHZ", "trace identifier parsed incorrectly");
        ut_assert(this, bhz.tag == "raw_recording", "tag is %s", bhz.tag.c_str());
        ut_assert(this, bhz.starttime == TimeLib::datetime2sys(2020, 1, 1), "start time is %ld", (long)bhz.starttime);
        ut_assert(this, bhz.endtime - bhz.starttime == 10000000L, "trace spans %ld usecs", (long)(bhz.endtime - bhz.starttime));

        const AsdfDataSet::trace_t bh1 = asdf.readTrace("IU.ANMO", UT_Fixtures::TRACE_BH1);
        ut_assert(this, fabs(bh1.samplingRate - 5.0) < 1e-9, "sampling rate is %lf", bh1.samplingRate);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }
}

/*----------------------------------------------------------------------------
 * testTraceErrors
 *----------------------------------------------------------------------------*/
void UT_AsdfDataSet::testTraceErrors (void)
{
    H5Session session(asset, UT_Fixtures::ASDF_FILE);

    try
    {
        session.open();
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
        return;
    }

    AsdfDataSet asdf(&session);

    int code = RTE_INFO;
    try
    {
        asdf.readTrace("IU.COLA", UT_Fixtures::TRACE_BAD);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_FORMAT_ERROR, "unparseable trace name returned %s", RunTimeException::codeName(code));

    code = RTE_INFO;
    try
    {
        asdf.readTrace("IU.ANMO", "IU.ANMO.00.BHN__2020-01-01T00:00:00__2020-01-01T00:00:10__raw_recording");
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "missing trace returned %s", RunTimeException::codeName(code));

    code = RTE_INFO;
    try
    {
        asdf.traces("IU.XXXX");
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "missing station returned %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testDocuments - text documents are returned trimmed
 *----------------------------------------------------------------------------*/
void UT_AsdfDataSet::testDocuments (void)
{
    H5Session session(asset, UT_Fixtures::ASDF_FILE);

    try
    {
        session.open();
        AsdfDataSet asdf(&session);

        const std::string events = asdf.readEvents();
        ut_assert(this, events == UT_Fixtures::QUAKE_ML, "events document is <%s>", events.c_str());

        const std::string station = asdf.readStationXml("IU.ANMO");
        ut_assert(this, station == UT_Fixtures::STATION_XML, "station document is <%s>", station.c_str());

        const std::string dict = asdf.getAsdfDict();
        ut_assert(this, dict == UT_Fixtures::ASDF_DICT, "asdf dictionary is <%s>", dict.c_str());
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    /* File Without Dictionary */
    H5Session plain(asset, UT_Fixtures::EARLIEST_FILE);
    int code = RTE_INFO;
    try
    {
        plain.open();
        AsdfDataSet asdf(&plain);
        asdf.getAsdfDict();
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "missing dictionary returned %s", RunTimeException::codeName(code));

    /* Numeric Dataset Is Not Text */
    code = RTE_INFO;
    try
    {
        AsdfDataSet asdf(&session);
        const std::string path = std::string(AsdfDataSet::WAVEFORMS_GROUP) + "/IU.ANMO";
        asdf.readpStrings({UT_Fixtures::TRACE_BHZ}, (path + "/").c_str());
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_FORMAT_ERROR, "reading samples as text returned %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testParallelReads - results keyed by bare name
 *----------------------------------------------------------------------------*/
void UT_AsdfDataSet::testParallelReads (void)
{
    H5Session session(asset, UT_Fixtures::ASDF_FILE);

    try
    {
        session.open();
        AsdfDataSet asdf(&session);

        const std::map<std::string, std::vector<double>> arrays = asdf.readpArray({UT_Fixtures::TRACE_BHZ, UT_Fixtures::TRACE_BH1}, "/Waveforms/IU.ANMO/");
        ut_assert(this, arrays.size() == 2, "expected 2 arrays, got %ld", (long)arrays.size());
        for(const auto& kv: arrays)
        {
            ut_assert(this, kv.second.size() == (size_t)UT_Fixtures::TRACE_SAMPLES, "%s has %ld samples", kv.first.c_str(), (long)kv.second.size());
            ut_assert(this, !kv.second.empty() && kv.second.back() == (double)UT_Fixtures::traceValue(UT_Fixtures::TRACE_SAMPLES - 1), "%s has wrong values", kv.first.c_str());
        }
        ut_assert(this, arrays.count(UT_Fixtures::TRACE_BHZ) == 1, "array not keyed by bare name");

        const std::map<std::string, std::string> strings = asdf.readpStrings({"IU.ANMO", "IU.COLA"}, "/Waveforms/", "/StationXML");
        ut_assert(this, strings.size() == 2, "expected 2 strings, got %ld", (long)strings.size());
        for(const auto& kv: strings)
        {
            ut_assert(this, kv.second == UT_Fixtures::STATION_XML, "%s station document is <%s>", kv.first.c_str(), kv.second.c_str());
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    int code = RTE_INFO;
    try
    {
        AsdfDataSet asdf(&session);
        asdf.readpStrings({"IU.ANMO", "IU.XXXX"}, "/Waveforms/", "/StationXML");
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(this, code == RTE_PATH_NOT_FOUND, "missing station document returned %s", RunTimeException::codeName(code));
}

/*----------------------------------------------------------------------------
 * testTraceNames
 *----------------------------------------------------------------------------*/
void UT_AsdfDataSet::testTraceNames (void)
{
    AsdfDataSet::trace_t trace;

    try
    {
        AsdfDataSet::parseTraceName("UW.OSD..EHZ__2021-03-04T05:06:07__2021-03-04T06:06:07__processed", trace);
        ut_assert(this, trace.network == "UW" && trace.station == "OSD" && trace.location.empty() && trace.channel == "EHZ", "empty location parsed incorrectly");
        ut_assert(this, trace.endtime - trace.starttime == 3600000000L, "trace spans %ld usecs", (long)(trace.endtime - trace.starttime));
        ut_assert(this, trace.starttime == TimeLib::datetime2sys(2021, 3, 4, 5, 6, 7), "start time parsed incorrectly");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(this, false, "unexpected failure: %s", e.what());
    }

    const char* bad_names[] = {
        "UW.OSD..EHZ",
        "UW.OSD.EHZ__2021-03-04T05:06:07__2021-03-04T06:06:07__raw",
        "UW.OSD..EHZ__2021-13-04T05:06:07__2021-03-04T06:06:07__raw",
        "UW.OSD..EHZ__2021-03-04T06:06:07__2021-03-04T05:06:07__raw"
    };

    for(const char* name: bad_names)
    {
        int code = RTE_INFO;
        try
        {
            AsdfDataSet::parseTraceName(name, trace);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(this, code == RTE_FORMAT_ERROR, "%s returned %s", name, RunTimeException::codeName(code));
    }
}
