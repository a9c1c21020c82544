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

#include "AsdfDataSet.h"
#include "EventLib.h"
#include "StringLib.h"
#include "TimeLib.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* AsdfDataSet::WAVEFORMS_GROUP    = "/Waveforms";
const char* AsdfDataSet::QUAKEML_DATASET    = "/QuakeML";
const char* AsdfDataSet::ASDFDICT_DATASET   = "/AuxiliaryData/ASDFDict";
const char* AsdfDataSet::STATIONXML_NAME    = "StationXML";
const char* AsdfDataSet::NAME_SEPARATOR     = "__";

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
AsdfDataSet::AsdfDataSet (H5Session* _session):
    session(_session)
{
    if(session == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "asdf data set requires a session");
    }
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
AsdfDataSet::~AsdfDataSet (void)
{
}

/*----------------------------------------------------------------------------
 * waveforms - station names
 *----------------------------------------------------------------------------*/
std::vector<std::string> AsdfDataSet::waveforms (void)
{
    return session->list(WAVEFORMS_GROUP);
}

/*----------------------------------------------------------------------------
 * traces - trace names of a station
 *----------------------------------------------------------------------------*/
std::vector<std::string> AsdfDataSet::traces (const char* station)
{
    const std::string path = std::string(WAVEFORMS_GROUP) + "/" + station;

    std::vector<std::string> names;
    for(const std::string& name: session->list(path.c_str()))
    {
        if(name != STATIONXML_NAME) names.push_back(name);
    }

    return names;
}

/*----------------------------------------------------------------------------
 * readTrace
 *
 *  sampling rate is derived from the sample count and the time span in the
 *  trace name
 *----------------------------------------------------------------------------*/
AsdfDataSet::trace_t AsdfDataSet::readTrace (const char* station, const char* trace)
{
    trace_t result;
    parseTraceName(trace, result);

    const std::string path = std::string(WAVEFORMS_GROUP) + "/" + station + "/" + trace;

    H5Cloud::info_t info;
    try
    {
        info = session->read(path.c_str(), H5Cloud::REAL);
    }
    catch(const RunTimeException& e)
    {
        if(e.code() == RTE_PATH_NOT_FOUND)
        {
            throw RunTimeException(e.level(), RTE_PATH_NOT_FOUND, "waveform %s not in file: %s", trace, e.what());
        }
        throw;
    }

    const double* samples = reinterpret_cast<const double*>(info.data);
    result.samples.assign(samples, samples + info.elements);
    delete [] info.data;

    const double span = (double)(result.endtime - result.starttime) / 1000000.0;
    result.samplingRate = (result.samples.size() > 1) ? (double)(result.samples.size() - 1) / span : 0.0;

    mlog(DEBUG, "Read trace %s: %ld samples at %.3lf hz", path.c_str(), (long)result.samples.size(), result.samplingRate);

    return result;
}

/*----------------------------------------------------------------------------
 * readEvents
 *----------------------------------------------------------------------------*/
std::string AsdfDataSet::readEvents (void)
{
    return readString(QUAKEML_DATASET);
}

/*----------------------------------------------------------------------------
 * readStationXml
 *----------------------------------------------------------------------------*/
std::string AsdfDataSet::readStationXml (const char* station)
{
    const std::string path = std::string(WAVEFORMS_GROUP) + "/" + station + "/" + STATIONXML_NAME;
    return readString(path.c_str());
}

/*----------------------------------------------------------------------------
 * getAsdfDict
 *----------------------------------------------------------------------------*/
std::string AsdfDataSet::getAsdfDict (void)
{
    try
    {
        return readString(ASDFDICT_DATASET);
    }
    catch(const RunTimeException& e)
    {
        if(e.code() == RTE_PATH_NOT_FOUND)
        {
            throw RunTimeException(e.level(), RTE_PATH_NOT_FOUND, "asdf dictionary not in file: %s", e.what());
        }
        throw;
    }
}

/*----------------------------------------------------------------------------
 * readpArray - results keyed by name without prefix and suffix
 *----------------------------------------------------------------------------*/
std::map<std::string, std::vector<double>> AsdfDataSet::readpArray (const std::vector<std::string>& names, const char* prefix, const char* suffix)
{
    std::vector<H5Future*> futures = readAll(names, prefix, suffix, H5Cloud::REAL);

    std::map<std::string, std::vector<double>> results;
    for(size_t i = 0; i < futures.size(); i++)
    {
        const double* values = reinterpret_cast<const double*>(futures[i]->info.data);
        results[names[i]] = std::vector<double>(values, values + futures[i]->info.elements);
    }

    deleteAll(futures);
    return results;
}

/*----------------------------------------------------------------------------
 * readpStrings - results keyed by name without prefix and suffix
 *----------------------------------------------------------------------------*/
std::map<std::string, std::string> AsdfDataSet::readpStrings (const std::vector<std::string>& names, const char* prefix, const char* suffix)
{
    std::vector<H5Future*> futures = readAll(names, prefix, suffix, H5Cloud::RAW);

    std::map<std::string, std::string> results;
    try
    {
        for(size_t i = 0; i < futures.size(); i++)
        {
            results[names[i]] = toString(futures[i]->info, futures[i]->getPath());
        }
    }
    catch(const RunTimeException&)
    {
        deleteAll(futures);
        throw;
    }

    deleteAll(futures);
    return results;
}

/*----------------------------------------------------------------------------
 * parseTraceName
 *
 *  NET.STA.LOC.CHA__<start>__<end>__<tag>, times as %Y-%m-%dT%H:%M:%S UTC
 *----------------------------------------------------------------------------*/
void AsdfDataSet::parseTraceName (const char* name, trace_t& trace)
{
    const std::string full(name ? name : "");

    /* Split Fields */
    std::vector<std::string> fields;
    size_t start = 0;
    size_t sep;
    while((sep = full.find(NAME_SEPARATOR, start)) != std::string::npos)
    {
        fields.push_back(full.substr(start, sep - start));
        start = sep + 2;
    }
    fields.push_back(full.substr(start));

    if(fields.size() < 3)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "trace name %s is missing start and end times", full.c_str());
    }

    /* Split Identifier - location may be empty */
    std::vector<std::string> codes;
    size_t pos = 0;
    while((sep = fields[0].find('.', pos)) != std::string::npos)
    {
        codes.push_back(fields[0].substr(pos, sep - pos));
        pos = sep + 1;
    }
    codes.push_back(fields[0].substr(pos));

    if(codes.size() != 4)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "trace identifier %s is not NET.STA.LOC.CHA", fields[0].c_str());
    }

    trace.network = codes[0];
    trace.station = codes[1];
    trace.location = codes[2];
    trace.channel = codes[3];
    trace.tag = (fields.size() > 3) ? fields[3] : "";

    /* Parse Times */
    trace.starttime = TimeLib::str2systime(fields[1].c_str());
    trace.endtime = TimeLib::str2systime(fields[2].c_str());
    if(trace.starttime == TimeLib::INVALID_TIME || trace.endtime == TimeLib::INVALID_TIME)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unable to parse times %s and %s of trace %s", fields[1].c_str(), fields[2].c_str(), full.c_str());
    }

    if(trace.endtime <= trace.starttime)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "trace %s ends before it starts", full.c_str());
    }

    trace.samplingRate = 0.0;
}

/*----------------------------------------------------------------------------
 * readString - int8 document with surrounding whitespace and nulls removed
 *----------------------------------------------------------------------------*/
std::string AsdfDataSet::readString (const char* path)
{
    H5Cloud::info_t info = session->read(path, H5Cloud::RAW);

    std::string text;
    try
    {
        text = toString(info, path);
    }
    catch(const RunTimeException&)
    {
        delete [] info.data;
        throw;
    }

    delete [] info.data;
    return text;
}

/*----------------------------------------------------------------------------
 * readAll - waits for every read and throws the first failure in order
 *----------------------------------------------------------------------------*/
std::vector<H5Future*> AsdfDataSet::readAll (const std::vector<std::string>& names, const char* prefix, const char* suffix, H5Cloud::valtype_t valtype)
{
    std::vector<H5Session::request_t> requests;
    for(const std::string& name: names)
    {
        H5Session::request_t request;
        request.path = std::string(prefix ? prefix : "") + name + (suffix ? suffix : "");
        request.valtype = valtype;
        requests.push_back(request);
    }

    std::vector<H5Future*> futures = session->readp(requests);

    for(H5Future* future: futures)
    {
        future->wait(IO_PEND);
    }

    for(H5Future* future: futures)
    {
        if(future->wait(0) != H5Future::COMPLETE)
        {
            const int code = future->getCode();
            const std::string error = future->getError();
            deleteAll(futures);
            throw RunTimeException(CRITICAL, code, "%s", error.c_str());
        }
    }

    return futures;
}

/*----------------------------------------------------------------------------
 * toString
 *----------------------------------------------------------------------------*/
std::string AsdfDataSet::toString (const H5Cloud::info_t& info, const char* path)
{
    if(info.datatype != H5Cloud::INT8 && info.datatype != H5Cloud::UINT8 && info.datatype != H5Cloud::STRING)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "%s holds %s values, not text", path, H5Cloud::type2str(info.datatype));
    }

    if(info.data == NULL) return std::string();
    return StringLib::trim(reinterpret_cast<const char*>(info.data), info.datasize);
}

/*----------------------------------------------------------------------------
 * deleteAll
 *----------------------------------------------------------------------------*/
void AsdfDataSet::deleteAll (std::vector<H5Future*>& futures)
{
    for(H5Future* future: futures) delete future;
    futures.clear();
}
