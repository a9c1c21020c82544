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
 INCLUDES
 ******************************************************************************/

#include "core.h"
#include "aws.h"
#include "h5.h"
#include "asdf.h"

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <inttypes.h>

/******************************************************************************
 TYPEDEFS
 ******************************************************************************/

typedef struct {
    const char*         format;
    const char*         path;
    const char*         region;
    const char*         endpoint;
    H5Session::config_t config;
} cli_parms_t;

/******************************************************************************
 FILE DATA
 ******************************************************************************/

static const char* ASSET_NAME = "h5cloud";

/******************************************************************************
 LOCAL FUNCTIONS
 ******************************************************************************/

/*
 * usage
 */
static void usage (const char* app)
{
    print2term("Usage: %s [options] <resource> <command> [args]\n", app);
    print2term("Options:\n");
    print2term("  -f <format>       storage format: file (default) or s3\n");
    print2term("  -p <path>         directory, or bucket/prefix for s3 (default .)\n");
    print2term("  -r <region>       s3 region (default %s)\n", Asset::DEFAULT_REGION);
    print2term("  -e <endpoint>     s3 endpoint (default https://s3.<region>.amazonaws.com)\n");
    print2term("  -c <cache_mb>     cache ceiling in megabytes\n");
    print2term("  -t <timeout_ms>   deadline applied to each call\n");
    print2term("  -l <level>        log level: DEBUG, INFO, WARNING, ERROR, CRITICAL\n");
    print2term("Commands:\n");
    print2term("  list <group>\n");
    print2term("  read <dataset> [start:stop[:step],...]\n");
    print2term("  attr <path> <name>\n");
    print2term("  meta <dataset>\n");
    print2term("  stats\n");
}

/*
 * parseSlice - empty start is 0, empty stop is the extent of the dimension
 */
static std::vector<H5Cloud::slice_t> parseSlice (const char* str)
{
    std::vector<H5Cloud::slice_t> slice;

    StringLib::TokenList dims = StringLib::split(str, (int)strlen(str), ',', true);
    for(const std::string& dim: dims)
    {
        H5Cloud::slice_t s = {0, H5Cloud::EOR, 1};
        int64_t* fields[3] = {&s.start, &s.stop, &s.step};

        size_t pos = 0;
        for(int f = 0; f < 3; f++)
        {
            const size_t sep = dim.find(':', pos);
            const std::string field = dim.substr(pos, (sep == std::string::npos) ? std::string::npos : sep - pos);
            if(!field.empty())
            {
                long long value;
                if(!StringLib::str2llong(field.c_str(), &value, 10))
                {
                    throw RunTimeException(CRITICAL, RTE_ERROR, "invalid slice field <%s> in %s", field.c_str(), str);
                }
                *fields[f] = value;
            }
            if(sep == std::string::npos) break;
            if(f == 2) throw RunTimeException(CRITICAL, RTE_ERROR, "too many slice fields in %s", dim.c_str());
            pos = sep + 1;
        }

        slice.push_back(s);
    }

    return slice;
}

/*
 * printShape
 */
static void printShape (const H5Cloud::info_t& info)
{
    print2term("type: %s\n", H5Cloud::type2str(info.datatype));
    print2term("typesize: %u\n", info.typesize);
    print2term("elements: %lu\n", (unsigned long)info.elements);
    print2term("shape: [");
    for(int d = 0; d < info.ndims; d++)
    {
        print2term("%s%lu", d > 0 ? "," : "", (unsigned long)info.shape[d]);
    }
    print2term("]\n");
}

/*
 * printValues - one row per line for the last dimension
 */
static void printValues (const H5Cloud::info_t& info)
{
    if(info.data == NULL) return;

    const uint64_t row = (info.ndims > 1 && info.shape[info.ndims - 1] > 0) ? info.shape[info.ndims - 1] : info.elements;

    if(info.datatype == H5Cloud::STRING)
    {
        for(uint64_t i = 0; i < info.elements; i++)
        {
            const std::string text = StringLib::trim(reinterpret_cast<const char*>(&info.data[i * info.typesize]), info.typesize);
            print2term("%s\n", text.c_str());
        }
        return;
    }

    for(uint64_t i = 0; i < info.elements; i++)
    {
        switch(info.datatype)
        {
            case H5Cloud::INT64:    print2term("%" PRId64, reinterpret_cast<const int64_t*>(info.data)[i]); break;
            case H5Cloud::DOUBLE:   print2term("%.17g", reinterpret_cast<const double*>(info.data)[i]); break;
            default:                throw RunTimeException(CRITICAL, RTE_ERROR, "unable to display %s values", H5Cloud::type2str(info.datatype));
        }
        print2term("%s", ((i + 1) % row == 0) ? "\n" : " ");
    }
}

/*
 * printStats
 */
static void printStats (const H5Session::stats_t& stats)
{
    print2term("fetches: %ld\n", stats.fetches);
    print2term("bytes_read: %ld\n", stats.bytesRead);
    print2term("cache_hits: %ld\n", stats.cacheHits);
    print2term("cache_misses: %ld\n", stats.cacheMisses);
    print2term("cache_evictions: %ld\n", stats.cacheEvictions);
    print2term("cache_entries: %ld\n", stats.cacheEntries);
    print2term("cache_resident: %ld\n", (long)stats.cacheResident);
}

/*
 * readDataset - integer types are displayed as int64, everything numeric else as double
 */
static void readDataset (H5Session& session, const char* path, const std::vector<H5Cloud::slice_t>& slice)
{
    H5Cloud::info_t meta = session.meta(path);

    H5Cloud::valtype_t valtype = H5Cloud::REAL;
    if(meta.datatype == H5Cloud::STRING)        valtype = H5Cloud::RAW;
    else if(meta.datatype != H5Cloud::FLOAT &&
            meta.datatype != H5Cloud::DOUBLE)   valtype = H5Cloud::INTEGER;

    H5Cloud::info_t info = session.read(path, valtype, slice);
    try
    {
        printValues(info);
    }
    catch(const RunTimeException&)
    {
        delete [] info.data;
        throw;
    }
    delete [] info.data;
}

/*
 * runCommand
 */
static void runCommand (H5Session& session, int argc, char* argv[])
{
    const char* command = argv[0];

    if(StringLib::match(command, "list") && argc == 2)
    {
        for(const std::string& name: session.list(argv[1]))
        {
            print2term("%s\n", name.c_str());
        }
    }
    else if(StringLib::match(command, "read") && (argc == 2 || argc == 3))
    {
        const std::vector<H5Cloud::slice_t> slice = (argc == 3) ? parseSlice(argv[2]) : std::vector<H5Cloud::slice_t>();
        readDataset(session, argv[1], slice);
    }
    else if(StringLib::match(command, "attr") && argc == 3)
    {
        H5Cloud::info_t info = session.readAttribute(argv[1], argv[2], H5Cloud::RAW);
        if(info.datatype != H5Cloud::STRING)
        {
            delete [] info.data;
            info = session.readAttribute(argv[1], argv[2], (info.datatype == H5Cloud::FLOAT || info.datatype == H5Cloud::DOUBLE) ? H5Cloud::REAL : H5Cloud::INTEGER);
        }
        try
        {
            printValues(info);
        }
        catch(const RunTimeException&)
        {
            delete [] info.data;
            throw;
        }
        delete [] info.data;
    }
    else if(StringLib::match(command, "meta") && argc == 2)
    {
        printShape(session.meta(argv[1]));
    }
    else if(StringLib::match(command, "stats") && argc == 1)
    {
        printStats(session.stats());
    }
    else
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "invalid command: %s with %d arguments", command, argc - 1);
    }
}

/******************************************************************************
 MAIN
 ******************************************************************************/

int main (int argc, char* argv[])
{
    cli_parms_t parms;
    parms.format = FileIODriver::FORMAT;
    parms.path = ".";
    parms.region = NULL;
    parms.endpoint = NULL;
    parms.config = H5Session::defaultConfig();

    /* Initialize Libraries */
    initcore();
    initaws();
    inith5();
    initasdf();

    /* Parse Options */
    int status = 0;
    int opt;
    while(status == 0 && (opt = getopt(argc, argv, "f:p:r:e:c:t:l:h")) != -1)
    {
        long val = 0;
        switch(opt)
        {
            case 'f':   parms.format = optarg; break;
            case 'p':   parms.path = optarg; break;
            case 'r':   parms.region = optarg; break;
            case 'e':   parms.endpoint = optarg; break;
            case 'c':
            {
                if(StringLib::str2long(optarg, &val, 10) && val > 0) parms.config.cacheCeiling = (int64_t)val * 1024 * 1024;
                else { mlog(CRITICAL, "Invalid cache size: %s", optarg); status = 1; }
                break;
            }
            case 't':
            {
                if(StringLib::str2long(optarg, &val, 10) && val > 0) parms.config.fetchTimeoutMs = (int)val;
                else { mlog(CRITICAL, "Invalid timeout: %s", optarg); status = 1; }
                break;
            }
            case 'l':
            {
                event_level_t lvl;
                if(EventLib::str2lvl(optarg, &lvl)) EventLib::setLvl(EventLib::LOG, lvl);
                else { mlog(CRITICAL, "Invalid log level: %s", optarg); status = 1; }
                break;
            }
            default:
            {
                status = 1;
                break;
            }
        }
    }

    if(status == 0 && argc - optind < 2)
    {
        status = 1;
    }

    if(status != 0)
    {
        usage(argv[0]);
    }
    else
    {
        const char* resource = argv[optind];
        Asset* asset = NULL;

        try
        {
            /* Credentials Come From Environment */
            if(StringLib::match(parms.format, S3CurlIODriver::FORMAT) && !CredentialStore::fromEnvironment(ASSET_NAME))
            {
                mlog(INFO, "No credentials in environment, accessing %s anonymously", parms.path);
            }

            asset = Asset::create(ASSET_NAME, parms.format, parms.path, parms.region, parms.endpoint);

            H5Session session(asset, resource, parms.config);
            session.open();
            runCommand(session, argc - optind - 1, &argv[optind + 1]);
            session.close();
        }
        catch(const RunTimeException& e)
        {
            mlog(e.level(), "%s [%s]", e.what(), RunTimeException::codeName(e.code()));
            status = 2;
        }

        delete asset;
    }

    /* Clean Up */
    deinitasdf();
    deinith5();
    deinitaws();
    deinitcore();

    return status;
}
