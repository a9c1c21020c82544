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
#include "h5.h"
#include "asdf.h"

#include "UT_String.h"
#include "UT_EventLib.h"
#include "UT_Fixtures.h"
#include "UT_RangeFetcher.h"
#include "UT_ChunkCache.h"
#include "UT_H5Session.h"
#include "UT_AsdfDataSet.h"

#include <stdlib.h>
#include <stdio.h>

/******************************************************************************
 LOCAL FUNCTIONS
 ******************************************************************************/

/*
 * createSuites - caller owns returned tests
 */
static std::vector<UnitTest*> createSuites (void)
{
    std::vector<UnitTest*> suites;
    suites.push_back(new UT_String());
    suites.push_back(new UT_EventLib());
    suites.push_back(new UT_RangeFetcher());
    suites.push_back(new UT_ChunkCache());
    suites.push_back(new UT_H5Session());
    suites.push_back(new UT_AsdfDataSet());
    return suites;
}

/******************************************************************************
 MAIN
 ******************************************************************************/

int main (int argc, char* argv[])
{
    if(argc < 2 || argc > 3)
    {
        print2term("Usage: %s <%s|%s|%s|%s|%s|%s|all> [fixture directory]\n", argv[0],
                    UT_String::NAME, UT_EventLib::NAME, UT_RangeFetcher::NAME, UT_ChunkCache::NAME, UT_H5Session::NAME, UT_AsdfDataSet::NAME);
        return 1;
    }

    const char* selection = argv[1];
    const char* directory = (argc == 3) ? argv[2] : NULL;

    /* Initialize Libraries */
    initcore();
    inith5();
    initasdf();

    int failures = 0;
    int executed = 0;

    if(UT_Fixtures::create(directory))
    {
        std::vector<UnitTest*> suites = createSuites();
        for(UnitTest* suite: suites)
        {
            if(StringLib::match(selection, "all") || StringLib::match(selection, suite->getName()))
            {
                const int64_t start = OsApi::time(OsApi::CPU_CLK);
                const bool passed = suite->run();
                const double elapsed = (double)(OsApi::time(OsApi::CPU_CLK) - start) / 1000000.0;

                print2term("%s: %s (%d failures, %.3lf secs)\n", suite->getName(), passed ? "PASSED" : "FAILED", suite->getFailures(), elapsed);
                if(!passed) failures += MAX(suite->getFailures(), 1);
                executed++;
            }
            delete suite;
        }

        if(executed == 0)
        {
            mlog(CRITICAL, "Unknown test suite: %s", selection);
            failures = 1;
        }
    }
    else
    {
        failures = 1;
    }

    /* Clean Up */
    deinitasdf();
    deinith5();
    deinitcore();

    return (failures == 0) ? 0 : 1;
}
