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

#include "UT_EventLib.h"
#include "EventLib.h"
#include "StringLib.h"
#include "UnitTest.h"
#include "OsApi.h"

#include <string.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_EventLib::NAME = "UT_EventLib";

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_EventLib::UT_EventLib (void):
    UnitTest(NAME)
{
}

/*----------------------------------------------------------------------------
 * run
 *----------------------------------------------------------------------------*/
bool UT_EventLib::run (void)
{
    ut_initialize(this);

    const event_level_t log_level = EventLib::getLvl(EventLib::LOG);
    const event_level_t metric_level = EventLib::getLvl(EventLib::METRIC);

    testLevels();
    testHandler();
    testMetrics();
    testPlatformLog();

    /* Restore Settings */
    EventLib::setHandler(NULL, NULL);
    EventLib::setLvl(EventLib::LOG, log_level);
    EventLib::setLvl(EventLib::METRIC, metric_level);

    return ut_status(this);
}

/*----------------------------------------------------------------------------
 * testLevels
 *----------------------------------------------------------------------------*/
void UT_EventLib::testLevels (void)
{
    event_level_t lvl = INVALID_EVENT_LEVEL;

    ut_assert(this, EventLib::str2lvl("warning", &lvl) && lvl == WARNING, "lowercase level not parsed");
    ut_assert(this, EventLib::str2lvl("CRITICAL", &lvl) && lvl == CRITICAL, "uppercase level not parsed");
    ut_assert(this, !EventLib::str2lvl("LOUD", &lvl), "unknown level parsed");
    ut_assert(this, lvl == CRITICAL, "failed parse modified level");

    ut_assert(this, StringLib::match(EventLib::lvl2str(DEBUG), "DEBUG"), "wrong name for DEBUG");
    ut_assert(this, EventLib::lvl2str(INVALID_EVENT_LEVEL) == NULL, "name returned for invalid level");

    ut_assert(this, EventLib::setLvl(EventLib::LOG, ERROR), "failed to set log level");
    ut_assert(this, EventLib::getLvl(EventLib::LOG) == ERROR, "log level not set");
}

/*----------------------------------------------------------------------------
 * testHandler - messages below the log level are dropped
 *----------------------------------------------------------------------------*/
void UT_EventLib::testHandler (void)
{
    captured.clear();
    EventLib::setHandler(captureHandler, this);
    EventLib::setLvl(EventLib::LOG, WARNING);

    mlog(INFO, "dropped %d", 1);
    mlog(WARNING, "kept %d", 2);
    mlog(CRITICAL, "kept %s", "three");

    EventLib::setHandler(NULL, NULL);

    if(ut_assert(this, captured.size() == 2, "expected 2 messages, got %ld", (long)captured.size()))
    {
        ut_assert(this, captured[0].level == WARNING && captured[0].type == EventLib::LOG, "wrong level or type for first message");
        ut_assert(this, StringLib::match(captured[0].attr, "kept 2"), "first message is <%s>", captured[0].attr);
        ut_assert(this, StringLib::match(captured[1].attr, "kept three"), "second message is <%s>", captured[1].attr);
        ut_assert(this, StringLib::find(captured[0].name, ':') != NULL, "message source is <%s>", captured[0].name);
        ut_assert(this, StringLib::find(captured[0].name, PATH_DELIMETER) == NULL, "message source contains directory: <%s>", captured[0].name);
        ut_assert(this, captured[0].systime > 0, "message has no time");
    }
}

/*----------------------------------------------------------------------------
 * testMetrics - counters accumulate, gauges overwrite
 *----------------------------------------------------------------------------*/
void UT_EventLib::testMetrics (void)
{
    const char* counter = "ut_eventlib.counter";
    const char* gauge = "ut_eventlib.gauge";

    EventLib::setLvl(EventLib::METRIC, DEBUG);

    const double start = EventLib::getMetric(counter);
    count_metric(INFO, counter, 3);
    count_metric(DEBUG, counter, 4);
    ut_assert(this, EventLib::getMetric(counter) == start + 7, "counter is %lf", EventLib::getMetric(counter));

    gauge_metric(INFO, gauge, 10);
    gauge_metric(INFO, gauge, 6);
    ut_assert(this, EventLib::getMetric(gauge) == 6, "gauge is %lf", EventLib::getMetric(gauge));

    EventLib::setLvl(EventLib::METRIC, INFO);
    count_metric(DEBUG, counter, 100);
    ut_assert(this, EventLib::getMetric(counter) == start + 7, "metric below level was recorded");

    ut_assert(this, EventLib::getMetric("ut_eventlib.missing") == 0, "missing metric is not zero");
}

/*----------------------------------------------------------------------------
 * testPlatformLog - platform layer messages arrive as errors
 *----------------------------------------------------------------------------*/
void UT_EventLib::testPlatformLog (void)
{
    captured.clear();
    EventLib::setHandler(captureHandler, this);
    EventLib::setLvl(EventLib::LOG, ERROR);

    dlog("Unable to join thread (%d): %s\n", 22, "Invalid argument");

    EventLib::setHandler(NULL, NULL);

    if(ut_assert(this, captured.size() == 1, "expected 1 platform message, got %ld", (long)captured.size()))
    {
        ut_assert(this, captured[0].level == ERROR, "platform message logged at %s", EventLib::lvl2str((event_level_t)captured[0].level));
        ut_assert(this, strstr(captured[0].attr, "Unable to join thread (22): Invalid argument") != NULL, "platform message is <%s>", captured[0].attr);
        ut_assert(this, strstr(captured[0].name, "UT_EventLib.cpp") != NULL, "platform message source is <%s>", captured[0].name);
    }
}

/*----------------------------------------------------------------------------
 * captureHandler
 *----------------------------------------------------------------------------*/
void UT_EventLib::captureHandler (const EventLib::event_t* event, void* parm)
{
    UT_EventLib* ut = static_cast<UT_EventLib*>(parm);
    ut->captured.push_back(*event);
}
