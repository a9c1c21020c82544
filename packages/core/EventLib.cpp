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

#include "OsApi.h"
#include "EventLib.h"
#include "StringLib.h"
#include "TimeLib.h"

#include <cstdarg>
#include <cstring>
#include <atomic>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

Mutex EventLib::eventMut;
EventLib::event_handler_t EventLib::eventHandler = EventLib::termHandler;
void* EventLib::eventParm = NULL;
std::map<std::string, double> EventLib::metrics;

std::atomic<int> EventLib::log_level{INFO};
std::atomic<int> EventLib::metric_level{DEBUG};

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void EventLib::init (void)
{
    /* Set Default Event Level */
    log_level = INFO;
    metric_level = DEBUG;

    /* Reset Output */
    eventMut.lock();
    {
        eventHandler = termHandler;
        eventParm = NULL;
        metrics.clear();
    }
    eventMut.unlock();
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void EventLib::deinit (void)
{
    eventMut.lock();
    {
        metrics.clear();
    }
    eventMut.unlock();
}

/*----------------------------------------------------------------------------
 * setLvl
 *----------------------------------------------------------------------------*/
bool EventLib::setLvl (type_t type, event_level_t lvl)
{
    switch(type)
    {
        case LOG:       log_level = lvl;    return true;
        case METRIC:    metric_level = lvl; return true;
        default:                            return false;
    }
}

/*----------------------------------------------------------------------------
 * getLvl
 *----------------------------------------------------------------------------*/
event_level_t EventLib::getLvl (type_t type)
{
    switch(type)
    {
        case LOG:       return (event_level_t)log_level.load();
        case METRIC:    return (event_level_t)metric_level.load();
        default:        return INVALID_EVENT_LEVEL;
    }
}

/*----------------------------------------------------------------------------
 * lvl2str
 *----------------------------------------------------------------------------*/
const char* EventLib::lvl2str (event_level_t lvl)
{
    switch(lvl)
    {
        case DEBUG:     return "DEBUG";
        case INFO:      return "INFO";
        case WARNING:   return "WARNING";
        case ERROR:     return "ERROR";
        case CRITICAL:  return "CRITICAL";
        default:        return NULL;
    }
}

/*----------------------------------------------------------------------------
 * type2str
 *----------------------------------------------------------------------------*/
const char* EventLib::type2str (type_t type)
{
    switch(type)
    {
        case LOG:       return "LOG";
        case METRIC:    return "METRIC";
        default:        return NULL;
    }
}

/*----------------------------------------------------------------------------
 * str2lvl
 *----------------------------------------------------------------------------*/
bool EventLib::str2lvl (const char* str, event_level_t* lvl)
{
    for(int i = DEBUG; i < INVALID_EVENT_LEVEL; i++)
    {
        const char* name = lvl2str((event_level_t)i);
        if(strcasecmp(str, name) == 0)
        {
            *lvl = (event_level_t)i;
            return true;
        }
    }
    return false;
}

/*----------------------------------------------------------------------------
 * setHandler
 *
 *  passing NULL restores printing to the terminal
 *----------------------------------------------------------------------------*/
void EventLib::setHandler (event_handler_t handler, void* parm)
{
    eventMut.lock();
    {
        eventHandler = handler ? handler : termHandler;
        eventParm = handler ? parm : NULL;
    }
    eventMut.unlock();
}

/*----------------------------------------------------------------------------
 * logMsg
 *----------------------------------------------------------------------------*/
void EventLib::logMsg(const char* file_name, unsigned int line_number, event_level_t lvl, const char* msg_fmt, ...)
{
    event_t event;

    /* Return Here If Nothing to Do */
    if(lvl < log_level) return;

    /* Initialize Log Message */
    event.systime   = OsApi::time(OsApi::SYS_CLK);
    event.tid       = Thread::getId();
    event.type      = LOG;
    event.level     = lvl;

    /* Build Name - <Filename>:<Line Number> */
    const char* last_path_delimeter = StringLib::find(file_name, PATH_DELIMETER, false);
    const char* file_name_only = last_path_delimeter ? last_path_delimeter + 1 : file_name;
    StringLib::format(event.name, MAX_NAME_SIZE, "%s:%u", file_name_only, line_number);

    /* Build Attribute - <log message> */
    va_list args;
    va_start(args, msg_fmt);
    const int vlen = vsnprintf(event.attr, MAX_ATTR_SIZE - 1, msg_fmt, args);
    const int attr_size = MAX(MIN(vlen + 1, MAX_ATTR_SIZE), 1);
    event.attr[attr_size - 1] = '\0';
    va_end(args);

    /* Post Log Message */
    sendEvent(&event);
}

/*----------------------------------------------------------------------------
 * generateMetric
 *
 *  counters accumulate, gauges overwrite
 *----------------------------------------------------------------------------*/
void EventLib::generateMetric (event_level_t lvl, const char* name, metric_subtype_t subtype, double value)
{
    /* Return Here If Nothing to Do */
    if(lvl < metric_level) return;

    eventMut.lock();
    {
        if(subtype == COUNTER)  metrics[name] += value;
        else                    metrics[name] = value;
    }
    eventMut.unlock();
}

/*----------------------------------------------------------------------------
 * getMetric
 *----------------------------------------------------------------------------*/
double EventLib::getMetric (const char* name)
{
    double value = 0.0;
    eventMut.lock();
    {
        auto iter = metrics.find(name);
        if(iter != metrics.end()) value = iter->second;
    }
    eventMut.unlock();
    return value;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * sendEvent
 *----------------------------------------------------------------------------*/
void EventLib::sendEvent (const event_t* event)
{
    eventMut.lock();
    {
        eventHandler(event, eventParm);
    }
    eventMut.unlock();
}

/*----------------------------------------------------------------------------
 * termHandler
 *----------------------------------------------------------------------------*/
void EventLib::termHandler (const event_t* event, void* parm)
{
    (void)parm;
    const TimeLib::gmt_time_t gmt = TimeLib::sys2gmttime(event->systime);
    fprintf(stderr, "%04d:%03d:%02d:%02d:%02d %s:%s %s\n",
            gmt.year, gmt.doy, gmt.hour, gmt.minute, gmt.second,
            lvl2str((event_level_t)event->level), event->name, event->attr);
}
