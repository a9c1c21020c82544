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

#include "Asset.h"
#include "EventLib.h"
#include "StringLib.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* Asset::DEFAULT_REGION = "us-west-2";

Mutex Asset::ioDriverMut;
std::map<std::string, Asset::io_driver_f> Asset::ioDrivers;

/******************************************************************************
 * ASSET CLASS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * create
 *----------------------------------------------------------------------------*/
Asset* Asset::create (const char* name, const char* format, const char* path, const char* region, const char* endpoint)
{
    if(!name || !format || !path)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "asset requires a name, format, and path");
    }

    /* Look Up Driver */
    io_driver_f _factory = NULL;
    ioDriverMut.lock();
    {
        std::map<std::string, io_driver_f>::const_iterator iter = ioDrivers.find(format);
        if(iter != ioDrivers.end()) _factory = iter->second;
    }
    ioDriverMut.unlock();

    if(!_factory)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "no driver registered for format <%s> of asset %s", format, name);
    }

    /* Build Attributes */
    attributes_t _attributes = {
        .name       = StringLib::duplicate(name),
        .format     = StringLib::duplicate(format),
        .path       = StringLib::duplicate(path),
        .region     = StringLib::duplicate(region ? region : DEFAULT_REGION),
        .endpoint   = StringLib::duplicate(endpoint ? endpoint : "")
    };

    return new Asset(_attributes, _factory);
}

/*----------------------------------------------------------------------------
 * registerDriver
 *----------------------------------------------------------------------------*/
bool Asset::registerDriver (const char* _format, io_driver_f factory)
{
    bool status;

    ioDriverMut.lock();
    {
        status = ioDrivers.emplace(_format, factory).second;
        mlog(DEBUG, "Registering driver %s: %d", _format, status);
    }
    ioDriverMut.unlock();

    return status;
}

/*----------------------------------------------------------------------------
 * createDriver
 *----------------------------------------------------------------------------*/
Asset::io_driver_t Asset::createDriver (const char* resource) const
{
    return factory(this, resource);
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
Asset::~Asset (void)
{
    delete [] attributes.name;
    delete [] attributes.format;
    delete [] attributes.path;
    delete [] attributes.region;
    delete [] attributes.endpoint;
}

/*----------------------------------------------------------------------------
 * getName
 *----------------------------------------------------------------------------*/
const char* Asset::getName (void) const
{
    return attributes.name;
}

/*----------------------------------------------------------------------------
 * getPath
 *----------------------------------------------------------------------------*/
const char* Asset::getPath (void) const
{
    return attributes.path;
}

/*----------------------------------------------------------------------------
 * getRegion
 *----------------------------------------------------------------------------*/
const char* Asset::getRegion (void) const
{
    return attributes.region;
}

/*----------------------------------------------------------------------------
 * getEndpoint - empty when the backend derives it from the region
 *----------------------------------------------------------------------------*/
const char* Asset::getEndpoint (void) const
{
    return attributes.endpoint;
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
Asset::Asset (const attributes_t& _attributes, io_driver_f _factory):
    attributes(_attributes),
    factory(_factory)
{
}
