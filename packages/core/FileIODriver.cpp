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

#include "FileIODriver.h"
#include "EventLib.h"
#include "StringLib.h"
#include "OsApi.h"

#include <errno.h>
#include <fcntl.h>
#include <memory>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* FileIODriver::FORMAT = "file";

/******************************************************************************
 * FILE IO DRIVER CLASS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * create
 *----------------------------------------------------------------------------*/
Asset::io_driver_t FileIODriver::create (const Asset* _asset, const char* resource)
{
    /* Build Filename */
    char filename[MAX_STR_SIZE];
    const char* path = _asset->getPath();
    if(path && path[0] != '\0')
    {
        StringLib::format(filename, MAX_STR_SIZE, "%s%c%s", path, PATH_DELIMETER, resource);
    }
    else
    {
        StringLib::copy(filename, resource, MAX_STR_SIZE);
    }

    /* Open File */
    const int fd = open(filename, O_RDONLY);
    if(fd < 0)
    {
        if(errno == ENOENT || errno == ENOTDIR)
        {
            throw RunTimeException(CRITICAL, RTE_RESOURCE_DOES_NOT_EXIST, "file %s does not exist", filename);
        }
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "failed to open resource %s: %s", filename, strerror(errno));
    }

    /* Bind Capability */
    std::shared_ptr<Handle> handle = std::make_shared<Handle>(fd, filename);
    Asset::io_driver_t driver;
    driver.size = [handle]() { return ioSize(handle.get()); };
    driver.read = [handle](uint8_t* data, int64_t size, uint64_t pos, int64_t deadline) {
        return ioRead(handle.get(), data, size, pos, deadline);
    };

    mlog(DEBUG, "Opened %s", filename);
    return driver;
}

/*----------------------------------------------------------------------------
 * Handle::Destructor
 *----------------------------------------------------------------------------*/
FileIODriver::Handle::~Handle (void)
{
    close(fd);
}

/*----------------------------------------------------------------------------
 * ioSize
 *----------------------------------------------------------------------------*/
uint64_t FileIODriver::ioSize (const Handle* handle)
{
    struct stat st;
    if(fstat(handle->fd, &st) != 0)
    {
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "failed to stat %s: %s", handle->filename.c_str(), strerror(errno));
    }
    return static_cast<uint64_t>(st.st_size);
}

/*----------------------------------------------------------------------------
 * ioRead
 *----------------------------------------------------------------------------*/
int64_t FileIODriver::ioRead (const Handle* handle, uint8_t* data, int64_t size, uint64_t pos, int64_t deadline)
{
    int64_t bytes_read = 0;
    while(bytes_read < size)
    {
        if(deadline > 0 && OsApi::time(OsApi::CPU_CLK) > deadline)
        {
            throw RunTimeException(CRITICAL, RTE_TIMEOUT, "read of %s timed out at %lu", handle->filename.c_str(), (unsigned long)(pos + bytes_read));
        }

        const ssize_t ret = pread(handle->fd, &data[bytes_read], size - bytes_read, pos + bytes_read);
        if(ret < 0)
        {
            if(errno == EINTR) continue;
            throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "failed to read %s at %lu: %s", handle->filename.c_str(), (unsigned long)(pos + bytes_read), strerror(errno));
        }
        else if(ret == 0)
        {
            break; // end of file
        }
        bytes_read += ret;
    }

    return bytes_read;
}
