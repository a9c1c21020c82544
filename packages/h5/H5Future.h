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

#ifndef __h5cloud_h5future__
#define __h5cloud_h5future__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Cloud.h"
#include "H5RangeFetcher.h"

#include <string>

/******************************************************************************
 * H5FUTURE CLASS
 ******************************************************************************/

class H5Future
{
    public:

        /*--------------------------------------------------------------------
        * Typedefs
        *--------------------------------------------------------------------*/

        typedef enum {
            INVALID     = -1,
            TIMEOUT     = 0,
            COMPLETE    = 1
        } rc_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit    H5Future        (const char* _path);
                    ~H5Future       (void);

        rc_t        wait            (int timeout); // ms
        void        finish          (bool _valid, int _code=RTE_INFO, const char* _errmsg=NULL);
        void        cancel          (void);

        const char* getPath         (void) const;
        int         getCode         (void);
        std::string getError        (void);
        const H5RangeFetcher::Cancel* getCancel (void) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Cloud::info_t info;
        Thread*         reader;     // owned, joined on destruction

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::string             path;
        bool                    valid;      // set to false when error encountered
        bool                    complete;   // set to true when data fully populated
        int                     code;       // exception code when not valid
        std::string             errmsg;
        H5RangeFetcher::Cancel  cancelToken;
        Cond                    sync;       // signals when data read is complete
};

#endif  /* __h5cloud_h5future__ */
