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

#ifndef __h5cloud_ut_h5session__
#define __h5cloud_ut_h5session__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "UnitTest.h"
#include "H5Session.h"

/******************************************************************************
 * H5 SESSION UNIT TEST CLASS
 *
 *  requires UT_Fixtures::create to have been called
 ******************************************************************************/

class UT_H5Session: public UnitTest
{
    public:

        static const char* NAME;

                UT_H5Session        (void);
                ~UT_H5Session       (void) override;
        bool    run                 (void) override;

    private:

        void    testAsset           (void);
        void    testOpenAndList     (void);
        void    testRoundTrip       (void);
        void    testSlices          (void);
        void    testValueTypes      (void);
        void    testFillValue       (void);
        void    testEmptyValues     (void);
        void    testStrings         (void);
        void    testAttributes      (void);
        void    testMeta            (void);
        void    testErrors          (void);
        void    testBadFiles        (void);
        void    testNewerFormat     (void);
        void    testIdempotence     (void);
        void    testConcurrency     (void);
        void    testCancel          (void);
        void    testClose           (void);

        bool    checkChunked        (const H5Cloud::info_t& info, int row0, int rows, int row_step, int col0, int cols, int col_step);
        int     expectFailure       (H5Session& session, const char* path, const std::vector<H5Cloud::slice_t>& slice=std::vector<H5Cloud::slice_t>());

        Asset*  asset;  // local fixture directory
};

#endif  /* __h5cloud_ut_h5session__ */
