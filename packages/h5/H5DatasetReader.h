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

#ifndef __h5cloud_h5datasetreader__
#define __h5cloud_h5datasetreader__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Cloud.h"
#include "H5Parser.h"
#include "H5RangeFetcher.h"

#include <vector>

/******************************************************************************
 * H5 DATASET READER CLASS
 ******************************************************************************/

class H5DatasetReader
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int MAX_CHUNKS_PER_BATCH = 64;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                H5DatasetReader     (H5Parser* _parser, const H5RangeFetcher::control_t& _control);
                                ~H5DatasetReader    (void);

        H5Cloud::info_t         readDataset         (const char* path, H5Cloud::valtype_t valtype, const std::vector<H5Cloud::slice_t>& slice, bool meta_only=false);
        H5Cloud::info_t         readAttribute       (const char* path, const char* name, H5Cloud::valtype_t valtype);

        static H5Cloud::datatype_t  toDatatype      (const H5Parser::dtype_t& dtype);

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        /* requested hyperslab in dataset coordinates */
        typedef struct {
            int             ndims;
            uint64_t        dims[H5Cloud::MAX_NDIMS];
            int64_t         start[H5Cloud::MAX_NDIMS];
            int64_t         step[H5Cloud::MAX_NDIMS];
            int64_t         count[H5Cloud::MAX_NDIMS];
            uint64_t        elements;
        } selection_t;

        typedef struct {
            uint64_t        offset[H5Cloud::MAX_NDIMS];   // dataset coordinates of first element
            uint64_t        address;
            uint32_t        size;                         // stored bytes
            uint32_t        filter_mask;
        } chunk_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                    buildSelection      (const H5Parser::Node& node, const std::vector<H5Cloud::slice_t>& slice, selection_t& sel);
        void                    readContiguous      (const H5Parser::Node& node, const selection_t& sel, uint8_t* buffer);
        void                    readChunked         (const H5Parser::Node& node, const selection_t& sel, uint8_t* buffer);
        void                    readChunkIndex      (const H5Parser::Node& node, const selection_t& sel, std::vector<chunk_t>& chunks);
        const uint8_t*          decodeChunk         (const H5Parser::Node& node, const chunk_t& chunk, const uint8_t* data, int64_t size, std::vector<uint8_t>& scratch);
        bool                    chunkSelection      (const H5Parser::Node& node, const selection_t& sel, const uint64_t* offset,
                                                     int64_t* local_start, int64_t* local_count, int64_t* dst_start);
        uint64_t                chunkLinearIndex    (const H5Parser::Node& node, const uint64_t* offset);

        static void             copySelection       (const uint8_t* src, const uint64_t* src_dims, int64_t src_origin, const int64_t* src_start, const int64_t* src_step,
                                                     uint8_t* dst, const int64_t* dst_dims, const int64_t* dst_start,
                                                     const int64_t* count, int ndims, int typesize);
        static void             fillBuffer          (const H5Parser::Node& node, uint8_t* buffer, uint64_t datasize);
        static void             swapBuffer          (uint8_t* buffer, uint64_t elements, int typesize);
        static void             translate           (H5Cloud::info_t& info, H5Cloud::valtype_t valtype);
        static void             inflateChunk        (const uint8_t* input, uint32_t input_size, uint8_t* output, uint32_t output_size);
        static void             shuffleChunk        (const uint8_t* input, uint32_t input_size, uint8_t* output, int type_size);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Parser*                   parser;
        H5RangeFetcher::control_t   control;
};

#endif  /* __h5cloud_h5datasetreader__ */
