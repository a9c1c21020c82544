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

#include "H5DatasetReader.h"
#include "EventLib.h"
#include "OsApi.h"

#include <set>
#include <string.h>
#include <zlib.h>

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

template<typename S, typename T>
static void castArray (const uint8_t* src, uint64_t elements, T* dst)
{
    const S* values = reinterpret_cast<const S*>(src);
    for(uint64_t i = 0; i < elements; i++)
    {
        dst[i] = static_cast<T>(values[i]);
    }
}

template<typename T>
static void castData (const H5Cloud::info_t& info, T* dst)
{
    switch(info.datatype)
    {
        case H5Cloud::INT8:     castArray<int8_t>(info.data, info.elements, dst);     break;
        case H5Cloud::INT16:    castArray<int16_t>(info.data, info.elements, dst);    break;
        case H5Cloud::INT32:    castArray<int32_t>(info.data, info.elements, dst);    break;
        case H5Cloud::INT64:    castArray<int64_t>(info.data, info.elements, dst);    break;
        case H5Cloud::UINT8:    castArray<uint8_t>(info.data, info.elements, dst);    break;
        case H5Cloud::UINT16:   castArray<uint16_t>(info.data, info.elements, dst);   break;
        case H5Cloud::UINT32:   castArray<uint32_t>(info.data, info.elements, dst);   break;
        case H5Cloud::UINT64:   castArray<uint64_t>(info.data, info.elements, dst);   break;
        case H5Cloud::FLOAT:    castArray<float>(info.data, info.elements, dst);      break;
        case H5Cloud::DOUBLE:   castArray<double>(info.data, info.elements, dst);     break;
        default:
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "data translation failed for %s", H5Cloud::type2str(info.datatype));
        }
    }
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5DatasetReader::H5DatasetReader (H5Parser* _parser, const H5RangeFetcher::control_t& _control):
    parser(_parser),
    control(_control)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5DatasetReader::~H5DatasetReader (void)
{
}

/*----------------------------------------------------------------------------
 * readDataset
 *
 *  returned data is owned by the caller; nothing is returned on failure
 *----------------------------------------------------------------------------*/
H5Cloud::info_t H5DatasetReader::readDataset (const char* path, H5Cloud::valtype_t valtype, const std::vector<H5Cloud::slice_t>& slice, bool meta_only)
{
    H5Cloud::info_t info;
    H5Cloud::clearInfo(info);

    try
    {
        /* Resolve Dataset */
        const H5Parser::node_ptr_t node = parser->resolve(path, control);
        if(!node->isDataset())
        {
            throw RunTimeException(CRITICAL, RTE_PATH_NOT_FOUND, "not a dataset");
        }

        if(node->datatype.shared)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "committed datatypes are not supported");
        }

        info.datatype = toDatatype(node->datatype);
        if(info.datatype == H5Cloud::INVALID_TYPE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unsupported datatype %s of %d bytes",
                                   H5Parser::class2str(node->datatype.typeclass), (int)node->datatype.size);
        }

        /* Build Selection */
        selection_t sel;
        buildSelection(*node, slice, sel);
        info.typesize = node->datatype.size;
        info.elements = sel.elements;
        info.datasize = sel.elements * info.typesize;
        info.ndims = sel.ndims;
        for(int d = 0; d < sel.ndims; d++)
        {
            info.shape[d] = sel.count[d];
        }

        if(H5CLOUD_VERBOSE)
        {
            print2term("Dataset %s: %s, %lu elements, %s\n", path, H5Cloud::type2str(info.datatype),
                       (unsigned long)info.elements, H5Parser::layout2str(node->layout.type));
        }

        if(meta_only) return info;

        /* Read Data */
        if(info.datasize > 0)
        {
            info.data = new uint8_t[info.datasize];
            switch(node->layout.type)
            {
                case H5Parser::COMPACT_LAYOUT:
                case H5Parser::CONTIGUOUS_LAYOUT:   readContiguous(*node, sel, info.data);  break;
                case H5Parser::CHUNKED_LAYOUT:      readChunked(*node, sel, info.data);     break;
                default:
                {
                    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unsupported data layout version %d", node->layout.version);
                }
            }

            /* Native Byte Order */
            if(node->datatype.bigendian)
            {
                swapBuffer(info.data, info.elements, info.typesize);
            }
        }

        translate(info, valtype);
    }
    catch(const RunTimeException& e)
    {
        delete [] info.data;
        info.data = NULL;
        throw RunTimeException(e.level(), e.code(), "%s: %s", path, e.what());
    }

    return info;
}

/*----------------------------------------------------------------------------
 * readAttribute
 *----------------------------------------------------------------------------*/
H5Cloud::info_t H5DatasetReader::readAttribute (const char* path, const char* name, H5Cloud::valtype_t valtype)
{
    H5Cloud::info_t info;
    H5Cloud::clearInfo(info);

    try
    {
        const H5Parser::node_ptr_t node = parser->resolve(path, control);
        const H5Parser::attribute_t* attribute = node->findAttribute(name);
        if(attribute == NULL)
        {
            throw RunTimeException(CRITICAL, RTE_PATH_NOT_FOUND, "attribute not found");
        }

        if(attribute->dtype.shared)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "shared attribute components are not supported");
        }

        info.datatype = toDatatype(attribute->dtype);
        if(info.datatype == H5Cloud::INVALID_TYPE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unsupported attribute datatype %s of %d bytes",
                                   H5Parser::class2str(attribute->dtype.typeclass), (int)attribute->dtype.size);
        }

        info.typesize = attribute->dtype.size;
        info.datasize = attribute->value.size();
        info.elements = info.datasize / info.typesize;
        info.ndims = attribute->dspace.ndims;
        for(int d = 0; d < info.ndims; d++)
        {
            info.shape[d] = attribute->dspace.dims[d];
        }

        if(info.datasize > 0)
        {
            info.data = new uint8_t[info.datasize];
            memcpy(info.data, attribute->value.data(), info.datasize);
            if(attribute->dtype.bigendian)
            {
                swapBuffer(info.data, info.elements, info.typesize);
            }
        }

        translate(info, valtype);
    }
    catch(const RunTimeException& e)
    {
        delete [] info.data;
        info.data = NULL;
        throw RunTimeException(e.level(), e.code(), "%s@%s: %s", path, name, e.what());
    }

    return info;
}

/*----------------------------------------------------------------------------
 * toDatatype
 *----------------------------------------------------------------------------*/
H5Cloud::datatype_t H5DatasetReader::toDatatype (const H5Parser::dtype_t& dtype)
{
    if(dtype.shared) return H5Cloud::INVALID_TYPE;

    switch(dtype.typeclass)
    {
        case H5Parser::FIXED_POINT_TYPE:
        {
            switch(dtype.size)
            {
                case 1:     return dtype.signedval ? H5Cloud::INT8  : H5Cloud::UINT8;
                case 2:     return dtype.signedval ? H5Cloud::INT16 : H5Cloud::UINT16;
                case 4:     return dtype.signedval ? H5Cloud::INT32 : H5Cloud::UINT32;
                case 8:     return dtype.signedval ? H5Cloud::INT64 : H5Cloud::UINT64;
                default:    return H5Cloud::INVALID_TYPE;
            }
        }

        case H5Parser::FLOATING_POINT_TYPE:
        {
            if      (dtype.size == 4) return H5Cloud::FLOAT;
            else if (dtype.size == 8) return H5Cloud::DOUBLE;
            else                      return H5Cloud::INVALID_TYPE;
        }

        case H5Parser::STRING_TYPE:
        {
            return (dtype.size > 0) ? H5Cloud::STRING : H5Cloud::INVALID_TYPE;
        }

        default:
        {
            return H5Cloud::INVALID_TYPE;
        }
    }
}

/*----------------------------------------------------------------------------
 * buildSelection
 *
 *  missing trailing dimensions select the whole extent
 *----------------------------------------------------------------------------*/
void H5DatasetReader::buildSelection (const H5Parser::Node& node, const std::vector<H5Cloud::slice_t>& slice, selection_t& sel)
{
    sel.ndims = node.dataspace.ndims;
    sel.elements = node.dataspace.null ? 0 : 1;

    if((int)slice.size() > sel.ndims)
    {
        throw RunTimeException(CRITICAL, RTE_OUT_OF_RANGE_SLICE, "slice has %d dimensions but dataset has %d", (int)slice.size(), sel.ndims);
    }

    for(int d = 0; d < sel.ndims; d++)
    {
        const int64_t extent = (int64_t)node.dataspace.dims[d];
        int64_t start = 0;
        int64_t stop = extent;
        int64_t step = 1;

        if(d < (int)slice.size())
        {
            start = slice[d].start;
            stop = (slice[d].stop == H5Cloud::EOR) ? extent : slice[d].stop;
            step = slice[d].step;
        }

        const bool empty_extent = (extent == 0) && (start == 0) && (stop == 0);
        if(step < 1 || start < 0 || stop > extent || (start >= stop && !empty_extent))
        {
            throw RunTimeException(CRITICAL, RTE_OUT_OF_RANGE_SLICE, "slice [%ld:%ld:%ld] outside dimension %d of extent %ld",
                                   (long)start, (long)stop, (long)step, d, (long)extent);
        }

        sel.dims[d] = extent;
        sel.start[d] = start;
        sel.step[d] = step;
        sel.count[d] = (stop - start + step - 1) / step;
        sel.elements *= sel.count[d];
    }
}

/*----------------------------------------------------------------------------
 * readContiguous
 *
 *  fetches the single range covering the first through last selected
 *  element; compact data is served from the object header's cached block
 *----------------------------------------------------------------------------*/
void H5DatasetReader::readContiguous (const H5Parser::Node& node, const selection_t& sel, uint8_t* buffer)
{
    const int typesize = node.datatype.size;

    /* Storage Never Allocated */
    if(parser->isUndefined(node.layout.address))
    {
        fillBuffer(node, buffer, sel.elements * typesize);
        return;
    }

    /* Check Storage Size */
    uint64_t dataset_elements = 1;
    for(int d = 0; d < sel.ndims; d++) dataset_elements *= sel.dims[d];
    if(node.layout.size < dataset_elements * typesize)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "storage of %lu bytes is smaller than dataset of %lu bytes",
                               (unsigned long)node.layout.size, (unsigned long)(dataset_elements * typesize));
    }

    /* Covering Range */
    int64_t stride[H5Cloud::MAX_NDIMS];
    int64_t first = 0;
    int64_t last = 0;
    for(int d = sel.ndims - 1; d >= 0; d--)
    {
        stride[d] = (d == sel.ndims - 1) ? 1 : stride[d + 1] * (int64_t)sel.dims[d + 1];
        first += sel.start[d] * stride[d];
        last += (sel.start[d] + ((sel.count[d] - 1) * sel.step[d])) * stride[d];
    }

    const uint64_t offset = node.layout.address + (first * typesize);
    const int64_t length = (last - first + 1) * typesize;

    if(control.cancel) control.cancel->check();
    const H5ChunkCache::Ref ref = parser->fetchRange(offset, length, control);

    /* Copy Selection */
    const int64_t dst_start[H5Cloud::MAX_NDIMS] = {0};
    copySelection(ref.data(), sel.dims, first, sel.start, sel.step, buffer, sel.count, dst_start, sel.count, sel.ndims, typesize);
}

/*----------------------------------------------------------------------------
 * readChunked
 *
 *  chunks intersecting the selection are fetched in batches through the
 *  cache, decoded independently, and cropped into the output
 *----------------------------------------------------------------------------*/
void H5DatasetReader::readChunked (const H5Parser::Node& node, const selection_t& sel, uint8_t* buffer)
{
    const H5Parser::layout_info_t& layout = node.layout;
    const int typesize = node.datatype.size;

    if(layout.ndims != sel.ndims)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk dimensionality %d does not match dataspace %d", layout.ndims, sel.ndims);
    }

    if(layout.elementsize != (uint32_t)typesize)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk element size %d does not match datatype size %d", (int)layout.elementsize, typesize);
    }

    /* Check Filters Before Any Data Is Fetched */
    for(const H5Parser::filter_info_t& filter: node.filters)
    {
        if(filter.id != H5Parser::DEFLATE_FILTER && filter.id != H5Parser::SHUFFLE_FILTER)
        {
            throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FILTER, "filter %d (%s) is not supported", (int)filter.id,
                                   filter.name.empty() ? H5Parser::filter2str(filter.id) : filter.name.c_str());
        }
    }

    /* Unwritten Chunks Read As Fill */
    fillBuffer(node, buffer, sel.elements * typesize);
    if(parser->isUndefined(layout.address))
    {
        return;
    }

    /* Find Chunks */
    std::vector<chunk_t> chunks;
    readChunkIndex(node, sel, chunks);
    mlog(DEBUG, "Reading %ld chunks from b-tree at 0x%lx", (long)chunks.size(), (unsigned long)layout.address);

    /* Process Chunks in Batches */
    for(size_t batch_start = 0; batch_start < chunks.size(); batch_start += MAX_CHUNKS_PER_BATCH)
    {
        if(control.cancel) control.cancel->check();

        const size_t batch_end = MIN(batch_start + MAX_CHUNKS_PER_BATCH, chunks.size());
        std::vector<H5RangeFetcher::range_t> ranges;
        for(size_t c = batch_start; c < batch_end; c++)
        {
            ranges.push_back({chunks[c].address, (int64_t)chunks[c].size});
        }

        const std::vector<H5ChunkCache::Ref> refs = parser->fetchRanges(ranges, control);

        for(size_t c = batch_start; c < batch_end; c++)
        {
            const chunk_t& chunk = chunks[c];
            const H5ChunkCache::Ref& ref = refs[c - batch_start];

            std::vector<uint8_t> scratch;
            const uint8_t* chunk_data = decodeChunk(node, chunk, ref.data(), ref.size(), scratch);

            int64_t local_start[H5Cloud::MAX_NDIMS];
            int64_t local_count[H5Cloud::MAX_NDIMS];
            int64_t dst_start[H5Cloud::MAX_NDIMS];
            if(chunkSelection(node, sel, chunk.offset, local_start, local_count, dst_start))
            {
                copySelection(chunk_data, layout.chunkdims, 0, local_start, sel.step, buffer, sel.count, dst_start, local_count, sel.ndims, typesize);
            }
        }
    }
}

/*----------------------------------------------------------------------------
 * readChunkIndex
 *
 *  version 1 b-tree of type 1 walked from an explicit work list; subtrees
 *  whose key range falls outside the selection are not visited
 *----------------------------------------------------------------------------*/
void H5DatasetReader::readChunkIndex (const H5Parser::Node& node, const selection_t& sel, std::vector<chunk_t>& chunks)
{
    static const int CHUNK_NODE_TYPE = 1;

    const H5Parser::layout_info_t& layout = node.layout;
    const int offsetsize = parser->getSuperblock().offsetsize;
    const int ndims = layout.ndims;

    if(sel.elements == 0) return;

    /* Linear Bounds of Selection */
    uint64_t first_offset[H5Cloud::MAX_NDIMS];
    uint64_t last_offset[H5Cloud::MAX_NDIMS];
    for(int d = 0; d < ndims; d++)
    {
        const uint64_t last_index = sel.start[d] + ((sel.count[d] - 1) * sel.step[d]);
        first_offset[d] = (sel.start[d] / layout.chunkdims[d]) * layout.chunkdims[d];
        last_offset[d] = (last_index / layout.chunkdims[d]) * layout.chunkdims[d];
    }
    const uint64_t sel_first = chunkLinearIndex(node, first_offset);
    const uint64_t sel_last = chunkLinearIndex(node, last_offset);

    H5Parser::Cursor cur(parser, control);
    std::vector<uint64_t> work = {layout.address};
    std::set<uint64_t> seen;
    int nodes_visited = 0;

    while(!work.empty())
    {
        uint64_t pos = work.back();
        work.pop_back();

        if(++nodes_visited > H5Parser::MAX_TREE_NODES)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk b-tree exceeds maximum number of nodes");
        }

        if(control.cancel) control.cancel->check();

        /* Node Header */
        const uint32_t signature = (uint32_t)cur.readField(4, &pos);
        if(signature != H5Parser::H5_TREE_SIGNATURE_LE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid b-tree signature: 0x%llX", (unsigned long long)signature);
        }

        const uint8_t node_type = (uint8_t)cur.readField(1, &pos);
        const uint8_t node_level = (uint8_t)cur.readField(1, &pos);
        const uint16_t entries_used = (uint16_t)cur.readField(2, &pos);
        if(node_type != CHUNK_NODE_TYPE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "only raw data chunk b-trees supported: %d", (int)node_type);
        }

        pos += 2 * offsetsize; // left and right siblings

        /* Keys and Children (one more key than children) */
        std::vector<chunk_t> keys(entries_used + 1);
        for(int e = 0; e <= entries_used; e++)
        {
            chunk_t& key = keys[e];
            key.size = (uint32_t)cur.readField(4, &pos);
            key.filter_mask = (uint32_t)cur.readField(4, &pos);
            for(int d = 0; d < ndims; d++)
            {
                key.offset[d] = cur.readField(8, &pos);
            }
            pos += 8; // element offset, always zero
            key.address = (e < entries_used) ? cur.readField(offsetsize, &pos) : 0;
        }

        if(node_level > 0)
        {
            for(int e = entries_used - 1; e >= 0; e--)
            {
                const uint64_t lo = chunkLinearIndex(node, keys[e].offset);
                const uint64_t hi = chunkLinearIndex(node, keys[e + 1].offset);
                if(lo <= sel_last && hi >= sel_first)
                {
                    work.push_back(keys[e].address);
                }
            }
        }
        else
        {
            for(int e = 0; e < entries_used; e++)
            {
                const chunk_t& chunk = keys[e];

                for(int d = 0; d < ndims; d++)
                {
                    if((chunk.offset[d] % layout.chunkdims[d]) != 0 || chunk.offset[d] >= sel.dims[d])
                    {
                        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk key offset %lu in dimension %d outside dataset extent %lu",
                                               (unsigned long)chunk.offset[d], d, (unsigned long)sel.dims[d]);
                    }
                }

                if(!seen.insert(chunkLinearIndex(node, chunk.offset)).second)
                {
                    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "duplicate chunk at address 0x%lx", (unsigned long)chunk.address);
                }

                int64_t local_start[H5Cloud::MAX_NDIMS];
                int64_t local_count[H5Cloud::MAX_NDIMS];
                int64_t dst_start[H5Cloud::MAX_NDIMS];
                if(chunkSelection(node, sel, chunk.offset, local_start, local_count, dst_start))
                {
                    chunks.push_back(chunk);
                }
            }
        }
    }
}

/*----------------------------------------------------------------------------
 * decodeChunk
 *
 *  filters are undone in reverse order of the pipeline; a set bit in the
 *  chunk's filter mask means that filter was not applied
 *----------------------------------------------------------------------------*/
const uint8_t* H5DatasetReader::decodeChunk (const H5Parser::Node& node, const chunk_t& chunk, const uint8_t* data, int64_t size, std::vector<uint8_t>& scratch)
{
    const int typesize = node.datatype.size;

    uint64_t chunk_bytes = typesize;
    for(int d = 0; d < node.layout.ndims; d++)
    {
        chunk_bytes *= node.layout.chunkdims[d];
    }

    const uint8_t* input = data;
    int64_t input_size = size;

    for(int f = (int)node.filters.size() - 1; f >= 0; f--)
    {
        if(chunk.filter_mask & (1 << f)) continue;

        std::vector<uint8_t> output;
        switch(node.filters[f].id)
        {
            case H5Parser::DEFLATE_FILTER:
            {
                output.resize(chunk_bytes);
                inflateChunk(input, input_size, output.data(), chunk_bytes);
                break;
            }

            case H5Parser::SHUFFLE_FILTER:
            {
                output.resize(input_size);
                shuffleChunk(input, input_size, output.data(), typesize);
                break;
            }

            default:
            {
                throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FILTER, "filter %d (%s) is not supported",
                                       (int)node.filters[f].id, H5Parser::filter2str(node.filters[f].id));
            }
        }

        scratch.swap(output);
        input = scratch.data();
        input_size = scratch.size();
    }

    if((uint64_t)input_size != chunk_bytes)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk at 0x%lx decoded to %ld bytes, expected %lu",
                               (unsigned long)chunk.address, (long)input_size, (unsigned long)chunk_bytes);
    }

    return input;
}

/*----------------------------------------------------------------------------
 * chunkSelection
 *
 *  intersection of the selection with the chunk at offset, expressed as a
 *  start and count within the chunk and a start within the output
 *----------------------------------------------------------------------------*/
bool H5DatasetReader::chunkSelection (const H5Parser::Node& node, const selection_t& sel, const uint64_t* offset,
                                      int64_t* local_start, int64_t* local_count, int64_t* dst_start)
{
    for(int d = 0; d < sel.ndims; d++)
    {
        const int64_t c0 = offset[d];
        const int64_t c1 = MIN(c0 + (int64_t)node.layout.chunkdims[d], (int64_t)sel.dims[d]);
        const int64_t start = sel.start[d];
        const int64_t step = sel.step[d];
        const int64_t last = start + ((sel.count[d] - 1) * step);

        if(c1 <= start || c0 > last) return false;

        const int64_t kf = (c0 <= start) ? 0 : ((c0 - start + step - 1) / step);
        const int64_t kl = MIN(sel.count[d] - 1, (c1 - 1 - start) / step);
        if(kf > kl) return false;

        local_start[d] = start + (kf * step) - c0;
        local_count[d] = kl - kf + 1;
        dst_start[d] = kf;
    }

    return true;
}

/*----------------------------------------------------------------------------
 * chunkLinearIndex - row major position of the chunk holding offset
 *----------------------------------------------------------------------------*/
uint64_t H5DatasetReader::chunkLinearIndex (const H5Parser::Node& node, const uint64_t* offset)
{
    uint64_t index = 0;
    for(int d = 0; d < node.layout.ndims; d++)
    {
        const uint64_t chunkdim = node.layout.chunkdims[d];
        const uint64_t num_chunks = (node.dataspace.dims[d] + chunkdim - 1) / chunkdim;
        index = (index * num_chunks) + (offset[d] / chunkdim);
    }
    return index;
}

/*----------------------------------------------------------------------------
 * copySelection
 *
 *  copies count elements per dimension from src (taking every src_step'th
 *  element from src_start) to dst (densely from dst_start); src_origin is
 *  the flat index of the first element held in src
 *----------------------------------------------------------------------------*/
void H5DatasetReader::copySelection (const uint8_t* src, const uint64_t* src_dims, int64_t src_origin, const int64_t* src_start, const int64_t* src_step,
                                     uint8_t* dst, const int64_t* dst_dims, const int64_t* dst_start,
                                     const int64_t* count, int ndims, int typesize)
{
    /* Scalar */
    if(ndims == 0)
    {
        memcpy(dst, src, typesize);
        return;
    }

    for(int d = 0; d < ndims; d++)
    {
        if(count[d] <= 0) return;
    }

    /* Strides */
    int64_t src_stride[H5Cloud::MAX_NDIMS];
    int64_t dst_stride[H5Cloud::MAX_NDIMS];
    src_stride[ndims - 1] = 1;
    dst_stride[ndims - 1] = 1;
    for(int d = ndims - 2; d >= 0; d--)
    {
        src_stride[d] = src_stride[d + 1] * (int64_t)src_dims[d + 1];
        dst_stride[d] = dst_stride[d + 1] * dst_dims[d + 1];
    }

    /* Copy Rows */
    const int last = ndims - 1;
    const bool contiguous_rows = (src_step[last] == 1);
    int64_t index[H5Cloud::MAX_NDIMS] = {0};
    while(true)
    {
        int64_t src_index = src_start[last] - src_origin;
        int64_t dst_index = dst_start[last];
        for(int d = 0; d < last; d++)
        {
            src_index += (src_start[d] + (index[d] * src_step[d])) * src_stride[d];
            dst_index += (dst_start[d] + index[d]) * dst_stride[d];
        }

        if(contiguous_rows)
        {
            memcpy(&dst[dst_index * typesize], &src[src_index * typesize], count[last] * typesize);
        }
        else
        {
            for(int64_t k = 0; k < count[last]; k++)
            {
                memcpy(&dst[(dst_index + k) * typesize], &src[(src_index + (k * src_step[last])) * typesize], typesize);
            }
        }

        /* Next Row */
        int d = last - 1;
        while(d >= 0)
        {
            if(++index[d] < count[d]) break;
            index[d] = 0;
            d--;
        }
        if(d < 0) break;
    }
}

/*----------------------------------------------------------------------------
 * fillBuffer
 *----------------------------------------------------------------------------*/
void H5DatasetReader::fillBuffer (const H5Parser::Node& node, uint8_t* buffer, uint64_t datasize)
{
    const uint32_t typesize = node.datatype.size;
    if(node.hasFill && node.fillvalue.size() == typesize)
    {
        for(uint64_t i = 0; i < datasize; i += typesize)
        {
            memcpy(&buffer[i], node.fillvalue.data(), typesize);
        }
    }
    else
    {
        memset(buffer, 0, datasize);
    }
}

/*----------------------------------------------------------------------------
 * swapBuffer
 *----------------------------------------------------------------------------*/
void H5DatasetReader::swapBuffer (uint8_t* buffer, uint64_t elements, int typesize)
{
    switch(typesize)
    {
        case 2:
        {
            uint16_t* values = reinterpret_cast<uint16_t*>(buffer);
            for(uint64_t i = 0; i < elements; i++) values[i] = OsApi::swaps(values[i]);
            break;
        }

        case 4:
        {
            uint32_t* values = reinterpret_cast<uint32_t*>(buffer);
            for(uint64_t i = 0; i < elements; i++) values[i] = OsApi::swapl(values[i]);
            break;
        }

        case 8:
        {
            uint64_t* values = reinterpret_cast<uint64_t*>(buffer);
            for(uint64_t i = 0; i < elements; i++) values[i] = OsApi::swapll(values[i]);
            break;
        }

        default:
        {
            break; // single byte elements
        }
    }
}

/*----------------------------------------------------------------------------
 * translate
 *----------------------------------------------------------------------------*/
void H5DatasetReader::translate (H5Cloud::info_t& info, H5Cloud::valtype_t valtype)
{
    if(valtype == H5Cloud::RAW) return;

    const H5Cloud::datatype_t target = (valtype == H5Cloud::INTEGER) ? H5Cloud::INT64 : H5Cloud::DOUBLE;
    if(info.datatype == target) return;

    if(info.datatype == H5Cloud::STRING || info.datatype == H5Cloud::INVALID_TYPE)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "cannot translate %s data to %s", H5Cloud::type2str(info.datatype), H5Cloud::type2str(target));
    }

    uint8_t* output = NULL;
    if(info.elements > 0)
    {
        output = new uint8_t[info.elements * sizeof(int64_t)];
        try
        {
            if(target == H5Cloud::INT64)    castData(info, reinterpret_cast<int64_t*>(output));
            else                            castData(info, reinterpret_cast<double*>(output));
        }
        catch(const RunTimeException&)
        {
            delete [] output;
            throw;
        }
    }

    delete [] info.data;
    info.data = output;
    info.datatype = target;
    info.typesize = sizeof(int64_t);
    info.datasize = info.elements * sizeof(int64_t);
}

/*----------------------------------------------------------------------------
 * inflateChunk
 *----------------------------------------------------------------------------*/
void H5DatasetReader::inflateChunk (const uint8_t* input, uint32_t input_size, uint8_t* output, uint32_t output_size)
{
    int status;
    z_stream strm;

    /* Initialize z_stream State */
    strm.zalloc     = Z_NULL;
    strm.zfree      = Z_NULL;
    strm.opaque     = Z_NULL;
    strm.avail_in   = 0;
    strm.next_in    = Z_NULL;

    /* Initialize z_stream */
    status = inflateInit(&strm);
    if(status != Z_OK)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "failed to initialize z_stream: %d", status);
    }

    /* Decompress Entire Chunk */
    strm.avail_in = input_size;
    strm.next_in = const_cast<Bytef*>(input);
    strm.avail_out = output_size;
    strm.next_out = output;
    status = inflate(&strm, Z_FINISH);
    const uint64_t total_out = strm.total_out;

    /* Clean Up z_stream */
    inflateEnd(&strm);

    /* Check Decompression Complete */
    if(status != Z_STREAM_END)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "failed to inflate entire z_stream: %d", status);
    }

    if(total_out != output_size)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "inflated %lu bytes, expected %u", (unsigned long)total_out, output_size);
    }
}

/*----------------------------------------------------------------------------
 * shuffleChunk
 *
 *  byte b of element e is stored at b * num_elements + e; trailing bytes
 *  that do not form a whole element are left in place
 *----------------------------------------------------------------------------*/
void H5DatasetReader::shuffleChunk (const uint8_t* input, uint32_t input_size, uint8_t* output, int type_size)
{
    if(type_size <= 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid data size to perform shuffle on: %d", type_size);
    }

    const int64_t num_elements = input_size / type_size;
    for(int64_t element_index = 0; element_index < num_elements; element_index++)
    {
        for(int64_t val_index = 0; val_index < type_size; val_index++)
        {
            output[(element_index * type_size) + val_index] = input[(val_index * num_elements) + element_index];
        }
    }

    const int64_t shuffled_size = num_elements * type_size;
    memcpy(&output[shuffled_size], &input[shuffled_size], input_size - shuffled_size);
}
