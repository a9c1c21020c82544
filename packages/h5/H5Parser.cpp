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

#include "H5Parser.h"
#include "EventLib.h"
#include "StringLib.h"
#include "OsApi.h"

#include <string.h>

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static inline uint64_t pad8 (uint64_t size)
{
    return (size + 7) & ~(uint64_t)7;
}

/******************************************************************************
 * NODE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Parser::Node::Node (uint64_t _address):
    address(_address),
    version(0),
    hasDataspace(false),
    hasDatatype(false),
    hasLayout(false),
    hasFill(false),
    hasLinks(false)
{
    memset(&dataspace, 0, sizeof(dataspace));
    memset(&datatype, 0, sizeof(datatype));
    memset(&layout, 0, sizeof(layout));
    datatype.typeclass = UNKNOWN_TYPE;
    layout.type = UNKNOWN_LAYOUT;
}

/*----------------------------------------------------------------------------
 * isDataset
 *----------------------------------------------------------------------------*/
bool H5Parser::Node::isDataset (void) const
{
    return hasDataspace && hasDatatype && hasLayout;
}

/*----------------------------------------------------------------------------
 * isGroup
 *----------------------------------------------------------------------------*/
bool H5Parser::Node::isGroup (void) const
{
    return hasLinks;
}

/*----------------------------------------------------------------------------
 * findLink - first occurrence of a name wins
 *----------------------------------------------------------------------------*/
const H5Parser::link_t* H5Parser::Node::findLink (const char* name) const
{
    for(const link_t& link: links)
    {
        if(link.name == name) return &link;
    }
    return NULL;
}

/*----------------------------------------------------------------------------
 * findAttribute - first occurrence of a name wins
 *----------------------------------------------------------------------------*/
const H5Parser::attribute_t* H5Parser::Node::findAttribute (const char* name) const
{
    for(const attribute_t& attribute: attributes)
    {
        if(attribute.name == name) return &attribute;
    }
    return NULL;
}

/******************************************************************************
 * CURSOR METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Parser::Cursor::Cursor (H5Parser* _parser, const H5RangeFetcher::control_t& _control):
    parser(_parser),
    control(_control)
{
}

/*----------------------------------------------------------------------------
 * readField
 *----------------------------------------------------------------------------*/
uint64_t H5Parser::Cursor::readField (int64_t size, uint64_t* pos)
{
    assert(pos);

    if(size <= 0 || size > 8)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid field size: %ld", (long)size);
    }

    /* Little Endian Field */
    const uint8_t* field = access(*pos, size);
    uint64_t value = 0;
    for(int64_t i = size - 1; i >= 0; i--)
    {
        value = (value << 8) | field[i];
    }

    *pos += size;
    return value;
}

/*----------------------------------------------------------------------------
 * readByteArray
 *----------------------------------------------------------------------------*/
void H5Parser::Cursor::readByteArray (uint8_t* data, int64_t size, uint64_t* pos)
{
    assert(pos);

    if(size > 0)
    {
        assert(data);
        memcpy(data, access(*pos, size), size);
        *pos += size;
    }
}

/*----------------------------------------------------------------------------
 * readString - null terminated
 *----------------------------------------------------------------------------*/
std::string H5Parser::Cursor::readString (uint64_t* pos, int64_t max_size)
{
    std::string str;
    for(int64_t i = 0; i < max_size; i++)
    {
        const char c = (char)readField(1, pos);
        if(c == '\0') return str;
        str += c;
    }

    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unterminated string exceeds %ld bytes at 0x%lx", (long)max_size, (unsigned long)*pos);
}

/*----------------------------------------------------------------------------
 * getControl
 *----------------------------------------------------------------------------*/
const H5RangeFetcher::control_t& H5Parser::Cursor::getControl (void) const
{
    return control;
}

/*----------------------------------------------------------------------------
 * access
 *
 *  small structural reads pull in the surrounding read ahead block so
 *  neighboring fields are served from the same cache entry
 *----------------------------------------------------------------------------*/
const uint8_t* H5Parser::Cursor::access (uint64_t pos, int64_t size)
{
    const uint64_t object_size = parser->getObjectSize();
    if(pos > object_size || (uint64_t)size > (object_size - pos))
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "structural read of %ld bytes at 0x%lx runs past end of object (%lu bytes)",
                               (long)size, (unsigned long)pos, (unsigned long)object_size);
    }

    if(!block.contains(pos, size))
    {
        block = parser->cache->find(pos, size);
        if(!block.valid())
        {
            const uint64_t start = pos - (pos % parser->readAheadSize);
            uint64_t end = MAX(start + parser->readAheadSize, pos + size);
            end = MIN(end, object_size);
            block = parser->fetchRange(start, end - start, control);
        }
    }

    return block.data() + (pos - block.offset());
}

/******************************************************************************
 * PARSER METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Parser::H5Parser (H5RangeFetcher* _fetcher, H5ChunkCache* _cache, int64_t _read_ahead):
    fetcher(_fetcher),
    cache(_cache),
    readAheadSize(_read_ahead > 0 ? _read_ahead : DEFAULT_READ_AHEAD_SIZE)
{
    superblock.version = -1;
    superblock.offsetsize = 8;
    superblock.lengthsize = 8;
    superblock.root = 0;
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5Parser::~H5Parser (void)
{
}

/*----------------------------------------------------------------------------
 * readSuperblock
 *----------------------------------------------------------------------------*/
void H5Parser::readSuperblock (const H5RangeFetcher::control_t& control)
{
    Cursor cur(this, control);
    uint64_t pos = 0;

    /* Signature and Version */
    const uint64_t signature = cur.readField(8, &pos);
    if(signature != H5_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid h5 file signature: 0x%llX", (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    uint64_t base_addr = 0;
    superblock.version = version;

    if(version == 0 || version == 1)
    {
        pos = 13;
        superblock.offsetsize = (int)cur.readField(1, &pos);
        superblock.lengthsize = (int)cur.readField(1, &pos);

        /* Version 1 adds indexed storage internal node K */
        pos = (version == 0) ? 24 : 28;
        base_addr = cur.readField(superblock.offsetsize, &pos);

        /* Skip Free Space, End of File, Driver Info, and Link Name Offset */
        pos += 4 * superblock.offsetsize;
        superblock.root = cur.readField(superblock.offsetsize, &pos);
    }
    else if(version == 2 || version == 3)
    {
        pos = 9;
        superblock.offsetsize = (int)cur.readField(1, &pos);
        superblock.lengthsize = (int)cur.readField(1, &pos);
        pos += 1; // file consistency flags
        base_addr = cur.readField(superblock.offsetsize, &pos);

        /* Skip Superblock Extension and End of File */
        pos += 2 * superblock.offsetsize;
        superblock.root = cur.readField(superblock.offsetsize, &pos);
    }
    else
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unsupported superblock version: %d", (int)version);
    }

    if(H5CLOUD_ERROR_CHECKING)
    {
        if(superblock.offsetsize != 2 && superblock.offsetsize != 4 && superblock.offsetsize != 8)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid size of offsets: %d", superblock.offsetsize);
        }

        if(superblock.lengthsize != 2 && superblock.lengthsize != 4 && superblock.lengthsize != 8)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid size of lengths: %d", superblock.lengthsize);
        }

        if(base_addr != 0)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unsupported base address: 0x%lx", (unsigned long)base_addr);
        }
    }

    if(H5CLOUD_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("File Information\n");
        print2term("----------------\n");
        print2term("Superblock Version:                                              %d\n", superblock.version);
        print2term("Size of Offsets:                                                 %d\n", superblock.offsetsize);
        print2term("Size of Lengths:                                                 %d\n", superblock.lengthsize);
        print2term("Root Object Header Address:                                      0x%lX\n", (unsigned long)superblock.root);
    }
}

/*----------------------------------------------------------------------------
 * getSuperblock
 *----------------------------------------------------------------------------*/
const H5Parser::superblock_t& H5Parser::getSuperblock (void) const
{
    return superblock;
}

/*----------------------------------------------------------------------------
 * getNode
 *
 *  object headers are parsed once per session and shared read-only
 *----------------------------------------------------------------------------*/
H5Parser::node_ptr_t H5Parser::getNode (uint64_t address, const H5RangeFetcher::control_t& control)
{
    /* Check Memo */
    nodeMut.lock();
    {
        auto iter = nodes.find(address);
        if(iter != nodes.end())
        {
            node_ptr_t found = iter->second;
            nodeMut.unlock();
            return found;
        }
    }
    nodeMut.unlock();

    /* Parse Object Header */
    std::shared_ptr<Node> node = std::make_shared<Node>(address);
    try
    {
        Cursor cur(this, control);
        readObjHdr(cur, address, *node);
    }
    catch(const RunTimeException& e)
    {
        throw RunTimeException(e.level(), e.code(), "object header 0x%lx: %s", (unsigned long)address, e.what());
    }

    /* Publish - first parse wins */
    node_ptr_t published;
    nodeMut.lock();
    {
        auto result = nodes.emplace(address, node);
        published = result.first->second;
    }
    nodeMut.unlock();

    return published;
}

/*----------------------------------------------------------------------------
 * resolve
 *
 *  walks one path component at a time from the root group
 *----------------------------------------------------------------------------*/
H5Parser::node_ptr_t H5Parser::resolve (const char* path, const H5RangeFetcher::control_t& control)
{
    if(path == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "null path");
    }

    node_ptr_t node = getNode(superblock.root, control);
    std::string resolved;

    const StringLib::TokenList components = StringLib::split(path, StringLib::size(path, H5CLOUD_MAXIMUM_NAME_SIZE), '/', true);
    for(const std::string& component: components)
    {
        if(component == ".") continue;

        if(!node->isGroup())
        {
            throw RunTimeException(CRITICAL, RTE_PATH_NOT_FOUND, "%s is not a group while resolving %s", resolved.empty() ? "/" : resolved.c_str(), path);
        }

        const link_t* link = node->findLink(component.c_str());
        resolved += "/" + component;
        if(link == NULL)
        {
            throw RunTimeException(CRITICAL, RTE_PATH_NOT_FOUND, "%s not found", resolved.c_str());
        }

        if(link->type == SOFT_LINK)
        {
            throw RunTimeException(CRITICAL, RTE_PATH_NOT_FOUND, "%s is a soft link to %s and is not followed", resolved.c_str(), link->target.c_str());
        }
        else if(link->type == EXTERNAL_LINK)
        {
            throw RunTimeException(CRITICAL, RTE_PATH_NOT_FOUND, "%s is an external link to %s and is not followed", resolved.c_str(), link->target.c_str());
        }

        node = getNode(link->address, control);
    }

    return node;
}

/*----------------------------------------------------------------------------
 * clear
 *----------------------------------------------------------------------------*/
void H5Parser::clear (void)
{
    nodeMut.lock();
    {
        nodes.clear();
    }
    nodeMut.unlock();
}

/*----------------------------------------------------------------------------
 * fetchRange
 *----------------------------------------------------------------------------*/
H5ChunkCache::Ref H5Parser::fetchRange (uint64_t offset, int64_t length, const H5RangeFetcher::control_t& control)
{
    return cache->getOrFetch(offset, length, [this, &control](const std::vector<H5RangeFetcher::range_t>& ranges, std::vector<H5RangeFetcher::bytes_t>& results) {
        fetcher->fetchMany(ranges, results, control);
    });
}

/*----------------------------------------------------------------------------
 * fetchRanges
 *----------------------------------------------------------------------------*/
std::vector<H5ChunkCache::Ref> H5Parser::fetchRanges (const std::vector<H5RangeFetcher::range_t>& ranges, const H5RangeFetcher::control_t& control)
{
    return cache->getOrFetchMany(ranges, [this, &control](const std::vector<H5RangeFetcher::range_t>& missing, std::vector<H5RangeFetcher::bytes_t>& results) {
        fetcher->fetchMany(missing, results, control);
    });
}

/*----------------------------------------------------------------------------
 * getObjectSize
 *----------------------------------------------------------------------------*/
uint64_t H5Parser::getObjectSize (void) const
{
    return fetcher->getObject()->getSize();
}

/*----------------------------------------------------------------------------
 * class2str
 *----------------------------------------------------------------------------*/
const char* H5Parser::class2str (data_class_t typeclass)
{
    switch(typeclass)
    {
        case FIXED_POINT_TYPE:      return "FIXED_POINT_TYPE";
        case FLOATING_POINT_TYPE:   return "FLOATING_POINT_TYPE";
        case TIME_TYPE:             return "TIME_TYPE";
        case STRING_TYPE:           return "STRING_TYPE";
        case BIT_FIELD_TYPE:        return "BIT_FIELD_TYPE";
        case OPAQUE_TYPE:           return "OPAQUE_TYPE";
        case COMPOUND_TYPE:         return "COMPOUND_TYPE";
        case REFERENCE_TYPE:        return "REFERENCE_TYPE";
        case ENUMERATED_TYPE:       return "ENUMERATED_TYPE";
        case VARIABLE_LENGTH_TYPE:  return "VARIABLE_LENGTH_TYPE";
        case ARRAY_TYPE:            return "ARRAY_TYPE";
        default:                    return "UNKNOWN_TYPE";
    }
}

/*----------------------------------------------------------------------------
 * layout2str
 *----------------------------------------------------------------------------*/
const char* H5Parser::layout2str (layout_t layout)
{
    switch(layout)
    {
        case COMPACT_LAYOUT:    return "COMPACT_LAYOUT";
        case CONTIGUOUS_LAYOUT: return "CONTIGUOUS_LAYOUT";
        case CHUNKED_LAYOUT:    return "CHUNKED_LAYOUT";
        default:                return "UNKNOWN_LAYOUT";
    }
}

/*----------------------------------------------------------------------------
 * filter2str
 *----------------------------------------------------------------------------*/
const char* H5Parser::filter2str (int filter)
{
    switch(filter)
    {
        case DEFLATE_FILTER:        return "deflate";
        case SHUFFLE_FILTER:        return "shuffle";
        case FLETCHER32_FILTER:     return "fletcher32";
        case SZIP_FILTER:           return "szip";
        case NBIT_FILTER:           return "nbit";
        case SCALEOFFSET_FILTER:    return "scaleoffset";
        default:                    return "unknown";
    }
}

/*----------------------------------------------------------------------------
 * readObjHdr
 *
 *  header blocks (the first chunk and every continuation) are processed
 *  from a work list that continuation messages append to
 *----------------------------------------------------------------------------*/
void H5Parser::readObjHdr (Cursor& cur, uint64_t pos, Node& node)
{
    static const int SIZE_OF_CHUNK_0_MASK   = 0x03;
    static const int STORE_CHANGE_PHASE_BIT = 0x10;
    static const int FILE_STATS_BIT         = 0x20;

    const uint64_t starting_position = pos;
    std::vector<block_t> blocks;
    uint8_t hdr_flags = 0;

    /* Peek at Signature */
    uint64_t peek_pos = pos;
    const uint64_t signature = cur.readField(4, &peek_pos);
    if(signature == H5_OHDR_SIGNATURE_LE)
    {
        pos = peek_pos;
        const uint8_t version = (uint8_t)cur.readField(1, &pos);
        if(version != 2)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid object header version: %d", (int)version);
        }

        hdr_flags = (uint8_t)cur.readField(1, &pos);
        if(hdr_flags & FILE_STATS_BIT)
        {
            pos += 16; // access, modification, change, and birth times
        }

        if(hdr_flags & STORE_CHANGE_PHASE_BIT)
        {
            pos += 4; // max compact and min dense attributes
        }

        const int size_of_chunk0 = 1 << (hdr_flags & SIZE_OF_CHUNK_0_MASK);
        const uint64_t chunk0_size = cur.readField(size_of_chunk0, &pos);
        blocks.push_back({pos, pos + chunk0_size});
        node.version = 2;
    }
    else
    {
        const uint8_t version = (uint8_t)cur.readField(1, &pos);
        if(version != 1)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid object header: signature 0x%08lX, version %d", (unsigned long)signature, (int)version);
        }

        pos += 1; // reserved
        const uint16_t num_msgs = (uint16_t)cur.readField(2, &pos);
        pos += 4; // object reference count
        const uint32_t hdr_size = (uint32_t)cur.readField(4, &pos);
        pos += 4; // align messages to 8 bytes
        (void)num_msgs;

        blocks.push_back({pos, pos + hdr_size});
        node.version = 1;
    }

    if(H5CLOUD_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Object Header: 0x%lx\n", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Version:                                                         %d\n", node.version);
        print2term("Flags:                                                           0x%x\n", (int)hdr_flags);
    }

    /* Process Header Blocks */
    for(size_t b = 0; b < blocks.size(); b++)
    {
        if(blocks.size() > (size_t)MAX_CONTINUATIONS)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "too many header continuation blocks: %ld", (long)blocks.size());
        }

        const block_t block = blocks[b];
        if(node.version == 1)   readMessagesV1(cur, block.pos, block.end, node, blocks);
        else                    readMessages(cur, block.pos, block.end, hdr_flags, node, blocks);
    }
}

/*----------------------------------------------------------------------------
 * readMessages
 *----------------------------------------------------------------------------*/
void H5Parser::readMessages (Cursor& cur, uint64_t pos, uint64_t end, uint8_t hdr_flags, Node& node, std::vector<block_t>& blocks)
{
    static const int ATTR_CREATION_TRACK_BIT = 0x04;

    const uint64_t prefix_size = (hdr_flags & ATTR_CREATION_TRACK_BIT) ? 6 : 4;

    while((pos + prefix_size) <= end)
    {
        const msg_type_t msg_type   = (msg_type_t)cur.readField(1, &pos);
        const uint64_t msg_size     = cur.readField(2, &pos);
        const uint8_t msg_flags     = (uint8_t)cur.readField(1, &pos);
        if(hdr_flags & ATTR_CREATION_TRACK_BIT)
        {
            pos += 2; // creation order
        }

        if(pos + msg_size > end)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "message 0x%x of %lu bytes at 0x%lx runs past end of header block at 0x%lx",
                                   (int)msg_type, (unsigned long)msg_size, (unsigned long)pos, (unsigned long)end);
        }

        readMessage(cur, msg_type, msg_size, pos, msg_flags, node, blocks);
        pos += msg_size;
    }
}

/*----------------------------------------------------------------------------
 * readMessagesV1
 *----------------------------------------------------------------------------*/
void H5Parser::readMessagesV1 (Cursor& cur, uint64_t pos, uint64_t end, Node& node, std::vector<block_t>& blocks)
{
    static const uint64_t PREFIX_SIZE = 8;

    while((pos + PREFIX_SIZE) <= end)
    {
        const msg_type_t msg_type   = (msg_type_t)cur.readField(2, &pos);
        const uint64_t msg_size     = cur.readField(2, &pos);
        const uint8_t msg_flags     = (uint8_t)cur.readField(1, &pos);
        pos += 3; // reserved

        if(pos + msg_size > end)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "message 0x%x of %lu bytes at 0x%lx runs past end of header block at 0x%lx",
                                   (int)msg_type, (unsigned long)msg_size, (unsigned long)pos, (unsigned long)end);
        }

        readMessage(cur, msg_type, msg_size, pos, msg_flags, node, blocks);
        pos += msg_size;
    }
}

/*----------------------------------------------------------------------------
 * readMessage
 *
 *  unknown message types are skipped using their declared size
 *----------------------------------------------------------------------------*/
int H5Parser::readMessage (Cursor& cur, msg_type_t msg_type, uint64_t size, uint64_t pos, uint8_t msg_flags, Node& node, std::vector<block_t>& blocks)
{
    static const int SHARED_MSG_BIT = 0x02;

    /* Shared Messages Are Not Decoded */
    if(msg_flags & SHARED_MSG_BIT)
    {
        if(msg_type == DATATYPE_MSG)
        {
            node.hasDatatype = true;
            node.datatype.shared = true;
        }
        mlog(DEBUG, "Skipping shared message 0x%x at 0x%lx", (int)msg_type, (unsigned long)pos);
        return size;
    }

    int bytes_read = 0;
    switch(msg_type)
    {
        case DATASPACE_MSG:
            bytes_read = readDataspaceMsg(cur, pos, node.dataspace);
            node.hasDataspace = true;
            break;

        case LINK_INFO_MSG:         bytes_read = readLinkInfoMsg(cur, pos, node);               break;

        case DATATYPE_MSG:
            bytes_read = readDatatypeMsg(cur, pos, node.datatype);
            node.hasDatatype = true;
            break;

        case FILL_VALUE_MSG:        bytes_read = readFillValueMsg(cur, pos, node);              break;
        case LINK_MSG:              bytes_read = readLinkMsg(cur, pos, node);                   break;
        case DATA_LAYOUT_MSG:       bytes_read = readDataLayoutMsg(cur, pos, node);             break;
        case FILTER_MSG:            bytes_read = readFilterMsg(cur, pos, node);                 break;
        case ATTRIBUTE_MSG:         bytes_read = readAttributeMsg(cur, pos, node);              break;
        case ATTRIBUTE_INFO_MSG:    bytes_read = readAttributeInfoMsg(cur, pos, node);          break;
        case HEADER_CONT_MSG:       bytes_read = readHeaderContMsg(cur, pos, node, blocks);     break;
        case SYMBOL_TABLE_MSG:      bytes_read = readSymbolTableMsg(cur, pos, node);            break;

        default:
        {
            if(H5CLOUD_VERBOSE)
            {
                print2term("Skipped Message [0x%x]: 0x%lx, 0x%lx\n", (int)msg_type, (unsigned long)size, (unsigned long)pos);
            }
            bytes_read = size;
            break;
        }
    }

    if((uint64_t)bytes_read > size)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "message 0x%x at 0x%lx decoded %d bytes but declared %lu",
                               (int)msg_type, (unsigned long)pos, bytes_read, (unsigned long)size);
    }

    return bytes_read;
}

/*----------------------------------------------------------------------------
 * readDataspaceMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readDataspaceMsg (Cursor& cur, uint64_t pos, dspace_t& dspace)
{
    static const int MAX_DIM_PRESENT    = 0x1;
    static const int PERM_INDEX_PRESENT = 0x2;
    static const int NULL_DATASPACE     = 2;

    const uint64_t starting_position = pos;

    const uint8_t version         = (uint8_t)cur.readField(1, &pos);
    const uint8_t dimensionality  = (uint8_t)cur.readField(1, &pos);
    const uint8_t flags           = (uint8_t)cur.readField(1, &pos);

    dspace.null = false;
    if(version == 1)
    {
        pos += 5; // reserved
    }
    else if(version == 2)
    {
        const uint8_t space_type = (uint8_t)cur.readField(1, &pos);
        dspace.null = (space_type == NULL_DATASPACE);
    }
    else
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid dataspace version: %d", (int)version);
    }

    if(flags & PERM_INDEX_PRESENT)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unsupported permutation indexes");
    }

    if(dimensionality > H5Cloud::MAX_NDIMS)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unsupported number of dimensions: %d", dimensionality);
    }

    /* Read Dimensions */
    dspace.ndims = dimensionality;
    for(int d = 0; d < dspace.ndims; d++)
    {
        dspace.dims[d] = cur.readField(superblock.lengthsize, &pos);
    }

    /* Skip Over Maximum Dimensions */
    if(flags & MAX_DIM_PRESENT)
    {
        pos += dimensionality * superblock.lengthsize;
    }

    if(H5CLOUD_VERBOSE)
    {
        print2term("Dataspace Message: 0x%lx, version %d, %d dimensions\n", (unsigned long)starting_position, (int)version, dspace.ndims);
    }

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readLinkInfoMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readLinkInfoMsg (Cursor& cur, uint64_t pos, Node& node)
{
    static const int MAX_CREATE_PRESENT_BIT     = 0x01;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x02;

    const uint64_t starting_position = pos;

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    const uint8_t flags = (uint8_t)cur.readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid link info version: %d", (int)version);
    }

    if(flags & MAX_CREATE_PRESENT_BIT)
    {
        pos += 8; // maximum creation index
    }

    const uint64_t heap_address = cur.readField(superblock.offsetsize, &pos);
    const uint64_t name_index = cur.readField(superblock.offsetsize, &pos);
    (void)name_index;

    if(flags & CREATE_ORDER_PRESENT_BIT)
    {
        pos += superblock.offsetsize; // creation order index
    }

    node.hasLinks = true;

    /* Dense Link Storage */
    if(!isUndefined(heap_address))
    {
        const uint64_t ending_position = pos;
        readFractalHeap(cur, LINK_MSG, heap_address, node);
        return ending_position - starting_position;
    }

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readDatatypeMsg
 *
 *  properties are decoded for the classes that can be read; the remaining
 *  classes are recorded so they can still be listed
 *----------------------------------------------------------------------------*/
int H5Parser::readDatatypeMsg (Cursor& cur, uint64_t pos, dtype_t& dtype)
{
    static const int BYTE_ORDER_BIT = 0x01;
    static const int SIGNED_BIT     = 0x08;

    const uint64_t starting_position = pos;

    const uint64_t version_class = cur.readField(4, &pos);
    const uint32_t size = (uint32_t)cur.readField(4, &pos);
    const int version = (int)((version_class & 0xF0) >> 4);
    const int typeclass = (int)(version_class & 0x0F);
    const uint64_t databits = version_class >> 8;

    if(version < 1 || version > 4)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid datatype version: %d", version);
    }

    dtype.typeclass = (typeclass <= ARRAY_TYPE) ? (data_class_t)typeclass : UNKNOWN_TYPE;
    dtype.size = size;
    dtype.signedval = false;
    dtype.bigendian = false;
    dtype.shared = false;

    switch(dtype.typeclass)
    {
        case FIXED_POINT_TYPE:
        {
            dtype.bigendian = (databits & BYTE_ORDER_BIT) != 0;
            dtype.signedval = (databits & SIGNED_BIT) != 0;
            pos += 4; // bit offset and bit precision
            break;
        }

        case FLOATING_POINT_TYPE:
        {
            dtype.bigendian = (databits & BYTE_ORDER_BIT) != 0;
            dtype.signedval = true;
            pos += 12; // bit offset, precision, exponent and mantissa locations, bias
            break;
        }

        case STRING_TYPE:
        {
            break; // padding and character set are in the class bits
        }

        default:
        {
            if(H5CLOUD_VERBOSE)
            {
                print2term("Datatype %s (%d bytes) not decoded at 0x%lx\n", class2str(dtype.typeclass), (int)size, (unsigned long)starting_position);
            }
            break;
        }
    }

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readFillValueMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readFillValueMsg (Cursor& cur, uint64_t pos, Node& node)
{
    static const int FILL_VALUE_DEFINED = 0x20;

    const uint64_t starting_position = pos;

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    bool value_present = false;

    if(version == 1 || version == 2)
    {
        pos += 2; // space allocation time and fill value write time
        const uint8_t fill_value_defined = (uint8_t)cur.readField(1, &pos);
        value_present = (version == 1) || (fill_value_defined != 0);
    }
    else if(version == 3)
    {
        const uint8_t flags = (uint8_t)cur.readField(1, &pos);
        value_present = (flags & FILL_VALUE_DEFINED) != 0;
    }
    else
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid fill value version: %d", (int)version);
    }

    if(value_present)
    {
        const uint32_t fill_size = (uint32_t)cur.readField(4, &pos);
        node.fillvalue.resize(fill_size);
        cur.readByteArray(node.fillvalue.data(), fill_size, &pos);
    }

    node.hasFill = !node.fillvalue.empty();

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readLinkMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readLinkMsg (Cursor& cur, uint64_t pos, Node& node)
{
    static const int SIZE_OF_LEN_OF_NAME_MASK   = 0x03;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x04;
    static const int LINK_TYPE_PRESENT_BIT      = 0x08;
    static const int CHAR_SET_PRESENT_BIT       = 0x10;

    const uint64_t starting_position = pos;

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    const uint8_t flags = (uint8_t)cur.readField(1, &pos);
    if(version != 1)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid link version: %d", (int)version);
    }

    link_t link;
    link.type = HARD_LINK;
    link.address = 0;

    if(flags & LINK_TYPE_PRESENT_BIT)
    {
        link.type = (link_type_t)cur.readField(1, &pos);
    }

    if(flags & CREATE_ORDER_PRESENT_BIT)
    {
        pos += 8; // creation order
    }

    if(flags & CHAR_SET_PRESENT_BIT)
    {
        pos += 1; // character set
    }

    /* Link Name */
    const int link_name_len_of_len = 1 << (flags & SIZE_OF_LEN_OF_NAME_MASK);
    const uint64_t link_name_len = cur.readField(link_name_len_of_len, &pos);
    if(link_name_len > H5CLOUD_MAXIMUM_NAME_SIZE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "link name length of %lu exceeds maximum allowed", (unsigned long)link_name_len);
    }

    std::vector<uint8_t> name_buf(link_name_len);
    cur.readByteArray(name_buf.data(), link_name_len, &pos);
    link.name.assign(name_buf.begin(), name_buf.end());

    /* Link Information */
    switch(link.type)
    {
        case HARD_LINK:
        {
            link.address = cur.readField(superblock.offsetsize, &pos);
            break;
        }

        case SOFT_LINK:
        {
            const uint16_t soft_link_len = (uint16_t)cur.readField(2, &pos);
            std::vector<uint8_t> target(soft_link_len);
            cur.readByteArray(target.data(), soft_link_len, &pos);
            link.target.assign(target.begin(), target.end());
            break;
        }

        case EXTERNAL_LINK:
        {
            /* Flags Byte, then File Name and Object Path */
            const uint16_t ext_link_len = (uint16_t)cur.readField(2, &pos);
            std::vector<uint8_t> target(ext_link_len);
            cur.readByteArray(target.data(), ext_link_len, &pos);
            if(ext_link_len > 1)
            {
                const std::string filename((const char*)&target[1], strnlen((const char*)&target[1], ext_link_len - 1));
                const size_t path_offset = 1 + filename.size() + 1;
                const std::string objpath = (path_offset < target.size()) ? std::string((const char*)&target[path_offset], target.size() - path_offset) : "";
                link.target = filename + ":" + objpath.c_str();
            }
            break;
        }

        default:
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid link type: %d", (int)link.type);
        }
    }

    if(H5CLOUD_VERBOSE)
    {
        print2term("Link %s [%d]: 0x%lx\n", link.name.c_str(), (int)link.type, (unsigned long)link.address);
    }

    node.links.push_back(link);
    node.hasLinks = true;

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readDataLayoutMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readDataLayoutMsg (Cursor& cur, uint64_t pos, Node& node)
{
    const uint64_t starting_position = pos;

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    const uint8_t layout_class = (uint8_t)cur.readField(1, &pos);

    layout_info_t& layout = node.layout;
    layout.version = version;
    node.hasLayout = true;

    /* Other Versions Fail When Read */
    if(version != 3)
    {
        layout.type = UNKNOWN_LAYOUT;
        return pos - starting_position;
    }

    switch(layout_class)
    {
        case COMPACT_LAYOUT:
        {
            layout.type = COMPACT_LAYOUT;
            layout.size = cur.readField(2, &pos);
            layout.address = pos;
            pos += layout.size;
            break;
        }

        case CONTIGUOUS_LAYOUT:
        {
            layout.type = CONTIGUOUS_LAYOUT;
            layout.address = cur.readField(superblock.offsetsize, &pos);
            layout.size = cur.readField(superblock.lengthsize, &pos);
            break;
        }

        case CHUNKED_LAYOUT:
        {
            layout.type = CHUNKED_LAYOUT;

            /* Dimensionality includes the element size */
            const int dimensionality = (int)cur.readField(1, &pos);
            layout.address = cur.readField(superblock.offsetsize, &pos);
            layout.ndims = dimensionality - 1;
            if(layout.ndims < 1 || layout.ndims > H5Cloud::MAX_NDIMS)
            {
                throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid chunk dimensionality: %d", dimensionality);
            }

            for(int d = 0; d < layout.ndims; d++)
            {
                layout.chunkdims[d] = cur.readField(4, &pos);
                if(layout.chunkdims[d] == 0)
                {
                    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid chunk dimension %d: 0", d);
                }
            }

            layout.elementsize = (uint32_t)cur.readField(4, &pos);
            break;
        }

        default:
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid data layout: %d", (int)layout_class);
        }
    }

    if(H5CLOUD_VERBOSE)
    {
        print2term("Data Layout Message: 0x%lx, %s, address 0x%lx, size %lu\n", (unsigned long)starting_position,
                   layout2str(layout.type), (unsigned long)layout.address, (unsigned long)layout.size);
    }

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readFilterMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readFilterMsg (Cursor& cur, uint64_t pos, Node& node)
{
    static const uint16_t RESERVED_FILTER_IDS = 256;

    const uint64_t starting_position = pos;

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    const uint8_t num_filters = (uint8_t)cur.readField(1, &pos);

    if(version == 1)
    {
        pos += 6; // reserved
    }
    else if(version != 2)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid filter version: %d", (int)version);
    }

    for(int f = 0; f < num_filters; f++)
    {
        filter_info_t filter;
        filter.id = (uint16_t)cur.readField(2, &pos);

        uint16_t name_len = 0;
        if(version == 1 || filter.id >= RESERVED_FILTER_IDS)
        {
            name_len = (uint16_t)cur.readField(2, &pos);
        }

        filter.flags = (uint16_t)cur.readField(2, &pos);
        const uint16_t num_parms = (uint16_t)cur.readField(2, &pos);

        /* Version 1 names are padded to eight bytes */
        if(name_len > 0)
        {
            const uint64_t name_size = (version == 1) ? pad8(name_len) : name_len;
            std::vector<uint8_t> name_buf(name_size);
            cur.readByteArray(name_buf.data(), name_size, &pos);
            filter.name = std::string((const char*)name_buf.data(), strnlen((const char*)name_buf.data(), name_size));
        }

        for(int p = 0; p < num_parms; p++)
        {
            filter.parms.push_back((uint32_t)cur.readField(4, &pos));
        }

        if(version == 1 && (num_parms % 2 == 1))
        {
            pos += 4; // padding
        }

        if(H5CLOUD_VERBOSE)
        {
            print2term("Filter %d: %s, flags 0x%x, %d parameters\n", (int)filter.id, filter2str(filter.id), (int)filter.flags, (int)num_parms);
        }

        node.filters.push_back(filter);
    }

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readAttributeMsg
 *
 *  size of value is taken from its datatype and dataspace so the message
 *  is self delimiting inside fractal heap blocks
 *----------------------------------------------------------------------------*/
int H5Parser::readAttributeMsg (Cursor& cur, uint64_t pos, Node& node)
{
    static const int SHARED_DATATYPE_BIT    = 0x01;
    static const int SHARED_DATASPACE_BIT   = 0x02;

    const uint64_t starting_position = pos;

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    const uint8_t flags = (uint8_t)cur.readField(1, &pos);
    const uint16_t name_size = (uint16_t)cur.readField(2, &pos);
    const uint16_t datatype_size = (uint16_t)cur.readField(2, &pos);
    const uint16_t dataspace_size = (uint16_t)cur.readField(2, &pos);

    if(version < 1 || version > 3)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid attribute version: %d", (int)version);
    }

    if(version == 3)
    {
        pos += 1; // character set encoding
    }

    /* Attribute Name */
    std::vector<uint8_t> name_buf(name_size);
    cur.readByteArray(name_buf.data(), name_size, &pos);
    if(version == 1) pos += pad8(name_size) - name_size;

    attribute_t attribute;
    attribute.name = std::string((const char*)name_buf.data(), strnlen((const char*)name_buf.data(), name_size));
    memset(&attribute.dtype, 0, sizeof(attribute.dtype));
    memset(&attribute.dspace, 0, sizeof(attribute.dspace));

    /* Shared Components Are Not Decoded */
    if(version > 1 && (flags & (SHARED_DATATYPE_BIT | SHARED_DATASPACE_BIT)))
    {
        attribute.dtype.typeclass = UNKNOWN_TYPE;
        attribute.dtype.shared = true;
        pos += datatype_size + dataspace_size;
        node.attributes.push_back(attribute);
        return pos - starting_position;
    }

    /* Attribute Datatype */
    uint64_t datatype_pos = pos;
    readDatatypeMsg(cur, datatype_pos, attribute.dtype);
    pos += (version == 1) ? pad8(datatype_size) : datatype_size;

    /* Attribute Dataspace */
    uint64_t dataspace_pos = pos;
    readDataspaceMsg(cur, dataspace_pos, attribute.dspace);
    pos += (version == 1) ? pad8(dataspace_size) : dataspace_size;

    /* Attribute Value */
    uint64_t num_elements = attribute.dspace.null ? 0 : 1;
    for(int d = 0; d < attribute.dspace.ndims; d++)
    {
        num_elements *= attribute.dspace.dims[d];
    }

    const uint64_t value_size = num_elements * attribute.dtype.size;
    if(value_size > getObjectSize())
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "attribute %s value of %lu bytes exceeds object size", attribute.name.c_str(), (unsigned long)value_size);
    }

    attribute.value.resize(value_size);
    cur.readByteArray(attribute.value.data(), value_size, &pos);

    if(H5CLOUD_VERBOSE)
    {
        print2term("Attribute %s: %s, %lu elements\n", attribute.name.c_str(), class2str(attribute.dtype.typeclass), (unsigned long)num_elements);
    }

    node.attributes.push_back(attribute);

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readAttributeInfoMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readAttributeInfoMsg (Cursor& cur, uint64_t pos, Node& node)
{
    static const int MAX_CREATE_PRESENT_BIT     = 0x01;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x02;

    const uint64_t starting_position = pos;

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    const uint8_t flags = (uint8_t)cur.readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid attribute info version: %d", (int)version);
    }

    if(flags & MAX_CREATE_PRESENT_BIT)
    {
        pos += 2; // maximum creation index
    }

    const uint64_t heap_address = cur.readField(superblock.offsetsize, &pos);
    const uint64_t name_index = cur.readField(superblock.offsetsize, &pos);
    (void)name_index;

    if(flags & CREATE_ORDER_PRESENT_BIT)
    {
        pos += superblock.offsetsize; // creation order index
    }

    const uint64_t ending_position = pos;

    /* Dense Attribute Storage */
    if(!isUndefined(heap_address))
    {
        readFractalHeap(cur, ATTRIBUTE_MSG, heap_address, node);
    }

    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readHeaderContMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readHeaderContMsg (Cursor& cur, uint64_t pos, Node& node, std::vector<block_t>& blocks)
{
    const uint64_t starting_position = pos;

    const uint64_t hc_offset = cur.readField(superblock.offsetsize, &pos);
    const uint64_t hc_length = cur.readField(superblock.lengthsize, &pos);

    if(hc_offset > getObjectSize() || hc_length > (getObjectSize() - hc_offset))
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "header continuation <0x%lx, %lu> runs past end of object",
                               (unsigned long)hc_offset, (unsigned long)hc_length);
    }

    /* Continuation Blocks Are Visited Once */
    for(const block_t& block: blocks)
    {
        if(block.pos == hc_offset || block.pos == hc_offset + 4)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "header continuation loop at 0x%lx", (unsigned long)hc_offset);
        }
    }

    if(node.version == 1)
    {
        blocks.push_back({hc_offset, hc_offset + hc_length});
    }
    else
    {
        uint64_t hc_pos = hc_offset;
        const uint64_t signature = cur.readField(4, &hc_pos);
        if(signature != H5_OCHK_SIGNATURE_LE || hc_length < 8)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid header continuation signature: 0x%llX", (unsigned long long)signature);
        }

        /* Messages End Before Checksum */
        blocks.push_back({hc_pos, hc_offset + hc_length - 4});
    }

    return pos - starting_position;
}

/*----------------------------------------------------------------------------
 * readSymbolTableMsg
 *----------------------------------------------------------------------------*/
int H5Parser::readSymbolTableMsg (Cursor& cur, uint64_t pos, Node& node)
{
    const uint64_t starting_position = pos;

    const uint64_t btree_addr = cur.readField(superblock.offsetsize, &pos);
    const uint64_t heap_addr = cur.readField(superblock.offsetsize, &pos);
    const uint64_t ending_position = pos;

    node.hasLinks = true;

    /* Local Heap */
    uint64_t heap_pos = heap_addr;
    const uint64_t signature = cur.readField(4, &heap_pos);
    if(signature != H5_HEAP_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid local heap signature: 0x%llX", (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)cur.readField(1, &heap_pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid local heap version: %d", (int)version);
    }

    heap_pos += 3; // reserved
    heap_pos += 2 * superblock.lengthsize; // data segment size and free list offset
    const uint64_t heap_data_addr = cur.readField(superblock.offsetsize, &heap_pos);

    readGroupBTree(cur, btree_addr, heap_data_addr, node);

    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readFractalHeap
 *
 *  managed objects are link or attribute messages stored back to back in
 *  the direct blocks; blocks are visited from an explicit work list
 *----------------------------------------------------------------------------*/
void H5Parser::readFractalHeap (Cursor& cur, msg_type_t msg_type, uint64_t pos, Node& node)
{
    static const int FRHP_CHECKSUM_DIRECT_BLOCKS = 0x02;

    const uint64_t starting_position = pos;

    const uint32_t signature = (uint32_t)cur.readField(4, &pos);
    if(signature != H5_FRHP_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid heap signature: 0x%llX", (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid heap version: %d", (int)version);
    }

    /* Read Fractal Heap Header */
    const int O = superblock.offsetsize;
    const int L = superblock.lengthsize;
    pos += 2; // heap id length
    const uint16_t io_filter_len        = (uint16_t)cur.readField(2, &pos);
    const uint8_t  flags                = (uint8_t)cur.readField(1, &pos);
    pos += 4; // maximum size of managed objects
    pos += L + O + L + O; // huge object id, huge object b-tree, free space, free space manager
    pos += L + L + L; // managed space, allocated managed space, direct block allocation iterator
    const uint64_t mg_objs              = cur.readField(L, &pos);
    pos += L + L + L + L; // huge and tiny object counts and sizes
    const uint16_t table_width          = (uint16_t)cur.readField(2, &pos);
    const uint64_t starting_blk_size    = cur.readField(L, &pos);
    const uint64_t max_dblk_size        = cur.readField(L, &pos);
    const uint16_t max_heap_size        = (uint16_t)cur.readField(2, &pos);
    pos += 2; // starting number of rows in root indirect block
    const uint64_t root_blk_addr        = cur.readField(O, &pos);
    const uint16_t curr_num_rows        = (uint16_t)cur.readField(2, &pos);

    if(H5CLOUD_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Fractal Heap [%d]: 0x%lx\n", (int)msg_type, (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Number of Managed Objects in Heap:                               %lu\n", (unsigned long)mg_objs);
        print2term("Table Width:                                                     %d\n", (int)table_width);
        print2term("Starting Block Size:                                             %lu\n", (unsigned long)starting_blk_size);
        print2term("Maximum Direct Block Size:                                       %lu\n", (unsigned long)max_dblk_size);
        print2term("Current # of Rows in Root Indirect Block:                        %d\n", (int)curr_num_rows);
    }
    else
    {
        (void)mg_objs;
    }

    if(io_filter_len > 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "filtering unsupported on fractal heap: %d", io_filter_len);
    }

    if(table_width == 0 || starting_blk_size == 0 || max_dblk_size < starting_blk_size)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid fractal heap geometry at 0x%lx", (unsigned long)starting_position);
    }

    if(isUndefined(root_blk_addr))
    {
        return; // empty heap
    }

    heap_info_t heap_info;
    heap_info.msg_type          = msg_type;
    heap_info.table_width       = table_width;
    heap_info.curr_num_rows     = curr_num_rows;
    heap_info.starting_blk_size = starting_blk_size;
    heap_info.max_dblk_size     = max_dblk_size;
    heap_info.blk_offset_size   = (max_heap_size + 7) / 8;
    heap_info.dblk_checksum     = (flags & FRHP_CHECKSUM_DIRECT_BLOCKS) != 0;

    /* Process Blocks */
    std::vector<heap_block_t> work;
    if(curr_num_rows == 0)  work.push_back({root_blk_addr, starting_blk_size, false});
    else                    work.push_back({root_blk_addr, 0, true});

    int blocks_visited = 0;
    while(!work.empty())
    {
        const heap_block_t block = work.back();
        work.pop_back();

        if(++blocks_visited > MAX_TREE_NODES)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "fractal heap at 0x%lx exceeds maximum number of blocks", (unsigned long)starting_position);
        }

        if(block.indirect)  readIndirectBlock(cur, heap_info, block.size, block.address, work);
        else                readDirectBlock(cur, heap_info, block.size, block.address, node);
    }
}

/*----------------------------------------------------------------------------
 * readDirectBlock
 *----------------------------------------------------------------------------*/
void H5Parser::readDirectBlock (Cursor& cur, const heap_info_t& heap_info, uint64_t block_size, uint64_t pos, Node& node)
{
    const uint64_t starting_position = pos;

    const uint32_t signature = (uint32_t)cur.readField(4, &pos);
    if(signature != H5_FHDB_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid direct block signature: 0x%llX", (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid direct block version: %d", (int)version);
    }

    /* Skip Heap Header Address and Block Offset */
    pos += superblock.offsetsize + heap_info.blk_offset_size;

    if(heap_info.dblk_checksum)
    {
        pos += 4;
    }

    /* Read Block Data */
    int64_t data_left = block_size - (pos - starting_position);
    while(data_left > 0)
    {
        /* Peek if More Messages */
        uint64_t peek_addr = pos;
        const int peek_size = MIN((1 << highestBit(data_left)), 8);
        if(cur.readField(peek_size, &peek_addr) == 0)
        {
            break;
        }

        /* Read Message */
        int data_read = 0;
        if(heap_info.msg_type == LINK_MSG)  data_read = readLinkMsg(cur, pos, node);
        else                                data_read = readAttributeMsg(cur, pos, node);

        pos += data_read;
        data_left -= data_read;

        if(data_left < 0)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "reading message exceeded end of direct block: 0x%lx", (unsigned long)starting_position);
        }
    }
}

/*----------------------------------------------------------------------------
 * readIndirectBlock
 *
 *  child blocks are appended to the work list in reverse so they are
 *  visited in heap order
 *----------------------------------------------------------------------------*/
void H5Parser::readIndirectBlock (Cursor& cur, const heap_info_t& heap_info, uint64_t block_size, uint64_t pos, std::vector<heap_block_t>& work)
{
    static const int MAX_ROWS = 64;

    const uint32_t signature = (uint32_t)cur.readField(4, &pos);
    if(signature != H5_FHIB_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid indirect block signature: 0x%llX", (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid indirect block version: %d", (int)version);
    }

    /* Skip Heap Header Address and Block Offset */
    pos += superblock.offsetsize + heap_info.blk_offset_size;

    /* Calculate Number of Rows (root uses current number of rows) */
    int nrows = heap_info.curr_num_rows;
    const uint64_t curr_size = heap_info.starting_blk_size * heap_info.table_width;
    if(block_size > 0) nrows = (highestBit(block_size) - highestBit(curr_size)) + 1;
    if(nrows <= 0 || nrows > MAX_ROWS)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid number of rows in indirect block: %d", nrows);
    }

    /* Read Child Block Addresses */
    std::vector<heap_block_t> children;
    for(int row = 0; row < nrows; row++)
    {
        uint64_t row_block_size;
        if(row < 2) row_block_size = heap_info.starting_blk_size;
        else        row_block_size = heap_info.starting_blk_size * ((uint64_t)0x2 << (row - 2));

        for(int entry = 0; entry < heap_info.table_width; entry++)
        {
            const uint64_t block_addr = cur.readField(superblock.offsetsize, &pos);
            if(!isUndefined(block_addr))
            {
                children.push_back({block_addr, row_block_size, row_block_size > heap_info.max_dblk_size});
            }
        }
    }

    for(auto iter = children.rbegin(); iter != children.rend(); ++iter)
    {
        work.push_back(*iter);
    }
}

/*----------------------------------------------------------------------------
 * readGroupBTree
 *
 *  version 1 b-tree of type 0; leaves point at symbol table nodes
 *----------------------------------------------------------------------------*/
void H5Parser::readGroupBTree (Cursor& cur, uint64_t pos, uint64_t heap_data_addr, Node& node)
{
    static const int GROUP_NODE_TYPE = 0;

    std::vector<uint64_t> work = {pos};
    int nodes_visited = 0;

    while(!work.empty())
    {
        uint64_t node_pos = work.back();
        work.pop_back();

        if(++nodes_visited > MAX_TREE_NODES)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "group b-tree at 0x%lx exceeds maximum number of nodes", (unsigned long)pos);
        }

        const uint32_t signature = (uint32_t)cur.readField(4, &node_pos);
        if(signature != H5_TREE_SIGNATURE_LE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid b-tree signature: 0x%llX", (unsigned long long)signature);
        }

        const uint8_t node_type = (uint8_t)cur.readField(1, &node_pos);
        const uint8_t node_level = (uint8_t)cur.readField(1, &node_pos);
        const uint16_t entries_used = (uint16_t)cur.readField(2, &node_pos);
        if(node_type != GROUP_NODE_TYPE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "only group b-trees supported here: %d", (int)node_type);
        }

        node_pos += 2 * superblock.offsetsize; // left and right siblings

        std::vector<uint64_t> children;
        for(int e = 0; e < entries_used; e++)
        {
            node_pos += superblock.lengthsize; // key
            children.push_back(cur.readField(superblock.offsetsize, &node_pos));
        }

        if(node_level > 0)
        {
            for(auto iter = children.rbegin(); iter != children.rend(); ++iter)
            {
                work.push_back(*iter);
            }
        }
        else
        {
            for(const uint64_t child: children)
            {
                readSymbolTable(cur, child, heap_data_addr, node);
            }
        }
    }
}

/*----------------------------------------------------------------------------
 * readSymbolTable
 *----------------------------------------------------------------------------*/
void H5Parser::readSymbolTable (Cursor& cur, uint64_t pos, uint64_t heap_data_addr, Node& node)
{
    static const int SOFT_LINK_CACHE_TYPE = 2;

    const uint32_t signature = (uint32_t)cur.readField(4, &pos);
    if(signature != H5_SNOD_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid symbol table signature: 0x%llX", (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)cur.readField(1, &pos);
    if(version != 1)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "incorrect version of symbol table: %d", (int)version);
    }

    pos += 1; // reserved
    const uint16_t num_symbols = (uint16_t)cur.readField(2, &pos);

    for(int s = 0; s < num_symbols; s++)
    {
        const uint64_t link_name_offset = cur.readField(superblock.offsetsize, &pos);
        const uint64_t obj_hdr_addr = cur.readField(superblock.offsetsize, &pos);
        const uint32_t cache_type = (uint32_t)cur.readField(4, &pos);
        pos += 4; // reserved

        /* Scratch Pad */
        uint64_t link_value_offset = 0;
        if(cache_type == SOFT_LINK_CACHE_TYPE)
        {
            link_value_offset = cur.readField(4, &pos);
            pos += 12;
        }
        else
        {
            pos += 16;
        }

        link_t link;
        uint64_t name_pos = heap_data_addr + link_name_offset;
        link.name = cur.readString(&name_pos, H5CLOUD_MAXIMUM_NAME_SIZE);
        link.address = obj_hdr_addr;
        link.type = HARD_LINK;
        if(cache_type == SOFT_LINK_CACHE_TYPE)
        {
            uint64_t value_pos = heap_data_addr + link_value_offset;
            link.type = SOFT_LINK;
            link.target = cur.readString(&value_pos, H5CLOUD_MAXIMUM_NAME_SIZE);
        }

        if(H5CLOUD_VERBOSE)
        {
            print2term("Symbol %s: 0x%lx\n", link.name.c_str(), (unsigned long)link.address);
        }

        node.links.push_back(link);
    }
}

/*----------------------------------------------------------------------------
 * isUndefined
 *----------------------------------------------------------------------------*/
bool H5Parser::isUndefined (uint64_t address) const
{
    return address == (0xFFFFFFFFFFFFFFFFllu >> (64 - (superblock.offsetsize * 8)));
}

/*----------------------------------------------------------------------------
 * highestBit
 *----------------------------------------------------------------------------*/
int H5Parser::highestBit (uint64_t value)
{
    int bit = 0;
    while(value >>= 1) bit++;
    return bit;
}
