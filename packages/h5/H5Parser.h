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

#ifndef __h5cloud_h5parser__
#define __h5cloud_h5parser__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Cloud.h"
#include "H5RangeFetcher.h"
#include "H5ChunkCache.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

/******************************************************************************
 * H5 PARSER CLASS
 ******************************************************************************/

class H5Parser
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint64_t H5_SIGNATURE_LE           = 0x0A1A0A0D46444889LL;
        static const uint64_t H5_OHDR_SIGNATURE_LE      = 0x5244484FLL; // object header
        static const uint64_t H5_FRHP_SIGNATURE_LE      = 0x50485246LL; // fractal heap
        static const uint64_t H5_FHDB_SIGNATURE_LE      = 0x42444846LL; // direct block
        static const uint64_t H5_FHIB_SIGNATURE_LE      = 0x42494846LL; // indirect block
        static const uint64_t H5_OCHK_SIGNATURE_LE      = 0x4B48434FLL; // object header continuation block
        static const uint64_t H5_TREE_SIGNATURE_LE      = 0x45455254LL; // binary tree version 1
        static const uint64_t H5_HEAP_SIGNATURE_LE      = 0x50414548LL; // local heap
        static const uint64_t H5_SNOD_SIGNATURE_LE      = 0x444F4E53LL; // symbol table

        static const int64_t  DEFAULT_READ_AHEAD_SIZE   = 0x10000; // 64KB
        static const int      MAX_CONTINUATIONS         = 4096;
        static const int      MAX_TREE_NODES            = 0x100000;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            NIL_MSG             = 0x0,
            DATASPACE_MSG       = 0x1,
            LINK_INFO_MSG       = 0x2,
            DATATYPE_MSG        = 0x3,
            FILL_VALUE_MSG      = 0x5,
            LINK_MSG            = 0x6,
            DATA_LAYOUT_MSG     = 0x8,
            FILTER_MSG          = 0xB,
            ATTRIBUTE_MSG       = 0xC,
            HEADER_CONT_MSG     = 0x10,
            SYMBOL_TABLE_MSG    = 0x11,
            ATTRIBUTE_INFO_MSG  = 0x15
        } msg_type_t;

        typedef enum {
            FIXED_POINT_TYPE    = 0,
            FLOATING_POINT_TYPE = 1,
            TIME_TYPE           = 2,
            STRING_TYPE         = 3,
            BIT_FIELD_TYPE      = 4,
            OPAQUE_TYPE         = 5,
            COMPOUND_TYPE       = 6,
            REFERENCE_TYPE      = 7,
            ENUMERATED_TYPE     = 8,
            VARIABLE_LENGTH_TYPE= 9,
            ARRAY_TYPE          = 10,
            UNKNOWN_TYPE        = 11
        } data_class_t;

        typedef enum {
            COMPACT_LAYOUT      = 0,
            CONTIGUOUS_LAYOUT   = 1,
            CHUNKED_LAYOUT      = 2,
            UNKNOWN_LAYOUT      = 3
        } layout_t;

        typedef enum {
            INVALID_FILTER      = 0,
            DEFLATE_FILTER      = 1,
            SHUFFLE_FILTER      = 2,
            FLETCHER32_FILTER   = 3,
            SZIP_FILTER         = 4,
            NBIT_FILTER         = 5,
            SCALEOFFSET_FILTER  = 6
        } filter_t;

        typedef enum {
            HARD_LINK           = 0,
            SOFT_LINK           = 1,
            EXTERNAL_LINK       = 64
        } link_type_t;

        typedef struct {
            int             version;
            int             offsetsize;
            int             lengthsize;
            uint64_t        root;           // address of root group object header
        } superblock_t;

        typedef struct {
            data_class_t    typeclass;
            uint32_t        size;           // bytes per element
            bool            signedval;
            bool            bigendian;
            bool            shared;         // committed datatype, not decoded
        } dtype_t;

        typedef struct {
            int             ndims;
            uint64_t        dims[H5Cloud::MAX_NDIMS];
            bool            null;           // no elements
        } dspace_t;

        typedef struct {
            layout_t        type;
            int             version;
            uint64_t        address;
            uint64_t        size;           // compact and contiguous only
            int             ndims;          // chunked only
            uint64_t        chunkdims[H5Cloud::MAX_NDIMS];
            uint32_t        elementsize;
        } layout_info_t;

        typedef struct {
            uint16_t                id;
            uint16_t                flags;
            std::string             name;
            std::vector<uint32_t>   parms;
        } filter_info_t;

        typedef struct {
            std::string     name;
            link_type_t     type;
            uint64_t        address;        // hard links
            std::string     target;         // soft and external links
        } link_t;

        typedef struct {
            std::string             name;
            dtype_t                 dtype;
            dspace_t                dspace;
            std::vector<uint8_t>    value;
        } attribute_t;

        /*--------------------------------------------------------------------
         * Node - decoded object header, immutable once published
         *--------------------------------------------------------------------*/

        struct Node
        {
            uint64_t                    address;
            int                         version;
            bool                        hasDataspace;
            bool                        hasDatatype;
            bool                        hasLayout;
            bool                        hasFill;
            bool                        hasLinks;       // symbol table or link info message
            dspace_t                    dataspace;
            dtype_t                     datatype;
            layout_info_t               layout;
            std::vector<filter_info_t>  filters;
            std::vector<uint8_t>        fillvalue;
            std::vector<link_t>         links;
            std::vector<attribute_t>    attributes;

            explicit                Node            (uint64_t _address);
            bool                    isDataset       (void) const;
            bool                    isGroup         (void) const;
            const link_t*           findLink        (const char* name) const;
            const attribute_t*      findAttribute   (const char* name) const;
        };

        typedef std::shared_ptr<const Node> node_ptr_t;

        /*--------------------------------------------------------------------
         * Cursor - structural reads through the session cache
         *--------------------------------------------------------------------*/

        class Cursor
        {
            public:
                                Cursor          (H5Parser* _parser, const H5RangeFetcher::control_t& _control);
                uint64_t        readField       (int64_t size, uint64_t* pos);
                void            readByteArray   (uint8_t* data, int64_t size, uint64_t* pos);
                std::string     readString      (uint64_t* pos, int64_t max_size);
                const H5RangeFetcher::control_t& getControl (void) const;
            private:
                const uint8_t*  access          (uint64_t pos, int64_t size);
                H5Parser*                   parser;
                H5RangeFetcher::control_t   control;
                H5ChunkCache::Ref           block;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                            H5Parser            (H5RangeFetcher* _fetcher, H5ChunkCache* _cache, int64_t _read_ahead=DEFAULT_READ_AHEAD_SIZE);
                            ~H5Parser           (void);

        void                readSuperblock      (const H5RangeFetcher::control_t& control);
        const superblock_t& getSuperblock       (void) const;
        node_ptr_t          getNode             (uint64_t address, const H5RangeFetcher::control_t& control);
        node_ptr_t          resolve             (const char* path, const H5RangeFetcher::control_t& control);
        void                clear               (void);

        H5ChunkCache::Ref   fetchRange          (uint64_t offset, int64_t length, const H5RangeFetcher::control_t& control);
        std::vector<H5ChunkCache::Ref> fetchRanges (const std::vector<H5RangeFetcher::range_t>& ranges, const H5RangeFetcher::control_t& control);
        uint64_t            getObjectSize       (void) const;
        bool                isUndefined         (uint64_t address) const;

        static const char*  class2str           (data_class_t typeclass);
        static const char*  layout2str          (layout_t layout);
        static const char*  filter2str          (int filter);

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        /* region of object header holding messages */
        typedef struct {
            uint64_t        pos;
            uint64_t        end;
        } block_t;

        typedef struct {
            msg_type_t      msg_type;
            int             table_width;
            int             curr_num_rows;
            uint64_t        starting_blk_size;
            uint64_t        max_dblk_size;
            int             blk_offset_size;
            bool            dblk_checksum;
        } heap_info_t;

        typedef struct {
            uint64_t        address;
            uint64_t        size;
            bool            indirect;
        } heap_block_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                readObjHdr          (Cursor& cur, uint64_t pos, Node& node);
        void                readMessages        (Cursor& cur, uint64_t pos, uint64_t end, uint8_t hdr_flags, Node& node, std::vector<block_t>& blocks);
        void                readMessagesV1      (Cursor& cur, uint64_t pos, uint64_t end, Node& node, std::vector<block_t>& blocks);
        int                 readMessage         (Cursor& cur, msg_type_t msg_type, uint64_t size, uint64_t pos, uint8_t msg_flags, Node& node, std::vector<block_t>& blocks);

        int                 readDataspaceMsg    (Cursor& cur, uint64_t pos, dspace_t& dspace);
        int                 readLinkInfoMsg     (Cursor& cur, uint64_t pos, Node& node);
        int                 readDatatypeMsg     (Cursor& cur, uint64_t pos, dtype_t& dtype);
        int                 readFillValueMsg    (Cursor& cur, uint64_t pos, Node& node);
        int                 readLinkMsg         (Cursor& cur, uint64_t pos, Node& node);
        int                 readDataLayoutMsg   (Cursor& cur, uint64_t pos, Node& node);
        int                 readFilterMsg       (Cursor& cur, uint64_t pos, Node& node);
        int                 readAttributeMsg    (Cursor& cur, uint64_t pos, Node& node);
        int                 readAttributeInfoMsg(Cursor& cur, uint64_t pos, Node& node);
        int                 readHeaderContMsg   (Cursor& cur, uint64_t pos, Node& node, std::vector<block_t>& blocks);
        int                 readSymbolTableMsg  (Cursor& cur, uint64_t pos, Node& node);

        void                readFractalHeap     (Cursor& cur, msg_type_t msg_type, uint64_t pos, Node& node);
        void                readDirectBlock     (Cursor& cur, const heap_info_t& heap_info, uint64_t block_size, uint64_t pos, Node& node);
        void                readIndirectBlock   (Cursor& cur, const heap_info_t& heap_info, uint64_t block_size, uint64_t pos, std::vector<heap_block_t>& work);
        void                readGroupBTree      (Cursor& cur, uint64_t pos, uint64_t heap_data_addr, Node& node);
        void                readSymbolTable     (Cursor& cur, uint64_t pos, uint64_t heap_data_addr, Node& node);

        static int          highestBit          (uint64_t value);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5RangeFetcher*                     fetcher;
        H5ChunkCache*                       cache;
        int64_t                             readAheadSize;
        superblock_t                        superblock;
        Mutex                               nodeMut;
        std::map<uint64_t, node_ptr_t>      nodes;      // memoized object headers by address
};

#endif  /* __h5cloud_h5parser__ */
