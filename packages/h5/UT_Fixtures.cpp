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

#include "UT_Fixtures.h"
#include "EventLib.h"
#include "OsApi.h"

#include <hdf5.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <initializer_list>
#include <utility>
#include <vector>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Fixtures::EARLIEST_FILE      = "earliest.h5";
const char* UT_Fixtures::V18_FILE           = "v18.h5";
const char* UT_Fixtures::ASDF_FILE          = "waveforms.h5";
const char* UT_Fixtures::BAD_SIGNATURE_FILE = "badsig.h5";

const char* UT_Fixtures::STATION_XML    = "<FDSNStationXML><Network code=\"IU\"/></FDSNStationXML>";
const char* UT_Fixtures::QUAKE_ML       = "<q:quakeml><eventParameters/></q:quakeml>";
const char* UT_Fixtures::ASDF_DICT      = "{\"format_version\": \"1.0.3\"}";
const char* UT_Fixtures::TRACE_BHZ      = "IU.ANMO.00.BHZ__2020-01-01T00:00:00__2020-01-01T00:00:10__raw_recording";
const char* UT_Fixtures::TRACE_BH1      = "IU.ANMO.00.BH1__2020-01-01T00:00:00__2020-01-01T00:00:20__raw_recording";
const char* UT_Fixtures::TRACE_BAD      = "IU.COLA.00.BHZ__yesterday__raw_recording";

std::string UT_Fixtures::scratch;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

typedef enum {
    NO_FILTERS      = 0,
    SHUFFLE_DEFLATE = 1,
    FLETCHER32      = 2
} fixture_filter_t;

/*----------------------------------------------------------------------------
 * closeAll - closes handles in order, returns false if any close failed
 *----------------------------------------------------------------------------*/
static bool closeAll (std::initializer_list<std::pair<hid_t, herr_t (*)(hid_t)>> handles)
{
    bool status = true;
    for(const auto& handle: handles)
    {
        if(handle.first >= 0 && handle.second(handle.first) < 0) status = false;
    }
    return status;
}

/*----------------------------------------------------------------------------
 * writeChunked - (ROWS,COLS) int32 dataset in (CHUNK_ROWS,CHUNK_COLS) chunks
 *----------------------------------------------------------------------------*/
static bool writeChunked (hid_t loc, const char* name, fixture_filter_t filters, int rows_written)
{
    const hsize_t dims[2] = {UT_Fixtures::ROWS, UT_Fixtures::COLS};
    const hsize_t chunk[2] = {UT_Fixtures::CHUNK_ROWS, UT_Fixtures::CHUNK_COLS};

    std::vector<int32_t> values(UT_Fixtures::ROWS * UT_Fixtures::COLS);
    for(int row = 0; row < UT_Fixtures::ROWS; row++)
    {
        for(int col = 0; col < UT_Fixtures::COLS; col++)
        {
            values[(row * UT_Fixtures::COLS) + col] = UT_Fixtures::chunkedValue(row, col);
        }
    }

    bool status = true;
    const hid_t dcpl = H5Pcreate(H5P_DATASET_CREATE);
    status = status && H5Pset_chunk(dcpl, 2, chunk) >= 0;
    if(filters == SHUFFLE_DEFLATE)
    {
        status = status && H5Pset_shuffle(dcpl) >= 0;
        status = status && H5Pset_deflate(dcpl, 6) >= 0;
    }
    else if(filters == FLETCHER32)
    {
        status = status && H5Pset_fletcher32(dcpl) >= 0;
    }

    if(rows_written < UT_Fixtures::ROWS)
    {
        const int32_t fill = UT_Fixtures::SPARSE_FILL;
        status = status && H5Pset_fill_value(dcpl, H5T_NATIVE_INT32, &fill) >= 0;
        status = status && H5Pset_alloc_time(dcpl, H5D_ALLOC_TIME_INCR) >= 0;
    }

    const hid_t space = H5Screate_simple(2, dims, NULL);
    const hid_t dset = H5Dcreate2(loc, name, H5T_STD_I32LE, space, H5P_DEFAULT, dcpl, H5P_DEFAULT);
    status = status && dset >= 0;

    hid_t memspace = -1;
    if(status && rows_written < UT_Fixtures::ROWS)
    {
        const hsize_t start[2] = {0, 0};
        const hsize_t count[2] = {(hsize_t)rows_written, UT_Fixtures::COLS};
        memspace = H5Screate_simple(2, count, NULL);
        status = status && H5Sselect_hyperslab(space, H5S_SELECT_SET, start, NULL, count, NULL) >= 0;
        status = status && H5Dwrite(dset, H5T_NATIVE_INT32, memspace, space, H5P_DEFAULT, values.data()) >= 0;
    }
    else if(status)
    {
        status = H5Dwrite(dset, H5T_NATIVE_INT32, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) >= 0;
    }

    status = closeAll({{memspace, H5Sclose}, {dset, H5Dclose}, {space, H5Sclose}, {dcpl, H5Pclose}}) && status;
    return status;
}

/*----------------------------------------------------------------------------
 * writeArray - one dimensional dataset from a native buffer
 *----------------------------------------------------------------------------*/
static bool writeArray (hid_t loc, const char* name, hid_t file_type, hid_t mem_type, hsize_t size, const void* data, H5D_layout_t layout=H5D_CONTIGUOUS)
{
    bool status = true;
    const hid_t dcpl = H5Pcreate(H5P_DATASET_CREATE);
    status = status && H5Pset_layout(dcpl, layout) >= 0;

    const hid_t space = H5Screate_simple(1, &size, NULL);
    const hid_t dset = H5Dcreate2(loc, name, file_type, space, H5P_DEFAULT, dcpl, H5P_DEFAULT);
    status = status && dset >= 0;
    status = status && H5Dwrite(dset, mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, data) >= 0;

    status = closeAll({{dset, H5Dclose}, {space, H5Sclose}, {dcpl, H5Pclose}}) && status;
    return status;
}

/*----------------------------------------------------------------------------
 * writeText - text stored as int8 bytes followed by padding
 *----------------------------------------------------------------------------*/
static bool writeText (hid_t loc, const char* name, const char* text)
{
    std::string padded(text);
    padded += "\n  ";
    padded.push_back('\0');
    padded.push_back('\0');
    return writeArray(loc, name, H5T_STD_I8LE, H5T_NATIVE_INT8, padded.size(), padded.data());
}

/*----------------------------------------------------------------------------
 * writeAttribute
 *----------------------------------------------------------------------------*/
static bool writeAttribute (hid_t loc, const char* name, hid_t file_type, hid_t mem_type, hsize_t size, const void* data)
{
    bool status = true;
    const hid_t space = (size == 0) ? H5Screate(H5S_SCALAR) : H5Screate_simple(1, &size, NULL);
    const hid_t attr = H5Acreate2(loc, name, file_type, space, H5P_DEFAULT, H5P_DEFAULT);
    status = status && attr >= 0;
    status = status && H5Awrite(attr, mem_type, data) >= 0;
    status = closeAll({{attr, H5Aclose}, {space, H5Sclose}}) && status;
    return status;
}

/*----------------------------------------------------------------------------
 * stringType - fixed length, null padded
 *----------------------------------------------------------------------------*/
static hid_t stringType (size_t size)
{
    const hid_t type = H5Tcopy(H5T_C_S1);
    if(type >= 0)
    {
        if(H5Tset_size(type, size) < 0 || H5Tset_strpad(type, H5T_STR_NULLPAD) < 0)
        {
            H5Tclose(type);
            return -1;
        }
    }
    return type;
}

/*----------------------------------------------------------------------------
 * createFile
 *----------------------------------------------------------------------------*/
static hid_t createFile (const char* filename, H5F_libver_t low)
{
    const hid_t fapl = H5Pcreate(H5P_FILE_ACCESS);
    if(fapl < 0) return -1;
    hid_t file = -1;
    if(H5Pset_libver_bounds(fapl, low, H5F_LIBVER_LATEST) >= 0)
    {
        file = H5Fcreate(filename, H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
    }
    if(H5Pclose(fapl) < 0 && file >= 0)
    {
        H5Fclose(file);
        file = -1;
    }
    return file;
}

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * create
 *
 *  directory of NULL creates a scratch directory under /tmp
 *----------------------------------------------------------------------------*/
bool UT_Fixtures::create (const char* directory)
{
    if(directory)
    {
        scratch = directory;
    }
    else
    {
        char templ[] = "/tmp/h5cloud-XXXXXX";
        if(mkdtemp(templ) == NULL)
        {
            mlog(CRITICAL, "Failed to create fixture directory: %s", strerror(errno));
            return false;
        }
        scratch = templ;
    }

    /* Quiet HDF5 Error Stack */
    H5Eset_auto2(H5E_DEFAULT, NULL, NULL);

    bool status = true;
    status = writeEarliest(path(EARLIEST_FILE).c_str()) && status;
    status = writeV18(path(V18_FILE).c_str()) && status;
    status = writeAsdf(path(ASDF_FILE).c_str()) && status;
    status = writeBadSignature(path(BAD_SIGNATURE_FILE).c_str()) && status;

    if(status) mlog(INFO, "Fixtures written to %s", scratch.c_str());
    else mlog(CRITICAL, "Failed to write fixtures to %s", scratch.c_str());

    return status;
}

/*----------------------------------------------------------------------------
 * path
 *----------------------------------------------------------------------------*/
std::string UT_Fixtures::path (const char* file)
{
    return scratch + "/" + file;
}

/*----------------------------------------------------------------------------
 * directory
 *----------------------------------------------------------------------------*/
const char* UT_Fixtures::directory (void)
{
    return scratch.c_str();
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * writeEarliest
 *
 *  /chunked            int32 (100,10) in (10,10) chunks, attributes units, scale, count
 *  /compressed         same values with shuffle and deflate
 *  /sparse             same shape, first 30 rows written, fill value -1
 *  /fletcher           same shape with fletcher32 checksum
 *  /contiguous         double (50)
 *  /bigendian          big endian int16 (20)
 *  /compact            int32 (4) stored in the object header
 *  /names              fixed length strings (3)
 *  /unfilled           chunked int32 (UNFILLED_SIZE) never written, default fill, empty attribute
 *  /group/sub/leaf     int32 (4)
 *  /group/alias        soft link to /chunked
 *  /group/outside      external link
 *----------------------------------------------------------------------------*/
bool UT_Fixtures::writeEarliest (const char* filename)
{
    const hid_t file = createFile(filename, H5F_LIBVER_EARLIEST);
    if(file < 0) return false;

    bool status = true;

    /* Chunked Datasets */
    status = writeChunked(file, "/chunked", NO_FILTERS, ROWS) && status;
    status = writeChunked(file, "/compressed", SHUFFLE_DEFLATE, ROWS) && status;
    status = writeChunked(file, "/sparse", NO_FILTERS, WRITTEN_ROWS) && status;
    status = writeChunked(file, "/fletcher", FLETCHER32, ROWS) && status;

    /* Contiguous Datasets */
    double contiguous[CONTIGUOUS_SIZE];
    for(int i = 0; i < CONTIGUOUS_SIZE; i++) contiguous[i] = contiguousValue(i);
    status = writeArray(file, "/contiguous", H5T_IEEE_F64LE, H5T_NATIVE_DOUBLE, CONTIGUOUS_SIZE, contiguous) && status;

    int16_t bigendian[BIGENDIAN_SIZE];
    for(int i = 0; i < BIGENDIAN_SIZE; i++) bigendian[i] = bigendianValue(i);
    status = writeArray(file, "/bigendian", H5T_STD_I16BE, H5T_NATIVE_INT16, BIGENDIAN_SIZE, bigendian) && status;

    const int32_t compact[4] = {7, 8, 9, 10};
    status = writeArray(file, "/compact", H5T_STD_I32LE, H5T_NATIVE_INT32, 4, compact, H5D_COMPACT) && status;

    /* Strings */
    const hid_t name_type = stringType(8);
    const char names[3][8] = {"ANMO", "COLA", "KONO"};
    status = name_type >= 0 && writeArray(file, "/names", name_type, name_type, 3, names) && status;

    /* Attributes */
    const hid_t dset = H5Dopen2(file, "/chunked", H5P_DEFAULT);
    const char units[16] = "counts";
    const double scale = 2.5;
    const int32_t count[3] = {1, 2, 3};
    const hid_t units_type = stringType(sizeof(units));
    status = dset >= 0 && units_type >= 0 && status;
    status = status && writeAttribute(dset, "units", units_type, units_type, 0, units);
    status = status && writeAttribute(dset, "scale", H5T_IEEE_F64LE, H5T_NATIVE_DOUBLE, 0, &scale);
    status = status && writeAttribute(dset, "count", H5T_STD_I32LE, H5T_NATIVE_INT32, 3, count);

    /* Default Fill Value and Zero Element Attribute */
    const hsize_t unfilled_size = UNFILLED_SIZE;
    const hsize_t unfilled_chunk = UNFILLED_SIZE / 2;
    const hsize_t no_elements = 0;
    const hid_t unfilled_dcpl = H5Pcreate(H5P_DATASET_CREATE);
    const hid_t unfilled_space = H5Screate_simple(1, &unfilled_size, NULL);
    const hid_t empty_space = H5Screate_simple(1, &no_elements, NULL);
    status = status && H5Pset_chunk(unfilled_dcpl, 1, &unfilled_chunk) >= 0;
    const hid_t unfilled = status ? H5Dcreate2(file, "/unfilled", H5T_STD_I32LE, unfilled_space, H5P_DEFAULT, unfilled_dcpl, H5P_DEFAULT) : -1;
    const hid_t empty = (unfilled >= 0 && empty_space >= 0) ? H5Acreate2(unfilled, "empty", H5T_STD_I32LE, empty_space, H5P_DEFAULT, H5P_DEFAULT) : -1;
    status = unfilled >= 0 && empty >= 0 && status;

    /* Groups and Links */
    const hid_t group = H5Gcreate2(file, "/group", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    const hid_t sub = H5Gcreate2(file, "/group/sub", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    const int32_t leaf[4] = {1, 2, 3, 4};
    status = group >= 0 && sub >= 0 && status;
    status = status && writeArray(sub, "leaf", H5T_STD_I32LE, H5T_NATIVE_INT32, 4, leaf);
    status = status && H5Lcreate_soft("/chunked", group, "alias", H5P_DEFAULT, H5P_DEFAULT) >= 0;
    status = status && H5Lcreate_external("elsewhere.h5", "/data", group, "outside", H5P_DEFAULT, H5P_DEFAULT) >= 0;

    status = closeAll({{empty, H5Aclose}, {empty_space, H5Sclose}, {unfilled, H5Dclose}, {unfilled_space, H5Sclose}, {unfilled_dcpl, H5Pclose}}) && status;
    status = closeAll({{units_type, H5Tclose}, {name_type, H5Tclose}, {dset, H5Dclose}, {sub, H5Gclose}, {group, H5Gclose}, {file, H5Fclose}}) && status;
    return status;
}

/*----------------------------------------------------------------------------
 * writeV18
 *
 *  /chunked            as in the earliest file, plus 12 attributes (dense)
 *  /dense/itemNN       20 scalar-like int32 (1) datasets (dense links)
 *  /labels             16 byte strings (LABEL_COUNT) with shuffle and deflate
 *  /nested/a/b/leaf    int32 (4)
 *----------------------------------------------------------------------------*/
bool UT_Fixtures::writeV18 (const char* filename)
{
    const hid_t file = createFile(filename, H5F_LIBVER_V18);
    if(file < 0) return false;

    bool status = true;
    status = writeChunked(file, "/chunked", NO_FILTERS, ROWS) && status;

    const hid_t dset = H5Dopen2(file, "/chunked", H5P_DEFAULT);
    status = dset >= 0 && status;
    for(int i = 0; status && i < DENSE_ATTRIBUTES; i++)
    {
        char name[16];
        snprintf(name, sizeof(name), "attr%02d", i);
        const int32_t value = i * 10;
        status = writeAttribute(dset, name, H5T_STD_I32LE, H5T_NATIVE_INT32, 0, &value);
    }

    const hid_t dense = H5Gcreate2(file, "/dense", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    status = dense >= 0 && status;
    for(int i = 0; status && i < DENSE_CHILDREN; i++)
    {
        char name[16];
        snprintf(name, sizeof(name), "item%02d", i);
        const int32_t value = i;
        status = writeArray(dense, name, H5T_STD_I32LE, H5T_NATIVE_INT32, 1, &value);
    }

    /* Shuffled Sixteen Byte Strings */
    char labels[LABEL_COUNT][LABEL_SIZE];
    memset(labels, 0, sizeof(labels));
    for(int i = 0; i < LABEL_COUNT; i++) label(i, labels[i]);
    const hsize_t label_count = LABEL_COUNT;
    const hsize_t label_chunk = 5;
    const hid_t label_type = stringType(LABEL_SIZE);
    const hid_t label_dcpl = H5Pcreate(H5P_DATASET_CREATE);
    const hid_t label_space = H5Screate_simple(1, &label_count, NULL);
    status = label_type >= 0 && label_dcpl >= 0 && label_space >= 0 && status;
    status = status && H5Pset_chunk(label_dcpl, 1, &label_chunk) >= 0;
    status = status && H5Pset_shuffle(label_dcpl) >= 0;
    status = status && H5Pset_deflate(label_dcpl, 6) >= 0;
    const hid_t label_dset = status ? H5Dcreate2(file, "/labels", label_type, label_space, H5P_DEFAULT, label_dcpl, H5P_DEFAULT) : -1;
    status = label_dset >= 0 && status;
    status = status && H5Dwrite(label_dset, label_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, labels) >= 0;
    status = closeAll({{label_dset, H5Dclose}, {label_space, H5Sclose}, {label_dcpl, H5Pclose}, {label_type, H5Tclose}}) && status;

    const hid_t lcpl = H5Pcreate(H5P_LINK_CREATE);
    status = lcpl >= 0 && H5Pset_create_intermediate_group(lcpl, 1) >= 0 && status;
    const hid_t nested = H5Gcreate2(file, "/nested/a/b", lcpl, H5P_DEFAULT, H5P_DEFAULT);
    const int32_t leaf[4] = {1, 2, 3, 4};
    status = nested >= 0 && status;
    status = status && writeArray(nested, "leaf", H5T_STD_I32LE, H5T_NATIVE_INT32, 4, leaf);

    status = closeAll({{nested, H5Gclose}, {lcpl, H5Pclose}, {dense, H5Gclose}, {dset, H5Dclose}, {file, H5Fclose}}) && status;
    return status;
}

/*----------------------------------------------------------------------------
 * writeAsdf
 *
 *  /QuakeML
 *  /AuxiliaryData/ASDFDict
 *  /Waveforms/IU.ANMO/StationXML, two float32 traces
 *  /Waveforms/IU.COLA/StationXML, one trace with an unparseable name
 *----------------------------------------------------------------------------*/
bool UT_Fixtures::writeAsdf (const char* filename)
{
    const hid_t file = createFile(filename, H5F_LIBVER_EARLIEST);
    if(file < 0) return false;

    bool status = true;
    status = writeText(file, "/QuakeML", QUAKE_ML) && status;

    const hid_t aux = H5Gcreate2(file, "/AuxiliaryData", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    status = aux >= 0 && status;
    status = status && writeText(aux, "ASDFDict", ASDF_DICT);

    const hid_t waveforms = H5Gcreate2(file, "/Waveforms", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    const hid_t anmo = H5Gcreate2(file, "/Waveforms/IU.ANMO", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    const hid_t cola = H5Gcreate2(file, "/Waveforms/IU.COLA", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    status = waveforms >= 0 && anmo >= 0 && cola >= 0 && status;

    float samples[TRACE_SAMPLES];
    for(int i = 0; i < TRACE_SAMPLES; i++) samples[i] = traceValue(i);

    status = status && writeText(anmo, "StationXML", STATION_XML);
    status = status && writeArray(anmo, TRACE_BHZ, H5T_IEEE_F32LE, H5T_NATIVE_FLOAT, TRACE_SAMPLES, samples);
    status = status && writeArray(anmo, TRACE_BH1, H5T_IEEE_F32LE, H5T_NATIVE_FLOAT, TRACE_SAMPLES, samples);
    status = status && writeText(cola, "StationXML", STATION_XML);
    status = status && writeArray(cola, TRACE_BAD, H5T_IEEE_F32LE, H5T_NATIVE_FLOAT, TRACE_SAMPLES, samples);

    status = closeAll({{cola, H5Gclose}, {anmo, H5Gclose}, {waveforms, H5Gclose}, {aux, H5Gclose}, {file, H5Fclose}}) && status;
    return status;
}

/*----------------------------------------------------------------------------
 * writeBadSignature
 *----------------------------------------------------------------------------*/
bool UT_Fixtures::writeBadSignature (const char* filename)
{
    FILE* fp = fopen(filename, "wb");
    if(fp == NULL)
    {
        mlog(CRITICAL, "Failed to open %s: %s", filename, strerror(errno));
        return false;
    }

    uint8_t block[4096];
    memset(block, 0, sizeof(block));
    const uint8_t signature[8] = {0x89, 'H', 'D', 'X', '\r', '\n', 0x1A, '\n'};
    memcpy(block, signature, sizeof(signature));

    const bool status = fwrite(block, 1, sizeof(block), fp) == sizeof(block);
    return (fclose(fp) == 0) && status;
}

/******************************************************************************
 * IN MEMORY OBJECT METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor - patterned bytes
 *----------------------------------------------------------------------------*/
UT_MemoryObject::UT_MemoryObject (int64_t size):
    data(size),
    maxRead(0),
    failAt(-1),
    delayMs(0),
    reads(0),
    bytes(0)
{
    for(int64_t i = 0; i < size; i++) data[i] = pattern(i);
}

/*----------------------------------------------------------------------------
 * Constructor - contents of a file
 *----------------------------------------------------------------------------*/
UT_MemoryObject::UT_MemoryObject (const char* filename):
    maxRead(0),
    failAt(-1),
    delayMs(0),
    reads(0),
    bytes(0)
{
    FILE* fp = fopen(filename, "rb");
    if(fp == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_RESOURCE_DOES_NOT_EXIST, "unable to open %s: %s", filename, strerror(errno));
    }

    uint8_t block[4096];
    size_t n;
    while((n = fread(block, 1, sizeof(block), fp)) > 0)
    {
        data.insert(data.end(), block, block + n);
    }

    const bool failed = ferror(fp) != 0;
    fclose(fp);
    if(failed)
    {
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "unable to read %s", filename);
    }
}

/*----------------------------------------------------------------------------
 * backend
 *----------------------------------------------------------------------------*/
H5Cloud::backend_t UT_MemoryObject::backend (void)
{
    H5Cloud::backend_t driver;
    driver.size = [this]() -> uint64_t { return data.size(); };
    driver.read = [this](uint8_t* buffer, int64_t size, uint64_t pos, int64_t deadline) -> int64_t {
        (void)deadline;
        return read(buffer, size, pos);
    };
    return driver;
}

/*----------------------------------------------------------------------------
 * getReads
 *----------------------------------------------------------------------------*/
long UT_MemoryObject::getReads (void) const
{
    return reads.load();
}

/*----------------------------------------------------------------------------
 * getBytes
 *----------------------------------------------------------------------------*/
int64_t UT_MemoryObject::getBytes (void) const
{
    return bytes.load();
}

/*----------------------------------------------------------------------------
 * read
 *----------------------------------------------------------------------------*/
int64_t UT_MemoryObject::read (uint8_t* buffer, int64_t size, uint64_t pos)
{
    reads++;

    if(delayMs > 0) OsApi::sleep(delayMs / 1000.0);

    if(failAt >= 0 && (uint64_t)failAt >= pos && (uint64_t)failAt < pos + size)
    {
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "injected failure reading <%lu, %ld>", (unsigned long)pos, (long)size);
    }

    if(pos >= data.size()) return 0;

    int64_t n = MIN(size, (int64_t)(data.size() - pos));
    if(maxRead > 0) n = MIN(n, maxRead);

    memcpy(buffer, &data[pos], n);
    bytes += n;
    return n;
}
