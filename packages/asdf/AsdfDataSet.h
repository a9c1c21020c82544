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

#ifndef __h5cloud_asdfdataset__
#define __h5cloud_asdfdataset__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Session.h"

#include <map>
#include <string>
#include <vector>

/******************************************************************************
 * ASDF DATASET CLASS
 *
 *  Adaptable Seismic Data Format layout:
 *      /QuakeML                            int8 event document
 *      /AuxiliaryData/ASDFDict             int8 structure document
 *      /Waveforms/<NET.STA>/StationXML     int8 station document
 *      /Waveforms/<NET.STA>/<trace>        samples, trace named
 *                                          NET.STA.LOC.CHA__<start>__<end>__<tag>
 ******************************************************************************/

class AsdfDataSet
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* WAVEFORMS_GROUP;
        static const char* QUAKEML_DATASET;
        static const char* ASDFDICT_DATASET;
        static const char* STATIONXML_NAME;
        static const char* NAME_SEPARATOR;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            std::string         network;
            std::string         station;
            std::string         location;
            std::string         channel;
            std::string         tag;
            int64_t             starttime;      // microseconds since unix epoch
            int64_t             endtime;        // microseconds since unix epoch
            double              samplingRate;   // hz
            std::vector<double> samples;
        } trace_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit                            AsdfDataSet     (H5Session* _session);
                                            ~AsdfDataSet    (void);

        std::vector<std::string>            waveforms       (void);
        std::vector<std::string>            traces          (const char* station);
        trace_t                             readTrace       (const char* station, const char* trace);
        std::string                         readEvents      (void);
        std::string                         readStationXml  (const char* station);
        std::string                         getAsdfDict     (void);

        std::map<std::string, std::vector<double>>  readpArray      (const std::vector<std::string>& names, const char* prefix="", const char* suffix="");
        std::map<std::string, std::string>          readpStrings    (const std::vector<std::string>& names, const char* prefix="", const char* suffix="");

        static void                         parseTraceName  (const char* name, trace_t& trace);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        std::string                         readString      (const char* path);
        std::vector<H5Future*>              readAll         (const std::vector<std::string>& names, const char* prefix, const char* suffix, H5Cloud::valtype_t valtype);

        static std::string                  toString        (const H5Cloud::info_t& info, const char* path);
        static void                         deleteAll       (std::vector<H5Future*>& futures);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Session*  session;    // not owned
};

#endif  /* __h5cloud_asdfdataset__ */
