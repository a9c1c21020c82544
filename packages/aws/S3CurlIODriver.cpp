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

#include "S3CurlIODriver.h"
#include "CredentialStore.h"
#include "core.h"

#include <memory>
#include <string.h>
#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/evp.h>

/******************************************************************************
 * LOCAL TYPEDEFS
 ******************************************************************************/

typedef struct {
    uint8_t*    buffer;
    long        size;
    long        index;
} fixed_data_t;

typedef struct curl_slist* headers_t;

typedef size_t (*write_cb_t)(void*, size_t, size_t, void*);

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * curlWriteFixed
 *----------------------------------------------------------------------------*/
static size_t curlWriteFixed(void *buffer, size_t size, size_t nmemb, void *userp)
{
    fixed_data_t* data = (fixed_data_t*)userp;
    const size_t rsps_size = size * nmemb;
    const size_t bytes_available = data->size - data->index;
    const size_t bytes_to_copy = MIN(rsps_size, bytes_available);
    memcpy(&data->buffer[data->index], buffer, bytes_to_copy);
    data->index += bytes_to_copy;
    return rsps_size; // excess is dropped so error bodies do not abort the transfer
}

/*----------------------------------------------------------------------------
 * curlWriteDiscard
 *----------------------------------------------------------------------------*/
static size_t curlWriteDiscard(void *buffer, size_t size, size_t nmemb, void *userp)
{
    (void)buffer;
    (void)userp;
    return size * nmemb;
}

/*----------------------------------------------------------------------------
 * buildHeadersV2
 *----------------------------------------------------------------------------*/
static headers_t buildHeadersV2 (const char* verb, const S3CurlIODriver::object_t& object)
{
    /* Initial HTTP Header List */
    struct curl_slist* headers = NULL;

    /* Build Date String and Date Header */
    const TimeLib::gmt_time_t gmt_time = TimeLib::gmttime();
    const TimeLib::date_t gmt_date = TimeLib::gmt2date(gmt_time);
    char date[MAX_STR_SIZE];
    StringLib::format(date, MAX_STR_SIZE, "%04d%02d%02dT%02d%02d%02dZ", gmt_date.year, gmt_date.month, gmt_date.day, gmt_time.hour, gmt_time.minute, gmt_time.second);
    const std::string date_header = StringLib::formatString("Date: %s", date);
    headers = curl_slist_append(headers, date_header.c_str());

    const CredentialStore::Credential& credentials = object.credentials;
    if(credentials.provided)
    {
        /* Build SecurityToken Header */
        std::string canonical_amz_headers;
        if(!credentials.sessionToken.empty())
        {
            canonical_amz_headers = "x-amz-security-token:" + credentials.sessionToken + "\n";
            const std::string token_header = "x-amz-security-token: " + credentials.sessionToken;
            headers = curl_slist_append(headers, token_header.c_str());
        }

        /* Build Authorization Header */
        const std::string string_to_sign = std::string(verb) + "\n\n\n" + date + "\n" + canonical_amz_headers + "/" + object.bucket + "/" + object.key;
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_size = EVP_MAX_MD_SIZE; // set below with actual size
        HMAC(EVP_sha1(), credentials.secretAccessKey.c_str(), credentials.secretAccessKey.size(),
             (const unsigned char*)string_to_sign.c_str(), string_to_sign.size(), hash, &hash_size);
        int encoded_size = hash_size;
        char* encoded_hash = StringLib::b64encode(hash, &encoded_size);
        const std::string authorization_header = "Authorization: AWS " + credentials.accessKeyId + ":" + encoded_hash;
        delete [] encoded_hash;
        headers = curl_slist_append(headers, authorization_header.c_str());
    }

    /* Return */
    return headers;
}

/*----------------------------------------------------------------------------
 * initializeRequest
 *----------------------------------------------------------------------------*/
static CURL* initializeRequest (const std::string& url, headers_t headers, write_cb_t write_cb, void* write_parm, long timeout_ms)
{
    /* Initialize cURL */
    CURL* curl = curl_easy_init();
    if(curl)
    {
        /* Set Options */
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, S3CurlIODriver::CONNECTION_TIMEOUT);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, S3CurlIODriver::LOW_SPEED_TIME);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, S3CurlIODriver::LOW_SPEED_LIMIT);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, S3CurlIODriver::SSL_VERIFYPEER);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, S3CurlIODriver::SSL_VERIFYHOST);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, write_parm);
    }
    else
    {
        mlog(CRITICAL, "Failed to initialize cURL request");
    }

    /* Return Handle */
    return curl;
}

/*----------------------------------------------------------------------------
 * timeoutFor
 *
 *  milliseconds left before deadline, capped at the read timeout
 *----------------------------------------------------------------------------*/
static long timeoutFor (int64_t deadline, const char* key)
{
    long timeout_ms = S3CurlIODriver::READ_TIMEOUT * 1000;
    if(deadline > 0)
    {
        const int64_t remaining_ms = (deadline - OsApi::time(OsApi::CPU_CLK)) / 1000;
        if(remaining_ms <= 0)
        {
            throw RunTimeException(CRITICAL, RTE_TIMEOUT, "deadline expired before request for %s", key);
        }
        timeout_ms = MIN(timeout_ms, static_cast<long>(remaining_ms));
    }
    return timeout_ms;
}

/*----------------------------------------------------------------------------
 * checkHttpCode
 *----------------------------------------------------------------------------*/
static void checkHttpCode (long http_code, const char* verb, const S3CurlIODriver::object_t& object)
{
    if(http_code == 404 || http_code == 403)
    {
        throw RunTimeException(CRITICAL, RTE_RESOURCE_DOES_NOT_EXIST, "S3 %s of %s/%s returned http error <%ld>", verb, object.bucket.c_str(), object.key.c_str(), http_code);
    }
    else if(http_code >= 300)
    {
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "S3 %s of %s/%s returned http error <%ld>", verb, object.bucket.c_str(), object.key.c_str(), http_code);
    }
}

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* S3CurlIODriver::FORMAT = "s3";

/******************************************************************************
 * AWS S3 cURL I/O DRIVER CLASS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void S3CurlIODriver::init (void)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void S3CurlIODriver::deinit (void)
{
    curl_global_cleanup();
}

/*----------------------------------------------------------------------------
 * create
 *
 *  asset path is <bucket>[/<prefix>]; object is <endpoint>/<bucket>/<prefix>/<resource>
 *  and the endpoint defaults to the regional s3 endpoint
 *----------------------------------------------------------------------------*/
Asset::io_driver_t S3CurlIODriver::create (const Asset* _asset, const char* resource)
{
    std::shared_ptr<object_t> object = std::make_shared<object_t>();

    /* Split Path into Bucket and Prefix */
    const StringLib::TokenList path_tokens = StringLib::split(_asset->getPath(), MAX_STR_SIZE, PATH_DELIMETER, true);
    if(path_tokens.empty())
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "invalid S3 path for asset %s: %s", _asset->getName(), _asset->getPath());
    }
    object->bucket = path_tokens[0];
    for(size_t i = 1; i < path_tokens.size(); i++)
    {
        object->key += path_tokens[i] + PATH_DELIMETER;
    }

    /* Massage Key */
    const char* key_ptr = resource;
    while(key_ptr[0] == PATH_DELIMETER) key_ptr++;
    object->key += key_ptr;

    /* Build URL */
    std::string endpoint(_asset->getEndpoint());
    if(endpoint.empty()) endpoint = std::string("https://s3.") + _asset->getRegion() + ".amazonaws.com";
    while(!endpoint.empty() && endpoint.back() == PATH_DELIMETER) endpoint.pop_back();
    object->url = endpoint + "/" + object->bucket + "/" + object->key;

    /* Get Credentials */
    object->credentials = CredentialStore::get(_asset->getName());

    /* Bind Capability */
    Asset::io_driver_t driver;
    driver.size = [object]() { return head(*object); };
    driver.read = [object](uint8_t* data, int64_t size, uint64_t pos, int64_t deadline) {
        return get(*object, data, size, pos, deadline);
    };

    mlog(DEBUG, "Created S3 driver for %s", object->url.c_str());
    return driver;
}

/*----------------------------------------------------------------------------
 * head
 *----------------------------------------------------------------------------*/
uint64_t S3CurlIODriver::head (const object_t& object)
{
    curl_off_t content_length = -1;
    long http_code = 0;
    CURLcode res = CURLE_OK;

    int attempts = ATTEMPTS_PER_REQUEST;
    bool rqst_complete = false;
    while(!rqst_complete && (attempts-- > 0))
    {
        headers_t headers = buildHeadersV2("HEAD", object);
        CURL* curl = initializeRequest(object.url, headers, curlWriteDiscard, NULL, READ_TIMEOUT * 1000);
        if(curl)
        {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            res = curl_easy_perform(curl);
            if(res == CURLE_OK)
            {
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
                curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &content_length);
                rqst_complete = true;
            }
            else
            {
                mlog(WARNING, "cURL head failed (%d) for request: %s", res, object.key.c_str());
                OsApi::performIOTimeout();
            }
            curl_easy_cleanup(curl);
        }
        curl_slist_free_all(headers);
    }

    /* Throw Exception on Failure */
    if(!rqst_complete)
    {
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "cURL head request to %s failed: %s", object.url.c_str(), curl_easy_strerror(res));
    }
    checkHttpCode(http_code, "HEAD", object);
    if(content_length < 0)
    {
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "S3 HEAD of %s returned no content length", object.url.c_str());
    }

    return static_cast<uint64_t>(content_length);
}

/*----------------------------------------------------------------------------
 * get - fixed
 *----------------------------------------------------------------------------*/
int64_t S3CurlIODriver::get (const object_t& object, uint8_t* data, int64_t size, uint64_t pos, int64_t deadline)
{
    if(size <= 0) return 0;

    /* Setup Buffer for Callback */
    fixed_data_t info = {
        .buffer = data,
        .size = size,
        .index = 0
    };

    /* Issue Get Request */
    long http_code = 0;
    CURLcode res = CURLE_OK;
    int attempts = ATTEMPTS_PER_REQUEST;
    bool rqst_complete = false;
    while(!rqst_complete && (attempts > 0))
    {
        /* Build Standard Headers */
        headers_t headers = buildHeadersV2("GET", object);

        /* Build Range Header */
        const unsigned long start_byte = pos + info.index;
        const unsigned long end_byte = pos + size - 1;
        const std::string range_header = StringLib::formatString("Range: bytes=%lu-%lu", start_byte, end_byte);
        headers = curl_slist_append(headers, range_header.c_str());

        /* Initialize cURL Request */
        CURL* curl = NULL;
        try
        {
            curl = initializeRequest(object.url, headers, curlWriteFixed, &info, timeoutFor(deadline, object.key.c_str()));
        }
        catch(const RunTimeException&)
        {
            curl_slist_free_all(headers);
            throw;
        }

        if(curl)
        {
            while(!rqst_complete && (attempts-- > 0))
            {
                /* Perform Request */
                res = curl_easy_perform(curl);
                if(res == CURLE_OK)
                {
                    /* Get HTTP Code */
                    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
                    rqst_complete = true;
                }
                else if(info.index > 0)
                {
                    /* Reissue Range Request for Remaining Bytes */
                    mlog(WARNING, "cURL error (%d) encountered after partial response (%ld): %s", res, info.index, object.key.c_str());
                    break;
                }
                else if(res == CURLE_OPERATION_TIMEDOUT)
                {
                    mlog(WARNING, "cURL call timed out (%d) for request: %s", res, object.key.c_str());
                    if(deadline > 0 && OsApi::time(OsApi::CPU_CLK) >= deadline) attempts = 0;
                }
                else
                {
                    mlog(WARNING, "cURL call failed (%d) for request: %s", res, object.key.c_str());
                    OsApi::performIOTimeout();
                }
            }

            /* Clean Up cURL */
            curl_easy_cleanup(curl);
        }
        else
        {
            /* Decrement Attempts on Failed cURL Initialization */
            attempts--;
        }

        /* Clean Up Headers */
        curl_slist_free_all(headers);
    }

    /* Throw Exception on Failure */
    if(!rqst_complete)
    {
        if(res == CURLE_OPERATION_TIMEDOUT)
        {
            throw RunTimeException(CRITICAL, RTE_TIMEOUT, "cURL request to %s timed out", object.url.c_str());
        }
        throw RunTimeException(CRITICAL, RTE_IO_FAILURE, "cURL fixed request to %s failed: %s", object.url.c_str(), curl_easy_strerror(res));
    }
    checkHttpCode(http_code, "GET", object);

    /* Return Bytes Received */
    return info.index;
}
