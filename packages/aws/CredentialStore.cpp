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

#include "CredentialStore.h"
#include "EventLib.h"
#include "OsApi.h"

#include <stdlib.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

Mutex CredentialStore::credentialLock;
std::map<std::string, CredentialStore::Credential> CredentialStore::credentialStore;

const char* CredentialStore::ACCESS_KEY_ID_ENV = "AWS_ACCESS_KEY_ID";
const char* CredentialStore::SECRET_ACCESS_KEY_ENV = "AWS_SECRET_ACCESS_KEY";
const char* CredentialStore::SESSION_TOKEN_ENV = "AWS_SESSION_TOKEN";

/******************************************************************************
 * CREDENTIAL STORE CLASS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void CredentialStore::init (void)
{
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void CredentialStore::deinit (void)
{
    credentialLock.lock();
    {
        credentialStore.clear();
    }
    credentialLock.unlock();
}

/*----------------------------------------------------------------------------
 * get
 *
 *  returns an unprovided credential when nothing is stored for identity
 *----------------------------------------------------------------------------*/
CredentialStore::Credential CredentialStore::get (const char* identity)
{
    Credential credential;

    credentialLock.lock();
    {
        std::map<std::string, Credential>::const_iterator iter = credentialStore.find(identity);
        if(iter != credentialStore.end()) credential = iter->second;
    }
    credentialLock.unlock();

    return credential;
}

/*----------------------------------------------------------------------------
 * put
 *----------------------------------------------------------------------------*/
bool CredentialStore::put (const char* identity, const Credential& credential)
{
    if( (credential.accessKeyId.size() >= MAX_KEY_SIZE) ||
        (credential.secretAccessKey.size() >= MAX_KEY_SIZE) ||
        (credential.sessionToken.size() >= MAX_KEY_SIZE) )
    {
        mlog(ERROR, "Credential for %s exceeds maximum key size", identity);
        return false;
    }

    credentialLock.lock();
    {
        credentialStore[identity] = credential;
    }
    credentialLock.unlock();

    return true;
}

/*----------------------------------------------------------------------------
 * fromEnvironment
 *----------------------------------------------------------------------------*/
bool CredentialStore::fromEnvironment (const char* identity)
{
    const char* key_id = getenv(ACCESS_KEY_ID_ENV);
    const char* secret_key = getenv(SECRET_ACCESS_KEY_ENV);
    const char* token = getenv(SESSION_TOKEN_ENV);

    if(!key_id || !secret_key)
    {
        mlog(DEBUG, "No credentials found in environment for %s", identity);
        return false;
    }

    return put(identity, Credential(key_id, secret_key, token));
}
