// Copyright (c) 2005-2022 Jay Berkenbilt
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SCRUBCRYPTOIMPL_HH
#define SCRUBCRYPTOIMPL_HH

#include <pdfscrub/DLL.h>

#include <string>

// This class is part of pdfscrub's pluggable crypto provider support.
// Most users won't need to know or care about this class, but you can
// use it if you want to supply your own crypto implementation. To do
// so, provide an implementation of ScrubCryptoImpl, register it by
// calling ScrubCryptoProvider::registerImpl, and make it the default
// by calling ScrubCryptoProvider::setDefaultProvider.
//
// An instance is not thread-safe. Obtain a separate instance from
// ScrubCryptoProvider::getImpl() for each thread.

class PDFSCRUB_DLL_CLASS ScrubCryptoImpl
{
  public:
    PDFSCRUB_DLL
    ScrubCryptoImpl() = default;

    PDFSCRUB_DLL
    virtual ~ScrubCryptoImpl() = default;

    // Random Number Generation

    PDFSCRUB_DLL
    virtual void provideRandomData(unsigned char* data, size_t len) = 0;

    // Hashing

    PDFSCRUB_DLL
    virtual void SHA2_init(int bits) = 0;
    PDFSCRUB_DLL
    virtual void SHA2_update(unsigned char const* data, size_t len) = 0;
    PDFSCRUB_DLL
    virtual void SHA2_finalize() = 0;
    PDFSCRUB_DLL
    virtual std::string SHA2_digest() = 0;

    // Encryption/Decryption

    // key_len of -1 means treat key_data as a null-terminated string
    PDFSCRUB_DLL
    virtual void RC4_init(unsigned char const* key_data, int key_len = -1) = 0;
    // out_data = nullptr means to encrypt/decrypt in place
    PDFSCRUB_DLL
    virtual void
    RC4_process(unsigned char const* in_data, size_t len, unsigned char* out_data = nullptr) = 0;
    PDFSCRUB_DLL
    virtual void RC4_finalize() = 0;

    // AES with a 16, 24, or 32 byte key. Each block is processed
    // independently (ECB).
    static size_t constexpr rijndael_buf_size = 16;
    PDFSCRUB_DLL
    virtual void
    rijndael_init(bool encrypt, unsigned char const* key_data, size_t key_len) = 0;
    PDFSCRUB_DLL
    virtual void rijndael_process(unsigned char* in_data, unsigned char* out_data) = 0;
    PDFSCRUB_DLL
    virtual void rijndael_finalize() = 0;
};

#endif // SCRUBCRYPTOIMPL_HH
