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

#ifndef SCRUBENCRYPTOR_HH
#define SCRUBENCRYPTOR_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/ScrubObject.hh>

#include <chrono>
#include <memory>
#include <string>

class ScrubDocument;
class ScrubWorkerPool;

// ScrubEncryptor applies a per-object cipher to every string and every
// stream's data.
//
// Keys: the file key is SHA-256 over 32 random bytes, the key length
// in bits (4 bytes, little-endian), and the revision (4 bytes,
// little-endian), truncated to key_length / 8 bytes. Each object's key
// is SHA-256 over the file key, the object number (4 bytes,
// little-endian), and the generation (2 bytes, little-endian),
// truncated the same way. Object keys are computed once and cached.
//
// Ciphers: RC4 is its own inverse. For AES, whole 16-byte blocks are
// encrypted independently with the object key, and a final partial
// block is XORed with the encryption of a counter block holding the
// number of whole blocks (16 bytes, little-endian). Output is always
// the same length as the input and decryption restores the input
// exactly. Identity leaves data unchanged.
//
// The object numbered 1, any object whose /Type is /Encrypt, and, if
// encrypt_metadata is false, any stream whose /Type is /Metadata are
// left in the clear.
//
// Crypto comes from ScrubCryptoProvider; each worker obtains its own
// implementation instance.
class ScrubEncryptor
{
  public:
    struct EncryptionConfig
    {
        scrub_encryption_e method{scrub_enc_aes};
        // In bits. RC4: 40 or 128. AES: 128 or 256. Identity: any.
        int key_length{256};
        bool encrypt_metadata{true};
        // 2 through 6
        int revision{6};
        // Value of /P
        int permissions{-4};
    };

    enum object_state_e { os_unprocessed, os_encrypted, os_decrypted, os_exempt };

    struct Stats
    {
        size_t objects_encrypted{0};
        size_t objects_decrypted{0};
        size_t keys_generated{0};
        size_t bytes_processed{0};
        std::chrono::microseconds duration{0};
    };

    // Throws ScrubExc with scrub_e_invalid_encryption_config if the
    // configuration is not valid.
    PDFSCRUB_DLL
    ScrubEncryptor();
    PDFSCRUB_DLL
    explicit ScrubEncryptor(EncryptionConfig const& config);
    PDFSCRUB_DLL
    ~ScrubEncryptor();

    // Throws ScrubExc with scrub_e_invalid_encryption_config.
    PDFSCRUB_DLL
    static void validateConfig(EncryptionConfig const& config);

    PDFSCRUB_DLL
    EncryptionConfig const& getConfig() const;

    // Use the named crypto provider instead of the default one.
    PDFSCRUB_DLL
    void setCryptoProvider(std::string const& name);

    // Supply the file key instead of generating one. Throws ScrubExc
    // with scrub_e_invalid_key_length if its length is not
    // key_length / 8 bytes (at most 32). Clears cached object keys.
    PDFSCRUB_DLL
    void setFileKey(std::string const& key);
    // Return the file key, generating it if necessary.
    PDFSCRUB_DLL
    std::string getFileKey();
    PDFSCRUB_DLL
    bool hasFileKey() const;

    // Return the key for `og'. Throws ScrubExc with
    // scrub_e_no_encryption_key if there is no file key. Safe to call
    // from several threads.
    PDFSCRUB_DLL
    std::string getObjectKey(ScrubObjGen og);

    // Transform `data' with the configured method.
    PDFSCRUB_DLL
    std::string encryptData(std::string const& data, std::string const& key) const;
    PDFSCRUB_DLL
    std::string decryptData(std::string const& data, std::string const& key) const;

    PDFSCRUB_DLL
    static std::string rc4(std::string const& key, std::string const& data);
    PDFSCRUB_DLL
    static std::string aes(bool encrypt, std::string const& key, std::string const& data);

    PDFSCRUB_DLL
    bool isExempt(ScrubObjGen og, ScrubObject const& obj) const;

    // Encrypt every non-exempt object and store the Encrypt dictionary
    // in the trailer. The configuration is checked and all objects are
    // transformed before anything in the document is replaced, so on
    // error the document is unchanged. Throws ScrubExc with
    // scrub_e_crypto if the document is already encrypted or a cipher
    // fails.
    PDFSCRUB_DLL
    void encryptDocument(ScrubDocument& doc, ScrubWorkerPool* pool = nullptr);
    // Reverse encryptDocument using this encryptor's configuration and
    // file key, and remove the Encrypt dictionary. Throws ScrubExc with
    // scrub_e_no_encryption_key if there is no file key.
    PDFSCRUB_DLL
    void decryptDocument(ScrubDocument& doc, ScrubWorkerPool* pool = nullptr);

    PDFSCRUB_DLL
    ScrubObject createEncryptDictionary() const;

    PDFSCRUB_DLL
    object_state_e getObjectState(ScrubObjGen og) const;
    PDFSCRUB_DLL
    Stats getStats() const;
    // Forget keys, cached object keys, object states, and statistics.
    PDFSCRUB_DLL
    void reset();

  private:
    ScrubEncryptor(ScrubEncryptor const&) = delete;
    ScrubEncryptor& operator=(ScrubEncryptor const&) = delete;

    size_t keyBytes() const;
    void transformDocument(ScrubDocument& doc, ScrubWorkerPool* pool, bool encrypt);

    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBENCRYPTOR_HH
