#include <pdfscrub/ScrubEncryptor.hh>

#include <pdfscrub/Pl_SHA2.hh>
#include <pdfscrub/RC4.hh>
#include <pdfscrub/ScrubCryptoProvider.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubWorkerPool.hh>
#include <pdfscrub/Util.hh>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace pdfscrub;

namespace
{
    size_t constexpr key_shards = 16;

    struct KeyShard
    {
        std::mutex mutex;
        std::map<ScrubObjGen, std::string> keys;
    };

    std::string
    aes_transform(
        std::shared_ptr<ScrubCryptoImpl> const& crypto,
        bool encrypt,
        std::string const& key,
        std::string const& data)
    {
        auto const block = ScrubCryptoImpl::rijndael_buf_size;
        if (!(key.size() == 16 || key.size() == 24 || key.size() == 32)) {
            throw std::runtime_error(
                "AES key must be 16, 24, or 32 bytes, not " + std::to_string(key.size()));
        }
        auto key_data = reinterpret_cast<unsigned char const*>(key.data());
        size_t full_blocks = data.size() / block;
        std::string result = data;
        auto out = reinterpret_cast<unsigned char*>(result.data());

        if (full_blocks > 0) {
            unsigned char inbuf[block];
            crypto->rijndael_init(encrypt, key_data, key.size());
            for (size_t i = 0; i < full_blocks; ++i) {
                memcpy(inbuf, out + i * block, block);
                crypto->rijndael_process(inbuf, out + i * block);
            }
            crypto->rijndael_finalize();
        }

        size_t tail = data.size() - full_blocks * block;
        if (tail > 0) {
            // The keystream for the partial block is produced in the
            // encrypt direction for both operations.
            auto counter = util::le_bytes(full_blocks, block);
            unsigned char keystream[block];
            crypto->rijndael_init(true, key_data, key.size());
            crypto->rijndael_process(reinterpret_cast<unsigned char*>(counter.data()), keystream);
            crypto->rijndael_finalize();
            for (size_t i = 0; i < tail; ++i) {
                out[full_blocks * block + i] ^= keystream[i];
            }
        }
        return result;
    }
} // namespace

class ScrubEncryptor::Members
{
    friend class ScrubEncryptor;

  public:
    Members(EncryptionConfig const& config) :
        config(config)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    std::shared_ptr<ScrubCryptoImpl>
    getCrypto() const
    {
        return provider.empty() ? ScrubCryptoProvider::getImpl()
                                : ScrubCryptoProvider::getImpl(provider);
    }

    EncryptionConfig config;
    std::string provider;
    std::optional<std::string> file_key;
    std::array<KeyShard, key_shards> shards;
    std::map<ScrubObjGen, object_state_e> states;
    std::atomic<size_t> keys_generated{0};
    size_t objects_encrypted{0};
    size_t objects_decrypted{0};
    size_t bytes_processed{0};
    std::chrono::microseconds duration{0};
};

ScrubEncryptor::ScrubEncryptor() :
    m(std::make_unique<Members>(EncryptionConfig()))
{
}

ScrubEncryptor::ScrubEncryptor(EncryptionConfig const& config)
{
    validateConfig(config);
    m = std::make_unique<Members>(config);
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubEncryptor::~ScrubEncryptor() = default;

void
ScrubEncryptor::validateConfig(EncryptionConfig const& config)
{
    auto bad = [](std::string const& msg) {
        throw ScrubExc(scrub_e_invalid_encryption_config, "encrypt", "", msg);
    };
    switch (config.method) {
    case scrub_enc_rc4:
        if (!(config.key_length == 40 || config.key_length == 128)) {
            bad("RC4 key length must be 40 or 128 bits, not " +
                std::to_string(config.key_length));
        }
        break;

    case scrub_enc_aes:
        if (!(config.key_length == 128 || config.key_length == 256)) {
            bad("AES key length must be 128 or 256 bits, not " +
                std::to_string(config.key_length));
        }
        break;

    case scrub_enc_identity:
        // Any length; identity keys are never used.
        break;

    default:
        bad("unknown encryption method");
    }
    if (config.revision < 2 || config.revision > 6) {
        bad("revision must be between 2 and 6, not " + std::to_string(config.revision));
    }
}

ScrubEncryptor::EncryptionConfig const&
ScrubEncryptor::getConfig() const
{
    return m->config;
}

void
ScrubEncryptor::setCryptoProvider(std::string const& name)
{
    // Fail now rather than inside a worker.
    ScrubCryptoProvider::getImpl(name);
    m->provider = name;
}

size_t
ScrubEncryptor::keyBytes() const
{
    if (m->config.key_length <= 0) {
        return 0;
    }
    return std::min(size_t(32), size_t((m->config.key_length + 7) / 8));
}

void
ScrubEncryptor::setFileKey(std::string const& key)
{
    if (key.size() != keyBytes()) {
        throw ScrubExc(
            scrub_e_invalid_key_length,
            "encrypt",
            "",
            "file key must be " + std::to_string(keyBytes()) + " bytes, not " +
                std::to_string(key.size()));
    }
    m->file_key = key;
    for (auto& shard: m->shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.keys.clear();
    }
}

std::string
ScrubEncryptor::getFileKey()
{
    if (!m->file_key) {
        auto crypto = m->getCrypto();
        std::string seed(32, '\0');
        crypto->provideRandomData(reinterpret_cast<unsigned char*>(seed.data()), seed.size());
        seed += util::le_bytes(static_cast<unsigned long long>(m->config.key_length), 4);
        seed += util::le_bytes(static_cast<unsigned long long>(m->config.revision), 4);
        m->file_key = Pl_SHA2::digest(256, seed, crypto).substr(0, keyBytes());
        ++m->keys_generated;
    }
    return *m->file_key;
}

bool
ScrubEncryptor::hasFileKey() const
{
    return m->file_key.has_value();
}

std::string
ScrubEncryptor::getObjectKey(ScrubObjGen og)
{
    if (!m->file_key) {
        throw ScrubExc(
            scrub_e_no_encryption_key, "encrypt", og.unparse(' '), "no file key is available");
    }
    auto& shard = m->shards.at(
        (static_cast<size_t>(og.getObj()) * 31 + static_cast<size_t>(og.getGen())) % key_shards);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto iter = shard.keys.find(og);
    if (iter != shard.keys.end()) {
        return iter->second;
    }
    std::string seed = *m->file_key;
    seed += util::le_bytes(static_cast<unsigned long long>(og.getObj()), 4);
    seed += util::le_bytes(static_cast<unsigned long long>(og.getGen()), 2);
    auto key = Pl_SHA2::digest(256, seed, m->getCrypto()).substr(0, keyBytes());
    shard.keys[og] = key;
    ++m->keys_generated;
    return key;
}

std::string
ScrubEncryptor::rc4(std::string const& key, std::string const& data)
{
    std::string result = data;
    RC4::process(key, result, ScrubCryptoProvider::getImpl());
    return result;
}

std::string
ScrubEncryptor::aes(bool encrypt, std::string const& key, std::string const& data)
{
    return aes_transform(ScrubCryptoProvider::getImpl(), encrypt, key, data);
}

std::string
ScrubEncryptor::encryptData(std::string const& data, std::string const& key) const
{
    switch (m->config.method) {
    case scrub_enc_rc4:
        {
            std::string result = data;
            RC4::process(key, result, m->getCrypto());
            return result;
        }
    case scrub_enc_aes:
        return aes_transform(m->getCrypto(), true, key, data);
    default:
        return data;
    }
}

std::string
ScrubEncryptor::decryptData(std::string const& data, std::string const& key) const
{
    if (m->config.method == scrub_enc_aes) {
        return aes_transform(m->getCrypto(), false, key, data);
    }
    return encryptData(data, key);
}

bool
ScrubEncryptor::isExempt(ScrubObjGen og, ScrubObject const& obj) const
{
    if (og.getObj() == 1) {
        return true;
    }
    if (obj.isDictionaryOfType("/Encrypt")) {
        return true;
    }
    return !m->config.encrypt_metadata && obj.isStream() && obj.isDictionaryOfType("/Metadata");
}

void
ScrubEncryptor::transformDocument(ScrubDocument& doc, ScrubWorkerPool* pool, bool encrypt)
{
    auto start = std::chrono::steady_clock::now();
    std::string const stage = encrypt ? "encrypt" : "decrypt";

    struct Slot
    {
        ScrubObjGen og;
        ScrubObject const* obj;
        bool exempt{false};
        std::optional<ScrubObject> result;
        size_t bytes{0};
    };
    std::vector<Slot> slots;
    for (auto const& [og, obj]: doc.getObjects()) {
        slots.push_back({og, &obj, isExempt(og, obj), std::nullopt, 0});
    }

    try {
        ScrubWorkerPool::forEachIndex(pool, slots.size(), [this, &slots, encrypt](size_t i) {
            auto& slot = slots.at(i);
            if (slot.exempt) {
                return;
            }
            auto key = getObjectKey(slot.og);
            ScrubObject copy = *slot.obj;
            size_t bytes = 0;
            copy.forEach([this, &key, &bytes, encrypt](ScrubObject& o) {
                if (o.isString()) {
                    bytes += o.getStringValue().size();
                    o.setStringValue(
                        encrypt ? encryptData(o.getStringValue(), key)
                                : decryptData(o.getStringValue(), key));
                } else if (o.isStream()) {
                    bytes += o.getStreamData().size();
                    o.replaceStreamData(
                        encrypt ? encryptData(o.getStreamData(), key)
                                : decryptData(o.getStreamData(), key));
                }
            });
            slot.result = std::move(copy);
            slot.bytes = bytes;
        });
    } catch (ScrubExc&) {
        throw;
    } catch (std::runtime_error& e) {
        throw ScrubExc(scrub_e_crypto, stage, "", e.what());
    }

    // Every object was transformed, so it is safe to commit.
    for (auto& slot: slots) {
        if (slot.exempt) {
            m->states[slot.og] = os_exempt;
            continue;
        }
        doc.replaceObject(slot.og, *slot.result);
        m->states[slot.og] = encrypt ? os_encrypted : os_decrypted;
        m->bytes_processed += slot.bytes;
        if (encrypt) {
            ++m->objects_encrypted;
        } else {
            ++m->objects_decrypted;
        }
    }
    m->duration += std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

void
ScrubEncryptor::encryptDocument(ScrubDocument& doc, ScrubWorkerPool* pool)
{
    validateConfig(m->config);
    if (doc.getTrailer().encrypt) {
        throw ScrubExc(scrub_e_crypto, "encrypt", "", "document is already encrypted");
    }
    getFileKey();
    transformDocument(doc, pool, true);
    doc.getTrailer().encrypt = createEncryptDictionary();
}

void
ScrubEncryptor::decryptDocument(ScrubDocument& doc, ScrubWorkerPool* pool)
{
    if (!m->file_key) {
        throw ScrubExc(scrub_e_no_encryption_key, "decrypt", "", "no file key is available");
    }
    transformDocument(doc, pool, false);
    doc.getTrailer().encrypt.reset();
}

ScrubObject
ScrubEncryptor::createEncryptDictionary() const
{
    auto const& config = m->config;
    std::string cfm;
    switch (config.method) {
    case scrub_enc_rc4:
        cfm = "/V2";
        break;
    case scrub_enc_aes:
        cfm = config.key_length > 128 ? "/AESV3" : "/AESV2";
        break;
    default:
        cfm = "/None";
        break;
    }
    auto stdcf = ScrubObject::newDictionary(
        {{"/AuthEvent", ScrubObject::newName("/DocOpen")},
         {"/CFM", ScrubObject::newName(cfm)},
         {"/Length", ScrubObject::newInteger(config.key_length / 8)}});
    auto dict = ScrubObject::newDictionary(
        {{"/Filter", ScrubObject::newName("/Standard")},
         {"/V", ScrubObject::newInteger(config.key_length > 128 ? 5 : 4)},
         {"/R", ScrubObject::newInteger(config.revision)},
         {"/Length", ScrubObject::newInteger(config.key_length)},
         {"/P", ScrubObject::newInteger(config.permissions)},
         {"/CF", ScrubObject::newDictionary({{"/StdCF", stdcf}})},
         {"/StmF", ScrubObject::newName("/StdCF")},
         {"/StrF", ScrubObject::newName("/StdCF")}});
    if (!config.encrypt_metadata) {
        dict.replaceKey("/EncryptMetadata", ScrubObject::newBool(false));
    }
    return dict;
}

ScrubEncryptor::object_state_e
ScrubEncryptor::getObjectState(ScrubObjGen og) const
{
    auto iter = m->states.find(og);
    return iter == m->states.end() ? os_unprocessed : iter->second;
}

ScrubEncryptor::Stats
ScrubEncryptor::getStats() const
{
    Stats stats;
    stats.objects_encrypted = m->objects_encrypted;
    stats.objects_decrypted = m->objects_decrypted;
    stats.keys_generated = m->keys_generated.load();
    stats.bytes_processed = m->bytes_processed;
    stats.duration = m->duration;
    return stats;
}

void
ScrubEncryptor::reset()
{
    m->file_key.reset();
    for (auto& shard: m->shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.keys.clear();
    }
    m->states.clear();
    m->keys_generated = 0;
    m->objects_encrypted = 0;
    m->objects_decrypted = 0;
    m->bytes_processed = 0;
    m->duration = std::chrono::microseconds(0);
}
