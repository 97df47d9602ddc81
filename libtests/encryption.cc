#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubEncryptor.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <functional>
#include <iostream>

using Encryptor = ScrubEncryptor;

static ScrubObject
name(std::string const& n)
{
    return ScrubObject::newName(n);
}

static Encryptor::EncryptionConfig
config(scrub_encryption_e method, int key_length)
{
    Encryptor::EncryptionConfig result;
    result.method = method;
    result.key_length = key_length;
    return result;
}

static scrub_error_code_e
error_code(std::function<void()> fn)
{
    try {
        fn();
    } catch (ScrubExc& e) {
        return e.getErrorCode();
    }
    return scrub_e_success;
}

static void
test_keys()
{
    Encryptor e(config(scrub_enc_rc4, 40));
    assert(!e.hasFileKey());
    assert(error_code([&e]() { e.getObjectKey(ScrubObjGen(2)); }) == scrub_e_no_encryption_key);
    assert(error_code([&e]() { e.setFileKey("toolong"); }) == scrub_e_invalid_key_length);

    auto file_key = e.getFileKey();
    assert(file_key.size() == 5);
    assert(e.hasFileKey());
    assert(e.getFileKey() == file_key);

    auto k2 = e.getObjectKey(ScrubObjGen(2));
    assert(k2.size() == 5);
    assert(e.getObjectKey(ScrubObjGen(2)) == k2);
    assert(e.getObjectKey(ScrubObjGen(2, 1)) != k2);
    assert(e.getObjectKey(ScrubObjGen(3)) != k2);
    // One file key and three object keys
    assert(e.getStats().keys_generated == 4);

    // Keys depend only on the file key.
    Encryptor other(config(scrub_enc_rc4, 40));
    other.setFileKey(file_key);
    assert(other.getObjectKey(ScrubObjGen(2)) == k2);
    other.setFileKey("abcde");
    assert(other.getObjectKey(ScrubObjGen(2)) != k2);

    Encryptor aes(config(scrub_enc_aes, 256));
    assert(aes.getFileKey().size() == 32);
    assert(aes.getFileKey() != Encryptor(config(scrub_enc_aes, 256)).getFileKey());

    e.reset();
    assert(!e.hasFileKey());
    assert(e.getStats().keys_generated == 0);
}

static void
test_ciphers()
{
    assert(
        ScrubUtil::hex_encode(Encryptor::rc4("Key", "Plaintext")) == "bbf316e8d940af0ad3");
    auto key = ScrubUtil::hex_decode("000102030405060708090a0b0c0d0e0f");
    auto plain = ScrubUtil::hex_decode("00112233445566778899aabbccddeeff");
    auto cipher = Encryptor::aes(true, key, plain);
    assert(ScrubUtil::hex_encode(cipher) == "69c4e0d86a7b0430d8cdb78070b4c55a");
    assert(Encryptor::aes(false, key, cipher) == plain);

    std::string data = "The quick brown fox jumps over the lazy dog.";
    for (auto const& [method, bits]:
         {std::pair(scrub_enc_rc4, 40),
          std::pair(scrub_enc_rc4, 128),
          std::pair(scrub_enc_aes, 128),
          std::pair(scrub_enc_aes, 256)}) {
        Encryptor e(config(method, bits));
        e.getFileKey();
        auto object_key = e.getObjectKey(ScrubObjGen(4));
        for (size_t len: {0, 5, 16, 37}) {
            auto input = data.substr(0, len);
            auto encrypted = e.encryptData(input, object_key);
            assert(encrypted.size() == len);
            if (len > 0) {
                assert(encrypted != input);
            }
            assert(e.decryptData(encrypted, object_key) == input);
        }
    }

    // A partial AES block is not left in the clear.
    auto tail = Encryptor::aes(true, key, plain + "abc");
    assert(tail.substr(0, 16) == cipher);
    assert(tail.substr(16) != "abc");

    Encryptor identity(config(scrub_enc_identity, 128));
    assert(identity.encryptData(data, "k") == data);
    assert(identity.decryptData(data, "k") == data);

    bool thrown = false;
    try {
        Encryptor::aes(true, "short", plain);
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

static ScrubDocument
make_document()
{
    ScrubDocument doc;
    doc.replaceObject(
        ScrubObjGen(1),
        ScrubObject::newDictionary(
            {{"/Type", name("/Catalog")}, {"/Lang", ScrubObject::newString("en-US")}}));
    doc.replaceObject(
        ScrubObjGen(2),
        ScrubObject::newDictionary(
            {{"/Title", ScrubObject::newString("Quarterly report")},
             {"/Kids",
              ScrubObject::newArray(
                  {ScrubObject::newString("nested"), ScrubObject::newInteger(12)})}}));
    doc.replaceObject(
        ScrubObjGen(3),
        ScrubObject::newStream(
            {{"/T", ScrubObject::newString("in the stream dictionary")}},
            "BT /F1 12 Tf (Hello) Tj ET"));
    doc.replaceObject(
        ScrubObjGen(4),
        ScrubObject::newStream(
            {{"/Type", name("/Metadata")}, {"/Subtype", name("/XML")}}, "<x:xmpmeta/>"));
    doc.replaceObject(ScrubObjGen(5), ScrubObject::newInteger(42));
    doc.setRoot(ScrubObjGen(1));
    return doc;
}

static void
test_config()
{
    // An AES key of 64 bits is not allowed.
    assert(
        error_code([]() { Encryptor e(config(scrub_enc_aes, 64)); }) ==
        scrub_e_invalid_encryption_config);
    assert(
        error_code([]() { Encryptor e(config(scrub_enc_rc4, 256)); }) ==
        scrub_e_invalid_encryption_config);
    assert(error_code([]() { Encryptor e(config(scrub_enc_identity, 7)); }) == scrub_e_success);
    // Identity takes any length, even one that makes no key at all.
    for (int bits: {0, -64, 4096}) {
        assert(
            error_code([bits]() { Encryptor::validateConfig(config(scrub_enc_identity, bits)); }) ==
            scrub_e_success);
    }
    Encryptor empty_key(config(scrub_enc_identity, 0));
    assert(empty_key.getFileKey().empty());
    assert(empty_key.getFileKey().empty());
    auto identity_doc = make_document();
    auto const identity_before = make_document();
    empty_key.encryptDocument(identity_doc);
    for (auto const& [og, obj]: identity_before.getObjects()) {
        assert(identity_doc.getObject(og) == obj);
    }
    assert(identity_doc.getTrailer().encrypt);
    auto c = config(scrub_enc_aes, 128);
    c.revision = 7;
    assert(
        error_code([&c]() { Encryptor::validateConfig(c); }) ==
        scrub_e_invalid_encryption_config);

    Encryptor defaults;
    assert(defaults.getConfig().method == scrub_enc_aes);
    assert(defaults.getConfig().key_length == 256);
    assert(defaults.getConfig().revision == 6);
}

static void
test_document()
{
    for (size_t threads: {0, 4}) {
        auto doc = make_document();
        auto const original = make_document();
        ScrubWorkerPool pool(threads);
        Encryptor e;
        e.encryptDocument(doc, &pool);

        // The object numbered 1 stays in the clear.
        assert(doc.getObject(ScrubObjGen(1)) == original.getObject(ScrubObjGen(1)));
        assert(e.getObjectState(ScrubObjGen(1)) == Encryptor::os_exempt);

        auto title = doc.getObject(ScrubObjGen(2)).getKey("/Title");
        assert(title.getStringValue().size() == std::string("Quarterly report").size());
        assert(title.getStringValue() != "Quarterly report");
        assert(
            doc.getObject(ScrubObjGen(2)).getKey("/Kids").getArrayItem(0).getStringValue() !=
            "nested");
        auto stream = doc.getObject(ScrubObjGen(3));
        assert(stream.getStreamData() != "BT /F1 12 Tf (Hello) Tj ET");
        assert(stream.getKey("/T").getStringValue() != "in the stream dictionary");
        assert(doc.getObject(ScrubObjGen(4)).getStreamData() != "<x:xmpmeta/>");
        assert(doc.getObject(ScrubObjGen(5)) == original.getObject(ScrubObjGen(5)));
        assert(e.getObjectState(ScrubObjGen(3)) == Encryptor::os_encrypted);
        assert(e.getObjectState(ScrubObjGen(9)) == Encryptor::os_unprocessed);

        auto const& encrypt = doc.getTrailer().encrypt;
        assert(encrypt);
        assert(encrypt->getKey("/Filter").isNameAndEquals("/Standard"));
        assert(encrypt->getKey("/V").getIntValue() == 5);
        assert(encrypt->getKey("/R").getIntValue() == 6);
        assert(encrypt->getKey("/Length").getIntValue() == 256);
        assert(encrypt->getKey("/P").getIntValue() == -4);
        assert(encrypt->getKey("/StmF").isNameAndEquals("/StdCF"));
        assert(encrypt->getKey("/StrF").isNameAndEquals("/StdCF"));
        assert(encrypt->getKey("/CF").getKey("/StdCF").getKey("/CFM").isNameAndEquals("/AESV3"));
        assert(!encrypt->hasKey("/EncryptMetadata"));

        auto stats = e.getStats();
        assert(stats.objects_encrypted == 4);
        assert(stats.bytes_processed > 0);

        // Encrypting twice is refused and changes nothing.
        auto encrypted = doc;
        assert(error_code([&e, &doc]() { e.encryptDocument(doc); }) == scrub_e_crypto);
        for (auto const& [og, obj]: encrypted.getObjects()) {
            assert(doc.getObject(og) == obj);
        }

        e.decryptDocument(doc, &pool);
        assert(!doc.getTrailer().encrypt);
        assert(doc.getObjects().size() == original.getObjects().size());
        for (auto const& [og, obj]: original.getObjects()) {
            assert(doc.getObject(og) == obj);
        }
        assert(e.getStats().objects_decrypted == 4);
        assert(e.getObjectState(ScrubObjGen(3)) == Encryptor::os_decrypted);
    }
}

static void
test_options()
{
    // Metadata streams may be left in the clear.
    auto c = config(scrub_enc_rc4, 128);
    c.encrypt_metadata = false;
    c.revision = 4;
    c.permissions = -3904;
    Encryptor e(c);
    auto doc = make_document();
    e.encryptDocument(doc);
    assert(doc.getObject(ScrubObjGen(4)).getStreamData() == "<x:xmpmeta/>");
    assert(e.getObjectState(ScrubObjGen(4)) == Encryptor::os_exempt);
    auto const& encrypt = *doc.getTrailer().encrypt;
    assert(encrypt.getKey("/V").getIntValue() == 4);
    assert(encrypt.getKey("/R").getIntValue() == 4);
    assert(encrypt.getKey("/P").getIntValue() == -3904);
    assert(encrypt.getKey("/CF").getKey("/StdCF").getKey("/CFM").isNameAndEquals("/V2"));
    assert(encrypt.getKey("/CF").getKey("/StdCF").getKey("/Length").getIntValue() == 16);
    assert(encrypt.getKey("/EncryptMetadata").isBool());
    assert(!encrypt.getKey("/EncryptMetadata").getBoolValue());

    // Encrypt dictionaries are never encrypted.
    assert(e.isExempt(
        ScrubObjGen(7), ScrubObject::newDictionary({{"/Type", name("/Encrypt")}})));
    assert(!e.isExempt(ScrubObjGen(7), ScrubObject::newDictionary()));

    // Decrypting needs the key.
    Encryptor keyless(c);
    assert(error_code([&keyless, &doc]() { keyless.decryptDocument(doc); }) ==
           scrub_e_no_encryption_key);

    // A provider can be chosen by name.
    Encryptor named;
    bool thrown = false;
    try {
        named.setCryptoProvider("no such provider");
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

int
main()
{
    test_config();
    test_keys();
    test_ciphers();
    test_document();
    test_options();
    std::cout << "encryption tests passed" << std::endl;
    return 0;
}
