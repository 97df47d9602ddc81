#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubCryptoImpl.hh>
#include <pdfscrub/ScrubCryptoProvider.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <cstring>
#include <iostream>
#include <stdexcept>

// A crypto implementation that does nothing useful. It lets us
// exercise registering, querying, and selecting a provider.
class Potato: public ScrubCryptoImpl
{
  public:
    void
    provideRandomData(unsigned char* data, size_t len) override
    {
        std::memset(data, 'p', len);
    }
    void
    SHA2_init(int) override
    {
    }
    void
    SHA2_update(unsigned char const*, size_t) override
    {
    }
    void
    SHA2_finalize() override
    {
    }
    std::string
    SHA2_digest() override
    {
        return "potato";
    }
    void
    RC4_init(unsigned char const*, int) override
    {
    }
    void
    RC4_process(unsigned char const*, size_t, unsigned char*) override
    {
    }
    void
    RC4_finalize() override
    {
    }
    void
    rijndael_init(bool, unsigned char const*, size_t) override
    {
    }
    void
    rijndael_process(unsigned char*, unsigned char*) override
    {
    }
    void
    rijndael_finalize() override
    {
    }
};

static std::string
sha256(ScrubCryptoImpl& impl, std::string const& data)
{
    impl.SHA2_init(256);
    impl.SHA2_update(reinterpret_cast<unsigned char const*>(data.data()), data.size());
    impl.SHA2_finalize();
    return ScrubUtil::hex_encode(impl.SHA2_digest());
}

static void
test_sha2(ScrubCryptoImpl& impl)
{
    assert(
        sha256(impl, "abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(
        sha256(impl, "") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    impl.SHA2_init(512);
    impl.SHA2_update(reinterpret_cast<unsigned char const*>("abc"), 3);
    impl.SHA2_finalize();
    auto digest = impl.SHA2_digest();
    assert(digest.size() == 64);
    assert(ScrubUtil::hex_encode(digest).substr(0, 16) == "ddaf35a193617aba");
}

static void
test_rc4(ScrubCryptoImpl& impl)
{
    // Convert in place with a string key
    unsigned char data[6];
    std::memcpy(data, "potato", 6);
    impl.RC4_init(reinterpret_cast<unsigned char const*>("quack"));
    impl.RC4_process(data, 6);
    impl.RC4_finalize();
    assert(std::memcmp(data, "\xa5\x6f\xe7\x27\x2b\x5c", 6) == 0);

    // RC4 is symmetric
    unsigned char out[6];
    impl.RC4_init(reinterpret_cast<unsigned char const*>("quack"), 5);
    impl.RC4_process(data, 6, out);
    impl.RC4_finalize();
    assert(std::memcmp(out, "potato", 6) == 0);
}

static void
test_aes(ScrubCryptoImpl& impl)
{
    auto key = ScrubUtil::hex_decode("000102030405060708090a0b0c0d0e0f");
    auto plain = ScrubUtil::hex_decode("00112233445566778899aabbccddeeff");
    unsigned char in[16];
    unsigned char out[16];

    std::memcpy(in, plain.data(), 16);
    impl.rijndael_init(true, reinterpret_cast<unsigned char const*>(key.data()), key.size());
    impl.rijndael_process(in, out);
    impl.rijndael_finalize();
    std::string cipher(reinterpret_cast<char*>(out), 16);
    assert(ScrubUtil::hex_encode(cipher) == "69c4e0d86a7b0430d8cdb78070b4c55a");

    std::memcpy(in, out, 16);
    impl.rijndael_init(false, reinterpret_cast<unsigned char const*>(key.data()), key.size());
    impl.rijndael_process(in, out);
    impl.rijndael_finalize();
    assert(std::string(reinterpret_cast<char*>(out), 16) == plain);

    // AES-256 with the FIPS-197 key
    auto key256 =
        ScrubUtil::hex_decode("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
    std::memcpy(in, plain.data(), 16);
    impl.rijndael_init(
        true, reinterpret_cast<unsigned char const*>(key256.data()), key256.size());
    impl.rijndael_process(in, out);
    impl.rijndael_finalize();
    cipher = std::string(reinterpret_cast<char*>(out), 16);
    assert(ScrubUtil::hex_encode(cipher) == "8ea2b7ca516745bfeafc49904b496089");
}

static void
test_random(ScrubCryptoImpl& impl)
{
    unsigned char a[32];
    unsigned char b[32];
    impl.provideRandomData(a, sizeof(a));
    impl.provideRandomData(b, sizeof(b));
    assert(std::memcmp(a, b, sizeof(a)) != 0);
}

static void
test_provider()
{
    auto initial = ScrubCryptoProvider::getDefaultProvider();
    assert(ScrubCryptoProvider::getRegisteredImpls().count(initial) == 1);

    bool thrown = false;
    try {
        ScrubCryptoProvider::getImpl("nonexistent");
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);

    ScrubCryptoProvider::registerImpl("potato", std::make_shared<Potato>);
    ScrubCryptoProvider::setDefaultProvider("potato");
    assert(ScrubCryptoProvider::getDefaultProvider() == "potato");
    auto impl = ScrubCryptoProvider::getImpl();
    impl->SHA2_init(256);
    impl->SHA2_finalize();
    assert(impl->SHA2_digest() == "potato");

    ScrubCryptoProvider::setDefaultProvider(initial);
    assert(ScrubCryptoProvider::getDefaultProvider() == initial);
}

int
main()
{
    for (auto const& name: ScrubCryptoProvider::getRegisteredImpls()) {
        auto impl = ScrubCryptoProvider::getImpl(name);
        test_sha2(*impl);
        test_rc4(*impl);
        test_aes(*impl);
        test_random(*impl);
        std::cout << name << ": passed" << std::endl;
    }
    test_provider();
    std::cout << "crypto tests passed" << std::endl;
    return 0;
}
