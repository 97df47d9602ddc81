#include <pdfscrub/ScrubCrypto_gnutls.hh>

#include <pdfscrub/ScrubIntC.hh>

#include <cstring>
#include <stdexcept>

ScrubCrypto_gnutls::ScrubCrypto_gnutls()
{
    memset(digest, 0, sizeof(digest));
}

ScrubCrypto_gnutls::~ScrubCrypto_gnutls()
{
    if (hash_ctx) {
        gnutls_hash_deinit(hash_ctx, digest);
    }
    if (cipher_ctx) {
        gnutls_cipher_deinit(cipher_ctx);
    }
}

void
ScrubCrypto_gnutls::provideRandomData(unsigned char* data, size_t len)
{
    int code = gnutls_rnd(GNUTLS_RND_KEY, data, len);
    if (code < 0) {
        throw std::runtime_error(
            std::string("gnutls: random number generation error: ") +
            std::string(gnutls_strerror(code)));
    }
}

void
ScrubCrypto_gnutls::RC4_init(unsigned char const* key_data, int key_len)
{
    RC4_finalize();
    if (key_len == -1) {
        key_len = ScrubIntC::to_int(strlen(reinterpret_cast<char const*>(key_data)));
    }
    gnutls_datum_t key;
    key.data = const_cast<unsigned char*>(key_data);
    key.size = ScrubIntC::to_uint(key_len);

    int code = gnutls_cipher_init(&cipher_ctx, GNUTLS_CIPHER_ARCFOUR_128, &key, nullptr);
    if (code < 0) {
        cipher_ctx = nullptr;
        throw std::runtime_error(
            std::string("gnutls: RC4 error: ") + std::string(gnutls_strerror(code)));
    }
}

void
ScrubCrypto_gnutls::RC4_process(unsigned char const* in_data, size_t len, unsigned char* out_data)
{
    if (out_data == nullptr) {
        out_data = const_cast<unsigned char*>(in_data);
    }
    int code = gnutls_cipher_encrypt2(cipher_ctx, in_data, len, out_data, len);
    if (code < 0) {
        throw std::runtime_error(
            std::string("gnutls: RC4 error: ") + std::string(gnutls_strerror(code)));
    }
}

void
ScrubCrypto_gnutls::RC4_finalize()
{
    if (cipher_ctx) {
        gnutls_cipher_deinit(cipher_ctx);
        cipher_ctx = nullptr;
    }
}

void
ScrubCrypto_gnutls::SHA2_init(int bits)
{
    SHA2_finalize();
    gnutls_digest_algorithm_t alg = GNUTLS_DIG_UNKNOWN;
    switch (bits) {
    case 256:
        alg = GNUTLS_DIG_SHA256;
        break;
    case 384:
        alg = GNUTLS_DIG_SHA384;
        break;
    case 512:
        alg = GNUTLS_DIG_SHA512;
        break;
    default:
        badBits();
        break;
    }
    sha2_bits = bits;
    int code = gnutls_hash_init(&hash_ctx, alg);
    if (code < 0) {
        hash_ctx = nullptr;
        throw std::runtime_error(
            std::string("gnutls: SHA") + std::to_string(bits) +
            " error: " + std::string(gnutls_strerror(code)));
    }
}

void
ScrubCrypto_gnutls::SHA2_update(unsigned char const* data, size_t len)
{
    gnutls_hash(hash_ctx, data, len);
}

void
ScrubCrypto_gnutls::SHA2_finalize()
{
    if (hash_ctx) {
        gnutls_hash_deinit(hash_ctx, digest);
        hash_ctx = nullptr;
    }
}

std::string
ScrubCrypto_gnutls::SHA2_digest()
{
    std::string result;
    switch (sha2_bits) {
    case 256:
        result = std::string(digest, 32);
        break;
    case 384:
        result = std::string(digest, 48);
        break;
    case 512:
        result = std::string(digest, 64);
        break;
    default:
        badBits();
        break;
    }
    return result;
}

void
ScrubCrypto_gnutls::rijndael_init(bool encrypt, unsigned char const* key_data, size_t key_len)
{
    rijndael_finalize();
    if (!(key_len == 16 || key_len == 24 || key_len == 32)) {
        throw std::logic_error(
            "unsupported key length: " + std::to_string(key_len * 8));
    }
    this->encrypt = encrypt;
    // Save the key so we can re-initialize.
    aes_key.assign(reinterpret_cast<char const*>(key_data), key_len);
    static unsigned char zeroes[16] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
    initAES(zeroes);
}

void
ScrubCrypto_gnutls::initAES(unsigned char* iv_data)
{
    gnutls_cipher_algorithm_t alg = GNUTLS_CIPHER_AES_128_CBC;
    switch (aes_key.size()) {
    case 32:
        alg = GNUTLS_CIPHER_AES_256_CBC;
        break;
    case 24:
        alg = GNUTLS_CIPHER_AES_192_CBC;
        break;
    default:
        alg = GNUTLS_CIPHER_AES_128_CBC;
        break;
    }

    gnutls_datum_t cipher_key;
    gnutls_datum_t iv;
    cipher_key.data = reinterpret_cast<unsigned char*>(aes_key.data());
    cipher_key.size = ScrubIntC::to_uint(gnutls_cipher_get_key_size(alg));
    iv.data = iv_data;
    iv.size = rijndael_buf_size;

    int code = gnutls_cipher_init(&cipher_ctx, alg, &cipher_key, &iv);
    if (code < 0) {
        cipher_ctx = nullptr;
        throw std::runtime_error(
            std::string("gnutls: AES error: ") + std::string(gnutls_strerror(code)));
    }
}

void
ScrubCrypto_gnutls::rijndael_process(unsigned char* in_data, unsigned char* out_data)
{
    int code = 0;
    if (encrypt) {
        code = gnutls_cipher_encrypt2(
            cipher_ctx, in_data, rijndael_buf_size, out_data, rijndael_buf_size);
    } else {
        code = gnutls_cipher_decrypt2(
            cipher_ctx, in_data, rijndael_buf_size, out_data, rijndael_buf_size);
    }
    if (code < 0) {
        throw std::runtime_error(
            std::string("gnutls: AES error: ") + std::string(gnutls_strerror(code)));
    }

    // Gnutls doesn't support AES in ECB mode, but the result is the
    // same as CBC with the IV reset to all zeroes for each block.
    static unsigned char zeroes[16] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
    gnutls_cipher_deinit(cipher_ctx);
    cipher_ctx = nullptr;
    initAES(zeroes);
}

void
ScrubCrypto_gnutls::rijndael_finalize()
{
    if (cipher_ctx) {
        gnutls_cipher_deinit(cipher_ctx);
        cipher_ctx = nullptr;
    }
}

void
ScrubCrypto_gnutls::badBits()
{
    throw std::logic_error("SHA2 (gnutls) has bits != 256, 384, or 512");
}
