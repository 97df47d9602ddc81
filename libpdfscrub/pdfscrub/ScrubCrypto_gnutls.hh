#ifndef SCRUBCRYPTO_GNUTLS_HH
#define SCRUBCRYPTO_GNUTLS_HH

#include <pdfscrub/ScrubCryptoImpl.hh>

#include <memory>
#include <string>

// gnutls headers must be last to prevent them from interfering with
// other headers. gnutls.h has to be included first.
#include <gnutls/gnutls.h>
// This comment prevents clang-format from putting crypto.h before gnutls.h
#include <gnutls/crypto.h>

class ScrubCrypto_gnutls: public ScrubCryptoImpl
{
  public:
    ScrubCrypto_gnutls();

    PDFSCRUB_DLL
    ~ScrubCrypto_gnutls() override;

    void provideRandomData(unsigned char* data, size_t len) override;

    void RC4_init(unsigned char const* key_data, int key_len = -1) override;
    void RC4_process(
        unsigned char const* in_data, size_t len, unsigned char* out_data = nullptr) override;
    void RC4_finalize() override;

    void SHA2_init(int bits) override;
    void SHA2_update(unsigned char const* data, size_t len) override;
    void SHA2_finalize() override;
    std::string SHA2_digest() override;

    void rijndael_init(bool encrypt, unsigned char const* key_data, size_t key_len) override;
    void rijndael_process(unsigned char* in_data, unsigned char* out_data) override;
    void rijndael_finalize() override;

  private:
    void badBits();
    void initAES(unsigned char* iv_data);

    gnutls_hash_hd_t hash_ctx{nullptr};
    gnutls_cipher_hd_t cipher_ctx{nullptr};
    int sha2_bits{0};
    bool encrypt{false};
    char digest[64];
    std::string aes_key;
};

#endif // SCRUBCRYPTO_GNUTLS_HH
