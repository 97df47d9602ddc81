#ifndef RC4_HH
#define RC4_HH

#include <pdfscrub/ScrubCryptoImpl.hh>

#include <memory>
#include <string>

class RC4
{
  public:
    // key_len of -1 means treat key_data as a null-terminated string.
    // If `crypto' is null, the default crypto provider is used.
    RC4(unsigned char const* key_data,
        int key_len = -1,
        std::shared_ptr<ScrubCryptoImpl> crypto = nullptr);

    // It is safe to pass the same pointer to in_data and out_data to
    // encrypt/decrypt in place
    void process(unsigned char const* in_data, size_t len, unsigned char* out_data);

    // Encrypt or decrypt `data' in place with a fresh key schedule.
    static void
    process(std::string const& key, std::string& data, std::shared_ptr<ScrubCryptoImpl> crypto);

  private:
    std::shared_ptr<ScrubCryptoImpl> crypto;
};

#endif // RC4_HH
