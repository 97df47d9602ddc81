#include <pdfscrub/RC4.hh>

#include <pdfscrub/ScrubCryptoProvider.hh>
#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/ScrubUtil.hh>

RC4::RC4(unsigned char const* key_data, int key_len, std::shared_ptr<ScrubCryptoImpl> crypto) :
    crypto(crypto ? crypto : ScrubCryptoProvider::getImpl())
{
    this->crypto->RC4_init(key_data, key_len);
}

void
RC4::process(unsigned char const* in_data, size_t len, unsigned char* out_data)
{
    crypto->RC4_process(in_data, len, out_data);
}

void
RC4::process(std::string const& key, std::string& data, std::shared_ptr<ScrubCryptoImpl> crypto)
{
    if (data.empty()) {
        return;
    }
    RC4 rc4(ScrubUtil::unsigned_char_pointer(key), ScrubIntC::to_int(key.size()), crypto);
    auto* p = reinterpret_cast<unsigned char*>(data.data());
    rc4.process(p, data.size(), p);
}
