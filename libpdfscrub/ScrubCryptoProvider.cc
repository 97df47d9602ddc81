#include <pdfscrub/ScrubCryptoProvider.hh>

#include <pdfscrub/ScrubUtil.hh>

#include <stdexcept>

#ifdef USE_CRYPTO_GNUTLS
# include <pdfscrub/ScrubCrypto_gnutls.hh>
#endif
#ifdef USE_CRYPTO_OPENSSL
# include <pdfscrub/ScrubCrypto_openssl.hh>
#endif

std::shared_ptr<ScrubCryptoImpl>
ScrubCryptoProvider::getImpl()
{
    ScrubCryptoProvider& p = getInstance();
    if (p.m->default_provider.empty()) {
        throw std::logic_error("ScrubCryptoProvider::getImpl called with no default provider.");
    }
    return p.getImpl_internal(p.m->default_provider);
}

std::shared_ptr<ScrubCryptoImpl>
ScrubCryptoProvider::getImpl(std::string const& name)
{
    return getInstance().getImpl_internal(name);
}

void
ScrubCryptoProvider::registerImpl(std::string const& name, provider_fn f)
{
    getInstance().registerImpl_internal(name, std::move(f));
}

void
ScrubCryptoProvider::setDefaultProvider(std::string const& name)
{
    getInstance().setDefaultProvider_internal(name);
}

ScrubCryptoProvider::ScrubCryptoProvider() :
    m(std::make_shared<Members>())
{
#ifdef USE_CRYPTO_GNUTLS
    registerImpl_internal("gnutls", std::make_shared<ScrubCrypto_gnutls>);
#endif
#ifdef USE_CRYPTO_OPENSSL
    registerImpl_internal("openssl", std::make_shared<ScrubCrypto_openssl>);
#endif
    std::string default_crypto;
    if (!ScrubUtil::get_env("PDFSCRUB_CRYPTO_PROVIDER", &default_crypto)) {
        default_crypto = DEFAULT_CRYPTO;
    }
    setDefaultProvider_internal(default_crypto);
}

ScrubCryptoProvider&
ScrubCryptoProvider::getInstance()
{
    static ScrubCryptoProvider instance;
    return instance;
}

std::shared_ptr<ScrubCryptoImpl>
ScrubCryptoProvider::getImpl_internal(std::string const& name) const
{
    auto iter = m->providers.find(name);
    if (iter == m->providers.end()) {
        throw std::logic_error(
            "ScrubCryptoProvider requested unknown implementation \"" + name + "\"");
    }
    return iter->second();
}

void
ScrubCryptoProvider::registerImpl_internal(std::string const& name, provider_fn f)
{
    m->providers[name] = std::move(f);
}

void
ScrubCryptoProvider::setDefaultProvider_internal(std::string const& name)
{
    if (!m->providers.count(name)) {
        throw std::logic_error(
            "ScrubCryptoProvider: request to set default provider to unknown implementation \"" +
            name + "\"");
    }
    m->default_provider = name;
}

std::set<std::string>
ScrubCryptoProvider::getRegisteredImpls()
{
    std::set<std::string> result;
    ScrubCryptoProvider& p = getInstance();
    for (auto const& iter: p.m->providers) {
        result.insert(iter.first);
    }
    return result;
}

std::string
ScrubCryptoProvider::getDefaultProvider()
{
    return getInstance().m->default_provider;
}
