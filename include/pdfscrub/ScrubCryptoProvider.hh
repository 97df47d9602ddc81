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

#ifndef SCRUBCRYPTOPROVIDER_HH
#define SCRUBCRYPTOPROVIDER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubCryptoImpl.hh>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

// This class is part of pdfscrub's pluggable crypto provider support.
// See also comments in ScrubCryptoImpl.hh.
//
// The default provider is selected at build time. It may be
// overridden by setting the PDFSCRUB_CRYPTO_PROVIDER environment
// variable to the name of a registered implementation.

class ScrubCryptoProvider
{
  public:
    typedef std::function<std::shared_ptr<ScrubCryptoImpl>()> provider_fn;

    // Methods for getting and registering crypto implementations.
    // getImpl may be called concurrently; registration and changing
    // the default are not thread-safe.

    // Return an instance of a crypto provider using the default
    // implementation.
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubCryptoImpl> getImpl();

    // Return an instance of the crypto provider registered using the
    // given name.
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubCryptoImpl> getImpl(std::string const& name);

    // Register a factory for a crypto implementation.
    PDFSCRUB_DLL
    static void registerImpl(std::string const& name, provider_fn f);

    // Set the crypto provider registered with the given name as the
    // default crypto implementation.
    PDFSCRUB_DLL
    static void setDefaultProvider(std::string const& name);

    // Get the names of registered implementations
    PDFSCRUB_DLL
    static std::set<std::string> getRegisteredImpls();

    // Get the name of the default crypto provider
    PDFSCRUB_DLL
    static std::string getDefaultProvider();

  private:
    ScrubCryptoProvider();
    ~ScrubCryptoProvider() = default;
    ScrubCryptoProvider(ScrubCryptoProvider const&) = delete;
    ScrubCryptoProvider& operator=(ScrubCryptoProvider const&) = delete;

    static ScrubCryptoProvider& getInstance();

    std::shared_ptr<ScrubCryptoImpl> getImpl_internal(std::string const& name) const;
    void registerImpl_internal(std::string const& name, provider_fn f);
    void setDefaultProvider_internal(std::string const& name);

    class Members
    {
        friend class ScrubCryptoProvider;

      public:
        Members() = default;
        PDFSCRUB_DLL
        ~Members() = default;

      private:
        Members(Members const&) = delete;
        Members& operator=(Members const&) = delete;

        std::string default_provider;
        std::map<std::string, provider_fn> providers;
    };

    std::shared_ptr<Members> m;
};

#endif // SCRUBCRYPTOPROVIDER_HH
