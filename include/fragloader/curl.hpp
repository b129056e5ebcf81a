#ifndef FRAGLOADER_CURL_HPP
#define FRAGLOADER_CURL_HPP

#include <optional>
#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <fragloader/export.hpp>

namespace fragloader
{
    class CURLHandle;

    enum class ssl_backend_t
    {
        none = CURLSSLBACKEND_NONE,
        openssl = CURLSSLBACKEND_OPENSSL,
        gnutls = CURLSSLBACKEND_GNUTLS,
        nss = CURLSSLBACKEND_NSS,
        wolfssl = CURLSSLBACKEND_WOLFSSL,
        schannel = CURLSSLBACKEND_SCHANNEL,
        securetransport = CURLSSLBACKEND_SECURETRANSPORT,
        mbedtls = CURLSSLBACKEND_MBEDTLS,
        bearssl = CURLSSLBACKEND_BEARSSL,
        rustls = CURLSSLBACKEND_RUSTLS,
    };

    // Outcome of one transfer as reported by curl.
    struct FRAGLOADER_API Response
    {
        long http_status = 0;
        std::string effective_url;

        // curl reports 0 for protocols without status codes (file://)
        bool ok() const;

        void fill_values(CURLHandle& handle);

        curl_off_t average_speed = -1;
        curl_off_t downloaded_size = -1;
    };
}

#endif
