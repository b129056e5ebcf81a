#include <atomic>
#include <memory>

#include <spdlog/spdlog.h>

#include <fragloader/curl.hpp>
#include <fragloader/utils.hpp>
#include <fragloader/context.hpp>

#include "curl_internal.hpp"

namespace fragloader
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }


    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, errorbuffer);
        init_handle(ctx);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_NETRC, (long) CURL_NETRC_OPTIONAL);
        setopt(CURLOPT_MAXREDIRS, 6L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            // Windows SSL backend doesn't support this
            CURLcode verifystatus = curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYSTATUS, 0L);
            if (verifystatus != CURLE_OK && verifystatus != CURLE_NOT_BUILT_IN)
                throw curl_error("Could not initialize CURL handle");

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }

            if (ctx.ssl_no_revoke)
            {
                setopt(CURLOPT_SSL_OPTIONS, (long) CURLSSLOPT_NO_REVOKE);
            }
        }

        if (ctx.max_speed_limit > 0)
        {
            setopt(CURLOPT_MAX_RECV_SPEED_LARGE, static_cast<curl_off_t>(ctx.max_speed_limit));
        }

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url, ctx.proxy_map);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url);
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value());
        }
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        add_header(fmt::format("User-Agent: {} {}", user_agent, curl_version()));
        return *this;
    }

    CURLcode CURLHandle::perform()
    {
        errorbuffer[0] = '\0';
        return curl_easy_perform(handle());
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (res && res.value() != nullptr)
            return std::string(res.value());
        else if (res)
            return std::string();
        else
            return tl::unexpected(res.error());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    /************
     * Response *
     ************/

    bool Response::ok() const
    {
        return http_status == 0 || http_status / 100 == 2;
    }

    void Response::fill_values(CURLHandle& handle)
    {
        average_speed = handle.getinfo<curl_off_t>(CURLINFO_SPEED_DOWNLOAD_T).value_or(0);
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
        downloaded_size = handle.getinfo<curl_off_t>(CURLINFO_SIZE_DOWNLOAD_T).value_or(0);
    }

    namespace
    {
        std::string url_part(CURLU* url, CURLUPart part)
        {
            char* value = nullptr;
            if (curl_url_get(url, part, &value, 0) != CURLUE_OK || value == nullptr)
                return {};
            std::string res(value);
            curl_free(value);
            return res;
        }
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // Most specific key wins: scheme://host, scheme, all://host, all
        if (proxies.empty())
        {
            return std::nullopt;
        }

        std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handler(curl_url(),
                                                                     &curl_url_cleanup);
        if (!handler || curl_url_set(handler.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
        {
            return std::nullopt;
        }

        const std::string scheme = url_part(handler.get(), CURLUPART_SCHEME);
        const std::string host = url_part(handler.get(), CURLUPART_HOST);
        std::vector<std::string> options;

        if (host.empty())
        {
            options = {
                scheme,
                "all",
            };
        }
        else
        {
            options = { scheme + "://" + host, scheme, "all://" + host, "all" };
        }

        for (auto& option : options)
        {
            auto proxy = proxies.find(option);
            if (proxy != proxies.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup(const std::optional<ssl_backend_t>& ssl_backend)
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "fragloader::CURLSetup created more than once - instance must be unique");
            }

            if (ssl_backend)
            {
                const auto res = curl_global_sslset(
                    static_cast<curl_sslbackend>(ssl_backend.value()), nullptr, nullptr);
                if (res != CURLSSLSET_OK)
                {
                    is_curl_setup_alive = false;
                    if (res == CURLSSLSET_UNKNOWN_BACKEND)
                        throw curl_error("unknown curl ssl backend");
                    else if (res == CURLSSLSET_NO_BACKENDS)
                        throw curl_error("no curl ssl backend available");
                    else if (res == CURLSSLSET_TOO_LATE)
                        throw curl_error("curl ssl backend set too late");
                    throw curl_error("failed to set curl ssl backend");
                }
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}
