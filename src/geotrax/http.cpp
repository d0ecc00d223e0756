#include "geotrax/http.hpp"
#include "geotrax/errors.hpp"

#include <cctype>
#include <memory>
#include <mutex>

#include <curl/curl.h>

namespace geotrax {

    namespace {

        std::size_t write_callback(char *data, std::size_t size, std::size_t nmemb, void *userp) {
            auto *body = static_cast<std::string *>(userp);
            body->append(data, size * nmemb);
            return size * nmemb;
        }

        struct EasyDeleter {
            void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
        };

        struct SlistDeleter {
            void operator()(curl_slist *list) const { curl_slist_free_all(list); }
        };

        std::once_flag curl_init_flag;

    } // namespace

    CurlHttpClient::CurlHttpClient() {
        // curl_global_init is not thread-safe and must run once per process
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    CurlHttpClient::~CurlHttpClient() = default;

    HttpResponse CurlHttpClient::get(const std::string &url, const std::map<std::string, std::string> &headers,
                                     std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0)
            throw ValidationError("HTTP timeout must be positive");
        std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
        if (!curl)
            throw UpstreamUnavailable("failed to initialise libcurl handle");

        HttpResponse response;
        std::unique_ptr<curl_slist, SlistDeleter> header_list;
        for (const auto &[name, value] : headers) {
            std::string line = name + ": " + value;
            curl_slist *appended = curl_slist_append(header_list.get(), line.c_str());
            if (!appended)
                throw UpstreamUnavailable("failed to build request headers");
            header_list.release();
            header_list.reset(appended);
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        if (header_list)
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK)
            throw UpstreamUnavailable(std::string("request to ") + url + " failed: " + curl_easy_strerror(res));

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

    std::string url_escape(const std::string &text) {
        static const char hex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(text.size() * 3);
        for (unsigned char c : text) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back('%');
                out.push_back(hex[c >> 4]);
                out.push_back(hex[c & 0x0F]);
            }
        }
        return out;
    }

} // namespace geotrax
