#pragma once

#include <chrono>
#include <map>
#include <string>

namespace geotrax {

    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    /**
     * @brief Minimal blocking HTTP GET transport
     *
     * Providers depend on this interface only, so tests substitute a fake and
     * never touch the network.
     */
    class HttpClient {
      public:
        virtual ~HttpClient() = default;

        /**
         * @brief Perform a GET request
         *
         * @param url Fully built URL
         * @param headers Extra request headers (name -> value)
         * @param timeout Whole-request timeout
         * @return Response for any completed exchange, whatever its status
         * @throws UpstreamUnavailable if no response was received (DNS, connect, timeout)
         * @throws ValidationError if timeout is not positive
         */
        virtual HttpResponse get(const std::string &url, const std::map<std::string, std::string> &headers,
                                 std::chrono::milliseconds timeout) = 0;
    };

    /**
     * @brief libcurl-backed HttpClient
     *
     * One easy handle per request; safe to share between threads.
     */
    class CurlHttpClient : public HttpClient {
      public:
        CurlHttpClient();
        ~CurlHttpClient() override;

        CurlHttpClient(const CurlHttpClient &) = delete;
        CurlHttpClient &operator=(const CurlHttpClient &) = delete;

        HttpResponse get(const std::string &url, const std::map<std::string, std::string> &headers,
                         std::chrono::milliseconds timeout) override;
    };

    /// Percent-encode a query string component (RFC 3986 unreserved kept)
    std::string url_escape(const std::string &text);

} // namespace geotrax
