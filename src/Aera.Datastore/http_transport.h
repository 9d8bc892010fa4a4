#pragma once

#include <list>
#include <string>

namespace aera::data {

/// @brief HTTP request data type
struct HttpRequest {
    /// @brief Request method, GET or POST
    std::string method{"GET"};

    /// @brief Absolute request URL, including the query string
    std::string url;

    /// @brief Request header lines, <c>Name: value</c>
    std::list<std::string> headers;

    /// @brief Request body, POST only
    std::string body;

    /// @brief Request timeout in seconds
    long timeout_seconds{60};
};

/// @brief HTTP response data type
struct HttpResponse {
    /// @brief HTTP status code
    long status{};

    /// @brief Response body
    std::string body;
};

/// @brief Defines the HTTP transport interface
class HttpTransport {
  public:
    /// @brief Destroys a HttpTransport instance
    virtual ~HttpTransport() = default;

    /// @brief Sends a request and waits for the response
    /// @param request The request to send
    /// @return The response, any status code
    /// @throws core::UpstreamIOError for connection or timeout failures.
    virtual HttpResponse send(const HttpRequest &request) = 0;
};

/// @brief Implements the HTTP transport using the curlpp library
class CurlTransport final : public HttpTransport {
  public:
    HttpResponse send(const HttpRequest &request) override;
};

} // namespace aera::data
