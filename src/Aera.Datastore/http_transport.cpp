#include "http_transport.h"

#include "Aera.Core/exception.h"

#include <curlpp/Easy.hpp>
#include <curlpp/Exception.hpp>
#include <curlpp/Infos.hpp>
#include <curlpp/Options.hpp>
#include <curlpp/cURLpp.hpp>
#include <fmt/format.h>

#include <sstream>

namespace aera::data {

HttpResponse CurlTransport::send(const HttpRequest &request) {
    try {
        curlpp::Cleanup cleanup;
        std::ostringstream response_body;

        // Our request to be sent
        curlpp::Easy easy;
        easy.setOpt<curlpp::options::Url>(request.url);
        easy.setOpt<curlpp::options::HttpHeader>(request.headers);
        easy.setOpt<curlpp::options::Timeout>(request.timeout_seconds);
        easy.setOpt<curlpp::options::WriteStream>(&response_body);
        if (request.method == "POST") {
            easy.setOpt<curlpp::options::PostFields>(request.body);
            easy.setOpt<curlpp::options::PostFieldSize>(static_cast<long>(request.body.size()));
        }

        // Make request
        easy.perform();

        return HttpResponse{.status = curlpp::infos::ResponseCode::get(easy),
                            .body = response_body.str()};
    } catch (const curlpp::RuntimeError &ex) {
        throw core::UpstreamIOError(
            fmt::format("{} {} failed: {}", request.method, request.url, ex.what()));
    } catch (const curlpp::LogicError &ex) {
        throw core::UpstreamIOError(
            fmt::format("{} {} failed: {}", request.method, request.url, ex.what()));
    }
}

} // namespace aera::data
