#pragma once

#include <map>
#include <string>
#include <vector>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "registry.hpp"

namespace activities {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/// HTTP status for a rejection's gRPC code.
http::status http_status_for(grpc::StatusCode code);

/**
 * Maps the JSON-over-HTTP API onto an ActivityRegistry.
 *
 *   GET    /activities
 *   POST   /activities/{name}/signup?email={id}
 *   DELETE /activities/{name}/unregister?email={id}
 */
class HttpRouter {
public:
    explicit HttpRouter(ActivityRegistry& registry)
        : registry_(registry) {}

    HttpResponse handle(const HttpRequest& request);

private:
    HttpResponse list_activities(const HttpRequest& request);
    HttpResponse signup(const HttpRequest& request, const std::string& activity,
                        const std::map<std::string, std::string>& query);
    HttpResponse unregister(const HttpRequest& request, const std::string& activity,
                            const std::map<std::string, std::string>& query);

    HttpResponse route(const HttpRequest& request);

    static HttpResponse method_not_allowed(const HttpRequest& request, http::verb allowed);

    static HttpResponse json_response(const HttpRequest& request, http::status status,
                                      const nlohmann::json& body);
    static HttpResponse detail_response(const HttpRequest& request, http::status status,
                                        const std::string& detail);

    ActivityRegistry& registry_;
};

} // namespace activities
