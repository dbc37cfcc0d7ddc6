#include "activities/http_router.hpp"
#include "activities/logging.hpp"
#include "activities/url.hpp"

namespace activities {

http::status http_status_for(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::NOT_FOUND:
            return http::status::not_found;
        case grpc::StatusCode::FAILED_PRECONDITION:
            return http::status::bad_request;
        case grpc::StatusCode::INVALID_ARGUMENT:
            return http::status::unprocessable_entity;
        default:
            return http::status::internal_server_error;
    }
}

HttpResponse HttpRouter::handle(const HttpRequest& request) {
    try {
        return route(request);
    } catch (const CommandRejectedError& e) {
        log_warn(LOG_DOMAIN, "request_rejected",
            {{"method", std::string(request.method_string().data(), request.method_string().size())},
             {"target", std::string(request.target().data(), request.target().size())},
             {"reason", e.what()}});
        return detail_response(request, http_status_for(e.status_code), e.what());
    } catch (const std::exception& e) {
        log_error(LOG_DOMAIN, "request_failed",
            {{"target", std::string(request.target().data(), request.target().size())},
             {"error", e.what()}});
        return detail_response(request, http::status::internal_server_error, "Internal Server Error");
    }
}

HttpResponse HttpRouter::route(const HttpRequest& request) {
    std::string target(request.target().data(), request.target().size());
    auto [path, raw_query] = url::split_target(target);
    auto segments = url::path_segments(path);

    if (segments.size() == 1 && segments[0] == "activities") {
        if (request.method() != http::verb::get) {
            return method_not_allowed(request, http::verb::get);
        }
        return list_activities(request);
    }

    if (segments.size() == 3 && segments[0] == "activities") {
        const std::string& activity = segments[1];
        if (segments[2] == "signup") {
            if (request.method() != http::verb::post) {
                return method_not_allowed(request, http::verb::post);
            }
            return signup(request, activity, url::parse_query(raw_query));
        }
        if (segments[2] == "unregister") {
            if (request.method() != http::verb::delete_) {
                return method_not_allowed(request, http::verb::delete_);
            }
            return unregister(request, activity, url::parse_query(raw_query));
        }
    }

    return detail_response(request, http::status::not_found, "Not Found");
}

HttpResponse HttpRouter::list_activities(const HttpRequest& request) {
    nlohmann::json body = nlohmann::json::object();
    for (const auto& [name, activity] : registry_.list()) {
        body[name] = activity;
    }
    return json_response(request, http::status::ok, body);
}

namespace {

const std::string& require_email(const std::map<std::string, std::string>& query) {
    auto it = query.find("email");
    if (it == query.end()) {
        throw CommandRejectedError::invalid_argument("Missing required query parameter: email");
    }
    if (!url::is_valid_utf8(it->second)) {
        throw CommandRejectedError::invalid_argument("email must be valid UTF-8");
    }
    return it->second;
}

} // anonymous namespace

HttpResponse HttpRouter::signup(const HttpRequest& request, const std::string& activity,
                                const std::map<std::string, std::string>& query) {
    const std::string& email = require_email(query);
    std::string message = registry_.signup(activity, email);
    return json_response(request, http::status::ok, {{"message", message}});
}

HttpResponse HttpRouter::unregister(const HttpRequest& request, const std::string& activity,
                                    const std::map<std::string, std::string>& query) {
    const std::string& email = require_email(query);
    std::string message = registry_.unregister(activity, email);
    return json_response(request, http::status::ok, {{"message", message}});
}

HttpResponse HttpRouter::json_response(const HttpRequest& request, http::status status,
                                       const nlohmann::json& body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    response.prepare_payload();
    return response;
}

HttpResponse HttpRouter::detail_response(const HttpRequest& request, http::status status,
                                         const std::string& detail) {
    return json_response(request, status, {{"detail", detail}});
}

HttpResponse HttpRouter::method_not_allowed(const HttpRequest& request, http::verb allowed) {
    HttpResponse response = detail_response(request, http::status::method_not_allowed, "Method Not Allowed");
    response.set(http::field::allow, http::to_string(allowed));
    return response;
}

} // namespace activities
