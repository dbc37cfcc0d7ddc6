#include "activities/activity_service.hpp"
#include "activities/errors.hpp"
#include "activities/logging.hpp"

namespace activities {

namespace {

void require_email(const std::string& email) {
    if (email.empty()) {
        throw CommandRejectedError::invalid_argument("email is required");
    }
}

grpc::Status rejected(const char* operation, const CommandRejectedError& e) {
    log_warn(LOG_DOMAIN, "rpc_rejected", {{"rpc", operation}, {"reason", e.what()}});
    return e.to_grpc_status();
}

grpc::Status failed(const char* operation, const std::exception& e) {
    log_error(LOG_DOMAIN, "rpc_failed", {{"rpc", operation}, {"error", e.what()}});
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
}

} // anonymous namespace

grpc::Status ActivityServiceImpl::ListActivities(grpc::ServerContext* context,
                                                 const ListActivitiesRequest* request,
                                                 ListActivitiesResponse* response) {
    try {
        auto* entries = response->mutable_activities();
        for (const auto& [name, activity] : registry_.list()) {
            ActivityDetails& details = (*entries)[name];
            details.set_description(activity.description);
            details.set_schedule(activity.schedule);
            details.set_max_participants(activity.max_participants);
            for (const auto& email : activity.participants) {
                details.add_participants(email);
            }
        }
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        return failed("ListActivities", e);
    }
}

grpc::Status ActivityServiceImpl::Signup(grpc::ServerContext* context,
                                         const SignupRequest* request,
                                         RegistrationResponse* response) {
    try {
        require_email(request->email());
        response->set_message(registry_.signup(request->activity(), request->email()));
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("Signup", e);
    } catch (const std::exception& e) {
        return failed("Signup", e);
    }
}

grpc::Status ActivityServiceImpl::Unregister(grpc::ServerContext* context,
                                             const UnregisterRequest* request,
                                             RegistrationResponse* response) {
    try {
        require_email(request->email());
        response->set_message(registry_.unregister(request->activity(), request->email()));
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("Unregister", e);
    } catch (const std::exception& e) {
        return failed("Unregister", e);
    }
}

} // namespace activities
