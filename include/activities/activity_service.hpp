#pragma once

#include <grpcpp/grpcpp.h>
#include "activities/registry.grpc.pb.h"
#include "registry.hpp"

namespace activities {

/// gRPC front end for an ActivityRegistry.
class ActivityServiceImpl final : public ActivityService::Service {
public:
    explicit ActivityServiceImpl(ActivityRegistry& registry)
        : registry_(registry) {}

    grpc::Status ListActivities(grpc::ServerContext* context,
                                const ListActivitiesRequest* request,
                                ListActivitiesResponse* response) override;

    grpc::Status Signup(grpc::ServerContext* context,
                        const SignupRequest* request,
                        RegistrationResponse* response) override;

    grpc::Status Unregister(grpc::ServerContext* context,
                            const UnregisterRequest* request,
                            RegistrationResponse* response) override;

private:
    ActivityRegistry& registry_;
};

} // namespace activities
