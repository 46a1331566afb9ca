#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>
#include "mergington/activities.grpc.pb.h"
#include "activity_registry.hpp"

namespace mergington {

/// gRPC front end over the shared ActivityRegistry.
class ActivityServiceImpl final : public api::ActivityService::Service {
public:
    explicit ActivityServiceImpl(ActivityRegistry& registry) : registry_(registry) {}

    grpc::Status ListActivities(grpc::ServerContext* context,
                                const api::ListActivitiesRequest* request,
                                api::ListActivitiesResponse* response) override;

    grpc::Status SignUp(grpc::ServerContext* context,
                        const api::SignUpRequest* request,
                        api::SignUpResponse* response) override;

    grpc::Status Unregister(grpc::ServerContext* context,
                            const api::UnregisterRequest* request,
                            api::UnregisterResponse* response) override;

private:
    ActivityRegistry& registry_;
};

std::unique_ptr<api::ActivityService::Service> create_activity_service(ActivityRegistry& registry);

} // namespace mergington
