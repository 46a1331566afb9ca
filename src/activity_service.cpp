#include "mergington/activity_service.hpp"
#include "mergington/errors.hpp"
#include "mergington/logging.hpp"

namespace mergington {

namespace {

constexpr const char* COMPONENT = "grpc";

void to_proto(const Activity& activity, api::Activity* out) {
    out->set_name(activity.name);
    out->set_description(activity.description);
    out->set_schedule(activity.schedule);
    out->set_max_participants(activity.max_participants);
    for (const auto& email : activity.participants) {
        out->add_participants(email);
    }
}

grpc::Status require_fields(const std::string& activity_name, const std::string& email) {
    if (activity_name.empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "activity_name is required");
    }
    if (email.empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "email is required");
    }
    return grpc::Status::OK;
}

} // anonymous namespace

grpc::Status ActivityServiceImpl::ListActivities(grpc::ServerContext* context,
                                                 const api::ListActivitiesRequest* request,
                                                 api::ListActivitiesResponse* response) {
    for (const auto& activity : registry_.list()) {
        to_proto(activity, response->add_activities());
    }
    return grpc::Status::OK;
}

grpc::Status ActivityServiceImpl::SignUp(grpc::ServerContext* context,
                                         const api::SignUpRequest* request,
                                         api::SignUpResponse* response) {
    auto status = require_fields(request->activity_name(), request->email());
    if (!status.ok()) {
        return status;
    }

    try {
        response->set_message(registry_.sign_up(request->activity_name(), request->email()));
        log_info(COMPONENT, "signed_up",
            {{"activity", request->activity_name()}, {"email", request->email()}});
        return grpc::Status::OK;
    } catch (const RegistryError& e) {
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        log_error(COMPONENT, "sign_up_failed", {{"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status ActivityServiceImpl::Unregister(grpc::ServerContext* context,
                                             const api::UnregisterRequest* request,
                                             api::UnregisterResponse* response) {
    auto status = require_fields(request->activity_name(), request->email());
    if (!status.ok()) {
        return status;
    }

    try {
        response->set_message(registry_.unregister(request->activity_name(), request->email()));
        log_info(COMPONENT, "unregistered",
            {{"activity", request->activity_name()}, {"email", request->email()}});
        return grpc::Status::OK;
    } catch (const RegistryError& e) {
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        log_error(COMPONENT, "unregister_failed", {{"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

std::unique_ptr<api::ActivityService::Service> create_activity_service(ActivityRegistry& registry) {
    return std::make_unique<ActivityServiceImpl>(registry);
}

} // namespace mergington
