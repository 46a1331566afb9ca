#include "mergington/activity_registry.hpp"
#include "mergington/activity_service.hpp"
#include "mergington/config.hpp"
#include "mergington/errors.hpp"
#include "mergington/http_api.hpp"
#include "mergington/http_server.hpp"
#include "mergington/logging.hpp"
#include "mergington/seed.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <csignal>
#include <memory>
#include <thread>

namespace {

constexpr const char* COMPONENT = "server";

std::vector<mergington::Activity> initial_activities(const mergington::ServerConfig& config) {
    if (config.activities_file.empty()) {
        return mergington::seed::default_activities();
    }
    return mergington::seed::load_activities(config.activities_file);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = mergington::load_config(argc, argv);

        mergington::ActivityRegistry registry(initial_activities(config));
        mergington::log_info(COMPONENT, "registry_seeded", {
            {"activities", registry.size()},
            {"source", config.activities_file.empty() ? "built-in" : config.activities_file}
        });

        // gRPC
        grpc::EnableDefaultHealthCheckService(true);
        grpc::reflection::InitProtoReflectionServerBuilderPlugin();

        auto service = mergington::create_activity_service(registry);

        grpc::ServerBuilder builder;
        builder.AddListeningPort(config.grpc_address(), grpc::InsecureServerCredentials());
        builder.RegisterService(service.get());

        std::unique_ptr<grpc::Server> grpc_server(builder.BuildAndStart());
        if (!grpc_server) {
            mergington::log_error(COMPONENT, "grpc_server_failed", {{"address", config.grpc_address()}});
            return 1;
        }
        mergington::log_info(COMPONENT, "grpc_server_started", {{"port", config.grpc_port}});

        // HTTP
        mergington::HttpApi api(registry, config.static_dir);
        mergington::HttpServer http_server(api, config.http_address, config.http_port,
                                           static_cast<int>(std::thread::hardware_concurrency()));
        http_server.start();

        boost::asio::io_context signal_ioc;
        boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int signal_number) {
            mergington::log_info(COMPONENT, "shutting_down", {{"signal", signal_number}});
            http_server.stop();
            grpc_server->Shutdown();
        });
        signal_ioc.run();

        grpc_server->Wait();
        return 0;
    } catch (const mergington::RegistryError& e) {
        mergington::log_error(COMPONENT, "startup_failed", {{"error", e.what()}});
        return 1;
    } catch (const boost::system::system_error& e) {
        mergington::log_error(COMPONENT, "http_bind_failed", {{"error", e.what()}});
        return 1;
    }
}
