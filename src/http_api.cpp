#include "mergington/http_api.hpp"
#include "mergington/errors.hpp"
#include "mergington/logging.hpp"
#include "mergington/url.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace mergington {

namespace {

constexpr const char* COMPONENT = "http";
constexpr const char* INDEX_LOCATION = "/static/index.html";

HttpResponse method_not_allowed(const HttpRequest& request, const char* allow) {
    auto response = json_response(request, beast_http::status::method_not_allowed,
                                  json::detail_body("Method Not Allowed"));
    response.set(beast_http::field::allow, allow);
    return response;
}

HttpResponse not_found(const HttpRequest& request) {
    return json_response(request, beast_http::status::not_found, json::detail_body("Not Found"));
}

const std::string* required_param(const std::map<std::string, std::string>& params,
                                  const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        throw InvalidArgumentError("Missing required query parameter: " + name);
    }
    return &it->second;
}

void require_utf8(const std::string& value, const std::string& field_name) {
    if (!url::is_valid_utf8(value)) {
        throw InvalidArgumentError(field_name + " must be valid UTF-8");
    }
}

bool is_read(beast_http::verb method) {
    return method == beast_http::verb::get || method == beast_http::verb::head;
}

HttpResponse without_body(HttpResponse response) {
    response.body().clear();
    return response;
}

} // anonymous namespace

HttpResponse json_response(const HttpRequest& request, beast_http::status status,
                           const json::Json& body) {
    HttpResponse response{status, request.version()};
    response.set(beast_http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    response.prepare_payload();
    return response;
}

std::string mime_type(const std::string& path) {
    auto dot = path.rfind('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }
    std::string ext = path.substr(dot);
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".css") return "text/css; charset=utf-8";
    if (ext == ".js") return "text/javascript; charset=utf-8";
    if (ext == ".json") return "application/json";
    if (ext == ".txt") return "text/plain; charset=utf-8";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".ico") return "image/vnd.microsoft.icon";
    return "application/octet-stream";
}

HttpApi::HttpApi(ActivityRegistry& registry, std::string static_dir)
    : registry_(registry), static_dir_(std::move(static_dir)) {}

HttpResponse HttpApi::handle(const HttpRequest& request) const {
    try {
        return route(request);
    } catch (const RegistryError& e) {
        return json_response(request, beast_http::int_to_status(e.http_status()),
                             json::detail_body(e.what()));
    } catch (const std::exception& e) {
        log_error(COMPONENT, "request_failed",
                  {{"target", std::string(request.target())}, {"error", e.what()}});
        return json_response(request, beast_http::status::internal_server_error,
                             json::detail_body("Internal Server Error"));
    }
}

HttpResponse HttpApi::route(const HttpRequest& request) const {
    auto [path, query] = url::split_target(std::string(request.target()));
    auto segments = url::path_segments(path);
    auto method = request.method();

    if (segments.empty()) {
        if (!is_read(method)) {
            return method_not_allowed(request, "GET, HEAD");
        }
        HttpResponse response{beast_http::status::temporary_redirect, request.version()};
        response.set(beast_http::field::location, INDEX_LOCATION);
        response.keep_alive(request.keep_alive());
        response.prepare_payload();
        return response;
    }

    if (segments[0] == "static") {
        if (!is_read(method)) {
            return method_not_allowed(request, "GET, HEAD");
        }
        return serve_static(request, std::vector<std::string>(segments.begin() + 1, segments.end()));
    }

    if (segments[0] != "activities") {
        return not_found(request);
    }

    if (segments.size() == 1) {
        if (!is_read(method)) {
            return method_not_allowed(request, "GET, HEAD");
        }
        if (method == beast_http::verb::head) {
            return without_body(list_activities(request));
        }
        return list_activities(request);
    }

    if (segments.size() == 3) {
        const auto& activity_name = segments[1];
        const auto& action = segments[2];
        if (action == "signup") {
            if (method != beast_http::verb::post) {
                return method_not_allowed(request, "POST");
            }
            require_utf8(activity_name, "activity name");
            return sign_up(request, activity_name, url::parse_query(query));
        }
        if (action == "unregister") {
            if (method != beast_http::verb::delete_) {
                return method_not_allowed(request, "DELETE");
            }
            require_utf8(activity_name, "activity name");
            return unregister(request, activity_name, url::parse_query(query));
        }
    }

    return not_found(request);
}

HttpResponse HttpApi::list_activities(const HttpRequest& request) const {
    return json_response(request, beast_http::status::ok, json::to_json(registry_.list()));
}

HttpResponse HttpApi::sign_up(const HttpRequest& request, const std::string& activity_name,
                              const QueryParams& params) const {
    const std::string* email = required_param(params, "email");
    require_utf8(*email, "email");
    auto message = registry_.sign_up(activity_name, *email);
    log_info(COMPONENT, "signed_up", {{"activity", activity_name}, {"email", *email}});
    return json_response(request, beast_http::status::ok, json::message_body(message));
}

HttpResponse HttpApi::unregister(const HttpRequest& request, const std::string& activity_name,
                                 const QueryParams& params) const {
    const std::string* email = required_param(params, "email");
    require_utf8(*email, "email");
    auto message = registry_.unregister(activity_name, *email);
    log_info(COMPONENT, "unregistered", {{"activity", activity_name}, {"email", *email}});
    return json_response(request, beast_http::status::ok, json::message_body(message));
}

HttpResponse HttpApi::serve_static(const HttpRequest& request,
                                   const std::vector<std::string>& segments) const {
    if (segments.empty()) {
        return not_found(request);
    }
    auto file_path = url::safe_join(static_dir_, segments);
    std::error_code ec;
    if (!file_path || !std::filesystem::is_regular_file(*file_path, ec)) {
        return not_found(request);
    }

    std::ifstream in(*file_path, std::ios::binary);
    if (!in) {
        return not_found(request);
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    HttpResponse response{beast_http::status::ok, request.version()};
    response.set(beast_http::field::content_type, mime_type(*file_path));
    response.keep_alive(request.keep_alive());
    response.body() = contents.str();
    response.prepare_payload();
    if (request.method() == beast_http::verb::head) {
        return without_body(std::move(response));
    }
    return response;
}

} // namespace mergington
