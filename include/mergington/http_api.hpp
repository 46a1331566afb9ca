#pragma once

#include <map>
#include <string>
#include <vector>
#include <boost/beast/http.hpp>
#include "activity_registry.hpp"
#include "json.hpp"

namespace mergington {

namespace beast_http = boost::beast::http;

using HttpRequest = beast_http::request<beast_http::string_body>;
using HttpResponse = beast_http::response<beast_http::string_body>;

/**
 * HTTP routes of the activities API.
 *
 *   GET    /                                  -> 307 /static/index.html
 *   GET    /activities                        -> registry as JSON
 *   POST   /activities/{name}/signup?email=   -> sign up
 *   DELETE /activities/{name}/unregister?email= -> unregister
 *   GET    /static/{path}                     -> file under static_dir
 *
 * handle() never throws: registry errors become {"detail": ...} bodies
 * with the matching status code.
 */
class HttpApi {
public:
    HttpApi(ActivityRegistry& registry, std::string static_dir);

    HttpResponse handle(const HttpRequest& request) const;

private:
    using QueryParams = std::map<std::string, std::string>;

    HttpResponse route(const HttpRequest& request) const;

    HttpResponse list_activities(const HttpRequest& request) const;
    HttpResponse sign_up(const HttpRequest& request, const std::string& activity_name,
                         const QueryParams& params) const;
    HttpResponse unregister(const HttpRequest& request, const std::string& activity_name,
                            const QueryParams& params) const;
    HttpResponse serve_static(const HttpRequest& request,
                              const std::vector<std::string>& segments) const;

    ActivityRegistry& registry_;
    std::string static_dir_;
};

/// Build a response with a JSON body.
HttpResponse json_response(const HttpRequest& request, beast_http::status status,
                           const json::Json& body);

/// MIME type for a file name, by extension.
std::string mime_type(const std::string& path);

} // namespace mergington
