#include "api_routes.hpp"
#include "static_files.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char* kServerName = "katadojo";

static void add_cors(HttpResponse& res) {
    res.set(http::field::access_control_allow_origin, "*");
}

static HttpResponse make_response(const HttpRequest& req, http::status status,
                                  std::string body, const std::string& content_type) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, content_type);
    add_cors(res);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

static HttpResponse json_response(const HttpRequest& req, http::status status, const json& body) {
    return make_response(req, status, body.dump(), "application/json");
}

static HttpResponse error_response(const HttpRequest& req, http::status status, const std::string& message) {
    return make_response(req, status, message, "text/plain; charset=utf-8");
}

static HttpResponse preflight(const HttpRequest& req) {
    HttpResponse res{http::status::no_content, req.version()};
    res.set(http::field::server, kServerName);
    add_cors(res);
    res.set(http::field::access_control_allow_methods, "GET, HEAD, POST, OPTIONS");
    auto requested = req[http::field::access_control_request_headers];
    res.set(http::field::access_control_allow_headers,
            requested.empty() ? std::string("*") : std::string(requested.data(), requested.size()));
    res.set(http::field::access_control_max_age, "86400");
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

static HttpResponse method_not_allowed(const HttpRequest& req, const char* allow) {
    auto res = error_response(req, http::status::method_not_allowed, "Method Not Allowed");
    res.set(http::field::allow, allow);
    return res;
}

static HttpResponse run_code(const HttpRequest& req, const ApiContext& ctx) {
    auto content_type = req[http::field::content_type];
    if (content_type.find("application/json") == boost::beast::string_view::npos) {
        return error_response(req, http::status::unsupported_media_type,
                              "Expected request with `Content-Type: application/json`");
    }

    json body = json::parse(req.body(), nullptr, false);
    if (body.is_discarded()) {
        return error_response(req, http::status::bad_request,
                              "Failed to parse the request body as JSON");
    }
    auto exec_req = execution_request_from_json(body);
    if (!exec_req) {
        return error_response(req, http::status::unprocessable_entity,
                              "Failed to deserialize the JSON body: expected an object with a string `code` field");
    }
    if (!ctx.sandbox) {
        return error_response(req, http::status::service_unavailable, "Sandbox is not configured");
    }

    ExecutionResult result = ctx.sandbox->execute(*exec_req);
    return json_response(req, http::status::ok, to_json(result));
}

static HttpResponse serve_static(const HttpRequest& req, const std::string& path, const ApiContext& ctx) {
    if (req.method() != http::verb::get && req.method() != http::verb::head) {
        return method_not_allowed(req, "GET, HEAD");
    }
    if (ctx.static_dir.empty()) {
        return error_response(req, http::status::not_found, "Not Found");
    }
    auto file = resolve_static_path(ctx.static_dir, path);
    if (!file) {
        return error_response(req, http::status::bad_request, "Invalid path");
    }
    auto content = read_file(*file);
    if (!content) {
        return error_response(req, http::status::not_found, "Not Found");
    }

    auto res = make_response(req, http::status::ok, std::move(*content), mime_type(*file));
    if (req.method() == http::verb::head) {
        auto size = res.body().size();
        res.body().clear();
        res.content_length(size);
    }
    return res;
}

HttpResponse handle_request(const HttpRequest& req, const ApiContext& ctx) {
    if (req.method() == http::verb::options) {
        return preflight(req);
    }

    std::string target(req.target().data(), req.target().size());
    std::string path = target.substr(0, target.find('?'));

    static const std::string kApi = "/api/";
    if (path.compare(0, kApi.size(), kApi) != 0 && path != "/api") {
        return serve_static(req, path, ctx);
    }

    if (path == "/api/playground/run") {
        if (req.method() != http::verb::post) return method_not_allowed(req, "POST");
        return run_code(req, ctx);
    }

    if (path == "/api/katas") {
        if (req.method() != http::verb::get) return method_not_allowed(req, "GET");
        json body = ctx.catalog ? json(ctx.catalog->list()) : json(KataListResponse{});
        return json_response(req, http::status::ok, body);
    }

    static const std::string kKataPrefix = "/api/katas/";
    if (path.compare(0, kKataPrefix.size(), kKataPrefix) == 0) {
        auto raw_id = path.substr(kKataPrefix.size());
        if (!raw_id.empty() && raw_id.find('/') == std::string::npos) {
            if (req.method() != http::verb::get) return method_not_allowed(req, "GET");
            auto id = percent_decode(raw_id);
            const Kata* kata = (id && ctx.catalog) ? ctx.catalog->find(*id) : nullptr;
            if (!kata) {
                return error_response(req, http::status::not_found, "Not Found");
            }
            return json_response(req, http::status::ok, json(*kata));
        }
    }

    return error_response(req, http::status::not_found, "Not Found");
}
