#pragma once
#include "catalog/catalog.hpp"
#include "sandbox/sandbox.hpp"
#include <boost/beast/http.hpp>
#include <filesystem>
#include <memory>

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

struct ApiContext {
    std::shared_ptr<const Catalog> catalog;
    const Sandbox* sandbox{nullptr};
    std::filesystem::path static_dir;
};

// GET  /api/katas
// GET  /api/katas/{id}
// POST /api/playground/run
// OPTIONS *            CORS preflight
// GET|HEAD anything else from the static directory
HttpResponse handle_request(const HttpRequest& req, const ApiContext& ctx);
