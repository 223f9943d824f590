#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"
#include "../src/api_routes.hpp"
#include "../src/playground_server.hpp"
#include "../src/static_files.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using tcp = boost::asio::ip::tcp;
using namespace test_support;

namespace {

Kata make_kata(const std::string& id, uint32_t phase, uint32_t sequence) {
    Kata k;
    k.id = id;
    k.phase = phase;
    k.phase_title = "Phase " + std::to_string(phase);
    k.sequence = sequence;
    k.title = "Kata " + id;
    k.hints = {"hint"};
    k.broken_code = "fn main() {}";
    return k;
}

struct Fixture {
    ScratchDir tools{"katadojo-tools"};
    ScratchDir root{"katadojo-ws"};
    ScratchDir site{"katadojo-site"};
    Sandbox sandbox{fake_config(write_fake_compiler(tools.path), root.path), false};
    ApiContext ctx;

    Fixture() {
        ctx.catalog = std::make_shared<const Catalog>(std::vector<Kata>{
            make_kata("own-01", 1, 1), make_kata("own-02", 1, 2), make_kata("borrow 01", 2, 1)});
        ctx.sandbox = &sandbox;
        ctx.static_dir = site.path;
        write_text(site.path / "index.html", "<!doctype html><title>dojo</title>");
        write_text(site.path / "assets" / "app.js", "console.log('dojo');");
        write_text(site.path / "docs" / "index.html", "docs");
    }
};

HttpRequest make_request(http::verb method, const std::string& target, std::string body = "",
                         const std::string& content_type = "") {
    HttpRequest req{method, target, 11};
    req.set(http::field::host, "localhost");
    if (!content_type.empty()) req.set(http::field::content_type, content_type);
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

std::string header(const HttpResponse& res, http::field f) {
    auto v = res[f];
    return std::string(v.data(), v.size());
}

void test_list_katas() {
    Fixture fx;
    auto res = handle_request(make_request(http::verb::get, "/api/katas"), fx.ctx);
    expect(res.result() == http::status::ok, "200");
    expect(header(res, http::field::content_type) == "application/json", "json content type");
    expect(header(res, http::field::access_control_allow_origin) == "*", "cors header");
    auto j = json::parse(res.body());
    expect(j["phases"].size() == 2, "two phases");
    expect(j["phases"][0]["katas"].size() == 2, "two katas in phase 1");
    expect(j["phases"][0]["katas"][1]["id"] == "own-02", "ordered by sequence");
}

void test_list_with_query_string() {
    Fixture fx;
    auto res = handle_request(make_request(http::verb::get, "/api/katas?refresh=1"), fx.ctx);
    expect(res.result() == http::status::ok, "query string ignored for routing");
}

void test_get_kata() {
    Fixture fx;
    auto res = handle_request(make_request(http::verb::get, "/api/katas/own-01"), fx.ctx);
    expect(res.result() == http::status::ok, "200");
    auto j = json::parse(res.body());
    expect(j["id"] == "own-01" && j["broken_code"] == "fn main() {}", "kata body");

    auto encoded = handle_request(make_request(http::verb::get, "/api/katas/borrow%2001"), fx.ctx);
    expect(encoded.result() == http::status::ok, "percent-encoded id decoded");
}

void test_unknown_kata_and_api_paths() {
    Fixture fx;
    expect(handle_request(make_request(http::verb::get, "/api/katas/nope"), fx.ctx).result()
               == http::status::not_found, "unknown kata id is 404");
    expect(handle_request(make_request(http::verb::get, "/api/katas/own-01/extra"), fx.ctx).result()
               == http::status::not_found, "nested kata path is 404");
    expect(handle_request(make_request(http::verb::get, "/api/unknown"), fx.ctx).result()
               == http::status::not_found, "unknown api path is 404");
    expect(handle_request(make_request(http::verb::get, "/api"), fx.ctx).result()
               == http::status::not_found, "bare api prefix is 404");
}

void test_wrong_methods() {
    Fixture fx;
    auto run = handle_request(make_request(http::verb::get, "/api/playground/run"), fx.ctx);
    expect(run.result() == http::status::method_not_allowed, "GET on run is 405");
    expect(header(run, http::field::allow) == "POST", "allow header");
    auto list = handle_request(make_request(http::verb::post, "/api/katas", "{}", "application/json"), fx.ctx);
    expect(list.result() == http::status::method_not_allowed, "POST on katas is 405");
    auto stat = handle_request(make_request(http::verb::delete_, "/index.html"), fx.ctx);
    expect(stat.result() == http::status::method_not_allowed, "DELETE on static is 405");
}

void test_preflight() {
    Fixture fx;
    auto req = make_request(http::verb::options, "/api/playground/run");
    req.set(http::field::access_control_request_headers, "content-type");
    auto res = handle_request(req, fx.ctx);
    expect(res.result() == http::status::no_content, "204");
    expect(header(res, http::field::access_control_allow_origin) == "*", "any origin");
    expect(header(res, http::field::access_control_allow_methods).find("POST") != std::string::npos, "POST allowed");
    expect(header(res, http::field::access_control_allow_headers) == "content-type", "requested headers echoed");
    expect(res.body().empty(), "no body");
}

void test_run_success() {
    Fixture fx;
    auto res = handle_request(make_request(http::verb::post, "/api/playground/run",
                                           json{{"code", "echo 'Hello, world!'"}}.dump(), "application/json"),
                              fx.ctx);
    expect(res.result() == http::status::ok, "200");
    auto j = json::parse(res.body());
    expect(j["success"] == true, "success");
    expect(j["stdout"] == "Hello, world!\n", "stdout");
    expect(j["stderr"] == "", "stderr");
    expect(j["execution_time_ms"].is_number_unsigned(), "elapsed time present");
    expect(!j.contains("error"), "no error key");
}

void test_run_compile_error_is_200() {
    Fixture fx;
    auto res = handle_request(make_request(http::verb::post, "/api/playground/run",
                                           json{{"code", "COMPILE_ERROR"}}.dump(), "application/json; charset=utf-8"),
                              fx.ctx);
    expect(res.result() == http::status::ok, "compile errors are still 200");
    auto j = json::parse(res.body());
    expect(j["success"] == false && j["stderr"].get<std::string>().find("error:") != std::string::npos,
           "diagnostics in stderr");
}

void test_run_infrastructure_error_is_200() {
    Fixture fx;
    SandboxConfig cfg = fx.sandbox.config();
    cfg.compiler = "/nonexistent/rustc";
    Sandbox broken{cfg, false};
    fx.ctx.sandbox = &broken;
    auto res = handle_request(make_request(http::verb::post, "/api/playground/run",
                                           json{{"code", "x"}}.dump(), "application/json"),
                              fx.ctx);
    expect(res.result() == http::status::ok, "200");
    auto j = json::parse(res.body());
    expect(j["success"] == false && j["error"].is_string(), "error reported in the body");
}

void test_run_rejects_bad_bodies() {
    Fixture fx;
    auto bad_json = handle_request(make_request(http::verb::post, "/api/playground/run", "{not json",
                                                "application/json"), fx.ctx);
    expect(bad_json.result() == http::status::bad_request, "malformed json is 400");

    auto wrong_shape = handle_request(make_request(http::verb::post, "/api/playground/run",
                                                   R"({"source":"x"})", "application/json"), fx.ctx);
    expect(wrong_shape.result() == http::status::unprocessable_entity, "missing code is 422");

    auto wrong_type = handle_request(make_request(http::verb::post, "/api/playground/run",
                                                  R"({"code":42})", "application/json"), fx.ctx);
    expect(wrong_type.result() == http::status::unprocessable_entity, "non-string code is 422");

    auto no_type = handle_request(make_request(http::verb::post, "/api/playground/run",
                                               R"({"code":"x"})"), fx.ctx);
    expect(no_type.result() == http::status::unsupported_media_type, "missing content type is 415");
    expect(dir_is_empty(fx.root.path), "rejected bodies never touch the sandbox");
}

void test_static_files() {
    Fixture fx;
    auto index = handle_request(make_request(http::verb::get, "/"), fx.ctx);
    expect(index.result() == http::status::ok && index.body().find("dojo") != std::string::npos, "index served");
    expect(header(index, http::field::content_type) == "text/html; charset=utf-8", "html type");

    auto js = handle_request(make_request(http::verb::get, "/assets/app.js?v=3"), fx.ctx);
    expect(js.result() == http::status::ok, "asset served");
    expect(header(js, http::field::content_type) == "text/javascript; charset=utf-8", "js type");

    auto dir = handle_request(make_request(http::verb::get, "/docs"), fx.ctx);
    expect(dir.result() == http::status::ok && dir.body() == "docs", "directory maps to index.html");

    auto missing = handle_request(make_request(http::verb::get, "/missing.css"), fx.ctx);
    expect(missing.result() == http::status::not_found, "missing file is 404");
}

void test_static_head() {
    Fixture fx;
    auto res = handle_request(make_request(http::verb::head, "/index.html"), fx.ctx);
    expect(res.result() == http::status::ok, "200");
    expect(res.body().empty(), "no body for HEAD");
    expect(header(res, http::field::content_length) == "34", "length of the file");
}

void test_static_traversal_rejected() {
    Fixture fx;
    for (const char* target : {"/../secret", "/assets/../../secret", "/%2e%2e/secret", "//etc/passwd", "/a%00b"}) {
        auto res = handle_request(make_request(http::verb::get, target), fx.ctx);
        expect(res.result() == http::status::bad_request, std::string("rejected ") + target);
    }
}

void test_static_disabled() {
    Fixture fx;
    fx.ctx.static_dir.clear();
    auto res = handle_request(make_request(http::verb::get, "/"), fx.ctx);
    expect(res.result() == http::status::not_found, "no static dir means 404");
}

void test_static_helpers() {
    expect(mime_type("a/b/STYLE.CSS") == "text/css; charset=utf-8", "extension case-insensitive");
    expect(mime_type("blob") == "application/octet-stream", "unknown type");
    expect(percent_decode("a%20b") == std::optional<std::string>("a b"), "decode escape");
    expect(!percent_decode("bad%2"), "truncated escape");
    expect(!percent_decode("bad%zz"), "non-hex escape");
    auto p = resolve_static_path("/srv/site", "/css/app.css");
    expect(p && *p == fs::path("/srv/site/css/app.css"), "joined under root");
}

// ---------------------------------------------------------------------------
// live server
// ---------------------------------------------------------------------------

struct Client {
    boost::asio::io_context ioc;
    tcp::socket socket{ioc};
    boost::beast::flat_buffer buffer;

    explicit Client(unsigned short port) {
        socket.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port});
    }

    http::response<http::string_body> send(HttpRequest req) {
        req.keep_alive(true);
        http::write(socket, req);
        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        return res;
    }
};

void test_live_server_keep_alive() {
    Fixture fx;
    PlaygroundServer server{fx.ctx, 2, false};
    expect(server.start("127.0.0.1", 0), "server started");
    expect(server.port() != 0, "ephemeral port bound");

    {
        Client client(server.port());
        auto list = client.send(make_request(http::verb::get, "/api/katas"));
        expect(list.result() == http::status::ok, "list over the wire");
        expect(json::parse(list.body())["phases"].size() == 2, "list body");

        auto run = client.send(make_request(http::verb::post, "/api/playground/run",
                                            json{{"code", "echo wire"}}.dump(), "application/json"));
        expect(run.result() == http::status::ok, "run over the same connection");
        expect(json::parse(run.body())["stdout"] == "wire\n", "run body");
    }

    server.stop();
    expect(!server.is_running(), "stopped");
}

void test_live_server_parallel_runs() {
    Fixture fx;
    PlaygroundServer server{fx.ctx, 4, false};
    expect(server.start("127.0.0.1", 0), "server started");

    const int n = 4;
    std::vector<std::string> outputs(n);
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.emplace_back([&, i] {
            Client client(server.port());
            auto res = client.send(make_request(http::verb::post, "/api/playground/run",
                                                json{{"code", "sleep 0.2; echo " + std::to_string(i)}}.dump(),
                                                "application/json"));
            outputs[i] = json::parse(res.body())["stdout"].get<std::string>();
        });
    }
    for (auto& t : threads) t.join();
    for (int i = 0; i < n; ++i) {
        expect(outputs[i] == std::to_string(i) + "\n", "each client got its own output");
    }
    server.stop();
    expect(dir_is_empty(fx.root.path), "no workspaces left behind");
}

void test_live_server_oversized_body() {
    Fixture fx;
    PlaygroundServer server{fx.ctx, 1, false};
    expect(server.start("127.0.0.1", 0), "server started");
    {
        // Only the header goes out; the server must refuse on the declared length.
        Client client(server.port());
        auto req = make_request(http::verb::post, "/api/playground/run", "", "application/json");
        req.content_length(3 * 1024 * 1024);
        auto res = client.send(std::move(req));
        expect(res.result() == http::status::payload_too_large, "413 for bodies over the limit");
    }
    server.stop();
}

void test_live_server_half_sent_request_does_not_block() {
    Fixture fx;
    PlaygroundServer server{fx.ctx, 1, false};
    server.set_request_timeout(std::chrono::milliseconds(800));
    expect(server.start("127.0.0.1", 0), "server started");
    {
        boost::asio::io_context ioc;
        tcp::socket stalled{ioc};
        stalled.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), server.port()});
        boost::asio::write(stalled, boost::asio::buffer(std::string("GET /api/katas HTTP/1.1\r\nHost: x\r\n")));

        Client client(server.port());
        auto res = client.send(make_request(http::verb::get, "/api/katas"));
        expect(res.result() == http::status::ok, "complete request answered next to a half-sent one");

        auto t0 = std::chrono::steady_clock::now();
        char byte = 0;
        boost::system::error_code ec;
        stalled.read_some(boost::asio::buffer(&byte, 1), ec);
        expect(static_cast<bool>(ec), "half-sent connection closed by the server");
        expect(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5), "closed at the request deadline");
    }
    server.stop();
}

void test_live_server_idle_connections_do_not_hold_workers() {
    Fixture fx;
    PlaygroundServer server{fx.ctx, 1, false};
    expect(server.start("127.0.0.1", 0), "server started");
    {
        std::vector<std::unique_ptr<Client>> idle;
        for (int i = 0; i < 3; ++i) {
            idle.push_back(std::make_unique<Client>(server.port()));
            auto res = idle.back()->send(make_request(http::verb::get, "/api/katas"));
            expect(res.result() == http::status::ok, "keep-alive connection served");
        }

        Client runner(server.port());
        auto run = runner.send(make_request(http::verb::post, "/api/playground/run",
                                            json{{"code", "echo ran"}}.dump(), "application/json"));
        expect(run.result() == http::status::ok, "run answered while other connections sit idle");
        expect(json::parse(run.body())["stdout"] == "ran\n", "run body");
    }
    server.stop();
}

void test_start_twice_and_bad_address() {
    Fixture fx;
    PlaygroundServer server{fx.ctx, 1, false};
    expect(server.start("127.0.0.1", 0), "first start");
    expect(!server.start("127.0.0.1", 0), "second start refused while running");
    server.stop();

    PlaygroundServer bad{fx.ctx, 1, false};
    expect(!bad.start("not-an-address", 0), "invalid address refused");
}

} // namespace

int main() {
    std::cout << "api tests\n";
    run_test("list_katas", test_list_katas);
    run_test("list_with_query_string", test_list_with_query_string);
    run_test("get_kata", test_get_kata);
    run_test("unknown_kata_and_api_paths", test_unknown_kata_and_api_paths);
    run_test("wrong_methods", test_wrong_methods);
    run_test("preflight", test_preflight);
    run_test("run_success", test_run_success);
    run_test("run_compile_error_is_200", test_run_compile_error_is_200);
    run_test("run_infrastructure_error_is_200", test_run_infrastructure_error_is_200);
    run_test("run_rejects_bad_bodies", test_run_rejects_bad_bodies);
    run_test("static_files", test_static_files);
    run_test("static_head", test_static_head);
    run_test("static_traversal_rejected", test_static_traversal_rejected);
    run_test("static_disabled", test_static_disabled);
    run_test("static_helpers", test_static_helpers);
    run_test("live_server_keep_alive", test_live_server_keep_alive);
    run_test("live_server_parallel_runs", test_live_server_parallel_runs);
    run_test("live_server_oversized_body", test_live_server_oversized_body);
    run_test("live_server_half_sent_request_does_not_block", test_live_server_half_sent_request_does_not_block);
    run_test("live_server_idle_connections_do_not_hold_workers", test_live_server_idle_connections_do_not_hold_workers);
    run_test("start_twice_and_bad_address", test_start_twice_and_bad_address);
    return finish("api");
}
