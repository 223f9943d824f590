#pragma once
#include "api_routes.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

class ThreadPool;

struct TlsOptions {
    std::string cert_file;   // PEM certificate chain
    std::string key_file;    // PEM private key
};

// HTTP/1.1 front end. One network thread runs every connection
// asynchronously; parsed requests are handed to the worker pool and the
// responses are written back on the network thread. Idle and half-sent
// connections therefore never occupy a worker.
class PlaygroundServer {
public:
    PlaygroundServer(ApiContext ctx, int concurrency = 1, bool verbose = true);
    ~PlaygroundServer();

    // Binds and starts the network thread. Port 0 picks a free port, see port().
    bool start(const std::string& address = "0.0.0.0", unsigned short port = 3000,
               const TlsOptions* tls = nullptr);
    void stop();

    // Deadline for one whole request, including the wait for its first byte.
    // Takes effect for requests read after the call.
    void set_request_timeout(std::chrono::milliseconds timeout) { request_timeout_ = timeout.count(); }

    bool is_running() const { return running; }
    unsigned short port() const { return bound_port; }
    int get_concurrency() const { return max_concurrency; }

private:
    struct Listener;
    template<class Stream> class Session;

    void do_accept();
    void run_io();
    HttpResponse respond(const HttpRequest& req, const std::string& peer);

    ApiContext ctx_;
    std::atomic<bool> running{false};
    std::thread th;
    std::unique_ptr<Listener> listener_;
    std::unique_ptr<ThreadPool> thread_pool;
    int max_concurrency;
    bool verbose_;
    std::atomic<std::chrono::milliseconds::rep> request_timeout_{15000};
    unsigned short bound_port{0};
    std::atomic<int> active_connections{0};
};
