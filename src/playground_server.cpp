// playground_server.cpp
#include "playground_server.hpp"
#include "thread_pool.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/error.hpp>
#include <algorithm>
#include <iostream>
#include <optional>
#include <type_traits>

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

static constexpr uint64_t kMaxBodyBytes = 2 * 1024 * 1024;
static constexpr std::chrono::seconds kWriteTimeout{30};
static constexpr std::chrono::seconds kHandshakeTimeout{10};

struct PlaygroundServer::Listener {
    net::io_context ioc{1};
    tcp::acceptor acceptor{ioc};
    net::steady_timer backoff{ioc};
    std::optional<ssl::context> tls;
};

// Helper: treat these errors as normal client disconnects (not server fatal)
static bool is_normal_disconnect(const beast::error_code& ec){
    if(!ec) return false;
    return ec == net::error::eof
        || ec == net::error::connection_reset
        || ec == net::error::connection_aborted
        || ec == net::error::broken_pipe
        || ec == net::error::operation_aborted
        || ec == beast::http::error::end_of_stream
        || ec == ssl::error::stream_truncated;
}

template<class Stream>
class PlaygroundServer::Session : public std::enable_shared_from_this<PlaygroundServer::Session<Stream>> {
public:
    template<class... Args>
    Session(PlaygroundServer& server, std::string peer, Args&&... args)
        : server_(server), peer_(std::move(peer)), stream_(std::forward<Args>(args)...) {
        int active = ++server_.active_connections;
        if(server_.verbose_){
            std::cout << "[server] " << peer_ << " connected, active connections: " << active << std::endl;
        }
    }

    ~Session(){ --server_.active_connections; }

    void run(){
        if constexpr (kTls){
            beast::get_lowest_layer(stream_).expires_after(kHandshakeTimeout);
            stream_.async_handshake(ssl::stream_base::server,
                beast::bind_front_handler(&Session::on_handshake, this->shared_from_this()));
        } else {
            do_read();
        }
    }

private:
    static constexpr bool kTls = !std::is_same<Stream, beast::tcp_stream>::value;

    void on_handshake(beast::error_code ec){
        if(ec){
            if(!is_normal_disconnect(ec)){
                std::cerr << "[server] " << peer_ << " SSL handshake error: " << ec.message() << std::endl;
            }
            return;
        }
        do_read();
    }

    void do_read(){
        parser_.emplace();
        parser_->body_limit(kMaxBodyBytes);
        // One deadline covers the idle wait and the whole request.
        beast::get_lowest_layer(stream_).expires_after(
            std::chrono::milliseconds(server_.request_timeout_.load()));
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&Session::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t){
        if(ec == http::error::end_of_stream) return do_close();
        if(ec == beast::error::timeout){
            if(server_.verbose_){
                std::cout << "[server] " << peer_ << " closed: no complete request within the deadline" << std::endl;
            }
            return;
        }
        if(is_normal_disconnect(ec)) return;
        if(ec){
            http::status status = ec == http::error::body_limit
                ? http::status::payload_too_large : http::status::bad_request;
            std::cerr << "[server] " << peer_ << " bad request: " << ec.message() << std::endl;
            auto res = std::make_shared<HttpResponse>(status, 11);
            res->set(http::field::content_type, "text/plain; charset=utf-8");
            res->set(http::field::access_control_allow_origin, "*");
            res->body() = ec.message();
            res->keep_alive(false);
            res->prepare_payload();
            return do_write(std::move(res));
        }

        auto req = std::make_shared<HttpRequest>(parser_->release());
        auto self = this->shared_from_this();
        try{
            server_.thread_pool->enqueue([self, req]{
                auto res = std::make_shared<HttpResponse>(self->server_.respond(*req, self->peer_));
                net::post(self->stream_.get_executor(), [self, res]() mutable {
                    self->do_write(std::move(res));
                });
            });
        }catch(std::exception const& e){
            std::cerr << "[server] " << peer_ << " dropped: " << e.what() << std::endl;
        }
    }

    void do_write(std::shared_ptr<HttpResponse> res){
        res_ = std::move(res);
        beast::get_lowest_layer(stream_).expires_after(kWriteTimeout);
        http::async_write(stream_, *res_,
            beast::bind_front_handler(&Session::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t){
        if(ec){
            if(!is_normal_disconnect(ec)){
                std::cerr << "[server] " << peer_ << " write error: " << ec.message() << std::endl;
            }
            return;
        }
        bool keep_alive = res_->keep_alive();
        res_.reset();
        if(!keep_alive) return do_close();
        do_read();
    }

    void do_close(){
        if constexpr (kTls){
            beast::get_lowest_layer(stream_).expires_after(kHandshakeTimeout);
            stream_.async_shutdown(
                beast::bind_front_handler(&Session::on_shutdown, this->shared_from_this()));
        } else {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    void on_shutdown(beast::error_code){}

    PlaygroundServer& server_;
    std::string peer_;
    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<HttpResponse> res_;
};

PlaygroundServer::PlaygroundServer(ApiContext ctx, int concurrency, bool verbose)
    : ctx_(std::move(ctx)), max_concurrency(std::max(1, concurrency)), verbose_(verbose) {
    std::cout << "[server] Initializing with concurrency: " << max_concurrency << std::endl;
}

PlaygroundServer::~PlaygroundServer(){ stop(); }

bool PlaygroundServer::start(const std::string& address, unsigned short port, const TlsOptions* tls){
    if(running) return false;

    auto listener = std::make_unique<Listener>();
    try{
        if(tls){
            listener->tls.emplace(ssl::context::tlsv12_server);
            listener->tls->use_certificate_chain_file(tls->cert_file);
            listener->tls->use_private_key_file(tls->key_file, ssl::context::pem);
        }
    }catch(std::exception const& e){
        std::cerr << "[server] TLS setup failed: " << e.what() << std::endl;
        return false;
    }

    beast::error_code ec;
    auto ip = net::ip::make_address(address, ec);
    if(ec){
        std::cerr << "[server] invalid address " << address << ": " << ec.message() << std::endl;
        return false;
    }
    tcp::endpoint endpoint{ip, port};
    auto& acceptor = listener->acceptor;
    acceptor.open(endpoint.protocol(), ec);
    if(ec){
        std::cerr << "[server] acceptor.open error: " << ec.message() << std::endl;
        return false;
    }
    acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if(ec){
        std::cerr << "[server] setting reuse_address failed: " << ec.message() << std::endl;
    }
    acceptor.bind(endpoint, ec);
    if(ec){
        std::cerr << "[server] bind error: " << ec.message() << std::endl;
        return false;
    }
    acceptor.listen(net::socket_base::max_listen_connections, ec);
    if(ec){
        std::cerr << "[server] listen error: " << ec.message() << std::endl;
        return false;
    }

    bound_port = acceptor.local_endpoint().port();
    std::cout << "[server] Server running on " << (tls ? "https" : "http") << "://"
              << address << ":" << bound_port << std::endl;
    std::cout << "[server] Concurrent processing enabled: " << max_concurrency << " threads" << std::endl;

    listener_ = std::move(listener);
    thread_pool = std::make_unique<ThreadPool>(max_concurrency);
    running = true;
    do_accept();
    th = std::thread(&PlaygroundServer::run_io, this);
    return true;
}

void PlaygroundServer::run_io(){
    for(;;){
        try{
            listener_->ioc.run();
            return;
        }catch(std::exception const& e){
            std::cerr << "[server] network loop exception: " << e.what() << std::endl;
        }
    }
}

void PlaygroundServer::stop(){
    if(!running.exchange(false)) return;

    listener_->ioc.stop();
    if(th.joinable()) th.join();
    // Requests already with the pool finish; their responses are discarded
    // together with the connections when the listener goes away.
    thread_pool->shutdown();
    listener_.reset();
    std::cout << "[server] stopped" << std::endl;
}

void PlaygroundServer::do_accept(){
    Listener* l = listener_.get();
    l->acceptor.async_accept(net::make_strand(l->ioc),
        [this, l](beast::error_code ec, tcp::socket socket){
            if(ec == net::error::operation_aborted || !running) return;
            if(ec){
                // Typically descriptor exhaustion; retry shortly.
                std::cerr << "[server] accept error: " << ec.message() << std::endl;
                l->backoff.expires_after(std::chrono::milliseconds(50));
                l->backoff.async_wait([this](beast::error_code){ if(running) do_accept(); });
                return;
            }

            beast::error_code ep_ec;
            auto remote = socket.remote_endpoint(ep_ec);
            std::string peer = ep_ec ? std::string("?") : remote.address().to_string() + ":" + std::to_string(remote.port());

            if(l->tls){
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    *this, std::move(peer), std::move(socket), *l->tls)->run();
            } else {
                std::make_shared<Session<beast::tcp_stream>>(
                    *this, std::move(peer), std::move(socket))->run();
            }
            do_accept();
        });
}

HttpResponse PlaygroundServer::respond(const HttpRequest& req, const std::string& peer){
    HttpResponse res;
    try{
        res = handle_request(req, ctx_);
    }catch(std::exception const& e){
        std::cerr << "[server] handler exception for " << req.method_string() << " "
                  << req.target() << ": " << e.what() << std::endl;
        res = HttpResponse{http::status::internal_server_error, req.version()};
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.set(http::field::access_control_allow_origin, "*");
        res.body() = "Internal Server Error";
        res.keep_alive(false);
        res.prepare_payload();
    }

    if(verbose_){
        std::cout << "[server] " << peer << " " << req.method_string() << " " << req.target()
                  << " -> " << res.result_int() << std::endl;
    }
    return res;
}
