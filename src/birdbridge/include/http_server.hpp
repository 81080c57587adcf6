#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <thread>
#include <atomic>

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::unordered_map<std::string,std::string> headers; // names lower-cased
    std::string body;
    std::string path_rest;  // decoded remainder after a prefix route

    std::string header(const std::string& name) const;
    std::string param(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::unordered_map<std::string,std::string> headers;
    std::string body;
};

using RouteHandler = std::function<void(const HttpRequest&, HttpResponse&)>;

const char* status_reason(int status);

class HttpServer {
public:
    ~HttpServer();

    // Port 0 binds an ephemeral port; port() reports the one bound.
    bool start(int port);
    // Stops accepting and waits for requests in flight.
    void stop();
    int port() const { return port_; }
    void add_route(const std::string& method, const std::string& path, RouteHandler h);
    // Matches any path starting with `prefix`; the rest lands in req.path_rest.
    void add_prefix_route(const std::string& method, const std::string& prefix, RouteHandler h);

    // Route lookup and handler call without a socket.
    HttpResponse dispatch(HttpRequest req) const;

private:
    int server_fd_ = -1;
    int port_ = 0;
    std::thread th_;
    std::atomic<bool> run_{false};
    std::atomic<int> active_{0};
    std::unordered_map<std::string, RouteHandler> routes_;
    std::vector<std::pair<std::string, RouteHandler>> prefix_routes_;

    void loop();
    // 0 on success, otherwise the status to answer with (400 or 413).
    static int read_request(int fd, HttpRequest& req);
    static void send_response(int fd, const HttpResponse& res);
};
