#include "http_server.hpp"
#include "utils.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <sstream>

static std::string key(const std::string& m, const std::string& p){return m+" "+p;}

static constexpr size_t MAX_BODY = 1 << 20;
static constexpr int RECV_TIMEOUT_SEC = 10;

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::param(const std::string& name) const {
    return query_param(query, name);
}

const char* status_reason(int status){
    switch (status){
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
    }
    return "Unknown";
}

HttpServer::~HttpServer(){
    stop();
}

bool HttpServer::start(int port){
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) { perror("socket"); return false; }
    int opt=1; setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr{}; addr.sin_family=AF_INET; addr.sin_addr.s_addr=INADDR_ANY; addr.sin_port=htons(port);
    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr))<0){ perror("bind"); close(server_fd_); server_fd_=-1; return false; }
    if (listen(server_fd_, 16)<0){ perror("listen"); close(server_fd_); server_fd_=-1; return false; }
    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, (sockaddr*)&addr, &len)==0) port_ = ntohs(addr.sin_port);
    run_ = true;
    th_ = std::thread(&HttpServer::loop, this);
    printf("[Http] Listening on port %d\n", port_);
    return true;
}

void HttpServer::stop(){
    run_ = false;
    if (server_fd_>=0){ shutdown(server_fd_, SHUT_RDWR); close(server_fd_); server_fd_=-1; }
    if (th_.joinable()) th_.join();
    // Connection threads are detached and may still be using the handlers'
    // state; reads time out, so this ends once the handlers return.
    if (active_ > 0) printf("[Http] Waiting for %d request(s) to finish\n", active_.load());
    while (active_ > 0) usleep(20000);
}

void HttpServer::add_route(const std::string& method, const std::string& path, RouteHandler h){
    routes_[key(method,path)] = std::move(h);
}

void HttpServer::add_prefix_route(const std::string& method, const std::string& prefix, RouteHandler h){
    prefix_routes_.emplace_back(key(method,prefix), std::move(h));
}

HttpResponse HttpServer::dispatch(HttpRequest req) const {
    HttpResponse res;
    const RouteHandler* handler = nullptr;

    auto it = routes_.find(key(req.method, req.path));
    if (it != routes_.end()){
        handler = &it->second;
    } else {
        std::string k = key(req.method, req.path);
        for (auto& pr : prefix_routes_){
            if (k.size() > pr.first.size() && k.compare(0, pr.first.size(), pr.first) == 0){
                req.path_rest = url_decode(k.substr(pr.first.size()));
                handler = &pr.second;
                break;
            }
        }
    }

    res.headers["Content-Type"] = "application/json";
    if (!handler){
        res.status=404; res.body="{\"error\":\"Not found\"}";
        return res;
    }
    try {
        (*handler)(req, res);
    } catch (const std::exception& e){
        fprintf(stderr, "[Http] %s %s failed: %s\n", req.method.c_str(), req.path.c_str(), e.what());
        res.status=500; res.body="{\"error\":\"Internal server error\"}";
    }
    return res;
}

void HttpServer::loop(){
    while (run_){
        int cfd = accept(server_fd_, nullptr, nullptr);
        if (cfd<0){ if(!run_) break; perror("accept"); continue; }
        timeval tv{}; tv.tv_sec = RECV_TIMEOUT_SEC;
        setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        // Handle per connection in a detached thread
        active_++;
        std::thread([this,cfd](){
            HttpRequest req;
            int err = read_request(cfd, req);
            if (err == 0){
                send_response(cfd, dispatch(std::move(req)));
            } else {
                HttpResponse res; res.status=err;
                res.headers["Content-Type"] = "application/json";
                res.body = err==413 ? "{\"error\":\"Request body too large\"}" : "{\"error\":\"Bad request\"}";
                send_response(cfd, res);
            }
            close(cfd);
            active_--;
        }).detach();
    }
}

static bool parse_request_line(const std::string& line, HttpRequest& req){
    std::istringstream iss(line);
    if(!(iss>>req.method)) return false;
    std::string target; if(!(iss>>target)) return false;
    size_t q = target.find('?');
    if (q==std::string::npos){ req.path = target; }
    else { req.path = target.substr(0,q); req.query = target.substr(q+1); }
    return true;
}

int HttpServer::read_request(int fd, HttpRequest& req){
    // read until double CRLF
    std::string data; char buf[2048];
    ssize_t n;
    size_t header_end = std::string::npos;
    while (header_end==std::string::npos){
        n=recv(fd,buf,sizeof(buf),0); if(n<=0) break; data.append(buf,n);
        header_end = data.find("\r\n\r\n");
        if (header_end==std::string::npos && data.size() > MAX_BODY) return 413;
    }
    if (header_end==std::string::npos) return 400;

    std::istringstream ss(data.substr(0, header_end));
    std::string line; if(!std::getline(ss,line)) return 400;
    if (line.size() && line.back()=='\r') line.pop_back();
    if(!parse_request_line(line, req)) return 400;

    while (std::getline(ss,line)){
        if (line.size() && line.back()=='\r') line.pop_back();
        size_t c=line.find(':'); if(c!=std::string::npos){
            req.headers[to_lower(line.substr(0,c))] = trim(line.substr(c+1));
        }
    }

    // Body (Content-Length)
    size_t cl=0;
    auto it=req.headers.find("content-length");
    if (it!=req.headers.end()){
        try { cl = std::stoul(it->second); }
        catch (const std::exception&) { return 400; }
        if (cl > MAX_BODY) return 413;
    }
    req.body = data.substr(header_end+4);
    while (req.body.size()<cl){
        n=recv(fd,buf,sizeof(buf),0); if(n<=0) break; req.body.append(buf,n);
    }
    if (req.body.size() < cl) return 400;
    if (req.body.size() > cl) req.body.resize(cl);
    return 0;
}

void HttpServer::send_response(int fd, const HttpResponse& res){
    std::ostringstream hdr;
    hdr<<"HTTP/1.1 "<<res.status<<" "<<status_reason(res.status)<<"\r\n";
    for (auto &kv: res.headers) hdr<<kv.first<<": "<<kv.second<<"\r\n";
    hdr<<"Connection: close\r\n";
    hdr<<"Content-Length: "<<res.body.size()<<"\r\n\r\n";
    auto s = hdr.str();
    if (send(fd, s.data(), s.size(), MSG_NOSIGNAL) <= 0) return;
    if (!res.body.empty()) send(fd, res.body.data(), res.body.size(), MSG_NOSIGNAL);
}
