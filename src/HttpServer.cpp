#include <petsc.h>
#include "HttpServer.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace GeoProfile {

namespace {

const size_t MAX_HEAD_BYTES = 64 * 1024;
const int POLL_INTERVAL_MS = 200;
const int RECV_TIMEOUT_S = 5;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpResponse HttpResponse::text(int status, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.content_type = "text/plain; charset=utf-8";
    r.body = body;
    return r;
}

HttpResponse HttpResponse::json(int status, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.content_type = "application/json";
    r.body = body;
    return r;
}

const char* HttpResponse::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "Unknown";
    }
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n";
    out << "Content-Type: " << content_type << "\r\n";
    out << "Content-Length: " << body.size() << "\r\n";
    for (const auto& h : headers) {
        out << h.first << ": " << h.second << "\r\n";
    }
    out << "Connection: close\r\n\r\n";
    out << body;
    return out.str();
}

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(const ServerConfig& config, HttpHandler handler)
    : config_(config), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    if (listen_fd_ >= 0) {
        close(listen_fd_);
    }
}

void HttpServer::open() {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<unsigned short>(config_.port));
    if (inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + config_.host);
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
    }

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
        PetscPrintf(PETSC_COMM_SELF, "Warning: SO_REUSEADDR not set: %s\n", std::strerror(errno));
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::string msg = std::string("bind() failed: ") + std::strerror(errno);
        close(fd);
        throw std::runtime_error(msg);
    }
    if (listen(fd, config_.backlog) != 0) {
        std::string msg = std::string("listen() failed: ") + std::strerror(errno);
        close(fd);
        throw std::runtime_error(msg);
    }

    sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        std::string msg = std::string("getsockname() failed: ") + std::strerror(errno);
        close(fd);
        throw std::runtime_error(msg);
    }

    listen_fd_ = fd;
    bound_port_ = ntohs(bound.sin_port);
    running_ = true;
}

void HttpServer::serve() {
    if (listen_fd_ < 0) open();
    while (running_) {
        serveOne(POLL_INTERVAL_MS);
    }
}

bool HttpServer::serveOne(int timeout_ms) {
    if (listen_fd_ < 0) {
        throw std::runtime_error("HttpServer::serveOne called before open()");
    }

    pollfd pfd;
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = poll(&pfd, 1, timeout_ms);
    if (ready < 0) {
        if (errno == EINTR) return false;
        throw std::runtime_error(std::string("poll() failed: ") + std::strerror(errno));
    }
    if (ready == 0 || !(pfd.revents & POLLIN)) return false;

    sockaddr_in peer;
    socklen_t len = sizeof(peer);
    int fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len);
    if (fd < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED) {
            return false;
        }
        throw std::runtime_error(std::string("accept() failed: ") + std::strerror(errno));
    }

    handleConnection(fd);
    close(fd);
    return true;
}

void HttpServer::handleConnection(int fd) {
    timeval tv;
    tv.tv_sec = RECV_TIMEOUT_S;
    tv.tv_usec = 0;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        PetscPrintf(PETSC_COMM_SELF, "Warning: SO_RCVTIMEO not set: %s\n", std::strerror(errno));
    }

    HttpRequest request;
    int status = readRequest(fd, request);
    if (status < 0) {
        return;    // peer went away before a full request arrived
    }

    HttpResponse response;
    if (status > 0) {
        response = HttpResponse::json(status, std::string("{\"error\":\"") +
                                              HttpResponse::reasonPhrase(status) + "\"}");
    } else {
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            PetscPrintf(PETSC_COMM_SELF, "Error: unhandled exception for %s %s: %s\n",
                        request.method.c_str(), request.path.c_str(), e.what());
            response = HttpResponse::json(500, "{\"error\":\"Internal Server Error\"}");
        }
    }

    PetscPrintf(PETSC_COMM_SELF, "%s %s -> %d (%d bytes)\n",
                request.method.empty() ? "-" : request.method.c_str(),
                request.path.empty() ? "-" : request.path.c_str(),
                response.status, static_cast<int>(response.body.size()));

    if (!sendAll(fd, response.serialize())) {
        PetscPrintf(PETSC_COMM_SELF, "Warning: response to %s not fully sent: %s\n",
                    request.path.c_str(), std::strerror(errno));
    }
}

int HttpServer::readRequest(int fd, HttpRequest& request) const {
    std::string buffer;
    char chunk[4096];
    size_t head_end = std::string::npos;

    while (head_end == std::string::npos) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            return buffer.empty() ? -1 : 400;
        }
        buffer.append(chunk, static_cast<size_t>(n));
        head_end = buffer.find("\r\n\r\n");
        if (head_end == std::string::npos && buffer.size() > MAX_HEAD_BYTES) {
            return 400;
        }
    }

    if (!parseHead(buffer.substr(0, head_end), request)) {
        return 400;
    }

    if (!request.header("transfer-encoding").empty()) {
        return 400;
    }

    size_t content_length = 0;
    std::string cl = request.header("content-length");
    if (!cl.empty()) {
        if (cl.find_first_not_of("0123456789") != std::string::npos || cl.size() > 18) {
            return 400;
        }
        content_length = static_cast<size_t>(std::stoull(cl));
    }
    if (content_length > config_.max_body_bytes) {
        return 413;
    }

    request.body = buffer.substr(head_end + 4);
    while (request.body.size() < content_length) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return 400;
        request.body.append(chunk, static_cast<size_t>(n));
    }
    if (request.body.size() > content_length) {
        request.body.resize(content_length);
    }
    return 0;
}

bool HttpServer::parseHead(const std::string& head, HttpRequest& request) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream request_line(line);
    std::string target, extra;
    if (!(request_line >> request.method >> target >> request.version)) return false;
    if (request_line >> extra) return false;
    if (request.version.compare(0, 5, "HTTP/") != 0) return false;
    if (target.empty() || target[0] != '/') return false;
    for (char c : request.method) {
        if (!std::isupper(static_cast<unsigned char>(c))) return false;
    }

    size_t q = target.find_first_of("?#");
    request.path = q == std::string::npos ? target : target.substr(0, q);

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        request.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

bool HttpServer::sendAll(int fd, const std::string& data) {
    const char* p = data.data();
    size_t remain = data.size();
    while (remain > 0) {
        ssize_t n = send(fd, p, remain, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        p += n;
        remain -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace GeoProfile
