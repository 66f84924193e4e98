#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include "GeoProfile.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <string>

namespace GeoProfile {

struct HttpRequest {
    std::string method;
    std::string path;                              ///< Query string stripped
    std::string version;
    std::map<std::string, std::string> headers;    ///< Keys lower-cased
    std::string body;

    /// Header value by case-insensitive name, "" when absent
    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "text/plain";
    std::map<std::string, std::string> headers;    ///< Extra headers
    std::string body;

    static HttpResponse text(int status, const std::string& body);
    static HttpResponse json(int status, const std::string& body);

    /// Status line, headers (with Content-Length, Connection: close) and body
    std::string serialize() const;

    static const char* reasonPhrase(int status);
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Minimal HTTP/1.1 listener over POSIX sockets
 *
 * Serves one connection at a time: read the request, call the handler,
 * write the response, close. Requests are independent so no state is
 * shared between them. The accept loop polls so that stop() from another
 * thread or a signal handler ends serve() within one poll interval.
 *
 * Protocol errors are answered without calling the handler:
 *   400 malformed request line or headers, bad Content-Length
 *   413 body larger than max_body_bytes
 */
class HttpServer {
public:
    HttpServer(const ServerConfig& config, HttpHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Open, bind and listen; port 0 picks a free port. Throws std::runtime_error.
    void open();

    /// Actual listening port once open() returned
    int port() const { return bound_port_; }

    bool isOpen() const { return listen_fd_ >= 0; }

    /// Accept and answer connections until stop() is called
    void serve();

    /**
     * @brief Wait up to timeout_ms for one connection and answer it
     * @return true if a connection was handled
     */
    bool serveOne(int timeout_ms);

    void stop() { running_ = false; }

    /// Parses request line and headers (everything before the blank line)
    static bool parseHead(const std::string& head, HttpRequest& request);

private:
    ServerConfig config_;
    HttpHandler handler_;
    int listen_fd_ = -1;
    int bound_port_ = 0;
    std::atomic<bool> running_{false};

    void handleConnection(int fd);

    /// 0 when a complete request was read, otherwise the HTTP status to answer with
    int readRequest(int fd, HttpRequest& request) const;

    static bool sendAll(int fd, const std::string& data);
};

} // namespace GeoProfile

#endif // HTTP_SERVER_HPP
