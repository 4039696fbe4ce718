#pragma once
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "common/threadpool.h"

namespace modelhost {
using tcp = boost::asio::ip::tcp;
// a simple http server based on boost beast for serving the operator api,
// metrics and health check endpoints
class HttpServer {
 public:
  class Transport;
  using Handler = std::function<bool(Transport&)>;

  HttpServer() = default;

  ~HttpServer() { stop(); }

  // handle requests whose path equals uri. blocking handlers run on a
  // separate pool so they cannot stall the io threads.
  bool register_uri(const std::string& uri,
                    Handler handler,
                    bool blocking = false);

  // handle requests whose path starts with prefix, exact uris win
  bool register_prefix(const std::string& prefix,
                       Handler handler,
                       bool blocking = false);

  // port 0 picks a free port, see port()
  bool start(uint16_t port,
             int32_t num_threads,
             int32_t num_blocking_threads = 1);

  // waits for blocking handlers that are already running
  void stop();

  // the port the server listens on, 0 before start()
  uint16_t port() const;

  /**
   * A helper class that request handler can use to query transport related
   * information. one transport object is created for each request, and should
   * be accessed from single thread only.
   */
  class Transport {
   private:
    const boost::beast::http::request<boost::beast::http::string_body>* req_;
    boost::beast::http::response<boost::beast::http::string_body>* res_;

    // decoded path and query parameters of the request target
    std::string path_;
    std::unordered_map<std::string, std::string> params_;

   public:
    Transport(
        const boost::beast::http::request<boost::beast::http::string_body>*
            req,
        boost::beast::http::response<boost::beast::http::string_body>* res);

    Transport(const Transport&) = delete;
    Transport& operator=(Transport&) = delete;

    boost::beast::http::verb method() const { return req_->method(); }

    const std::string& path() const { return path_; }

    // returns nullopt if the query parameter is missing
    std::optional<std::string> param(const std::string& name) const;

    const std::string& body() const { return req_->body(); }

    // Send response
    bool send_string(
        const std::string& data,
        const std::string& mime_type = "text/plain; charset=utf-8");

    // Send json response with the given status code
    bool send_json(const nlohmann::json& data, int status_code = 200);

    // Send status code: 200 OK, 503 Service Unavailable, etc.
    bool send_status(int status_code);
  };

  // split a request target into its decoded path and query parameters
  static std::string parse_target(
      const std::string& target,
      std::unordered_map<std::string, std::string>* params);

 private:
  struct Route {
    Handler handler;
    bool blocking = false;
  };

  void async_accept();
  void handle_request(std::shared_ptr<tcp::socket> socket);

  // returns nullptr if no handler matches the path
  const Route* find_route(const std::string& path) const;

  // hold the ownership of all request handlers
  std::unordered_map<std::string, Route> endpoints_;

  // prefix handlers, longest prefix first
  std::vector<std::pair<std::string, Route>> prefix_endpoints_;

  // runs blocking handlers
  std::unique_ptr<ThreadPool> blocking_pool_;

  // io_context and threads for running the server
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::vector<std::thread> threads_;
};

}  // namespace modelhost
