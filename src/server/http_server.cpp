#include "http_server.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <glog/logging.h>

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace modelhost {
namespace {

// decode %XX escapes and '+' as space
std::string url_decode(std::string_view str) {
  std::string decoded;
  decoded.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    const char c = str[i];
    if (c == '+') {
      decoded.push_back(' ');
    } else if (c == '%' && i + 2 < str.size()) {
      int value = 0;
      if (absl::SimpleHexAtoi(str.substr(i + 1, 2), &value)) {
        decoded.push_back(static_cast<char>(value));
        i += 2;
      } else {
        decoded.push_back(c);
      }
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

void write_response(tcp::socket& socket, Response& res) {
  res.prepare_payload();
  boost::beast::http::write(socket, res);
  boost::system::error_code ec;
  socket.shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace

bool HttpServer::register_uri(const std::string& uri,
                              HttpServer::Handler handler,
                              bool blocking) {
  if (endpoints_.count(uri) != 0) {
    return false;
  }
  endpoints_[uri] = Route{std::move(handler), blocking};
  return true;
}

bool HttpServer::register_prefix(const std::string& prefix,
                                 HttpServer::Handler handler,
                                 bool blocking) {
  for (const auto& [existing, _] : prefix_endpoints_) {
    if (existing == prefix) {
      return false;
    }
  }
  prefix_endpoints_.emplace_back(prefix, Route{std::move(handler), blocking});
  std::sort(prefix_endpoints_.begin(),
            prefix_endpoints_.end(),
            [](const auto& lhs, const auto& rhs) {
              return lhs.first.size() > rhs.first.size();
            });
  return true;
}

const HttpServer::Route* HttpServer::find_route(
    const std::string& path) const {
  auto it = endpoints_.find(path);
  if (it != endpoints_.end()) {
    return &it->second;
  }
  for (const auto& [prefix, route] : prefix_endpoints_) {
    if (path.compare(0, prefix.size(), prefix) == 0) {
      return &route;
    }
  }
  return nullptr;
}

std::string HttpServer::parse_target(
    const std::string& target,
    std::unordered_map<std::string, std::string>* params) {
  const size_t pos = target.find('?');
  if (pos == std::string::npos) {
    return url_decode(target);
  }
  const std::string_view query = std::string_view(target).substr(pos + 1);
  for (std::string_view pair : absl::StrSplit(query, '&', absl::SkipEmpty())) {
    const std::pair<std::string_view, std::string_view> kv =
        absl::StrSplit(pair, absl::MaxSplits('=', 1));
    (*params)[url_decode(kv.first)] = url_decode(kv.second);
  }
  return url_decode(std::string_view(target).substr(0, pos));
}

void HttpServer::async_accept() {
  // create a new socket
  const auto socket = std::make_shared<tcp::socket>(*io_context_);
  acceptor_->async_accept(
      *socket, [this, socket](boost::system::error_code ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        // loop to accept new incoming connections
        async_accept();

        if (!ec) {
          try {
            handle_request(socket);
          } catch (const std::exception& e) {
            LOG(ERROR) << "Exception in processing request: " << e.what();
          }
        } else {
          LOG(ERROR) << "Error in accepting connection: " << ec.message();
        }
      });
}

void HttpServer::handle_request(std::shared_ptr<tcp::socket> socket) {
  boost::beast::flat_buffer buffer;
  auto req = std::make_shared<Request>();
  boost::beast::http::read(*socket, buffer, *req);
  auto res = std::make_shared<Response>();
  res->version(req->version());
  res->keep_alive(false);

  // the request is read on the io thread, only the handler may block
  auto serve = [socket, req, res](const Route* route) {
    Transport transport(req.get(), res.get());
    if (!route->handler(transport)) {
      res->result(boost::beast::http::status::internal_server_error);
      res->body() = "An error occurred processing the request.";
      res->set(boost::beast::http::field::content_type, "text/plain");
    }
    write_response(*socket, *res);
  };

  std::unordered_map<std::string, std::string> params;
  const std::string path = parse_target(std::string(req->target()), &params);
  const Route* route = find_route(path);
  if (route == nullptr) {
    res->result(boost::beast::http::status::not_found);
    res->body() = "The resource '" + path + "' was not found.";
    res->set(boost::beast::http::field::content_type, "text/plain");
    write_response(*socket, *res);
  } else if (route->blocking && blocking_pool_ != nullptr) {
    blocking_pool_->schedule([serve, route]() {
      try {
        serve(route);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Exception in processing request: " << e.what();
      }
    });
  } else {
    serve(route);
  }
}

bool HttpServer::start(uint16_t port,
                       int32_t num_threads,
                       int32_t num_blocking_threads) {
  io_context_ = std::make_unique<boost::asio::io_context>(num_threads);
  blocking_pool_ = std::make_unique<ThreadPool>(
      static_cast<size_t>(std::max(num_blocking_threads, 1)));
  try {
    acceptor_ = std::make_unique<tcp::acceptor>(
        *io_context_, tcp::endpoint{tcp::v4(), port});
  } catch (const boost::system::system_error& e) {
    LOG(ERROR) << "Failed to listen on port " << port << ": " << e.what();
    return false;
  }
  async_accept();

  for (int32_t i = 0; i < num_threads; ++i) {
    threads_.emplace_back([this] { io_context_->run(); });
  }
  LOG(INFO) << "Started http server on 0.0.0.0:" << this->port();
  return true;
}

uint16_t HttpServer::port() const {
  if (acceptor_ == nullptr) {
    return 0;
  }
  boost::system::error_code ec;
  const tcp::endpoint endpoint = acceptor_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

void HttpServer::stop() {
  // notifiy io_context to stop
  if (io_context_) {
    io_context_->stop();
  }
  // wait for threads to finish
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  // drains handlers already scheduled
  blocking_pool_.reset();
  acceptor_.reset();
}

HttpServer::Transport::Transport(
    const boost::beast::http::request<boost::beast::http::string_body>* req,
    boost::beast::http::response<boost::beast::http::string_body>* res)
    : req_(req), res_(res) {
  path_ = parse_target(std::string(req_->target()), &params_);
}

std::optional<std::string> HttpServer::Transport::param(
    const std::string& name) const {
  auto it = params_.find(name);
  if (it == params_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool HttpServer::Transport::send_string(const std::string& data,
                                        const std::string& mime_type) {
  res_->set(boost::beast::http::field::content_type, mime_type);
  res_->body() = data;
  res_->result(boost::beast::http::status::ok);
  return true;
}

bool HttpServer::Transport::send_json(const nlohmann::json& data,
                                      int status_code) {
  res_->set(boost::beast::http::field::content_type, "application/json");
  // strings from the request may hold invalid utf-8, never throw on them
  res_->body() = data.dump(/*indent=*/2,
                           /*indent_char=*/' ',
                           /*ensure_ascii=*/false,
                           nlohmann::json::error_handler_t::replace);
  res_->result(status_code);
  return true;
}

bool HttpServer::Transport::send_status(int status_code) {
  res_->result(status_code);
  return true;
}

}  // namespace modelhost
