#include "network/http_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace bucketd {
namespace network {

namespace http = boost::beast::http;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const uint16_t port, const std::string& address, RequestHandler& handler)
  : port_(port)
  , address_(address)
  , is_running_(false)
  , handler_(handler) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor created";
    // Create acceptor
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(
      io_context_,
      endpoint
    );

    is_running_ = true;
    io_context_.restart();

    // Start accepting connections
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting IO context";
    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        boost::asio::io_context::work work(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Server started successfully on " << address_ << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (error == boost::asio::error::operation_aborted) {
        return;
      }

      if (!error) {
        boost::system::error_code endpoint_error;
        auto remote = socket.remote_endpoint(endpoint_error);
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection from " << remote;
        reap_sessions();

        auto session = std::make_shared<Session>(std::move(socket));
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.push_back(session);
        session->thread = std::thread(&HttpServer::serve, this, session);
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context
  io_context_.stop();

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  // Unblock and join every connection thread
  std::list<std::shared_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& session : sessions) {
    boost::system::error_code ec;
    session->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (session->thread.joinable()) {
      session->thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// GETTERS
//==============================================

uint16_t HttpServer::local_port() const {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    if (!ec) {
      return endpoint.port();
    }
  }
  return port_;
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::serve(std::shared_ptr<Session> session) {
  auto& socket = session->socket;
  boost::beast::flat_buffer buffer;
  boost::system::error_code ec;

  while (is_running_) {
    http::request_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_SIZE);

    http::read(socket, buffer, parser, ec);
    if (ec == http::error::end_of_stream) {
      break;
    }
    if (ec == http::error::body_limit) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: Rejecting request body above " << MAX_BODY_SIZE << " bytes";
      Request header_only;
      header_only.version(parser.get().version());
      header_only.keep_alive(false);
      Response response = make_error_response(header_only, http::status::bad_request, "Request too large.");
      http::write(socket, response, ec);
      break;
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read error: " << ec.message();
      break;
    }

    Request request = parser.release();
    Response response = handler_.handle(request);
    const bool close = response.need_eof();

    http::write(socket, response, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Write error: " << ec.message();
      break;
    }
    if (close) {
      break;
    }
  }

  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  session->finished = true;
}

void HttpServer::reap_sessions() {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if ((*it)->finished) {
      if ((*it)->thread.joinable()) {
        (*it)->thread.join();
      }
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace network
} // namespace bucketd
