#ifndef SRC_SERVER_SERVER_H_
#define SRC_SERVER_SERVER_H_

#include <iostream>
#include <sstream>
#include <string>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "server/config.h"

struct WSPPServerConfig : public websocketpp::config::asio {
  typedef WSPPServerConfig type;
  typedef websocketpp::config::asio base;

  typedef base::concurrency_type concurrency_type;
  typedef base::request_type request_type;
  typedef base::response_type response_type;
  typedef base::message_type message_type;
  typedef base::con_msg_manager_type con_msg_manager_type;
  typedef base::endpoint_msg_manager_type endpoint_msg_manager_type;
  typedef base::alog_type alog_type;
  typedef base::elog_type elog_type;
  typedef base::rng_type rng_type;

  struct transport_config : public base::transport_config {
    typedef type::concurrency_type concurrency_type;
    typedef type::alog_type alog_type;
    typedef type::elog_type elog_type;
    typedef type::request_type request_type;
    typedef type::response_type response_type;
    typedef websocketpp::transport::asio::basic_socket::endpoint socket_type;
  };

  typedef websocketpp::transport::asio::endpoint<transport_config>
      transport_type;

  // Client frames are tiny JSON objects.
  static const size_t max_message_size = 4096;
};

typedef websocketpp::connection_hdl connection_hdl;
typedef websocketpp::frame::opcode::value opcode;
typedef websocketpp::lib::error_code error_code;
typedef websocketpp::log::alevel alevel;

class WSPPServer : public websocketpp::server<WSPPServerConfig> {
 public:
  // Serializes the packet once and queues it as a text frame. Sends never
  // block; a slow reader only grows its own outbound queue.
  template <typename T>
  void send_text(connection_hdl hdl, const T &packet, error_code &ec) {
    std::stringstream out;
    out << packet;
    send_raw(hdl, out.str(), ec);
  }

  template <typename T>
  void send_text(connection_hdl hdl, const T &packet) {
    error_code ec;
    send_text(hdl, packet, ec);
    if (ec) {
      get_alog().write(alevel::app, "Send failed: " + ec.message());
    }
  }

  void send_raw(connection_hdl hdl, const std::string &frame, error_code &ec) {
    const connection_ptr con = get_con_from_hdl(hdl, ec);
    if (ec) {
      return;
    }
    ec = con->send(frame, opcode::text);
  }

  // Bytes queued but not yet written to the socket, 0 for a stale handle.
  size_t buffered_amount(connection_hdl hdl) {
    error_code ec;
    const connection_ptr con = get_con_from_hdl(hdl, ec);
    return ec ? 0 : con->get_buffered_amount();
  }
};

typedef WSPPServer::message_ptr message_ptr;

#endif  // SRC_SERVER_SERVER_H_
