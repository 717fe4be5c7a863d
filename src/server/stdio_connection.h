// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "facade/redis_parser.h"
#include "facade/reply_builder.h"
#include "server/conn_context.h"

namespace doppel {

class Service;

// A single client speaking RESP over a pair of file descriptors, usually stdin and stdout.
// A reader thread owns the input descriptor. When the input ends the client is considered
// gone and a command blocked on its behalf is interrupted, like on a closed socket.
class StdioConnection {
 public:
  StdioConnection(Service* service, int in_fd, int out_fd, uint32_t max_multibulk_len);
  ~StdioConnection();

  StdioConnection(const StdioConnection&) = delete;
  StdioConnection& operator=(const StdioConnection&) = delete;

  // Serves requests until the input ends. Returns false on a protocol or io error.
  bool Run();

  ConnectionContext* cntx() {
    return &cntx_;
  }

 private:
  enum ParserStatus { OK, ERROR };

  // Runs on the reader thread.
  void ReadLoop();
  void OnBreak(bool read_error);

  // Dispatches every complete request in io_buf_ and writes the replies.
  ParserStatus ParseRedis();

  bool WriteAll(std::string_view data);

  Service* service_;
  int in_fd_;
  int out_fd_;

  facade::RedisParser parser_;
  ConnectionContext cntx_;
  std::string sink_;
  facade::RedisReplyBuilder builder_;

  std::string io_buf_;  // used only by the thread running Run()

  std::mutex mu_;
  std::condition_variable cnd_;
  std::string read_buf_;       // guarded by mu_
  bool input_closed_ = false;  // guarded by mu_
  bool read_error_ = false;    // guarded by mu_

  std::atomic_bool stop_reading_{false};
  std::thread reader_;
};

}  // namespace doppel
