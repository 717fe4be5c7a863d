// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/stdio_connection.h"

#include <absl/cleanup/cleanup.h>
#include <glog/logging.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "server/main_service.h"

namespace doppel {

using namespace std;
using namespace facade;

namespace {

// How often the reader thread checks whether it should stop.
constexpr int kPollTimeoutMs = 50;

}  // namespace

StdioConnection::StdioConnection(Service* service, int in_fd, int out_fd,
                                 uint32_t max_multibulk_len)
    : service_(service),
      in_fd_(in_fd),
      out_fd_(out_fd),
      parser_(max_multibulk_len),
      cntx_("stdio"),
      builder_(&sink_) {
}

StdioConnection::~StdioConnection() {
  DCHECK(!reader_.joinable());
}

bool StdioConnection::Run() {
  reader_ = thread([this] { ReadLoop(); });
  absl::Cleanup join_reader = [this] {
    stop_reading_.store(true, memory_order_relaxed);
    reader_.join();
  };

  while (true) {
    bool closed = false;
    {
      unique_lock lk(mu_);
      cnd_.wait(lk, [this] { return !read_buf_.empty() || input_closed_; });
      io_buf_.append(read_buf_);
      read_buf_.clear();
      closed = input_closed_;
    }

    if (ParseRedis() == ERROR)
      return false;

    if (closed)
      break;
  }

  if (!io_buf_.empty()) {
    LOG(WARNING) << "Dropping an incomplete request of " << io_buf_.size() << " bytes";
  }

  lock_guard lk(mu_);
  return !read_error_;
}

void StdioConnection::ReadLoop() {
  char buf[4096];
  pollfd pfd{in_fd_, POLLIN, 0};
  bool read_error = false;

  while (!stop_reading_.load(memory_order_relaxed)) {
    int res = poll(&pfd, 1, kPollTimeoutMs);
    if (res < 0) {
      if (errno == EINTR)
        continue;
      LOG(ERROR) << "poll failed: " << strerror(errno);
      read_error = true;
      break;
    }
    if (res == 0)
      continue;

    ssize_t len = read(in_fd_, buf, sizeof(buf));
    if (len < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      LOG(ERROR) << "read failed: " << strerror(errno);
      read_error = true;
      break;
    }
    if (len == 0)
      break;

    lock_guard lk(mu_);
    read_buf_.append(buf, len);
    cnd_.notify_one();
  }

  OnBreak(read_error);
}

void StdioConnection::OnBreak(bool read_error) {
  {
    lock_guard lk(mu_);
    input_closed_ = true;
    read_error_ = read_error;
  }
  cnd_.notify_one();

  // The input is gone, so is the client. A blocked command would otherwise never return.
  VLOG(1) << "Input closed for " << cntx_.name();
  cntx_.CancelBlocking();
}

auto StdioConnection::ParseRedis() -> ParserStatus {
  RespVec parsed;
  CmdArgVec args;
  size_t offset = 0;

  while (offset < io_buf_.size()) {
    uint8_t* start = reinterpret_cast<uint8_t*>(io_buf_.data()) + offset;
    uint32_t consumed = 0;
    RedisParser::Result result =
        parser_.Parse(RedisParser::Buffer{start, io_buf_.size() - offset}, &consumed, &parsed);

    if (result == RedisParser::INPUT_PENDING)
      break;

    if (result != RedisParser::OK) {
      LOG(ERROR) << "Protocol error " << int(result) << ", closing";
      sink_.clear();
      builder_.SendError("Protocol error");
      if (!WriteAll(sink_))
        VLOG(1) << "Could not report the protocol error";
      return ERROR;
    }
    offset += consumed;

    // Empty inline lines are ignored.
    if (parsed.empty())
      continue;

    bool is_request = RespExpr::VecToArgList(parsed, &args);
    DCHECK(is_request) << "server mode parser accepts only strings";

    sink_.clear();
    service_->DispatchCommand(CmdArgList{args}, &builder_, &cntx_);
    if (!WriteAll(sink_))
      return ERROR;
  }

  io_buf_.erase(0, offset);
  return OK;
}

bool StdioConnection::WriteAll(string_view data) {
  while (!data.empty()) {
    ssize_t res = write(out_fd_, data.data(), data.size());
    if (res < 0) {
      if (errno == EINTR)
        continue;
      LOG(ERROR) << "write failed: " << strerror(errno);
      return false;
    }
    data.remove_prefix(res);
  }
  return true;
}

}  // namespace doppel
