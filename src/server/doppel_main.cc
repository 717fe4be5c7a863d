// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <glog/logging.h>
#include <unistd.h>

#include "server/main_service.h"
#include "server/stdio_connection.h"

ABSL_FLAG(uint64_t, start_time_ms, 0,
          "If positive, freezes the clock at this unix time in milliseconds. "
          "Otherwise the clock follows the wall time.");
ABSL_FLAG(uint32_t, max_multibulk_len, 1u << 16, "Maximal number of arguments in a request");

using absl::GetFlag;

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(
      R"(an in-memory emulation of a redis-like stream store.

Reads RESP requests on stdin and writes the replies to stdout.

Usage: doppel [FLAGS]
)");

  absl::ParseCommandLine(argc, argv);
  google::InitGoogleLogging(argv[0]);

  doppel::Service service;
  service.Init();

  uint64_t start_ms = GetFlag(FLAGS_start_time_ms);
  if (start_ms > 0) {
    LOG(INFO) << "Freezing the clock at " << start_ms;
    service.clock().SetTime(start_ms);
  }

  doppel::StdioConnection connection{&service, STDIN_FILENO, STDOUT_FILENO,
                                     GetFlag(FLAGS_max_multibulk_len)};
  bool res = connection.Run();
  LOG(INFO) << "Connection closed";
  return res ? 0 : 1;
}
