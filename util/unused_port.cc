// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "util/unused_port.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fstream>

#include "absl/cleanup/cleanup.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

namespace scriptbox::util {
namespace {

constexpr int kFirstUserPort = 20000;
constexpr int kMaxAttempts = 32;

bool CanListenOn(int port) {
  int fd = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
  if (fd < 0) {
    return false;
  }
  absl::Cleanup close_fd = [fd] { close(fd); };
  int reuse = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    return false;
  }
  sockaddr_in addr = {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    return false;
  }
  return listen(fd, 1) == 0;
}

ABSL_CONST_INIT absl::Mutex next_port_mutex(absl::kConstInit);
int next_port = kFirstUserPort;

}  // namespace

absl::StatusOr<int> FindUnusedPort() {
  int ephemeral_low = 32768, ephemeral_high = 60999;
  std::ifstream range("/proc/sys/net/ipv4/ip_local_port_range");
  if (range && !(range >> ephemeral_low >> ephemeral_high)) {
    return absl::ResourceExhaustedError(
        "Unable to read the ephemeral port range.");
  }
  absl::MutexLock lock(&next_port_mutex);
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    int port = next_port++;
    if (next_port >= ephemeral_low) {
      next_port = kFirstUserPort;
    }
    if (CanListenOn(port)) {
      return port;
    }
  }
  return absl::ResourceExhaustedError("Unable to find an unused TCP port.");
}

}  // namespace scriptbox::util
