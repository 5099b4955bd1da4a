#ifndef __EB_HEADERS__
#define __EB_HEADERS__

#if __APPLE__
#include <mach-o/dyld.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <paths.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "easylogging++.h"
#include "nlohmann/json.hpp"
#include "ust.hpp"

using namespace std;
using json = nlohmann::json;

// Largest frame accepted from the mail client
static const int64_t MAX_INBOUND_FRAME_LENGTH = 128 * 1024 * 1024;

// Default upper bound (in bytes) for the body carried by one response
static const size_t DEFAULT_MAX_BODY_LENGTH = 768 * 1024;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef EB_VERSION
#define EB_VERSION "0.0.0"
#endif

namespace eb {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // In case 'to' contains 'from', like replacing
                               // 'x' with 'yx'
  }
  return retval;
}

inline string trim(const string &s) {
  const char *whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

inline string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

inline bool startsWithIgnoreCase(const string &s, const string &prefix) {
  if (s.length() < prefix.length()) {
    return false;
  }
  return toLower(s.substr(0, prefix.length())) == toLower(prefix);
}

// Length of the UTF-8 sequence starting at `pos`, or 0 when the bytes there
// are not a well-formed sequence.
inline size_t utf8SequenceLength(const string &s, size_t pos) {
  unsigned char lead = s[pos];
  size_t length;
  unsigned char low = 0x80, high = 0xBF;
  if (lead < 0x80) {
    return 1;
  } else if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) low = 0xA0;
    if (lead == 0xED) high = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) low = 0x90;
    if (lead == 0xF4) high = 0x8F;
  } else {
    return 0;
  }
  if (pos + length > s.length()) {
    return 0;
  }
  for (size_t a = 1; a < length; a++) {
    unsigned char c = s[pos + a];
    if (a == 1 ? (c < low || c > high) : (c < 0x80 || c > 0xBF)) {
      return 0;
    }
  }
  return length;
}

// Replaces every malformed byte with U+FFFD
inline string toValidUtf8(const string &s) {
  string result;
  result.reserve(s.length());
  size_t pos = 0;
  while (pos < s.length()) {
    size_t length = utf8SequenceLength(s, pos);
    if (length == 0) {
      result.append("\xEF\xBF\xBD");
      pos++;
    } else {
      result.append(s, pos, length);
      pos += length;
    }
  }
  return result;
}

inline bool waitOnFdData(int fd) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = 1;
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting fd";
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc < 0) {
    if (errno == EINTR) {
      return false;
    }
    FATAL_FAIL(rc);
  }
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  const char *tmpdirEnv = ::getenv("TMPDIR");
  string tmpDir = (tmpdirEnv && *tmpdirEnv) ? string(tmpdirEnv) : _PATH_TMP;
  if (tmpDir.back() != '/') {
    tmpDir.push_back('/');
  }
  return tmpDir;
}

inline string GetExecutablePath() {
#if __APPLE__
  char buf[PATH_MAX];
  uint32_t size = sizeof(buf);
  if (_NSGetExecutablePath(buf, &size) != 0) {
    throw std::runtime_error("Executable path is too long");
  }
  return fs::canonical(buf).string();
#else
  return fs::read_symlink("/proc/self/exe").string();
#endif
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  ::exit(signum);
}
}  // namespace eb

#endif
