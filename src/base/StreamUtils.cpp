#include "StreamUtils.hpp"

namespace eb {
void StreamUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = errno;
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
        continue;
      }
      STERROR << "Cannot write to stream: " << strerror(localErrno);
      throw std::runtime_error("Cannot write to stream");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to stream: stream closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void StreamUtils::readAll(int fd, char* buf, size_t count) {
  if (!readAllUnlessEof(fd, buf, count)) {
    throw std::runtime_error("Stream has closed abruptly.");
  }
}

bool StreamUtils::readAllUnlessEof(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAll");
  }
  if (count == 0) {
    return true;
  }

  size_t bytesRead = 0;
  do {
    if (!waitOnFdData(fd)) {
      continue;
    }
    ssize_t rc = ::read(fd, buf + bytesRead, count - bytesRead);
    if (rc < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      STERROR << "Cannot read from stream: " << strerror(localErrno);
      throw std::runtime_error("Cannot read from stream");
    }
    if (rc == 0) {
      if (bytesRead == 0) {
        return false;
      }
      throw std::runtime_error("Stream has closed abruptly.");
    }
    bytesRead += rc;
  } while (bytesRead != count);
  return true;
}

string StreamUtils::readToEnd(int fd) {
  string result;
  char buf[4096];
  while (true) {
    ssize_t rc = ::read(fd, buf, sizeof(buf));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::runtime_error(string("Cannot read from stream: ") +
                               strerror(errno));
    }
    if (rc == 0) {
      break;
    }
    result.append(buf, rc);
  }
  return result;
}
}  // namespace eb
