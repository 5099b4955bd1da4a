#include <pthread.h>

#include "StreamUtils.hpp"
#include "TestHeaders.hpp"

using namespace eb;

namespace {
struct Pipe {
  Pipe() {
    if (::pipe(fds) == -1) {
      throw std::runtime_error(string("Cannot create pipe: ") +
                               strerror(errno));
    }
  }
  ~Pipe() {
    closeReadEnd();
    closeWriteEnd();
  }
  void closeReadEnd() {
    if (fds[0] >= 0) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }
  void closeWriteEnd() {
    if (fds[1] >= 0) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
  int readEnd() const { return fds[0]; }
  int writeEnd() const { return fds[1]; }

  int fds[2];
};

void ignoreSignal(int) {}

// Installs a handler without SA_RESTART so blocking calls fail with EINTR
void installInterruptingHandler() {
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = ignoreSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  REQUIRE(::sigaction(SIGUSR1, &action, NULL) == 0);
}

void interrupt(thread& target) {
  for (int a = 0; a < 5; a++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ::pthread_kill(target.native_handle(), SIGUSR1);
  }
}
}  // namespace

TEST_CASE("A frame split across many writes is read whole",
          "[StreamUtils]") {
  Pipe pipe;
  const string frame = string("\x0d\x00\x00\x00", 4) + "{\"ping\":1234}";
  thread writer([&]() {
    for (char c : frame) {
      StreamUtils::writeAll(pipe.writeEnd(), &c, 1);
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  char header[4];
  REQUIRE(StreamUtils::readAllUnlessEof(pipe.readEnd(), header,
                                        sizeof(header)));
  REQUIRE(string(header, 4) == frame.substr(0, 4));
  string payload(frame.length() - 4, '\0');
  StreamUtils::readAll(pipe.readEnd(), &payload[0], payload.length());
  REQUIRE(payload == "{\"ping\":1234}");
  writer.join();
}

TEST_CASE("readAllUnlessEof tells a clean end from a cut frame",
          "[StreamUtils]") {
  Pipe pipe;
  char header[4];

  SECTION("Nothing left to read") {
    pipe.closeWriteEnd();
    REQUIRE_FALSE(
        StreamUtils::readAllUnlessEof(pipe.readEnd(), header, sizeof(header)));
  }

  SECTION("Stream ends inside the length prefix") {
    StreamUtils::writeAll(pipe.writeEnd(), "\x05\x00", 2);
    pipe.closeWriteEnd();
    REQUIRE_THROWS_WITH(
        StreamUtils::readAllUnlessEof(pipe.readEnd(), header, sizeof(header)),
        "Stream has closed abruptly.");
  }

  SECTION("readAll treats even a clean end as a cut") {
    pipe.closeWriteEnd();
    REQUIRE_THROWS_WITH(
        StreamUtils::readAll(pipe.readEnd(), header, sizeof(header)),
        "Stream has closed abruptly.");
  }

  SECTION("Bytes after the frame stay in the stream") {
    StreamUtils::writeAll(pipe.writeEnd(), "abcdef", 6);
    pipe.closeWriteEnd();
    REQUIRE(
        StreamUtils::readAllUnlessEof(pipe.readEnd(), header, sizeof(header)));
    REQUIRE(string(header, 4) == "abcd");
    REQUIRE(StreamUtils::readToEnd(pipe.readEnd()) == "ef");
  }
}

TEST_CASE("Interrupted reads are retried", "[StreamUtils]") {
  installInterruptingHandler();
  Pipe pipe;

  SECTION("readAllUnlessEof") {
    char buffer[3];
    bool complete = false;
    thread reader([&]() {
      complete =
          StreamUtils::readAllUnlessEof(pipe.readEnd(), buffer, sizeof(buffer));
    });
    interrupt(reader);
    StreamUtils::writeAll(pipe.writeEnd(), "xyz", 3);
    reader.join();
    REQUIRE(complete);
    REQUIRE(string(buffer, 3) == "xyz");
  }

  SECTION("readToEnd") {
    string output;
    thread reader([&]() { output = StreamUtils::readToEnd(pipe.readEnd()); });
    interrupt(reader);
    StreamUtils::writeAll(pipe.writeEnd(), "vim: E325\n", 10);
    pipe.closeWriteEnd();
    reader.join();
    REQUIRE(output == "vim: E325\n");
  }
}

TEST_CASE("readToEnd collects output larger than the pipe buffer",
          "[StreamUtils]") {
  Pipe pipe;
  string errorOutput;
  for (int a = 0; a < 4000; a++) {
    errorOutput += "line " + to_string(a) + " of editor diagnostics\n";
  }
  thread writer([&]() {
    StreamUtils::writeAll(pipe.writeEnd(), errorOutput.data(),
                          errorOutput.length());
    pipe.closeWriteEnd();
  });
  REQUIRE(StreamUtils::readToEnd(pipe.readEnd()) == errorOutput);
  writer.join();
}

TEST_CASE("writeAll blocks until a large frame is drained", "[StreamUtils]") {
  Pipe pipe;
  const string body(DEFAULT_MAX_BODY_LENGTH, 'b');
  thread writer([&]() {
    StreamUtils::writeAll(pipe.writeEnd(), body.data(), body.length());
  });
  string received(body.length(), '\0');
  StreamUtils::readAll(pipe.readEnd(), &received[0], received.length());
  writer.join();
  REQUIRE(received == body);
}

TEST_CASE("writeAll fails once the reader is gone", "[StreamUtils]") {
  // The mail client closing its end must surface as an error, not SIGPIPE
  signal(SIGPIPE, SIG_IGN);
  Pipe pipe;
  pipe.closeReadEnd();
  REQUIRE_THROWS_AS(StreamUtils::writeAll(pipe.writeEnd(), "{}", 2),
                    std::runtime_error);

  // Nothing to send is not an error
  Pipe other;
  StreamUtils::writeAll(other.writeEnd(), "", 0);
}

TEST_CASE("Invalid descriptors are rejected", "[StreamUtils]") {
  char buffer[4];
  REQUIRE_THROWS(StreamUtils::writeAll(-1, "abcd", 4));
  REQUIRE_THROWS(StreamUtils::readAllUnlessEof(-1, buffer, sizeof(buffer)));
  REQUIRE_THROWS(StreamUtils::readToEnd(-1));
}
