#define CATCH_CONFIG_RUNNER

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace eb;

int main(int argc, char **argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  eb::HandleTerminate();

  // Transport and launcher tests close pipes on purpose
  ::signal(SIGPIPE, SIG_IGN);

  const char *verbosity = ::getenv("EB_TEST_VERBOSITY");
  if (verbosity && *verbosity) {
    el::Loggers::setVerboseLevel(atoi(verbosity));
  }

  // Keep test logs out of the Catch report
  string pattern = GetTempDirectory() + string("eb_test_XXXXXXXX");
  if (mkdtemp(&pattern[0]) == NULL) {
    cerr << "Cannot create log directory: " << strerror(errno) << endl;
    return 1;
  }
  string logDirectory = pattern;
  LogHandler::setupLogFiles(&defaultConf, logDirectory, "editor-bridge-test",
                            false, true);
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  std::error_code ec;
  fs::remove_all(logDirectory, ec);
  return result;
}
