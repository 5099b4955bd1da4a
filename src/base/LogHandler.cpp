#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace eb {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts and the config file, not from easylogging's
  // own argument parsing
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name given with setThreadName (tab-<id> for workers)
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return defaultConf;
}

string LogHandler::logFilename(const string &prefix, const string &kind,
                               bool appendPid) {
  char timestamp[80];
  time_t now = time(NULL);
  struct tm localNow;
  localtime_r(&now, &localNow);
  strftime(timestamp, sizeof(timestamp), "%Y-%m-%d_%H-%M-%S", &localNow);

  string name = prefix + "-";
  if (!kind.empty()) {
    name += kind + "-";
  }
  name += timestamp;
  if (appendPid) {
    name += "_" + to_string(getpid());
  }
  return name + ".log";
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &directory, const string &prefix,
                               bool redirectStderrToFile, bool appendPid,
                               const string &maxLogSize) {
  string logPath =
      createLogFile(directory, logFilename(prefix, "", appendPid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput, "false");

  if (redirectStderrToFile) {
    string stderrPath =
        createLogFile(directory, logFilename(prefix, "stderr", appendPid));
    FILE *stream = freopen(stderrPath.c_str(), "w", stderr);
    if (!stream) {
      throw std::runtime_error("Cannot redirect stderr to " + stderrPath +
                               ": " + strerror(errno));
    }
    setvbuf(stream, NULL, _IOLBF, BUFSIZ);
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed at this point, so nothing may be logged here
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), stdoutConf);
}

string LogHandler::createLogFile(const fs::path &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " +
                             directory.string() + ": " + ec.message());
  }
  string path = (directory / filename).string();
  // Refuse to follow a planted symlink in a shared temporary directory
  int fd = ::open(path.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT | O_WRONLY, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot create log file " + path + ": " +
                             strerror(errno));
  }
  ::close(fd);
  return path;
}
}  // namespace eb
