#ifndef __EB_LOG_HANDLER__
#define __EB_LOG_HANDLER__

#include "Headers.hpp"

namespace eb {
/**
 * @brief Configures easylogging++ for the bridge.
 *
 * Standard output carries native messaging frames, so the default logger
 * never writes there.  The "stdout" logger exists only for the manifest and
 * version output printed before the messaging loop starts.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a new log file under `directory`.
   *
   * The file is named `<prefix>-<timestamp>[_<pid>].log`.  With
   * `redirectStderrToFile`, stderr goes to a sibling `<prefix>-stderr-...`
   * file so that crash output survives.
   *
   * @throws std::runtime_error when the directory or file cannot be created.
   */
  static void setupLogFiles(el::Configurations *defaultConf,
                            const string &directory, const string &prefix,
                            bool redirectStderrToFile = false,
                            bool appendPid = false,
                            const string &maxLogSize = "20971520");

  /**
   * @brief Called by easylogging++ when a log file reaches its size limit.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  static void setupStdoutLogger();

  /** @brief `<prefix>-[<kind>-]<timestamp>[_<pid>].log` */
  static string logFilename(const string &prefix, const string &kind,
                            bool appendPid);

 private:
  static string createLogFile(const fs::path &directory,
                              const string &filename);
};
}  // namespace eb
#endif  // __EB_LOG_HANDLER__
