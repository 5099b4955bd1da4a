#include <cxxopts.hpp>

#include "AppManifest.hpp"
#include "BridgeHost.hpp"
#include "LogHandler.hpp"
#include "SimpleIni.h"
#include "StdioTransport.hpp"

using namespace eb;

namespace {
string platformName() {
#if __APPLE__
  return "macos";
#elif __linux__
  return "linux";
#elif __FreeBSD__
  return "freebsd";
#else
  return "unix";
#endif
}

string architectureName() {
#if defined(__x86_64__)
  return "x86_64";
#elif defined(__aarch64__)
  return "aarch64";
#elif defined(__i386__)
  return "x86";
#elif defined(__arm__)
  return "arm";
#else
  return "unknown";
#endif
}

void printManifest() {
  AppManifest manifest = AppManifest::create(GetExecutablePath());
  cerr << "Please create '" << manifest.name
       << ".json' manifest file with the JSON below." << endl;
#if __APPLE__
  cerr << "Under macOS this is usually ~/Library/Mozilla/NativeMessagingHosts/"
       << manifest.name << ".json," << endl
       << "or /Library/Application Support/Mozilla/NativeMessagingHosts/"
       << manifest.name << ".json for global visibility." << endl;
#else
  cerr << "Consult https://wiki.mozilla.org/WebExtensions/Native_Messaging "
          "for its location."
       << endl;
#endif
  cerr << endl;
  CLOG(INFO, "stdout") << manifest.toJson().dump(2) << endl;
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  eb::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, eb::InterruptSignalHandler);
  // A closed stdout must surface as a write error, not kill the host
  ::signal(SIGPIPE, SIG_IGN);

  if (argc == 1) {
    // The mail client always passes the manifest path and extension id
    printManifest();
    exit(0);
  }

  cxxopts::Options options(
      "editor-bridge",
      "Native messaging host that edits mail drafts in an external editor");
  try {
    options.allow_unrecognised_options();

    options.add_options()                                     //
        ("h,help", "Print help and the host manifest")        //
        ("version", "Print version")                          //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("max-body-length",
         "Largest message body (in bytes) carried by one response",
         cxxopts::value<size_t>()->default_value(
             to_string(DEFAULT_MAX_BODY_LENGTH)))  //
        ("positional",
         "Manifest path and extension id passed by the mail client",
         cxxopts::value<vector<string>>())  //
        ;
    options.parse_positional({"positional"});

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      printManifest();
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "EditorBridge native messaging host for "
                           << platformName() << " (" << architectureName()
                           << ") v" << EB_VERSION << endl;
      exit(0);
    }

    // default max log file size is 20MB
    string maxlogsize = "20971520";
    string logDirectory = GetTempDirectory();
    size_t maxBodyLength = DEFAULT_MAX_BODY_LENGTH;

    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      // Load the config file
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc == 0) {
        // read verbose level (prioritize command line option over cfgfile)
        const char *vlevel = ini.GetValue("Debug", "verbose", NULL);
        if (!result.count("verbose") && vlevel) {
          el::Loggers::setVerboseLevel(atoi(vlevel));
        }

        // read silent setting
        const char *silent = ini.GetValue("Debug", "silent", NULL);
        if (silent && atoi(silent) != 0) {
          defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
        }
        // read log file size limit
        const char *logsize = ini.GetValue("Debug", "logsize", NULL);
        if (logsize && atoi(logsize) != 0) {
          // make sure maxlogsize is a string of int value
          maxlogsize = string(logsize);
        }
        const char *logdir = ini.GetValue("Debug", "logdir", NULL);
        if (logdir && *logdir) {
          logDirectory = string(logdir);
        }

        const char *bodyLength =
            ini.GetValue("Messaging", "max_body_length", NULL);
        if (bodyLength && atoll(bodyLength) > 0) {
          maxBodyLength = size_t(atoll(bodyLength));
        }
      } else {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    }

    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    }
    if (result.count("logdir") && !result["logdir"].as<string>().empty()) {
      logDirectory = result["logdir"].as<string>();
    }
    if (result.count("max-body-length")) {
      maxBodyLength = result["max-body-length"].as<size_t>();
    }
    if (maxBodyLength == 0) {
      CLOG(INFO, "stdout") << "--max-body-length must be positive" << endl;
      exit(1);
    }

    // stdout carries native messaging frames from here on
    try {
      LogHandler::setupLogFiles(&defaultConf, logDirectory, "editor-bridge",
                                true, true, maxlogsize);
    } catch (const std::runtime_error &re) {
      cerr << "EditorBridge cannot set up logging: " << re.what() << endl;
      exit(1);
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("editor-bridge-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (result.count("positional")) {
      for (const auto &it : result["positional"].as<vector<string>>()) {
        VLOG(1) << "Ignoring argument from the mail client: " << it;
      }
    }

    shared_ptr<MessageTransport> transport(new StdioTransport());
    shared_ptr<EditorLauncher> launcher(new EditorLauncher());
    BridgeHost host(transport, launcher, EB_VERSION, maxBodyLength);
    bool cleanExit = host.run();
    LOG(INFO) << "EditorBridge shutting down";
    return cleanExit ? 0 : 1;
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}
