#ifndef __EB_EDITOR_LAUNCHER__
#define __EB_EDITOR_LAUNCHER__

#include "Headers.hpp"

namespace eb {
struct EditorResult {
  // Exit status, or -1 when the editor was killed by a signal
  int exitStatus = 0;
  string errorOutput;

  bool succeeded() const { return exitStatus == 0; }
};

/**
 * @brief Runs the user's editor command through a shell and waits for it.
 */
class EditorLauncher {
 public:
  virtual ~EditorLauncher() = default;

  /**
   * @brief Runs `<shell> -c <command>` (`-i -l -c` on macOS) with stdin and
   * stdout on /dev/null, capturing stderr.  Blocks until the editor exits.
   * @throws std::runtime_error when the shell cannot be started.
   */
  virtual EditorResult runEditor(const string& shell, const string& command);

  /** @brief Arguments placed between the shell and the command. */
  static vector<string> shellArguments();
};
}  // namespace eb

#endif  // __EB_EDITOR_LAUNCHER__
