#ifndef __EB_BRIDGE_HOST__
#define __EB_BRIDGE_HOST__

#include "Chunker.hpp"
#include "ComposeTypes.hpp"
#include "DocumentCodec.hpp"
#include "EditorLauncher.hpp"
#include "Headers.hpp"
#include "HostUtils.hpp"
#include "MessageTransport.hpp"

namespace eb {
/**
 * @brief A failed compose round trip, reported to the mail client as an
 * error message for the tab.
 */
class ComposeError : public std::exception {
 public:
  ComposeError(bool _reset, const string& _title, const string& _message)
      : reset(_reset), title(_title), message(_message) {}
  inline virtual const char* what() const noexcept { return message.c_str(); }

  // Whether the client should drop its in-progress state for the tab
  bool reset;
  string title;
  string message;
};

/**
 * @brief Native messaging host: reads requests from the mail client and
 * answers each one on its own worker thread.
 */
class BridgeHost {
 public:
  BridgeHost(shared_ptr<MessageTransport> _transport,
             shared_ptr<EditorLauncher> _launcher, const string& _hostVersion,
             size_t _maxBodyLength = DEFAULT_MAX_BODY_LENGTH);
  virtual ~BridgeHost();

  /**
   * @brief Reads requests until the stream ends, then waits for every
   * worker.
   * @return false when reading stopped on a broken stream or a malformed
   * frame.
   */
  bool run();

  /** @brief Answers one request.  Runs on a worker thread. */
  void dispatch(const json& request);

  /** @brief Builds the reply to a ping. */
  json handlePing(const json& request);

  /**
   * @brief Runs the editor round trip and sends either every response chunk
   * or one error.  The temporary document is removed only on success.
   */
  void handleCompose(const Compose& request);

  /** @brief Waits for every worker started so far. */
  void joinWorkers();

  /** @brief Workers started and not yet joined. */
  size_t workerCount();

 protected:
  /**
   * @brief Renders, edits and re-parses the document at `path`.
   * @throws ComposeError for every failure reported to the client.
   */
  vector<Compose> editDocument(Compose request, const string& path);

  /**
   * @brief Joins the workers that have finished, then starts one for
   * `request`.
   */
  void startWorker(const json& request);

  /** @brief Worker thread body: dispatches, then marks itself finished. */
  void runWorker(const json& request);

  /** @brief Writes a message; write failures are only logged. */
  void send(const json& message);

  shared_ptr<MessageTransport> transport;
  shared_ptr<EditorLauncher> launcher;
  string hostVersion;
  size_t maxBodyLength;

  /** @brief Guards `workerThreads` and `finishedWorkers`. */
  mutex workerMutex;
  vector<shared_ptr<thread>> workerThreads;
  set<thread::id> finishedWorkers;
};
}  // namespace eb

#endif  // __EB_BRIDGE_HOST__
