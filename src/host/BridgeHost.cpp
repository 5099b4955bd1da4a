#include "BridgeHost.hpp"

namespace eb {
BridgeHost::BridgeHost(shared_ptr<MessageTransport> _transport,
                       shared_ptr<EditorLauncher> _launcher,
                       const string& _hostVersion, size_t _maxBodyLength)
    : transport(_transport),
      launcher(_launcher),
      hostVersion(_hostVersion),
      maxBodyLength(_maxBodyLength) {}

BridgeHost::~BridgeHost() { joinWorkers(); }

bool BridgeHost::run() {
  LOG(INFO) << "EditorBridge " << hostVersion << " waiting for requests";
  bool cleanExit = true;
  while (true) {
    json request;
    try {
      request = transport->readMessage();
    } catch (const StreamClosedException&) {
      LOG(INFO) << "Mail client closed the connection";
      break;
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Cannot read request: " << re.what();
      cleanExit = false;
      break;
    }
    startWorker(request);
  }
  joinWorkers();
  return cleanExit;
}

void BridgeHost::startWorker(const json& request) {
  // The mail client keeps the connection open for its whole session, so
  // finished workers are joined here rather than only at the end
  vector<shared_ptr<thread>> finished;
  lock_guard<std::mutex> guard(workerMutex);
  for (auto it = workerThreads.begin(); it != workerThreads.end();) {
    auto finishedIt = finishedWorkers.find((*it)->get_id());
    if (finishedIt != finishedWorkers.end()) {
      finishedWorkers.erase(finishedIt);
      finished.push_back(*it);
      it = workerThreads.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& it : finished) {
    it->join();
  }
  workerThreads.push_back(shared_ptr<thread>(
      new thread(&BridgeHost::runWorker, this, request)));
}

void BridgeHost::runWorker(const json& request) {
  dispatch(request);
  lock_guard<std::mutex> guard(workerMutex);
  finishedWorkers.insert(std::this_thread::get_id());
}

size_t BridgeHost::workerCount() {
  lock_guard<std::mutex> guard(workerMutex);
  return workerThreads.size();
}

void BridgeHost::joinWorkers() {
  vector<shared_ptr<thread>> threads;
  {
    lock_guard<std::mutex> guard(workerMutex);
    threads.swap(workerThreads);
  }
  for (auto& it : threads) {
    if (it->joinable()) {
      it->join();
    }
  }
  lock_guard<std::mutex> guard(workerMutex);
  finishedWorkers.clear();
}

void BridgeHost::dispatch(const json& request) {
  if (isPing(request)) {
    json reply;
    try {
      reply = handlePing(request);
    } catch (const json::exception& je) {
      LOG(ERROR) << "Ignoring malformed ping: " << je.what();
      return;
    }
    send(reply);
    return;
  }

  Compose compose;
  try {
    compose = Compose::fromJson(request);
  } catch (const std::exception& e) {
    // Without a valid tab there is nobody to report this to
    LOG(ERROR) << "Ignoring malformed request: " << e.what();
    return;
  }
  el::Helpers::setThreadName(string("tab-") + to_string(compose.tabId()));
  handleCompose(compose);
}

json BridgeHost::handlePing(const json& request) {
  Ping ping = Ping::fromJson(request);
  ping.pong = ping.ping;
  ping.hostVersion = hostVersion;
  ping.compatible = isVersionCompatible(hostVersion, ping.version);
  VLOG(1) << "Ping from " << ping.version
          << (ping.compatible ? " (compatible)" : " (incompatible)");
  return ping.toJson();
}

void BridgeHost::handleCompose(const Compose& request) {
  string path = getTemporaryDocumentPath(request);
  vector<Compose> responses;
  try {
    responses = editDocument(request, path);
  } catch (const ComposeError& ce) {
    LOG(ERROR) << ce.title << ": " << ce.message;
    ErrorResponse error;
    error.tab = request.tab;
    error.reset = ce.reset;
    error.title = ce.title;
    error.message = ce.message;
    send(error.toJson());
    return;
  }

  for (const auto& response : responses) {
    send(response.toJson());
  }

  std::error_code ec;
  if (!fs::remove(path, ec) || ec) {
    LOG(ERROR) << "EditorBridge failed to remove temporary file " << path
               << ": " << (ec ? ec.message() : "file is missing");
  }
}

vector<Compose> BridgeHost::editDocument(Compose request,
                                         const string& path) {
  const string& callerVersion = request.configuration.version;
  if (!isVersionCompatible(hostVersion, callerVersion)) {
    if (!request.configuration.bypassVersionCheck) {
      throw ComposeError(false, "EditorBridge version mismatch!",
                         "Mail extension is " + callerVersion +
                             " while native messaging host is " + hostVersion +
                             ". The request has been discarded.");
    }
    LOG(WARNING) << "Bypassing version check: mail extension is "
                 << callerVersion << " while native messaging host is "
                 << hostVersion << ".";
  }

  {
    ofstream out(path, ios::out | ios::binary | ios::trunc);
    if (!out.is_open()) {
      throw ComposeError(true, "EditorBridge failed to create temporary file",
                         path + ": " + strerror(errno));
    }
    DocumentCodec::render(request, out);
    out.close();
    if (out.fail()) {
      throw ComposeError(true, "EditorBridge failed to write to temporary file",
                         path + ": " + strerror(errno));
    }
  }

  string command =
      buildEditorCommand(request.configuration.commandTemplate, path);
  EditorResult result;
  try {
    result = launcher->runEditor(request.configuration.shell, command);
  } catch (const std::runtime_error& re) {
    throw ComposeError(true, "EditorBridge failed to start editor", re.what());
  }
  if (!result.succeeded()) {
    throw ComposeError(false,
                       "EditorBridge encountered error from external editor",
                       withRecoveryHint(trim(result.errorOutput), path));
  }

  ifstream in(path, ios::in | ios::binary);
  if (!in.is_open()) {
    throw ComposeError(false, "EditorBridge failed to read from temporary file",
                       withRecoveryHint(strerror(errno), path));
  }
  try {
    DocumentCodec::parse(request, in);
  } catch (const HeaderParseException& hpe) {
    throw ComposeError(false, "EditorBridge failed to process temporary file",
                       withRecoveryHint(hpe.what(), path));
  }
  if (in.bad()) {
    throw ComposeError(false, "EditorBridge failed to read from temporary file",
                       withRecoveryHint(strerror(errno), path));
  }

  return Chunker::split(request, maxBodyLength);
}

void BridgeHost::send(const json& message) {
  try {
    transport->writeMessage(message);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "EditorBridge failed to send response to the mail client: "
               << re.what();
  }
}
}  // namespace eb
