#include "EditorLauncher.hpp"
#include "TestHeaders.hpp"

using namespace eb;

TEST_CASE("EditorLauncher runs a command through the shell",
          "[EditorLauncher]") {
  EditorLauncher launcher;
  EditorResult result = launcher.runEditor("sh", "exit 0");
  REQUIRE(result.succeeded());
  REQUIRE(result.errorOutput.empty());
}

TEST_CASE("EditorLauncher captures stderr and the exit status",
          "[EditorLauncher]") {
  EditorLauncher launcher;
  EditorResult result =
      launcher.runEditor("sh", "echo 'nvim: not found' >&2; exit 3");
  REQUIRE_FALSE(result.succeeded());
  REQUIRE(result.exitStatus == 3);
  REQUIRE(result.errorOutput == "nvim: not found\n");
}

TEST_CASE("EditorLauncher detaches the editor from the message stream",
          "[EditorLauncher]") {
  EditorLauncher launcher;
  // stdin reads as empty and stdout output goes nowhere
  EditorResult result = launcher.runEditor(
      "sh", "echo garbage; test -z \"$(cat)\" || exit 5");
  REQUIRE(result.succeeded());
  REQUIRE(result.errorOutput.empty());
}

TEST_CASE("EditorLauncher edits a file in place", "[EditorLauncher]") {
  string path = GetTempDirectory() + "eb_launcher_test.txt";
  {
    ofstream out(path);
    out << "before";
  }
  EditorLauncher launcher;
  EditorResult result =
      launcher.runEditor("sh", "printf after > \"" + path + "\"");
  REQUIRE(result.succeeded());
  ifstream in(path);
  string contents((istreambuf_iterator<char>(in)),
                  istreambuf_iterator<char>());
  REQUIRE(contents == "after");
  fs::remove(path);
}

TEST_CASE("EditorLauncher reports a shell that cannot start",
          "[EditorLauncher]") {
  EditorLauncher launcher;
  REQUIRE_THROWS_WITH(
      launcher.runEditor("/nonexistent/eb-shell", "true"),
      ContainsSubstring("Cannot start /nonexistent/eb-shell"));
}

TEST_CASE("EditorLauncher reports a killed editor", "[EditorLauncher]") {
  EditorLauncher launcher;
  EditorResult result = launcher.runEditor("sh", "kill -9 $$");
  REQUIRE(result.exitStatus == -1);
  REQUIRE_THAT(result.errorOutput, ContainsSubstring("signal 9"));
}

TEST_CASE("EditorLauncher is not held up by editors of other tabs",
          "[EditorLauncher]") {
  EditorLauncher launcher;
  atomic<bool> done(false);
  vector<shared_ptr<thread>> slowTabs;
  for (int a = 0; a < 8; a++) {
    slowTabs.push_back(shared_ptr<thread>(new thread([&launcher, &done]() {
      while (!done) {
        launcher.runEditor("sh", "sleep 2");
      }
    })));
  }

  // A quick editor must finish long before a slow sibling would
  auto worst = std::chrono::steady_clock::duration::zero();
  for (int a = 0; a < 40; a++) {
    auto start = std::chrono::steady_clock::now();
    EditorResult result = launcher.runEditor("sh", "true");
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(result.succeeded());
    worst = max(worst, elapsed);
  }
  done = true;
  for (auto& it : slowTabs) {
    it->join();
  }
  REQUIRE(worst < std::chrono::milliseconds(1500));
}
