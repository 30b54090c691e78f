#pragma once

#include "TerminalInput.hpp"
#include <deque>

// Replays a script of inputs. Every timeout step makes one wait_for_key()
// report that nothing arrived. Once the script runs dry it sends Ctrl-D.
class FakeTerminalInput : public TerminalInput {
public:
  enum class e_step { key, timeout, nothing, error };

  struct Step {
    e_step kind = e_step::key;
    KeyCode code;
    KeyholdError error;
  };

  FakeTerminalInput &key(const KeyCode &code) {
    script.push_back(Step{.kind = e_step::key, .code = code});
    return *this;
  }

  FakeTerminalInput &timeouts(int count) {
    for (int i = 0; i < count; i++) {
      script.push_back(Step{.kind = e_step::timeout});
    }
    return *this;
  }

  FakeTerminalInput &nothing() {
    script.push_back(Step{.kind = e_step::nothing});
    return *this;
  }

  FakeTerminalInput &error(e_keyhold_error code) {
    script.push_back(Step{.kind = e_step::error,
                          .error = KeyholdError{.code = code,
                                                .message = "injected"}});
    return *this;
  }

  std::expected<bool, KeyholdError>
  wait_for_key(std::chrono::milliseconds timeout) override {
    waits++;
    last_timeout = timeout;

    if (!script.empty() && script.front().kind == e_step::timeout) {
      script.pop_front();
      return false;
    }
    return true;
  }

  std::expected<std::optional<KeyCode>, KeyholdError> read_key() override {
    reads++;

    if (script.empty()) {
      return KeyCode(1, end_of_transmission);
    }

    Step step = script.front();
    script.pop_front();

    switch (step.kind) {
    case e_step::key:
      return step.code;
    case e_step::nothing:
    case e_step::timeout:
      return std::optional<KeyCode>{};
    case e_step::error:
      return std::unexpected(step.error);
    }

    return std::optional<KeyCode>{};
  }

  std::deque<Step> script;
  int waits = 0;
  int reads = 0;
  std::chrono::milliseconds last_timeout{0};
};
