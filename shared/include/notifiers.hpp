#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "collaborators.hpp"

namespace srvkeeper {

class JsonLogger;

// Records every notification in the orchestrator journal under category "Notification".
class JournalNotifier : public Notifier {
  public:
    explicit JournalNotifier(JsonLogger &journal);

    void Send(Audience audience, const std::string &event_key, const std::string &message,
              const std::vector<EventAttribute> &payload) override;

  private:
    JsonLogger &journal_;
};

// Runs `<hook> <audience> <event_key> <message> [key=value...]` for each notification. This is
// the bridge to chat bots and mail relays. The hook runs on the loop thread, so its timeout is
// short and a hung hook is killed.
class HookNotifier : public Notifier {
  public:
    HookNotifier(std::string hook_command, std::chrono::seconds timeout, JsonLogger *journal);

    void Send(Audience audience, const std::string &event_key, const std::string &message,
              const std::vector<EventAttribute> &payload) override;

  private:
    std::string hook_command_;
    std::chrono::seconds timeout_;
    JsonLogger *journal_;
};

// Fan-out. A notifier that throws is logged and skipped; the rest still receive the message.
class NotifierChain : public Notifier {
  public:
    explicit NotifierChain(JsonLogger *journal = nullptr);

    void Add(Notifier &notifier);

    void Send(Audience audience, const std::string &event_key, const std::string &message,
              const std::vector<EventAttribute> &payload) override;

  private:
    std::vector<Notifier *> notifiers_;
    JsonLogger *journal_;
};

}  // namespace srvkeeper
