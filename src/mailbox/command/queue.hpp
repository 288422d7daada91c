#pragma once

#include <mutex>
#include <variant>
#include <vector>

#include "cmds.hpp"

namespace mailbox::command {
using Command =
    std::variant<SelectGesture, ResetWorld, TogglePause, ToggleLoop, Quit>;

class Queue {
  public:
    void push(const Command &cmd) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(cmd);
    }

    std::vector<Command> drain() {
        std::vector<Command> out;
        std::lock_guard<std::mutex> lock(m_mutex);

        out.swap(m_queue);

        return out;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

  private:
    mutable std::mutex m_mutex;
    std::vector<Command> m_queue;
};
} // namespace mailbox::command
