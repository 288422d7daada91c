#pragma once

#include "../../simulation/sequence.hpp"

namespace mailbox::command {

/**
 * @brief Rebuilds the world with the gesture's initial pile and starts its
 * sequence
 */
struct SelectGesture {
    Gesture gesture = Gesture::Flatten;
};

/**
 * @brief Rebuilds the current pile and drops any running sequence
 */
struct ResetWorld {};

struct TogglePause {};

struct ToggleLoop {};

struct Quit {};

} // namespace mailbox::command
