#pragma once

#include <stdexcept>
#include <string>

namespace klatsch::chat {

class ChatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rejected by validation. Never persisted, never broadcast, not worth retrying.
class InvalidMessage : public ChatError {
public:
    using ChatError::ChatError;
};

// The store could not complete an operation. Nothing partial is visible and the
// client may retry with the same message id.
class StorageUnavailable : public ChatError {
public:
    using ChatError::ChatError;
};

}  // namespace klatsch::chat
