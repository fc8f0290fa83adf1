#pragma once

#include <string>

namespace download
{

// Modal progress UI shown for the duration of one download.
// isCancelRequested() is polled from the controller's timer thread, so implementations
// must make it safe to call concurrently with reportProgress().
class ProgressSurface
{
public:
    virtual ~ProgressSurface() = default;

    virtual void show(const std::string& text) = 0;
    virtual void reportProgress(int percent, const std::string& description) = 0;
    virtual bool isCancelRequested() const = 0;
    virtual void close() = 0;
};

enum class MessageLevel
{
    Information,
    Warning,
    Error
};

// Which part of a download a message is about
enum class MessageTopic
{
    Session, // Controller state, e.g. a second download while one is running
    Network, // Connect, status, body read
    Storage, // Temp file
    Package  // Downloaded archive
};

// Displays messages to the user (e.g. a message box)
class ErrorSink
{
public:
    virtual ~ErrorSink() = default;

    virtual void show(const std::string& message, MessageLevel level, MessageTopic topic) = 0;
};

// Main application surface, re-activated after the progress UI closes
class MainSurface
{
public:
    virtual ~MainSurface() = default;

    virtual void activate() = 0;
};

} // namespace download
