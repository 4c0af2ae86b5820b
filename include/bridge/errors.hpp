#ifndef BRIDGE_ERRORS_HPP
#define BRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace bridge
{

// Base exception
class BridgeError : public std::runtime_error
{
  public:
    explicit BridgeError(const std::string& message) : std::runtime_error(message) {}
};

// Bridge script or node interpreter not found
class BridgeNotFoundError : public BridgeError
{
  public:
    explicit BridgeNotFoundError(const std::string& message) : BridgeError(message) {}
};

// Child process could not be started or its streams could not be obtained
class BridgeSpawnError : public BridgeError
{
  public:
    explicit BridgeSpawnError(const std::string& message) : BridgeError(message) {}
};

// Liveness check failed: no process handle, input stream cleared, or not ready yet
class ProcessNotRunningError : public BridgeError
{
  public:
    explicit ProcessNotRunningError(const std::string& message) : BridgeError(message) {}
};

// Input stream failed mid-request, or the transport went away with the call in flight
class ProcessClosedError : public BridgeError
{
  public:
    explicit ProcessClosedError(const std::string& message) : BridgeError(message) {}
};

// A line from the bridge outgrew BridgeOptions::max_buffer_size
class MessageFramingError : public BridgeError
{
  public:
    explicit MessageFramingError(const std::string& message) : BridgeError(message) {}
};

// The bridge answered with an `error` field; what() is that string verbatim
class RemoteError : public BridgeError
{
  public:
    explicit RemoteError(const std::string& message) : BridgeError(message) {}
};

} // namespace bridge

#endif // BRIDGE_ERRORS_HPP
