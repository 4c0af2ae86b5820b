#ifndef BRIDGE_HPP
#define BRIDGE_HPP

// Main header that includes everything

#include <bridge/client.hpp>
#include <bridge/errors.hpp>
#include <bridge/protocol/messages.hpp>
#include <bridge/transport.hpp>
#include <bridge/types.hpp>
#include <bridge/version.hpp>

#endif // BRIDGE_HPP
