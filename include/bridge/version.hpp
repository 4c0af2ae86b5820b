#ifndef BRIDGE_VERSION_HPP
#define BRIDGE_VERSION_HPP

#include <string>

namespace bridge
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace bridge

#endif // BRIDGE_VERSION_HPP
