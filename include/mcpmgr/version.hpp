#ifndef MCPMGR_VERSION_HPP
#define MCPMGR_VERSION_HPP

#include <string>

namespace mcpmgr
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace mcpmgr

#endif // MCPMGR_VERSION_HPP
