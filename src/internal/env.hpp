#ifndef MCPMGR_INTERNAL_ENV_HPP
#define MCPMGR_INTERNAL_ENV_HPP

#include <optional>

namespace mcpmgr
{
namespace internal
{

// Positive integer from the environment; nullopt when unset or invalid
std::optional<long long> env_positive_int(const char* name);

} // namespace internal
} // namespace mcpmgr

#endif // MCPMGR_INTERNAL_ENV_HPP
