#include <mcpmgr/version.hpp>
#include <sstream>

namespace mcpmgr
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace mcpmgr
