#ifndef MCPMGR_HPP
#define MCPMGR_HPP

// Main header that includes everything

#include <mcpmgr/client.hpp>
#include <mcpmgr/config.hpp>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/events.hpp>
#include <mcpmgr/health_monitor.hpp>
#include <mcpmgr/inspector.hpp>
#include <mcpmgr/pool.hpp>
#include <mcpmgr/transport.hpp>
#include <mcpmgr/types.hpp>
#include <mcpmgr/version.hpp>

#endif // MCPMGR_HPP
