#ifndef MCPMGR_INSPECTOR_HPP
#define MCPMGR_INSPECTOR_HPP

#include <cstddef>
#include <map>
#include <mcpmgr/config.hpp>
#include <mcpmgr/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpmgr
{

/**
 * Produces and caches one CapabilitySnapshot per server name.
 *
 * By default the cache has no TTL: an entry is replaced only by a forced
 * refresh (or InspectorOptions::cache_ttl expiry) and removed only by
 * clear_cache(). Failed passes are cached as error snapshots so that
 * repeated inspection of a broken server is cheap.
 */
class CapabilityInspector
{
  public:
    explicit CapabilityInspector(InspectorOptions options = InspectorOptions{});
    ~CapabilityInspector();

    // No copy
    CapabilityInspector(const CapabilityInspector&) = delete;
    CapabilityInspector& operator=(const CapabilityInspector&) = delete;

    /// Never throws for server failures; they are reported in the snapshot
    CapabilitySnapshot inspect(const std::string& name, const ServerDescriptor& descriptor,
                               bool force_refresh = false);

    /// Inspects in batches of options.batch_size. One failure never aborts
    /// the batch.
    std::map<std::string, CapabilitySnapshot>
    inspect_many(const std::map<std::string, ServerDescriptor>& servers,
                 bool force_refresh = false);

    std::optional<CapabilitySnapshot> get_cached(const std::string& name) const;

    // Drop one entry, or every entry when name is nullopt
    void clear_cache(const std::optional<std::string>& name = std::nullopt);

    // Tear down every session kept for later inspections
    void disconnect_all();

    /// inspect() reduced to the figures shown in a server list
    ServerMetricsSummary server_metrics(const std::string& name,
                                        const ServerDescriptor& descriptor);

    std::size_t active_client_count() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// ~4 characters per token, rounded up per field
std::size_t estimate_tokens(const std::string& text);

/// Approximate context cost of everything a server advertises.
/// For relative comparison only.
std::size_t estimate_token_usage(const std::vector<ToolInfo>& tools,
                                 const std::vector<ResourceInfo>& resources,
                                 const std::vector<PromptInfo>& prompts);

} // namespace mcpmgr

#endif // MCPMGR_INSPECTOR_HPP
