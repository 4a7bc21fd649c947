#ifndef SPACECHECK_SRC_PROBE_CAPACITY_PROBE_HPP_
#define SPACECHECK_SRC_PROBE_CAPACITY_PROBE_HPP_

#include "probe/capacity_info.hpp"
#include "probe/i_filesystem_stats.hpp"
#include "probe/probe_error.hpp"

#include <filesystem>

namespace SpaceCheck::Probe
{

/**
 * Determines total/free/available capacity for a path by trying an ordered chain
 * of OS query strategies. The first strategy whose result passes its acceptance
 * check wins; later strategies are not consulted.
 *
 * Chain order:
 *   - network mounts: low-level statistics, volume resources, filesystem attributes
 *   - local mounts:   volume resources, filesystem attributes
 *
 * A result with zero total capacity is never accepted. When no strategy is
 * accepted the probe returns an error instead of a zero-valued CapacityInfo.
 * Probe() never throws and performs each query at most once.
 */
class CapacityProbe
{
    public:
    explicit CapacityProbe(const IFilesystemStats& stats) : stats_(stats) {}

    CapacityProbe(const CapacityProbe&)            = delete;
    CapacityProbe& operator=(const CapacityProbe&) = delete;

    [[nodiscard]] ProbeResult<CapacityInfo> Probe(const std::filesystem::path& path) const;

    private:
    const IFilesystemStats& stats_;
};

}  // namespace SpaceCheck::Probe

#endif  // SPACECHECK_SRC_PROBE_CAPACITY_PROBE_HPP_
