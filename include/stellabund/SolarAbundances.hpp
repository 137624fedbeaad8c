/* ===================================================================== *
 *  include/stellabund/SolarAbundances.hpp  ––  named solar compositions
 * ===================================================================== */
#pragma once
#include "Types.hpp"

#include <ankerl/unordered_dense.h>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace stellabund {

struct SolarComposition {
    std::string name;
    SolarTable  values;     // canonical symbol -> log eps
};

using SolarCompositionPtr = std::shared_ptr<const SolarComposition>;

/*
 * Process-wide table of solar compositions, keyed by (case-insensitive)
 * literature name.  Ships "Asplund2009"; further tables come from JSON:
 *
 *     { "name": "MySun", "abundances": { "C": 8.43, "Fe": 7.50 } }
 *
 * or an array of such objects.
 *
 * Lookups hand out shared ownership, so re-registering a name never
 * invalidates a composition somebody still holds.
 */
class SolarTableRegistry
{
public:
    static SolarTableRegistry& instance();

    SolarCompositionPtr try_get(const std::string& name) const;
    SolarCompositionPtr get(const std::string& name) const;   // throws UnknownReference

    void register_table(SolarComposition comp);
    std::size_t load_file(const std::string& path);           // returns #tables added

    std::vector<std::string> available() const;

private:
    SolarTableRegistry();

    using Map = ankerl::unordered_dense::map<std::string, SolarCompositionPtr>;

    mutable std::shared_mutex mtx_;
    Map                       tables_;
};

/* the external lookup: name -> composition, UnknownReference if absent */
SolarCompositionPtr solar_abundances(const std::string& reference_name);

} // namespace stellabund
