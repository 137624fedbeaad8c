#pragma once
#include "Types.hpp"
#include "SolarAbundances.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stellabund {

class AbundanceStore;

/*
 * Per-element log eps values handed to the synthesis code, keyed by
 * atomic number.  Every solar element is scaled to `metals`, alpha
 * elements get `alphas` on top, explicit overrides win and excluded
 * elements are dropped.  helium / rprocess / sprocess are only written
 * into the parameter block.
 */
class SynthesisAbundances {
public:
    struct Options {
        double                   metals   = 0.0;
        double                   alphas   = 0.0;
        double                   helium   = 0.0;
        double                   rprocess = 0.0;
        double                   sprocess = 0.0;
        SolarTable               overrides;                 // element -> log eps
        std::vector<std::string> exclude  = {"H", "He"};
        std::string              solar_reference = "Asplund2009";
    };

    explicit SynthesisAbundances(const Options& opts);
    SynthesisAbundances(const Options& opts, const SolarComposition& solar);

    // overrides taken from the store's log eps values of one star;
    // empty if log eps is not materialized
    static std::optional<SynthesisAbundances>
    from_store(const AbundanceStore& store, Options opts, Eigen::Index star = 0);

    void                set(const std::string& element, double logeps);
    std::optional<Real> get(const std::string& element) const;
    SolarTable          all() const;                       // symbol -> log eps, by Z

    const std::map<int, Real>& by_atomic_number() const { return abund_; }
    const Options&             options() const { return opts_; }

    // METALLICITY ... INDIVIDUAL ABUNDANCES section of the solver input
    std::string format_block() const;

private:
    void build(const SolarComposition& solar);

    Options             opts_;
    std::map<int, Real> abund_;
};

} // namespace stellabund
