#include "stellabund/SynthesisAbundances.hpp"
#include "stellabund/AbundanceStore.hpp"
#include "stellabund/PeriodicTable.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stellabund {

SynthesisAbundances::SynthesisAbundances(const Options& opts)
: opts_(opts)
{
    build(*solar_abundances(opts_.solar_reference));
}

SynthesisAbundances::SynthesisAbundances(const Options& opts,
                                         const SolarComposition& solar)
: opts_(opts)
{
    opts_.solar_reference = solar.name;
    build(solar);
}

void SynthesisAbundances::build(const SolarComposition& solar)
{
    SolarTable scaled;
    for (const auto& [el, val] : solar.values) {
        if (el == "H" || el == "He") continue;
        scaled[el] = val + opts_.metals;
    }
    for (const auto& el : alpha_elements()) {
        auto it = scaled.find(el);
        if (it != scaled.end()) it->second += opts_.alphas;
    }
    for (const auto& [el, val] : opts_.overrides)
        scaled[canonical_symbol(el)] = val;

    std::vector<std::string> excluded;
    excluded.reserve(opts_.exclude.size());
    for (const auto& el : opts_.exclude) excluded.push_back(canonical_symbol(el));

    abund_.clear();
    for (const auto& [el, val] : scaled)
        if (std::find(excluded.begin(), excluded.end(), el) == excluded.end())
            abund_[atomic_number(el)] = val;
}

std::optional<SynthesisAbundances>
SynthesisAbundances::from_store(const AbundanceStore& store,
                                Options               opts,
                                Eigen::Index          star)
{
    if (star < 0 || star >= store.size())
        throw std::out_of_range("Star index " + std::to_string(star) + " out of range (" +
                                std::to_string(store.size()) + " stars).");

    auto logeps = store.export_system(ReferenceSystem::logeps());
    if (!logeps) return std::nullopt;

    for (const auto& [el, v] : *logeps) opts.overrides[el] = v[star];

    if (const auto& solar = store.solar_reference())
        return SynthesisAbundances(opts, *solar);
    return SynthesisAbundances(opts);
}

void SynthesisAbundances::set(const std::string& element, double logeps)
{
    abund_[atomic_number(element)] = logeps;
}

std::optional<Real> SynthesisAbundances::get(const std::string& element) const
{
    auto it = abund_.find(atomic_number(element));
    if (it == abund_.end()) return std::nullopt;
    return it->second;
}

SolarTable SynthesisAbundances::all() const
{
    SolarTable out;
    out.reserve(abund_.size());
    for (const auto& [z, val] : abund_) out.emplace(symbol_for(z), val);
    return out;
}

std::string SynthesisAbundances::format_block() const
{
    std::ostringstream s;
    s << std::fixed << std::setprecision(3);
    s << "'METALLICITY:'    '" << opts_.metals   << "'\n";
    s << "'ALPHA/Fe   :'    '" << opts_.alphas   << "'\n";
    s << "'HELIUM     :'    '" << opts_.helium   << "'\n";
    s << "'R-PROCESS  :'    '" << opts_.rprocess << "'\n";
    s << "'S-PROCESS  :'    '" << opts_.sprocess << "'\n";
    s << "'INDIVIDUAL ABUNDANCES:'  '" << abund_.size() << "'\n";
    for (const auto& [z, val] : abund_)
        s << z << "  " << val << '\n';
    return s.str();
}

} // namespace stellabund
