#include "stellabund/AbundanceStore.hpp"
#include "stellabund/Errors.hpp"
#include "stellabund/PeriodicTable.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace stellabund {

namespace {

const std::string kLogEps = "logeps";
const std::string kH      = "h";

ReferenceSystem input_system_for(const std::string&    tag,
                                 const AbundanceTable& raw)
{
    const std::string msg = "'" + tag + "' was given as the reference but is "
                            "not in the provided abundances.";
    std::optional<ReferenceSystem> sys;
    try {
        sys = ReferenceSystem::parse(tag);
    } catch (const UnknownElement&) {
        throw InvalidReference(msg);
    }
    if (sys->is_relative() && !raw.contains(sys->element()))
        throw InvalidReference(msg);
    return *sys;
}

} // unnamed namespace

/* =================================================================== */
AbundanceStore::AbundanceStore(const AbundanceTable&                abundances,
                               const std::string&                   input_system,
                               const std::optional<SolarReference>& solar_reference)
{
    if (abundances.empty())
        throw MissingAbundances("No abundances given; expected {element: value(s)}.");

    /* ---------- common number of stars ---------------------------- */
    for (const auto& [el, v] : abundances) {
        if (v.size() == 0)
            throw MissingAbundances("Abundance of '" + el + "' is empty.");
        if (v.size() == 1) continue;
        if (nstars_ != 1 && nstars_ != v.size())
            throw std::invalid_argument("Abundance of '" + el + "' has " +
                                        std::to_string(v.size()) + " values, expected " +
                                        std::to_string(nstars_) + ".");
        nstars_ = v.size();
    }

    AbundanceTable raw;
    raw.reserve(abundances.size());
    for (const auto& [el, v] : abundances) {
        std::string sym = canonical_symbol(el);
        if (raw.contains(sym))
            throw std::invalid_argument("Element '" + sym + "' given twice.");
        raw.emplace(sym, v.size() == 1 ? Vector(Vector::Constant(nstars_, v[0])) : Vector(v));
        elements_.push_back(std::move(sym));
    }

    /* ---------- store raw values, derive [X/H] -------------------- */
    const ReferenceSystem input = input_system_for(input_system, raw);
    if (input.is_relative()) {
        AbundanceTable h = h_from_relative(raw, input.element());
        raw.erase(input.element());            // the anchor lives in [X/H] only
        systems_[input.tag()] = std::move(raw);
        systems_[kH]          = std::move(h);
        materialized_.insert(input.tag());
        materialized_.insert(kH);
    } else {
        systems_[input.tag()] = std::move(raw);
        materialized_.insert(input.tag());
    }

    if (solar_reference) set_solar_reference(*solar_reference);

    // [X/Fe] by default; skipped while only logeps is known
    const ReferenceSystem fe = ReferenceSystem::relative_to("Fe");
    if (tracks("Fe") && !is_materialized(fe) && is_materialized(ReferenceSystem::h()))
        materialize(fe);
}

/* ------------------------------------------------------------------ *
 *                     solar reference                                *
 * ------------------------------------------------------------------ */
void AbundanceStore::set_solar_reference(const SolarReference& reference)
{
    if (const auto* name = std::get_if<std::string>(&reference)) {
        SolarCompositionPtr comp = solar_abundances(*name);
        apply_solar(*comp);
    } else {
        apply_solar(std::get<SolarComposition>(reference));
    }
}

void AbundanceStore::check_solar_coverage(const SolarComposition& solar) const
{
    for (const auto& el : elements_)
        if (!solar.values.contains(el))
            throw MissingSolarValue("Solar reference '" + solar.name +
                                    "' has no value for " + el + ".");
}

void AbundanceStore::apply_solar(const SolarComposition& solar)
{
    check_solar_coverage(solar);

    if (materialized_.contains(kLogEps)) {
        systems_[kH] = h_from_logeps(solar);
        materialized_.insert(kH);

        /* everything else hangs off [X/H]: rebuild it all */
        for (const auto& tag : materialized_) {
            if (tag == kLogEps || tag == kH) continue;
            systems_[tag] = relative_from_h(ReferenceSystem::parse(tag).element());
        }
        const ReferenceSystem fe = ReferenceSystem::relative_to("Fe");
        if (tracks("Fe") && !is_materialized(fe)) materialize(fe);
    }
    else if (materialized_.contains(kH)) {
        systems_[kLogEps] = logeps_from_h(solar);
        materialized_.insert(kLogEps);
    }
    else {
        throw InconsistentState("Neither log eps nor [X/H] abundances are available; "
                                "cannot apply solar reference '" + solar.name + "'.");
    }

    solar_name_ = solar.name;
    solar_      = solar;
}

/* ------------------------------------------------------------------ *
 *                     relative systems                               *
 * ------------------------------------------------------------------ */
bool AbundanceStore::materialize(const ReferenceSystem& system)
{
    if (!system.is_relative()) {
        if (is_materialized(system)) return true;
        std::cerr << "[AbundanceStore] Warning: " << system.label()
                  << " abundances not calculated. Please set a solar reference first.\n";
        return false;
    }

    if (!tracks(system.element()))
        throw InvalidReference("Cannot compute " + system.label() + ": " +
                               system.element() + " is not among the tracked elements.");

    if (!materialized_.contains(kH)) {
        std::cerr << "[AbundanceStore] Warning: " << system.label()
                  << " abundances not calculated. Please set a solar reference first.\n";
        return false;
    }

    systems_[system.tag()] = relative_from_h(system.element());
    materialized_.insert(system.tag());
    return true;
}

/* ------------------------------------------------------------------ *
 *                     export / queries                               *
 * ------------------------------------------------------------------ */
std::optional<AbundanceTable>
AbundanceStore::export_system(const ReferenceSystem& system) const
{
    if (!is_materialized(system)) {
        std::cerr << "[AbundanceStore] Warning: " << system.label()
                  << " has not been calculated for these abundances; set a solar"
                     " reference or materialize this system first.\n";
        return std::nullopt;
    }

    const AbundanceTable& tab = systems_.at(system.tag());
    AbundanceTable out;
    out.reserve(elements_.size());
    for (const auto& el : elements_) {
        if (system.is_relative() && el == system.element())
            out.emplace(el, systems_.at(kH).at(el));     // anchor keeps [E/H]
        else
            out.emplace(el, tab.at(el));
    }
    return out;
}

std::optional<Vector> AbundanceStore::value(const std::string&     element,
                                            const ReferenceSystem& system) const
{
    if (!tracks(element) || !is_materialized(system)) return std::nullopt;

    const std::string sym = canonical_symbol(element);
    if (system.is_relative() && sym == system.element())
        return systems_.at(kH).at(sym);
    return systems_.at(system.tag()).at(sym);
}

bool AbundanceStore::is_materialized(const ReferenceSystem& system) const
{
    return materialized_.contains(system.tag());
}

std::vector<std::string> AbundanceStore::materialized_systems() const
{
    std::vector<std::string> tags(materialized_.begin(), materialized_.end());
    std::sort(tags.begin(), tags.end());
    return tags;
}

bool AbundanceStore::tracks(const std::string& element) const
{
    if (!is_element(element)) return false;
    const std::string sym = canonical_symbol(element);
    return std::find(elements_.begin(), elements_.end(), sym) != elements_.end();
}

/* ------------------------------------------------------------------ *
 *                     conversions                                    *
 * ------------------------------------------------------------------ */
AbundanceTable AbundanceStore::relative_from_h(const std::string& anchor) const
{
    const AbundanceTable& h   = systems_.at(kH);
    const Vector&         ref = h.at(anchor);

    AbundanceTable out;
    out.reserve(elements_.size());
    for (const auto& el : elements_)
        if (el != anchor) out.emplace(el, h.at(el) - ref);
    return out;
}

AbundanceTable AbundanceStore::h_from_relative(const AbundanceTable& raw,
                                               const std::string&    anchor) const
{
    const Vector& ref = raw.at(anchor);

    AbundanceTable out;
    out.reserve(elements_.size());
    for (const auto& el : elements_)
        out.emplace(el, el == anchor ? Vector(ref) : Vector(raw.at(el) + ref));
    return out;
}

AbundanceTable AbundanceStore::h_from_logeps(const SolarComposition& solar) const
{
    const AbundanceTable& lg = systems_.at(kLogEps);

    AbundanceTable out;
    out.reserve(elements_.size());
    for (const auto& el : elements_)
        out.emplace(el, (lg.at(el).array() - solar.values.at(el)).matrix());
    return out;
}

AbundanceTable AbundanceStore::logeps_from_h(const SolarComposition& solar) const
{
    const AbundanceTable& h = systems_.at(kH);

    AbundanceTable out;
    out.reserve(elements_.size());
    for (const auto& el : elements_)
        out.emplace(el, (h.at(el).array() + solar.values.at(el)).matrix());
    return out;
}

} // namespace stellabund
