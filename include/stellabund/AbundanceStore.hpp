#pragma once
#include "Types.hpp"
#include "ReferenceSystem.hpp"
#include "SolarAbundances.hpp"

#include <ankerl/unordered_dense.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stellabund {

// a registered solar composition name, or an explicit composition
using SolarReference = std::variant<std::string, SolarComposition>;

/*
 * Elemental abundances held in one or more unit systems at once.
 *
 * A system is "materialized" once it holds a value for every tracked
 * element.  Conversions only run along
 *
 *     logeps <-> [X/H]      (needs a solar reference)
 *     [X/H]  <-> [X/E]      (needs [X/H])
 *
 * so logeps <-> [X/E] always goes through [X/H].  Changing the solar
 * reference re-derives every materialized relative system; a table
 * exported before the change is stale afterwards.
 *
 * The anchor E of an [X/E] system is exported with its [E/H] value, not 0.
 *
 * Values are vectors with one entry per star; all elements share the
 * same length and length-1 inputs are broadcast at construction.
 */
class AbundanceStore {
public:
    // input_system: "logeps", "h" or a symbol present in `abundances`
    AbundanceStore(const AbundanceTable&                abundances,
                   const std::string&                   input_system,
                   const std::optional<SolarReference>& solar_reference = std::nullopt);

    void set_solar_reference(const SolarReference& reference);

    // false (with a warning on the log) if [X/H] is not available yet
    bool materialize(const ReferenceSystem& system);
    bool materialize(const std::string& tag) { return materialize(ReferenceSystem::parse(tag)); }

    // empty (with a warning on the log) if `system` is not materialized
    std::optional<AbundanceTable> export_system(const ReferenceSystem& system) const;
    std::optional<AbundanceTable> export_system(const std::string& tag) const
    { return export_system(ReferenceSystem::parse(tag)); }

    // single-element lookup, silent counterpart of export_system()
    std::optional<Vector> value(const std::string& element,
                                const ReferenceSystem& system) const;

    bool is_materialized(const ReferenceSystem& system) const;
    bool is_materialized(const std::string& tag) const
    { return is_materialized(ReferenceSystem::parse(tag)); }

    std::vector<std::string> materialized_systems() const;

    const std::vector<std::string>& elements() const { return elements_; }
    bool          tracks(const std::string& element) const;
    Eigen::Index  size() const { return nstars_; }

    const std::string&                     solar_reference_name() const { return solar_name_; }
    const std::optional<SolarComposition>& solar_reference() const { return solar_; }

private:
    using Systems = ankerl::unordered_dense::map<std::string, AbundanceTable>;

    /* --- conversions (all O(#elements)) ---------------------------- */
    AbundanceTable relative_from_h(const std::string& anchor) const;
    AbundanceTable h_from_relative(const AbundanceTable& raw,
                                   const std::string&    anchor) const;
    AbundanceTable h_from_logeps(const SolarComposition& solar) const;
    AbundanceTable logeps_from_h(const SolarComposition& solar) const;

    void apply_solar(const SolarComposition& solar);
    void check_solar_coverage(const SolarComposition& solar) const;

    std::vector<std::string>                elements_;
    Eigen::Index                            nstars_ = 1;
    Systems                                 systems_;       // tag -> element -> value
    ankerl::unordered_dense::set<std::string> materialized_;
    std::string                             solar_name_ = "None";
    std::optional<SolarComposition>         solar_;
};

} // namespace stellabund
