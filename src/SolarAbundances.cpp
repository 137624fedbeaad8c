/* ===================================================================== *
 *  src/SolarAbundances.cpp
 * ===================================================================== */
#include "stellabund/SolarAbundances.hpp"
#include "stellabund/Errors.hpp"
#include "stellabund/JsonUtils.hpp"
#include "stellabund/PeriodicTable.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace stellabund {
namespace {

std::string key_for(const std::string& name)
{
    std::string k;
    k.reserve(name.size());
    for (unsigned char c : name) k.push_back(static_cast<char>(std::tolower(c)));
    return k;
}

/* Asplund, Grevesse, Sauval & Scott 2009, ARA&A 47, 481, Table 1.
 * Photospheric values; meteoritic where no photospheric one exists.     */
SolarComposition asplund2009()
{
    SolarComposition c;
    c.name = "Asplund2009";
    c.values = {
        {"H", 12.00}, {"He", 10.93}, {"Li", 1.05},  {"Be", 1.38},  {"B", 2.70},
        {"C", 8.43},  {"N", 7.83},   {"O", 8.69},   {"F", 4.56},   {"Ne", 7.93},
        {"Na", 6.24}, {"Mg", 7.60},  {"Al", 6.45},  {"Si", 7.51},  {"P", 5.41},
        {"S", 7.12},  {"Cl", 5.50},  {"Ar", 6.40},  {"K", 5.03},   {"Ca", 6.34},
        {"Sc", 3.15}, {"Ti", 4.95},  {"V", 3.93},   {"Cr", 5.64},  {"Mn", 5.43},
        {"Fe", 7.50}, {"Co", 4.99},  {"Ni", 6.22},  {"Cu", 4.19},  {"Zn", 4.56},
        {"Ga", 3.04}, {"Ge", 3.65},  {"As", 2.30},  {"Se", 3.34},  {"Br", 2.54},
        {"Kr", 3.25}, {"Rb", 2.52},  {"Sr", 2.87},  {"Y", 2.21},   {"Zr", 2.58},
        {"Nb", 1.46}, {"Mo", 1.88},  {"Ru", 1.75},  {"Rh", 0.91},  {"Pd", 1.57},
        {"Ag", 0.94}, {"Cd", 1.71},  {"In", 0.80},  {"Sn", 2.04},  {"Sb", 1.01},
        {"Te", 2.18}, {"I", 1.55},   {"Xe", 2.24},  {"Cs", 1.08},  {"Ba", 2.18},
        {"La", 1.10}, {"Ce", 1.58},  {"Pr", 0.72},  {"Nd", 1.42},  {"Sm", 0.96},
        {"Eu", 0.52}, {"Gd", 1.07},  {"Tb", 0.30},  {"Dy", 1.10},  {"Ho", 0.48},
        {"Er", 0.92}, {"Tm", 0.10},  {"Yb", 0.84},  {"Lu", 0.10},  {"Hf", 0.85},
        {"Ta", -0.12},{"W", 0.85},   {"Re", 0.26},  {"Os", 1.40},  {"Ir", 1.38},
        {"Pt", 1.62}, {"Au", 0.92},  {"Hg", 1.17},  {"Tl", 0.90},  {"Pb", 1.75},
        {"Bi", 0.65}, {"Th", 0.02},  {"U", -0.54}
    };
    return c;
}

SolarComposition composition_from_json(const nlohmann::json& entry,
                                       const std::string&    path)
{
    if (!entry.is_object() || !entry.contains("name") || !entry.contains("abundances"))
        throw std::runtime_error("Solar table in '" + path +
                                 "' needs \"name\" and \"abundances\".");

    SolarComposition comp;
    comp.name = entry["name"].get<std::string>();
    for (const auto& item : entry["abundances"].items())
        comp.values[canonical_symbol(item.key())] = item.value().get<Real>();

    if (comp.values.empty())
        throw std::runtime_error("Solar table '" + comp.name + "' in '" + path +
                                 "' has no abundances.");
    return comp;
}

} // unnamed namespace

/* -------- singleton -------------------------------------------------- */
SolarTableRegistry& SolarTableRegistry::instance()
{
    static SolarTableRegistry inst;
    return inst;
}

SolarTableRegistry::SolarTableRegistry()
{
    register_table(asplund2009());
}

/* -------- lookups ---------------------------------------------------- */
SolarCompositionPtr SolarTableRegistry::try_get(const std::string& name) const
{
    std::shared_lock lk(mtx_);
    auto it = tables_.find(key_for(name));
    if (it == tables_.end()) return nullptr;
    return it->second;
}

SolarCompositionPtr SolarTableRegistry::get(const std::string& name) const
{
    if (auto comp = try_get(name)) return comp;
    throw UnknownReference("Solar reference '" + name + "' is not known.");
}

std::vector<std::string> SolarTableRegistry::available() const
{
    std::shared_lock lk(mtx_);
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [key, comp] : tables_) names.push_back(comp->name);
    std::sort(names.begin(), names.end());
    return names;
}

/* -------- registration ----------------------------------------------- */
void SolarTableRegistry::register_table(SolarComposition comp)
{
    const std::string key = key_for(comp.name);
    auto sp = std::make_shared<const SolarComposition>(std::move(comp));

    std::unique_lock lk(mtx_);
    tables_.insert_or_assign(key, std::move(sp));
}

std::size_t SolarTableRegistry::load_file(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);

    std::vector<SolarComposition> parsed;
    if (j.is_array())
        for (const auto& entry : j) parsed.push_back(composition_from_json(entry, path));
    else
        parsed.push_back(composition_from_json(j, path));

    for (auto& comp : parsed) {
        std::cout << "[SolarAbundances] Registered '" << comp.name << "' ("
                  << comp.values.size() << " elements) from " << path << '\n';
        register_table(std::move(comp));
    }
    return parsed.size();
}

/* -------- free lookup ------------------------------------------------ */
SolarCompositionPtr solar_abundances(const std::string& reference_name)
{
    return SolarTableRegistry::instance().get(reference_name);
}

} // namespace stellabund
