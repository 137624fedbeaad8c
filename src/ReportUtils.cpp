#include "stellabund/ReportUtils.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <vector>

namespace stellabund {

static std::string row_label(const ReferenceSystem& sys, const std::string& el)
{
    switch (sys.kind()) {
        case ReferenceSystem::Kind::LogEps: return "log eps(" + el + ")";
        case ReferenceSystem::Kind::H:      return "[" + el + "/H]";
        case ReferenceSystem::Kind::Element: break;
    }
    // the anchor row carries [E/H]
    if (el == sys.element()) return "[" + el + "/H]";
    return "[" + el + "/" + sys.element() + "]";
}

void write_table(std::ostream&          os,
                 const ReferenceSystem& system,
                 const AbundanceTable&  table,
                 int                    precision)
{
    std::size_t width = 8;
    for (const auto& [el, v] : table)
        width = std::max(width, row_label(system, el).size() + 2);

    os << "# " << system.label() << '\n';
    const auto old_flags = os.flags();
    const auto old_prec  = os.precision();
    os << std::fixed << std::setprecision(precision);
    for (const auto& [el, v] : table) {
        os << std::left << std::setw(static_cast<int>(width)) << row_label(system, el)
           << std::right;
        for (Eigen::Index i = 0; i < v.size(); ++i)
            os << std::setw(precision + 6) << v[i];
        os << '\n';
    }
    os.flags(old_flags);
    os.precision(old_prec);
}

nlohmann::json to_json(const AbundanceTable& table)
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [el, v] : table) {
        if (v.size() == 1)
            j[el] = v[0];
        else
            j[el] = std::vector<Real>(v.data(), v.data() + v.size());
    }
    return j;
}

} // namespace stellabund
