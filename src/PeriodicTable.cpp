#include "stellabund/PeriodicTable.hpp"
#include "stellabund/Errors.hpp"

#include <ankerl/unordered_dense.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace stellabund {
namespace {

constexpr std::array<std::string_view, 92> kSymbols = {
    "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne",   //  1-10
    "Na", "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar", "K",  "Ca",   // 11-20
    "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn",   // 21-30
    "Ga", "Ge", "As", "Se", "Br", "Kr", "Rb", "Sr", "Y",  "Zr",   // 31-40
    "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd", "In", "Sn",   // 41-50
    "Sb", "Te", "I",  "Xe", "Cs", "Ba", "La", "Ce", "Pr", "Nd",   // 51-60
    "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb",   // 61-70
    "Lu", "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg",   // 71-80
    "Tl", "Pb", "Bi", "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th",   // 81-90
    "Pa", "U"                                                     // 91-92
};

const ankerl::unordered_dense::map<std::string, int>& number_lut()
{
    static const auto lut = [] {
        ankerl::unordered_dense::map<std::string, int> m;
        m.reserve(kSymbols.size());
        for (std::size_t i = 0; i < kSymbols.size(); ++i)
            m.emplace(std::string(kSymbols[i]), static_cast<int>(i) + 1);
        return m;
    }();
    return lut;
}

/* "  fE " -> "Fe" (no validation) */
std::string normalise(const std::string& in)
{
    auto first = std::find_if_not(in.begin(), in.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last  = std::find_if_not(in.rbegin(), in.rend(),
                                  [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) return {};

    std::string out(first, last);
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    for (std::size_t i = 1; i < out.size(); ++i)
        out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
    return out;
}

} // unnamed namespace

std::string canonical_symbol(const std::string& symbol)
{
    std::string sym = normalise(symbol);
    if (!number_lut().contains(sym))
        throw UnknownElement("'" + symbol + "' is not an element symbol.");
    return sym;
}

bool is_element(const std::string& symbol)
{
    return number_lut().contains(normalise(symbol));
}

int atomic_number(const std::string& symbol)
{
    return number_lut().at(canonical_symbol(symbol));
}

std::string symbol_for(int z)
{
    if (z < 1 || z > static_cast<int>(kSymbols.size()))
        throw UnknownElement("No element with atomic number " + std::to_string(z) + ".");
    return std::string(kSymbols[z - 1]);
}

const std::vector<std::string>& alpha_elements()
{
    static const std::vector<std::string> alphas = {
        "O", "Ne", "Mg", "Si", "S", "Ar", "Ca", "Ti"
    };
    return alphas;
}

} // namespace stellabund
