#pragma once
#include <string>
#include <vector>

namespace stellabund {

// "fe", " FE " -> "Fe".  Throws UnknownElement for anything past U (Z = 92).
std::string canonical_symbol(const std::string& symbol);

bool is_element(const std::string& symbol);

int         atomic_number(const std::string& symbol);
std::string symbol_for(int z);

// elements scaled by [alpha/Fe] in the synthesis input
const std::vector<std::string>& alpha_elements();

} // namespace stellabund
