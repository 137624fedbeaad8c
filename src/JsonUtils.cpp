#include "stellabund/JsonUtils.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace stellabund {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open '" + path + "'");
    nlohmann::json j;
    f >> j;
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

AbundanceTable abundances_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw std::runtime_error("\"abundances\" must be an object of element: value pairs");

    AbundanceTable out;
    for (const auto& item : j.items()) {
        const std::string& el = item.key();
        const auto&        v  = item.value();
        if (v.is_number()) {
            out.emplace(el, scalar(v.get<Real>()));
        } else if (v.is_array()) {
            auto vals = v.get<std::vector<Real>>();
            out.emplace(el, Eigen::Map<Vector>(vals.data(), vals.size()));
        } else {
            throw std::runtime_error("Abundance of '" + el + "' is neither a number nor an array");
        }
    }
    return out;
}

} // namespace stellabund
