#include "stellabund/ReferenceSystem.hpp"
#include "stellabund/PeriodicTable.hpp"

#include <cctype>

namespace stellabund {

static std::string lower_trimmed(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        if (!std::isspace(c)) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

ReferenceSystem ReferenceSystem::logeps() { return {Kind::LogEps, {}}; }
ReferenceSystem ReferenceSystem::h()      { return {Kind::H, {}}; }

// [X/H] relative to hydrogen is just [X/H]
ReferenceSystem ReferenceSystem::relative_to(const std::string& element)
{
    std::string sym = canonical_symbol(element);
    if (sym == "H") return h();
    return {Kind::Element, std::move(sym)};
}

ReferenceSystem ReferenceSystem::parse(const std::string& tag)
{
    const std::string t = lower_trimmed(tag);
    if (t == "logeps") return logeps();
    if (t == "h")      return h();
    return relative_to(t);
}

std::string ReferenceSystem::tag() const
{
    switch (kind_) {
        case Kind::LogEps: return "logeps";
        case Kind::H:      return "h";
        case Kind::Element: break;
    }
    return lower_trimmed(element_);
}

std::string ReferenceSystem::label() const
{
    switch (kind_) {
        case Kind::LogEps: return "log eps";
        case Kind::H:      return "[X/H]";
        case Kind::Element: break;
    }
    return "[X/" + element_ + "]";
}

} // namespace stellabund
