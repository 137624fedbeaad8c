#pragma once
#include <string>
#include <utility>

namespace stellabund {

/*
 * Unit system an abundance value is expressed in:
 *
 *   LogEps   log10(N_X/N_H) + 12
 *   H        [X/H] = logeps(X) - logeps_sun(X)
 *   Element  [X/E] = [X/H] - [E/H]
 *
 * tag() gives the lower-case key used throughout ("logeps", "h", "fe").
 */
class ReferenceSystem {
public:
    enum class Kind { LogEps, H, Element };

    static ReferenceSystem logeps();
    static ReferenceSystem h();
    static ReferenceSystem relative_to(const std::string& element);

    // "logeps" / "h" (any case), otherwise an element symbol
    static ReferenceSystem parse(const std::string& tag);

    Kind               kind()    const { return kind_; }
    const std::string& element() const { return element_; }
    bool               is_relative() const { return kind_ == Kind::Element; }

    std::string tag()   const;
    std::string label() const;   // "log eps", "[X/H]", "[X/Fe]"

    bool operator==(const ReferenceSystem&) const = default;

private:
    ReferenceSystem(Kind k, std::string el) : kind_(k), element_(std::move(el)) {}

    Kind        kind_;
    std::string element_;
};

} // namespace stellabund
