#pragma once
#include <stdexcept>
#include <string>

namespace stellabund {

/* Base class of every error raised by the abundance library.            */
class AbundanceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// no input data, or an empty value
class MissingAbundances : public AbundanceError {
public:
    using AbundanceError::AbundanceError;
};

// input system / reference element is not among the tracked elements
class InvalidReference : public AbundanceError {
public:
    using AbundanceError::AbundanceError;
};

// solar composition name is not registered
class UnknownReference : public AbundanceError {
public:
    using AbundanceError::AbundanceError;
};

// solar composition has no entry for a tracked element
class MissingSolarValue : public AbundanceError {
public:
    using AbundanceError::AbundanceError;
};

// neither logeps nor [X/H] is available
class InconsistentState : public AbundanceError {
public:
    using AbundanceError::AbundanceError;
};

// not an element symbol
class UnknownElement : public AbundanceError {
public:
    using AbundanceError::AbundanceError;
};

} // namespace stellabund
