#pragma once
#include <Eigen/Core>
#include <ankerl/unordered_dense.h>
#include <string>

namespace stellabund {
	using Real   = double;
	using Vector = Eigen::VectorXd;

	// element -> value (one entry per star), iterates in insertion order
	using AbundanceTable = ankerl::unordered_dense::map<std::string, Vector>;
	// element -> scalar log eps
	using SolarTable     = ankerl::unordered_dense::map<std::string, Real>;

	inline Vector scalar(Real v) { return Vector::Constant(1, v); }
} // namespace stellabund
