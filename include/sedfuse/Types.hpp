#pragma once
#include <Eigen/Dense>
#include <limits>

namespace sedfuse {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	inline constexpr Real kNaN = std::numeric_limits<Real>::quiet_NaN();
} // namespace sedfuse
