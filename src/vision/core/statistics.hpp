#pragma once

#include <cstddef>
#include <vector>

namespace facegate::vision::core {

double mean(const std::vector<double>& v);
double variance(const std::vector<double>& v); //!< Population variance. 0 for fewer than 2 values.

//! count / total, 0 for an empty population.
inline double ratio(std::size_t count, std::size_t total) {
	return total == 0u ? 0.0 : static_cast<double>(count) / static_cast<double>(total);
}

} // namespace facegate::vision::core
