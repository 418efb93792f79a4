#include "statistics.hpp"

#include <functional>
#include <numeric>

namespace facegate::vision::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double variance(const std::vector<double>& v) {
	if (v.size() < 2) {
		return 0.0;
	}

	const double m          = mean(v);
	const double sumSquares = std::transform_reduce(v.begin(), v.end(), 0.0, std::plus<>{}, [m](double x) { return (x - m) * (x - m); });
	return sumSquares / static_cast<double>(v.size());
}

} // namespace facegate::vision::core
