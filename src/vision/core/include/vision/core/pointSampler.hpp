#pragma once

#include <cstdint>
#include <random>

namespace facegate::vision::core {

//! Seedable source of random sample positions shared by the sampling heuristics.
//! Same seed -> same sequence of positions -> same verdict for the same image.
class PointSampler {
public:
	explicit PointSampler(std::uint32_t seed = 0u) : m_engine(seed) {
	}

	//! Uniform integer in [0, n). Returns 0 for n <= 1.
	int below(int n) {
		if (n <= 1) {
			return 0;
		}
		std::uniform_int_distribution<int> dist(0, n - 1);
		return dist(m_engine);
	}

	//! Uniform real in [0, 1).
	double unit() {
		std::uniform_real_distribution<double> dist(0.0, 1.0);
		return dist(m_engine);
	}

private:
	std::mt19937 m_engine;
};

} // namespace facegate::vision::core
