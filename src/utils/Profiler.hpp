/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vqlatent {

/**
 * @class PerformanceProfiler
 * @brief Accumulates wall-clock time per named section (training steps, sampling, checkpoint I/O)
 */
class PerformanceProfiler {
   public:
	static PerformanceProfiler& getInstance();

	void startTimer(const std::string& name);
	void endTimer(const std::string& name);

	// Total microseconds recorded for `name`, 0 if never timed
	long long totalMicros(const std::string& name) const;
	int callCount(const std::string& name) const;

	// Emits one info line per section through the logger
	void logReport() const;

	void reset();

   private:
	mutable std::mutex mutex_;
	std::unordered_map<std::string, std::chrono::high_resolution_clock::time_point> startTimes_;
	std::unordered_map<std::string, long long> totalTimes_;
	std::unordered_map<std::string, int> callCounts_;
};

// RAII timer for automatic timing
class ScopedTimer {
   public:
	explicit ScopedTimer(const std::string& name) : name_(name) { PerformanceProfiler::getInstance().startTimer(name_); }

	~ScopedTimer() { PerformanceProfiler::getInstance().endTimer(name_); }

	ScopedTimer(const ScopedTimer&) = delete;
	ScopedTimer& operator=(const ScopedTimer&) = delete;

   private:
	std::string name_;
};

}  // namespace vqlatent

#define VQLATENT_PROFILE_SCOPE(name) ::vqlatent::ScopedTimer _timer(name)
