/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "Profiler.hpp"

#include "Logger.hpp"

namespace vqlatent {

PerformanceProfiler& PerformanceProfiler::getInstance() {
	static PerformanceProfiler instance;
	return instance;
}

void PerformanceProfiler::startTimer(const std::string& name) {
	const auto now = std::chrono::high_resolution_clock::now();
	std::lock_guard<std::mutex> lock(mutex_);
	startTimes_[name] = now;
}

void PerformanceProfiler::endTimer(const std::string& name) {
	const auto endTime = std::chrono::high_resolution_clock::now();
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = startTimes_.find(name);
	if (it != startTimes_.end()) {
		auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - it->second).count();
		totalTimes_[name] += duration;
		callCounts_[name]++;
		startTimes_.erase(it);
	}
}

long long PerformanceProfiler::totalMicros(const std::string& name) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = totalTimes_.find(name);
	return it == totalTimes_.end() ? 0 : it->second;
}

int PerformanceProfiler::callCount(const std::string& name) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = callCounts_.find(name);
	return it == callCounts_.end() ? 0 : it->second;
}

void PerformanceProfiler::logReport() const {
	std::lock_guard<std::mutex> lock(mutex_);
	logger::info("=== Performance Report ===");
	for (const auto& [name, totalTime] : totalTimes_) {
		const auto count = callCounts_.at(name);
		const auto avgTime = totalTime / count;
		logger::info("{}: {} calls, {} us total, {} us average", name, count, totalTime, avgTime);
	}
}

void PerformanceProfiler::reset() {
	std::lock_guard<std::mutex> lock(mutex_);
	startTimes_.clear();
	totalTimes_.clear();
	callCounts_.clear();
}

}  // namespace vqlatent
