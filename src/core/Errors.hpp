/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vqlatent {

/**
 * @brief Raised when a tensor does not have the layout a component was configured for.
 *
 * Covers a latent channel count that differs from the embedding dimension, an index
 * grid with the wrong spatial size, and interpolation between differently shaped inputs.
 */
class ShapeMismatch : public std::runtime_error {
   public:
	explicit ShapeMismatch(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Raised when an index grid holds a code outside [0, K).
 */
class InvalidIndex : public std::out_of_range {
   public:
	InvalidIndex(int64_t minIndex, int64_t maxIndex, int64_t numEmbeddings)
	    : std::out_of_range(format(minIndex, maxIndex, numEmbeddings)), minIndex_(minIndex), maxIndex_(maxIndex) {}

	int64_t minIndex() const noexcept { return minIndex_; }
	int64_t maxIndex() const noexcept { return maxIndex_; }

   private:
	static std::string format(int64_t minIndex, int64_t maxIndex, int64_t numEmbeddings) {
		std::ostringstream msg;
		msg << "Index grid values span [" << minIndex << ", " << maxIndex << "] but the codebook holds " << numEmbeddings
		    << " entries (valid range [0, " << numEmbeddings << "))";
		return msg.str();
	}

	int64_t minIndex_;
	int64_t maxIndex_;
};

// Formats a shape as "[2, 64, 13, 13]" for error messages.
inline std::string shapeToString(const std::vector<int64_t>& shape) {
	std::ostringstream out;
	out << '[';
	for (size_t i = 0; i < shape.size(); ++i) {
		out << shape[i] << (i + 1 == shape.size() ? "" : ", ");
	}
	out << ']';
	return out.str();
}

}  // namespace vqlatent
