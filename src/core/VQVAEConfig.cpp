/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "VQVAEConfig.hpp"

#include <sstream>
#include <stdexcept>

namespace vqlatent {

namespace {

void requirePositive(const int64_t value, const char* name) {
	if (value <= 0) {
		throw std::invalid_argument(std::string("VQVAEConfig: ") + name + " must be > 0, got " + std::to_string(value));
	}
}

}  // namespace


void VQVAEConfig::validate() const {
	requirePositive(num_embeddings, "num_embeddings");
	requirePositive(embedding_dim, "embedding_dim");
	requirePositive(representation_dim, "representation_dim");
	requirePositive(num_channels, "num_channels");
	requirePositive(image_size, "image_size");
	requirePositive(num_hiddens, "num_hiddens");
	requirePositive(num_residual_hiddens, "num_residual_hiddens");
	requirePositive(prior_hiddens, "prior_hiddens");
	requirePositive(batch_size, "batch_size");
	requirePositive(log_interval, "log_interval");

	if (num_residual_layers < 0) throw std::invalid_argument("VQVAEConfig: num_residual_layers must be >= 0");
	if (prior_layers < 0) throw std::invalid_argument("VQVAEConfig: prior_layers must be >= 0");
	if (epochs < 0) throw std::invalid_argument("VQVAEConfig: epochs must be >= 0");
	if (prior_start < 0) throw std::invalid_argument("VQVAEConfig: prior_start must be >= 0");

	if (num_hiddens < 2) {
		throw std::invalid_argument("VQVAEConfig: num_hiddens must be >= 2 (the decoder halves it)");
	}
	if (commitment_cost < 0.0f) {
		throw std::invalid_argument("VQVAEConfig: commitment_cost must be >= 0");
	}
	if (!(decay > 0.0f && decay < 1.0f)) {
		throw std::invalid_argument("VQVAEConfig: decay must lie in (0, 1), got " + std::to_string(decay));
	}
	if (!(epsilon > 0.0f)) {
		throw std::invalid_argument("VQVAEConfig: epsilon must be > 0");
	}
	if (!(learning_rate > 0.0)) {
		throw std::invalid_argument("VQVAEConfig: learning_rate must be > 0");
	}
	if (weight_decay < 0.0) {
		throw std::invalid_argument("VQVAEConfig: weight_decay must be >= 0");
	}
}

std::string VQVAEConfig::describe() const {
	std::ostringstream out;
	out << "K=" << num_embeddings << " D=" << embedding_dim << " grid=" << representation_dim << "x" << representation_dim
	    << " commitment=" << commitment_cost << " decay=" << decay << " image=" << num_channels << "x" << image_size << "x" << image_size
	    << " hiddens=" << num_hiddens;
	return out.str();
}

}  // namespace vqlatent
