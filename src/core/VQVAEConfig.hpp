/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <cstdint>
#include <string>

namespace vqlatent {

/**
 * @brief Immutable configuration of a VQ-VAE and its training run.
 *
 * Defaults reproduce the FFHQ 64x64 setup. The quantizer section (K, D, representation
 * size, commitment cost, decay, epsilon) is fixed once a model is constructed from it.
 */
struct VQVAEConfig {
	// --- Quantizer ---
	int64_t num_embeddings = 512;
	int64_t embedding_dim = 64;
	int64_t representation_dim = 13;  // H = W of the index grid
	float commitment_cost = 0.25f;
	float decay = 0.99f;
	float epsilon = 1e-5f;

	// --- Encoder / Decoder ---
	int64_t num_channels = 3;
	int64_t image_size = 64;
	int64_t num_hiddens = 128;
	int64_t num_residual_layers = 2;
	int64_t num_residual_hiddens = 32;

	// --- Prior ---
	int64_t prior_hiddens = 64;
	int64_t prior_layers = 5;

	// --- Training ---
	int64_t batch_size = 64;
	int64_t epochs = 100;
	int64_t prior_start = 50;
	int64_t log_interval = 1;
	double learning_rate = 1e-3;
	double weight_decay = 0.0;
	uint64_t seed = 1265;
	bool use_cuda = true;

	/**
	 * @brief Spatial size the convolutional encoder produces for `image_size` inputs.
	 *
	 * Two stride-2 convolutions followed by an unpadded 4x4 convolution.
	 */
	static int64_t latentSizeFor(int64_t imageSize) { return imageSize / 4 - 3; }

	/**
	 * @brief Field-level checks only. Whether `representation_dim` matches the encoder is
	 *        up to whoever builds the encoder.
	 * @throws std::invalid_argument naming the first offending field.
	 */
	void validate() const;

	std::string describe() const;
};

}  // namespace vqlatent
