/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <torch/torch.h>

#include "core/IVQVAEComponents.hpp"
#include "core/VQVAEConfig.hpp"

namespace vqlatent::test {

// image 24 -> 3x3 grid, small enough to run the real networks in tests
inline VQVAEConfig smallConfig() {
	VQVAEConfig config;
	config.num_embeddings = 8;
	config.embedding_dim = 4;
	config.image_size = 24;
	config.representation_dim = VQVAEConfig::latentSizeFor(24);
	config.num_channels = 1;
	config.num_hiddens = 8;
	config.num_residual_layers = 1;
	config.num_residual_hiddens = 4;
	config.prior_hiddens = 8;
	config.prior_layers = 2;
	config.batch_size = 2;
	config.epochs = 2;
	config.prior_start = 1;
	return config;
}

// Pools the input down to the grid and broadcasts it over the hidden channels
struct CountingEncoder final : IEncoder {
	int calls = 0;
	int64_t hiddens;
	int64_t grid;

	CountingEncoder(int64_t hiddens, int64_t grid) : hiddens(hiddens), grid(grid) {}

	torch::Tensor forward(const torch::Tensor& x) override {
		++calls;
		auto pooled = torch::adaptive_avg_pool2d(x, {grid, grid}).mean(1, true);
		return pooled.expand({x.size(0), hiddens, grid, grid});
	}
};

// Upsamples the channel mean back to image size and remembers what it was given
struct CountingDecoder final : IDecoder {
	int calls = 0;
	int64_t channels;
	int64_t image_size;
	torch::Tensor last_input;

	CountingDecoder(int64_t channels, int64_t image_size) : channels(channels), image_size(image_size) {}

	torch::Tensor forward(const torch::Tensor& quantized) override {
		++calls;
		last_input = quantized.detach().clone();
		auto up = torch::adaptive_avg_pool2d(quantized.mean(1, true), {image_size, image_size});
		return up.repeat({1, channels, 1, 1});
	}
};

// Returns a preset grid and uniform (trainable) logits
struct ScriptedPrior final : IPrior {
	int64_t num_categories;
	int64_t grid;
	int64_t fill_value = 0;
	int sample_calls = 0;
	int reconstruct_calls = 0;
	torch::Tensor last_reconstruct_input;
	torch::Tensor sample_override;  // returned verbatim by sample() when defined
	torch::Tensor logit_bias;

	ScriptedPrior(int64_t num_categories, int64_t grid) : num_categories(num_categories), grid(grid) {
		logit_bias = register_parameter("logit_bias", torch::zeros({num_categories}));
	}

	torch::Tensor sample(int64_t n) override {
		++sample_calls;
		if (sample_override.defined()) return sample_override;
		return torch::full({n, grid, grid}, fill_value, torch::kLong);
	}

	torch::Tensor reconstruct(const torch::Tensor& indices) override {
		++reconstruct_calls;
		last_reconstruct_input = indices.clone();
		return torch::full_like(indices, fill_value);
	}

	torch::Tensor predict(const torch::Tensor& indices) override {
		return logit_bias.view({1, num_categories, 1, 1}).expand({indices.size(0), num_categories, indices.size(1), indices.size(2)});
	}
};

}  // namespace vqlatent::test
