/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <torch/torch.h>

#include <cstdint>

namespace vqlatent {

/**
 * @brief Continuous feature extractor in front of the quantizer.
 *
 * Implementations are ordinary torch modules so that the pipeline can register
 * them as submodules and checkpoint them together with the codebook.
 */
struct IEncoder : torch::nn::Module {
	~IEncoder() override = default;

	/**
	 * @param x Input batch, shape [B, C, S, S].
	 * @return Feature map, shape [B, num_hiddens, H, W].
	 */
	virtual torch::Tensor forward(const torch::Tensor& x) = 0;
};

/**
 * @brief Maps a quantized grid back to data space.
 */
struct IDecoder : torch::nn::Module {
	~IDecoder() override = default;

	/**
	 * @param quantized Channel-first grid, shape [B, D, H, W], exactly as the quantizer emits it.
	 * @return Reconstruction, shape [B, C, S, S].
	 */
	virtual torch::Tensor forward(const torch::Tensor& quantized) = 0;
};

/**
 * @brief Autoregressive density model over the discrete index grid.
 *
 * The prior never sees continuous latents: every operation consumes and/or produces
 * int64 index grids of shape [B, H, W] with values in [0, K).
 */
struct IPrior : torch::nn::Module {
	~IPrior() override = default;

	/**
	 * @brief Unconditional generation.
	 * @param n Number of grids to draw.
	 * @return Index grid, shape [n, H, W].
	 */
	virtual torch::Tensor sample(int64_t n) = 0;

	/**
	 * @brief Denoises an index grid, e.g. a blended code from interpolation.
	 * @return Revised index grid with the same shape as `indices`.
	 */
	virtual torch::Tensor reconstruct(const torch::Tensor& indices) = 0;

	/**
	 * @brief Predictive distribution at every location.
	 * @return Unnormalised logits, shape [B, K, H, W].
	 */
	virtual torch::Tensor predict(const torch::Tensor& indices) = 0;
};

}  // namespace vqlatent
