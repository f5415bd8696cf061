/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <torch/torch.h>

#include <memory>

#include "core/IVQVAEComponents.hpp"
#include "core/VQVAEConfig.hpp"
#include "model/VectorQuantizerEMA.hpp"

namespace vqlatent {

struct ForwardOutput {
	torch::Tensor reconstruction;
	torch::Tensor quant_loss;
	torch::Tensor prior_loss;  // bits per symbol while fitting the prior, a graph-attached zero otherwise
	torch::Tensor perplexity;
	torch::Tensor indices;
};

/**
 * @brief The VQ-VAE pipeline.
 *
 * Threads data through encoder, 1x1 projection, quantizer and decoder, and builds the
 * generation paths (sample, interpolate) from the prior and the quantizer's gather path.
 * The codebook is only ever read through the quantizer.
 */
struct VQVAEImpl final : torch::nn::Module {
	std::shared_ptr<IEncoder> encoder;
	torch::nn::Conv2d pre_vq_conv = nullptr;
	VectorQuantizerEMA quantizer = nullptr;
	std::shared_ptr<IDecoder> decoder;
	std::shared_ptr<IPrior> prior;

	/**
	 * @brief Builds the convolutional encoder/decoder and the PixelCNN prior from `config`.
	 * @throws std::invalid_argument if `representation_dim` is not what ConvEncoder yields for `image_size`.
	 */
	explicit VQVAEImpl(const VQVAEConfig& config);

	/** Composes externally built components. The encoder must emit `config.num_hiddens` channels. */
	VQVAEImpl(const VQVAEConfig& config, std::shared_ptr<IEncoder> encoder, std::shared_ptr<IDecoder> decoder,
	          std::shared_ptr<IPrior> prior);

	/**
	 * @brief Reconstruction pass.
	 *
	 * The quantizer updates its EMA statistics when the module is in training mode. With
	 * fit_prior enabled, reconstruction and quant_loss come back detached so that a summed
	 * loss only trains the prior.
	 */
	ForwardOutput forward(const torch::Tensor& x);
	ForwardOutput reconstruct(const torch::Tensor& x) { return forward(x); }

	/** Draws `n` index grids from the prior and decodes them. One decoder call, no encoder call. */
	torch::Tensor sample(int64_t n = 1);

	/**
	 * @brief Decodes the prior-denoised code of the averaged latents of x and y.
	 * @throws ShapeMismatch if x and y differ in shape.
	 */
	torch::Tensor interpolate(const torch::Tensor& x, const torch::Tensor& y);

	// project(encode(x)), shape [B, D, H, W]
	torch::Tensor latent(const torch::Tensor& x);

	// Index grid for x, shape [B, H, W]. No codebook update.
	torch::Tensor encode(const torch::Tensor& x);

	// Gathers and decodes an index grid [B, H, W]
	torch::Tensor decode(const torch::Tensor& indices);

	void set_fit_prior(bool enabled) { fit_prior_ = enabled; }
	bool fit_prior() const { return fit_prior_; }

	const VQVAEConfig& config() const { return config_; }

   private:
	void build(std::shared_ptr<IEncoder> encoder_, std::shared_ptr<IDecoder> decoder_, std::shared_ptr<IPrior> prior_);
	void checkIndexGrid(const torch::Tensor& indices, int64_t batch) const;

	const VQVAEConfig config_;
	bool fit_prior_ = false;
};
TORCH_MODULE(VQVAE);

}  // namespace vqlatent
