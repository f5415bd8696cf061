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

namespace vqlatent {

enum class MaskType {
	A,  // excludes the centre pixel, first layer only
	B,  // includes the centre pixel
};

/**
 * @brief 2-D convolution whose kernel only sees pixels above and to the left of the centre.
 */
struct MaskedConv2dImpl final : torch::nn::Module {
	torch::nn::Conv2d conv = nullptr;
	torch::Tensor mask;
	int64_t padding;

	MaskedConv2dImpl(int64_t in_channels, int64_t out_channels, int64_t kernel_size, MaskType type);

	torch::Tensor forward(const torch::Tensor& x);
};
TORCH_MODULE(MaskedConv2d);


struct GatedResidualLayerImpl final : torch::nn::Module {
	MaskedConv2d conv = nullptr;
	torch::nn::Conv2d proj = nullptr;

	explicit GatedResidualLayerImpl(int64_t channels);

	torch::Tensor forward(const torch::Tensor& x);
};
TORCH_MODULE(GatedResidualLayer);


/**
 * @brief Gated PixelCNN over the index grid, the concrete prior of the pipeline.
 *
 * Locations are ordered in raster order (row-major). The prediction at (i, j) depends only
 * on locations strictly before it, so `sample` and `reconstruct` can revise one location
 * at a time with a full forward pass per step.
 */
struct PixelCNNImpl final : IPrior {
	int64_t num_categories;
	int64_t grid_size;

	torch::nn::Embedding embed = nullptr;
	MaskedConv2d input_conv = nullptr;
	torch::nn::ModuleList gated_layers = nullptr;
	torch::nn::Sequential head = nullptr;

	PixelCNNImpl(int64_t num_categories, int64_t grid_size, int64_t hiddens, int64_t num_layers);

	/** Logits [B, K, H, W] for an index grid [B, H, W]. */
	torch::Tensor forward(const torch::Tensor& indices);

	torch::Tensor sample(int64_t n) override;
	torch::Tensor reconstruct(const torch::Tensor& indices) override;
	torch::Tensor predict(const torch::Tensor& indices) override { return forward(indices); }

   private:
	void checkIndices(const torch::Tensor& indices) const;
};
TORCH_MODULE(PixelCNN);

}  // namespace vqlatent
