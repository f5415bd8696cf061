/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "PixelCNN.hpp"

#include "core/Errors.hpp"

namespace vqlatent {

MaskedConv2dImpl::MaskedConv2dImpl(const int64_t in_channels, const int64_t out_channels, const int64_t kernel_size, const MaskType type)
    : padding(kernel_size / 2) {
	conv = register_module("conv", torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, out_channels, kernel_size).padding(padding)));

	const int64_t centre = kernel_size / 2;
	const int64_t first_hidden_col = type == MaskType::A ? centre : centre + 1;

	auto m = torch::ones_like(conv->weight);
	m.narrow(2, centre, 1).narrow(3, first_hidden_col, kernel_size - first_hidden_col).zero_();
	m.narrow(2, centre + 1, kernel_size - centre - 1).zero_();
	mask = register_buffer("mask", m);
}

torch::Tensor MaskedConv2dImpl::forward(const torch::Tensor& x) {
	return torch::nn::functional::conv2d(x, conv->weight * mask, torch::nn::functional::Conv2dFuncOptions().bias(conv->bias).padding(padding));
}


GatedResidualLayerImpl::GatedResidualLayerImpl(const int64_t channels) {
	conv = register_module("conv", MaskedConv2d(channels, 2 * channels, 3, MaskType::B));
	proj = register_module("proj", torch::nn::Conv2d(torch::nn::Conv2dOptions(channels, channels, 1)));
}

torch::Tensor GatedResidualLayerImpl::forward(const torch::Tensor& x) {
	const auto gates = conv->forward(x).chunk(2, 1);
	const auto h = torch::tanh(gates[0]) * torch::sigmoid(gates[1]);
	return x + proj->forward(h);
}


PixelCNNImpl::PixelCNNImpl(const int64_t num_categories, const int64_t grid_size, const int64_t hiddens, const int64_t num_layers)
    : num_categories(num_categories), grid_size(grid_size) {
	embed = register_module("embed", torch::nn::Embedding(torch::nn::EmbeddingOptions(num_categories, hiddens)));
	input_conv = register_module("input_conv", MaskedConv2d(hiddens, hiddens, 7, MaskType::A));

	gated_layers = torch::nn::ModuleList();
	for (int64_t i = 0; i < num_layers; ++i) {
		gated_layers->push_back(GatedResidualLayer(hiddens));
	}
	register_module("gated_layers", gated_layers);

	head = torch::nn::Sequential(torch::nn::ReLU(), torch::nn::Conv2d(torch::nn::Conv2dOptions(hiddens, hiddens, 1)), torch::nn::ReLU(),
	                             torch::nn::Conv2d(torch::nn::Conv2dOptions(hiddens, num_categories, 1)));
	register_module("head", head);
}

void PixelCNNImpl::checkIndices(const torch::Tensor& indices) const {
	if (indices.dim() != 3 || indices.size(1) != grid_size || indices.size(2) != grid_size) {
		throw ShapeMismatch("PixelCNN: expected index grid [B, " + std::to_string(grid_size) + ", " + std::to_string(grid_size) + "], got " +
		                    shapeToString(indices.sizes().vec()));
	}
	if (indices.numel() == 0) return;

	const int64_t lo = indices.min().item<int64_t>();
	const int64_t hi = indices.max().item<int64_t>();
	if (lo < 0 || hi >= num_categories) {
		throw InvalidIndex(lo, hi, num_categories);
	}
}

torch::Tensor PixelCNNImpl::forward(const torch::Tensor& indices) {
	checkIndices(indices);

	auto x = embed->forward(indices.to(embed->weight.device(), torch::kLong)).permute({0, 3, 1, 2});
	x = input_conv->forward(x);
	for (const auto& layer : *gated_layers) {
		x = layer->as<GatedResidualLayer>()->forward(x);
	}
	return head->forward(x);
}

torch::Tensor PixelCNNImpl::sample(const int64_t n) {
	torch::NoGradGuard nograd;

	auto grid = torch::zeros({n, grid_size, grid_size}, torch::TensorOptions().dtype(torch::kLong).device(embed->weight.device()));
	for (int64_t i = 0; i < grid_size; ++i) {
		for (int64_t j = 0; j < grid_size; ++j) {
			const auto logits = forward(grid).select(3, j).select(2, i);  // [n, K]
			const auto probs = torch::softmax(logits, 1);
			grid.select(1, i).select(1, j).copy_(torch::multinomial(probs, 1).squeeze(1));
		}
	}
	return grid;
}

torch::Tensor PixelCNNImpl::reconstruct(const torch::Tensor& indices) {
	checkIndices(indices);
	torch::NoGradGuard nograd;

	// Each location is replaced by the mode of its prediction given the already revised prefix
	auto grid = indices.to(embed->weight.device(), torch::kLong).clone();
	for (int64_t i = 0; i < grid_size; ++i) {
		for (int64_t j = 0; j < grid_size; ++j) {
			const auto logits = forward(grid).select(3, j).select(2, i);
			grid.select(1, i).select(1, j).copy_(logits.argmax(1));
		}
	}
	return grid;
}

}  // namespace vqlatent
