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

// x + conv1x1(relu(conv3x3(relu(x))))
struct ResidualStackImpl final : torch::nn::Module {
	torch::nn::ModuleList layers = nullptr;

	ResidualStackImpl(int64_t num_hiddens, int64_t num_residual_layers, int64_t num_residual_hiddens);

	torch::Tensor forward(const torch::Tensor& x);
};
TORCH_MODULE(ResidualStack);


struct ConvEncoderImpl final : IEncoder {
	torch::nn::Sequential net = nullptr;
	ResidualStack residual_stack = nullptr;

	ConvEncoderImpl(int64_t in_channels, int64_t num_hiddens, int64_t num_residual_layers, int64_t num_residual_hiddens);

	torch::Tensor forward(const torch::Tensor& x) override { return residual_stack->forward(net->forward(x)); }
};
TORCH_MODULE(ConvEncoder);


struct ConvDecoderImpl final : IDecoder {
	torch::nn::Conv2d conv_in = nullptr;
	ResidualStack residual_stack = nullptr;
	torch::nn::Sequential upsample = nullptr;

	ConvDecoderImpl(int64_t in_channels, int64_t out_channels, int64_t num_hiddens, int64_t num_residual_layers,
	                int64_t num_residual_hiddens);

	torch::Tensor forward(const torch::Tensor& x) override { return upsample->forward(residual_stack->forward(conv_in->forward(x))); }
};
TORCH_MODULE(ConvDecoder);

}  // namespace vqlatent
