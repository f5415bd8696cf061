/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "ConvNetworks.hpp"

namespace vqlatent {

ResidualStackImpl::ResidualStackImpl(const int64_t num_hiddens, const int64_t num_residual_layers, const int64_t num_residual_hiddens) {
	layers = torch::nn::ModuleList();
	for (int64_t i = 0; i < num_residual_layers; ++i) {
		layers->push_back(torch::nn::Sequential(
		    torch::nn::ReLU(),
		    torch::nn::Conv2d(torch::nn::Conv2dOptions(num_hiddens, num_residual_hiddens, 3).stride(1).padding(1).bias(false)),
		    torch::nn::ReLU(), torch::nn::Conv2d(torch::nn::Conv2dOptions(num_residual_hiddens, num_hiddens, 1).stride(1).bias(false))));
	}
	register_module("layers", layers);
}

torch::Tensor ResidualStackImpl::forward(const torch::Tensor& x) {
	torch::Tensor out = x;
	for (const auto& layer : *layers) {
		out = out + layer->as<torch::nn::Sequential>()->forward(out);
	}
	return torch::relu(out);
}


ConvEncoderImpl::ConvEncoderImpl(const int64_t in_channels, const int64_t num_hiddens, const int64_t num_residual_layers,
                                 const int64_t num_residual_hiddens) {
	net = torch::nn::Sequential(
	    // S → S/2
	    torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, num_hiddens / 2, 4).stride(2).padding(1)), torch::nn::ReLU(),

	    // S/2 → S/4
	    torch::nn::Conv2d(torch::nn::Conv2dOptions(num_hiddens / 2, num_hiddens, 4).stride(2).padding(1)), torch::nn::ReLU(),

	    // S/4 → S/4 - 3
	    torch::nn::Conv2d(torch::nn::Conv2dOptions(num_hiddens, num_hiddens, 4).stride(1)), torch::nn::ReLU(),

	    // Refine
	    torch::nn::Conv2d(torch::nn::Conv2dOptions(num_hiddens, num_hiddens, 3).stride(1).padding(1)));
	register_module("net", net);
	residual_stack = register_module("residual_stack", ResidualStack(num_hiddens, num_residual_layers, num_residual_hiddens));
}


ConvDecoderImpl::ConvDecoderImpl(const int64_t in_channels, const int64_t out_channels, const int64_t num_hiddens,
                                 const int64_t num_residual_layers, const int64_t num_residual_hiddens) {
	conv_in = register_module("conv_in", torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, num_hiddens, 3).stride(1).padding(1)));
	residual_stack = register_module("residual_stack", ResidualStack(num_hiddens, num_residual_layers, num_residual_hiddens));

	upsample = torch::nn::Sequential(
	    // S/4 - 3 → S/4
	    torch::nn::ConvTranspose2d(torch::nn::ConvTranspose2dOptions(num_hiddens, num_hiddens / 2, 4).stride(1)), torch::nn::ReLU(),

	    // S/4 → S/2
	    torch::nn::ConvTranspose2d(torch::nn::ConvTranspose2dOptions(num_hiddens / 2, num_hiddens / 2, 4).stride(2).padding(1)),
	    torch::nn::ReLU(),

	    // Final reconstruction
	    torch::nn::ConvTranspose2d(torch::nn::ConvTranspose2dOptions(num_hiddens / 2, out_channels, 4).stride(2).padding(1)));
	register_module("upsample", upsample);
}

}  // namespace vqlatent
