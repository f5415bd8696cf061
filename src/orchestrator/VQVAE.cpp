/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "VQVAE.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "core/Errors.hpp"
#include "model/ConvNetworks.hpp"
#include "model/PixelCNN.hpp"
#include "utils/Logger.hpp"

namespace vqlatent {

namespace {

constexpr double kLog2E = 1.4426950408889634;  // nats → bits

}  // namespace


VQVAEImpl::VQVAEImpl(const VQVAEConfig& config) : config_(config) {
	config_.validate();

	const int64_t expected = VQVAEConfig::latentSizeFor(config_.image_size);
	if (expected <= 0 || expected != config_.representation_dim) {
		throw std::invalid_argument("VQVAE: representation_dim " + std::to_string(config_.representation_dim) +
		                            " does not match image_size " + std::to_string(config_.image_size) +
		                            " (the convolutional encoder produces " + std::to_string(expected) + ")");
	}

	build(ConvEncoder(config_.num_channels, config_.num_hiddens, config_.num_residual_layers, config_.num_residual_hiddens).ptr(),
	      ConvDecoder(config_.embedding_dim, config_.num_channels, config_.num_hiddens, config_.num_residual_layers,
	                  config_.num_residual_hiddens)
	          .ptr(),
	      PixelCNN(config_.num_embeddings, config_.representation_dim, config_.prior_hiddens, config_.prior_layers).ptr());
}

VQVAEImpl::VQVAEImpl(const VQVAEConfig& config, std::shared_ptr<IEncoder> encoder_, std::shared_ptr<IDecoder> decoder_,
                     std::shared_ptr<IPrior> prior_)
    : config_(config) {
	config_.validate();
	if (!encoder_ || !decoder_ || !prior_) {
		throw std::invalid_argument("VQVAE: encoder, decoder and prior must not be null.");
	}
	build(std::move(encoder_), std::move(decoder_), std::move(prior_));
}

void VQVAEImpl::build(std::shared_ptr<IEncoder> encoder_, std::shared_ptr<IDecoder> decoder_, std::shared_ptr<IPrior> prior_) {
	encoder = register_module("encoder", std::move(encoder_));
	pre_vq_conv = register_module("pre_vq_conv",
	                              torch::nn::Conv2d(torch::nn::Conv2dOptions(config_.num_hiddens, config_.embedding_dim, 1).stride(1)));
	quantizer = register_module("quantizer", VectorQuantizerEMA(config_.num_embeddings, config_.embedding_dim, config_.commitment_cost,
	                                                            config_.decay, config_.epsilon));
	decoder = register_module("decoder", std::move(decoder_));
	prior = register_module("prior", std::move(prior_));

	logger::debug("VQVAE: {}", config_.describe());
}


torch::Tensor VQVAEImpl::latent(const torch::Tensor& x) { return pre_vq_conv->forward(encoder->forward(x)); }


ForwardOutput VQVAEImpl::forward(const torch::Tensor& x) {
	const auto z = latent(x);
	auto [quantized, indices, quant_loss, perplexity] = quantizer->quantize(z, is_training());

	if (fit_prior_) {
		const auto logits = prior->predict(indices.detach());
		const auto targets = indices.to(logits.device());
		const auto prior_loss = torch::nn::functional::cross_entropy(logits, targets) * kLog2E;

		torch::Tensor x_recon;
		{
			torch::NoGradGuard nograd;
			x_recon = decoder->forward(quantized);
		}
		return {x_recon, quant_loss.detach(), prior_loss, perplexity, indices};
	}

	torch::Tensor x_recon = decoder->forward(quantized);
	return {x_recon, quant_loss, quant_loss * 0, perplexity, indices};
}


torch::Tensor VQVAEImpl::sample(const int64_t n) {
	if (n <= 0) throw std::invalid_argument("VQVAE::sample: n must be > 0, got " + std::to_string(n));
	torch::NoGradGuard nograd;

	const auto indices = prior->sample(n);
	checkIndexGrid(indices, n);
	return decode(indices);
}


torch::Tensor VQVAEImpl::interpolate(const torch::Tensor& x, const torch::Tensor& y) {
	if (x.sizes() != y.sizes()) {
		throw ShapeMismatch("VQVAE::interpolate: inputs must share a shape, got " + shapeToString(x.sizes().vec()) + " and " +
		                    shapeToString(y.sizes().vec()));
	}
	torch::NoGradGuard nograd;

	const auto z = (latent(x) + latent(y)) / 2;
	const auto indices = quantizer->quantize(z, false).indices;

	const auto denoised = prior->reconstruct(indices);
	if (denoised.sizes() != indices.sizes()) {
		throw ShapeMismatch("VQVAE::interpolate: prior returned " + shapeToString(denoised.sizes().vec()) + " for an index grid of " +
		                    shapeToString(indices.sizes().vec()));
	}

	const auto quantized = quantizer->lookup(denoised).view(z.sizes());
	return decoder->forward(quantized);
}


torch::Tensor VQVAEImpl::encode(const torch::Tensor& x) {
	torch::NoGradGuard nograd;
	return quantizer->assign(latent(x));
}


torch::Tensor VQVAEImpl::decode(const torch::Tensor& indices) { return decoder->forward(quantizer->lookup(indices)); }


void VQVAEImpl::checkIndexGrid(const torch::Tensor& indices, const int64_t batch) const {
	const int64_t r = config_.representation_dim;
	if (indices.dim() != 3 || indices.size(0) != batch || indices.size(1) != r || indices.size(2) != r) {
		throw ShapeMismatch("VQVAE: prior produced index grid " + shapeToString(indices.sizes().vec()) + ", expected [" +
		                    std::to_string(batch) + ", " + std::to_string(r) + ", " + std::to_string(r) + "]");
	}
}

}  // namespace vqlatent
