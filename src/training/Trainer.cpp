/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "Trainer.hpp"

#include <algorithm>
#include <stdexcept>

#include "core/Errors.hpp"
#include "orchestrator/Checkpoint.hpp"
#include "utils/Logger.hpp"
#include "utils/Profiler.hpp"

namespace vqlatent {

namespace {

torch::Device modelDevice(const VQVAE& model) {
	const auto params = model->parameters();
	return params.empty() ? torch::Device(torch::kCPU) : params.front().device();
}

}  // namespace


Trainer::Trainer(VQVAE model, Options opts)
    : model_(std::move(model)),
      opts_(std::move(opts)),
      optimizer_(model_->parameters(),
                 torch::optim::AdamOptions(model_->config().learning_rate).weight_decay(model_->config().weight_decay)),
      device_(modelDevice(model_)) {}


void Trainer::checkData(const torch::Tensor& data) const {
	const auto& config = model_->config();
	if (data.dim() != 4 || data.size(1) != config.num_channels || data.size(2) != config.image_size ||
	    data.size(3) != config.image_size) {
		throw ShapeMismatch("Trainer: expected data of shape [N, " + std::to_string(config.num_channels) + ", " +
		                    std::to_string(config.image_size) + ", " + std::to_string(config.image_size) + "], got " +
		                    shapeToString(data.sizes().vec()));
	}
	if (data.size(0) == 0) {
		throw std::invalid_argument("Trainer: training set is empty");
	}
}


std::vector<EpochStats> Trainer::fit(const torch::Tensor& data) {
	checkData(data);
	const auto& config = model_->config();

	logger::info("Training on {} samples for {} epochs (prior from epoch {}), device {}", data.size(0), config.epochs, config.prior_start,
	             device_.str());

	std::vector<EpochStats> history;
	history.reserve(config.epochs);
	for (int64_t epoch = 0; epoch < config.epochs; ++epoch) {
		history.push_back(runEpoch(data, epoch));

		if (opts_.checkpoint_path) {
			saveCheckpoint(model_, *opts_.checkpoint_path);
		}
	}

	PerformanceProfiler::getInstance().logReport();
	return history;
}


EpochStats Trainer::runEpoch(const torch::Tensor& data, const int64_t epoch) {
	checkData(data);
	VQLATENT_PROFILE_SCOPE("train_epoch");
	const auto& config = model_->config();

	EpochStats stats;
	stats.epoch = epoch;
	stats.fit_prior = epoch >= config.prior_start;

	model_->train();
	model_->set_fit_prior(stats.fit_prior);

	const int64_t n = data.size(0);
	const auto order = torch::randperm(n, torch::TensorOptions().dtype(torch::kLong));

	int64_t batches = 0;
	for (int64_t start = 0; start < n; start += config.batch_size) {
		const int64_t end = std::min(start + config.batch_size, n);
		const auto batch = data.index_select(0, order.slice(0, start, end).to(data.device())).to(device_);

		optimizer_.zero_grad();
		auto out = model_->forward(batch);

		const auto recon_loss = torch::nn::functional::mse_loss(out.reconstruction, batch);
		const auto loss = recon_loss + out.quant_loss + out.prior_loss;
		if (loss.requires_grad()) {
			loss.backward();
			optimizer_.step();
		}

		if (opts_.reset_dead_codes && !stats.fit_prior) {
			torch::NoGradGuard nograd;
			model_->quantizer->resetDeadCodes(model_->latent(batch), opts_.dead_code_threshold);
		}

		stats.recon_loss += recon_loss.item<double>();
		stats.quant_loss += out.quant_loss.item<double>();
		stats.prior_bits += out.prior_loss.item<double>();
		stats.perplexity += out.perplexity.item<double>();
		++batches;

		if (batches % config.log_interval == 0) {
			logger::debug("epoch {} batch {}: recon {:.5f} quant {:.5f} prior {:.4f} bits perplexity {:.2f}", epoch, batches,
			              recon_loss.item<double>(), out.quant_loss.item<double>(), out.prior_loss.item<double>(),
			              out.perplexity.item<double>());
		}
	}

	stats.recon_loss /= batches;
	stats.quant_loss /= batches;
	stats.prior_bits /= batches;
	stats.perplexity /= batches;

	const auto usage = model_->quantizer->usageStats(opts_.dead_code_threshold);
	stats.dead_codes = usage.dead_codes;

	logger::info("epoch {} [{}]: recon {:.5f} quant {:.5f} prior {:.4f} bits perplexity {:.2f}", epoch,
	             stats.fit_prior ? "prior" : "autoencoder", stats.recon_loss, stats.quant_loss, stats.prior_bits, stats.perplexity);
	if (usage.dead_codes > 0) {
		logger::warn("epoch {}: {} of {} codebook entries are dead (smallest smoothed cluster size {:.3g})", epoch, usage.dead_codes,
		             config.num_embeddings, usage.min_cluster_size);
	}
	return stats;
}

}  // namespace vqlatent
