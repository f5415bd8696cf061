/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <torch/torch.h>

#include <filesystem>
#include <optional>
#include <vector>

#include "orchestrator/VQVAE.hpp"

namespace vqlatent {

struct EpochStats {
	int64_t epoch = 0;
	bool fit_prior = false;
	double recon_loss = 0.0;
	double quant_loss = 0.0;
	double prior_bits = 0.0;
	double perplexity = 0.0;
	int64_t dead_codes = 0;
};

/**
 * @brief Adam training loop over a VQVAE.
 *
 * Epochs before `prior_start` fit the autoencoder (reconstruction + commitment); the remaining
 * epochs switch the model to fit_prior and train only the prior on the frozen codes.
 */
class Trainer {
   public:
	struct Options {
		// Entries whose EMA cluster size falls below this are reported, and reset when reset_dead_codes is set
		float dead_code_threshold = 1e-3f;
		bool reset_dead_codes = false;
		std::optional<std::filesystem::path> checkpoint_path;  // written after every epoch
	};

	Trainer(VQVAE model, Options opts);

	/**
	 * @param data Training set, shape [N, C, S, S], on any device.
	 * @return One entry per epoch.
	 */
	std::vector<EpochStats> fit(const torch::Tensor& data);

	/**
	 * @brief One epoch over `data`; exposed for callers driving their own schedule.
	 * @throws ShapeMismatch or std::invalid_argument under the same conditions as fit().
	 */
	EpochStats runEpoch(const torch::Tensor& data, int64_t epoch);

   private:
	void checkData(const torch::Tensor& data) const;

	VQVAE model_;
	Options opts_;
	torch::optim::Adam optimizer_;
	torch::Device device_;
};

}  // namespace vqlatent
