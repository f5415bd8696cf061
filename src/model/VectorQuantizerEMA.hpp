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
#include <mutex>
#include <shared_mutex>

namespace vqlatent {

struct QuantizerOutput {
	torch::Tensor quantized;        // [B, D, H, W], straight-through w.r.t. the latent
	torch::Tensor indices;          // [B, H, W], int64
	torch::Tensor commitment_loss;  // scalar
	torch::Tensor perplexity;       // scalar, no grad
};

/**
 * @brief Advisory dead-code report. Never thrown, only observed.
 */
struct CodebookUsage {
	torch::Tensor smoothed_cluster_size;  // [K]
	int64_t dead_codes = 0;
	float min_cluster_size = 0.0f;
};

/**
 * @brief Straight-through estimator.
 *
 * Forward gathers codebook rows for the given assignments; backward hands the incoming
 * gradient to the latent unchanged and nothing to the codebook or the indices.
 */
class StraightThroughLookup : public torch::autograd::Function<StraightThroughLookup> {
   public:
	static torch::Tensor forward(torch::autograd::AutogradContext* ctx, const torch::Tensor& flatLatent, const torch::Tensor& codebook,
	                             const torch::Tensor& indices);

	static torch::autograd::variable_list backward(torch::autograd::AutogradContext* ctx, torch::autograd::variable_list gradOutputs);
};


// --- VectorQuantizerEMA ---
struct VectorQuantizerEMAImpl final : torch::nn::Module {
	float commitment_cost;
	float decay;
	float eps;

	int64_t num_embeddings;
	int64_t embedding_dim;

	VectorQuantizerEMAImpl(int64_t num_embeddings, int64_t embedding_dim, float commitment_cost, float decay = 0.99, float eps = 1e-5);

	// Seeded construction from a given [K, D] table.
	VectorQuantizerEMAImpl(const torch::Tensor& initial_codebook, float commitment_cost, float decay = 0.99, float eps = 1e-5);

	/**
	 * @brief Quantizes a channel-first latent grid.
	 *
	 * Assignment uses the codebook as it was before this call. When `training` is set the EMA
	 * statistics of this batch are folded in afterwards, as one atomic update.
	 *
	 * @param x Latent grid, shape [B, D, ...spatial].
	 * @throws ShapeMismatch if x.size(1) != D or x has no spatial dimension.
	 */
	QuantizerOutput quantize(const torch::Tensor& x, bool training);

	// Uses the module's train/eval mode.
	QuantizerOutput forward(const torch::Tensor& x) { return quantize(x, is_training()); }

	/** Nearest-code assignment only, shape [B, ...spatial]. No state change. */
	torch::Tensor assign(const torch::Tensor& x) const;

	/**
	 * @brief Gathers codebook rows for an index grid.
	 * @param indices Integer grid, shape [B, ...spatial].
	 * @return Channel-first grid, shape [B, D, ...spatial].
	 * @throws InvalidIndex if any index lies outside [0, K).
	 */
	torch::Tensor lookup(const torch::Tensor& indices) const;

	/**
	 * @brief Re-seeds entries whose EMA cluster size fell below `threshold` with random latent
	 *        vectors from `x`. Returns the number of entries reset.
	 */
	int64_t resetDeadCodes(const torch::Tensor& x, float threshold);

	CodebookUsage usageStats(float deadThreshold) const;

	// Detached snapshots; the live tables are only written by the update rule.
	torch::Tensor codebook() const;
	torch::Tensor clusterSize() const;
	torch::Tensor embedAverage() const;
	torch::Tensor smoothedClusterSize() const;

	// For whole-model serialization, which must see all three tables from the same update.
	[[nodiscard]] std::shared_lock<std::shared_mutex> sharedLock() const { return std::shared_lock<std::shared_mutex>(mutex_); }
	[[nodiscard]] std::unique_lock<std::shared_mutex> exclusiveLock() { return std::unique_lock<std::shared_mutex>(mutex_); }

   private:
	void registerTables(const torch::Tensor& initial);
	void checkLatentShape(const torch::Tensor& x) const;
	torch::Tensor flatten(const torch::Tensor& x) const;
	torch::Tensor nearest(const torch::Tensor& flat) const;
	QuantizerOutput quantizeLocked(const torch::Tensor& x, bool training);
	void updateEMA(const torch::Tensor& flat, const torch::Tensor& indices);
	torch::Tensor smoothedLocked() const;

	torch::Tensor embedding;     // These are buffers
	torch::Tensor cluster_size;
	torch::Tensor embed_avg;

	mutable std::shared_mutex mutex_;
};
TORCH_MODULE(VectorQuantizerEMA);

}  // namespace vqlatent
