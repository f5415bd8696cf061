/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "VectorQuantizerEMA.hpp"

#include <algorithm>
#include <vector>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace vqlatent {

namespace {

// [0, 2, 3, …, n, 1]
std::vector<int64_t> channelLastPermutation(const int64_t dim) {
	std::vector<int64_t> perm{0};
	for (int64_t i = 2; i < dim; ++i) perm.push_back(i);
	perm.push_back(1);
	return perm;
}

// [0, n, 1, 2, …, n-1]
std::vector<int64_t> channelFirstPermutation(const int64_t dim) {
	std::vector<int64_t> perm{0, dim - 1};
	for (int64_t i = 1; i < dim - 1; ++i) perm.push_back(i);
	return perm;
}

}  // namespace


// --- StraightThroughLookup ---
torch::Tensor StraightThroughLookup::forward(torch::autograd::AutogradContext* ctx, const torch::Tensor& flatLatent,
                                             const torch::Tensor& codebook, const torch::Tensor& indices) {
	return torch::index_select(codebook, 0, indices);
}

torch::autograd::variable_list StraightThroughLookup::backward(torch::autograd::AutogradContext* ctx,
                                                               torch::autograd::variable_list gradOutputs) {
	// Identity towards the latent, nothing towards the codebook or the indices
	return {gradOutputs[0], torch::Tensor(), torch::Tensor()};
}


// --- VectorQuantizerEMAImpl ---
VectorQuantizerEMAImpl::VectorQuantizerEMAImpl(const int64_t num_embeddings, const int64_t embedding_dim, const float commitment_cost,
                                               const float decay, const float eps)
    : commitment_cost(commitment_cost), decay(decay), eps(eps), num_embeddings(num_embeddings), embedding_dim(embedding_dim) {
	auto embed = torch::randn({num_embeddings, embedding_dim});
	embed = torch::nn::functional::normalize(embed,
	                                         torch::nn::functional::NormalizeFuncOptions().p(2).dim(1));  // L2, dim=1
	registerTables(embed);
}

VectorQuantizerEMAImpl::VectorQuantizerEMAImpl(const torch::Tensor& initial_codebook, const float commitment_cost, const float decay,
                                               const float eps)
    : commitment_cost(commitment_cost),
      decay(decay),
      eps(eps),
      num_embeddings(initial_codebook.dim() == 2 ? initial_codebook.size(0) : 0),
      embedding_dim(initial_codebook.dim() == 2 ? initial_codebook.size(1) : 0) {
	if (initial_codebook.dim() != 2 || num_embeddings == 0 || embedding_dim == 0) {
		throw ShapeMismatch("VectorQuantizerEMA: initial codebook must have shape [K, D] with K, D > 0, got " +
		                    shapeToString(initial_codebook.sizes().vec()));
	}
	registerTables(initial_codebook.detach().to(torch::kFloat32));
}

void VectorQuantizerEMAImpl::registerTables(const torch::Tensor& initial) {
	embedding = register_buffer("embedding", initial.clone());
	cluster_size = register_buffer("cluster_size", torch::ones({num_embeddings}, initial.options()));
	embed_avg = register_buffer("embed_avg", initial.clone());
}


void VectorQuantizerEMAImpl::checkLatentShape(const torch::Tensor& x) const {
	if (x.dim() < 3 || x.size(1) != embedding_dim) {
		throw ShapeMismatch("VectorQuantizerEMA: expected latent of shape [B, " + std::to_string(embedding_dim) + ", ...spatial], got " +
		                    shapeToString(x.sizes().vec()));
	}
}

torch::Tensor VectorQuantizerEMAImpl::flatten(const torch::Tensor& x) const {
	return x.permute(channelLastPermutation(x.dim())).contiguous().view({-1, embedding_dim});
}

torch::Tensor VectorQuantizerEMAImpl::nearest(const torch::Tensor& flat) const {
	torch::NoGradGuard guard;
	const auto f = flat.detach();

	// L2 distance
	auto distances = torch::sum(f.pow(2), 1, true) + torch::sum(embedding.pow(2), 1) - 2 * torch::matmul(f, embedding.t());

	// argmin returns the first minimum, so ties go to the lowest index
	return torch::argmin(distances, 1);
}


QuantizerOutput VectorQuantizerEMAImpl::quantize(const torch::Tensor& x, const bool training) {
	checkLatentShape(x);

	if (training) {
		std::unique_lock<std::shared_mutex> lock(mutex_);
		return quantizeLocked(x, true);
	}
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return quantizeLocked(x, false);
}

QuantizerOutput VectorQuantizerEMAImpl::quantizeLocked(const torch::Tensor& x, const bool training) {
	const int64_t dim = x.dim();
	auto flat = flatten(x);

	const auto encoding_indices = nearest(flat);

	// Gather against the pre-update table; the result owns its storage
	auto quantized_flat = StraightThroughLookup::apply(flat, embedding.detach(), encoding_indices);

	std::vector<int64_t> perm_shape;
	perm_shape.push_back(x.size(0));
	for (int64_t i = 2; i < dim; ++i) perm_shape.push_back(x.size(i));
	perm_shape.push_back(embedding_dim);

	auto quantized = quantized_flat.view(perm_shape).permute(channelFirstPermutation(dim)).contiguous();

	// Squared distance per location, averaged over locations
	auto commitment = commitment_cost * (x - quantized.detach()).pow(2).sum(1).mean();

	// Perplexity
	torch::Tensor perplex;
	{
		torch::NoGradGuard guard;
		auto counts = torch::bincount(encoding_indices, {}, num_embeddings).to(flat.dtype());
		auto avg_probs = counts / std::max<int64_t>(encoding_indices.numel(), 1);
		perplex = torch::exp(-torch::sum(avg_probs * torch::log(avg_probs + 1e-10)));
	}

	// ── EMA updates ───────────────────────────────────────────────────────────
	if (training) {
		updateEMA(flat, encoding_indices);
	}

	std::vector<int64_t> index_shape(perm_shape.begin(), perm_shape.end() - 1);
	return {quantized, encoding_indices.view(index_shape), commitment, perplex};
}

void VectorQuantizerEMAImpl::updateEMA(const torch::Tensor& flat, const torch::Tensor& indices) {
	torch::NoGradGuard guard;

	const auto f = flat.detach();
	const auto enc_sum = torch::bincount(indices, {}, num_embeddings).to(f.dtype());
	const auto dw = torch::zeros({num_embeddings, embedding_dim}, f.options()).index_add_(0, indices, f);

	// Stage the new state, then publish all three tables together
	auto new_cluster_size = cluster_size * decay + enc_sum * (1 - decay);
	auto new_embed_avg = embed_avg * decay + dw * (1 - decay);

	// Laplace smoothing keeps every size strictly positive
	const auto n = new_cluster_size.sum();
	const auto smoothed = (new_cluster_size + eps) / (n + num_embeddings * eps) * n;
	auto new_embedding = new_embed_avg / smoothed.unsqueeze(1);

	cluster_size.copy_(new_cluster_size);
	embed_avg.copy_(new_embed_avg);
	embedding.copy_(new_embedding);
}


torch::Tensor VectorQuantizerEMAImpl::assign(const torch::Tensor& x) const {
	checkLatentShape(x);
	std::shared_lock<std::shared_mutex> lock(mutex_);

	std::vector<int64_t> index_shape{x.size(0)};
	for (int64_t i = 2; i < x.dim(); ++i) index_shape.push_back(x.size(i));
	return nearest(flatten(x)).view(index_shape);
}

torch::Tensor VectorQuantizerEMAImpl::lookup(const torch::Tensor& indices) const {
	if (indices.dim() < 2) {
		throw ShapeMismatch("VectorQuantizerEMA: expected index grid of shape [B, ...spatial], got " + shapeToString(indices.sizes().vec()));
	}
	if (at::isFloatingType(indices.scalar_type()) || indices.scalar_type() == torch::kBool) {
		throw std::invalid_argument("VectorQuantizerEMA: index grid must hold integers");
	}

	const auto flat_indices = indices.reshape({-1}).to(torch::kLong);
	if (flat_indices.numel() > 0) {
		const int64_t lo = flat_indices.min().item<int64_t>();
		const int64_t hi = flat_indices.max().item<int64_t>();
		if (lo < 0 || hi >= num_embeddings) {
			throw InvalidIndex(lo, hi, num_embeddings);
		}
	}

	std::shared_lock<std::shared_mutex> lock(mutex_);
	const auto selected_vectors = torch::index_select(embedding, 0, flat_indices.to(embedding.device()));

	std::vector<int64_t> target_shape = indices.sizes().vec();
	target_shape.push_back(embedding_dim);  // Append the embedding dimension

	return selected_vectors.view(target_shape).permute(channelFirstPermutation(indices.dim() + 1)).contiguous();
}


int64_t VectorQuantizerEMAImpl::resetDeadCodes(const torch::Tensor& x, const float threshold) {
	checkLatentShape(x);
	torch::NoGradGuard guard;

	const auto flat_z = flatten(x.detach());
	std::unique_lock<std::shared_mutex> lock(mutex_);

	const auto dead_idx = torch::where(cluster_size < threshold)[0];
	if (dead_idx.numel() == 0) return 0;

	const auto num_active = flat_z.size(0);
	if (num_active == 0) {
		logger::warn("Cannot reset {} dead codes, encoder batch empty.", dead_idx.numel());
		return 0;
	}

	logger::info("Resetting {} dead codes.", dead_idx.numel());

	const auto sample_idx =
	    torch::randint(0, num_active, {dead_idx.numel()}, torch::TensorOptions().device(flat_z.device()).dtype(torch::kLong));
	const auto new_embeds = flat_z.index_select(0, sample_idx).to(embedding.device());

	embedding.index_copy_(0, dead_idx, new_embeds);
	embed_avg.index_copy_(0, dead_idx, new_embeds);
	cluster_size.index_fill_(0, dead_idx, 1.0);
	return dead_idx.numel();
}

torch::Tensor VectorQuantizerEMAImpl::smoothedLocked() const {
	torch::NoGradGuard guard;
	const auto n = cluster_size.sum();
	return (cluster_size + eps) / (n + num_embeddings * eps) * n;
}

CodebookUsage VectorQuantizerEMAImpl::usageStats(const float deadThreshold) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	CodebookUsage usage;
	usage.smoothed_cluster_size = smoothedLocked();
	usage.dead_codes = (usage.smoothed_cluster_size < deadThreshold).sum().item<int64_t>();
	usage.min_cluster_size = usage.smoothed_cluster_size.min().item<float>();
	return usage;
}

torch::Tensor VectorQuantizerEMAImpl::codebook() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return embedding.detach().clone();
}

torch::Tensor VectorQuantizerEMAImpl::clusterSize() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return cluster_size.detach().clone();
}

torch::Tensor VectorQuantizerEMAImpl::embedAverage() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return embed_avg.detach().clone();
}

torch::Tensor VectorQuantizerEMAImpl::smoothedClusterSize() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return smoothedLocked();
}

}  // namespace vqlatent
