/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <cmath>
#include <thread>
#include <vector>

#include "core/Errors.hpp"
#include "model/VectorQuantizerEMA.hpp"

using namespace vqlatent;

namespace {

constexpr float kCommitment = 0.25f;
constexpr float kDecay = 0.99f;
constexpr float kEps = 1e-5f;

torch::Tensor cornerCodebook() {
	// [[0,0],[10,0],[0,10],[10,10]]
	return torch::tensor({0.f, 0.f, 10.f, 0.f, 0.f, 10.f, 10.f, 10.f}).view({4, 2});
}

// Single-location latent [1, D, 1, 1]
torch::Tensor pointLatent(std::vector<float> v) {
	const auto d = static_cast<int64_t>(v.size());
	return torch::tensor(v).view({1, d, 1, 1});
}

}  // namespace


class VectorQuantizerTest : public ::testing::Test {
   protected:
	void SetUp() override { torch::manual_seed(42); }

	VectorQuantizerEMA corner() { return VectorQuantizerEMA(cornerCodebook(), kCommitment, kDecay, kEps); }
};


TEST_F(VectorQuantizerTest, CornerScenario) {
	auto vq = corner();
	const auto out = vq->quantize(pointLatent({1.f, 1.f}), false);

	EXPECT_EQ(out.indices.sizes(), torch::IntArrayRef({1, 1, 1}));
	EXPECT_EQ(out.indices.item<int64_t>(), 0);
	EXPECT_TRUE(torch::equal(out.quantized.view({2}), torch::zeros({2})));
	EXPECT_NEAR(out.commitment_loss.item<float>(), kCommitment * 2.0f, 1e-6);
}

TEST_F(VectorQuantizerTest, TiesGoToLowestIndex) {
	// Entries 2 and 5 are both at squared distance 1 from the origin, everything else is farther
	const auto codebook =
	    torch::tensor({5.f, 5.f, 5.f, -5.f, 1.f, 0.f, -5.f, 5.f, 4.f, 4.f, -1.f, 0.f}).view({6, 2});
	VectorQuantizerEMA vq(codebook, kCommitment, kDecay, kEps);

	const auto out = vq->quantize(pointLatent({0.f, 0.f}), false);
	EXPECT_EQ(out.indices.item<int64_t>(), 2);
	EXPECT_EQ(vq->assign(pointLatent({0.f, 0.f})).item<int64_t>(), 2);
}

TEST_F(VectorQuantizerTest, InferenceIsDeterministic) {
	VectorQuantizerEMA vq(16, 8, kCommitment);
	const auto z = torch::randn({3, 8, 5, 5});

	const auto a = vq->quantize(z, false);
	const auto b = vq->quantize(z, false);

	EXPECT_TRUE(torch::equal(a.indices, b.indices));
	EXPECT_TRUE(torch::equal(a.quantized, b.quantized));
}

TEST_F(VectorQuantizerTest, QuantizedVectorsAreExactCodebookRows) {
	VectorQuantizerEMA vq(16, 8, kCommitment);
	const auto z = torch::randn({2, 8, 4, 6});
	const auto out = vq->quantize(z, false);

	const auto codebook = vq->codebook();
	const auto expected = codebook.index_select(0, out.indices.reshape({-1})).view({2, 4, 6, 8}).permute({0, 3, 1, 2});
	EXPECT_TRUE(torch::equal(out.quantized, expected));
	EXPECT_TRUE(torch::equal(vq->lookup(out.indices), expected));
}

TEST_F(VectorQuantizerTest, AssignmentIsNearestNeighbour) {
	VectorQuantizerEMA vq(32, 6, kCommitment);
	const auto z = torch::randn({4, 6, 3, 3});
	const auto out = vq->quantize(z, false);

	const auto flat = z.permute({0, 2, 3, 1}).reshape({-1, 6});
	const auto codebook = vq->codebook();
	const auto dist = (flat.unsqueeze(1) - codebook.unsqueeze(0)).pow(2).sum(2);  // [N, K]
	const auto chosen = dist.gather(1, out.indices.reshape({-1, 1})).squeeze(1);
	const auto best = std::get<0>(dist.min(1));

	EXPECT_TRUE(torch::all(chosen <= best + 1e-4).item<bool>());
}

TEST_F(VectorQuantizerTest, GradientPassesStraightThrough) {
	for (const bool training : {false, true}) {
		auto vq = corner();
		auto z = torch::tensor({1.f, 1.f, 9.f, 2.f, 3.f, 8.f}).view({1, 2, 3, 1}).requires_grad_(true);

		const auto out = vq->quantize(z, training);
		out.quantized.backward(torch::ones_like(out.quantized));

		ASSERT_TRUE(z.grad().defined());
		EXPECT_TRUE(torch::equal(z.grad(), torch::ones_like(z))) << "training=" << training;
	}
}

TEST_F(VectorQuantizerTest, CommitmentLossDoesNotReachCodebook) {
	auto vq = corner();
	auto z = pointLatent({1.f, 1.f}).requires_grad_(true);
	const auto out = vq->quantize(z, false);
	out.commitment_loss.backward();

	// d/dz cost * ||z - q||^2 = 2 * cost * (z - q)
	EXPECT_TRUE(torch::allclose(z.grad().view({2}), torch::full({2}, 2 * kCommitment)));
	EXPECT_TRUE(torch::equal(vq->codebook(), cornerCodebook()));
}

TEST_F(VectorQuantizerTest, EmaUpdateConservesMass) {
	auto vq = corner();
	const auto before = vq->clusterSize();
	ASSERT_NEAR(before.sum().item<float>(), 4.0f, 1e-6);

	// Four locations, all nearest to entry 0
	const auto z = torch::ones({1, 2, 2, 2});
	const auto out = vq->quantize(z, true);
	ASSERT_TRUE(torch::all(out.indices == 0).item<bool>());

	const auto after = vq->clusterSize();
	EXPECT_GT(after[0].item<float>(), before[0].item<float>());
	for (int64_t j = 1; j < 4; ++j) {
		EXPECT_LT(after[j].item<float>(), before[j].item<float>());
	}
	EXPECT_NEAR(after.sum().item<float>(), before.sum().item<float>(), kEps);
	EXPECT_NEAR(vq->smoothedClusterSize().sum().item<float>(), after.sum().item<float>(), 1e-4);
}

TEST_F(VectorQuantizerTest, EmaMovesCodeTowardsAssignedMean) {
	auto vq = corner();
	const auto z = torch::ones({1, 2, 2, 2});
	const auto out = vq->quantize(z, true);

	// The returned grid is gathered from the table as it was before the update
	EXPECT_TRUE(torch::equal(out.quantized, torch::zeros_like(z)));

	const float n = 4.0f;
	const float size0 = kDecay * 1.0f + (1 - kDecay) * 4.0f;
	const float smoothed0 = (size0 + kEps) / (n + 4 * kEps) * n;
	const float expected0 = (1 - kDecay) * 4.0f / smoothed0;

	const auto codebook = vq->codebook();
	EXPECT_NEAR(codebook[0][0].item<float>(), expected0, 1e-5);
	EXPECT_NEAR(codebook[0][1].item<float>(), expected0, 1e-5);
	EXPECT_NEAR(codebook[1][0].item<float>(), 10.0f, 1e-3);
	EXPECT_NEAR(codebook[3][1].item<float>(), 10.0f, 1e-3);

	const auto avg = vq->embedAverage();
	EXPECT_NEAR(avg[0][0].item<float>(), (1 - kDecay) * 4.0f, 1e-6);
}

TEST_F(VectorQuantizerTest, InferenceLeavesStateUntouched) {
	auto vq = corner();
	vq->quantize(torch::randn({2, 2, 3, 3}), false);

	EXPECT_TRUE(torch::equal(vq->codebook(), cornerCodebook()));
	EXPECT_TRUE(torch::equal(vq->clusterSize(), torch::ones({4})));
}

TEST_F(VectorQuantizerTest, ForwardFollowsModuleMode) {
	auto vq = corner();
	vq->eval();
	vq->forward(torch::ones({1, 2, 2, 2}));
	EXPECT_TRUE(torch::equal(vq->clusterSize(), torch::ones({4})));

	vq->train();
	vq->forward(torch::ones({1, 2, 2, 2}));
	EXPECT_FALSE(torch::equal(vq->clusterSize(), torch::ones({4})));
}

TEST_F(VectorQuantizerTest, WrongChannelCountThrowsWithoutUpdating) {
	auto vq = corner();
	EXPECT_THROW(vq->quantize(torch::randn({1, 3, 2, 2}), true), ShapeMismatch);
	EXPECT_THROW(vq->quantize(torch::randn({4, 2}), true), ShapeMismatch);
	EXPECT_THROW(vq->assign(torch::randn({1, 5, 2, 2})), ShapeMismatch);
	EXPECT_TRUE(torch::equal(vq->clusterSize(), torch::ones({4})));
}

TEST_F(VectorQuantizerTest, LookupRejectsOutOfRangeIndices) {
	auto vq = corner();
	EXPECT_THROW(vq->lookup(torch::tensor({0, 1, 4, 2}, torch::kLong).view({1, 2, 2})), InvalidIndex);
	EXPECT_THROW(vq->lookup(torch::tensor({-1, 1, 3, 2}, torch::kLong).view({1, 2, 2})), InvalidIndex);

	try {
		vq->lookup(torch::tensor({0, 7}, torch::kLong).view({1, 1, 2}));
		FAIL() << "expected InvalidIndex";
	} catch (const InvalidIndex& e) {
		EXPECT_EQ(e.maxIndex(), 7);
		EXPECT_NE(std::string(e.what()).find("4 entries"), std::string::npos);
	}
}

TEST_F(VectorQuantizerTest, LookupIsChannelFirst) {
	auto vq = corner();
	const auto indices = torch::tensor({3, 1, 2, 0}, torch::kLong).view({1, 2, 2});
	const auto grid = vq->lookup(indices);

	ASSERT_EQ(grid.sizes(), torch::IntArrayRef({1, 2, 2, 2}));
	EXPECT_TRUE(torch::equal(grid.select(0, 0).select(1, 0).select(1, 0), torch::tensor({10.f, 10.f})));
	EXPECT_TRUE(torch::equal(grid.select(0, 0).select(1, 0).select(1, 1), torch::tensor({10.f, 0.f})));
	EXPECT_TRUE(torch::equal(grid.select(0, 0).select(1, 1).select(1, 0), torch::tensor({0.f, 10.f})));
}

TEST_F(VectorQuantizerTest, UnusedEntriesDecayTowardsDead) {
	auto vq = corner();
	const auto z = torch::ones({1, 2, 2, 2});

	QuantizerOutput out;
	for (int step = 0; step < 100; ++step) {
		out = vq->quantize(z, true);
	}
	EXPECT_NEAR(out.perplexity.item<float>(), 1.0f, 1e-4);

	const auto usage = vq->usageStats(0.5f);
	EXPECT_EQ(usage.dead_codes, 3);
	EXPECT_GT(usage.min_cluster_size, 0.0f);
	EXPECT_TRUE(torch::all(torch::isfinite(vq->codebook())).item<bool>());
}

TEST_F(VectorQuantizerTest, ResetDeadCodesReseedsFromBatch) {
	auto vq = corner();
	const auto z = torch::tensor({3.f, 4.f, 5.f, 6.f}).view({1, 2, 2, 1});

	// Every entry starts at cluster size 1
	EXPECT_EQ(vq->resetDeadCodes(z, 0.5f), 0);
	EXPECT_EQ(vq->resetDeadCodes(z, 1.5f), 4);

	const auto codebook = vq->codebook();
	for (int64_t k = 0; k < 4; ++k) {
		const bool first = torch::equal(codebook[k], torch::tensor({3.f, 5.f}));
		const bool second = torch::equal(codebook[k], torch::tensor({4.f, 6.f}));
		EXPECT_TRUE(first || second) << "entry " << k;
	}
	EXPECT_TRUE(torch::equal(vq->embedAverage(), codebook));
	EXPECT_TRUE(torch::equal(vq->clusterSize(), torch::ones({4})));
}

TEST_F(VectorQuantizerTest, ConcurrentTrainingUpdatesAreSerialised) {
	auto vq = corner();
	const auto z = torch::ones({1, 2, 2, 2});

	constexpr int kThreads = 4;
	constexpr int kSteps = 25;
	std::vector<std::thread> workers;
	for (int t = 0; t < kThreads; ++t) {
		workers.emplace_back([&] {
			for (int s = 0; s < kSteps; ++s) {
				vq->quantize(z, true);
				vq->quantize(z, false);
			}
		});
	}
	for (auto& w : workers) w.join();

	// An entry that never wins decays by exactly one factor per training call
	const float expected = std::pow(kDecay, kThreads * kSteps);
	EXPECT_NEAR(vq->clusterSize()[3].item<float>(), expected, 1e-4);
	EXPECT_NEAR(vq->clusterSize().sum().item<float>(), 4.0f, 1e-3);
}
