/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "TestComponents.hpp"
#include "core/VQVAEConfig.hpp"

using namespace vqlatent;

TEST(VQVAEConfigTest, DefaultsAreConsistent) {
	const VQVAEConfig config;
	EXPECT_NO_THROW(config.validate());
	EXPECT_EQ(config.num_embeddings, 512);
	EXPECT_EQ(config.embedding_dim, 64);
	EXPECT_EQ(config.representation_dim, VQVAEConfig::latentSizeFor(config.image_size));
}

TEST(VQVAEConfigTest, LatentSizeFollowsEncoderGeometry) {
	EXPECT_EQ(VQVAEConfig::latentSizeFor(64), 13);
	EXPECT_EQ(VQVAEConfig::latentSizeFor(24), 3);
	EXPECT_EQ(VQVAEConfig::latentSizeFor(80), 17);
}

TEST(VQVAEConfigTest, RejectsDecayOutsideUnitInterval) {
	VQVAEConfig config;
	config.decay = 1.0f;
	EXPECT_THROW(config.validate(), std::invalid_argument);
	config.decay = 0.0f;
	EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(VQVAEConfigTest, RejectsNonPositiveSizes) {
	VQVAEConfig config;
	config.num_embeddings = 0;
	EXPECT_THROW(config.validate(), std::invalid_argument);

	config = VQVAEConfig{};
	config.embedding_dim = -1;
	EXPECT_THROW(config.validate(), std::invalid_argument);

	config = VQVAEConfig{};
	config.epsilon = 0.0f;
	EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(VQVAEConfigTest, GridSizeIsNotTiedToImageSize) {
	VQVAEConfig config;
	config.image_size = 32;
	config.representation_dim = 8;
	EXPECT_NO_THROW(config.validate());
}

TEST(VQVAEConfigTest, SmallTestConfigValidates) { EXPECT_NO_THROW(test::smallConfig().validate()); }
