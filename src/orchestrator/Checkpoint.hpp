/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#pragma once

#include <filesystem>

#include "VQVAE.hpp"

namespace vqlatent {

/**
 * @brief Writes every parameter and buffer of `model` to `path`.
 *
 * The codebook and both EMA accumulators are captured under one read lock, so the file
 * never mixes tables from different updates. The archive is written next to `path` and
 * renamed over it once complete.
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void saveCheckpoint(VQVAE& model, const std::filesystem::path& path);

/**
 * @brief Restores a model written by saveCheckpoint. The model must have been built from
 *        the same configuration.
 * @throws std::runtime_error if the file is missing or does not match the model.
 */
void loadCheckpoint(VQVAE& model, const std::filesystem::path& path);

}  // namespace vqlatent
