/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include "Checkpoint.hpp"

#include <stdexcept>
#include <string>
#include <system_error>

#include "utils/Logger.hpp"
#include "utils/Profiler.hpp"

namespace vqlatent {

void saveCheckpoint(VQVAE& model, const std::filesystem::path& path) {
	VQLATENT_PROFILE_SCOPE("checkpoint_save");

	if (path.has_parent_path()) {
		std::error_code ec;
		std::filesystem::create_directories(path.parent_path(), ec);
		if (ec) {
			throw std::runtime_error("Cannot create checkpoint directory " + path.parent_path().string() + ": " + ec.message());
		}
	}

	std::filesystem::path tmp = path;
	tmp += ".tmp";

	try {
		torch::serialize::OutputArchive archive;
		{
			const auto lock = model->quantizer->sharedLock();
			model->save(archive);
		}
		archive.save_to(tmp.string());
	} catch (const c10::Error& e) {
		throw std::runtime_error("Failed to write checkpoint " + tmp.string() + ": " + e.what_without_backtrace());
	}

	std::error_code ec;
	std::filesystem::rename(tmp, path, ec);
	if (ec) {
		const auto reason = ec.message();
		std::filesystem::remove(tmp, ec);
		throw std::runtime_error("Failed to move checkpoint into place at " + path.string() + ": " + reason);
	}
	logger::info("Checkpoint written to {}", path.string());
}

void loadCheckpoint(VQVAE& model, const std::filesystem::path& path) {
	VQLATENT_PROFILE_SCOPE("checkpoint_load");

	if (!std::filesystem::exists(path)) {
		throw std::runtime_error("Checkpoint not found at path: " + path.string());
	}

	try {
		torch::serialize::InputArchive archive;
		archive.load_from(path.string());
		const auto lock = model->quantizer->exclusiveLock();
		model->load(archive);
	} catch (const c10::Error& e) {
		throw std::runtime_error("Failed to load checkpoint " + path.string() + ": " + e.what_without_backtrace());
	}
	logger::info("Checkpoint loaded from {}", path.string());
}

}  // namespace vqlatent
