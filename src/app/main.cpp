/*
 * Copyright (c) 2025, Enzo Crema
 *
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * See the LICENSE file in the project root for full license text.
 */

#include <torch/torch.h>

#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>
#include <string>

#include "core/Errors.hpp"
#include "core/VQVAEConfig.hpp"
#include "orchestrator/Checkpoint.hpp"
#include "orchestrator/VQVAE.hpp"
#include "training/Trainer.hpp"
#include "utils/Logger.hpp"
#include "utils/Profiler.hpp"

namespace {

torch::Device resolveDevice(const bool wantCuda) {
	if (wantCuda) {
		if (torch::cuda::is_available()) {
			return torch::kCUDA;
		}
		logger::warn("CUDA requested but not available. Falling back to CPU.");
	}
	return torch::kCPU;
}

torch::Tensor loadTensor(const std::string& path) {
	if (!std::filesystem::exists(path)) {
		throw std::runtime_error("Input tensor not found at path: " + path);
	}
	torch::Tensor t;
	torch::load(t, path);
	return t;
}

void saveTensor(const torch::Tensor& t, const std::string& path) {
	const std::filesystem::path outp(path);
	if (outp.has_parent_path()) {
		std::filesystem::create_directories(outp.parent_path());
	}
	torch::save(t.to(torch::kCPU), path);
	logger::info("Wrote tensor {} to {}", vqlatent::shapeToString(t.sizes().vec()), path);
}

}  // namespace


int main(int argc, char** argv) {
	cxxopts::Options cli("vqlatent", "VQ-VAE with an autoregressive prior over the code grid");

	vqlatent::VQVAEConfig config;

	cli.add_options()
		("train", "Train a model on --input and write --checkpoint", cxxopts::value<bool>()->default_value("false"))
		("sample", "Draw -n samples from the prior", cxxopts::value<bool>()->default_value("false"))
		("reconstruct", "Reconstruct --input through the codebook", cxxopts::value<bool>()->default_value("false"))
		("interpolate", "Interpolate between --input and --second", cxxopts::value<bool>()->default_value("false"))
		("i,input", "Input tensor file [N, C, S, S]", cxxopts::value<std::string>())
		("second", "Second input tensor file (interpolate)", cxxopts::value<std::string>())
		("o,output", "Output tensor file", cxxopts::value<std::string>())
		("c,checkpoint", "Model checkpoint", cxxopts::value<std::string>())
		("n,count", "Number of samples", cxxopts::value<int64_t>()->default_value("1"))
		("epochs", "Training epochs", cxxopts::value<int64_t>()->default_value(std::to_string(config.epochs)))
		("prior_start", "First epoch that fits the prior", cxxopts::value<int64_t>()->default_value(std::to_string(config.prior_start)))
		("batch_size", "Mini-batch size", cxxopts::value<int64_t>()->default_value(std::to_string(config.batch_size)))
		("lr", "Learning rate", cxxopts::value<double>()->default_value(std::to_string(config.learning_rate)))
		("num_embeddings", "Codebook size K", cxxopts::value<int64_t>()->default_value(std::to_string(config.num_embeddings)))
		("embedding_dim", "Codebook vector size D", cxxopts::value<int64_t>()->default_value(std::to_string(config.embedding_dim)))
		("image_size", "Input side length", cxxopts::value<int64_t>()->default_value(std::to_string(config.image_size)))
		("channels", "Input channels", cxxopts::value<int64_t>()->default_value(std::to_string(config.num_channels)))
		("reset_dead_codes", "Re-seed dead codebook entries while training", cxxopts::value<bool>()->default_value("false"))
		("seed", "Random seed", cxxopts::value<uint64_t>()->default_value(std::to_string(config.seed)))
		("cuda", "Use CUDA when available", cxxopts::value<bool>()->default_value("false"))
		("v,verbose", "Verbose / debug logging", cxxopts::value<bool>()->default_value("false"))
		("h,help", "Show help");

	auto args = cli.parse(argc, argv);

	// --- Initialise logging ----------------------------------------------------
	logger::init(args["verbose"].as<bool>(), "vqlatent");

	if (args.count("help") || argc == 1) {
		std::cout << cli.help() << '\n';
		return 0;
	}

	const bool doTrain = args["train"].as<bool>();
	const bool doSample = args["sample"].as<bool>();
	const bool doReconstruct = args["reconstruct"].as<bool>();
	const bool doInterpolate = args["interpolate"].as<bool>();

	if (int(doTrain) + int(doSample) + int(doReconstruct) + int(doInterpolate) != 1) {
		std::cerr << "Specify exactly one of --train, --sample, --reconstruct or --interpolate\n";
		return 1;
	}

	try {
		config.epochs = args["epochs"].as<int64_t>();
		config.prior_start = args["prior_start"].as<int64_t>();
		config.batch_size = args["batch_size"].as<int64_t>();
		config.learning_rate = args["lr"].as<double>();
		config.num_embeddings = args["num_embeddings"].as<int64_t>();
		config.embedding_dim = args["embedding_dim"].as<int64_t>();
		config.image_size = args["image_size"].as<int64_t>();
		config.num_channels = args["channels"].as<int64_t>();
		config.representation_dim = vqlatent::VQVAEConfig::latentSizeFor(config.image_size);
		config.seed = args["seed"].as<uint64_t>();
		config.use_cuda = args["cuda"].as<bool>();
		config.validate();

		torch::manual_seed(config.seed);
		const torch::Device device = resolveDevice(config.use_cuda);
		logger::info("vqlatent: {} on {}", config.describe(), device.str());

		vqlatent::VQVAE model(config);
		if (args.count("checkpoint") && !doTrain) {
			vqlatent::loadCheckpoint(model, args["checkpoint"].as<std::string>());
		}
		model->to(device);

		if (!doTrain && !args.count("output")) {
			throw std::runtime_error("--output is required");
		}

		if (doTrain) {
			if (!args.count("input") || !args.count("checkpoint")) {
				throw std::runtime_error("Train mode requires --input and --checkpoint");
			}
			const torch::Tensor data = loadTensor(args["input"].as<std::string>());

			vqlatent::Trainer::Options opts;
			opts.reset_dead_codes = args["reset_dead_codes"].as<bool>();
			opts.checkpoint_path = std::filesystem::path(args["checkpoint"].as<std::string>());

			vqlatent::Trainer trainer(model, opts);
			trainer.fit(data);
		} else if (doSample) {
			model->eval();
			const int64_t n = args["count"].as<int64_t>();
			VQLATENT_PROFILE_SCOPE("sample");
			saveTensor(model->sample(n), args["output"].as<std::string>());
		} else if (doReconstruct) {
			if (!args.count("input")) throw std::runtime_error("Reconstruct mode requires --input");
			model->eval();
			torch::NoGradGuard nograd;
			const torch::Tensor x = loadTensor(args["input"].as<std::string>()).to(device);
			const auto out = model->reconstruct(x);
			logger::info("commitment loss {:.5f}, perplexity {:.2f}", out.quant_loss.item<double>(), out.perplexity.item<double>());
			saveTensor(out.reconstruction, args["output"].as<std::string>());
		} else {
			if (!args.count("input") || !args.count("second")) {
				throw std::runtime_error("Interpolate mode requires --input and --second");
			}
			model->eval();
			const torch::Tensor x = loadTensor(args["input"].as<std::string>()).to(device);
			const torch::Tensor y = loadTensor(args["second"].as<std::string>()).to(device);
			saveTensor(model->interpolate(x, y), args["output"].as<std::string>());
		}
	} catch (const std::exception& e) {
		logger::error("{}", e.what());
		return 1;
	}

	return 0;
}
