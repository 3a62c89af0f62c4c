// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "config/moe_config.h"
#include "modules/moe/moe_layer.h"
#include "modules/moe/moe_registry.h"
#include "runtime/optimizers/expert_optimizer_state.h"
#include "training/logging.h"
#include "utilities/comm.h"
#include "utilities/errors.h"
#ifdef MOESHARD_WITH_NCCL
#include "utilities/nccl_comm.h"
#endif

namespace {

/**
 * @brief Draw a synthetic token batch whose routing is skewed toward low expert ids.
 *
 * Each token is aimed at one "target" expert drawn from p(e) ~ 1 / (e + 1)^skew:
 * the token is Gaussian noise plus a multiple of that expert's gate row, which
 * makes the target expert's routing logit dominate.
 */
HostTensor make_skewed_batch(const modules::TopKRouter& router, int num_tokens, float skew, std::mt19937& gen) {
    const int E = router.config().num_experts;
    const int H = router.config().hidden_size;
    const float* gate = router.gate().get<float>();

    std::vector<double> weights(E);
    for (int e = 0; e < E; ++e) {
        weights[e] = 1.0 / std::pow(static_cast<double>(e + 1), static_cast<double>(skew));
    }
    std::discrete_distribution<int> pick(weights.begin(), weights.end());
    std::normal_distribution<float> noise(0.f, 1.f);

    HostTensor batch(ETensorDType::FP32, {num_tokens, H});
    float* x = batch.get<float>();
    for (int t = 0; t < num_tokens; ++t) {
        const int target = pick(gen);
        const float* g = gate + static_cast<std::size_t>(target) * H;
        float norm2 = 0.f;
        for (int h = 0; h < H; ++h) norm2 += g[h] * g[h];
        const float scale = norm2 > 0.f ? 4.f / norm2 : 0.f;
        for (int h = 0; h < H; ++h) {
            x[static_cast<std::size_t>(t) * H + h] = 0.1f * noise(gen) + scale * g[h];
        }
    }
    return batch;
}

} // namespace

/**
 * @brief Expert-parallel MoE simulation: builds a stack of MoE layers on every
 * worker, feeds skewed batches and runs the load-balancing hooks on a schedule.
 *
 * "Parameters" are stored as public fields so CLI11 can bind options directly.
 */
struct SimulationRunner {
    /// Number of in-process workers (or GPUs with --nccl).
    int NRanks = 2;
    /// Use NCCL over local GPUs instead of in-process host workers.
    bool UseNCCL = false;
    /// Number of MoE layers in the stack.
    int NumLayers = 2;
    /// Number of forward passes.
    int Steps = 20;
    /// Print the token distribution every n steps (0 = never).
    int DistEvery = 10;
    /// Tokens per worker per step.
    int TokensPerRank = 64;
    /// Exponent of the expert popularity distribution (0 = uniform).
    float Skew = 1.2f;
    /// Seed for the synthetic data.
    int DataSeed = 1234;

    /// Optional JSON layer configuration; replaces the layer options below.
    std::string ConfigFile;
    /// JSON log output.
    std::string LogFile = "logs/moeshard.json";
    int Verbosity = MoERunLogger::DEFAULT;

    MoELayerConfig Layer;
    int BalanceInterval = 5;
    std::string Activation = "swiglu";
    std::string Policy = "placement";

    void load_config(int argc, const char** argv);
    void run(int argc, const char** argv);

private:
    void run_worker(Communicator& comm, int argc, const char** argv);
};

void SimulationRunner::load_config(int argc, const char** argv) {
    CLI::App app{"Expert-parallel dropless MoE simulation"};

    Layer.hidden_size = 64;
    Layer.ffn_hidden_size = 128;
    Layer.num_experts = 8;
    Layer.top_k = 2;

    app.add_option("--ranks", NRanks, "Number of workers")->check(CLI::PositiveNumber);
    app.add_flag("--nccl", UseNCCL, "Run one worker per local GPU and communicate through NCCL");
    app.add_option("--layers", NumLayers, "Number of MoE layers")->check(CLI::PositiveNumber);
    app.add_option("--steps", Steps, "Number of forward passes")->check(CLI::NonNegativeNumber);
    app.add_option("--dist-every", DistEvery, "Print the token distribution every n steps (0 = never)")->check(CLI::NonNegativeNumber);
    app.add_option("--tokens", TokensPerRank, "Tokens per worker per step")->check(CLI::NonNegativeNumber);
    app.add_option("--skew", Skew, "Expert popularity exponent (0 = uniform)")->check(CLI::NonNegativeNumber);
    app.add_option("--data-seed", DataSeed, "Seed for the synthetic batches");
    app.add_option("--log-file", LogFile, "Where to save the run log");
    app.add_flag_function("-v,--verbose", [this](std::int64_t) { Verbosity = MoERunLogger::VERBOSE; }, "Verbose output");
    app.add_flag_function("-q,--quiet", [this](std::int64_t) { Verbosity = MoERunLogger::QUIET; }, "Only print errors and rebalancing summaries");

    auto config_opt = app.add_option("--config", ConfigFile, "JSON file with the MoE layer configuration")->check(CLI::ExistingFile);
    std::vector<CLI::Option*> layer_opts;
    layer_opts.push_back(app.add_option("--num-experts", Layer.num_experts, "Number of experts per layer")->check(CLI::PositiveNumber));
    layer_opts.push_back(app.add_option("--top-k", Layer.top_k, "Experts per token")->check(CLI::PositiveNumber));
    layer_opts.push_back(app.add_option("--hidden", Layer.hidden_size, "Hidden size")->check(CLI::PositiveNumber));
    layer_opts.push_back(app.add_option("--ffn", Layer.ffn_hidden_size, "Expert intermediate size")->check(CLI::PositiveNumber));
    layer_opts.push_back(app.add_option("--activation", Activation, "Expert activation")
        ->check(CLI::IsMember({"swiglu", "gelu", "relu", "identity"}, CLI::ignore_case)));
    layer_opts.push_back(app.add_flag("--expert-bias", Layer.add_bias, "Experts add an output bias"));
    layer_opts.push_back(app.add_flag("--grouped-gemm,!--sequential", Layer.grouped_gemm, "Grouped or per-expert execution"));
    layer_opts.push_back(app.add_option("--ep-size", Layer.ep_size, "Expert-parallel group size (default: all ranks)")->check(CLI::PositiveNumber));
    layer_opts.push_back(app.add_option("--balance-interval", BalanceInterval, "Rebalance every n steps (0 = disabled)")->check(CLI::NonNegativeNumber));
    layer_opts.push_back(app.add_option("--balance-window", Layer.balance_window, "Forward passes in the load window")->check(CLI::PositiveNumber));
    layer_opts.push_back(app.add_option("--policy", Policy, "Balancing policy")
        ->check(CLI::IsMember({"placement", "router_bias"}, CLI::ignore_case)));
    layer_opts.push_back(app.add_option("--threshold", Layer.improvement_threshold, "Minimum load ratio improvement for migration")->check(CLI::NonNegativeNumber));
    layer_opts.push_back(app.add_option("--bias-rate", Layer.bias_update_rate, "Router bias update rate")->check(CLI::NonNegativeNumber));
    layer_opts.push_back(app.add_option("--seed", Layer.seed, "Parameter seed"));
    for (CLI::Option* opt : layer_opts) {
        opt->excludes(config_opt);
    }

    Layer.ep_size = -1;
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!ConfigFile.empty()) {
        Layer = load_moe_config(ConfigFile);
        if (!Layer.load_balance_interval) {
            DistEvery = 0;
        }
        return;
    }

    Layer.activation = modules::activation_from_str(Activation);
    Layer.balance_policy = balance_policy_from_str(Policy);
    if (BalanceInterval > 0) {
        Layer.load_balance_interval = BalanceInterval;
    } else {
        Layer.load_balance_interval.reset();
    }
    if (Layer.ep_size < 0) {
        Layer.ep_size = NRanks;
    }
    Layer.validate();
}

void SimulationRunner::run_worker(Communicator& comm, int argc, const char** argv) {
    MoERunLogger logger(LogFile, comm.rank(), static_cast<MoERunLogger::EVerbosity>(Verbosity));
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"ranks", static_cast<std::int64_t>(comm.world_size())},
        {"layers", static_cast<std::int64_t>(NumLayers)},
        {"steps", static_cast<std::int64_t>(Steps)},
        {"tokens_per_rank", static_cast<std::int64_t>(TokensPerRank)},
        {"skew", Skew},
        {"num_experts", static_cast<std::int64_t>(Layer.num_experts)},
        {"top_k", static_cast<std::int64_t>(Layer.top_k)},
        {"hidden_size", static_cast<std::int64_t>(Layer.hidden_size)},
        {"ffn_hidden_size", static_cast<std::int64_t>(Layer.ffn_hidden_size)},
        {"activation", std::string(modules::activation_to_str(Layer.activation))},
        {"grouped_gemm", Layer.grouped_gemm},
        {"ep_size", static_cast<std::int64_t>(Layer.ep_size)},
        {"load_balance_interval", static_cast<std::int64_t>(Layer.load_balance_interval.value_or(0))},
        {"balance_policy", std::string(balance_policy_to_str(Layer.balance_policy))},
    });

    std::unique_ptr<Communicator> ep_comm = comm.split_ep_group(Layer.ep_size);

    std::vector<std::unique_ptr<modules::MoELayer>> layers;
    std::vector<optimizers::ExpertOptimizerState> optim_states;
    modules::MoELayerRegistry registry;
    {
        auto section = logger.log_section_start(0, fmt::format("Building {} MoE layers", NumLayers));
        for (int l = 0; l < NumLayers; ++l) {
            MoELayerConfig cfg = Layer;
            cfg.seed = Layer.seed + 1000ull * l;
            layers.push_back(std::make_unique<modules::MoELayer>(cfg, *ep_comm, &logger, fmt::format("layer{}", l)));
            registry.add(*layers.back());
            optim_states.push_back(layers.back()->make_optimizer_state());
        }
    }
    std::vector<optimizers::ExpertOptimizerState*> optimizers;
    for (auto& s : optim_states) optimizers.push_back(&s);

    std::mt19937 gen(static_cast<unsigned>(DataSeed + 7919 * comm.rank()));
    auto section = logger.log_section_start(0, fmt::format("Running {} steps", Steps));
    for (int step = 0; step < Steps; ++step) {
        HostTensor x = make_skewed_batch(layers.front()->router(), TokensPerRank, Skew, gen);
        for (auto& layer : layers) {
            modules::MoELayerOutput out = layer->forward(x);
            // residual connection keeps the next layer's input on the same scale
            float* y = out.output.get<float>();
            const float* r = x.get<float>();
            for (std::size_t i = 0; i < out.output.nelem(); ++i) {
                y[i] += r[i];
            }
            if (out.bias.has_value()) {
                const float* b = out.bias.get<float>();
                for (std::size_t i = 0; i < out.output.nelem(); ++i) {
                    y[i] += b[i];
                }
            }
            x = std::move(out.output);
        }
        modules::log_moe_stats(registry, step);

        if (DistEvery > 0 && (step + 1) % DistEvery == 0) {
            modules::print_token_dist(registry, step);
        }
        if (Layer.load_balance_interval && (step + 1) % *Layer.load_balance_interval == 0) {
            for (auto& s : optim_states) s.set_step(step + 1);
            modules::apply_load_balance(registry, optimizers, step);
        }
    }
}

void SimulationRunner::run(int argc, const char** argv) {
    auto work = [&](Communicator& comm) { run_worker(comm, argc, argv); };
    if (UseNCCL) {
#ifdef MOESHARD_WITH_NCCL
        NCCLCommunicator::run_communicators(NRanks, work);
#else
        throw std::runtime_error("--nccl requested, but this build has no NCCL support");
#endif
    } else {
        Communicator::run_communicators(NRanks, work);
    }
}

/**
 * @brief Program entry point. Parses CLI args and launches the simulation.
 *
 * @return 0 on success; nonzero on failure (errors are printed to stderr).
 */
int main(int argc, const char** argv) {
    try {
        SimulationRunner runner;
        runner.load_config(argc, argv);
        runner.run(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
