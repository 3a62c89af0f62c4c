// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <numeric>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <fmt/ranges.h>

// Only rank 0 opens the file; it starts out as an empty JSON array.
MoERunLogger::MoERunLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        const auto dir = std::filesystem::path(mFileName).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }
        mLogFile.open(mFileName, std::fstream::out);
        mLogFile << "[\n\n]\n";
    }
}

MoERunLogger::~MoERunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void MoERunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

void MoERunLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::vector<std::string> quoted;
    quoted.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        quoted.push_back(fmt::format("\"{}\"", argv[i]));
    }
    log_line(fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [{}]}})",
                         std::chrono::system_clock::now(), fmt::join(quoted, ", ")));
}

//! One "option" record per entry; printed as an aligned table unless silent.
void MoERunLogger::log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options) {
    if(mRank != 0) return;

    std::size_t width = 0;
    for(const auto& entry : options) {
        width = std::max(width, entry.first.size());
    }

    if(mVerbosity >= 0) {
        printf("[Options]\n");
    }
    for(const auto& [name, value] : options) {
        auto log = [&, name = name](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": "{}"}})",
                                     std::chrono::system_clock::now(), name, v));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if(mVerbosity >= 0) {
                printf("  %-*s : %s\n", static_cast<int>(width), std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
    if(mVerbosity >= 0) {
        printf("\n");
    }
}

void MoERunLogger::log_message(int step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        printf("%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": "{}"}})",
                         std::chrono::system_clock::now(), step, msg));
}

void MoERunLogger::log_moe_stats(int step, std::string_view layer, float aux_loss, float z_loss,
                                 float expert_utilization, float load_imbalance)
{
    if (mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "moe", "time": "{}", "step": {}, "layer": "{}", "aux_loss": {:.6f}, "z_loss": {:.6f}, "expert_utilization": {:.4f}, "load_imbalance": {:.4f}}})",
        std::chrono::system_clock::now(), step, layer, aux_loss, z_loss, expert_utilization, load_imbalance));
    if(mVerbosity >= 1) {
        printf("[M] step %5d [%s] | aux %.5f | z %.5f | util %5.1f%% | imbalance %.3f\n",
               step, std::string(layer).c_str(), aux_loss, z_loss, 100.f * expert_utilization, load_imbalance);
    }
}

// Prints the first 16 experts unless verbose.
void MoERunLogger::log_token_dist(int step, std::string_view layer, const std::vector<long>& expert_loads,
                                  const std::vector<long>& rank_loads, float imbalance)
{
    if (mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "token_dist", "time": "{}", "step": {}, "layer": "{}", "experts": [{}], "ranks": [{}], "imbalance": {:.4f}}})",
        std::chrono::system_clock::now(), step, layer, fmt::join(expert_loads, ", "), fmt::join(rank_loads, ", "), imbalance));

    if(mVerbosity >= 0) {
        const long total = std::accumulate(expert_loads.begin(), expert_loads.end(), 0L);
        printf("[D] step %5d [%s] | %ld tokens | rank imbalance %.3f\n",
               step, std::string(layer).c_str(), total, imbalance);
        for (std::size_t e = 0; e < expert_loads.size(); ++e) {
            if (e < 16 || mVerbosity >= 1) {
                const float share = total > 0 ? 100.f * static_cast<float>(expert_loads[e]) / static_cast<float>(total) : 0.f;
                printf("   expert %3zu : %8ld (%5.1f%%)\n", e, expert_loads[e], share);
            }
        }
    }
}

void MoERunLogger::log_rebalance(int step, std::string_view layer, std::string_view policy, bool applied,
                                 float ratio_before, float ratio_after, int migrated_experts, std::uint64_t table_version)
{
    if (mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "rebalance", "time": "{}", "step": {}, "layer": "{}", "policy": "{}", "applied": {}, "ratio_before": {:.4f}, "ratio_after": {:.4f}, "migrated": {}, "version": {}}})",
        std::chrono::system_clock::now(), step, layer, policy, applied, ratio_before, ratio_after, migrated_experts, table_version));
    if(mVerbosity >= 0) {
        printf("[B] step %5d [%s] | %-9s | %s | ratio %.3f -> %.3f | %d experts moved | table v%llu\n",
               step, std::string(layer).c_str(), std::string(policy).c_str(), applied ? "applied" : "skipped",
               ratio_before, ratio_after, migrated_experts, static_cast<unsigned long long>(table_version));
    }
}

// The file stays a valid JSON array after every record: the closing "\n]\n"
// is overwritten by the next entry.
void MoERunLogger::log_line(std::string_view line) {
    if(mCallback) {
        mCallback(line);
    }
    if(!mLogFile.is_open()) return;

    mLogFile.seekp(-3, std::ios::end);
    mLogFile << (mFirst ? "" : ",\n") << line << "\n]" << std::endl;
    mFirst = false;
}

MoERunLogger::RAII_Section MoERunLogger::log_section_start(int step, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

void MoERunLogger::log_section_end() {
    if(mRank != 0) return;
    const long elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - mSectionStart).count();
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": "{}", "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, mSectionInfo, elapsed_ms));

    if(mVerbosity >= 0) {
        if(elapsed_ms < 2000) {
            printf("  done in %ld ms\n\n", elapsed_ms);
        } else {
            printf("  done in %.1f s\n\n", static_cast<double>(elapsed_ms) / 1000.0);
        }
    }
}
