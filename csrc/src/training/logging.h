// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_TRAINING_LOGGING_H
#define MOESHARD_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @brief Run log for MoE layers.
 *
 * Rank 0 writes a JSON array with one object per line; every record carries
 * "log", "time" and "step" fields. Human-readable output goes to stdout
 * depending on the verbosity. Other ranks accept all calls and do nothing.
 */
class MoERunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    using OptionValue = std::variant<bool, std::int64_t, float, std::string>;

    //! An empty @p file_name disables the file; the callback still sees every line.
    MoERunLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~MoERunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options);
    void log_message(int step, const std::string& msg);

    /// Router health of one layer for one forward pass.
    void log_moe_stats(int step, std::string_view layer, float aux_loss, float z_loss,
                       float expert_utilization, float load_imbalance);

    /// Per-expert token counts of the current balancing window.
    void log_token_dist(int step, std::string_view layer, const std::vector<long>& expert_loads,
                        const std::vector<long>& rank_loads, float imbalance);

    void log_rebalance(int step, std::string_view layer, std::string_view policy, bool applied,
                       float ratio_before, float ratio_after, int migrated_experts, std::uint64_t table_version);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(MoERunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        MoERunLogger* mLogger;

        friend class MoERunLogger;
    };

    RAII_Section log_section_start(int step, const std::string& info);
    void log_section_end();

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    int mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //MOESHARD_TRAINING_LOGGING_H
