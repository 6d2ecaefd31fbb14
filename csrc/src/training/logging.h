// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_TRAINING_LOGGING_H
#define LOWBIT_SRC_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lowbit {

/**
 * @brief Run log of an optimizer: a JSON array on disk plus console progress lines.
 *
 * Every record is one JSON object per line. The file is valid JSON after each record.
 */
class RunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    using OptionValue = std::variant<bool, std::int64_t, float, std::string>;

    //! An empty @p file_name disables the file; console output and the callback still work.
    RunLogger(const std::string& file_name, EVerbosity verbosity);
    ~RunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options);
    void log_step(int step, int duration_ms, float gnorm, float clip_value, float gnorm_scale, float lr);
    void log_abs_maxes(int step, const std::vector<std::pair<std::string, float>>& abs_maxes);
    void log_message(int step, const std::string& msg);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(RunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        RunLogger* mLogger;

        friend class RunLogger;
    };

    RAII_Section log_section_start(int step, const std::string& info);
    void log_section_end();

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    EVerbosity mVerbosity;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    int mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

} // namespace lowbit

#endif //LOWBIT_SRC_TRAINING_LOGGING_H
