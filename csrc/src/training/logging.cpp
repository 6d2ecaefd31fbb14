// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

namespace lowbit {

namespace {

//! JSON string literal (quoted and escaped) for free-form text.
std::string json_string(std::string_view text) {
    return nlohmann::json(std::string(text)).dump();
}

} // namespace

/**
 * @brief Create a logger that writes a JSON array to @p file_name.
 *
 * Ensures the parent directory exists, opens the file for output,
 * and initializes it as an empty JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty to disable the file.
 * @param verbosity Verbosity level controlling stdout printing.
 */
RunLogger::RunLogger(const std::string& file_name, EVerbosity verbosity) :
    mFileName(file_name), mVerbosity(verbosity)
{
    if(!mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw std::runtime_error(fmt::format("could not open log file {}", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

RunLogger::~RunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

/**
 * @brief Log configuration options.
 *
 * Each option is written as a JSON log line and, when verbose, printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void RunLogger::log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options) {
    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, json_string(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if(mVerbosity >= VERBOSE) {
                fmt::print("  {:>20}: {}\n", name, v);
            }
        };
        std::visit(log, value);
    }
}

/**
 * @brief Log one optimizer step.
 *
 * @param step Step index (1-based).
 * @param duration_ms Wall time of the step.
 * @param gnorm Gradient norm before clipping (0 when clipping is off).
 * @param clip_value Clip threshold from the norm history.
 * @param gnorm_scale Multiplier applied to the gradient.
 * @param lr Learning rate for this step.
 */
void RunLogger::log_step(int step, int duration_ms, float gnorm, float clip_value, float gnorm_scale, float lr)
{
    if(mVerbosity >= DEFAULT) {
        const char clip_flag = gnorm_scale < 1.0f ? '!' : ' ';
        printf(":: step %7d | norm %c%9.4f | clip %9.4f | lr %.3e | %5d ms\n",
               step, clip_flag, gnorm, clip_value, lr, duration_ms);
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "duration_ms": {}, "gnorm": {}, "clip": {}, "scale": {}, "lr": {}}})",
        std::chrono::system_clock::now(), step, duration_ms, gnorm, clip_value, gnorm_scale, lr));
}

void RunLogger::log_abs_maxes(int step, const std::vector<std::pair<std::string, float>>& abs_maxes) {
    std::string abs_maxes_str = "[\n          ";
    int count = 0;
    for (auto& [name, max]: abs_maxes) {
        if (count != 0) abs_maxes_str += ", ";
        ++count;
        if (count % 10 == 0) {
            abs_maxes_str += "\n          ";
        }
        abs_maxes_str += fmt::format(R"({{"name": {}, "value": {}}})", json_string(name), max);
    }
    abs_maxes_str += "]";

    if (mVerbosity >= VERBOSE) {
        printf("[Abs Maxes]\n");
        for (auto& [name, max]: abs_maxes) {
            printf("  %24s: %10.4f \n", name.c_str(), max);
        }
        printf("\n");
    }

    std::string line = fmt::format(R"(  {{"log": "abs-maxes", "time": "{}", "step": {}, "abs_maxes": {}}})",
        std::chrono::system_clock::now(), step, abs_maxes_str);
    log_line(line);
}

/**
 * @brief Set a callback invoked for each JSON log line before file append.
 *
 * @param cb Callback taking the JSON line as a string_view; may be empty/null.
 */
void RunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

void RunLogger::log_message(int step, const std::string& msg) {
    if(mVerbosity >= DEFAULT) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, json_string(msg)));
}

/**
 * @brief Begin a timed logging section.
 *
 * Stores section metadata in the logger and returns an RAII handle that will
 * call log_section_end() on destruction.
 */
RunLogger::RAII_Section RunLogger::log_section_start(int step, const std::string& info) {
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= DEFAULT) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

/**
 * @brief End the current timed section and emit its duration.
 */
void RunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, json_string(mSectionInfo), milliseconds));

    if(mVerbosity >= DEFAULT) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}

/**
 * @brief Append one JSON object line to the log array.
 *
 * Rewrites the closing "\n]\n" so the file stays a valid JSON array, inserting a
 * separator comma before every object except the first.
 *
 * @param line JSON object line to append.
 */
void RunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open())
        return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

} // namespace lowbit
