#pragma once

#include "TextProcessingTypes.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/Profile.hpp"

namespace processing {

// Utility to run a stage (callable returning T) and produce text_processing::StageResult<T>
// Measures duration and logs errors. Keeps stages consistent for pipeline tracing.
template<typename T, typename Fn>
text_processing::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = steady_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_VERBOSE << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        return text_processing::StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_DEBUG << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        return text_processing::StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace processing
