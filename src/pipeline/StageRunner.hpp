#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <plog/Log.h>

namespace pipeline
{

// Result wrapper shared by timed pipeline stages
template<typename T>
struct StageResult
{
    T result{};
    bool succeeded = true;
    std::optional<std::string> error;
    std::chrono::microseconds duration{ 0 };
    std::string stage_name;

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name)
    {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name)
    {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

// Runs a stage (callable returning T), measuring its duration and turning a
// thrown std::exception into a failed StageResult.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_DEBUG << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_ERROR << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace pipeline
