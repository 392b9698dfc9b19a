#include "tradecore/IndicatorEngine.hpp"

#include "tradecore/IndicatorLibrary.hpp"
#include "tradecore/Logger.hpp"

#include <future>
#include <optional>
#include <utility>

namespace tradecore {

std::vector<IndicatorResult> IndicatorEngine::compute(
    const BarSeries& bars,
    const std::vector<IndicatorRequest>& requests,
    ExecutionOptions options) const
{
    std::vector<IndicatorResult> results(requests.size());

    if (options.parallel && requests.size() > 1) {
        std::vector<std::future<void>> tasks;
        tasks.reserve(requests.size());
        for (std::size_t i = 0; i < requests.size(); ++i) {
            tasks.emplace_back(std::async(std::launch::async, [&, i]() {
                results[i] = compute_indicator(bars, requests[i]);
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    } else {
        for (std::size_t i = 0; i < requests.size(); ++i) {
            results[i] = compute_indicator(bars, requests[i]);
        }
    }

    for (const auto& result : results) {
        if (!result.success) {
            Logger::warning("IndicatorEngine", result.name + ": " + result.error_message);
        }
    }

    return results;
}

std::vector<IndicatorResult> IndicatorEngine::compute(
    const BarSeries& bars,
    const std::vector<IndicatorDefinition>& definitions,
    ExecutionOptions options) const
{
    std::vector<IndicatorRequest> requests;
    std::vector<std::optional<IndicatorResult>> failures(definitions.size());
    std::vector<std::size_t> slots;
    requests.reserve(definitions.size());
    slots.reserve(definitions.size());

    for (std::size_t i = 0; i < definitions.size(); ++i) {
        IndicatorRequest request;
        std::string error;
        if (IndicatorConfigParser::to_request(definitions[i], &request, &error)) {
            requests.push_back(std::move(request));
            slots.push_back(i);
        } else {
            IndicatorResult failed;
            failed.name = definitions[i].variable_name;
            failed.success = false;
            failed.error_message = error;
            Logger::warning("IndicatorEngine", failed.name + ": " + error);
            failures[i] = std::move(failed);
        }
    }

    auto computed = compute(bars, requests, options);

    std::vector<IndicatorResult> results(definitions.size());
    for (std::size_t k = 0; k < slots.size(); ++k) {
        results[slots[k]] = std::move(computed[k]);
    }
    for (std::size_t i = 0; i < definitions.size(); ++i) {
        if (failures[i]) {
            results[i] = std::move(*failures[i]);
        }
    }
    return results;
}

} // namespace tradecore
