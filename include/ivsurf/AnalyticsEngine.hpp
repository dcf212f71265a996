#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ThreadPool.hpp"
#include "../utils/Timer.hpp"
#include "ImpliedVolatility.hpp"
#include "ModelFactory.hpp"
#include "PricingModel.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

namespace ivsurf {

struct AnalyticsConfiguration {
    ModelChoice model = ModelChoice::AUTO;
    std::size_t binomial_steps = 500;
    SolverConfiguration solver;
    bool enable_multithreading = true;
    std::size_t thread_pool_size = utils::default_thread_count();
    std::size_t parallel_threshold = 100;
};

// Chain-level analytics: prices contracts, recovers implied volatilities and
// computes Greeks at the recovered volatility, fanning large batches out over
// a thread pool. Only the performance counters are shared between workers.
class AnalyticsEngine {
public:
    using Configuration = AnalyticsConfiguration;

    AnalyticsEngine()
        : AnalyticsEngine(AnalyticsConfiguration{}) {}

    explicit AnalyticsEngine(const AnalyticsConfiguration& config)
        : config_(config),
          european_model_(make_model(config.model, ExerciseStyle::EUROPEAN, config.binomial_steps)),
          american_model_(make_model(config.model, ExerciseStyle::AMERICAN, config.binomial_steps)),
          solver_(config.solver) {

        IVSURF_LOG_DEBUG("analytics_engine", "models: european=" << european_model_->name()
                         << " american=" << american_model_->name());
    }

    const AnalyticsConfiguration& configuration() const noexcept {
        return config_;
    }

    const PricingModel& model_for(const OptionContractSpec& option) const noexcept {
        return option.exercise_style() == ExerciseStyle::AMERICAN ? *american_model_ : *european_model_;
    }

    PricingResult price_option(const OptionContractSpec& option, const MarketState& market, double vol) {
        PricingResult result = model_for(option).evaluate(option, market, vol);
        update_performance_metrics(result.computation_time);
        return result;
    }

    std::vector<PricingResult> price_chain(
        const std::vector<OptionContractSpec>& options,
        const std::vector<MarketState>& markets,
        const std::vector<double>& vols) {

        if (options.size() != markets.size() || options.size() != vols.size()) {
            throw InvalidInput("price_chain", "contract, market and volatility vectors must have the same size");
        }

        std::vector<std::size_t> indices(options.size());
        std::iota(indices.begin(), indices.end(), std::size_t{0});

        return utils::ParallelExecutor::parallel_transform(
            indices,
            [this, &options, &markets, &vols](std::size_t i) { return price_option(options[i], markets[i], vols[i]); },
            threads_for(options.size()));
    }

    ImpliedVolatilityResult implied_volatility(const OptionQuote& quote) {
        utils::HighResolutionTimer timer;
        const auto result = solver_.solve(quote, model_for(quote.spec()));
        record_solve(result, timer.elapsed());

        if (!result.converged) {
            IVSURF_LOG_WARN("analytics_engine", "implied volatility failed for " << describe(quote)
                            << ": " << to_string(result.status) << ", residual " << result.residual);
        }
        return result;
    }

    // Solves and, when converged, reprices and computes Greeks at the implied
    // volatility for one quote.
    AnalyticsRecord analyze_quote(const OptionQuote& quote) {
        utils::HighResolutionTimer timer;
        const PricingModel& model = model_for(quote.spec());

        AnalyticsRecord record(quote, solver_.solve(quote, model));
        if (record.iv.converged) {
            const double vol = record.iv.implied_volatility;
            record.greeks = model.greeks(quote.spec(), quote.market(), vol);
            record.reprice_error = model.price(quote.spec(), quote.market(), vol) - quote.market_price();
        }

        record_solve(record.iv, timer.elapsed());
        return record;
    }

    std::vector<AnalyticsRecord> analyze_chain(const std::vector<OptionQuote>& quotes) {
        return analyze_chain_until(quotes, nullptr);
    }

    // Once `cancel` is raised the remaining quotes are skipped; the records
    // already computed are returned in input order.
    std::vector<AnalyticsRecord> analyze_chain(const std::vector<OptionQuote>& quotes,
                                               const std::atomic<bool>& cancel) {
        return analyze_chain_until(quotes, &cancel);
    }

    static std::vector<IvObservation> observations(const std::vector<AnalyticsRecord>& records) {
        std::vector<IvObservation> result;
        result.reserve(records.size());
        for (const auto& record : records) {
            result.emplace_back(record.quote, record.iv);
        }
        return result;
    }

    PerformanceMetrics performance_metrics() const {
        std::lock_guard<std::mutex> lock(performance_mutex_);
        return performance_metrics_;
    }

    void reset_performance_metrics() {
        std::lock_guard<std::mutex> lock(performance_mutex_);
        performance_metrics_.reset();
    }

private:
    AnalyticsConfiguration config_;
    std::unique_ptr<PricingModel> european_model_;
    std::unique_ptr<PricingModel> american_model_;
    ImpliedVolatilitySolver solver_;

    mutable std::mutex performance_mutex_;
    PerformanceMetrics performance_metrics_;

    std::size_t threads_for(std::size_t batch_size) const noexcept {
        if (config_.enable_multithreading && batch_size > config_.parallel_threshold) {
            return config_.thread_pool_size;
        }
        return 1;
    }

    std::vector<AnalyticsRecord> analyze_chain_until(const std::vector<OptionQuote>& quotes,
                                                     const std::atomic<bool>* cancel) {
        utils::HighResolutionTimer timer;
        const std::size_t threads = threads_for(quotes.size());

        auto slots = utils::ParallelExecutor::parallel_transform_until(
            quotes, [this](const OptionQuote& quote) { return analyze_quote(quote); }, cancel, threads);

        std::vector<AnalyticsRecord> records;
        records.reserve(slots.size());
        std::size_t failed = 0;
        for (auto& slot : slots) {
            if (slot) {
                failed += slot->iv.converged ? 0 : 1;
                records.push_back(std::move(*slot));
            }
        }

        IVSURF_LOG_INFO("analytics_engine", "analyzed " << records.size() << "/" << quotes.size()
                        << " quotes on " << threads << " thread(s) in " << timer.elapsed_microseconds() << " us");
        if (records.size() < quotes.size()) {
            IVSURF_LOG_INFO("analytics_engine", "batch cancelled, " << quotes.size() - records.size()
                            << " quotes skipped");
        }
        if (failed > 0) {
            IVSURF_LOG_WARN("analytics_engine", failed << " implied volatility solves did not converge");
        }

        return records;
    }

    void record_solve(const ImpliedVolatilityResult& result, std::chrono::nanoseconds elapsed) {
        std::lock_guard<std::mutex> lock(performance_mutex_);
        performance_metrics_.update(elapsed);
        if (!result.converged) {
            ++performance_metrics_.failed_solves;
        }
    }

    void update_performance_metrics(std::chrono::nanoseconds computation_time) {
        std::lock_guard<std::mutex> lock(performance_mutex_);
        performance_metrics_.update(computation_time);
    }

    static std::string describe(const OptionQuote& quote) {
        if (!quote.contract_symbol().empty()) {
            return quote.contract_symbol();
        }
        return std::string(to_string(quote.spec().type())) + " K=" + std::to_string(quote.spec().strike()) +
               " T=" + std::to_string(quote.spec().time_to_expiry());
    }
};

}
