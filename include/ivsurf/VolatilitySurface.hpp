#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../math/Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace ivsurf {

struct SurfaceParameters {
    double expiry_tolerance = 1e-9;
    double strike_tolerance = 1e-9;
    bool include_non_converged = false;
    std::optional<OptionType> type_filter;
};

// Groups per-contract implied volatilities into plot-ready series. Every
// series is rebuilt from the full set of observations on each call.
class VolatilitySurfaceBuilder {
public:
    using Parameters = SurfaceParameters;

    VolatilitySurfaceBuilder()
        : VolatilitySurfaceBuilder(SurfaceParameters{}) {}

    explicit VolatilitySurfaceBuilder(const SurfaceParameters& params)
        : params_(params) {
        detail::require_non_negative("expiry_tolerance", params_.expiry_tolerance);
        detail::require_non_negative("strike_tolerance", params_.strike_tolerance);
    }

    const SurfaceParameters& parameters() const noexcept {
        return params_;
    }

    // IV by strike for one expiry.
    SurfaceSeries build_smile(const std::vector<IvObservation>& observations, double expiry) const {
        SurfaceSeries series = make_series(SeriesKind::SMILE, expiry);

        for (const auto& obs : observations) {
            if (accepts(obs) && within(obs.quote.spec().time_to_expiry(), expiry, params_.expiry_tolerance)) {
                series.points.emplace_back(obs.quote.spec().strike(), obs.result.implied_volatility,
                                           obs.result.converged);
            }
        }

        sort_points(series);
        return series;
    }

    // IV by expiry for one strike.
    SurfaceSeries build_term_structure(const std::vector<IvObservation>& observations, double strike) const {
        SurfaceSeries series = make_series(SeriesKind::TERM_STRUCTURE, strike);

        for (const auto& obs : observations) {
            if (accepts(obs) && within(obs.quote.spec().strike(), strike, params_.strike_tolerance)) {
                series.points.emplace_back(obs.quote.spec().time_to_expiry(), obs.result.implied_volatility,
                                           obs.result.converged);
            }
        }

        sort_points(series);
        return series;
    }

    // IV by expiry at a fixed moneyness K/S: per expiry, the contract whose
    // moneyness is nearest the target within +/- half_width.
    SurfaceSeries build_term_structure_by_moneyness(
        const std::vector<IvObservation>& observations,
        double target_moneyness,
        double half_width) const {

        detail::require_positive("target_moneyness", target_moneyness);
        detail::require_non_negative("half_width", half_width);

        struct Candidate {
            double expiry;
            double distance;
            const IvObservation* observation;
        };

        std::vector<Candidate> nearest;

        for (const auto& obs : observations) {
            if (!accepts(obs)) {
                continue;
            }

            const double distance = std::abs(moneyness(obs.quote.spec(), obs.quote.market()) - target_moneyness);
            if (distance > half_width) {
                continue;
            }

            const double expiry = obs.quote.spec().time_to_expiry();
            auto slot = std::find_if(nearest.begin(), nearest.end(), [&](const Candidate& c) {
                return within(c.expiry, expiry, params_.expiry_tolerance);
            });

            if (slot == nearest.end()) {
                nearest.push_back({expiry, distance, &obs});
            } else if (distance < slot->distance) {
                *slot = {expiry, distance, &obs};
            }
        }

        SurfaceSeries series = make_series(SeriesKind::TERM_STRUCTURE, target_moneyness);
        for (const auto& c : nearest) {
            series.points.emplace_back(c.expiry, c.observation->result.implied_volatility,
                                       c.observation->result.converged);
        }

        sort_points(series);
        return series;
    }

    // Mean IV per expiry over contracts with K/S strictly inside (1 - band, 1 + band).
    SurfaceSeries build_atm_term_structure(const std::vector<IvObservation>& observations, double band = 0.1) const {
        detail::require_positive("band", band);

        struct Bucket {
            double expiry;
            std::vector<double> vols;
            bool all_converged;
        };

        std::vector<Bucket> buckets;

        for (const auto& obs : observations) {
            if (!accepts(obs)) {
                continue;
            }

            const double m = moneyness(obs.quote.spec(), obs.quote.market());
            if (!(m > 1.0 - band && m < 1.0 + band)) {
                continue;
            }

            const double expiry = obs.quote.spec().time_to_expiry();
            auto bucket = std::find_if(buckets.begin(), buckets.end(), [&](const Bucket& b) {
                return within(b.expiry, expiry, params_.expiry_tolerance);
            });

            if (bucket == buckets.end()) {
                buckets.push_back({expiry, {obs.result.implied_volatility}, obs.result.converged});
            } else {
                bucket->vols.push_back(obs.result.implied_volatility);
                bucket->all_converged = bucket->all_converged && obs.result.converged;
            }
        }

        SurfaceSeries series = make_series(SeriesKind::TERM_STRUCTURE, 1.0);
        for (const auto& b : buckets) {
            series.points.emplace_back(b.expiry, math::FastStatistics<double>::mean(b.vols), b.all_converged);
        }

        sort_points(series);
        return series;
    }

    // Distinct expiries present after filtering, ascending.
    std::vector<double> expiries(const std::vector<IvObservation>& observations) const {
        std::vector<double> keys;
        for (const auto& obs : observations) {
            if (accepts(obs)) {
                keys.push_back(obs.quote.spec().time_to_expiry());
            }
        }
        return distinct_sorted(std::move(keys), params_.expiry_tolerance);
    }

    // Distinct strikes present after filtering, ascending.
    std::vector<double> strikes(const std::vector<IvObservation>& observations) const {
        std::vector<double> keys;
        for (const auto& obs : observations) {
            if (accepts(obs)) {
                keys.push_back(obs.quote.spec().strike());
            }
        }
        return distinct_sorted(std::move(keys), params_.strike_tolerance);
    }

private:
    SurfaceParameters params_;

    bool accepts(const IvObservation& obs) const {
        if (params_.type_filter && obs.quote.spec().type() != *params_.type_filter) {
            return false;
        }
        if (obs.result.converged) {
            return true;
        }
        return params_.include_non_converged && std::isfinite(obs.result.implied_volatility);
    }

    SurfaceSeries make_series(SeriesKind kind, double fixed_key) const {
        SurfaceSeries series;
        series.kind = kind;
        series.fixed_key = fixed_key;
        series.includes_non_converged = params_.include_non_converged;
        return series;
    }

    static bool within(double a, double b, double tolerance) noexcept {
        return std::abs(a - b) <= tolerance;
    }

    static void sort_points(SurfaceSeries& series) {
        std::stable_sort(series.points.begin(), series.points.end(),
                         [](const SurfacePoint& a, const SurfacePoint& b) { return a.x < b.x; });
    }

    static std::vector<double> distinct_sorted(std::vector<double> keys, double tolerance) {
        std::sort(keys.begin(), keys.end());
        std::vector<double> distinct;
        for (const double key : keys) {
            if (distinct.empty() || key - distinct.back() > tolerance) {
                distinct.push_back(key);
            }
        }
        return distinct;
    }
};

}
