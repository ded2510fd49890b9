#include "engine/Forecaster.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sloguard::engine {

using sloguard::model::Confidence;
using sloguard::model::Forecast;
using sloguard::model::TrendDirection;

namespace {

Confidence confidence_for(size_t n, double r2) {
  if (n >= kHighConfidenceMinPoints && r2 >= kHighConfidenceMinR2) return Confidence::High;
  if (n >= kMediumConfidenceMinPoints && r2 >= kMediumConfidenceMinR2) return Confidence::Medium;
  return Confidence::Low;
}

TrendDirection trend_for(double slope) {
  // A falling remaining-budget line means the burn is increasing.
  if (slope < -kTrendSlopeEpsilon) return TrendDirection::Increasing;
  if (slope > kTrendSlopeEpsilon) return TrendDirection::Decreasing;
  return TrendDirection::Stable;
}

} // namespace

Forecast forecast_exhaustion(std::vector<BudgetPoint> points, double current_burn_rate) {
  Forecast f{};
  f.current_burn_rate = current_burn_rate;
  f.points = points.size();
  if (points.empty()) return f;

  std::stable_sort(points.begin(), points.end(),
                   [](const BudgetPoint& a, const BudgetPoint& b){ return a.ts < b.ts; });
  f.as_of = points.back().ts;
  f.budget_remaining = points.back().remaining;
  if (points.size() < 2) {
    f.intercept = points.back().remaining;
    return f;
  }

  const auto t0 = points.front().ts;
  const double n = static_cast<double>(points.size());
  double sum_x = 0.0, sum_y = 0.0;
  std::vector<double> xs;
  xs.reserve(points.size());
  for (const auto& p : points) {
    double x = sloguard::model::hours_between(t0, p.ts);
    xs.push_back(x);
    sum_x += x;
    sum_y += p.remaining;
  }
  const double mean_x = sum_x / n;
  const double mean_y = sum_y / n;
  double sxx = 0.0, sxy = 0.0;
  for (size_t i = 0; i < points.size(); ++i) {
    double dx = xs[i] - mean_x;
    sxx += dx * dx;
    sxy += dx * (points[i].remaining - mean_y);
  }

  // All points at the same instant: no usable spread.
  if (sxx <= 1e-12) {
    f.trend_slope = 0.0;
    f.intercept = mean_y;
    return f;
  }

  const double slope = sxy / sxx;
  const double intercept = mean_y - slope * mean_x;
  double ss_res = 0.0, ss_tot = 0.0;
  for (size_t i = 0; i < points.size(); ++i) {
    double pred = intercept + slope * xs[i];
    double r = points[i].remaining - pred;
    double d = points[i].remaining - mean_y;
    ss_res += r * r;
    ss_tot += d * d;
  }
  double r2 = 0.0;
  if (ss_tot > 1e-12) r2 = 1.0 - ss_res / ss_tot;
  else if (ss_res <= 1e-12) r2 = 1.0;
  r2 = std::clamp(r2, 0.0, 1.0);

  f.trend_slope = slope;
  f.intercept = intercept;
  f.r_squared = r2;
  f.trend = trend_for(slope);
  f.confidence = confidence_for(points.size(), r2);

  if (slope < 0.0) {
    double x_zero = -intercept / slope;
    double tte = x_zero - xs.back();
    if (std::isfinite(tte) && tte > 0.0) {
      f.time_to_exhaustion_hours = tte;
      f.projected_exhaustion = sloguard::model::add_hours(points.back().ts, tte);
    }
  }
  return f;
}

Forecast forecast_from_history(const std::vector<sloguard::model::BurnRateSnapshot>& history, size_t max_points) {
  std::vector<BudgetPoint> pts;
  size_t start = history.size() > max_points ? history.size() - max_points : 0;
  pts.reserve(history.size() - start);
  for (size_t i = start; i < history.size(); ++i)
    pts.push_back(BudgetPoint{history[i].ts, history[i].budget_remaining});
  double burn = history.empty() ? 0.0 : history.back().composite_burn_rate;
  Forecast f = forecast_exhaustion(std::move(pts), burn);
  if (!history.empty()) {
    f.service = history.back().service;
    f.slo_id = history.back().slo_id;
  }
  f.message = forecast_message(f.service, f);
  return f;
}

std::string format_duration_hours(double hours) {
  char buf[64];
  if (hours < 1.0) {
    std::snprintf(buf, sizeof(buf), "%d minutes", static_cast<int>(hours * 60.0));
  } else if (hours < 24.0) {
    std::snprintf(buf, sizeof(buf), "%.1f hours", hours);
  } else if (hours < 72.0) {
    std::snprintf(buf, sizeof(buf), "%.1f days", hours / 24.0);
  } else {
    std::snprintf(buf, sizeof(buf), "%d days", static_cast<int>(hours / 24.0));
  }
  return buf;
}

std::string forecast_message(const std::string& service, const Forecast& f) {
  const std::string name = service.empty() ? std::string("service") : service;
  char buf[256];
  if (f.budget_remaining <= 0.0) {
    return name + " has exhausted its error budget. Immediate action required.";
  }
  if (!f.time_to_exhaustion_hours) {
    std::snprintf(buf, sizeof(buf), "%s error budget status is healthy with %.1f%% remaining.",
                  name.c_str(), f.budget_remaining);
    return buf;
  }

  std::string severity, urgency;
  const double b = f.current_burn_rate;
  if (b >= 3.0) {
    severity = "critically fast";
    urgency = "Immediate intervention required.";
  } else if (b >= 2.0) {
    std::snprintf(buf, sizeof(buf), "%.1fx faster than allowed", b);
    severity = buf;
    urgency = "Action recommended within the hour.";
  } else if (b >= 1.5) {
    std::snprintf(buf, sizeof(buf), "%.1fx normal rate", b);
    severity = buf;
    urgency = "Monitor closely.";
  } else if (b >= 1.0) {
    severity = "at the allowed rate";
    urgency = "Consider investigation.";
  } else {
    severity = "below normal";
    urgency = "Budget is healthy.";
  }

  std::string trend;
  switch (f.trend) {
    case TrendDirection::Increasing: trend = " Burn rate is trending upward."; break;
    case TrendDirection::Decreasing: trend = " Burn rate is trending downward."; break;
    case TrendDirection::Stable: break;
  }

  return name + " is burning error budget " + severity + ". Budget exhaustion projected in ~" +
         format_duration_hours(*f.time_to_exhaustion_hours) + "." + trend + " " + urgency;
}

} // namespace sloguard::engine
