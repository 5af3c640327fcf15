#include "log.hpp"
#include "civil_time.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <fstream>
#include <filesystem>
#include <string>

// Writes data/customers.csv: two snapshots per customer, all model features
// and a churned_hard90 label drawn from a latent risk score.

static const char* kHeader =
  "customer_id,as_of_date,recency_days,median_gap_days,p90_gap_days,cv_gap,in_renewal_grace,"
  "rev_180d,rev_returns_90d,invoices_90d,credit_notes_90d,orders_pos_30d,orders_neg_30d,"
  "backorder_qty_30d,pct_change_3m,pct_change_6m,yoy_change_pct,credit_notes_prev_month,"
  "invoices_pos_prev_month,credit_notes_ma3,threshold_days,is_maintenance_heavy,maint_cycle_days,"
  "severity_score,lateness_component,credits_component,trend_component,mitigator_component,"
  "churned_hard90\n";

int main(int argc, char** argv) {
  Log::init();
  int customers = 400;
  if (argc > 1) customers = std::max(1, std::atoi(argv[1]));
  Log::write(LogLevel::Info, "Sample harness writing %d customers", customers);

  std::filesystem::create_directories("data");
  std::ofstream csv("data/customers.csv");
  if (!csv.is_open()) {
    Log::write(LogLevel::Error, "Failed to open data/customers.csv for writing");
    return 1;
  }
  csv << kHeader;

  std::mt19937 rng{42};
  std::normal_distribution<double> noise(0.0, 1.0);
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  const long long base_day = *parseIsoDate("2025-06-30");
  auto cell = [&](double v, int decimals) {
    // ~2% of cells arrive blank
    if (unit(rng) < 0.02) return std::string();
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return std::string(buf);
  };

  int positives = 0;
  for (int c = 0; c < customers; ++c) {
    const double risk = noise(rng);
    const bool maint = unit(rng) < 0.2;
    for (int snap = 0; snap < 2; ++snap) {
      const double r = risk + 0.3 * noise(rng);
      const long long day = base_day - (snap == 0 ? 90 : 0);

      const double recency = std::max(0.0, 35.0 + 30.0 * r + 10.0 * noise(rng));
      const double median_gap = std::max(1.0, 21.0 + 8.0 * r + 4.0 * noise(rng));
      const double rev180 = std::max(0.0, 60000.0 - 18000.0 * r + 9000.0 * noise(rng));
      const double invoices = std::max(0.0, std::round(14.0 - 5.0 * r + 2.0 * noise(rng)));
      const double credits = std::max(0.0, std::round(1.5 + 1.2 * r + noise(rng)));
      const double pct3 = -12.0 * r + 6.0 * noise(rng);
      const bool grace = unit(rng) < 0.1;
      const double threshold = std::max(0.0, recency - median_gap * 2.0);

      const double z = 1.6 * r - 0.6 + (grace ? -0.4 : 0.0);
      const int churned = unit(rng) < 1.0 / (1.0 + std::exp(-z)) ? 1 : 0;
      positives += churned;

      csv << (100000 + c) << ',' << formatIsoDate(day) << ','
          << cell(std::round(recency), 0) << ',' << cell(median_gap, 1) << ','
          << cell(median_gap * (1.6 + 0.2 * unit(rng)), 1) << ',' << cell(0.45 + 0.15 * r, 3) << ','
          << (grace ? "True" : "False") << ','
          << cell(rev180, 2) << ',' << cell(std::fabs(2500.0 * (1.0 + r) * unit(rng)), 2) << ','
          << cell(invoices, 0) << ',' << cell(credits, 0) << ','
          << cell(std::max(0.0, 9000.0 - 3000.0 * r + 1500.0 * noise(rng)), 2) << ','
          << cell(-std::fabs(400.0 * (1.0 + r) * unit(rng)), 2) << ','
          << cell(std::max(0.0, std::round(20.0 + 15.0 * r + 10.0 * noise(rng))), 0) << ','
          << cell(pct3, 1) << ',' << cell(0.8 * pct3 + 4.0 * noise(rng), 1) << ','
          << cell(0.6 * pct3 + 8.0 * noise(rng), 1) << ','
          << cell(std::max(0.0, std::round(credits / 3.0 + 0.5 * noise(rng))), 0) << ','
          << cell(std::max(0.0, std::round(invoices / 3.0 + noise(rng))), 0) << ','
          << cell(credits / 3.0, 2) << ',' << cell(std::round(threshold), 0) << ','
          << (maint ? 1 : 0) << ',' << cell(maint ? 60.0 + 20.0 * unit(rng) : 0.0, 0) << ','
          << cell(std::max(0.0, 2.0 + 1.5 * r + noise(rng)), 2) << ','
          << cell(0.5 * r + 0.2 * noise(rng), 3) << ',' << cell(0.3 * r + 0.2 * noise(rng), 3) << ','
          << cell(0.4 * r + 0.2 * noise(rng), 3) << ',' << cell(-0.3 * r + 0.2 * noise(rng), 3) << ','
          << churned << '\n';
    }
  }

  Log::write(LogLevel::Info, "Sample complete -> data/customers.csv (%d rows, %d churned)",
             customers * 2, positives);
}
