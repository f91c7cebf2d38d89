#include "posmr/audit/audit_reporter.h"

#include "posmr/audit/checks/aud_001.h"
#include "posmr/audit/checks/aud_002.h"
#include "posmr/audit/checks/aud_003.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace posmr::audit {

namespace {

std::vector<RateBucket> make_buckets(const int width) {
  std::vector<RateBucket> buckets;
  for (int lower = 0; lower < 100; lower += width) {
    buckets.push_back(RateBucket{lower, std::min(lower + width, 100), 0});
  }
  return buckets;
}

void count_rate(std::vector<RateBucket>& buckets, const int width, const double rate) {
  const double clamped = std::clamp(rate, 0.0, 100.0);
  auto slot = static_cast<std::size_t>(std::floor(clamped / width));
  slot = std::min(slot, buckets.size() - 1);
  ++buckets[slot].store_count;
}

std::string percent(const double ratio) {
  return std::to_string(static_cast<int>(std::lround(ratio * 100.0))) + "%";
}

std::vector<Recommendation> recommend(const AuditSummary& summary,
                                      const config::AuditThresholds& thresholds) {
  std::vector<Recommendation> recommendations;
  if (summary.total_stores == 0) {
    return recommendations;
  }
  const auto total = static_cast<double>(summary.total_stores);

  if (static_cast<double>(summary.stores_at_full_completion) / total >
      thresholds.over_matching_ratio) {
    recommendations.push_back(
        {"over_matching",
         "More than " + percent(thresholds.over_matching_ratio) +
             " of stores report 100% completion; review identity matching for over-matching."});
  }
  if (summary.anomaly_caps > 0) {
    recommendations.push_back(
        {"requirement_drift", std::to_string(summary.anomaly_caps) +
                                  " record(s) confirmed more codes than required; check the POSM "
                                  "requirement catalog for drift."});
  }
  if (static_cast<double>(summary.stores_with_findings) / total >
      thresholds.systemic_review_ratio) {
    recommendations.push_back(
        {"systemic_review", "More than " + percent(thresholds.systemic_review_ratio) +
                                " of stores carry audit findings; a systemic review is warranted."});
  }
  return recommendations;
}

}  // namespace

AuditChecks make_default_checks() {
  AuditChecks checks;
  checks.checks.push_back(std::make_unique<Aud001>());
  checks.checks.push_back(std::make_unique<Aud002>());
  checks.checks.push_back(std::make_unique<Aud003>());
  return checks;
}

AuditReporter::AuditReporter(const config::AuditThresholds& thresholds)
    : AuditReporter(make_default_checks(), thresholds) {}

AuditReporter::AuditReporter(AuditChecks checks, const config::AuditThresholds& thresholds)
    : checks_(std::move(checks)), thresholds_(thresholds) {
  thresholds_.bucket_width = std::clamp(thresholds_.bucket_width, 1, 100);
}

AuditReport AuditReporter::audit(const completion::CompletionResult& result,
                                 const std::vector<domain::DisplayAssignment>& displays,
                                 const std::vector<domain::SurveySubmission>& submissions) const {
  AuditReport report;
  auto& summary = report.summary;
  const AuditContext context{displays, submissions};

  summary.total_stores = result.stores.size();
  summary.total_displays = displays.size();
  summary.total_submissions = submissions.size();
  summary.anomaly_caps = result.diagnostics.anomaly_caps.size();
  summary.status_histogram = result.global.status_counts;
  summary.rate_distribution = make_buckets(thresholds_.bucket_width);
  for (const auto confidence : {domain::FindingConfidence::kLow, domain::FindingConfidence::kMedium}) {
    summary.confidence_counts[std::string(domain::to_string(confidence))] = 0;
  }

  for (const auto& store : result.stores) {
    count_rate(summary.rate_distribution, thresholds_.bucket_width, store.completion_rate);
    if (store.required_count > 0 && store.completed_count == store.required_count) {
      ++summary.stores_at_full_completion;
    }

    domain::AuditFinding finding;
    finding.store_id = store.store_id;
    for (const auto& check : checks_.checks) {
      if (!check) {
        continue;
      }
      for (auto& issue : check->Evaluate(store, context)) {
        finding.confidence = std::min(finding.confidence, issue.confidence);
        finding.issues.push_back(std::move(issue.message));
        if (std::find(finding.check_ids.begin(), finding.check_ids.end(), issue.check_id) ==
            finding.check_ids.end()) {
          finding.check_ids.push_back(std::move(issue.check_id));
        }
      }
    }
    if (!finding.issues.empty()) {
      ++summary.confidence_counts[std::string(domain::to_string(finding.confidence))];
      report.store_findings.push_back(std::move(finding));
    }
  }
  summary.stores_with_findings = report.store_findings.size();

  std::sort(report.store_findings.begin(), report.store_findings.end(),
            [](const domain::AuditFinding& a, const domain::AuditFinding& b) {
              if (a.confidence != b.confidence) {
                return a.confidence < b.confidence;
              }
              return a.store_id < b.store_id;
            });

  report.recommendations = recommend(summary, thresholds_);
  return report;
}

AuditReport audit_completion(const completion::CompletionResult& result,
                             const std::vector<domain::DisplayAssignment>& displays,
                             const std::vector<domain::SurveySubmission>& submissions,
                             const config::AuditThresholds& thresholds) {
  return AuditReporter(thresholds).audit(result, displays, submissions);
}

}  // namespace posmr::audit
