#ifndef METRIC_NAMES_HPP
#define METRIC_NAMES_HPP

namespace MetricNames {

// Ingestion and detection
constexpr const char *TWEETS_PROCESSED = "tweets_processed_total";
constexpr const char *SAMPLES_INGESTED = "samples_ingested_total";
constexpr const char *SAMPLES_REJECTED = "samples_rejected_total";
constexpr const char *ANOMALIES_DETECTED = "anomalies_detected_total";
constexpr const char *DETECTION_ERRORS = "detection_errors_total";
constexpr const char *COLLECTION_ERRORS = "collection_errors_total";
constexpr const char *LAST_ANOMALY_SCORE = "last_anomaly_score";

// Alerting
constexpr const char *ALERTS_CREATED = "alerts_created_total";
constexpr const char *ALERTS_SENT = "alerts_sent_total";
constexpr const char *ALERTS_SUPPRESSED = "alerts_suppressed_total";
constexpr const char *ALERTS_DISPATCH_FAILED = "alerts_dispatch_failed_total";
constexpr const char *ALERTS_DISPATCH_EXHAUSTED =
    "alerts_dispatch_exhausted_total";
constexpr const char *ALERTS_PENDING_RETRY = "alerts_pending_retry";

// Persistence
constexpr const char *PERSISTENCE_ERRORS = "persistence_errors_total";
constexpr const char *PERSISTENCE_DROPPED = "persistence_writes_dropped_total";

// Scheduler
constexpr const char *TASK_RUNS = "scheduler_task_runs_total";
constexpr const char *TASK_FAILURES = "scheduler_task_failures_total";
constexpr const char *TICKS_DROPPED = "scheduler_ticks_dropped_total";
constexpr const char *TASKS_FAILED = "scheduler_tasks_failed";
constexpr const char *TASKS_ABANDONED = "scheduler_tasks_abandoned_total";

// Any error surfaced to operators
constexpr const char *ERRORS = "errors_total";

} // namespace MetricNames

#endif // METRIC_NAMES_HPP
