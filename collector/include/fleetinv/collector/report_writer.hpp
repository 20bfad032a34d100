#pragma once

#include "fleetinv/collector/core.hpp"
#include "fleetinv/collector/distributed_lock.hpp"
#include "fleetinv/collector/object_store.hpp"
#include "fleetinv/collector/observability.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fleetinv {
namespace collector {

// One CSV row: Type,Arn,AccountId,Region,Tags
struct ReportRow {
    std::string type;
    std::string arn;
    std::string account_id;
    std::string region;
    std::string tags;  // compact JSON object

    static ReportRow from_record(const ResourceRecord& record);
};

// RFC 4180 quoting; the first line must be the header
caf::expected<std::vector<ReportRow>> parse_csv(const std::string& text);
std::string render_csv(const std::vector<ReportRow>& rows);

// Rows keyed by (Type, Arn); incoming rows replace existing ones. Sorted by key.
std::vector<ReportRow> merge_rows(const std::vector<ReportRow>& existing, const std::vector<ReportRow>& incoming);

struct ReportOutcome {
    std::string status;  // success | warning | error
    int64_t rows = 0;
    std::string message;
    std::string lock_id;
};

/**
 * Merges collected records into the CSV object at object_key. The read,
 * merge and write all happen while holding the distributed lock.
 */
class ReportWriter {
public:
    ReportWriter(std::shared_ptr<ObjectStore> store,
                 std::shared_ptr<DistributedLock> lock,
                 std::shared_ptr<Observability> observability);

    ReportOutcome write_report(const std::string& object_key, const std::vector<ResourceRecord>& records);

private:
    std::shared_ptr<ObjectStore> store_;
    std::shared_ptr<DistributedLock> lock_;
    std::shared_ptr<Observability> observability_;

    ReportOutcome merge_and_write(const std::string& object_key, const std::vector<ReportRow>& incoming);
};

} // namespace collector
} // namespace fleetinv
