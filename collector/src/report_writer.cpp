#include "fleetinv/collector/report_writer.hpp"
#include "fleetinv/collector/result_converter.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <utility>

namespace fleetinv {
namespace collector {

namespace {

const std::vector<std::string> kHeader = {"Type", "Arn", "AccountId", "Region", "Tags"};

std::string quote(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

// Splits text into records of fields, honoring quoted newlines
caf::expected<std::vector<std::vector<std::string>>> split_records(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            field_started = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
            field_started = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            if (field_started || !field.empty() || !fields.empty()) {
                fields.push_back(std::move(field));
                records.push_back(std::move(fields));
            }
            fields.clear();
            field.clear();
            field_started = false;
        } else {
            field += c;
            field_started = true;
        }
    }

    if (in_quotes) {
        return caf::make_error(caf::sec::invalid_argument, "Unterminated quoted field in CSV");
    }
    if (field_started || !field.empty() || !fields.empty()) {
        fields.push_back(std::move(field));
        records.push_back(std::move(fields));
    }
    return records;
}

} // namespace

ReportRow ReportRow::from_record(const ResourceRecord& record) {
    ReportRow row;
    row.type = record.resource_type;
    auto arn = record.attributes.find("Arn");
    row.arn = arn != record.attributes.end() ? arn->second : record.resource_id;
    row.account_id = record.account_id;
    row.region = record.region;
    row.tags = ResultConverter::dump(nlohmann::json(record.tags));
    return row;
}

caf::expected<std::vector<ReportRow>> parse_csv(const std::string& text) {
    auto records = split_records(text);
    if (!records) {
        return records.error();
    }

    std::vector<ReportRow> rows;
    if (records->empty()) {
        return rows;
    }

    // Map header names to column positions so column order is free
    const auto& header = records->front();
    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    for (const auto& name : {"Type", "Arn"}) {
        if (columns.count(name) == 0) {
            return caf::make_error(caf::sec::invalid_argument, std::string("CSV header is missing column ") + name);
        }
    }

    auto field = [&columns](const std::vector<std::string>& record, const char* name) -> std::string {
        auto it = columns.find(name);
        if (it == columns.end() || it->second >= record.size()) {
            return {};
        }
        return record[it->second];
    };

    for (size_t r = 1; r < records->size(); ++r) {
        const auto& record = (*records)[r];
        ReportRow row;
        row.type = field(record, "Type");
        row.arn = field(record, "Arn");
        row.account_id = field(record, "AccountId");
        row.region = field(record, "Region");
        row.tags = field(record, "Tags");
        if (row.type.empty() && row.arn.empty()) {
            continue;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string render_csv(const std::vector<ReportRow>& rows) {
    std::string out;
    for (size_t i = 0; i < kHeader.size(); ++i) {
        out += (i == 0 ? "" : ",") + kHeader[i];
    }
    out += "\r\n";
    for (const auto& row : rows) {
        out += quote(row.type) + "," + quote(row.arn) + "," + quote(row.account_id) + "," +
               quote(row.region) + "," + quote(row.tags) + "\r\n";
    }
    return out;
}

std::vector<ReportRow> merge_rows(const std::vector<ReportRow>& existing, const std::vector<ReportRow>& incoming) {
    std::map<std::pair<std::string, std::string>, ReportRow> merged;
    for (const auto& row : existing) {
        merged[{row.type, row.arn}] = row;
    }
    for (const auto& row : incoming) {
        merged[{row.type, row.arn}] = row;
    }

    std::vector<ReportRow> rows;
    rows.reserve(merged.size());
    for (auto& [key, row] : merged) {
        rows.push_back(std::move(row));
    }
    return rows;
}

ReportWriter::ReportWriter(std::shared_ptr<ObjectStore> store,
                           std::shared_ptr<DistributedLock> lock,
                           std::shared_ptr<Observability> observability)
    : store_(std::move(store)), lock_(std::move(lock)), observability_(std::move(observability)) {}

ReportOutcome ReportWriter::merge_and_write(const std::string& object_key, const std::vector<ReportRow>& incoming) {
    ReportOutcome outcome;
    std::vector<ReportRow> existing;

    auto current = store_->get(object_key);
    if (!current) {
        outcome.status = "error";
        outcome.message = "Failed to read existing report: " + caf::to_string(current.error());
        return outcome;
    }
    if (current->has_value()) {
        auto parsed = parse_csv(**current);
        if (!parsed) {
            // A corrupt report is replaced rather than blocking every later run
            observability_->log_warn("Existing report could not be parsed, rewriting it", LogFields{"", "", "report"}, {
                {"object_key", object_key}, {"error", caf::to_string(parsed.error())}
            });
        } else {
            existing = std::move(*parsed);
            observability_->log_info("Read existing report", LogFields{"", "", "report"}, {
                {"object_key", object_key}, {"rows", std::to_string(existing.size())}
            });
        }
    }

    std::vector<ReportRow> merged = merge_rows(existing, incoming);
    outcome.rows = static_cast<int64_t>(merged.size());
    if (merged.empty()) {
        outcome.status = "warning";
        outcome.message = "No rows to write";
        return outcome;
    }

    auto written = store_->put(object_key, render_csv(merged));
    if (!written) {
        outcome.status = "error";
        outcome.message = "Failed to write report: " + caf::to_string(written.error());
        return outcome;
    }
    outcome.status = "success";
    outcome.message = "Wrote " + std::to_string(merged.size()) + " rows to " + object_key;
    return outcome;
}

ReportOutcome ReportWriter::write_report(const std::string& object_key, const std::vector<ResourceRecord>& records) {
    std::vector<ReportRow> incoming;
    incoming.reserve(records.size());
    for (const auto& record : records) {
        incoming.push_back(ReportRow::from_record(record));
    }

    auto locked = lock_->write_with_lock(object_key, [this, &object_key, &incoming](const std::string& lock_id) {
        ReportOutcome outcome = merge_and_write(object_key, incoming);
        outcome.lock_id = lock_id;
        return outcome;
    });

    ReportOutcome outcome;
    if (!locked.acquired || !locked.value) {
        outcome.status = "error";
        outcome.message = locked.message;
    } else {
        outcome = *locked.value;
    }

    LogFields fields{"", "", "report"};
    Observability::Context context = {
        {"object_key", object_key},
        {"status", outcome.status},
        {"rows", std::to_string(outcome.rows)},
        {"attempts", std::to_string(locked.attempts)}
    };
    if (outcome.status == "error") {
        observability_->log_error(outcome.message, fields, context);
    } else if (outcome.status == "warning") {
        observability_->log_warn(outcome.message, fields, context);
    } else {
        observability_->log_info(outcome.message, fields, context);
    }
    return outcome;
}

} // namespace collector
} // namespace fleetinv
