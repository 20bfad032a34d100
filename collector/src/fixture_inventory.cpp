#include "fleetinv/collector/fixture_inventory.hpp"
#include "fleetinv/collector/errors.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>

namespace fleetinv {
namespace collector {

using json = nlohmann::json;

namespace {

caf::expected<json> read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return caf::make_error(caf::sec::invalid_argument, "Failed to open " + path.string());
    }
    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        return caf::make_error(caf::sec::invalid_argument, "Invalid JSON in " + path.string());
    }
    return doc;
}

std::map<std::string, std::string> string_map(const json& obj) {
    std::map<std::string, std::string> out;
    if (!obj.is_object()) {
        return out;
    }
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        out[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return out;
}

std::optional<FixtureInventory::InjectedError> injected_error(const json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_object()) {
        return std::nullopt;
    }
    const json& e = obj[key];
    FixtureInventory::InjectedError error;
    error.code = e.value("code", std::string("InternalError"));
    error.message = e.value("message", "Injected " + error.code);
    error.http_status = e.value("http_status", 0);
    error.after_pages = e.value("after_pages", 0);
    return error;
}

[[noreturn]] void raise(const FixtureInventory::InjectedError& error) {
    throw RemoteError(error.code, error.message, error.http_status);
}

class FixtureClient : public ResourceClient {
public:
    FixtureClient(std::shared_ptr<const FixtureInventory> owner, const FixtureInventory::Account& account, size_t page_size)
        : owner_(std::move(owner)), account_(account), page_size_(page_size == 0 ? 1 : page_size) {}

    ResourcePage list_page(const std::optional<std::string>& cursor) override {
        size_t offset = cursor ? static_cast<size_t>(std::stoull(*cursor)) : 0;
        size_t page_index = offset / page_size_;
        if (account_.list_error && page_index >= static_cast<size_t>(account_.list_error->after_pages)) {
            raise(*account_.list_error);
        }

        ResourcePage page;
        size_t end = std::min(offset + page_size_, account_.resources.size());
        for (size_t i = offset; i < end; ++i) {
            page.items.push_back(account_.resources[i].ref);
        }
        if (end < account_.resources.size()) {
            page.next_cursor = std::to_string(end);
        }
        return page;
    }

    ResourceDetail get_detail(const ResourceRef& item) override {
        for (const auto& resource : account_.resources) {
            if (resource.ref.id != item.id) {
                continue;
            }
            if (resource.detail_error) {
                raise(*resource.detail_error);
            }
            ResourceDetail detail;
            detail.tags = resource.tags;
            return detail;
        }
        throw RemoteError("NoSuchEntity", "Resource not found: " + item.id, 404);
    }

private:
    // Keeps the account data alive while the client is in use
    std::shared_ptr<const FixtureInventory> owner_;
    const FixtureInventory::Account& account_;
    size_t page_size_;
};

} // namespace

caf::expected<std::shared_ptr<FixtureInventory>> FixtureInventory::from_json(const json& doc) {
    if (!doc.is_object()) {
        return caf::make_error(caf::sec::invalid_argument, "Fixture document must be a JSON object");
    }

    auto inventory = std::make_shared<FixtureInventory>();
    inventory->service_ = doc.value("service", std::string("IAM"));
    int64_t page_size = doc.value("page_size", static_cast<int64_t>(50));
    inventory->page_size_ = page_size > 0 ? static_cast<size_t>(page_size) : 1;

    if (!doc.contains("accounts") || !doc["accounts"].is_object()) {
        return caf::make_error(caf::sec::invalid_argument, "Fixture document has no \"accounts\" object");
    }

    const json& accounts = doc["accounts"];
    for (auto it = accounts.begin(); it != accounts.end(); ++it) {
        const json& a = it.value();
        if (!a.is_object()) {
            return caf::make_error(caf::sec::invalid_argument, "Fixture account " + it.key() + " must be an object");
        }
        Account account;
        account.assume_role_error = injected_error(a, "assume_role_error");
        account.no_session = a.value("no_session", false);
        account.list_error = injected_error(a, "list_error");

        if (a.contains("resources")) {
            if (!a["resources"].is_array()) {
                return caf::make_error(caf::sec::invalid_argument,
                                       "Fixture account " + it.key() + " resources must be an array");
            }
            for (const auto& r : a["resources"]) {
                if (!r.is_object() || !r.contains("id") || !r["id"].is_string()) {
                    return caf::make_error(caf::sec::invalid_argument,
                                           "Fixture account " + it.key() + " has a resource without an id");
                }
                Resource resource;
                resource.ref.id = r["id"].get<std::string>();
                resource.ref.type = r.value("type", inventory->service_);
                if (r.contains("attributes")) {
                    resource.ref.attributes = string_map(r["attributes"]);
                }
                if (r.contains("tags")) {
                    resource.tags = string_map(r["tags"]);
                }
                resource.detail_error = injected_error(r, "detail_error");
                account.resources.push_back(std::move(resource));
            }
        }
        inventory->accounts_.emplace(it.key(), std::move(account));
    }
    return inventory;
}

caf::expected<std::shared_ptr<FixtureInventory>> FixtureInventory::load(const std::filesystem::path& path) {
    auto doc = read_json_file(path);
    if (!doc) {
        return doc.error();
    }
    return from_json(*doc);
}

std::optional<Credentials> FixtureInventory::assume_role(const AccountTask& task) {
    auto it = accounts_.find(task.account_id);
    if (it == accounts_.end()) {
        throw RemoteError("NoSuchEntity", "Role " + task.role_name + " not found in account " + task.account_id, 404);
    }
    if (it->second.assume_role_error) {
        raise(*it->second.assume_role_error);
    }
    if (it->second.no_session) {
        return std::nullopt;
    }

    Credentials credentials;
    credentials.access_key = "FIXTURE" + task.account_id;
    credentials.secret_key = "fixture-secret";
    credentials.session_token = "fixture-session-" + task.account_id;
    credentials.expiration = std::chrono::system_clock::now() + std::chrono::hours(1);
    return credentials;
}

std::unique_ptr<ResourceClient> FixtureInventory::open(const AccountTask& task, const Credentials&) {
    auto it = accounts_.find(task.account_id);
    if (it == accounts_.end()) {
        throw RemoteError("NoSuchEntity", "Unknown account " + task.account_id, 404);
    }
    return std::make_unique<FixtureClient>(shared_from_this(), it->second, page_size_);
}

caf::expected<std::vector<AccountTask>> load_account_tasks(const std::filesystem::path& path) {
    auto doc = read_json_file(path);
    if (!doc) {
        return doc.error();
    }
    if (!doc->is_array()) {
        return caf::make_error(caf::sec::invalid_argument, "Account list must be a JSON array: " + path.string());
    }

    std::vector<AccountTask> tasks;
    for (const auto& entry : *doc) {
        if (!entry.is_object() || !entry.contains("account_id") || !entry["account_id"].is_string()) {
            return caf::make_error(caf::sec::invalid_argument, "Account entry without account_id in " + path.string());
        }
        AccountTask task;
        task.account_id = entry["account_id"].get<std::string>();
        task.role_name = entry.value("role_name", std::string("InventoryReadRole"));
        task.region = entry.value("region", std::string("us-east-1"));
        tasks.push_back(std::move(task));
    }
    return tasks;
}

} // namespace collector
} // namespace fleetinv
