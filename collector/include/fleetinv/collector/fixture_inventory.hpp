#pragma once

#include "fleetinv/collector/core.hpp"
#include <caf/expected.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetinv {
namespace collector {

/**
 * Inventory backed by a JSON document instead of cloud APIs.
 *
 * {
 *   "service": "IAM",
 *   "page_size": 50,
 *   "accounts": {
 *     "111111111111": {
 *       "assume_role_error": {"code": "AccessDenied", "http_status": 403},
 *       "no_session": false,
 *       "list_error": {"code": "Throttling", "after_pages": 1},
 *       "resources": [
 *         {"id": "...", "type": "policy", "attributes": {}, "tags": {},
 *          "detail_error": {"code": "NoSuchEntity"}}
 *       ]
 *     }
 *   }
 * }
 *
 * Accounts missing from the document fail role assumption with NoSuchEntity.
 */
class FixtureInventory : public RoleAssumer,
                         public ResourceSource,
                         public std::enable_shared_from_this<FixtureInventory> {
public:
    struct InjectedError {
        std::string code;
        std::string message;
        int http_status = 0;
        int after_pages = 0;
    };

    struct Resource {
        ResourceRef ref;
        std::map<std::string, std::string> tags;
        std::optional<InjectedError> detail_error;
    };

    struct Account {
        std::optional<InjectedError> assume_role_error;
        bool no_session = false;
        std::optional<InjectedError> list_error;
        std::vector<Resource> resources;
    };

    static caf::expected<std::shared_ptr<FixtureInventory>> from_json(const nlohmann::json& doc);
    static caf::expected<std::shared_ptr<FixtureInventory>> load(const std::filesystem::path& path);

    std::optional<Credentials> assume_role(const AccountTask& task) override;

    std::string service_name() const override { return service_; }
    std::unique_ptr<ResourceClient> open(const AccountTask& task, const Credentials& credentials) override;

    size_t page_size() const { return page_size_; }

private:
    std::string service_;
    size_t page_size_ = 50;
    std::map<std::string, Account> accounts_;
};

// Reads [{"account_id", "role_name", "region"}]
caf::expected<std::vector<AccountTask>> load_account_tasks(const std::filesystem::path& path);

} // namespace collector
} // namespace fleetinv
