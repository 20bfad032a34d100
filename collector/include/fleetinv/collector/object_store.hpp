#pragma once

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/sec.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fleetinv {
namespace collector {

/**
 * Remote key-value object store used by the lock and the report writer.
 *
 * get() yields std::nullopt for a missing key; transport failures are
 * reported as caf::error.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual caf::expected<std::optional<std::string>> get(const std::string& key) = 0;
    virtual caf::expected<void> put(const std::string& key, const std::string& body) = 0;

    // Create-if-absent. Yields false when the key already exists.
    virtual caf::expected<bool> put_if_absent(const std::string& key, const std::string& body) = 0;

    // Removing a missing key is not an error
    virtual caf::expected<void> remove(const std::string& key) = 0;

    // Whether put_if_absent is atomic against concurrent writers
    virtual bool supports_conditional_write() const = 0;
};

class InMemoryObjectStore : public ObjectStore {
public:
    explicit InMemoryObjectStore(bool conditional_write = true) : conditional_write_(conditional_write) {}

    caf::expected<std::optional<std::string>> get(const std::string& key) override;
    caf::expected<void> put(const std::string& key, const std::string& body) override;
    caf::expected<bool> put_if_absent(const std::string& key, const std::string& body) override;
    caf::expected<void> remove(const std::string& key) override;
    bool supports_conditional_write() const override { return conditional_write_; }

    size_t size() const;
    bool contains(const std::string& key) const;

private:
    bool conditional_write_;
    mutable std::mutex mu_;
    std::map<std::string, std::string> objects_;
};

/**
 * Objects are files under a root directory. Keys are relative paths;
 * keys that would resolve outside the root are refused.
 */
class FilesystemObjectStore : public ObjectStore {
public:
    explicit FilesystemObjectStore(std::filesystem::path root);

    caf::expected<std::optional<std::string>> get(const std::string& key) override;
    caf::expected<void> put(const std::string& key, const std::string& body) override;
    caf::expected<bool> put_if_absent(const std::string& key, const std::string& body) override;
    caf::expected<void> remove(const std::string& key) override;
    bool supports_conditional_write() const override { return true; }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    bool is_key_allowed(const std::string& key) const;
    caf::expected<std::filesystem::path> resolve(const std::string& key) const;
    caf::expected<std::filesystem::path> write_temp(const std::filesystem::path& target, const std::string& body) const;
};

} // namespace collector
} // namespace fleetinv
