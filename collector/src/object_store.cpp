#include "fleetinv/collector/object_store.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace fleetinv {
namespace collector {

caf::expected<std::optional<std::string>> InMemoryObjectStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

caf::expected<void> InMemoryObjectStore::put(const std::string& key, const std::string& body) {
    std::lock_guard<std::mutex> lk(mu_);
    objects_[key] = body;
    return caf::unit;
}

caf::expected<bool> InMemoryObjectStore::put_if_absent(const std::string& key, const std::string& body) {
    std::lock_guard<std::mutex> lk(mu_);
    return objects_.emplace(key, body).second;
}

caf::expected<void> InMemoryObjectStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    objects_.erase(key);
    return caf::unit;
}

size_t InMemoryObjectStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return objects_.size();
}

bool InMemoryObjectStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return objects_.count(key) > 0;
}

FilesystemObjectStore::FilesystemObjectStore(std::filesystem::path root) : root_(std::move(root)) {}

bool FilesystemObjectStore::is_key_allowed(const std::string& key) const {
    if (key.empty() || key.front() == '/' || key.front() == '\\') {
        return false;
    }
    std::filesystem::path relative(key);
    if (relative.has_root_name() || relative.has_root_directory()) {
        return false;
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

caf::expected<std::filesystem::path> FilesystemObjectStore::resolve(const std::string& key) const {
    if (!is_key_allowed(key)) {
        return caf::make_error(caf::sec::invalid_argument, "Object key not allowed: " + key);
    }
    return root_ / std::filesystem::path(key);
}

caf::expected<std::filesystem::path> FilesystemObjectStore::write_temp(const std::filesystem::path& target,
                                                                       const std::string& body) const {
    static std::atomic<uint64_t> counter{0};

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return caf::make_error(caf::sec::runtime_error,
                               "Failed to create directory " + target.parent_path().string() + ": " + ec.message());
    }

    std::ostringstream name;
    name << "." << target.filename().string() << ".tmp." << ::getpid() << "." << counter.fetch_add(1);
    std::filesystem::path temp = target.parent_path() / name.str();

    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return caf::make_error(caf::sec::runtime_error, "Failed to open file for writing: " + temp.string());
    }
    file.write(body.data(), static_cast<std::streamsize>(body.size()));
    file.close();
    if (!file) {
        std::filesystem::remove(temp, ec);
        return caf::make_error(caf::sec::runtime_error, "Failed to write file: " + temp.string());
    }
    return temp;
}

caf::expected<std::optional<std::string>> FilesystemObjectStore::get(const std::string& key) {
    auto path = resolve(key);
    if (!path) {
        return path.error();
    }

    std::ifstream file(*path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(*path, ec)) {
            return std::optional<std::string>{};
        }
        return caf::make_error(caf::sec::runtime_error, "Failed to open file for reading: " + path->string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    return std::optional<std::string>{content.str()};
}

caf::expected<void> FilesystemObjectStore::put(const std::string& key, const std::string& body) {
    auto path = resolve(key);
    if (!path) {
        return path.error();
    }
    auto temp = write_temp(*path, body);
    if (!temp) {
        return temp.error();
    }

    // rename() replaces the target atomically, readers never see a partial object
    std::error_code ec;
    std::filesystem::rename(*temp, *path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(*temp, ignored);
        return caf::make_error(caf::sec::runtime_error, "Failed to replace " + path->string() + ": " + ec.message());
    }
    return caf::unit;
}

caf::expected<bool> FilesystemObjectStore::put_if_absent(const std::string& key, const std::string& body) {
    auto path = resolve(key);
    if (!path) {
        return path.error();
    }
    auto temp = write_temp(*path, body);
    if (!temp) {
        return temp.error();
    }

    // link() fails with EEXIST when the target exists, so creation is exclusive
    int rc = ::link(temp->c_str(), path->c_str());
    int link_errno = errno;
    std::error_code ec;
    std::filesystem::remove(*temp, ec);

    if (rc == 0) {
        return true;
    }
    if (link_errno == EEXIST) {
        return false;
    }
    return caf::make_error(caf::sec::runtime_error,
                           "Failed to create " + path->string() + ": " + std::strerror(link_errno));
}

caf::expected<void> FilesystemObjectStore::remove(const std::string& key) {
    auto path = resolve(key);
    if (!path) {
        return path.error();
    }
    std::error_code ec;
    std::filesystem::remove(*path, ec);
    if (ec) {
        return caf::make_error(caf::sec::runtime_error, "Failed to remove " + path->string() + ": " + ec.message());
    }
    return caf::unit;
}

} // namespace collector
} // namespace fleetinv
