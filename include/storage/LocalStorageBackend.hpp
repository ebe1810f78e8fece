#pragma once

#include "storage/StorageBackend.hpp"

#include <filesystem>

namespace rv::storage {

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(std::filesystem::path root);
    ~LocalStorageBackend() override = default;

    void ready() override;

    void copyIn(const std::filesystem::path& localPath, const std::string& key) override;
    void copyOut(const std::string& key, const std::filesystem::path& localPath) override;
    [[nodiscard]] bool exists(const std::string& key) const override;
    void makeNamespace(const std::string& key) override;
    void deleteNamespace(const std::string& key) override;
    [[nodiscard]] std::vector<std::string> listNamespaces(const std::string& root) const override;

    [[nodiscard]] types::BackendType type() const override { return types::BackendType::Local; }
    [[nodiscard]] std::string volume() const override { return root_.string(); }
    [[nodiscard]] std::string describe(const std::string& key) const override;

    [[nodiscard]] std::filesystem::path resolve(const std::string& key) const;
    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

}
