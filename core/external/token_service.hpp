#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "common/status.hpp"

namespace hearth {
namespace external {

/**
 * @brief Credential store keyed by service identifier
 *
 * The orchestrator never interprets tokens. Plugins reach the service
 * through their context, which scopes service ids by plugin id.
 */
class ITokenService {
public:
    virtual ~ITokenService() = default;

    virtual Status store_token(const std::string &service_id, const nlohmann::json &token) = 0;
    virtual std::optional<nlohmann::json> get_token(const std::string &service_id) = 0;
    virtual bool delete_token(const std::string &service_id) = 0;
};

class InMemoryTokenService : public ITokenService {
public:
    Status store_token(const std::string &service_id, const nlohmann::json &token) override {
        if (service_id.empty()) {
            return Status::error(ErrorCode::INVALID_ARGUMENT, "Service id must not be empty");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_[service_id] = token;
        return Status::success();
    }

    std::optional<nlohmann::json> get_token(const std::string &service_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tokens_.find(service_id);
        if (it == tokens_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool delete_token(const std::string &service_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return tokens_.erase(service_id) > 0;
    }

private:
    std::mutex mutex_;
    std::map<std::string, nlohmann::json> tokens_;
};

}  // namespace external
}  // namespace hearth
