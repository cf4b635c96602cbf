#include "core/user/user_directory.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <stdexcept>

namespace guard {
namespace core {

guard::common::StatusOr<UserProfile> InMemoryUserDirectory::GetUserById(const std::string& user_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return guard::common::Status::NotFound("User not found");
    }
    return guard::common::StatusOr<UserProfile>(it->second);
}

void InMemoryUserDirectory::Upsert(const UserProfile& profile) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    users_[profile.user_id] = profile;
}

void InMemoryUserDirectory::Remove(const std::string& user_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    users_.erase(user_id);
}

CallbackUserDirectory::CallbackUserDirectory(Lookup lookup) : lookup_(std::move(lookup)) {}

guard::common::StatusOr<UserProfile> CallbackUserDirectory::GetUserById(const std::string& user_id) const {
    if (!lookup_) {
        return guard::common::Status::Unavailable("User directory callback not configured");
    }
    return lookup_(user_id);
}

StoredUserDirectory::StoredUserDirectory(std::shared_ptr<guard::cache::KvStore> store, std::string key_prefix)
    : store_(std::move(store)), key_prefix_(std::move(key_prefix)) {
    if (!store_) {
        throw std::invalid_argument("StoredUserDirectory requires a key-value store");
    }
}

std::string StoredUserDirectory::KeyFor(const std::string& user_id) const {
    return key_prefix_ + "user:" + user_id;
}

guard::common::StatusOr<UserProfile> StoredUserDirectory::GetUserById(const std::string& user_id) const {
    auto resp = store_->Get(KeyFor(user_id));
    if (!resp.IsOk()) {
        if (resp.GetStatus().Code() == guard::common::StatusCode::kNotFound) {
            return guard::common::Status::NotFound("User not found");
        }
        return resp.GetStatus();
    }
    auto json = nlohmann::json::parse(resp.Value(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return guard::common::Status::Internal("invalid user payload for " + user_id);
    }
    UserProfile profile;
    profile.user_id = user_id;
    profile.email = json.value("email", "");
    profile.role = json.value("role", "");
    profile.is_active = json.value("is_active", false);
    return guard::common::StatusOr<UserProfile>(std::move(profile));
}

guard::common::Status StoredUserDirectory::Upsert(const UserProfile& profile) {
    if (profile.user_id.empty()) {
        return guard::common::Status::InvalidArgument("user id is empty");
    }
    nlohmann::json j{
        {"email", profile.email},
        {"role", profile.role},
        {"is_active", profile.is_active},
    };
    return store_->Set(KeyFor(profile.user_id)
                       , j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                       , std::chrono::seconds(0));
}

guard::common::Status StoredUserDirectory::SetActive(const std::string& user_id, bool active) {
    auto profile = GetUserById(user_id);
    if (!profile.IsOk()) {
        return profile.GetStatus();
    }
    auto updated = profile.Value();
    updated.is_active = active;
    return Upsert(updated);
}

} // namespace core
} // namespace guard
