#include "security/local_key_manager.hpp"
#include "core/utils.hpp"

#include <openssl/rand.h>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace anonproxy {

LocalKeyManager::LocalKeyManager(const std::string& key_file)
    : key_file_(key_file) {
    if (!key_file_.empty()) {
        load_keys();
    }
    // If no keys loaded, generate a default one
    if (keys_.empty()) {
        generate_and_add_key();
    }
}

LocalKeyManager::~LocalKeyManager() {
    std::unique_lock lock(mutex_);
    for (auto& key : keys_) {
        utils::secure_zero(key.key_bytes);
    }
}

std::optional<IKeyManager::KeyInfo> LocalKeyManager::get_active_key() const {
    std::shared_lock lock(mutex_);
    if (active_index_ < keys_.size()) {
        return keys_[active_index_];
    }
    return std::nullopt;
}

std::optional<IKeyManager::KeyInfo> LocalKeyManager::get_key(const std::string& key_id) const {
    std::shared_lock lock(mutex_);
    for (const auto& key : keys_) {
        if (key.key_id == key_id) {
            return key;
        }
    }
    return std::nullopt;
}

bool LocalKeyManager::rotate_key() {
    return generate_and_add_key();
}

size_t LocalKeyManager::key_count() const {
    std::shared_lock lock(mutex_);
    return keys_.size();
}

bool LocalKeyManager::generate_and_add_key() {
    std::unique_lock lock(mutex_);

    KeyInfo key;
    key.key_id = generate_key_id();
    key.key_bytes = generate_key();
    key.created_at = std::chrono::system_clock::now();
    key.active = true;

    // Deactivate previous active key
    if (!keys_.empty() && active_index_ < keys_.size()) {
        keys_[active_index_].active = false;
    }

    keys_.push_back(std::move(key));
    active_index_ = keys_.size() - 1;

    if (!key_file_.empty()) {
        return save_keys();
    }
    return true;
}

void LocalKeyManager::load_keys() {
    std::ifstream file(key_file_);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t first_colon = line.find(':');
        if (first_colon == std::string::npos) continue;
        const size_t second_colon = line.find(':', first_colon + 1);
        if (second_colon == std::string::npos) continue;

        KeyInfo key;
        key.key_id = line.substr(0, first_colon);
        key.key_bytes = utils::hex_to_bytes(
            std::string_view(line).substr(first_colon + 1, second_colon - first_colon - 1));
        const std::string active_str = line.substr(second_colon + 1);
        utils::secure_zero(line);

        // Only AES-256 keys are usable
        if (key.key_id.empty() || key.key_bytes.size() != 32) {
            utils::secure_zero(key.key_bytes);
            continue;
        }

        key.active = (active_str == "1" || active_str == "true");
        key.created_at = std::chrono::system_clock::now();

        if (key.active) {
            active_index_ = keys_.size();
        }
        keys_.push_back(std::move(key));
    }

    // No line marked active: newest key wins
    if (!keys_.empty() && !keys_[active_index_].active) {
        active_index_ = keys_.size() - 1;
        keys_[active_index_].active = true;
    }
}

bool LocalKeyManager::save_keys() const {
    if (key_file_.empty()) return false;

    std::ofstream file(key_file_, std::ios::trunc);
    if (!file.is_open()) return false;

    file << "# Key format: key_id:hex_key:active\n";
    for (const auto& key : keys_) {
        std::string hex = utils::bytes_to_hex(key.key_bytes.data(), key.key_bytes.size());
        file << key.key_id << ':' << hex << ':' << (key.active ? "1" : "0") << '\n';
        utils::secure_zero(hex);
    }
    file.close();

    std::error_code ec;
    std::filesystem::permissions(key_file_,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    return file.good() && !ec;
}

std::vector<uint8_t> LocalKeyManager::generate_key() {
    std::vector<uint8_t> key(32); // 256 bits
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed generating key");
    }
    return key;
}

std::string LocalKeyManager::generate_key_id() {
    uint8_t id[8];
    if (RAND_bytes(id, sizeof(id)) != 1) {
        throw std::runtime_error("RAND_bytes failed generating key id");
    }
    return "key-" + utils::bytes_to_hex(id, sizeof(id));
}

} // namespace anonproxy
