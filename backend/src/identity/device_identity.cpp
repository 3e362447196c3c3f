/**
 * DeviceIdentity - libsodium-generated device id with JSON persistence.
 */

#include "identity/device_identity.h"

#include <array>
#include <cstdint>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <sodium.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace beacon {

namespace {

constexpr std::size_t kIdBytes = 16;
constexpr const char* kDefaultName = "Beacon Device";

} // namespace

bool DeviceIdentity::init() {
    // 0 = initialised now, 1 = already initialised.
    return sodium_init() >= 0;
}

DeviceIdentity::DeviceIdentity(std::string device_id, std::string display_name)
    : device_id_(std::move(device_id)), display_name_(std::move(display_name)) {}

DeviceIdentity DeviceIdentity::generate(std::string display_name) {
    std::array<unsigned char, kIdBytes> raw{};
    randombytes_buf(raw.data(), raw.size());

    std::array<char, kIdBytes * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());

    if (display_name.empty()) {
        display_name = kDefaultName;
    }
    return DeviceIdentity(std::string(hex.data()), std::move(display_name));
}

std::optional<DeviceIdentity> DeviceIdentity::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    json j = json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object()) {
        spdlog::warn("identity: {} is not valid JSON, ignoring", path);
        return std::nullopt;
    }
    auto id = j.find("device_id");
    if (id == j.end() || !id->is_string() || id->get_ref<const std::string&>().empty()) {
        spdlog::warn("identity: {} has no device_id, ignoring", path);
        return std::nullopt;
    }
    return DeviceIdentity(id->get<std::string>(), j.value("display_name", std::string(kDefaultName)));
}

DeviceIdentity DeviceIdentity::load_or_create(const std::string& path, const std::string& display_name) {
    if (auto existing = load(path)) {
        if (!display_name.empty() && display_name != existing->display_name()) {
            existing->set_display_name(display_name);
            existing->save(path);
        }
        spdlog::info("identity: loaded device id {} from {}", existing->device_id(), path);
        return *existing;
    }

    if (!init()) {
        throw IdentityError("libsodium initialisation failed");
    }
    DeviceIdentity identity = generate(display_name);
    identity.save(path);
    spdlog::info("identity: generated device id {} ({})", identity.device_id(), path);
    return identity;
}

void DeviceIdentity::save(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw IdentityError("cannot write identity file: " + path);
    }
    json j = {
        {"device_id", device_id_},
        {"display_name", display_name_},
    };
    file << j.dump(2) << '\n';
    if (!file) {
        throw IdentityError("failed writing identity file: " + path);
    }
}

} // namespace beacon
