#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace beacon {

class IdentityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Stable per-install identity of this device.
 *
 * The identifier is 16 random bytes from libsodium, hex encoded, generated on
 * first start and persisted as JSON next to the display name.
 */
class DeviceIdentity {
public:
    /// Must be called once before generate(); wraps sodium_init().
    static bool init();

    /// Fresh random identifier.
    static DeviceIdentity generate(std::string display_name);

    /// Load from disk; nullopt if the file is missing or unreadable.
    static std::optional<DeviceIdentity> load(const std::string& path);

    /// Load, or generate and save when nothing usable is on disk.
    /// A non-empty display_name overrides the stored one.
    static DeviceIdentity load_or_create(const std::string& path, const std::string& display_name);

    DeviceIdentity(std::string device_id, std::string display_name);

    /// Persist to disk (JSON). Throws IdentityError.
    void save(const std::string& path) const;

    [[nodiscard]] const std::string& device_id() const { return device_id_; }
    [[nodiscard]] const std::string& display_name() const { return display_name_; }
    void set_display_name(std::string name) { display_name_ = std::move(name); }

private:
    std::string device_id_;
    std::string display_name_;
};

} // namespace beacon
