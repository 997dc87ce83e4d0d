#pragma once

#include "OuiDatabase.hpp"
#include "../common/Device.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netscout::discovery
{
    // Strips ':', '-' and '.', uppercases, and rebuilds XX:XX:XX:XX:XX:XX.
    // Needs at least 6 hex digits; shorter input is right-padded with zeros,
    // longer input truncated to 12 digits.
    std::optional<std::string> NormalizeMac(const std::string &mac);

    struct DeviceTypeRule
    {
        common::DeviceType type;
        std::vector<std::string> keywords; // lowercase substrings of the vendor name
    };

    // Evaluated in order, first match wins.
    const std::vector<DeviceTypeRule> &DeviceTypeRules();

    std::optional<common::DeviceType> InferDeviceType(const std::string &vendor);

    // Known hypervisor / container OUIs.
    std::optional<common::DeviceType> InferDeviceTypeFromMac(const std::string &mac);

    struct Classification
    {
        std::optional<std::string> vendor;
        std::optional<common::DeviceType> device_type;
    };

    class VendorClassifier
    {
    public:
        explicit VendorClassifier(const OuiDatabase &database) : m_database(database) {}

        Classification Classify(const std::string &mac) const;

        // Fills vendor and type for every device that has a MAC but no vendor.
        void Enrich(std::vector<common::Device> &devices) const;

    private:
        const OuiDatabase &m_database;
    };
}
