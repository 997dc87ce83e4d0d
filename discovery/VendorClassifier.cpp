#include "VendorClassifier.hpp"
#include "OutputParsers.hpp"
#include "../common/Log.hpp"

#include <cctype>

namespace netscout::discovery
{
    using common::DeviceType;

    std::optional<std::string> NormalizeMac(const std::string &mac)
    {
        std::string cleaned;
        for (char c : mac)
        {
            if (c == ':' || c == '-' || c == '.')
                continue;
            if (!std::isxdigit(static_cast<unsigned char>(c)))
                return std::nullopt;
            cleaned += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        if (cleaned.size() < 6)
            return std::nullopt;

        if (cleaned.size() < 12)
            cleaned.append(12 - cleaned.size(), '0');
        else
            cleaned.resize(12);

        std::string formatted;
        for (size_t i = 0; i < 12; i += 2)
        {
            if (i)
                formatted += ':';
            formatted += cleaned.substr(i, 2);
        }
        return formatted;
    }

    const std::vector<DeviceTypeRule> &DeviceTypeRules()
    {
        static const std::vector<DeviceTypeRule> rules = {
            {DeviceType::Firewall,
             {"firewalla", "pfsense", "opnsense", "sophos", "watchguard", "sonicwall", "barracuda",
              "checkpoint", "forcepoint", "untangle"}},
            {DeviceType::Service,
             {"proxmox", "vmware", "xensource", "parallels", "virtualbox", "qemu", "docker", "kubernetes"}},
            {DeviceType::NetworkDevice,
             {"cisco", "juniper", "arista", "ubiquiti", "netgear", "tp-link", "linksys", "d-link",
              "mikrotik", "aruba", "ruckus", "fortinet", "palo alto", "zyxel", "draytek", "meraki",
              "cambium", "routerboard"}},
            {DeviceType::Server,
             {"supermicro", "dell emc", "hpe", "hewlett packard enterprise", "ibm", "oracle", "fujitsu",
              "inspur"}},
            {DeviceType::Apple, {"apple"}},
            {DeviceType::Nas,
             {"synology", "qnap", "western digital", "buffalo", "drobo", "netgear readynas", "ugreen",
              "asustor", "terramaster"}},
            {DeviceType::Iot,
             {"sonos", "philips", "signify", "ring", "nest", "ecobee", "wyze", "tuya", "shelly",
              "espressif", "amazon", "google", "roku", "wemo", "lifx", "nanoleaf"}},
            {DeviceType::Printer,
             {"hewlett packard", "hp inc", "canon", "epson", "brother", "xerox", "lexmark", "ricoh",
              "konica", "kyocera"}},
            {DeviceType::Gaming, {"sony", "nintendo", "microsoft", "valve"}},
            {DeviceType::Mobile,
             {"samsung", "huawei", "xiaomi", "oneplus", "oppo", "vivo", "motorola", "lg electronics",
              "realme", "honor"}},
            // "hp " keeps the trailing space so HPE does not land here.
            {DeviceType::Computer,
             {"dell", "lenovo", "acer", "asus", "asustek", "intel", "realtek", "gigabyte", "msi", "hp ",
              "toshiba"}},
        };
        return rules;
    }

    std::optional<DeviceType> InferDeviceType(const std::string &vendor)
    {
        std::string lower = ToLower(vendor);
        for (const auto &rule : DeviceTypeRules())
        {
            for (const auto &keyword : rule.keywords)
            {
                if (lower.find(keyword) != std::string::npos)
                    return rule.type;
            }
        }
        return std::nullopt;
    }

    std::optional<DeviceType> InferDeviceTypeFromMac(const std::string &mac)
    {
        static const char *virtualPrefixes[] = {
            "0242AC",                     // Docker
            "005056", "000C29", "000569", // VMware
            "00163E",                     // Xen
            "00155D",                     // Hyper-V
            "001C42",                     // Parallels
            "525400",                     // QEMU/KVM
            "080027",                     // VirtualBox
            "BC2411"};                    // Proxmox

        auto normalized = NormalizeMac(mac);
        if (!normalized)
            return std::nullopt;

        std::string prefix = normalized->substr(0, 2) + normalized->substr(3, 2) + normalized->substr(6, 2);
        for (const char *candidate : virtualPrefixes)
        {
            if (prefix == candidate)
                return DeviceType::Service;
        }
        return std::nullopt;
    }

    Classification VendorClassifier::Classify(const std::string &mac) const
    {
        Classification result;
        auto normalized = NormalizeMac(mac);
        if (!normalized)
            return result;

        result.vendor = m_database.Lookup(*normalized);
        if (result.vendor)
        {
            result.device_type = InferDeviceType(*result.vendor);
            if (!result.device_type)
                result.device_type = InferDeviceTypeFromMac(*normalized);
            return result;
        }

        result.device_type = InferDeviceTypeFromMac(*normalized);
        if (result.device_type)
            result.vendor = "Virtual Machine";
        return result;
    }

    void VendorClassifier::Enrich(std::vector<common::Device> &devices) const
    {
        size_t candidates = 0;
        size_t identified = 0;

        for (auto &device : devices)
        {
            if (!device.mac || device.vendor)
                continue;
            ++candidates;

            Classification classification = Classify(*device.mac);
            if (classification.vendor)
            {
                device.vendor = classification.vendor;
                ++identified;
            }
            if (classification.device_type && !device.device_type)
                device.device_type = classification.device_type;
        }

        common::LogInfo("Vendor") << "Identified " << identified << "/" << candidates << " vendors";
    }
}
