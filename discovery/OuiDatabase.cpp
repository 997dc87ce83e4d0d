#include "OuiDatabase.hpp"
#include "OutputParsers.hpp"
#include "../common/Log.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace netscout::discovery
{
    namespace
    {
        std::string HexDigitsOnly(const std::string &text)
        {
            std::string digits;
            for (char c : text)
            {
                if (c == ':' || c == '-' || c == '.')
                    continue;
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return "";
                digits += c;
            }
            return digits;
        }

        bool ParseIeeeLine(const std::string &line, std::uint64_t &prefix, std::string &vendor)
        {
            auto marker = line.find("(hex)");
            if (marker == std::string::npos)
                return false;

            std::string digits = HexDigitsOnly(Trim(line.substr(0, marker)));
            if (digits.size() != 6)
                return false;

            vendor = Trim(line.substr(marker + 5));
            if (vendor.empty())
                return false;

            prefix = std::strtoull(digits.c_str(), nullptr, 16);
            return true;
        }

        bool ParseManufLine(const std::string &line, std::uint64_t &prefix, unsigned &bits, std::string &vendor)
        {
            auto fieldEnd = line.find_first_of(" \t");
            if (fieldEnd == std::string::npos)
                return false;

            std::string field = line.substr(0, fieldEnd);
            std::string rest = line.substr(fieldEnd);

            unsigned explicitBits = 0;
            auto slash = field.find('/');
            if (slash != std::string::npos)
            {
                explicitBits = static_cast<unsigned>(std::atoi(field.c_str() + slash + 1));
                field = field.substr(0, slash);
            }

            std::string digits = HexDigitsOnly(field);
            if (digits.size() < 6 || digits.size() > 12)
                return false;

            unsigned available = static_cast<unsigned>(digits.size() * 4);
            bits = explicitBits ? explicitBits : available;
            if (bits < 24 || bits > available)
                return false;

            prefix = std::strtoull(digits.c_str(), nullptr, 16) >> (available - bits);

            // Older manuf files: "short  # Long Name"; newer: "short\tLong Name".
            auto hash = rest.find('#');
            if (hash != std::string::npos)
            {
                vendor = Trim(rest.substr(hash + 1));
            }
            else
            {
                std::string trimmed = Trim(rest);
                auto tab = trimmed.find('\t');
                vendor = tab == std::string::npos ? trimmed : Trim(trimmed.substr(tab + 1));
            }
            return !vendor.empty();
        }
    }

    bool OuiDatabase::LoadFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            return false;

        std::size_t added = LoadFromStream(file);
        common::LogInfo("OUI") << "Loaded " << added << " vendor prefixes from " << path;
        return true;
    }

    std::size_t OuiDatabase::LoadFromStream(std::istream &in)
    {
        std::size_t added = 0;
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty() || line[0] == '#' || std::isspace(static_cast<unsigned char>(line[0])))
                continue;
            if (line.find("(base 16)") != std::string::npos)
                continue;

            std::uint64_t prefix = 0;
            unsigned bits = 24;
            std::string vendor;

            if (ParseIeeeLine(line, prefix, vendor) || ParseManufLine(line, prefix, bits, vendor))
            {
                Add(prefix, bits, vendor);
                ++added;
            }
        }
        return added;
    }

    void OuiDatabase::Add(std::uint64_t prefix, unsigned bits, const std::string &vendor)
    {
        m_prefixes[bits][prefix] = vendor;
    }

    std::optional<std::string> OuiDatabase::Lookup(const std::string &mac) const
    {
        std::string digits = HexDigitsOnly(mac);
        if (digits.size() != 12)
            return std::nullopt;

        std::uint64_t value = std::strtoull(digits.c_str(), nullptr, 16);
        for (const auto &bucket : m_prefixes)
        {
            auto it = bucket.second.find(value >> (48 - bucket.first));
            if (it != bucket.second.end())
                return it->second;
        }
        return std::nullopt;
    }

    std::size_t OuiDatabase::Size() const
    {
        std::size_t total = 0;
        for (const auto &bucket : m_prefixes)
            total += bucket.second.size();
        return total;
    }

    std::vector<std::string> OuiDatabase::DefaultPaths()
    {
        return {
            "/usr/share/ieee-data/oui.txt",
            "/usr/share/misc/oui.txt",
            "/usr/share/wireshark/manuf"};
    }
}
