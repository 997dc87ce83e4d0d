#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netscout::discovery
{
    // MAC prefix -> organization table. Reads the IEEE registry text
    // ("00-1A-2B   (hex)   Org") and the Wireshark manuf format, which also
    // carries the 28 and 36 bit MA-M / MA-S assignments ("00:1B:C5:00:00:00/36").
    class OuiDatabase
    {
    public:
        // False when the file cannot be opened.
        bool LoadFile(const std::string &path);

        // Returns the number of assignments added.
        std::size_t LoadFromStream(std::istream &in);

        void Add(std::uint64_t prefix, unsigned bits, const std::string &vendor);

        // `mac` in canonical XX:XX:XX:XX:XX:XX form. Longest prefix wins.
        std::optional<std::string> Lookup(const std::string &mac) const;

        std::size_t Size() const;

        static std::vector<std::string> DefaultPaths();

    private:
        // prefix length in bits -> (prefix value -> organization)
        std::map<unsigned, std::unordered_map<std::uint64_t, std::string>, std::greater<unsigned>> m_prefixes;
    };
}
