#pragma once

#include "../common/Device.hpp"

#include <vector>

namespace netscout::monitor
{
    // Hand-off point to whatever synchronizes results upstream. Both calls
    // return false when the payload was not delivered.
    class Uploader
    {
    public:
        virtual ~Uploader() = default;
        virtual bool UploadScan(const common::ScanResult &result) = 0;
        virtual bool UploadHealth(const std::vector<common::DeviceHealthResult> &results) = 0;
    };

    // Writes payload summaries to the log instead of sending them anywhere.
    class LogUploader : public Uploader
    {
    public:
        bool UploadScan(const common::ScanResult &result) override;
        bool UploadHealth(const std::vector<common::DeviceHealthResult> &results) override;
    };
}
