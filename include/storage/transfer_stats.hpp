#pragma once

#include <cstdint>
#include <optional>
#include <string>

// What one line of transfer-tool output says about progress.
struct TransferStats {
    std::optional<double> percent;
    std::optional<int64_t> itemsDone;
    std::optional<int64_t> itemsTotal;
    std::string currentItem;
    bool isError{false};
};

// rclone --stats-one-line output, e.g.
//   "Transferred:   1.234 GiB / 10.000 GiB, 12%, 50.000 MiB/s, ETA 3m15s"
//   "Transferred:   100 / 1000, 10%"
TransferStats parseRcloneStatsLine(const std::string& line);

// mc mirror output, e.g. "`source/bucket/a.txt` -> `target/bucket/a.txt`"
// or "`a.txt`: 1.23 MiB / 4.56 MiB".
TransferStats parseMcLine(const std::string& line);
