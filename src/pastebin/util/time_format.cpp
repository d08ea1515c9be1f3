#include <pastebin/util/time_format.hpp>

#include <cstdio>
#include <ctime>

namespace pastebin {

int64_t to_unix_micros(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_micros(int64_t micros) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(micros)));
}

std::string format_epoch_seconds(std::chrono::system_clock::time_point t) {
    int64_t micros = to_unix_micros(t);
    const char* sign = "";
    uint64_t magnitude = static_cast<uint64_t>(micros);
    if (micros < 0) {
        sign = "-";
        magnitude = static_cast<uint64_t>(-(micros + 1)) + 1;
    }

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s%llu.%06llu", sign,
                  static_cast<unsigned long long>(magnitude / 1000000),
                  static_cast<unsigned long long>(magnitude % 1000000));
    return buf;
}

std::string format_utc(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    if (gmtime_r(&tt, &tm) == nullptr) {
        return "";
    }

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        return "";
    }
    return buf;
}

}  // namespace pastebin
