#pragma once

#include <string>
#include <ctime>
#include <optional>
#include <cstdio>
#include <fmt/format.h>

namespace fastdocx {
namespace utils {

/**
 * @brief 时间工具类 - 核心属性中的 W3CDTF 时间读写
 */
class TimeUtils {
public:
    /**
     * @brief 获取当前UTC时间
     */
    static std::tm getCurrentUTCTime() {
        std::time_t now = std::time(nullptr);
        std::tm result{};
#ifdef _WIN32
        gmtime_s(&result, &now);
#else
        gmtime_r(&now, &result);
#endif
        return result;
    }

    /**
     * @brief 格式化为 W3CDTF (YYYY-MM-DDTHH:MM:SSZ)
     */
    static std::string formatW3CDTF(const std::tm& time) {
        return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           time.tm_year + 1900, time.tm_mon + 1, time.tm_mday,
                           time.tm_hour, time.tm_min, time.tm_sec);
    }

    static std::string nowW3CDTF() {
        return formatW3CDTF(getCurrentUTCTime());
    }

    /**
     * @brief 解析 W3CDTF 时间
     *
     * 接受 "YYYY"、"YYYY-MM"、"YYYY-MM-DD"、"YYYY-MM-DDThh:mm[:ss[.s]]Z"
     * 以及带 ±hh:mm 偏移的形式。偏移会被换算回UTC。
     * @return 格式不合法时返回 std::nullopt
     */
    static std::optional<std::tm> parseW3CDTF(const std::string& text) {
        std::tm result{};
        result.tm_mday = 1;

        int year = 0, month = 1, day = 1, hour = 0, minute = 0, second = 0;
        size_t len = text.size();

        auto digits = [&text](size_t pos, size_t count, int& out) {
            if (pos + count > text.size()) return false;
            int value = 0;
            for (size_t i = pos; i < pos + count; ++i) {
                char c = text[i];
                if (c < '0' || c > '9') return false;
                value = value * 10 + (c - '0');
            }
            out = value;
            return true;
        };

        if (!digits(0, 4, year)) return std::nullopt;
        size_t pos = 4;
        if (pos < len) {
            if (text[pos] != '-' || !digits(pos + 1, 2, month)) return std::nullopt;
            pos += 3;
        }
        if (pos < len) {
            if (text[pos] != '-' || !digits(pos + 1, 2, day)) return std::nullopt;
            pos += 3;
        }

        int offset_minutes = 0;
        if (pos < len) {
            if (text[pos] != 'T' || !digits(pos + 1, 2, hour) ||
                pos + 3 >= len || text[pos + 3] != ':' || !digits(pos + 4, 2, minute)) {
                return std::nullopt;
            }
            pos += 6;
            if (pos < len && text[pos] == ':') {
                if (!digits(pos + 1, 2, second)) return std::nullopt;
                pos += 3;
                if (pos < len && text[pos] == '.') {
                    ++pos;
                    size_t start = pos;
                    while (pos < len && text[pos] >= '0' && text[pos] <= '9') ++pos;
                    if (pos == start) return std::nullopt;
                }
            }
            if (pos >= len) return std::nullopt;
            if (text[pos] == 'Z') {
                ++pos;
            } else if (text[pos] == '+' || text[pos] == '-') {
                int off_h = 0, off_m = 0;
                if (!digits(pos + 1, 2, off_h) || pos + 3 >= len || text[pos + 3] != ':' ||
                    !digits(pos + 4, 2, off_m)) {
                    return std::nullopt;
                }
                offset_minutes = (off_h * 60 + off_m) * (text[pos] == '+' ? 1 : -1);
                pos += 6;
            } else {
                return std::nullopt;
            }
        }
        if (pos != len) return std::nullopt;

        if (month < 1 || month > 12 || day < 1 || day > 31 ||
            hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        result.tm_year = year - 1900;
        result.tm_mon = month - 1;
        result.tm_mday = day;
        result.tm_hour = hour;
        result.tm_min = minute - offset_minutes;
        result.tm_sec = second;
        normalizeUTC(result);
        return result;
    }

    static bool isValidW3CDTF(const std::string& text) {
        return parseW3CDTF(text).has_value();
    }

private:
    // 通过 timegm/_mkgmtime 规范化越界字段（时区偏移换算后分钟可能为负）
    static void normalizeUTC(std::tm& time) {
#ifdef _WIN32
        std::time_t t = _mkgmtime(&time);
        gmtime_s(&time, &t);
#else
        std::time_t t = timegm(&time);
        gmtime_r(&t, &time);
#endif
    }
};

}} // namespace fastdocx::utils
