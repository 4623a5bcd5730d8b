#pragma once

/**
 * @brief 时间戳助手
 *
 * - now(): 当前 UTC 时间（ISO-8601，用于 API 响应）
 * - normalize(): 设备 lastseen 字段统一为 "YYYY-MM-DD HH:MM:SS"
 */
class TimestampHelper {
public:
    static std::string now() {
        auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        auto dp = std::chrono::floor<std::chrono::days>(now);
        std::chrono::year_month_day ymd{dp};
        std::chrono::hh_mm_ss hms{now - dp};

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
            << std::setw(2) << hms.hours().count() << ":"
            << std::setw(2) << hms.minutes().count() << ":"
            << std::setw(2) << hms.seconds().count() << "Z";
        return oss.str();
    }

    /**
     * @brief 规范化时间戳
     *
     * 支持两种输入：
     * - ISO-8601：2024-01-02T03:04[:05[.ffffff]][Z|±HH:MM|±HHMM]（保留本地时刻，丢弃时区偏移）
     * - 数据库原生格式：2024-01-02 03:04:05
     *
     * 空值返回 nullopt；无法解析时原样返回（不抛异常）
     */
    static std::optional<std::string> normalize(const std::optional<std::string>& raw) {
        if (!raw || raw->empty()) {
            return std::nullopt;
        }

        auto parsed = raw->find('T') != std::string::npos
            ? parseIso8601(*raw)
            : parseNative(*raw);

        if (!parsed) {
            LOG_WARN << "[Timestamp] Failed to format timestamp " << *raw;
            return raw;
        }
        return format(*parsed);
    }

private:
    struct DateTime {
        int year = 0;
        int month = 0;
        int day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;
    };

    /** 顺序读取的简易游标 */
    class Cursor {
    public:
        explicit Cursor(std::string_view text) : text_(text) {}

        bool readNumber(size_t digits, int& out) {
            if (pos_ + digits > text_.size()) return false;
            int value = 0;
            for (size_t i = 0; i < digits; ++i) {
                char c = text_[pos_ + i];
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
                value = value * 10 + (c - '0');
            }
            pos_ += digits;
            out = value;
            return true;
        }

        bool expect(char c) {
            if (pos_ < text_.size() && text_[pos_] == c) {
                ++pos_;
                return true;
            }
            return false;
        }

        bool skipDigits() {
            size_t start = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
            return pos_ > start;
        }

        bool atEnd() const { return pos_ == text_.size(); }

    private:
        std::string_view text_;
        size_t pos_ = 0;
    };

    static bool readDate(Cursor& cur, DateTime& dt) {
        return cur.readNumber(4, dt.year) && cur.expect('-')
            && cur.readNumber(2, dt.month) && cur.expect('-')
            && cur.readNumber(2, dt.day);
    }

    static bool isValid(const DateTime& dt) {
        std::chrono::year_month_day ymd{
            std::chrono::year{dt.year},
            std::chrono::month{static_cast<unsigned>(dt.month)},
            std::chrono::day{static_cast<unsigned>(dt.day)}};
        return ymd.ok() && dt.hour < 24 && dt.minute < 60 && dt.second < 60;
    }

    static std::optional<DateTime> parseNative(const std::string& text) {
        Cursor cur(text);
        DateTime dt;
        bool ok = readDate(cur, dt) && cur.expect(' ')
            && cur.readNumber(2, dt.hour) && cur.expect(':')
            && cur.readNumber(2, dt.minute) && cur.expect(':')
            && cur.readNumber(2, dt.second)
            && cur.atEnd();
        if (!ok || !isValid(dt)) return std::nullopt;
        return dt;
    }

    static std::optional<DateTime> parseIso8601(const std::string& text) {
        Cursor cur(text);
        DateTime dt;
        if (!readDate(cur, dt) || !cur.expect('T')) return std::nullopt;
        if (!cur.readNumber(2, dt.hour) || !cur.expect(':') || !cur.readNumber(2, dt.minute)) {
            return std::nullopt;
        }
        if (cur.expect(':')) {
            if (!cur.readNumber(2, dt.second)) return std::nullopt;
            // 小数秒只校验格式，输出时丢弃
            if (cur.expect('.') && !cur.skipDigits()) return std::nullopt;
        }

        if (cur.expect('Z')) {
            // UTC 标记
        } else if (cur.expect('+') || cur.expect('-')) {
            int offHour = 0;
            int offMinute = 0;
            if (!cur.readNumber(2, offHour)) return std::nullopt;
            cur.expect(':');
            if (!cur.readNumber(2, offMinute)) return std::nullopt;
            if (offHour >= 24 || offMinute >= 60) return std::nullopt;
        }

        if (!cur.atEnd() || !isValid(dt)) return std::nullopt;
        return dt;
    }

    static std::string format(const DateTime& dt) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                      dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
        return buf;
    }
};
