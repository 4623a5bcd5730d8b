#pragma once

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    static std::string trim(const std::string& str) {
        auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char ch) {
            return std::isspace(ch);
        });
        auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char ch) {
            return std::isspace(ch);
        }).base();

        return (start < end) ? std::string(start, end) : std::string();
    }

    static std::string toLower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    static std::string toUpper(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        return result;
    }

    static bool contains(const std::string& str, const std::string& substr) {
        return str.find(substr) != std::string::npos;
    }

    /**
     * @brief 严格解析十进制整数（整串必须是数字，允许前导符号）
     */
    static std::optional<long long> parseInt(const std::string& str) {
        auto text = trim(str);
        if (text.empty()) return std::nullopt;

        const char* first = text.data();
        const char* last = text.data() + text.size();
        if (*first == '+') ++first;

        long long value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    /** 非空且只含 ASCII 数字 */
    static bool isDigits(const std::string& str) {
        return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
            return c >= '0' && c <= '9';
        });
    }

    /** 截断到指定长度（日志用） */
    static std::string preview(const std::string& str, size_t maxLength) {
        if (str.size() <= maxLength) return str;
        return str.substr(0, maxLength) + "...";
    }
};
