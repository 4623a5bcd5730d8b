#pragma once

/**
 * @brief 带 TTL 的结果缓存
 *
 * - 缓存键由操作名 + 参数确定性生成（见 makeKey）
 * - 命中条件：条目存在且 now - computedAt < ttl
 * - 未命中时在持锁状态下执行计算并整体替换条目，
 *   并发请求被串行化（不共享进行中的计算）
 * - 计算抛出异常时原样传播，不写入缓存
 *
 * 时钟可注入，便于测试过期行为
 */
template<typename Value>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using ValuePtr = std::shared_ptr<const Value>;
    using NowFunction = std::function<TimePoint()>;

    explicit TtlCache(NowFunction now = [] { return Clock::now(); })
        : now_(std::move(now)) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    /**
     * @brief 读取缓存，过期或缺失时调用 compute 重新计算
     * @return 缓存值（TTL 内多次调用返回同一对象）
     */
    template<typename Compute>
    ValuePtr getOrCompute(const std::string& key, Compute&& compute, std::chrono::seconds ttl) {
        std::lock_guard lock(mutex_);

        if (auto it = entries_.find(key); it != entries_.end()) {
            if (now_() - it->second.computedAt < ttl) {
                LOG_DEBUG << "[TtlCache] Cache hit for " << key;
                return it->second.value;
            }
        }

        auto value = std::make_shared<const Value>(std::forward<Compute>(compute)());
        entries_[key] = Entry{value, now_()};
        LOG_DEBUG << "[TtlCache] Cache miss for " << key << ", result cached";
        return value;
    }

    /**
     * @brief 清空全部条目
     */
    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    /**
     * @brief 生成缓存键："operation(arg1,arg2,...)"
     */
    template<typename... Args>
    static std::string makeKey(std::string_view operation, const Args&... args) {
        std::ostringstream oss;
        oss << operation << "(";
        size_t index = 0;
        ((oss << (index++ > 0 ? "," : "") << args), ...);
        oss << ")";
        return oss.str();
    }

private:
    struct Entry {
        ValuePtr value;
        TimePoint computedAt;
    };

    NowFunction now_;
    std::map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
};
