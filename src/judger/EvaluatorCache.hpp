/*
 * EvaluatorCache.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_EVALUATORCACHE_HPP_
#define SRC_JUDGER_EVALUATORCACHE_HPP_

#include "Result.hpp"
#include "judge_exception.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <kerbal/utility/noncopyable.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>

extern std::ofstream log_fp;

/**
 * @brief 缓存的存储后端. 值为序列化后的 json 文本
 * 实现必须是线程安全的, 失败时抛出 CacheException
 */
class CacheBackend
{
	public:
		virtual ~CacheBackend() noexcept = default;

		virtual optional<std::string> get(const std::string & key) = 0;

		/**
		 * @param tag 非空时, 该条目归入 tag 之下, 可被 invalidate(tag) 整体清除
		 */
		virtual void set(const std::string & key, const std::string & value, const optional<std::string> & tag) = 0;

		virtual void invalidate(const std::string & tag) = 0;
};

/**
 * @brief 进程内的缓存后端, ttl 为 0 时条目永不过期
 */
class MemoryCacheBackend : public CacheBackend, kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		struct entry
		{
				std::string value;
				optional<std::chrono::steady_clock::time_point> expire_at;
				optional<std::string> tag;
		};

		typedef std::unordered_map<std::string, entry> entry_map;

		std::chrono::milliseconds ttl;
		std::mutex mtx;
		entry_map entries;
		std::unordered_map<std::string, std::set<std::string> > tags;
		std::chrono::steady_clock::time_point next_sweep;

		/// 调用者须持有 mtx
		entry_map::iterator erase_entry(entry_map::iterator it);

		/**
		 * @brief 清除全部过期条目. 调用者须持有 mtx
		 * 两次清扫之间至少间隔一个 ttl
		 */
		void sweep_expired(std::chrono::steady_clock::time_point now);

	public:
		explicit MemoryCacheBackend(std::chrono::milliseconds ttl = std::chrono::milliseconds(0));

		virtual optional<std::string> get(const std::string & key) override;

		virtual void set(const std::string & key, const std::string & value, const optional<std::string> & tag) override;

		virtual void invalidate(const std::string & tag) override;

		/// 当前保存的条目数, 含已过期而尚未清扫的条目
		std::size_t size();
};

/**
 * @brief 评测程序调用结果的内容寻址缓存
 *
 * 键由评测程序源码, 操作名与全部参数共同决定, 所以只有逐字节相同的评测程序与参数才会命中.
 * 计算过程抛出的异常不会被缓存.
 */
class EvaluatorCache : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		std::shared_ptr<CacheBackend> backend;
		std::string prefix;

	public:
		EvaluatorCache(std::shared_ptr<CacheBackend> backend, const std::string & prefix);

		/**
		 * @brief 生成缓存键: "<prefix>:<operation>:<parts 的 sha1>"
		 * @param parts 评测程序源码及全部参数组成的 json 数组
		 */
		std::string make_key(const std::string & operation, const nlohmann::json & parts) const;

		/**
		 * @brief 命中时直接返回缓存值, 未命中时调用一次 compute 并在返回前写入缓存
		 * 后端故障只记录日志, 退化为直接计算
		 * @throws compute 抛出的任何异常
		 */
		template <typename Type, typename Compute>
		Type get_or_compute(const std::string & key, const optional<std::string> & tag, Compute && compute)
		{
			optional<std::string> cached;
			try {
				cached = backend->get(key);
			} catch (const CacheException & e) {
				EXCEPT_WARNING(log_kind::JUDGER, 0, log_fp, "Read evaluator cache failed.", e, " key: ", key);
			}

			if (cached != nullopt) {
				try {
					return nlohmann::json::parse(*cached).get<Type>();
				} catch (const nlohmann::json::exception & e) {
					EXCEPT_WARNING(log_kind::JUDGER, 0, log_fp, "Discard corrupted cache entry.", e, " key: ", key);
				} catch (const std::invalid_argument & e) {
					// 例如无法识别的 verdict 名
					EXCEPT_WARNING(log_kind::JUDGER, 0, log_fp, "Discard corrupted cache entry.", e, " key: ", key);
				}
			}

			Type value = compute();

			try {
				nlohmann::json j = value;
				backend->set(key, j.dump(), tag);
			} catch (const CacheException & e) {
				EXCEPT_WARNING(log_kind::JUDGER, 0, log_fp, "Write evaluator cache failed.", e, " key: ", key);
			}
			return value;
		}

		/**
		 * @brief 清除归入 tag 之下的所有条目
		 * @throws CacheException
		 */
		void invalidate(const std::string & tag);
};

#endif /* SRC_JUDGER_EVALUATORCACHE_HPP_ */
