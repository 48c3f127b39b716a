/*
 * RedisCacheBackend.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_REDISCACHEBACKEND_HPP_
#define SRC_JUDGER_REDISCACHEBACKEND_HPP_

#include "EvaluatorCache.hpp"
#include "redis_conn_factory.hpp"

#include <chrono>
#include <string>

/**
 * @brief 以 redis 为存储的缓存后端
 * 条目以 SET / SETEX 写入, tag 是一个 redis 集合, 记录归入其下的所有键
 */
class RedisCacheBackend : public CacheBackend
{
	private:
		redis_conn_pool_type & pool;
		std::string hostname;
		int port;
		std::chrono::seconds ttl;
		std::string tag_prefix;

		kerbal::redis_v2::reply execute(std::initializer_list<std::string> args);

	public:
		/**
		 * @param ttl 为 0 时条目永不过期
		 * @param tag_prefix tag 集合的键前缀
		 */
		RedisCacheBackend(redis_conn_pool_type & pool, const std::string & hostname, int port,
							std::chrono::seconds ttl, const std::string & tag_prefix);

		virtual optional<std::string> get(const std::string & key) override;

		virtual void set(const std::string & key, const std::string & value, const optional<std::string> & tag) override;

		virtual void invalidate(const std::string & tag) override;
};

#endif /* SRC_JUDGER_REDISCACHEBACKEND_HPP_ */
