/*
 * redis_conn_factory.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_REDIS_CONN_FACTORY_HPP_
#define SRC_SHARED_SRC_REDIS_CONN_FACTORY_HPP_

#include <kerbal/redis_v2/connection.hpp>
#include "sync_nonsingle_instance_pool.hpp"

#include <stdexcept>
#include <string>

typedef sync_nonsingle_instance_pool<kerbal::redis_v2::connection> redis_conn_pool_type;

/**
 * @brief 为 pool 新建一个 redis 连接
 * @throws std::runtime_error 连接失败时
 */
inline void add_redis_conn(redis_conn_pool_type & pool, const std::string & hostname, int port)
{
	kerbal::redis_v2::connection * redis_conn = new kerbal::redis_v2::connection(hostname, port);
	try {
		if (!*redis_conn) {
			throw std::runtime_error("failed connect redis " + hostname + ":" + std::to_string(port));
		}
	} catch (...) {
		delete redis_conn;
		redis_conn = nullptr;
		throw;
	}
	pool.add(redis_conn);
	redis_conn = nullptr;
}

/**
 * @brief 取出一个可用的 redis 连接, 已断开的连接被丢弃并重建
 */
inline redis_conn_pool_type::auto_revert_handle sync_fetch_redis_conn(redis_conn_pool_type & pool, const std::string & hostname, int port)
{
	redis_conn_pool_type::auto_revert_handle redis_conn_handle = pool.sync_fetch();
	while (!*redis_conn_handle) {
		redis_conn_handle.abandon();
		add_redis_conn(pool, hostname, port);
		redis_conn_handle = pool.sync_fetch();
	}
	return redis_conn_handle;
}

#endif /* SRC_SHARED_SRC_REDIS_CONN_FACTORY_HPP_ */
