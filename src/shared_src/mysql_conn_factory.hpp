/*
 * mysql_conn_factory.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_MYSQL_CONN_FACTORY_HPP_
#define SRC_SHARED_SRC_MYSQL_CONN_FACTORY_HPP_

#ifndef MYSQLPP_MYSQL_HEADERS_BURIED
#	define MYSQLPP_MYSQL_HEADERS_BURIED
#endif
#include <mysql++/connection.h>
#include <mysql++/options.h>

#include "sync_nonsingle_instance_pool.hpp"

#include <stdexcept>
#include <string>


typedef sync_nonsingle_instance_pool<mysqlpp::Connection> mysql_conn_pool_type;

/**
 * @brief 连接 MySQL 所需的参数
 */
struct MysqlConnectOption
{
		std::string hostname;
		std::string username;
		std::string password;
		std::string database;
		unsigned int port;
};

/**
 * @brief 为 pool 新建一个 MySQL 连接
 * @throws std::runtime_error 连接失败时
 */
inline void add_mysql_conn(mysql_conn_pool_type & pool, const MysqlConnectOption & option)
{
	mysqlpp::Connection * mysql_conn = new mysqlpp::Connection(false);
	try {
		mysql_conn->set_option(new mysqlpp::SetCharsetNameOption("utf8mb4"));
		if (!mysql_conn->connect(
				option.database.c_str(),
				option.hostname.c_str(),
				option.username.c_str(),
				option.password.c_str(),
				option.port
			)) {
			throw std::runtime_error("failed connect mysql, error: " + std::string(mysql_conn->error()));
		}
	} catch (...) {
		delete mysql_conn;
		mysql_conn = nullptr;
		throw;
	}
	pool.add(mysql_conn);
	mysql_conn = nullptr;
}

/**
 * @brief 取出一个可用的 MySQL 连接, 失去响应的连接被丢弃并重建
 */
inline mysql_conn_pool_type::auto_revert_handle sync_fetch_mysql_conn(mysql_conn_pool_type & pool, const MysqlConnectOption & option)
{
	mysql_conn_pool_type::auto_revert_handle mysql_conn_handle = pool.sync_fetch();
	while (!mysql_conn_handle->ping()) {
		mysql_conn_handle.abandon();
		add_mysql_conn(pool, option);
		mysql_conn_handle = pool.sync_fetch();
	}
	return mysql_conn_handle;
}


#endif /* SRC_SHARED_SRC_MYSQL_CONN_FACTORY_HPP_ */
