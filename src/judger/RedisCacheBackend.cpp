/*
 * RedisCacheBackend.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "RedisCacheBackend.hpp"

#include <vector>

RedisCacheBackend::RedisCacheBackend(redis_conn_pool_type & pool, const std::string & hostname, int port,
										std::chrono::seconds ttl, const std::string & tag_prefix) :
		pool(pool), hostname(hostname), port(port), ttl(ttl), tag_prefix(tag_prefix)
{
}

kerbal::redis_v2::reply RedisCacheBackend::execute(std::initializer_list<std::string> args)
{
	kerbal::redis_v2::reply reply;
	try {
		auto redis_conn_handle = sync_fetch_redis_conn(pool, hostname, port);
		kerbal::redis_v2::connection & conn = *redis_conn_handle;
		reply = conn.argv_execute(args.begin(), args.end());
	} catch (const std::exception & e) {
		throw CacheException(std::string("redis ") + *args.begin() + " failed: " + e.what());
	}
	if (reply.type() == kerbal::redis_v2::reply_type::ERROR) {
		throw CacheException(std::string("redis ") + *args.begin() + " returned error: " + reply->str);
	}
	return reply;
}

optional<std::string> RedisCacheBackend::get(const std::string & key)
{
	kerbal::redis_v2::reply reply = this->execute({"GET", key});
	switch (reply.type()) {
		case kerbal::redis_v2::reply_type::STRING:
			return std::string(reply->str, reply->len);
		case kerbal::redis_v2::reply_type::NIL:
			return nullopt;
		default:
			throw CacheException("Wrong cache entry type. Expected: STRING, actually get: " + reply_type_name(reply.type()));
	}
}

void RedisCacheBackend::set(const std::string & key, const std::string & value, const optional<std::string> & tag)
{
	if (ttl.count() > 0) {
		this->execute({"SETEX", key, std::to_string(ttl.count()), value});
	} else {
		this->execute({"SET", key, value});
	}

	if (tag != nullopt) {
		const std::string tag_key = tag_prefix + *tag;
		this->execute({"SADD", tag_key, key});
		if (ttl.count() > 0) {
			// tag 集合随最后写入的条目一同过期
			this->execute({"EXPIRE", tag_key, std::to_string(ttl.count())});
		}
	}
}

void RedisCacheBackend::invalidate(const std::string & tag)
{
	const std::string tag_key = tag_prefix + tag;
	kerbal::redis_v2::reply members = this->execute({"SMEMBERS", tag_key});
	if (members.type() != kerbal::redis_v2::reply_type::ARRAY) {
		throw CacheException("Wrong cache tag type. Expected: ARRAY, actually get: " + reply_type_name(members.type()));
	}

	std::vector<std::string> del_args = {"DEL", tag_key};
	for (size_t i = 0; i < members->elements; ++i) {
		del_args.emplace_back(members->element[i]->str, members->element[i]->len);
	}

	try {
		auto redis_conn_handle = sync_fetch_redis_conn(pool, hostname, port);
		kerbal::redis_v2::connection & conn = *redis_conn_handle;
		kerbal::redis_v2::reply reply = conn.argv_execute(del_args.begin(), del_args.end());
		if (reply.type() == kerbal::redis_v2::reply_type::ERROR) {
			throw CacheException(std::string("redis DEL returned error: ") + reply->str);
		}
	} catch (const CacheException &) {
		throw;
	} catch (const std::exception & e) {
		throw CacheException(std::string("redis DEL failed: ") + e.what());
	}
}
