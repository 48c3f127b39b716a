/*
 * EvaluatorCache.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "EvaluatorCache.hpp"

#include <boost/uuid/detail/sha1.hpp>

#include <iomanip>
#include <sstream>

namespace
{
	std::string sha1_hex(const std::string & text)
	{
		boost::uuids::detail::sha1 sha;
		sha.process_bytes(text.data(), text.size());
		boost::uuids::detail::sha1::digest_type digest;
		sha.get_digest(digest);

		constexpr std::size_t word_count = sizeof(digest) / sizeof(digest[0]);
		constexpr int hex_width = 2 * sizeof(digest[0]);

		std::ostringstream hex;
		hex << std::hex << std::setfill('0');
		for (std::size_t i = 0; i < word_count; ++i) {
			hex << std::setw(hex_width) << static_cast<unsigned long>(digest[i]);
		}
		return hex.str();
	}
}

MemoryCacheBackend::MemoryCacheBackend(std::chrono::milliseconds ttl) :
		ttl(ttl), next_sweep(std::chrono::steady_clock::now() + ttl)
{
}

MemoryCacheBackend::entry_map::iterator MemoryCacheBackend::erase_entry(entry_map::iterator it)
{
	if (it->second.tag != nullopt) {
		auto tag_it = tags.find(*it->second.tag);
		if (tag_it != tags.end()) {
			tag_it->second.erase(it->first);
			if (tag_it->second.empty()) {
				tags.erase(tag_it);
			}
		}
	}
	return entries.erase(it);
}

void MemoryCacheBackend::sweep_expired(std::chrono::steady_clock::time_point now)
{
	if (ttl.count() <= 0 || now < next_sweep) {
		return;
	}
	for (auto it = entries.begin(); it != entries.end();) {
		if (it->second.expire_at != nullopt && *it->second.expire_at <= now) {
			it = this->erase_entry(it);
		} else {
			++it;
		}
	}
	next_sweep = now + ttl;
}

optional<std::string> MemoryCacheBackend::get(const std::string & key)
{
	std::lock_guard<std::mutex> lck(mtx);
	auto it = entries.find(key);
	if (it == entries.end()) {
		return nullopt;
	}
	if (it->second.expire_at != nullopt && *it->second.expire_at <= std::chrono::steady_clock::now()) {
		this->erase_entry(it);
		return nullopt;
	}
	return it->second.value;
}

void MemoryCacheBackend::set(const std::string & key, const std::string & value, const optional<std::string> & tag)
{
	const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
	entry e;
	e.value = value;
	e.tag = tag;
	if (ttl.count() > 0) {
		e.expire_at = now + ttl;
	}

	std::lock_guard<std::mutex> lck(mtx);
	this->sweep_expired(now);

	auto it = entries.find(key);
	if (it != entries.end()) {
		this->erase_entry(it);
	}
	entries.emplace(key, std::move(e));
	if (tag != nullopt) {
		tags[*tag].insert(key);
	}
}

void MemoryCacheBackend::invalidate(const std::string & tag)
{
	std::lock_guard<std::mutex> lck(mtx);
	auto it = tags.find(tag);
	if (it == tags.end()) {
		return;
	}
	for (const std::string & key : it->second) {
		entries.erase(key);
	}
	tags.erase(it);
}

std::size_t MemoryCacheBackend::size()
{
	std::lock_guard<std::mutex> lck(mtx);
	return entries.size();
}

EvaluatorCache::EvaluatorCache(std::shared_ptr<CacheBackend> backend, const std::string & prefix) :
		backend(std::move(backend)), prefix(prefix)
{
}

std::string EvaluatorCache::make_key(const std::string & operation, const nlohmann::json & parts) const
{
	return prefix + ":" + operation + ":" + sha1_hex(parts.dump());
}

void EvaluatorCache::invalidate(const std::string & tag)
{
	backend->invalidate(tag);
	LOG_INFO(log_kind::CHALLENGE, tag, log_fp, "Evaluator cache invalidated.");
}
