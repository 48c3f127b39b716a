/*
 * RewardSerializer.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_REWARDSERIALIZER_HPP_
#define SRC_JUDGER_REWARDSERIALIZER_HPP_

#include "db_typedef.hpp"

#include <kerbal/utility/noncopyable.hpp>
#include <boost/functional/hash.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>

/**
 * @brief 按键互斥的锁. 同一个键同时只有一个持有者, 不同的键之间互不阻塞
 * 键对应的锁在第一次使用时创建, 不再有任务引用时释放
 */
template <typename Key, typename Hash = std::hash<Key> >
class keyed_mutex : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		struct entry
		{
				std::mutex mtx;
				std::size_t refs = 0;
		};

		std::mutex map_mtx;
		std::unordered_map<Key, std::unique_ptr<entry>, Hash> entries;

		entry * acquire(const Key & key)
		{
			std::lock_guard<std::mutex> lck(map_mtx);
			std::unique_ptr<entry> & e = entries[key];
			if (e == nullptr) {
				e.reset(new entry);
			}
			++e->refs;
			return e.get();
		}

		void release(const Key & key) noexcept
		{
			std::lock_guard<std::mutex> lck(map_mtx);
			auto it = entries.find(key);
			if (it != entries.end() && --it->second->refs == 0) {
				entries.erase(it);
			}
		}

		class __lock_guard : kerbal::utility::noncopyable, kerbal::utility::nonassignable
		{
			private:
				keyed_mutex * owner;
				Key key;
				entry * e;

				__lock_guard(keyed_mutex * owner, const Key & key) :
						owner(owner), key(key), e(owner->acquire(key))
				{
					try {
						e->mtx.lock();
					} catch (...) {
						owner->release(key);
						throw;
					}
				}

				friend class keyed_mutex;

			public:
				__lock_guard(__lock_guard && src) :
						owner(src.owner), key(src.key), e(src.e)
				{
					src.e = nullptr;
				}

				~__lock_guard()
				{
					if (e == nullptr) {
						return;
					}
					e->mtx.unlock();
					owner->release(key);
				}
		};

	public:
		typedef __lock_guard lock_guard;

		/**
		 * @brief 阻塞直到取得 key 的锁, 返回的 guard 析构时释放
		 */
		lock_guard lock(const Key & key)
		{
			return lock_guard(this, key);
		}

		template <typename Function>
		auto with_lock(const Key & key, Function && critical_section) -> decltype(critical_section())
		{
			lock_guard guard = this->lock(key);
			return critical_section();
		}

		/**
		 * @brief 当前存在的锁的个数
		 */
		std::size_t size()
		{
			std::lock_guard<std::mutex> lck(map_mtx);
			return entries.size();
		}
};

/**
 * @brief (题目, 用户) 对
 */
struct RewardKey
{
		cc::challenge_id_type challenge_id;
		cc::user_id_type user_id;

		friend bool operator==(const RewardKey & lhs, const RewardKey & rhs)
		{
			return lhs.challenge_id == rhs.challenge_id && lhs.user_id == rhs.user_id;
		}

		struct hash
		{
				std::size_t operator()(const RewardKey & key) const
				{
					std::size_t seed = cc::challenge_id_type::hash()(key.challenge_id);
					boost::hash_combine(seed, cc::user_id_type::hash()(key.user_id));
					return seed;
				}
		};
};

/**
 * @brief 保证 "检查是否已解决 -> 标记解决并发放奖励" 对同一 (题目, 用户) 串行执行
 */
typedef keyed_mutex<RewardKey, RewardKey::hash> RewardSerializer;

#endif /* SRC_JUDGER_REWARDSERIALIZER_HPP_ */
