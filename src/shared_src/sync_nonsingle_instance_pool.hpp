/*
 * sync_nonsingle_instance_pool.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_
#define SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_

#include <deque>
#include <type_traits>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <stdexcept>

#include <kerbal/utility/noncopyable.hpp>


class resource_exhausted_exception : public std::runtime_error
{
	public:
		resource_exhausted_exception() :
					std::runtime_error("resource exhausted in instance pool")
		{
		}
};

/**
 * @brief 线程安全的实例池, 用于在评测线程之间共享数据库连接
 * 取出的实例由 auto_revert_handle 持有, 析构时自动归还; 实例损坏时调用 abandon 丢弃
 */
template <typename InstanceType, typename PoolContainer = std::deque<InstanceType*> >
class sync_nonsingle_instance_pool : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		PoolContainer instance_pool;
		mutable std::mutex pool_vis_mtx;
		std::condition_variable pool_not_empty;

		class __auto_revert_handle: kerbal::utility::noncopyable, kerbal::utility::nonassignable
		{
			private:
				InstanceType * ptr_to_instance;
				sync_nonsingle_instance_pool * ptr_to_pool;

				__auto_revert_handle(InstanceType * ptr_to_instance, sync_nonsingle_instance_pool * ptr_to_pool) :
						ptr_to_instance(ptr_to_instance), ptr_to_pool(ptr_to_pool)
				{
				}

				friend class sync_nonsingle_instance_pool;

			public:
				__auto_revert_handle(__auto_revert_handle && src) noexcept :
						ptr_to_instance(src.ptr_to_instance), ptr_to_pool(src.ptr_to_pool)
				{
					src.ptr_to_instance = nullptr;
				}

				~__auto_revert_handle()
				{
					this->revert();
				}

				__auto_revert_handle& operator=(__auto_revert_handle && src)
				{
					this->revert();
					this->ptr_to_instance = src.ptr_to_instance;
					src.ptr_to_instance = nullptr;
					this->ptr_to_pool = src.ptr_to_pool;
					src.ptr_to_pool = nullptr;
					return *this;
				}

				bool empty() const
				{
					return this->ptr_to_instance == nullptr;
				}

				InstanceType& operator*() const
				{
					return *ptr_to_instance;
				}

				InstanceType* operator->() const
				{
					return ptr_to_instance;
				}

				void revert()
				{
					if (this->ptr_to_instance == nullptr) {
						return;
					}
					InstanceType* p = this->ptr_to_instance;
					this->ptr_to_instance = nullptr;
					ptr_to_pool->revert(p);
				}

				void abandon()
				{
					delete ptr_to_instance;
					this->ptr_to_instance = nullptr;
				}
		};

		void revert(InstanceType* p) noexcept
		{
			{
				std::lock_guard<std::mutex> lck(pool_vis_mtx);
				try {
					instance_pool.push_back(p);
				} catch (const std::bad_alloc &) {
					delete p;
					return;
				}
			}
			pool_not_empty.notify_one();
		}

	public:

		typedef __auto_revert_handle auto_revert_handle;
		typedef PoolContainer pool_type;
		typedef typename PoolContainer::size_type size_type;

		sync_nonsingle_instance_pool() = default;

		~sync_nonsingle_instance_pool() noexcept
		{
			while (!instance_pool.empty()) {
				delete instance_pool.front();
				instance_pool.pop_front();
			}
		}

		void add(InstanceType* p)
		{
			try {
				std::lock_guard<std::mutex> lck(pool_vis_mtx);
				instance_pool.push_back(p);
			} catch (...) {
				delete p;
				throw;
			}
			pool_not_empty.notify_one();
		}

		template <typename ... Args>
		void emplace(Args&& ... args)
		{
			this->add(new InstanceType(std::forward<Args>(args)...));
		}

		size_type size() const
		{
			std::lock_guard<std::mutex> lck(pool_vis_mtx);
			return instance_pool.size();
		}

		/**
		 * @brief 立即取出一个实例
		 * @throws resource_exhausted_exception 池中没有空闲实例时
		 */
		auto_revert_handle fetch()
		{
			std::lock_guard<std::mutex> lck(pool_vis_mtx);
			if (instance_pool.empty()) {
				throw resource_exhausted_exception();
			}
			InstanceType* p = instance_pool.front();
			instance_pool.pop_front();
			return auto_revert_handle(p, this);
		}

		/**
		 * @brief 阻塞直到取出一个实例
		 */
		auto_revert_handle sync_fetch()
		{
			std::unique_lock<std::mutex> lck(pool_vis_mtx);
			pool_not_empty.wait(lck, [this]() {
				return !instance_pool.empty();
			});
			InstanceType* p = instance_pool.front();
			instance_pool.pop_front();
			return auto_revert_handle(p, this);
		}
};

#endif /* SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_ */
