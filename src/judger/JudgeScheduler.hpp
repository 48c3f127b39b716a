/*
 * JudgeScheduler.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_JUDGESCHEDULER_HPP_
#define SRC_JUDGER_JUDGESCHEDULER_HPP_

#include "QueuePositions.hpp"

#include <kerbal/utility/noncopyable.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief 评测任务队列与固定大小的评测线程池
 *
 * 任务按入队顺序被取出, 同一时刻至多有 worker_count 个任务在执行.
 * 已入队的任务不可取消, shutdown 会等待队列中的任务全部完成.
 */
class JudgeScheduler : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef std::function<void()> task_type;

	private:
		std::mutex mtx;
		std::condition_variable task_available;
		std::deque<std::pair<cc::submission_id_type, task_type> > tasks;
		QueuePositions positions;
		std::vector<std::thread> workers;
		bool stopping;

		void worker_loop() noexcept;

	public:
		explicit JudgeScheduler(std::size_t worker_count);

		~JudgeScheduler() noexcept;

		/**
		 * @brief 提交一个评测任务, 立即返回其排队位置
		 * 同一个提交已在队中时不会重复入队
		 * @throws JudgeException 调度器已停止
		 */
		std::uint64_t enqueue(const cc::submission_id_type & id, task_type task);

		/**
		 * @return 提交不在队中 (未入队或已评测完) 时为空
		 */
		optional<std::uint64_t> position(const cc::submission_id_type & id);

		QueueStatus status();

		/**
		 * @brief 停止接受新任务, 等待已入队的任务完成后回收所有评测线程
		 */
		void shutdown() noexcept;
};

#endif /* SRC_JUDGER_JUDGESCHEDULER_HPP_ */
