/*
 * QueuePositions.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_QUEUEPOSITIONS_HPP_
#define SRC_JUDGER_QUEUEPOSITIONS_HPP_

#include "db_typedef.hpp"
#include "Result.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>

/**
 * @brief 排队状态
 */
struct QueueStatus
{
		std::uint64_t workers; ///< 评测线程数
		std::uint64_t active; ///< 正在评测的任务数
		std::uint64_t waiting; ///< 等待评测的任务数
};

void to_json(nlohmann::json & j, const QueueStatus & src);

/**
 * @brief 记录每个已入队提交的排队位置
 *
 * 每个入队的 id 领取一个递增的号码 t, 其位置为 max(0, t - workers - done), done 为已完成的任务数.
 * 位置只是近似值: 任务并不严格按号码顺序完成.
 * @warning 本类不是线程安全的, 由 JudgeScheduler 加锁使用
 */
class QueuePositions
{
	private:
		std::uint64_t workers;
		std::uint64_t counter;
		std::uint64_t done;
		std::unordered_map<cc::submission_id_type, std::uint64_t, cc::submission_id_type::hash> ids;

		std::uint64_t id_position(std::uint64_t ticket) const;

	public:
		explicit QueuePositions(std::uint64_t workers);

		/**
		 * @brief 入队, 对已在队中的 id 不做任何改变
		 * @return 该 id 当前的位置
		 */
		std::uint64_t push(const cc::submission_id_type & id);

		/**
		 * @brief 出队. 只有位置为 0 (正在评测) 的 id 可以出队
		 * @return 是否出队成功
		 */
		bool pop(const cc::submission_id_type & id);

		/**
		 * @return id 不在队中时为空
		 */
		optional<std::uint64_t> position(const cc::submission_id_type & id) const;

		QueueStatus status() const;
};

#endif /* SRC_JUDGER_QUEUEPOSITIONS_HPP_ */
